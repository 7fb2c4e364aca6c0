#pragma once

#include "DebugImageStack.hpp"
#include "PapercutTypes.hpp"
#include "PipelineConfig.hpp"
#include <opencv2/core.hpp>
#include <vector>

namespace Papercut {

class StencilVectorizer {
public:
    // Boundary loops on the pixel-corner lattice. Material is kept
    // 4-connected: at saddle vertices the trace turns into the current pixel.
    static std::vector<std::vector<cv::Point>> traceBoundaries(const cv::Mat& mask);

    // Drops lattice points that lie on a straight run
    static std::vector<cv::Point> removeCollinear(const std::vector<cv::Point>& loop);

    static double signedArea(const std::vector<cv::Point2d>& points);

    // Gaussian smoothing along the closed contour with bounded displacement
    static std::vector<cv::Point2d> smoothContour(const std::vector<cv::Point>& corners,
                                                  const VectorizeParams& params);

    // Sets role from orientation and links every hole to its enclosing outer contour
    static void assignRoles(std::vector<VectorContour>& contours);

    // Throws DegenerateGeometryError when a contour collapses below 3 points
    static StencilGeometry vectorize(const StencilMask& mask, const VectorizeParams& params,
                                     DebugImageStack* debug = nullptr, bool verbose = false);
};

} // namespace Papercut
