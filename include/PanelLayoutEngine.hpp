#pragma once

#include "PapercutTypes.hpp"
#include "PipelineConfig.hpp"
#include <opencv2/core.hpp>
#include <vector>

namespace Papercut {

class PanelLayoutEngine {
public:
    // Throws std::invalid_argument for an empty design or a page without
    // printable area
    static PanelLayout computeLayout(const StencilGeometry& geometry, const LayoutParams& params);

    // Translates every placement; geometry and clip rects stay unchanged
    static PanelLayout shift(const PanelLayout& layout, double dxMM, double dyMM);

    // Design bounds in page millimetres for one placement
    static cv::Rect2d placedBounds(const StencilGeometry& geometry, const Placement& placement);

    // Contour clipped to an axis-aligned rectangle (Sutherland-Hodgman)
    static std::vector<cv::Point2d> clipToRect(const std::vector<cv::Point2d>& polygon,
                                               const cv::Rect2d& rect);

    // Contours of one placement in page millimetres, clipped to the cell.
    // Contours falling entirely outside the cell are omitted.
    static std::vector<VectorContour> placeContours(const StencilGeometry& geometry,
                                                    const Placement& placement);

private:
    static PlacementTransform fitTransform(const cv::Size& source, double areaW, double areaH,
                                           double originX, double originY, FitMode mode);
    static void checkBounds(PanelLayout& layout);
};

} // namespace Papercut
