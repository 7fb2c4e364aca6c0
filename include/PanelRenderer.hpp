#pragma once

#include "PapercutTypes.hpp"
#include <opencv2/core.hpp>
#include <vector>

namespace Papercut {

class PanelRenderer {
public:
    // Stencil at mask resolution, material white on the background colour
    static cv::Mat renderOriginal(const StencilGeometry& geometry, const cv::Scalar& background);

    // One page at the given DPI: white paper, grey cells, white stencil
    static cv::Mat renderPage(const StencilGeometry& geometry, const PanelLayout& layout, int page,
                              double dpi, const cv::Scalar& background, bool drawSeams);

    // All pages side by side in the grid they are assembled in
    static cv::Mat renderPanel(const StencilGeometry& geometry, const PanelLayout& layout, double dpi,
                               const cv::Scalar& background);

private:
    static void fillContours(cv::Mat& canvas, const std::vector<VectorContour>& contours, double pxPerUnit,
                             const cv::Point2d& origin, const cv::Scalar& color, int lineType);
};

} // namespace Papercut
