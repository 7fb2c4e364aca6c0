#include "PanelRenderer.hpp"
#include "PanelLayoutEngine.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>

using namespace cv;
using namespace std;

namespace Papercut {

namespace {

const int FIXED_SHIFT = 4;
const double FIXED_ONE = 1 << FIXED_SHIFT;

const Scalar PAPER(255, 255, 255);
const Scalar PAGE_BORDER(0, 0, 0);
const Scalar SEAM(0, 0, 255);

} // namespace

void PanelRenderer::fillContours(Mat& canvas, const vector<VectorContour>& contours, double pxPerUnit,
                                 const Point2d& origin, const Scalar& color, int lineType) {
    vector<vector<Point>> polys;
    polys.reserve(contours.size());
    for (const auto& contour : contours) {
        if (contour.points.size() < 3) continue;
        vector<Point> poly;
        poly.reserve(contour.points.size());
        for (const auto& p : contour.points) {
            // Lattice corners to pixel-centre coordinates
            double x = (p.x - origin.x) * pxPerUnit - 0.5;
            double y = (p.y - origin.y) * pxPerUnit - 0.5;
            poly.emplace_back(cvRound(x * FIXED_ONE), cvRound(y * FIXED_ONE));
        }
        polys.push_back(std::move(poly));
    }
    if (polys.empty()) return;

    // fillPoly uses parity across all polygons, which matches even-odd
    fillPoly(canvas, polys, color, lineType, FIXED_SHIFT);
}

Mat PanelRenderer::renderOriginal(const StencilGeometry& geometry, const Scalar& background) {
    Size size = geometry.sourceSize;
    if (size.width <= 0 || size.height <= 0) {
        size = Size(1, 1);
    }
    Mat canvas(size, CV_8UC3, background);
    fillContours(canvas, geometry.contours, 1.0, Point2d(0, 0), PAPER, LINE_8);
    return canvas;
}

Mat PanelRenderer::renderPage(const StencilGeometry& geometry, const PanelLayout& layout, int page,
                              double dpi, const Scalar& background, bool drawSeams) {
    const double pxPerMM = dpi / MM_PER_INCH;
    const int w = max(1, mmToPx(layout.pageWidthMM, dpi));
    const int h = max(1, mmToPx(layout.pageHeightMM, dpi));
    Mat canvas(h, w, CV_8UC3, PAPER);

    auto toPx = [&](const Rect2d& r) {
        int x0 = cvRound(r.x * pxPerMM), y0 = cvRound(r.y * pxPerMM);
        int x1 = cvRound((r.x + r.width) * pxPerMM), y1 = cvRound((r.y + r.height) * pxPerMM);
        return Rect(x0, y0, max(1, x1 - x0), max(1, y1 - y0)) & Rect(0, 0, w, h);
    };

    for (const auto& placement : layout.placements) {
        if (placement.page != page) continue;
        rectangle(canvas, toPx(placement.clip), background, FILLED);
        vector<VectorContour> contours = PanelLayoutEngine::placeContours(geometry, placement);
        fillContours(canvas, contours, pxPerMM, Point2d(0, 0), PAPER, LINE_AA);
    }

    if (drawSeams) {
        for (const auto& placement : layout.placements) {
            if (placement.page != page) continue;
            rectangle(canvas, toPx(placement.clip), SEAM, 1);
        }
        rectangle(canvas, Rect(0, 0, w, h), PAGE_BORDER, 1);
    }
    return canvas;
}

Mat PanelRenderer::renderPanel(const StencilGeometry& geometry, const PanelLayout& layout, double dpi,
                               const Scalar& background) {
    const int gridCols = layout.mode == LayoutMode::Tile ? layout.cols : 1;
    const int gridRows = layout.mode == LayoutMode::Tile ? layout.rows : 1;
    const int w = max(1, mmToPx(layout.pageWidthMM, dpi));
    const int h = max(1, mmToPx(layout.pageHeightMM, dpi));

    Mat panel(h * gridRows, w * gridCols, CV_8UC3, PAPER);
    for (int page = 0; page < layout.pageCount; page++) {
        const int r = page / gridCols;
        const int c = page % gridCols;
        if (r >= gridRows) break;
        Mat pageImg = renderPage(geometry, layout, page, dpi, background, true);
        pageImg.copyTo(panel(Rect(c * w, r * h, w, h)));
    }
    return panel;
}

} // namespace Papercut
