#include "PanelLayoutEngine.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

using namespace cv;
using namespace std;

namespace Papercut {

namespace {

const double BOUNDS_EPS = 1e-6;

Rect2d transformRect(const Rect2d& r, const PlacementTransform& t) {
    Point2d a = t.apply(Point2d(r.x, r.y));
    Point2d b = t.apply(Point2d(r.x + r.width, r.y + r.height));
    return Rect2d(min(a.x, b.x), min(a.y, b.y), std::abs(b.x - a.x), std::abs(b.y - a.y));
}

Rect2d contourBounds(const StencilGeometry& geometry) {
    double minX = numeric_limits<double>::max(), minY = numeric_limits<double>::max();
    double maxX = numeric_limits<double>::lowest(), maxY = numeric_limits<double>::lowest();
    for (const auto& contour : geometry.contours) {
        for (const auto& p : contour.points) {
            minX = min(minX, p.x);
            minY = min(minY, p.y);
            maxX = max(maxX, p.x);
            maxY = max(maxY, p.y);
        }
    }
    if (minX > maxX) return Rect2d();
    return Rect2d(minX, minY, maxX - minX, maxY - minY);
}

} // namespace

PlacementTransform PanelLayoutEngine::fitTransform(const Size& source, double areaW, double areaH,
                                                   double originX, double originY, FitMode mode) {
    const double sx = areaW / source.width;
    const double sy = areaH / source.height;

    PlacementTransform t;
    switch (mode) {
        case FitMode::Fit:
            t.scaleX = t.scaleY = min(sx, sy);
            break;
        case FitMode::Fill:
            t.scaleX = t.scaleY = max(sx, sy);
            break;
        case FitMode::Stretch:
            t.scaleX = sx;
            t.scaleY = sy;
            break;
    }

    const double placedW = source.width * t.scaleX;
    const double placedH = source.height * t.scaleY;
    t.offsetX = originX + (areaW - placedW) / 2.0;
    t.offsetY = originY + (areaH - placedH) / 2.0;
    return t;
}

PanelLayout PanelLayoutEngine::computeLayout(const StencilGeometry& geometry, const LayoutParams& params) {
    if (geometry.sourceSize.width <= 0 || geometry.sourceSize.height <= 0) {
        throw invalid_argument("Cannot lay out a design with zero size");
    }
    if (params.rows < 1 || params.cols < 1) {
        throw invalid_argument("Grid must have at least one row and one column");
    }

    PanelLayout layout;
    layout.pageWidthMM = params.pageWidthMM;
    layout.pageHeightMM = params.pageHeightMM;
    layout.marginMM = params.marginMM;
    layout.rows = params.rows;
    layout.cols = params.cols;
    layout.mode = params.layoutMode;
    layout.fit = params.fitMode;
    layout.pageName = params.pageName;
    layout.designBoundsPx = contourBounds(geometry);

    const double printableW = params.pageWidthMM - 2.0 * params.marginMM;
    const double printableH = params.pageHeightMM - 2.0 * params.marginMM;
    if (printableW <= 0.0 || printableH <= 0.0) {
        throw invalid_argument("Margins are too large for the page size");
    }

    const double m = params.marginMM;
    if (params.layoutMode == LayoutMode::Tile) {
        // One design spread over rows x cols pages
        layout.cellWidthMM = printableW;
        layout.cellHeightMM = printableH;
        layout.pageCount = params.rows * params.cols;

        const double panelW = params.cols * printableW;
        const double panelH = params.rows * printableH;
        PlacementTransform panel = fitTransform(geometry.sourceSize, panelW, panelH, 0.0, 0.0, params.fitMode);

        cout << "[INFO] Tiling design over " << params.cols << "x" << params.rows << " pages ("
             << panelW << " x " << panelH << " mm panel, scale " << panel.scaleX << " mm/px)" << endl;

        for (int r = 0; r < params.rows; r++) {
            for (int c = 0; c < params.cols; c++) {
                Placement p;
                p.page = r * params.cols + c;
                p.row = r;
                p.col = c;
                p.transform = panel;
                p.transform.offsetX += m - c * printableW;
                p.transform.offsetY += m - r * printableH;
                p.clip = Rect2d(m, m, printableW, printableH);
                p.frame = Rect2d(m - c * printableW, m - r * printableH, panelW, panelH);
                layout.placements.push_back(p);
            }
        }
    } else {
        // rows x cols copies on a single page
        layout.cellWidthMM = printableW / params.cols;
        layout.cellHeightMM = printableH / params.rows;
        layout.pageCount = 1;

        cout << "[INFO] Repeating design in a " << params.cols << "x" << params.rows
             << " grid (" << layout.cellWidthMM << " x " << layout.cellHeightMM << " mm cells)" << endl;

        for (int r = 0; r < params.rows; r++) {
            for (int c = 0; c < params.cols; c++) {
                Placement p;
                p.page = 0;
                p.row = r;
                p.col = c;
                const double x0 = m + c * layout.cellWidthMM;
                const double y0 = m + r * layout.cellHeightMM;
                p.transform = fitTransform(geometry.sourceSize, layout.cellWidthMM, layout.cellHeightMM,
                                           x0, y0, params.fitMode);
                p.clip = Rect2d(x0, y0, layout.cellWidthMM, layout.cellHeightMM);
                p.frame = p.clip;
                layout.placements.push_back(p);
            }
        }
    }

    return shift(layout, params.shiftXMM, params.shiftYMM);
}

PanelLayout PanelLayoutEngine::shift(const PanelLayout& layout, double dxMM, double dyMM) {
    PanelLayout shifted = layout;
    shifted.shiftXMM += dxMM;
    shifted.shiftYMM += dyMM;
    for (auto& p : shifted.placements) {
        p.transform.offsetX += dxMM;
        p.transform.offsetY += dyMM;
    }
    shifted.warnings.clear();
    checkBounds(shifted);
    return shifted;
}

void PanelLayoutEngine::checkBounds(PanelLayout& layout) {
    if (layout.placements.empty() || layout.designBoundsPx.area() <= 0.0) return;

    double overflow = 0.0;
    for (const auto& p : layout.placements) {
        Rect2d placed = transformRect(layout.designBoundsPx, p.transform);
        overflow = max(overflow, p.frame.x - placed.x);
        overflow = max(overflow, p.frame.y - placed.y);
        overflow = max(overflow, (placed.x + placed.width) - (p.frame.x + p.frame.width));
        overflow = max(overflow, (placed.y + placed.height) - (p.frame.y + p.frame.height));
    }

    if (overflow > BOUNDS_EPS) {
        ostringstream msg;
        msg << "Design extends " << overflow << " mm beyond the "
            << (layout.mode == LayoutMode::Tile ? "panel" : "cell")
            << " (shift " << layout.shiftXMM << ", " << layout.shiftYMM << " mm); overflow is clipped";
        layout.warnings.push_back(msg.str());
        cout << "[WARN] " << msg.str() << endl;
    }
}

Rect2d PanelLayoutEngine::placedBounds(const StencilGeometry& geometry, const Placement& placement) {
    return transformRect(contourBounds(geometry), placement.transform);
}

vector<Point2d> PanelLayoutEngine::clipToRect(const vector<Point2d>& polygon, const Rect2d& rect) {
    const double left = rect.x, top = rect.y;
    const double right = rect.x + rect.width, bottom = rect.y + rect.height;

    // edge 0: x >= left, 1: x <= right, 2: y >= top, 3: y <= bottom
    auto inside = [&](const Point2d& p, int edge) {
        switch (edge) {
            case 0: return p.x >= left;
            case 1: return p.x <= right;
            case 2: return p.y >= top;
            default: return p.y <= bottom;
        }
    };
    auto intersect = [&](const Point2d& a, const Point2d& b, int edge) {
        double t;
        switch (edge) {
            case 0: t = (left - a.x) / (b.x - a.x); break;
            case 1: t = (right - a.x) / (b.x - a.x); break;
            case 2: t = (top - a.y) / (b.y - a.y); break;
            default: t = (bottom - a.y) / (b.y - a.y); break;
        }
        Point2d p(a.x + (b.x - a.x) * t, a.y + (b.y - a.y) * t);
        // Snap onto the clip line to avoid drift
        if (edge == 0) p.x = left;
        else if (edge == 1) p.x = right;
        else if (edge == 2) p.y = top;
        else p.y = bottom;
        return p;
    };

    vector<Point2d> output = polygon;
    for (int edge = 0; edge < 4 && !output.empty(); edge++) {
        vector<Point2d> input;
        input.swap(output);
        const size_t n = input.size();
        for (size_t i = 0; i < n; i++) {
            const Point2d& curr = input[i];
            const Point2d& prev = input[(i + n - 1) % n];
            bool currIn = inside(curr, edge);
            bool prevIn = inside(prev, edge);
            if (currIn) {
                if (!prevIn) output.push_back(intersect(prev, curr, edge));
                output.push_back(curr);
            } else if (prevIn) {
                output.push_back(intersect(prev, curr, edge));
            }
        }
    }
    return output;
}

vector<VectorContour> PanelLayoutEngine::placeContours(const StencilGeometry& geometry,
                                                       const Placement& placement) {
    vector<VectorContour> placed;
    vector<int> remap(geometry.contours.size(), -1);

    for (size_t i = 0; i < geometry.contours.size(); i++) {
        const auto& src = geometry.contours[i];
        vector<Point2d> pts;
        pts.reserve(src.points.size());
        for (const auto& p : src.points) pts.push_back(placement.transform.apply(p));

        vector<Point2d> clipped = clipToRect(pts, placement.clip);
        if (clipped.size() < 3) continue;

        VectorContour contour;
        contour.points = std::move(clipped);
        if (contour.area() < 1e-9) continue;
        contour.role = src.role;
        contour.parent = src.parent;
        remap[i] = static_cast<int>(placed.size());
        placed.push_back(std::move(contour));
    }

    for (auto& contour : placed) {
        if (contour.parent >= 0) contour.parent = remap[static_cast<size_t>(contour.parent)];
    }
    return placed;
}

} // namespace Papercut
