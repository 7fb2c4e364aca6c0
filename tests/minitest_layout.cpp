#include "minitest.hpp"
#include "PanelLayoutEngine.hpp"

using namespace Papercut;

static StencilGeometry squareDesign(int size, int inset) {
    StencilGeometry g;
    g.sourceSize = cv::Size(size, size);
    VectorContour c;
    const double a = inset, b = size - inset;
    c.points = {{a, a}, {b, a}, {b, b}, {a, b}};
    g.contours.push_back(c);
    return g;
}

static bool test_tile_grid_defaults() {
    PanelLayout layout = PanelLayoutEngine::computeLayout(squareDesign(100, 0), LayoutParams());
    MT_ASSERT(layout.pageCount == 12);
    MT_ASSERT(layout.placements.size() == 12);
    MT_NEAR(layout.cellWidthMM, 190.0, 1e-9);
    MT_NEAR(layout.cellHeightMM, 277.0, 1e-9);
    MT_ASSERT(layout.warnings.empty());

    for (const auto& p : layout.placements) {
        MT_ASSERT(p.page == p.row * 3 + p.col);
        MT_NEAR(p.clip.x, 10.0, 1e-9);
        MT_NEAR(p.clip.y, 10.0, 1e-9);
        MT_NEAR(p.transform.scaleX, 5.7, 1e-9);
        MT_NEAR(p.transform.scaleY, 5.7, 1e-9);
    }
    // Neighbouring pages continue the panel exactly one cell apart
    MT_NEAR(layout.placements[0].transform.offsetX - layout.placements[1].transform.offsetX, 190.0, 1e-9);
    MT_NEAR(layout.placements[0].transform.offsetY - layout.placements[3].transform.offsetY, 277.0, 1e-9);
    return true;
}

static bool test_tiles_cover_the_design_once() {
    StencilGeometry g = squareDesign(100, 10);
    PanelLayout layout = PanelLayoutEngine::computeLayout(g, LayoutParams());
    double total = 0.0;
    for (const auto& p : layout.placements) {
        for (const auto& c : PanelLayoutEngine::placeContours(g, p)) {
            total += c.area();
            for (const auto& pt : c.points) {
                MT_ASSERT(pt.x >= p.clip.x - 1e-9 && pt.x <= p.clip.x + p.clip.width + 1e-9);
                MT_ASSERT(pt.y >= p.clip.y - 1e-9 && pt.y <= p.clip.y + p.clip.height + 1e-9);
            }
        }
    }
    const double side = 80.0 * 5.7;
    MT_NEAR(total, side * side, 1e-6);
    return true;
}

static bool test_repeat_mode() {
    LayoutParams params;
    params.layoutMode = LayoutMode::Repeat;
    params.cols = 2;
    params.rows = 2;
    StencilGeometry g = squareDesign(50, 0);
    PanelLayout layout = PanelLayoutEngine::computeLayout(g, params);
    MT_ASSERT(layout.pageCount == 1);
    MT_ASSERT(layout.placements.size() == 4);
    MT_NEAR(layout.cellWidthMM, 95.0, 1e-9);
    MT_NEAR(layout.cellHeightMM, 138.5, 1e-9);

    for (const auto& p : layout.placements) {
        MT_ASSERT(p.page == 0);
        cv::Rect2d placed = PanelLayoutEngine::placedBounds(g, p);
        MT_NEAR(placed.width, 95.0, 1e-9);
        MT_NEAR(placed.x, p.clip.x, 1e-9);
        MT_NEAR(placed.y + placed.height / 2.0, p.clip.y + p.clip.height / 2.0, 1e-9);
    }
    return true;
}

static bool test_fit_modes() {
    StencilGeometry g;
    g.sourceSize = cv::Size(200, 100);
    g.contours.push_back(VectorContour{{{0, 0}, {200, 0}, {200, 100}, {0, 100}}, ContourRole::Outer, -1});

    LayoutParams params;
    params.layoutMode = LayoutMode::Repeat;
    params.rows = params.cols = 1;
    params.pageWidthMM = 120.0;
    params.pageHeightMM = 120.0;
    params.marginMM = 10.0;

    params.fitMode = FitMode::Fit;
    PanelLayout fit = PanelLayoutEngine::computeLayout(g, params);
    MT_NEAR(fit.placements[0].transform.scaleX, 0.5, 1e-12);
    MT_ASSERT(fit.warnings.empty());

    params.fitMode = FitMode::Fill;
    PanelLayout fill = PanelLayoutEngine::computeLayout(g, params);
    MT_NEAR(fill.placements[0].transform.scaleX, 1.0, 1e-12);
    MT_ASSERT(!fill.warnings.empty());

    params.fitMode = FitMode::Stretch;
    PanelLayout stretch = PanelLayoutEngine::computeLayout(g, params);
    MT_NEAR(stretch.placements[0].transform.scaleX, 0.5, 1e-12);
    MT_NEAR(stretch.placements[0].transform.scaleY, 1.0, 1e-12);
    return true;
}

static bool test_shift_round_trip() {
    StencilGeometry g = squareDesign(100, 20);
    PanelLayout layout = PanelLayoutEngine::computeLayout(g, LayoutParams());
    PanelLayout there = PanelLayoutEngine::shift(layout, 7.5, -3.25);
    PanelLayout back = PanelLayoutEngine::shift(there, -7.5, 3.25);

    for (size_t i = 0; i < layout.placements.size(); i++) {
        const auto& a = layout.placements[i].transform;
        const auto& s = there.placements[i].transform;
        const auto& b = back.placements[i].transform;
        MT_NEAR(s.offsetX - a.offsetX, 7.5, 1e-9);
        MT_NEAR(s.offsetY - a.offsetY, -3.25, 1e-9);
        MT_NEAR(b.offsetX, a.offsetX, 1e-9);
        MT_NEAR(b.offsetY, a.offsetY, 1e-9);
        MT_NEAR(b.scaleX, a.scaleX, 1e-12);
        MT_ASSERT(there.placements[i].clip == layout.placements[i].clip);
    }
    MT_NEAR(back.shiftXMM, 0.0, 1e-9);
    return true;
}

static bool test_shift_past_panel_warns() {
    LayoutParams params;
    params.shiftXMM = 25.0;
    PanelLayout layout = PanelLayoutEngine::computeLayout(squareDesign(100, 0), params);
    MT_ASSERT(layout.warnings.size() == 1);
    MT_ASSERT(layout.warnings[0].find("beyond the panel") != std::string::npos);

    // Overflow is clipped at export, never drawn past the cell
    for (const auto& p : layout.placements) {
        for (const auto& c : PanelLayoutEngine::placeContours(squareDesign(100, 0), p)) {
            for (const auto& pt : c.points) {
                MT_ASSERT(pt.x <= p.clip.x + p.clip.width + 1e-9);
            }
        }
    }

    // A small shift inside the free vertical space is fine
    params.shiftXMM = 0.0;
    params.shiftYMM = 100.0;
    MT_ASSERT(PanelLayoutEngine::computeLayout(squareDesign(100, 0), params).warnings.empty());
    return true;
}

static bool test_invalid_layouts() {
    LayoutParams params;
    params.marginMM = 120.0;
    MT_THROWS(PanelLayoutEngine::computeLayout(squareDesign(10, 0), params), std::invalid_argument);

    params = LayoutParams();
    params.rows = 0;
    MT_THROWS(PanelLayoutEngine::computeLayout(squareDesign(10, 0), params), std::invalid_argument);

    StencilGeometry empty;
    MT_THROWS(PanelLayoutEngine::computeLayout(empty, LayoutParams()), std::invalid_argument);
    return true;
}

static bool test_clip_to_rect() {
    std::vector<cv::Point2d> square = {{-5, -5}, {5, -5}, {5, 5}, {-5, 5}};
    auto clipped = PanelLayoutEngine::clipToRect(square, cv::Rect2d(0, 0, 10, 10));
    VectorContour c;
    c.points = clipped;
    MT_NEAR(c.area(), 25.0, 1e-9);

    auto outside = PanelLayoutEngine::clipToRect(square, cv::Rect2d(20, 20, 5, 5));
    MT_ASSERT(outside.size() < 3);
    return true;
}

int main() {
    return minitest::run("layout", {
        {"tile_grid_defaults", test_tile_grid_defaults},
        {"tiles_cover_the_design_once", test_tiles_cover_the_design_once},
        {"repeat_mode", test_repeat_mode},
        {"fit_modes", test_fit_modes},
        {"shift_round_trip", test_shift_round_trip},
        {"shift_past_panel_warns", test_shift_past_panel_warns},
        {"invalid_layouts", test_invalid_layouts},
        {"clip_to_rect", test_clip_to_rect},
    });
}
