#include "minitest.hpp"
#include "PapercutErrors.hpp"
#include "PipelineConfig.hpp"
#include "StencilVectorizer.hpp"
#include <stdexcept>

using namespace Papercut;

static StencilMask maskFrom(const cv::Mat& m) {
    StencilMask mask;
    mask.mask = m;
    return mask;
}

static VectorizeParams latticeParams() {
    VectorizeParams p;
    p.antialiasRadius = 0.0;
    return p;
}

static double cross(const cv::Point2d& o, const cv::Point2d& a, const cv::Point2d& b) {
    return (a.x - o.x) * (b.y - o.y) - (a.y - o.y) * (b.x - o.x);
}

// Proper crossing or touching of segments ab and cd
static bool segmentsMeet(const cv::Point2d& a, const cv::Point2d& b, const cv::Point2d& c, const cv::Point2d& d) {
    const double d1 = cross(c, d, a), d2 = cross(c, d, b);
    const double d3 = cross(a, b, c), d4 = cross(a, b, d);
    return d1 * d2 <= 0.0 && d3 * d4 <= 0.0 &&
           std::max(std::min(a.x, b.x), std::min(c.x, d.x)) <= std::min(std::max(a.x, b.x), std::max(c.x, d.x)) &&
           std::max(std::min(a.y, b.y), std::min(c.y, d.y)) <= std::min(std::max(a.y, b.y), std::max(c.y, d.y));
}

static int crossingCount(const StencilGeometry& g) {
    int crossings = 0;
    for (size_t ci = 0; ci < g.contours.size(); ci++) {
        const auto& p = g.contours[ci].points;
        const size_t n = p.size();
        for (size_t i = 0; i < n; i++) {
            // Non-adjacent segments of the same contour
            for (size_t j = i + 2; j < n; j++) {
                if (i == 0 && j == n - 1) continue;
                if (segmentsMeet(p[i], p[(i + 1) % n], p[j], p[(j + 1) % n])) crossings++;
            }
            // Every segment of the later contours
            for (size_t cj = ci + 1; cj < g.contours.size(); cj++) {
                const auto& q = g.contours[cj].points;
                for (size_t j = 0; j < q.size(); j++) {
                    if (segmentsMeet(p[i], p[(i + 1) % n], q[j], q[(j + 1) % q.size()])) crossings++;
                }
            }
        }
    }
    return crossings;
}

static bool test_square_area_is_exact() {
    cv::Mat m = cv::Mat::zeros(30, 30, CV_8UC1);
    m(cv::Rect(5, 7, 12, 12)).setTo(255);
    StencilGeometry g = StencilVectorizer::vectorize(maskFrom(m), latticeParams());
    MT_ASSERT(g.contours.size() == 1);
    MT_ASSERT(g.contours[0].points.size() == 4);
    MT_NEAR(g.contours[0].signedArea(), 144.0, 1e-9);
    MT_ASSERT(g.contours[0].role == ContourRole::Outer);
    MT_ASSERT(g.sourceSize == cv::Size(30, 30));
    return true;
}

static bool test_full_frame_square() {
    cv::Mat m(8, 8, CV_8UC1, cv::Scalar(255));
    StencilGeometry g = StencilVectorizer::vectorize(maskFrom(m), latticeParams());
    MT_ASSERT(g.contours.size() == 1);
    MT_NEAR(g.contours[0].area(), 64.0, 1e-9);
    return true;
}

static bool test_hole_is_tagged_and_linked() {
    cv::Mat m = cv::Mat::zeros(40, 40, CV_8UC1);
    m(cv::Rect(5, 5, 30, 30)).setTo(255);
    m(cv::Rect(15, 15, 10, 10)).setTo(0);
    StencilGeometry g = StencilVectorizer::vectorize(maskFrom(m), latticeParams());
    MT_ASSERT(g.outerCount() == 1);
    MT_ASSERT(g.holeCount() == 1);

    int outer = -1;
    for (size_t i = 0; i < g.contours.size(); i++) {
        if (g.contours[i].role == ContourRole::Outer) outer = static_cast<int>(i);
    }
    for (const auto& c : g.contours) {
        if (c.role == ContourRole::Hole) {
            MT_ASSERT(c.parent == outer);
            MT_ASSERT(c.signedArea() < 0.0);
            MT_NEAR(c.area(), 100.0, 1e-9);
        } else {
            MT_ASSERT(c.signedArea() > 0.0);
        }
    }
    return true;
}

static bool test_nested_island_picks_smallest_parent() {
    // Ring with an island inside, and the island has its own hole
    cv::Mat m = cv::Mat::zeros(60, 60, CV_8UC1);
    m(cv::Rect(2, 2, 56, 56)).setTo(255);
    m(cv::Rect(10, 10, 40, 40)).setTo(0);
    m(cv::Rect(18, 18, 24, 24)).setTo(255);
    m(cv::Rect(26, 26, 8, 8)).setTo(0);
    StencilGeometry g = StencilVectorizer::vectorize(maskFrom(m), latticeParams());
    MT_ASSERT(g.outerCount() == 2);
    MT_ASSERT(g.holeCount() == 2);

    for (const auto& c : g.contours) {
        if (c.role != ContourRole::Hole) continue;
        const VectorContour& parent = g.contours[static_cast<size_t>(c.parent)];
        if (c.area() < 100.0) {
            MT_NEAR(parent.area(), 24.0 * 24.0, 1e-9);
        } else {
            MT_NEAR(parent.area(), 56.0 * 56.0, 1e-9);
        }
    }
    return true;
}

static bool test_diagonal_pixels_stay_separate() {
    cv::Mat m = cv::Mat::zeros(6, 6, CV_8UC1);
    m.at<uchar>(2, 2) = 255;
    m.at<uchar>(3, 3) = 255;
    StencilGeometry g = StencilVectorizer::vectorize(maskFrom(m), latticeParams());
    MT_ASSERT(g.contours.size() == 2);
    for (const auto& c : g.contours) {
        MT_NEAR(c.area(), 1.0, 1e-9);
        MT_ASSERT(c.role == ContourRole::Outer);
    }
    return true;
}

static bool test_smoothing_is_bounded() {
    cv::Mat m = cv::Mat::zeros(50, 50, CV_8UC1);
    cv::circle(m, cv::Point(25, 25), 15, cv::Scalar(255), cv::FILLED);
    StencilGeometry lattice = StencilVectorizer::vectorize(maskFrom(m), latticeParams());
    StencilGeometry smooth = StencilVectorizer::vectorize(maskFrom(m), VectorizeParams());
    MT_ASSERT(smooth.contours.size() == lattice.contours.size());

    const double a0 = lattice.contours[0].area();
    const double a1 = smooth.contours[0].area();
    MT_ASSERT(std::abs(a1 - a0) / a0 < 0.05);

    // Every smoothed point stays within the displacement cap of the lattice boundary
    std::vector<cv::Point2f> poly;
    for (const auto& p : lattice.contours[0].points) poly.emplace_back(float(p.x), float(p.y));
    for (const auto& p : smooth.contours[0].points) {
        double d = std::abs(cv::pointPolygonTest(poly, cv::Point2f(float(p.x), float(p.y)), true));
        MT_ASSERT(d <= 0.45 + 1e-3);
    }
    return true;
}

static bool test_neighbours_never_merge() {
    // Two blocks one void pixel apart
    cv::Mat m = cv::Mat::zeros(20, 30, CV_8UC1);
    m(cv::Rect(3, 3, 10, 10)).setTo(255);
    m(cv::Rect(14, 3, 10, 10)).setTo(255);
    VectorizeParams params;
    params.antialiasRadius = 3.0;
    StencilGeometry g = StencilVectorizer::vectorize(maskFrom(m), params);
    MT_ASSERT(g.contours.size() == 2);

    double maxRight = 0.0, minLeft = 1e9;
    for (const auto& c : g.contours) {
        double cx = 0.0;
        for (const auto& p : c.points) cx += p.x;
        cx /= c.points.size();
        for (const auto& p : c.points) {
            if (cx < 13.0) maxRight = std::max(maxRight, p.x);
            else minLeft = std::min(minLeft, p.x);
        }
    }
    MT_ASSERT(maxRight < minLeft);
    return true;
}

static bool test_smoothed_squares_keep_area() {
    for (int n : {4, 5, 10, 20}) {
        cv::Mat m = cv::Mat::zeros(n + 10, n + 10, CV_8UC1);
        m(cv::Rect(5, 5, n, n)).setTo(255);
        StencilGeometry g = StencilVectorizer::vectorize(maskFrom(m), VectorizeParams());
        MT_ASSERT(g.contours.size() == 1);
        MT_ASSERT(g.contours[0].role == ContourRole::Outer);

        std::vector<cv::Point2d> distinct;
        for (const auto& p : g.contours[0].points) {
            bool seen = false;
            for (const auto& q : distinct) seen = seen || cv::norm(p - q) < 1e-9;
            if (!seen) distinct.push_back(p);
        }
        MT_ASSERT(distinct.size() >= 3);

        // Rounded corners only ever shave area off a convex square
        const double area = g.contours[0].area();
        MT_ASSERT(area <= n * n + 1e-6);
        MT_ASSERT(n * n - area < 2.5);
    }
    return true;
}

static bool test_thin_slits_do_not_self_intersect() {
    cv::Mat m = cv::Mat::zeros(40, 60, CV_8UC1);
    // Block with a one pixel wide dead-end slit cut in from the top
    m(cv::Rect(5, 5, 20, 20)).setTo(255);
    m(cv::Rect(15, 5, 1, 12)).setTo(0);
    // Two blocks one void pixel apart
    m(cv::Rect(30, 5, 10, 10)).setTo(255);
    m(cv::Rect(41, 5, 10, 10)).setTo(255);
    // A slit running into a hole
    m(cv::Rect(30, 20, 21, 15)).setTo(255);
    m(cv::Rect(36, 25, 9, 5)).setTo(0);
    m(cv::Rect(40, 30, 1, 3)).setTo(0);

    StencilGeometry g = StencilVectorizer::vectorize(maskFrom(m), VectorizeParams());
    MT_ASSERT(g.outerCount() == 4);
    MT_ASSERT(g.holeCount() == 1);
    MT_ASSERT(crossingCount(g) == 0);

    VectorizeParams strong;
    strong.antialiasRadius = 3.0;
    MT_ASSERT(crossingCount(StencilVectorizer::vectorize(maskFrom(m), strong)) == 0);
    return true;
}

static bool test_displacement_budget_is_validated() {
    PipelineConfig config;
    MT_ASSERT(config.vectorize.maxDisplacement + config.vectorize.simplifyEpsilon < 0.5);
    validateConfig(config);

    config.vectorize.maxDisplacement = 0.45;
    config.vectorize.simplifyEpsilon = 0.1;
    MT_THROWS(validateConfig(config), std::invalid_argument);

    config.vectorize.simplifyEpsilon = 0.0;
    validateConfig(config);
    return true;
}

static bool test_speck_filter() {
    cv::Mat m = cv::Mat::zeros(30, 30, CV_8UC1);
    m(cv::Rect(2, 2, 20, 20)).setTo(255);
    m.at<uchar>(27, 27) = 255;
    VectorizeParams params = latticeParams();
    MT_ASSERT(StencilVectorizer::vectorize(maskFrom(m), params).contours.size() == 2);
    params.minRegionPx = 4.0;
    MT_ASSERT(StencilVectorizer::vectorize(maskFrom(m), params).contours.size() == 1);
    return true;
}

static bool test_empty_mask_is_degenerate() {
    MT_THROWS(StencilVectorizer::vectorize(maskFrom(cv::Mat()), VectorizeParams()), DegenerateGeometryError);
    cv::Mat m = cv::Mat::zeros(10, 10, CV_8UC1);
    MT_THROWS(StencilVectorizer::vectorize(maskFrom(m), VectorizeParams()), DegenerateGeometryError);
    return true;
}

static bool test_remove_collinear() {
    std::vector<cv::Point> loop = {{0, 0}, {1, 0}, {2, 0}, {2, 1}, {2, 2}, {1, 2}, {0, 2}, {0, 1}};
    std::vector<cv::Point> corners = StencilVectorizer::removeCollinear(loop);
    MT_ASSERT(corners.size() == 4);
    return true;
}

int main() {
    return minitest::run("vectorizer", {
        {"square_area_is_exact", test_square_area_is_exact},
        {"full_frame_square", test_full_frame_square},
        {"hole_is_tagged_and_linked", test_hole_is_tagged_and_linked},
        {"nested_island_picks_smallest_parent", test_nested_island_picks_smallest_parent},
        {"diagonal_pixels_stay_separate", test_diagonal_pixels_stay_separate},
        {"smoothing_is_bounded", test_smoothing_is_bounded},
        {"neighbours_never_merge", test_neighbours_never_merge},
        {"smoothed_squares_keep_area", test_smoothed_squares_keep_area},
        {"thin_slits_do_not_self_intersect", test_thin_slits_do_not_self_intersect},
        {"displacement_budget_is_validated", test_displacement_budget_is_validated},
        {"speck_filter", test_speck_filter},
        {"empty_mask_is_degenerate", test_empty_mask_is_degenerate},
        {"remove_collinear", test_remove_collinear},
    });
}
