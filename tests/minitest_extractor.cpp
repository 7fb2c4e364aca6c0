#include "minitest.hpp"
#include "DetailExtractor.hpp"
#include "PapercutErrors.hpp"
#include "StencilVectorizer.hpp"

using namespace Papercut;

static NormalizedImage grayImage(const cv::Mat& gray) {
    NormalizedImage img;
    img.gray = gray;
    return img;
}

// Extraction with every optional pass switched off
static ExtractionParams plainParams(InvertMode mode) {
    ExtractionParams p;
    p.threshold = 128;
    p.detailDelta = 0;
    p.blur = 0.0;
    p.dilatePx = 0;
    p.detailJoinPx = 0;
    p.invertMode = mode;
    return p;
}

static bool test_auto_picks_minority() {
    cv::Mat gray = minitest::rectImage(cv::Size(50, 50), cv::Rect(15, 15, 20, 20), 1);
    StencilMask mask = DetailExtractor::extract(grayImage(gray), plainParams(InvertMode::Auto));
    MT_ASSERT(mask.inverted);
    MT_ASSERT(mask.polarity == InvertMode::Dark);
    MT_NEAR(mask.lightFraction, 1.0 - 400.0 / 2500.0, 1e-9);
    MT_ASSERT(mask.materialPixels() == 400);
    MT_ASSERT(mask.mask.at<uchar>(25, 25) == 255);
    MT_ASSERT(mask.mask.at<uchar>(2, 2) == 0);
    return true;
}

static bool test_light_dark_are_complements() {
    cv::Mat gray(40, 40, CV_8UC1);
    cv::randu(gray, 0, 256);
    StencilMask light = DetailExtractor::extract(grayImage(gray), plainParams(InvertMode::Light));
    StencilMask dark = DetailExtractor::extract(grayImage(gray), plainParams(InvertMode::Dark));
    cv::Mat combined;
    cv::bitwise_xor(light.mask, dark.mask, combined);
    MT_ASSERT(cv::countNonZero(combined) == static_cast<int>(combined.total()));
    return true;
}

static bool test_mask_is_binary_and_deterministic() {
    cv::Mat gray(60, 60, CV_8UC1);
    cv::randu(gray, 0, 256);
    ExtractionParams params;
    StencilMask a = DetailExtractor::extract(grayImage(gray), params);
    StencilMask b = DetailExtractor::extract(grayImage(gray), params);
    MT_ASSERT(cv::norm(a.mask, b.mask, cv::NORM_INF) == 0.0);
    MT_ASSERT(a.mask.size() == gray.size());
    int binary = cv::countNonZero(a.mask == 0) + cv::countNonZero(a.mask == 255);
    MT_ASSERT(binary == static_cast<int>(a.mask.total()));
    return true;
}

static bool test_solid_image_is_empty() {
    cv::Mat white(100, 100, CV_8UC1, cv::Scalar(255));
    ExtractionParams params;
    params.threshold = 200;
    MT_THROWS(DetailExtractor::extract(grayImage(white), params), EmptyMaskError);

    cv::Mat black(100, 100, CV_8UC1, cv::Scalar(0));
    MT_THROWS(DetailExtractor::extract(grayImage(black), params), EmptyMaskError);

    try {
        DetailExtractor::extract(grayImage(white), params);
    } catch (const EmptyMaskError& e) {
        std::string what = e.what();
        MT_ASSERT(e.stage() == "extract");
        MT_ASSERT(what.find("threshold 200") != std::string::npos);
        MT_ASSERT(what.find("light fraction") != std::string::npos);
    }
    return true;
}

static bool test_detail_edges_stay_on_material_side() {
    // Dark line on white, one pixel wide
    cv::Mat gray(20, 20, CV_8UC1, cv::Scalar(255));
    gray.col(10).setTo(cv::Scalar(0));
    cv::Mat darkEdges = DetailExtractor::detectDetailEdges(gray, 60, true);
    MT_ASSERT(darkEdges.at<uchar>(5, 10) == 255);
    MT_ASSERT(darkEdges.at<uchar>(5, 9) == 0);
    MT_ASSERT(darkEdges.at<uchar>(5, 11) == 0);

    cv::Mat lightEdges = DetailExtractor::detectDetailEdges(gray, 60, false);
    MT_ASSERT(lightEdges.at<uchar>(5, 9) == 255);
    MT_ASSERT(lightEdges.at<uchar>(5, 10) == 0);

    MT_ASSERT(cv::countNonZero(DetailExtractor::detectDetailEdges(gray, 0, true)) == 0);
    return true;
}

static bool test_gap_joining() {
    // Two dark segments separated by a one-pixel gap
    cv::Mat gray(40, 60, CV_8UC1, cv::Scalar(255));
    cv::rectangle(gray, cv::Rect(10, 18, 20, 4), cv::Scalar(0), cv::FILLED);
    cv::rectangle(gray, cv::Rect(31, 18, 20, 4), cv::Scalar(0), cv::FILLED);

    ExtractionParams params = plainParams(InvertMode::Auto);
    params.detailDelta = 60;
    StencilMask open = DetailExtractor::extract(grayImage(gray), params);
    MT_ASSERT(open.mask.at<uchar>(20, 30) == 0);

    VectorizeParams vp;
    MT_ASSERT(StencilVectorizer::vectorize(open, vp).contours.size() == 2);

    params.detailJoinPx = 2;
    StencilMask joined = DetailExtractor::extract(grayImage(gray), params);
    MT_ASSERT(joined.mask.at<uchar>(20, 30) == 255);
    StencilGeometry geometry = StencilVectorizer::vectorize(joined, vp);
    MT_ASSERT(geometry.contours.size() == 1);
    MT_ASSERT(geometry.outerCount() == 1);
    return true;
}

static bool test_dilation_grows_material() {
    cv::Mat gray = minitest::rectImage(cv::Size(30, 30), cv::Rect(10, 10, 10, 10), 1);
    ExtractionParams params = plainParams(InvertMode::Dark);
    size_t base = DetailExtractor::extract(grayImage(gray), params).materialPixels();
    params.dilatePx = 2;
    size_t grown = DetailExtractor::extract(grayImage(gray), params).materialPixels();
    MT_ASSERT(grown > base);
    return true;
}

static bool test_bridge_reinforcement() {
    // Two blocks joined by a one-pixel bridge
    cv::Mat mask = cv::Mat::zeros(40, 60, CV_8UC1);
    cv::rectangle(mask, cv::Rect(5, 10, 20, 20), cv::Scalar(255), cv::FILLED);
    cv::rectangle(mask, cv::Rect(35, 10, 20, 20), cv::Scalar(255), cv::FILLED);
    cv::line(mask, cv::Point(25, 20), cv::Point(34, 20), cv::Scalar(255), 1);

    cv::Mat reinforced = DetailExtractor::reinforceBridges(mask, 6);
    MT_ASSERT(cv::countNonZero(reinforced) > cv::countNonZero(mask));
    // The bridge got thicker while existing material is kept
    MT_ASSERT(reinforced.at<uchar>(21, 30) == 255);
    cv::Mat lost;
    cv::bitwise_and(mask, ~reinforced, lost);
    MT_ASSERT(cv::countNonZero(lost) == 0);

    MT_ASSERT(cv::norm(DetailExtractor::reinforceBridges(mask, 0), mask, cv::NORM_INF) == 0.0);
    return true;
}

int main() {
    return minitest::run("extractor", {
        {"auto_picks_minority", test_auto_picks_minority},
        {"light_dark_are_complements", test_light_dark_are_complements},
        {"mask_is_binary_and_deterministic", test_mask_is_binary_and_deterministic},
        {"solid_image_is_empty", test_solid_image_is_empty},
        {"detail_edges_stay_on_material_side", test_detail_edges_stay_on_material_side},
        {"gap_joining", test_gap_joining},
        {"dilation_grows_material", test_dilation_grows_material},
        {"bridge_reinforcement", test_bridge_reinforcement},
    });
}
