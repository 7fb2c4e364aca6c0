#include "DetailExtractor.hpp"
#include "PapercutErrors.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

using namespace cv;
using namespace std;

namespace Papercut {

Mat DetailExtractor::ellipseKernel(int radius) {
    int size = max(3, 2 * radius + 1);
    return getStructuringElement(MORPH_ELLIPSE, Size(size, size));
}

Mat DetailExtractor::prepareGrayscale(const Mat& gray, double blur) {
    CV_Assert(gray.type() == CV_8UC1);

    Mat result;
    double minVal = 0.0, maxVal = 0.0;
    minMaxLoc(gray, &minVal, &maxVal);
    if (maxVal > minVal) {
        normalize(gray, result, 0, 255, NORM_MINMAX);
    } else {
        result = gray.clone();
    }

    if (blur > 0.0) {
        GaussianBlur(result, result, Size(0, 0), blur, blur, BORDER_REPLICATE);
    }
    return result;
}

Mat DetailExtractor::thresholdLight(const Mat& gray, int threshold) {
    Mat light;
    compare(gray, Scalar(threshold), light, CMP_GE);
    return light;
}

double DetailExtractor::lightFraction(const Mat& lightMask) {
    if (lightMask.empty()) return 0.0;
    return static_cast<double>(countNonZero(lightMask)) / static_cast<double>(lightMask.total());
}

bool DetailExtractor::shouldInvert(double fraction, InvertMode mode) {
    switch (mode) {
        case InvertMode::Light: return false;
        case InvertMode::Dark: return true;
        case InvertMode::Auto: return fraction > 0.5;
    }
    return false;
}

Mat DetailExtractor::detectDetailEdges(const Mat& gray, int delta, bool darkMaterial) {
    Mat edges = Mat::zeros(gray.size(), CV_8UC1);
    if (delta <= 0) return edges;

    Mat kernel = getStructuringElement(MORPH_RECT, Size(3, 3));
    Mat localMax, localMin;
    dilate(gray, localMax, kernel, Point(-1, -1), 1, BORDER_REPLICATE);
    erode(gray, localMin, kernel, Point(-1, -1), 1, BORDER_REPLICATE);

    Mat range;
    subtract(localMax, localMin, range);
    Mat contrasted;
    compare(range, Scalar(delta), contrasted, CMP_GE);

    // Side of the neighbourhood midpoint, compared at doubled scale to stay integral
    Mat doubled, bounds;
    gray.convertTo(doubled, CV_16U, 2.0);
    Mat max16, min16;
    localMax.convertTo(max16, CV_16U);
    localMin.convertTo(min16, CV_16U);
    add(max16, min16, bounds);

    Mat side;
    compare(doubled, bounds, side, darkMaterial ? CMP_LE : CMP_GE);

    bitwise_and(contrasted, side, edges);
    return edges;
}

Mat DetailExtractor::dilateMask(const Mat& mask, int radius) {
    if (radius <= 0) return mask.clone();
    Mat result;
    dilate(mask, result, ellipseKernel(radius));
    return result;
}

Mat DetailExtractor::joinGaps(const Mat& mask, int radius) {
    if (radius <= 0) return mask.clone();
    Mat result;
    morphologyEx(mask, result, MORPH_CLOSE, ellipseKernel(radius));
    return result;
}

Mat DetailExtractor::reinforceBridges(const Mat& mask, int minBridgePx) {
    if (minBridgePx <= 0 || countNonZero(mask) == 0) return mask.clone();

    const double halfBridge = minBridgePx / 2.0;
    const int radius = max(1, static_cast<int>(lround(halfBridge)));
    Mat kernel = ellipseKernel(radius);

    // Local thickness: the largest inscribed distance reachable within the radius
    Mat dist;
    distanceTransform(mask, dist, DIST_L2, 5);
    Mat localThickness;
    dilate(dist, localThickness, kernel);

    Mat thin;
    compare(localThickness, Scalar(halfBridge), thin, CMP_LT);
    bitwise_and(thin, mask, thin);
    if (countNonZero(thin) == 0) return mask.clone();

    Mat grown, region, reinforced;
    dilate(mask, grown, kernel);
    dilate(thin, region, kernel);
    bitwise_and(grown, region, reinforced);
    bitwise_or(reinforced, mask, reinforced);
    return reinforced;
}

StencilMask DetailExtractor::extract(const NormalizedImage& image, const ExtractionParams& params,
                                     DebugImageStack* debug, bool verbose) {
    if (image.gray.empty()) {
        throw InvalidImageError("Normalized image is empty");
    }

    cout << "[INFO] Extracting stencil mask (threshold " << params.threshold
         << ", detail delta " << params.detailDelta << ")" << endl;

    Mat prepared = prepareGrayscale(image.gray, params.blur);
    if (debug) debug->push(prepared, "prepared");

    Mat light = thresholdLight(prepared, params.threshold);
    if (debug) debug->push(light, "threshold");

    StencilMask result;
    result.lightFraction = lightFraction(light);
    result.inverted = shouldInvert(result.lightFraction, params.invertMode);
    result.polarity = result.inverted ? InvertMode::Dark : InvertMode::Light;

    if (params.invertMode == InvertMode::Auto) {
        cout << "[INFO] Light fraction " << result.lightFraction << " -> auto "
             << (result.inverted ? "dark" : "light") << " material" << endl;
    } else if (verbose) {
        cout << "[DEBUG] Light fraction " << result.lightFraction << ", forced "
             << toString(params.invertMode) << " material" << endl;
    }

    Mat material;
    if (result.inverted) {
        bitwise_not(light, material);
    } else {
        material = light;
    }

    if (params.detailDelta > 0) {
        Mat edges = detectDetailEdges(prepared, params.detailDelta, result.inverted);
        if (debug) debug->push(edges, "detail_edges");
        if (verbose) {
            cout << "[DEBUG] Detail pass flagged " << countNonZero(edges) << " pixels" << endl;
        }
        bitwise_or(material, edges, material);
    }

    material = dilateMask(material, params.dilatePx);
    material = joinGaps(material, params.detailJoinPx);
    material = reinforceBridges(material, params.minBridgePx);
    if (debug) debug->push(material, "mask");

    result.mask = material;

    const size_t count = result.materialPixels();
    if (count == 0) {
        ostringstream msg;
        msg << "Mask has no material pixels (threshold " << params.threshold
            << ", detail delta " << params.detailDelta
            << ", polarity " << toString(result.polarity)
            << ", light fraction " << result.lightFraction << ")";
        throw EmptyMaskError(msg.str());
    }

    cout << "[INFO] Mask has " << count << " material pixels ("
         << 100.0 * static_cast<double>(count) / static_cast<double>(result.mask.total())
         << "%)" << endl;
    return result;
}

} // namespace Papercut
