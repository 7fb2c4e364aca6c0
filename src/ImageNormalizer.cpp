#include "ImageNormalizer.hpp"
#include "PapercutErrors.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>

using namespace cv;
using namespace std;

namespace Papercut {

Mat ImageNormalizer::loadImage(const string& path) {
    if (path.empty()) {
        throw InvalidImageError("Image path cannot be empty");
    }

    cout << "[INFO] Loading image from: " << path << endl;
    Mat img;
    try {
        img = imread(path, IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        throw InvalidImageError("Failed to decode image " + path + ": " + e.what());
    }
    if (img.empty()) {
        cerr << "[ERROR] Could not load image from " << path << endl;
        throw InvalidImageError("Failed to load image: " + path);
    }

    if (img.rows == 0 || img.cols == 0) {
        throw InvalidImageError("Image has zero area: " + path);
    }

    cout << "[INFO] Image loaded successfully. Shape: " << img.cols << " x " << img.rows << endl;
    return img;
}

Mat ImageNormalizer::convertToGrayscale(const Mat& img) {
    Mat gray;
    switch (img.channels()) {
        case 1:
            gray = img.clone();
            break;
        case 3:
            cvtColor(img, gray, COLOR_BGR2GRAY);
            break;
        case 4:
            cvtColor(img, gray, COLOR_BGRA2GRAY);
            break;
        default:
            throw InvalidImageError("Unsupported channel count: " + to_string(img.channels()));
    }
    if (gray.depth() != CV_8U) {
        gray.convertTo(gray, CV_8U);
    }
    return gray;
}

double ImageNormalizer::resizeFactor(const NormalizationParams& params) {
    double factor = params.scale;
    if (params.targetDpi > 0 && params.sourceDpi > 0) {
        factor *= static_cast<double>(params.targetDpi) / static_cast<double>(params.sourceDpi);
    }
    return factor;
}

Size ImageNormalizer::targetSize(const Size& source, const NormalizationParams& params) {
    const double factor = resizeFactor(params);
    int w = max(1, static_cast<int>(lround(source.width * factor)));
    int h = max(1, static_cast<int>(lround(source.height * factor)));
    return Size(w, h);
}

NormalizedImage ImageNormalizer::normalize(const Mat& source, const NormalizationParams& params,
                                           bool verbose) {
    if (source.empty() || source.rows == 0 || source.cols == 0) {
        throw InvalidImageError("Input image has zero area");
    }
    if (params.scale <= 0.0) {
        throw invalid_argument("Normalization scale must be positive");
    }

    NormalizedImage result;
    result.scaleFactor = resizeFactor(params);

    Mat gray = convertToGrayscale(source);
    const Size target = targetSize(gray.size(), params);

    if (target == gray.size()) {
        result.gray = gray;
    } else {
        int interpolation = result.scaleFactor > 1.0 ? INTER_LANCZOS4 : INTER_AREA;
        resize(gray, result.gray, target, 0, 0, interpolation);
    }

    if (params.blur >= 0.05) {
        GaussianBlur(result.gray, result.gray, Size(0, 0), params.blur, params.blur, BORDER_REPLICATE);
        result.appliedBlur = params.blur;
    }

    cout << "[INFO] Normalized to " << result.gray.cols << " x " << result.gray.rows
         << " (scale " << result.scaleFactor << ", blur " << result.appliedBlur << ")" << endl;
    if (verbose) {
        cout << "[DEBUG] Normalization: target dpi " << params.targetDpi
             << ", source dpi " << params.sourceDpi << ", scale " << params.scale << endl;
    }
    return result;
}

} // namespace Papercut
