#pragma once

#include "PapercutTypes.hpp"
#include "PipelineConfig.hpp"
#include <opencv2/core.hpp>
#include <string>

namespace Papercut {

class ImageNormalizer {
public:
    // Throws InvalidImageError when the file cannot be decoded or is empty
    static cv::Mat loadImage(const std::string& path);
    static cv::Mat convertToGrayscale(const cv::Mat& img);

    static double resizeFactor(const NormalizationParams& params);
    static cv::Size targetSize(const cv::Size& source, const NormalizationParams& params);

    // Resample to the target DPI/scale, reduce to luminance and denoise
    static NormalizedImage normalize(const cv::Mat& source, const NormalizationParams& params,
                                     bool verbose = false);
};

} // namespace Papercut
