#pragma once

#include "DebugImageStack.hpp"
#include "PapercutTypes.hpp"
#include "PipelineConfig.hpp"
#include <opencv2/core.hpp>

namespace Papercut {

class DetailExtractor {
public:
    // Auto-contrast followed by the optional pre-threshold blur
    static cv::Mat prepareGrayscale(const cv::Mat& gray, double blur);

    static cv::Mat thresholdLight(const cv::Mat& gray, int threshold);
    static double lightFraction(const cv::Mat& lightMask);
    static bool shouldInvert(double lightFraction, InvertMode mode);

    // Pixels on the material side of a 3x3 neighbourhood whose range >= delta
    static cv::Mat detectDetailEdges(const cv::Mat& gray, int delta, bool darkMaterial);

    static cv::Mat dilateMask(const cv::Mat& mask, int radius);
    static cv::Mat joinGaps(const cv::Mat& mask, int radius);
    static cv::Mat reinforceBridges(const cv::Mat& mask, int minBridgePx);

    // Throws EmptyMaskError when nothing is left to cut
    static StencilMask extract(const NormalizedImage& image, const ExtractionParams& params,
                               DebugImageStack* debug = nullptr, bool verbose = false);

private:
    static cv::Mat ellipseKernel(int radius);
};

} // namespace Papercut
