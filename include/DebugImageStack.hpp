#pragma once

#include "PapercutTypes.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <utility>
#include <vector>

namespace Papercut {

// Numbered intermediate images for one pipeline run. Disabled when the
// output path is empty.
class DebugImageStack {
public:
    explicit DebugImageStack(std::string outputPath = std::string());

    bool enabled() const { return !m_outputPath.empty(); }

    void push(const cv::Mat& image, const std::string& name);
    void pushContours(const cv::Mat& image, const std::vector<VectorContour>& contours,
                      const std::string& name);

    // Writes 01_name.png, 02_name.png, ... and clears the stack.
    // Returns the number of images written.
    size_t flush();

    size_t size() const { return m_images.size(); }

private:
    std::string m_outputPath;
    std::vector<std::pair<cv::Mat, std::string>> m_images;
};

} // namespace Papercut
