#pragma once

#include "PapercutTypes.hpp"
#include "PipelineConfig.hpp"
#include <opencv2/core.hpp>
#include <functional>
#include <string>
#include <vector>

namespace Papercut {

struct PipelineResult {
    NormalizedImage normalized;
    StencilMask mask;
    StencilGeometry geometry;
    PanelLayout layout;
    std::vector<ExportArtifact> artifacts;

    size_t failedArtifacts() const;
    bool success() const { return failedArtifacts() == 0; }
};

// Runs normalize -> extract -> vectorize -> layout -> export for one image.
// A failing stage throws its PapercutError before any artifact is written.
class PapercutPipeline {
public:
    using ProgressCallback = std::function<void(double progress, const std::string& stage)>;

    // Throws std::invalid_argument when the configuration is out of range
    explicit PapercutPipeline(PipelineConfig config);

    const PipelineConfig& config() const { return m_config; }

    PipelineResult run(const std::string& inputPath, const std::string& outputBase,
                       const ProgressCallback& progress = nullptr) const;

    PipelineResult runImage(const cv::Mat& source, const std::string& outputBase,
                            const ProgressCallback& progress = nullptr) const;

    // Stages without export
    PipelineResult process(const cv::Mat& source, const ProgressCallback& progress = nullptr) const;

private:
    const PipelineConfig m_config;
};

} // namespace Papercut
