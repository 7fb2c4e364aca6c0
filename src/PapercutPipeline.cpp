#include "PapercutPipeline.hpp"
#include "DebugImageStack.hpp"
#include "DetailExtractor.hpp"
#include "ImageNormalizer.hpp"
#include "PanelExporter.hpp"
#include "PanelLayoutEngine.hpp"
#include "PapercutErrors.hpp"
#include "StencilVectorizer.hpp"
#include <iostream>

using namespace cv;
using namespace std;

namespace Papercut {

namespace {

PipelineConfig validated(PipelineConfig config) {
    validateConfig(config);
    return config;
}

void report(const PapercutPipeline::ProgressCallback& progress, double value, const string& stage) {
    if (progress) {
        progress(value, stage);
    }
}

} // namespace

size_t PipelineResult::failedArtifacts() const {
    size_t failed = 0;
    for (const auto& artifact : artifacts) {
        if (!artifact.ok) failed++;
    }
    return failed;
}

PapercutPipeline::PapercutPipeline(PipelineConfig config)
    : m_config(validated(std::move(config))) {
}

PipelineResult PapercutPipeline::process(const Mat& source, const ProgressCallback& progress) const {
    const bool verbose = m_config.verbose;
    DebugImageStack debug(m_config.debugOutputPath);
    PipelineResult result;

    try {
        report(progress, 0.1, "Normalizing image");
        result.normalized = ImageNormalizer::normalize(source, m_config.normalization, verbose);
        debug.push(result.normalized.gray, "normalized");

        report(progress, 0.3, "Extracting stencil mask");
        result.mask = DetailExtractor::extract(result.normalized, m_config.extraction, &debug, verbose);

        report(progress, 0.5, "Vectorizing contours");
        result.geometry = StencilVectorizer::vectorize(result.mask, m_config.vectorize, &debug, verbose);

        report(progress, 0.6, "Computing panel layout");
        result.layout = PanelLayoutEngine::computeLayout(result.geometry, m_config.layout);
    } catch (const PapercutError& e) {
        cerr << "[ERROR] Stage '" << e.stage() << "' failed: " << e.what() << endl;
        debug.flush();
        throw;
    }

    debug.flush();
    return result;
}

PipelineResult PapercutPipeline::runImage(const Mat& source, const string& outputBase,
                                          const ProgressCallback& progress) const {
    PipelineResult result = process(source, progress);

    report(progress, 0.7, "Exporting artifacts");
    result.artifacts = PanelExporter::exportAll(result.geometry, result.layout, m_config.exports, outputBase);

    const size_t failed = result.failedArtifacts();
    if (failed == 0) {
        cout << "[SUCCESS] Wrote " << result.artifacts.size() << " artifacts" << endl;
    } else {
        cerr << "[ERROR] " << failed << " of " << result.artifacts.size() << " artifacts failed" << endl;
    }
    report(progress, 1.0, "Complete");
    return result;
}

PipelineResult PapercutPipeline::run(const string& inputPath, const string& outputBase,
                                     const ProgressCallback& progress) const {
    report(progress, 0.0, "Loading image");
    Mat source = ImageNormalizer::loadImage(inputPath);
    return runImage(source, outputBase, progress);
}

} // namespace Papercut
