#pragma once

#include "PapercutTypes.hpp"
#include "PdfWriter.hpp"
#include "PipelineConfig.hpp"
#include <string>
#include <vector>

namespace Papercut {

class PanelExporter {
public:
    // <base>_original.png, <base>_panel.png, <base>_<cols>x<rows>_<page>.<ext>
    static std::string artifactPath(const std::string& base, ArtifactFormat format, const PanelLayout& layout);

    // Artifacts a run produces, in write order
    static std::vector<ArtifactFormat> requestedFormats(const ExportParams& params);

    // Each artifact is written independently; failures are recorded in the
    // returned list instead of aborting the remaining formats.
    static std::vector<ExportArtifact> exportAll(const StencilGeometry& geometry, const PanelLayout& layout,
                                                 const ExportParams& params, const std::string& base);

    // Single-format writers. Throw ExportIOError (or the encoder's error) on failure.
    static void writePptx(const StencilGeometry& geometry, const PanelLayout& layout,
                          const ExportParams& params, const std::string& path);
    static void writePdf(const StencilGeometry& geometry, const PanelLayout& layout,
                         const ExportParams& params, const std::string& path);
    static void writeDxf(const StencilGeometry& geometry, const PanelLayout& layout, const std::string& path);
    static void writePanelPreview(const StencilGeometry& geometry, const PanelLayout& layout,
                                  const ExportParams& params, const std::string& path);
    static void writeOriginalPreview(const StencilGeometry& geometry, const ExportParams& params,
                                     const std::string& path);

    static PdfDocument buildPdf(const StencilGeometry& geometry, const PanelLayout& layout,
                                const cv::Scalar& background);

private:
    static void writePng(const cv::Mat& image, const std::string& path);
};

} // namespace Papercut
