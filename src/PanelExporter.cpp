#include "PanelExporter.hpp"
#include "AtomicFile.hpp"
#include "DXFWriter.hpp"
#include "PanelLayoutEngine.hpp"
#include "PanelRenderer.hpp"
#include "PapercutErrors.hpp"
#include "PptxWriter.hpp"
#include <opencv2/imgcodecs.hpp>
#include <filesystem>
#include <iostream>

using namespace cv;
using namespace std;
namespace fs = std::filesystem;

namespace Papercut {

string PanelExporter::artifactPath(const string& base, ArtifactFormat format, const PanelLayout& layout) {
    const string grid = "_" + to_string(layout.cols) + "x" + to_string(layout.rows) + "_" + layout.pageName;
    switch (format) {
        case ArtifactFormat::OriginalPreview: return base + "_original.png";
        case ArtifactFormat::PanelPreview: return base + "_panel.png";
        case ArtifactFormat::Pdf: return base + grid + ".pdf";
        case ArtifactFormat::Pptx: return base + grid + ".pptx";
        case ArtifactFormat::Dxf: return base + grid + ".dxf";
    }
    return base;
}

vector<ArtifactFormat> PanelExporter::requestedFormats(const ExportParams& params) {
    vector<ArtifactFormat> formats;
    formats.push_back(ArtifactFormat::OriginalPreview);
    if (params.debugPanel) formats.push_back(ArtifactFormat::PanelPreview);
    if (params.pdf) formats.push_back(ArtifactFormat::Pdf);
    if (params.pptx) formats.push_back(ArtifactFormat::Pptx);
    if (params.dxf) formats.push_back(ArtifactFormat::Dxf);
    return formats;
}

void PanelExporter::writePng(const Mat& image, const string& path) {
    vector<unsigned char> encoded;
    if (!imencode(".png", image, encoded)) {
        throw ExportIOError(path, "PNG encoding failed");
    }
    AtomicFile::write(path, encoded);
}

PdfDocument PanelExporter::buildPdf(const StencilGeometry& geometry, const PanelLayout& layout,
                                    const Scalar& background) {
    PdfDocument doc(layout.pageWidthMM, layout.pageHeightMM);
    doc.setTitle("Papercut panel " + to_string(layout.cols) + "x" + to_string(layout.rows) + " " +
                 layout.pageName);

    for (int page = 0; page < layout.pageCount; page++) {
        PdfPage& pdfPage = doc.addPage();
        for (const auto& placement : layout.placements) {
            if (placement.page != page) continue;
            pdfPage.save();
            pdfPage.clipRect(placement.clip);
            pdfPage.setFillColor(background);
            pdfPage.fillRect(placement.clip);
            pdfPage.setFillColor(Scalar(255, 255, 255));
            pdfPage.fillContours(PanelLayoutEngine::placeContours(geometry, placement));
            pdfPage.restore();
        }
    }
    return doc;
}

void PanelExporter::writePdf(const StencilGeometry& geometry, const PanelLayout& layout,
                             const ExportParams& params, const string& path) {
    PdfDocument doc = buildPdf(geometry, layout, params.background);
    AtomicFile::write(path, doc.build());
    cout << "[INFO] PDF saved: " << path << " (" << doc.pageCount() << " pages)" << endl;
}

void PanelExporter::writePptx(const StencilGeometry& geometry, const PanelLayout& layout,
                              const ExportParams& params, const string& path) {
    AtomicFile::write(path, PptxWriter::build(geometry, layout, params.background));
    cout << "[INFO] PPTX saved: " << path << " (" << layout.pageCount << " slides)" << endl;
}

void PanelExporter::writeDxf(const StencilGeometry& geometry, const PanelLayout& layout, const string& path) {
    DXFWriter::saveStencilAsDXF(geometry, layout, path);
}

void PanelExporter::writePanelPreview(const StencilGeometry& geometry, const PanelLayout& layout,
                                      const ExportParams& params, const string& path) {
    Mat panel = PanelRenderer::renderPanel(geometry, layout, params.previewDpi, params.background);
    writePng(panel, path);
    cout << "[INFO] Panel preview saved: " << path << " (" << panel.cols << "x" << panel.rows << ")" << endl;
}

void PanelExporter::writeOriginalPreview(const StencilGeometry& geometry, const ExportParams& params,
                                         const string& path) {
    Mat original = PanelRenderer::renderOriginal(geometry, params.background);
    writePng(original, path);
    cout << "[INFO] Original-size preview saved: " << path << endl;
}

vector<ExportArtifact> PanelExporter::exportAll(const StencilGeometry& geometry, const PanelLayout& layout,
                                                const ExportParams& params, const string& base) {
    const fs::path parent = fs::path(base).parent_path();
    if (!parent.empty()) {
        error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            cerr << "[WARN] Cannot create output directory " << parent.string() << ": " << ec.message() << endl;
        }
    }

    vector<ExportArtifact> artifacts;
    for (ArtifactFormat format : requestedFormats(params)) {
        ExportArtifact artifact;
        artifact.format = format;
        artifact.path = artifactPath(base, format, layout);

        try {
            switch (format) {
                case ArtifactFormat::OriginalPreview:
                    writeOriginalPreview(geometry, params, artifact.path);
                    break;
                case ArtifactFormat::PanelPreview:
                    writePanelPreview(geometry, layout, params, artifact.path);
                    break;
                case ArtifactFormat::Pdf:
                    writePdf(geometry, layout, params, artifact.path);
                    break;
                case ArtifactFormat::Pptx:
                    writePptx(geometry, layout, params, artifact.path);
                    break;
                case ArtifactFormat::Dxf:
                    writeDxf(geometry, layout, artifact.path);
                    break;
            }
            artifact.ok = true;
        } catch (const ExportIOError& e) {
            artifact.error = e.what();
        } catch (const std::exception& e) {
            artifact.error = ExportIOError(artifact.path, e.what()).what();
        }

        if (!artifact.ok) {
            cerr << "[ERROR] " << toString(format) << " export failed: " << artifact.error << endl;
            AtomicFile::discard(AtomicFile::temporaryPath(artifact.path));
        }
        artifacts.push_back(artifact);
    }
    return artifacts;
}

} // namespace Papercut
