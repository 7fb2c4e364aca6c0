#include "DXFWriter.hpp"
#include "AtomicFile.hpp"
#include "PanelLayoutEngine.hpp"
#include "PapercutErrors.hpp"
#include <iostream>

namespace Papercut {

namespace {

const char* OUTER_LAYER = "OUTER";
const char* HOLE_LAYER = "HOLE";

} // namespace

DXFWriter::DXFWriter(dxfRW& dxfWriter, double heightMM)
    : m_dxfWriter(dxfWriter), m_heightMM(heightMM) {
}

void DXFWriter::addContour(const VectorContour& contour) {
    if (contour.points.size() < 3) {
        std::cout << "[DEBUG] Skipping degenerate contour with " << contour.points.size() << " points." << std::endl;
        return;
    }

    DRW_LWPolyline polyline;
    polyline.layer = contour.role == ContourRole::Outer ? OUTER_LAYER : HOLE_LAYER;
    polyline.color = 256; // By layer
    polyline.flags = 1;   // Closed polyline
    polyline.elevation = 0.0;
    polyline.thickness = 0.0;

    for (const auto& point : contour.points) {
        DRW_Vertex2D vertex;
        vertex.x = point.x;
        vertex.y = m_heightMM - point.y;
        vertex.bulge = 0.0;
        polyline.addVertex(vertex);
    }

    m_polylines.push_back(polyline);
}

void DXFWriter::addLWPolyline(const DRW_LWPolyline& data) {
    m_polylines.push_back(data);
}

void DXFWriter::writeHeader(DRW_Header& data) {
    data.addInt("$INSUNITS", 4, 70); // millimetres
}

void DXFWriter::writeLayers() {
    DRW_Layer outer;
    outer.name = OUTER_LAYER;
    outer.color = 7;
    m_dxfWriter.writeLayer(&outer);

    DRW_Layer hole;
    hole.name = HOLE_LAYER;
    hole.color = 1;
    m_dxfWriter.writeLayer(&hole);
}

void DXFWriter::writeEntities() {
    for (auto& polyline : m_polylines) {
        if (!m_dxfWriter.writeLWPolyline(&polyline)) {
            std::cerr << "[ERROR] Failed to write LWPolyline to DXF." << std::endl;
        }
    }
    m_polylines.clear();
}

std::vector<VectorContour> DXFWriter::panelContours(const StencilGeometry& geometry,
                                                    const PanelLayout& layout,
                                                    double& panelWidthMM, double& panelHeightMM) {
    std::vector<VectorContour> contours;
    if (layout.placements.empty()) {
        panelWidthMM = panelHeightMM = 0.0;
        return contours;
    }

    if (layout.mode == LayoutMode::Tile) {
        // Page (0,0) transform minus its margin offset is the panel transform
        panelWidthMM = layout.cols * layout.cellWidthMM;
        panelHeightMM = layout.rows * layout.cellHeightMM;

        Placement panel = layout.placements.front();
        panel.transform.offsetX -= panel.clip.x;
        panel.transform.offsetY -= panel.clip.y;
        panel.clip = cv::Rect2d(0.0, 0.0, panelWidthMM, panelHeightMM);
        return PanelLayoutEngine::placeContours(geometry, panel);
    }

    panelWidthMM = layout.pageWidthMM;
    panelHeightMM = layout.pageHeightMM;
    for (const auto& placement : layout.placements) {
        std::vector<VectorContour> placed = PanelLayoutEngine::placeContours(geometry, placement);
        const int base = static_cast<int>(contours.size());
        for (auto& contour : placed) {
            if (contour.parent >= 0) contour.parent += base;
            contours.push_back(std::move(contour));
        }
    }
    return contours;
}

void DXFWriter::saveStencilAsDXF(const StencilGeometry& geometry, const PanelLayout& layout,
                                 const std::string& outputPath) {
    std::cout << "[INFO] Saving stencil to DXF: " << outputPath << std::endl;

    double widthMM = 0.0, heightMM = 0.0;
    std::vector<VectorContour> contours = panelContours(geometry, layout, widthMM, heightMM);

    const std::string tmpPath = AtomicFile::temporaryPath(outputPath);
    bool written = false;
    size_t polylines = 0;
    {
        dxfRW dxf(tmpPath.c_str());
        DXFWriter writer(dxf, heightMM);
        for (const auto& contour : contours) {
            writer.addContour(contour);
        }
        polylines = writer.polylineCount();
        written = dxf.write(&writer, DRW::Version::AC1015, false);
    }

    if (!written) {
        AtomicFile::discard(tmpPath);
        throw ExportIOError(outputPath, "libdxfrw failed to write the drawing");
    }
    AtomicFile::commit(tmpPath, outputPath);

    std::cout << "[INFO] DXF file saved successfully (" << polylines << " polylines, "
              << widthMM << " x " << heightMM << " mm)." << std::endl;
}

} // namespace Papercut
