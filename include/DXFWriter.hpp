#pragma once

#include "PapercutTypes.hpp"
#include <libdxfrw.h>
#include <drw_interface.h>
#include <string>
#include <vector>

namespace Papercut {

// Writes the cut lines as closed LWPOLYLINEs on the OUTER and HOLE layers.
// Coordinates are millimetres with the DXF y axis pointing up.
class DXFWriter : public DRW_Interface {
public:
    DXFWriter(dxfRW& dxfWriter, double heightMM);

    // Contours with fewer than three points are skipped
    void addContour(const VectorContour& contour);
    size_t polylineCount() const { return m_polylines.size(); }

    // Design contours at panel scale (tile) or page scale (repeat), in mm,
    // y down. panelWidth/panelHeight receive the drawing extent.
    static std::vector<VectorContour> panelContours(const StencilGeometry& geometry,
                                                    const PanelLayout& layout,
                                                    double& panelWidthMM, double& panelHeightMM);

    // Throws ExportIOError when the file cannot be written
    static void saveStencilAsDXF(const StencilGeometry& geometry, const PanelLayout& layout,
                                 const std::string& outputPath);

    // Reader callbacks, unused when writing
    void addHeader(const DRW_Header*) {}
    void addLType(const DRW_LType&) {}
    void addLayer(const DRW_Layer&) {}
    void addDimStyle(const DRW_Dimstyle&) {}
    void addVport(const DRW_Vport&) {}
    void addTextStyle(const DRW_Textstyle&) {}
    void addAppId(const DRW_AppId&) {}
    void addBlock(const DRW_Block&) {}
    void setBlock(const int) {}
    void endBlock() {}
    void addPoint(const DRW_Point&) {}
    void addLine(const DRW_Line&) {}
    void addRay(const DRW_Ray&) {}
    void addXline(const DRW_Xline&) {}
    void addArc(const DRW_Arc&) {}
    void addCircle(const DRW_Circle&) {}
    void addEllipse(const DRW_Ellipse&) {}
    void addLWPolyline(const DRW_LWPolyline& data);
    void addPolyline(const DRW_Polyline&) {}
    void addSpline(const DRW_Spline*) {}
    void addKnot(const DRW_Entity&) {}
    void addInsert(const DRW_Insert&) {}
    void addTrace(const DRW_Trace&) {}
    void add3dFace(const DRW_3Dface&) {}
    void addSolid(const DRW_Solid&) {}
    void addMText(const DRW_MText&) {}
    void addText(const DRW_Text&) {}
    void addDimAlign(const DRW_DimAligned*) {}
    void addDimLinear(const DRW_DimLinear*) {}
    void addDimRadial(const DRW_DimRadial*) {}
    void addDimDiametric(const DRW_DimDiametric*) {}
    void addDimAngular(const DRW_DimAngular*) {}
    void addDimAngular3P(const DRW_DimAngular3p*) {}
    void addDimOrdinate(const DRW_DimOrdinate*) {}
    void addLeader(const DRW_Leader*) {}
    void addHatch(const DRW_Hatch*) {}
    void addViewport(const DRW_Viewport&) {}
    void addImage(const DRW_Image*) {}
    void linkImage(const DRW_ImageDef*) {}
    void addComment(const char*) {}

    // Writer callbacks
    void writeHeader(DRW_Header& data);
    void writeBlocks() {}
    void writeBlockRecords() {}
    void writeEntities();
    void writeLTypes() {}
    void writeLayers();
    void writeTextstyles() {}
    void writeVports() {}
    void writeDimstyles() {}
    void writeAppId() {}

private:
    dxfRW& m_dxfWriter;
    double m_heightMM;
    std::vector<DRW_LWPolyline> m_polylines;
};

} // namespace Papercut
