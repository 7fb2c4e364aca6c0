#include "PptxWriter.hpp"
#include "PanelLayoutEngine.hpp"
#include "ZipArchive.hpp"
#include <algorithm>
#include <cstdio>
#include <sstream>

using namespace cv;
using namespace std;

namespace Papercut {

namespace {

const char* XML_DECL = "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n";
const char* NS_A = "http://schemas.openxmlformats.org/drawingml/2006/main";
const char* NS_R = "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
const char* NS_P = "http://schemas.openxmlformats.org/presentationml/2006/main";
const char* NS_PKG_REL = "http://schemas.openxmlformats.org/package/2006/relationships";
const char* REL_BASE = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/";

string namespaces() {
    return string("xmlns:a=\"") + NS_A + "\" xmlns:r=\"" + NS_R + "\" xmlns:p=\"" + NS_P + "\"";
}

string hexColor(const Scalar& bgr) {
    char buf[8];
    snprintf(buf, sizeof(buf), "%02X%02X%02X",
             saturate_cast<uchar>(bgr[2]), saturate_cast<uchar>(bgr[1]), saturate_cast<uchar>(bgr[0]));
    return buf;
}

string emptyGroupProps() {
    return "<p:nvGrpSpPr><p:cNvPr id=\"1\" name=\"\"/><p:cNvGrpSpPr/><p:nvPr/></p:nvGrpSpPr>"
           "<p:grpSpPr><a:xfrm><a:off x=\"0\" y=\"0\"/><a:ext cx=\"0\" cy=\"0\"/>"
           "<a:chOff x=\"0\" y=\"0\"/><a:chExt cx=\"0\" cy=\"0\"/></a:xfrm></p:grpSpPr>";
}

string xfrm(int64_t x, int64_t y, int64_t cx, int64_t cy) {
    ostringstream s;
    s << "<a:xfrm><a:off x=\"" << x << "\" y=\"" << y << "\"/><a:ext cx=\"" << cx << "\" cy=\""
      << cy << "\"/></a:xfrm>";
    return s.str();
}

string relationship(const string& id, const string& type, const string& target) {
    return "<Relationship Id=\"" + id + "\" Type=\"" + REL_BASE + type + "\" Target=\"" + target + "\"/>";
}

string rootRels() {
    return string(XML_DECL) + "<Relationships xmlns=\"" + NS_PKG_REL + "\">" +
           relationship("rId1", "officeDocument", "ppt/presentation.xml") +
           "<Relationship Id=\"rId2\" Type=\"http://schemas.openxmlformats.org/package/2006/relationships/"
           "metadata/core-properties\" Target=\"docProps/core.xml\"/>" +
           relationship("rId3", "extended-properties", "docProps/app.xml") +
           "</Relationships>";
}

string coreXml() {
    return string(XML_DECL) +
           "<cp:coreProperties xmlns:cp=\"http://schemas.openxmlformats.org/package/2006/metadata/core-properties\""
           " xmlns:dc=\"http://purl.org/dc/elements/1.1/\" xmlns:dcterms=\"http://purl.org/dc/terms/\""
           " xmlns:xsi=\"http://www.w3.org/2001/XMLSchema-instance\">"
           "<dc:title>Papercut panel</dc:title><dc:creator>papercut</dc:creator>"
           "</cp:coreProperties>";
}

string appXml(int slideCount) {
    return string(XML_DECL) +
           "<Properties xmlns=\"http://schemas.openxmlformats.org/officeDocument/2006/extended-properties\">"
           "<Application>papercut</Application><Slides>" + to_string(slideCount) + "</Slides></Properties>";
}

string slideRels() {
    return string(XML_DECL) + "<Relationships xmlns=\"" + NS_PKG_REL + "\">" +
           relationship("rId1", "slideLayout", "../slideLayouts/slideLayout1.xml") + "</Relationships>";
}

string masterRels() {
    return string(XML_DECL) + "<Relationships xmlns=\"" + NS_PKG_REL + "\">" +
           relationship("rId1", "slideLayout", "../slideLayouts/slideLayout1.xml") +
           relationship("rId2", "theme", "../theme/theme1.xml") + "</Relationships>";
}

string layoutRels() {
    return string(XML_DECL) + "<Relationships xmlns=\"" + NS_PKG_REL + "\">" +
           relationship("rId1", "slideMaster", "../slideMasters/slideMaster1.xml") + "</Relationships>";
}

} // namespace

string PptxWriter::contentTypes(int slideCount) {
    const string pml = "application/vnd.openxmlformats-officedocument.presentationml.";
    string xml = string(XML_DECL) +
        "<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">"
        "<Default Extension=\"rels\" ContentType=\"application/vnd.openxmlformats-package.relationships+xml\"/>"
        "<Default Extension=\"xml\" ContentType=\"application/xml\"/>"
        "<Override PartName=\"/ppt/presentation.xml\" ContentType=\"" + pml + "presentation.main+xml\"/>"
        "<Override PartName=\"/ppt/slideMasters/slideMaster1.xml\" ContentType=\"" + pml + "slideMaster+xml\"/>"
        "<Override PartName=\"/ppt/slideLayouts/slideLayout1.xml\" ContentType=\"" + pml + "slideLayout+xml\"/>"
        "<Override PartName=\"/ppt/theme/theme1.xml\" "
        "ContentType=\"application/vnd.openxmlformats-officedocument.theme+xml\"/>"
        "<Override PartName=\"/docProps/core.xml\" "
        "ContentType=\"application/vnd.openxmlformats-package.core-properties+xml\"/>"
        "<Override PartName=\"/docProps/app.xml\" "
        "ContentType=\"application/vnd.openxmlformats-officedocument.extended-properties+xml\"/>";
    for (int i = 1; i <= slideCount; i++) {
        xml += "<Override PartName=\"/ppt/slides/slide" + to_string(i) + ".xml\" ContentType=\"" + pml +
               "slide+xml\"/>";
    }
    xml += "</Types>";
    return xml;
}

string PptxWriter::presentationXml(const PanelLayout& layout, int slideCount) {
    ostringstream s;
    s << XML_DECL << "<p:presentation " << namespaces() << ">"
      << "<p:sldMasterIdLst><p:sldMasterId id=\"2147483648\" r:id=\"rId1\"/></p:sldMasterIdLst>"
      << "<p:sldIdLst>";
    for (int i = 0; i < slideCount; i++) {
        s << "<p:sldId id=\"" << (256 + i) << "\" r:id=\"rId" << (3 + i) << "\"/>";
    }
    s << "</p:sldIdLst>"
      << "<p:sldSz cx=\"" << toEmu(layout.pageWidthMM) << "\" cy=\"" << toEmu(layout.pageHeightMM) << "\"/>"
      << "<p:notesSz cx=\"6858000\" cy=\"9144000\"/>"
      << "</p:presentation>";
    return s.str();
}

string PptxWriter::presentationRels(int slideCount) {
    string xml = string(XML_DECL) + "<Relationships xmlns=\"" + NS_PKG_REL + "\">" +
                 relationship("rId1", "slideMaster", "slideMasters/slideMaster1.xml") +
                 relationship("rId2", "theme", "theme/theme1.xml");
    for (int i = 0; i < slideCount; i++) {
        xml += relationship("rId" + to_string(3 + i), "slide", "slides/slide" + to_string(i + 1) + ".xml");
    }
    xml += "</Relationships>";
    return xml;
}

string PptxWriter::slideMasterXml() {
    return string(XML_DECL) + "<p:sldMaster " + namespaces() + ">" +
           "<p:cSld><p:bg><p:bgRef idx=\"1001\"><a:schemeClr val=\"bg1\"/></p:bgRef></p:bg>"
           "<p:spTree>" + emptyGroupProps() + "</p:spTree></p:cSld>"
           "<p:clrMap bg1=\"lt1\" tx1=\"dk1\" bg2=\"lt2\" tx2=\"dk2\" accent1=\"accent1\" accent2=\"accent2\""
           " accent3=\"accent3\" accent4=\"accent4\" accent5=\"accent5\" accent6=\"accent6\""
           " hlink=\"hlink\" folHlink=\"folHlink\"/>"
           "<p:sldLayoutIdLst><p:sldLayoutId id=\"2147483649\" r:id=\"rId1\"/></p:sldLayoutIdLst>"
           "</p:sldMaster>";
}

string PptxWriter::slideLayoutXml() {
    return string(XML_DECL) + "<p:sldLayout " + namespaces() + " type=\"blank\" preserve=\"1\">" +
           "<p:cSld name=\"Blank\"><p:spTree>" + emptyGroupProps() + "</p:spTree></p:cSld>"
           "<p:clrMapOvr><a:masterClrMapping/></p:clrMapOvr></p:sldLayout>";
}

string PptxWriter::themeXml() {
    auto solid = [](const char* scheme) {
        return string("<a:solidFill><a:schemeClr val=\"") + scheme + "\"/></a:solidFill>";
    };
    auto line = [&](int w) {
        return "<a:ln w=\"" + to_string(w) + "\">" + solid("phClr") + "</a:ln>";
    };
    auto sys = [](const char* name, const char* sysVal, const char* last) {
        return string("<a:") + name + "><a:sysClr val=\"" + sysVal + "\" lastClr=\"" + last + "\"/></a:" + name + ">";
    };
    auto rgb = [](const char* name, const char* val) {
        return string("<a:") + name + "><a:srgbClr val=\"" + val + "\"/></a:" + name + ">";
    };

    return string(XML_DECL) + "<a:theme xmlns:a=\"" + NS_A + "\" name=\"Papercut\"><a:themeElements>" +
           "<a:clrScheme name=\"Papercut\">" +
           sys("dk1", "windowText", "000000") + sys("lt1", "window", "FFFFFF") +
           rgb("dk2", "44546A") + rgb("lt2", "E7E6E6") + rgb("accent1", "4472C4") + rgb("accent2", "ED7D31") +
           rgb("accent3", "A5A5A5") + rgb("accent4", "FFC000") + rgb("accent5", "5B9BD5") +
           rgb("accent6", "70AD47") + rgb("hlink", "0563C1") + rgb("folHlink", "954F72") +
           "</a:clrScheme>"
           "<a:fontScheme name=\"Papercut\">"
           "<a:majorFont><a:latin typeface=\"Calibri\"/><a:ea typeface=\"\"/><a:cs typeface=\"\"/></a:majorFont>"
           "<a:minorFont><a:latin typeface=\"Calibri\"/><a:ea typeface=\"\"/><a:cs typeface=\"\"/></a:minorFont>"
           "</a:fontScheme>"
           "<a:fmtScheme name=\"Papercut\">"
           "<a:fillStyleLst>" + solid("phClr") + solid("phClr") + solid("phClr") + "</a:fillStyleLst>"
           "<a:lnStyleLst>" + line(6350) + line(12700) + line(19050) + "</a:lnStyleLst>"
           "<a:effectStyleLst><a:effectStyle><a:effectLst/></a:effectStyle>"
           "<a:effectStyle><a:effectLst/></a:effectStyle><a:effectStyle><a:effectLst/></a:effectStyle>"
           "</a:effectStyleLst>"
           "<a:bgFillStyleLst>" + solid("phClr") + solid("phClr") + solid("phClr") + "</a:bgFillStyleLst>"
           "</a:fmtScheme></a:themeElements></a:theme>";
}

string PptxWriter::groupXml(const vector<VectorContour>& contours, const Placement& placement,
                            const Scalar& background, int& nextId) {
    const int64_t x = toEmu(placement.clip.x);
    const int64_t y = toEmu(placement.clip.y);
    const int64_t cx = std::max<int64_t>(1, toEmu(placement.clip.width));
    const int64_t cy = std::max<int64_t>(1, toEmu(placement.clip.height));
    const string cellName = "Cell r" + to_string(placement.row + 1) + "c" + to_string(placement.col + 1);

    ostringstream s;
    s << "<p:grpSp><p:nvGrpSpPr><p:cNvPr id=\"" << nextId++ << "\" name=\"" << cellName << "\"/>"
      << "<p:cNvGrpSpPr/><p:nvPr/></p:nvGrpSpPr>"
      << "<p:grpSpPr><a:xfrm><a:off x=\"" << x << "\" y=\"" << y << "\"/><a:ext cx=\"" << cx << "\" cy=\""
      << cy << "\"/><a:chOff x=\"" << x << "\" y=\"" << y << "\"/><a:chExt cx=\"" << cx << "\" cy=\"" << cy
      << "\"/></a:xfrm></p:grpSpPr>";

    s << "<p:sp><p:nvSpPr><p:cNvPr id=\"" << nextId++ << "\" name=\"" << cellName << " background\"/>"
      << "<p:cNvSpPr/><p:nvPr/></p:nvSpPr><p:spPr>" << xfrm(x, y, cx, cy)
      << "<a:prstGeom prst=\"rect\"><a:avLst/></a:prstGeom>"
      << "<a:solidFill><a:srgbClr val=\"" << hexColor(background) << "\"/></a:solidFill>"
      << "<a:ln><a:noFill/></a:ln></p:spPr></p:sp>";

    if (!contours.empty()) {
        s << "<p:sp><p:nvSpPr><p:cNvPr id=\"" << nextId++ << "\" name=\"" << cellName << " stencil\"/>"
          << "<p:cNvSpPr/><p:nvPr/></p:nvSpPr><p:spPr>" << xfrm(x, y, cx, cy)
          << "<a:custGeom><a:avLst/><a:gdLst/><a:ahLst/><a:cxnLst/>"
          << "<a:rect l=\"0\" t=\"0\" r=\"r\" b=\"b\"/><a:pathLst>"
          << "<a:path w=\"" << cx << "\" h=\"" << cy << "\">";

        auto pt = [&](const Point2d& p) {
            int64_t px = std::min(cx, std::max<int64_t>(0, toEmu(p.x) - x));
            int64_t py = std::min(cy, std::max<int64_t>(0, toEmu(p.y) - y));
            return "<a:pt x=\"" + to_string(px) + "\" y=\"" + to_string(py) + "\"/>";
        };
        for (const auto& contour : contours) {
            s << "<a:moveTo>" << pt(contour.points.front()) << "</a:moveTo>";
            for (size_t i = 1; i < contour.points.size(); i++) {
                s << "<a:lnTo>" << pt(contour.points[i]) << "</a:lnTo>";
            }
            s << "<a:close/>";
        }

        s << "</a:path></a:pathLst></a:custGeom>"
          << "<a:solidFill><a:srgbClr val=\"FFFFFF\"/></a:solidFill>"
          << "<a:ln><a:noFill/></a:ln></p:spPr></p:sp>";
    }

    s << "</p:grpSp>";
    return s.str();
}

string PptxWriter::slideXml(const StencilGeometry& geometry, const PanelLayout& layout, int page,
                            const Scalar& background) {
    ostringstream s;
    s << XML_DECL << "<p:sld " << namespaces() << "><p:cSld><p:spTree>" << emptyGroupProps();

    int nextId = 2;
    for (const auto& placement : layout.placements) {
        if (placement.page != page) continue;
        vector<VectorContour> contours = PanelLayoutEngine::placeContours(geometry, placement);
        s << groupXml(contours, placement, background, nextId);
    }

    s << "</p:spTree></p:cSld><p:clrMapOvr><a:masterClrMapping/></p:clrMapOvr></p:sld>";
    return s.str();
}

vector<unsigned char> PptxWriter::build(const StencilGeometry& geometry, const PanelLayout& layout,
                                        const Scalar& background) {
    const int slideCount = layout.pageCount;

    ZipArchive zip;
    zip.addFile("[Content_Types].xml", contentTypes(slideCount));
    zip.addFile("_rels/.rels", rootRels());
    zip.addFile("docProps/core.xml", coreXml());
    zip.addFile("docProps/app.xml", appXml(slideCount));
    zip.addFile("ppt/presentation.xml", presentationXml(layout, slideCount));
    zip.addFile("ppt/_rels/presentation.xml.rels", presentationRels(slideCount));
    zip.addFile("ppt/slideMasters/slideMaster1.xml", slideMasterXml());
    zip.addFile("ppt/slideMasters/_rels/slideMaster1.xml.rels", masterRels());
    zip.addFile("ppt/slideLayouts/slideLayout1.xml", slideLayoutXml());
    zip.addFile("ppt/slideLayouts/_rels/slideLayout1.xml.rels", layoutRels());
    zip.addFile("ppt/theme/theme1.xml", themeXml());

    for (int page = 0; page < slideCount; page++) {
        const string name = "slide" + to_string(page + 1) + ".xml";
        zip.addFile("ppt/slides/" + name, slideXml(geometry, layout, page, background));
        zip.addFile("ppt/slides/_rels/" + name + ".rels", slideRels());
    }
    return zip.finish();
}

} // namespace Papercut
