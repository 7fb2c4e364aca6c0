#include "minitest.hpp"
#include "PanelLayoutEngine.hpp"
#include "PdfWriter.hpp"
#include "PptxWriter.hpp"
#include "ZipArchive.hpp"
#include <cstring>

#define MINIZ_NO_ZLIB_COMPATIBLE_NAMES
#include <miniz.h>

using namespace Papercut;

// Extracts one entry through the miniz reader; empty when missing.
static std::string readEntry(const std::vector<unsigned char>& archive, const char* name) {
    mz_zip_archive zip;
    std::memset(&zip, 0, sizeof(zip));
    if (!mz_zip_reader_init_mem(&zip, archive.data(), archive.size(), 0)) return std::string();
    size_t size = 0;
    void* data = mz_zip_reader_extract_file_to_heap(&zip, name, &size, 0);
    std::string out;
    if (data) {
        out.assign(static_cast<const char*>(data), size);
        mz_free(data);
    }
    mz_zip_reader_end(&zip);
    return out;
}

static size_t entryCountOf(const std::vector<unsigned char>& archive) {
    mz_zip_archive zip;
    std::memset(&zip, 0, sizeof(zip));
    if (!mz_zip_reader_init_mem(&zip, archive.data(), archive.size(), 0)) return 0;
    const size_t count = mz_zip_reader_get_num_files(&zip);
    mz_zip_reader_end(&zip);
    return count;
}

static StencilGeometry ringDesign() {
    StencilGeometry g;
    g.sourceSize = cv::Size(100, 100);
    VectorContour outer;
    outer.points = {{10, 10}, {90, 10}, {90, 90}, {10, 90}};
    VectorContour hole;
    hole.points = {{30, 30}, {30, 70}, {70, 70}, {70, 30}};
    hole.role = ContourRole::Hole;
    hole.parent = 0;
    g.contours = {outer, hole};
    return g;
}

static bool test_zip_structure() {
    ZipArchive zip;
    const std::string text(2000, 'a');
    zip.addFile("first.xml", text);
    zip.addFile("second.bin", "raw", false);
    MT_ASSERT(zip.entryCount() == 2);

    std::vector<unsigned char> bytes = zip.finish();
    MT_ASSERT(minitest::startsWith(bytes, "PK"));
    MT_ASSERT(bytes.size() < text.size());
    MT_ASSERT(entryCountOf(bytes) == 2);
    MT_ASSERT(readEntry(bytes, "first.xml") == text);
    MT_ASSERT(readEntry(bytes, "second.bin") == "raw");
    MT_ASSERT(readEntry(bytes, "third.xml").empty());

    // The archive is sealed once finished
    MT_THROWS(zip.addFile("late.xml", "x"), std::runtime_error);
    MT_THROWS(zip.finish(), std::runtime_error);
    return true;
}

static bool test_pdf_structure() {
    PdfDocument doc(210.0, 297.0);
    doc.setTitle("test (panel)");
    PdfPage& first = doc.addPage();
    first.save();
    first.clipRect(cv::Rect2d(10, 10, 190, 277));
    first.setFillColor(cv::Scalar(0x8E, 0x8E, 0x8E));
    first.fillRect(cv::Rect2d(10, 10, 190, 277));
    first.setFillColor(cv::Scalar(255, 255, 255));
    first.fillContours(ringDesign().contours);
    first.restore();
    const std::string content = first.content();
    doc.addPage();

    std::vector<unsigned char> pdf = doc.build();
    MT_ASSERT(minitest::startsWith(pdf, "%PDF-1.4"));
    MT_ASSERT(minitest::contains(pdf, "/Count 2"));
    MT_ASSERT(minitest::contains(pdf, "/MediaBox [0 0 595.276 841.890]"));
    MT_ASSERT(minitest::contains(pdf, "/Title (test \\(panel\\))"));
    MT_ASSERT(minitest::contains(pdf, "/FlateDecode"));

    const std::string tail(pdf.end() - 6, pdf.end());
    MT_ASSERT(tail == "%%EOF\n");

    // startxref points at the cross-reference table
    const std::string text(pdf.begin(), pdf.end());
    size_t sx = text.rfind("startxref\n");
    MT_ASSERT(sx != std::string::npos);
    size_t xrefPos = std::stoul(text.substr(sx + 10));
    MT_ASSERT(text.compare(xrefPos, 4, "xref") == 0);

    MT_ASSERT(content.find("re\nW n\n") != std::string::npos);
    MT_ASSERT(content.find("f*\n") != std::string::npos);
    MT_ASSERT(content.find("0.557 0.557 0.557 rg") != std::string::npos);
    MT_NEAR(PdfDocument::mmToPoints(25.4), 72.0, 1e-12);

    PdfDocument empty(100, 100);
    MT_THROWS(empty.build(), std::runtime_error);
    return true;
}

static bool test_pdf_flips_y_axis() {
    PdfPage page(100.0, 100.0);
    page.fillRect(cv::Rect2d(0, 0, 25.4, 25.4));
    // Top-left square in page space sits at the top of the PDF page
    MT_ASSERT(page.content().find("0.000 211.465 72.000 72.000 re") != std::string::npos);
    return true;
}

static bool test_pptx_package() {
    StencilGeometry g = ringDesign();
    PanelLayout layout = PanelLayoutEngine::computeLayout(g, LayoutParams());
    std::vector<unsigned char> pptx = PptxWriter::build(g, layout, cv::Scalar(0x8E, 0x8E, 0x8E));

    MT_ASSERT(minitest::startsWith(pptx, "PK"));
    MT_ASSERT(minitest::contains(pptx, "[Content_Types].xml"));
    MT_ASSERT(minitest::contains(pptx, "ppt/presentation.xml"));
    MT_ASSERT(minitest::contains(pptx, "ppt/slides/slide12.xml"));
    MT_ASSERT(!minitest::contains(pptx, "ppt/slides/slide13.xml"));
    MT_ASSERT(minitest::contains(pptx, "ppt/theme/theme1.xml"));

    const std::string presentation = readEntry(pptx, "ppt/presentation.xml");
    MT_ASSERT(presentation.find("<p:sldIdLst>") != std::string::npos);
    MT_ASSERT(readEntry(pptx, "ppt/slides/slide12.xml").find("<p:sld ") != std::string::npos);

    const std::string slide = PptxWriter::slideXml(g, layout, 4, cv::Scalar(0x8E, 0x8E, 0x8E));
    MT_ASSERT(slide.find("<p:grpSp>") != std::string::npos);
    MT_ASSERT(slide.find("<a:custGeom>") != std::string::npos);
    MT_ASSERT(slide.find("<a:srgbClr val=\"8E8E8E\"/>") != std::string::npos);
    MT_ASSERT(slide.find("<a:close/>") != std::string::npos);
    MT_ASSERT(slide.find("<a:off x=\"360000\" y=\"360000\"/>") != std::string::npos);

    MT_ASSERT(PptxWriter::toEmu(210.0) == 7560000);
    return true;
}

int main() {
    return minitest::run("containers", {
        {"zip_structure", test_zip_structure},
        {"pdf_structure", test_pdf_structure},
        {"pdf_flips_y_axis", test_pdf_flips_y_axis},
        {"pptx_package", test_pptx_package},
    });
}
