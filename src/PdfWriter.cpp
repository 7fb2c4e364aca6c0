#include "PdfWriter.hpp"
#include <cstdio>
#include <stdexcept>
#include <zlib.h>

using namespace cv;
using namespace std;

namespace Papercut {

namespace {

string fmt(double v) {
    char buf[32];
    snprintf(buf, sizeof(buf), "%.3f", v);
    return buf;
}

string escapeText(const string& s) {
    string out;
    for (char c : s) {
        if (c == '(' || c == ')' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

struct PdfBuffer {
    vector<unsigned char> bytes;
    vector<size_t> xref;

    void put(const string& s) { bytes.insert(bytes.end(), s.begin(), s.end()); }
    void putBinary(const vector<unsigned char>& b) { bytes.insert(bytes.end(), b.begin(), b.end()); }
    void beginObject() { xref.push_back(bytes.size()); }
};

vector<unsigned char> flate(const string& data) {
    uLongf size = compressBound(static_cast<uLong>(data.size()));
    vector<unsigned char> out(size);
    int rc = compress2(out.data(), &size, reinterpret_cast<const Bytef*>(data.data()),
                       static_cast<uLong>(data.size()), Z_BEST_COMPRESSION);
    if (rc != Z_OK) {
        throw runtime_error("zlib compress2 failed with code " + to_string(rc));
    }
    out.resize(size);
    return out;
}

} // namespace

PdfPage::PdfPage(double /*widthMM*/, double heightMM)
    : m_heightMM(heightMM) {
}

double PdfPage::x(double mm) const {
    return PdfDocument::mmToPoints(mm);
}

double PdfPage::y(double mm) const {
    return PdfDocument::mmToPoints(m_heightMM - mm);
}

void PdfPage::save() { m_content += "q\n"; }
void PdfPage::restore() { m_content += "Q\n"; }

void PdfPage::appendRect(const Rect2d& r) {
    m_content += fmt(x(r.x)) + " " + fmt(y(r.y + r.height)) + " " +
                 fmt(PdfDocument::mmToPoints(r.width)) + " " +
                 fmt(PdfDocument::mmToPoints(r.height)) + " re\n";
}

void PdfPage::clipRect(const Rect2d& rectMM) {
    appendRect(rectMM);
    m_content += "W n\n";
}

void PdfPage::setFillColor(const Scalar& bgr) {
    m_content += fmt(bgr[2] / 255.0) + " " + fmt(bgr[1] / 255.0) + " " + fmt(bgr[0] / 255.0) + " rg\n";
}

void PdfPage::fillRect(const Rect2d& rectMM) {
    appendRect(rectMM);
    m_content += "f\n";
}

void PdfPage::fillContours(const vector<VectorContour>& contours) {
    bool any = false;
    for (const auto& contour : contours) {
        if (contour.points.size() < 3) continue;
        const auto& first = contour.points.front();
        m_content += fmt(x(first.x)) + " " + fmt(y(first.y)) + " m\n";
        for (size_t i = 1; i < contour.points.size(); i++) {
            const auto& p = contour.points[i];
            m_content += fmt(x(p.x)) + " " + fmt(y(p.y)) + " l\n";
        }
        m_content += "h\n";
        any = true;
    }
    if (any) m_content += "f*\n";
}

PdfDocument::PdfDocument(double pageWidthMM, double pageHeightMM)
    : m_widthMM(pageWidthMM), m_heightMM(pageHeightMM) {
}

PdfPage& PdfDocument::addPage() {
    m_pages.emplace_back(m_widthMM, m_heightMM);
    return m_pages.back();
}

vector<unsigned char> PdfDocument::build() const {
    if (m_pages.empty()) {
        throw runtime_error("PDF has no pages");
    }

    // Object layout: 1 catalog, 2 pages, 3 info, then a page/content pair per page
    const size_t pageCount = m_pages.size();
    const size_t totalObjects = 3 + 2 * pageCount;
    const string width = fmt(mmToPoints(m_widthMM));
    const string height = fmt(mmToPoints(m_heightMM));

    PdfBuffer P;
    P.put("%PDF-1.4\n%\xE2\xE3\xCF\xD3\n");

    P.beginObject();
    P.put("1 0 obj\n<< /Type /Catalog /Pages 2 0 R >>\nendobj\n");

    P.beginObject();
    string kids;
    for (size_t i = 0; i < pageCount; i++) {
        kids += to_string(4 + 2 * i) + " 0 R ";
    }
    P.put("2 0 obj\n<< /Type /Pages /Kids [" + kids + "] /Count " + to_string(pageCount) + " >>\nendobj\n");

    P.beginObject();
    P.put("3 0 obj\n<< /Producer (papercut) /Title (" + escapeText(m_title) + ") >>\nendobj\n");

    for (size_t i = 0; i < pageCount; i++) {
        const size_t pageObj = 4 + 2 * i;
        const size_t contentObj = pageObj + 1;

        P.beginObject();
        P.put(to_string(pageObj) + " 0 obj\n<< /Type /Page /Parent 2 0 R /MediaBox [0 0 " + width + " " +
              height + "] /Resources << >> /Contents " + to_string(contentObj) + " 0 R >>\nendobj\n");

        vector<unsigned char> stream = flate(m_pages[i].content());
        P.beginObject();
        P.put(to_string(contentObj) + " 0 obj\n<< /Length " + to_string(stream.size()) +
              " /Filter /FlateDecode >>\nstream\n");
        P.putBinary(stream);
        P.put("\nendstream\nendobj\n");
    }

    const size_t xrefPos = P.bytes.size();
    P.put("xref\n0 " + to_string(totalObjects + 1) + "\n0000000000 65535 f \n");
    for (size_t off : P.xref) {
        char line[32];
        snprintf(line, sizeof(line), "%010zu 00000 n \n", off);
        P.put(line);
    }
    P.put("trailer\n<< /Size " + to_string(totalObjects + 1) + " /Root 1 0 R /Info 3 0 R >>\nstartxref\n" +
          to_string(xrefPos) + "\n%%EOF\n");
    return P.bytes;
}

} // namespace Papercut
