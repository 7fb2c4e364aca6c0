#pragma once

#include "PapercutTypes.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace Papercut {

// Content stream for one page. Coordinates are page millimetres with the
// origin at the top-left corner, converted to PDF points on output.
class PdfPage {
public:
    PdfPage(double widthMM, double heightMM);

    void save();
    void restore();
    void clipRect(const cv::Rect2d& rectMM);
    void setFillColor(const cv::Scalar& bgr);
    void fillRect(const cv::Rect2d& rectMM);
    // All contours as one path, filled with the even-odd rule
    void fillContours(const std::vector<VectorContour>& contours);

    const std::string& content() const { return m_content; }

private:
    double x(double mm) const;
    double y(double mm) const;
    void appendRect(const cv::Rect2d& rectMM);

    double m_heightMM;
    std::string m_content;
};

class PdfDocument {
public:
    PdfDocument(double pageWidthMM, double pageHeightMM);

    PdfPage& addPage();
    size_t pageCount() const { return m_pages.size(); }

    void setTitle(const std::string& title) { m_title = title; }

    // Serialized PDF 1.4 with Flate-compressed content streams
    std::vector<unsigned char> build() const;

    static double mmToPoints(double mm) { return mm * 72.0 / MM_PER_INCH; }

private:
    double m_widthMM;
    double m_heightMM;
    std::string m_title;
    std::vector<PdfPage> m_pages;
};

} // namespace Papercut
