#pragma once

#include <opencv2/core.hpp>
#include <cmath>
#include <string>
#include <vector>

namespace Papercut {

enum class InvertMode { Auto, Light, Dark };
enum class FitMode { Fit, Fill, Stretch };
enum class LayoutMode { Tile, Repeat };
enum class ContourRole { Outer, Hole };

// Luminance raster after resampling and denoising
struct NormalizedImage {
    cv::Mat gray;               // CV_8UC1
    double scaleFactor = 1.0;   // applied resize factor
    double appliedBlur = 0.0;   // Gaussian sigma actually applied (0 = none)
};

// Binary cut mask: 255 = material (paper that stays), 0 = void
struct StencilMask {
    cv::Mat mask;               // CV_8UC1, same size as the normalized image
    double lightFraction = 0.0; // share of pixels at or above the threshold
    bool inverted = false;      // true when dark regions became material
    InvertMode polarity = InvertMode::Light;

    size_t materialPixels() const { return static_cast<size_t>(cv::countNonZero(mask)); }
};

// Closed polygon in mask pixel coordinates. The closing edge is implicit.
struct VectorContour {
    std::vector<cv::Point2d> points;
    ContourRole role = ContourRole::Outer;
    int parent = -1;            // index of enclosing outer contour for holes

    double signedArea() const;
    double area() const;
};

struct StencilGeometry {
    std::vector<VectorContour> contours;
    cv::Size sourceSize;        // mask size in pixels

    size_t outerCount() const;
    size_t holeCount() const;
};

// Scale + translate from mask pixels to page millimetres
struct PlacementTransform {
    double scaleX = 1.0;
    double scaleY = 1.0;
    double offsetX = 0.0;
    double offsetY = 0.0;

    cv::Point2d apply(const cv::Point2d& p) const {
        return cv::Point2d(p.x * scaleX + offsetX, p.y * scaleY + offsetY);
    }
};

struct Placement {
    int page = 0;
    int row = 0;
    int col = 0;
    PlacementTransform transform;
    cv::Rect2d clip;            // printable cell rect on the page, millimetres
    cv::Rect2d frame;           // area the design was fitted into, page millimetres
};

struct PanelLayout {
    double pageWidthMM = 210.0;
    double pageHeightMM = 297.0;
    double marginMM = 10.0;
    double cellWidthMM = 0.0;
    double cellHeightMM = 0.0;
    int rows = 4;
    int cols = 3;
    int pageCount = 0;
    LayoutMode mode = LayoutMode::Tile;
    FitMode fit = FitMode::Fit;
    double shiftXMM = 0.0;
    double shiftYMM = 0.0;
    std::string pageName = "A4";
    cv::Rect2d designBoundsPx;  // extent of the contours in mask pixels
    std::vector<Placement> placements;
    std::vector<std::string> warnings;
};

enum class ArtifactFormat { Pptx, Pdf, Dxf, PanelPreview, OriginalPreview };

struct ExportArtifact {
    ArtifactFormat format;
    std::string path;
    bool ok = false;
    std::string error;
};

const char* toString(InvertMode mode);
const char* toString(FitMode mode);
const char* toString(LayoutMode mode);
const char* toString(ArtifactFormat format);

constexpr double MM_PER_INCH = 25.4;

inline int mmToPx(double mm, double dpi) {
    return static_cast<int>(std::lround(mm * dpi / MM_PER_INCH));
}

} // namespace Papercut
