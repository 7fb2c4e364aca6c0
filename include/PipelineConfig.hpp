#pragma once

#include "PapercutTypes.hpp"
#include <optional>
#include <string>
#include <vector>

namespace Papercut {

struct NormalizationParams {
    int targetDpi = 300;        // 0 disables DPI-based scaling
    int sourceDpi = 0;          // 0 = assume source is already at targetDpi
    double scale = 2.0;         // resize factor on top of the DPI ratio
    double blur = 0.8;          // Gaussian sigma at normalized resolution
};

struct ExtractionParams {
    int threshold = 200;        // lum >= threshold is light
    int detailDelta = 60;       // 3x3 contrast needed to count as detail, <= 0 disables
    double blur = 0.6;          // pre-threshold Gaussian sigma
    int dilatePx = 1;
    int detailJoinPx = 2;       // closing radius for gap bridging
    int minBridgePx = 0;        // 0 disables bridge reinforcement
    InvertMode invertMode = InvertMode::Auto;
};

struct VectorizeParams {
    double antialiasRadius = 0.8;  // Gaussian sigma along the contour, pixels
    // Cap plus simplify epsilon must stay below 0.5 so one-pixel gaps stay open
    double maxDisplacement = 0.35; // cap on smoothing displacement, pixels
    double simplifyEpsilon = 0.1;  // Douglas-Peucker tolerance, pixels
    double minRegionPx = 0.0;      // drop specks below this area
};

struct LayoutParams {
    int rows = 4;
    int cols = 3;
    std::string pageName = "A4";
    double pageWidthMM = 210.0;
    double pageHeightMM = 297.0;
    double marginMM = 10.0;
    double shiftXMM = 0.0;
    double shiftYMM = 0.0;
    FitMode fitMode = FitMode::Fit;
    LayoutMode layoutMode = LayoutMode::Tile;
};

struct ExportParams {
    bool pptx = true;
    bool pdf = true;
    bool dxf = false;
    bool debugPanel = false;
    int previewDpi = 150;
    cv::Scalar background = cv::Scalar(0x8E, 0x8E, 0x8E); // BGR
};

struct PipelineConfig {
    NormalizationParams normalization;
    ExtractionParams extraction;
    VectorizeParams vectorize;
    LayoutParams layout;
    ExportParams exports;
    std::string debugOutputPath;   // empty disables intermediate images
    bool verbose = false;
};

// Named bundle of normalization defaults
struct NormalizationPreset {
    const char* name;
    int targetDpi;
    double scale;
    double blur;
};

const std::vector<NormalizationPreset>& normalizationPresets();

// Individual fields left empty fall back to the preset
struct NormalizationOverrides {
    std::string preset = "default";
    std::optional<int> targetDpi;
    std::optional<int> sourceDpi;
    std::optional<double> scale;
    std::optional<double> blur;
};

NormalizationParams resolveNormalization(const NormalizationOverrides& overrides);

// Known page sizes in millimetres, portrait
bool lookupPageSize(const std::string& name, double& widthMM, double& heightMM);

// Page name used in artifact names: "A4" for known sizes, "210x297mm" otherwise
std::string pageSizeName(double widthMM, double heightMM);

// Pixels per inch of the normalized raster
double normalizedDpi(const NormalizationParams& params);
int mmToNormalizedPx(double mm, const NormalizationParams& params);

// Bridge-width guidance in normalized pixels, printed after a successful run
std::string bridgeRuleOfThumb(const NormalizationParams& params);

InvertMode parseInvertMode(const std::string& value);
FitMode parseFitMode(const std::string& value);
LayoutMode parseLayoutMode(const std::string& value);
void applyFormatSelector(const std::string& value, ExportParams& params);
cv::Scalar parseBackgroundColor(const std::string& value);

// Throws std::invalid_argument describing the first out-of-range field
void validateConfig(const PipelineConfig& config);

} // namespace Papercut
