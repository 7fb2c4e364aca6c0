#include "PipelineConfig.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>

using namespace std;

namespace Papercut {

namespace {

string lowercase(string value) {
    transform(value.begin(), value.end(), value.begin(),
              [](unsigned char c) { return static_cast<char>(tolower(c)); });
    return value;
}

void require(bool condition, const string& message) {
    if (!condition) {
        throw invalid_argument(message);
    }
}

} // namespace

const vector<NormalizationPreset>& normalizationPresets() {
    static const vector<NormalizationPreset> presets = {
        {"default", 300, 2.0, 0.8},
        {"noblur",  300, 2.0, 0.0},
        {"fast",    300, 1.0, 0.5},
        {"print",   600, 2.0, 0.8},
    };
    return presets;
}

NormalizationParams resolveNormalization(const NormalizationOverrides& overrides) {
    const string wanted = lowercase(overrides.preset);
    const auto& presets = normalizationPresets();
    auto it = find_if(presets.begin(), presets.end(),
                      [&](const NormalizationPreset& p) { return wanted == p.name; });
    if (it == presets.end()) {
        throw invalid_argument("Unknown normalization preset: " + overrides.preset);
    }

    NormalizationParams params;
    params.targetDpi = overrides.targetDpi.value_or(it->targetDpi);
    params.sourceDpi = overrides.sourceDpi.value_or(0);
    params.scale = overrides.scale.value_or(it->scale);
    params.blur = overrides.blur.value_or(it->blur);
    return params;
}

bool lookupPageSize(const string& name, double& widthMM, double& heightMM) {
    const string key = lowercase(name);
    if (key == "a3")     { widthMM = 297.0; heightMM = 420.0; return true; }
    if (key == "a4")     { widthMM = 210.0; heightMM = 297.0; return true; }
    if (key == "a5")     { widthMM = 148.0; heightMM = 210.0; return true; }
    if (key == "letter") { widthMM = 215.9; heightMM = 279.4; return true; }
    if (key == "legal")  { widthMM = 215.9; heightMM = 355.6; return true; }
    return false;
}

string pageSizeName(double widthMM, double heightMM) {
    for (const char* name : {"A3", "A4", "A5", "Letter", "Legal"}) {
        double w = 0.0, h = 0.0;
        lookupPageSize(name, w, h);
        if (std::abs(w - widthMM) < 0.05 && std::abs(h - heightMM) < 0.05) return name;
    }
    ostringstream s;
    s << widthMM << "x" << heightMM << "mm";
    return s.str();
}

double normalizedDpi(const NormalizationParams& params) {
    const double dpi = params.targetDpi > 0 ? params.targetDpi : 300.0;
    return dpi * params.scale;
}

int mmToNormalizedPx(double mm, const NormalizationParams& params) {
    if (mm <= 0.0) return 0;
    return max(1, mmToPx(mm, normalizedDpi(params)));
}

string bridgeRuleOfThumb(const NormalizationParams& params) {
    ostringstream ss;
    ss << "Rule of thumb: min bridge ~2.0 mm (~" << mmToNormalizedPx(2.0, params) << "px); hard min ~1.4 mm (~"
       << mmToNormalizedPx(1.4, params) << "px).";
    return ss.str();
}

InvertMode parseInvertMode(const string& value) {
    const string v = lowercase(value);
    if (v == "auto") return InvertMode::Auto;
    if (v == "light" || v == "keep") return InvertMode::Light;
    if (v == "dark" || v == "flip") return InvertMode::Dark;
    throw invalid_argument("Invalid invert mode: " + value + " (expected auto|light|dark)");
}

FitMode parseFitMode(const string& value) {
    const string v = lowercase(value);
    if (v == "fit") return FitMode::Fit;
    if (v == "fill") return FitMode::Fill;
    if (v == "stretch") return FitMode::Stretch;
    throw invalid_argument("Invalid fit mode: " + value + " (expected fit|fill|stretch)");
}

LayoutMode parseLayoutMode(const string& value) {
    const string v = lowercase(value);
    if (v == "tile") return LayoutMode::Tile;
    if (v == "repeat") return LayoutMode::Repeat;
    throw invalid_argument("Invalid layout mode: " + value + " (expected tile|repeat)");
}

void applyFormatSelector(const string& value, ExportParams& params) {
    const string v = lowercase(value);
    if (v == "pptx") {
        params.pptx = true;  params.pdf = false; params.dxf = false;
    } else if (v == "pdf") {
        params.pptx = false; params.pdf = true;  params.dxf = false;
    } else if (v == "both") {
        params.pptx = true;  params.pdf = true;  params.dxf = false;
    } else if (v == "dxf") {
        params.pptx = false; params.pdf = false; params.dxf = true;
    } else if (v == "all") {
        params.pptx = true;  params.pdf = true;  params.dxf = true;
    } else if (v == "preview") {
        params.pptx = false; params.pdf = false; params.dxf = false;
        params.debugPanel = true;
    } else {
        throw invalid_argument("Invalid format: " + value + " (expected pptx|pdf|both|dxf|all|preview)");
    }
}

cv::Scalar parseBackgroundColor(const string& value) {
    string hex = value;
    if (!hex.empty() && hex[0] == '#') hex = hex.substr(1);
    require(hex.size() == 6 && all_of(hex.begin(), hex.end(),
                                      [](unsigned char c) { return isxdigit(c) != 0; }),
            "Invalid background color: " + value + " (expected #RRGGBB)");
    int r = stoi(hex.substr(0, 2), nullptr, 16);
    int g = stoi(hex.substr(2, 2), nullptr, 16);
    int b = stoi(hex.substr(4, 2), nullptr, 16);
    return cv::Scalar(b, g, r);
}

void validateConfig(const PipelineConfig& config) {
    const auto& n = config.normalization;
    require(n.targetDpi >= 0 && n.targetDpi <= 2400, "normalize-dpi must be within 0..2400");
    require(n.sourceDpi >= 0 && n.sourceDpi <= 2400, "source-dpi must be within 0..2400");
    require(n.scale > 0.0 && n.scale <= 8.0, "normalize-scale must be within (0, 8]");
    require(n.blur >= 0.0 && n.blur <= 20.0, "normalize-blur must be within 0..20");

    const auto& e = config.extraction;
    require(e.threshold >= 0 && e.threshold <= 255, "threshold must be within 0..255");
    require(e.detailDelta <= 255, "detail-delta must be at most 255");
    require(e.blur >= 0.0 && e.blur <= 20.0, "blur must be within 0..20");
    require(e.dilatePx >= 0 && e.dilatePx <= 50, "dilate-px must be within 0..50");
    require(e.detailJoinPx >= 0 && e.detailJoinPx <= 50, "detail-join-px must be within 0..50");
    require(e.minBridgePx >= 0 && e.minBridgePx <= 100, "min-bridge must be within 0..100 px");

    const auto& v = config.vectorize;
    require(v.antialiasRadius >= 0.0 && v.antialiasRadius <= 10.0, "antialias-radius must be within 0..10");
    require(v.maxDisplacement > 0.0 && v.maxDisplacement < 0.5, "smoothing displacement cap must be within (0, 0.5)");
    require(v.simplifyEpsilon >= 0.0 && v.simplifyEpsilon <= 2.0, "simplify epsilon must be within 0..2");
    require(v.maxDisplacement + v.simplifyEpsilon < 0.5,
            "smoothing displacement plus simplify epsilon must stay below half a pixel");
    require(v.minRegionPx >= 0.0, "min-region-px must not be negative");

    const auto& l = config.layout;
    require(l.rows >= 1 && l.rows <= 20 && l.cols >= 1 && l.cols <= 20, "rows and cols must be within 1..20");
    require(l.pageWidthMM > 0.0 && l.pageHeightMM > 0.0, "page size must be positive");
    require(l.marginMM >= 0.0, "margin must not be negative");
    require(l.pageWidthMM - 2.0 * l.marginMM > 0.0 && l.pageHeightMM - 2.0 * l.marginMM > 0.0,
            "margins are too large for the page size");

    const auto& x = config.exports;
    require(x.previewDpi >= 10 && x.previewDpi <= 600, "preview-dpi must be within 10..600");
}

const char* toString(InvertMode mode) {
    switch (mode) {
        case InvertMode::Auto: return "auto";
        case InvertMode::Light: return "light";
        case InvertMode::Dark: return "dark";
    }
    return "auto";
}

const char* toString(FitMode mode) {
    switch (mode) {
        case FitMode::Fit: return "fit";
        case FitMode::Fill: return "fill";
        case FitMode::Stretch: return "stretch";
    }
    return "fit";
}

const char* toString(LayoutMode mode) {
    switch (mode) {
        case LayoutMode::Tile: return "tile";
        case LayoutMode::Repeat: return "repeat";
    }
    return "tile";
}

const char* toString(ArtifactFormat format) {
    switch (format) {
        case ArtifactFormat::Pptx: return "pptx";
        case ArtifactFormat::Pdf: return "pdf";
        case ArtifactFormat::Dxf: return "dxf";
        case ArtifactFormat::PanelPreview: return "panel";
        case ArtifactFormat::OriginalPreview: return "original";
    }
    return "unknown";
}

} // namespace Papercut
