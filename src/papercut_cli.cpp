#include <PapercutAPI.h>
#include "PipelineConfig.hpp"
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

using namespace std;

struct Arguments {
    string inputPath;
    string outputBase;
    bool valid = false;
    bool help = false;
    bool version = false;
    bool verbose = false;

    string format = "both";
    bool debugPanel = false;
    string debugDir;

    // Normalization: preset first, explicit values override field by field
    string normalizePreset = "default";
    optional<int> normalizeDpi;
    optional<int> sourceDpi;
    optional<double> normalizeScale;
    optional<double> normalizeBlur;

    int threshold = 200;
    int detailDelta = 60;
    double blur = 0.6;
    int dilatePx = 1;
    int detailJoinPx = 2;
    double minBridgeMM = 0.0;
    string invertMode = "auto";

    double antialiasRadius = 0.8;
    double minRegionPx = 0.0;

    int cols = 3;
    int rows = 4;
    string page = "A4";
    optional<double> pageWidthMM;
    optional<double> pageHeightMM;
    double marginMM = 10.0;
    double shiftXMM = 0.0;
    double shiftYMM = 0.0;
    string fitMode = "fit";
    string layoutMode = "tile";
    string background = "#8E8E8E";
    int previewDpi = 150;
};

Arguments parseArguments(int argc, char* argv[]) {
    Arguments args;

    if (argc < 2) {
        return args;
    }

    for (int i = 1; i < argc; i++) {
        string arg = argv[i];
        auto next = [&]() -> string {
            if (i + 1 >= argc) {
                throw invalid_argument("Missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        } else if (arg == "--version") {
            args.version = true;
            return args;
        } else if (arg == "-i" || arg == "--input") {
            args.inputPath = next();
        } else if (arg == "-o" || arg == "--output") {
            args.outputBase = next();
        } else if (arg == "-v" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--format") {
            args.format = next();
        } else if (arg == "--debug-panel") {
            args.debugPanel = true;
        } else if (arg == "--debug-dir") {
            args.debugDir = next();
        } else if (arg == "--normalize-preset") {
            args.normalizePreset = next();
        } else if (arg == "--normalize-dpi") {
            args.normalizeDpi = stoi(next());
        } else if (arg == "--source-dpi") {
            args.sourceDpi = stoi(next());
        } else if (arg == "--normalize-scale") {
            args.normalizeScale = stod(next());
        } else if (arg == "--normalize-blur") {
            args.normalizeBlur = stod(next());
        } else if (arg == "--threshold") {
            args.threshold = stoi(next());
        } else if (arg == "--detail-delta") {
            args.detailDelta = stoi(next());
        } else if (arg == "--blur") {
            args.blur = stod(next());
        } else if (arg == "--dilate-px") {
            args.dilatePx = stoi(next());
        } else if (arg == "--detail-join-px") {
            args.detailJoinPx = stoi(next());
        } else if (arg == "--min-bridge-mm") {
            args.minBridgeMM = stod(next());
        } else if (arg == "--invert-mode") {
            args.invertMode = next();
        } else if (arg == "--flip-silhouette") {
            args.invertMode = "dark";
        } else if (arg == "--antialias-radius") {
            args.antialiasRadius = stod(next());
        } else if (arg == "--min-region-px") {
            args.minRegionPx = stod(next());
        } else if (arg == "--cols") {
            args.cols = stoi(next());
        } else if (arg == "--rows") {
            args.rows = stoi(next());
        } else if (arg == "--page") {
            args.page = next();
        } else if (arg == "--page-width-mm") {
            args.pageWidthMM = stod(next());
        } else if (arg == "--page-height-mm") {
            args.pageHeightMM = stod(next());
        } else if (arg == "--margin-mm") {
            args.marginMM = stod(next());
        } else if (arg == "--shift-x-mm") {
            args.shiftXMM = stod(next());
        } else if (arg == "--shift-y-mm") {
            args.shiftYMM = stod(next());
        } else if (arg == "--fit-mode") {
            args.fitMode = next();
        } else if (arg == "--layout-mode") {
            args.layoutMode = next();
        } else if (arg == "--bg-gray") {
            args.background = next();
        } else if (arg == "--preview-dpi") {
            args.previewDpi = stoi(next());
        } else if (!arg.empty() && arg[0] == '-') {
            throw invalid_argument("Unknown option: " + arg);
        } else if (args.inputPath.empty()) {
            args.inputPath = arg;
        } else {
            throw invalid_argument("Unexpected argument: " + arg);
        }
    }

    if (args.inputPath.empty() || args.outputBase.empty()) {
        return args;
    }

    args.valid = true;
    return args;
}

void printUsage(const char* progName) {
    cout << "Papercut CLI - Turn an image into a printable papercut stencil panel\n"
         << "Using libpapercut v" << papercut_get_version() << "\n"
         << "\n"
         << "Usage: " << progName << " <input_image> --output <base> [options]\n"
         << "\n"
         << "Required:\n"
         << "  <input_image>, -i, --input  Input image file path\n"
         << "  -o, --output <base>         Output path prefix (suffixes are appended)\n"
         << "\n"
         << "Output:\n"
         << "  --format <pptx|pdf|both|dxf|all|preview>  Documents to write (default: both)\n"
         << "  --debug-panel               Also write <base>_panel.png\n"
         << "  --preview-dpi <dpi>         Panel preview resolution (default: 150)\n"
         << "  --bg-gray <#RRGGBB>         Cell background colour (default: #8E8E8E)\n"
         << "  --debug-dir <dir>           Save numbered intermediate images\n"
         << "\n"
         << "Normalization:\n"
         << "  --normalize-preset <default|noblur|fast|print>  (default: default)\n"
         << "  --normalize-dpi <dpi>       Target DPI (default: 300)\n"
         << "  --source-dpi <dpi>          Source DPI, 0 = same as target (default: 0)\n"
         << "  --normalize-scale <f>       Extra resize factor (default: 2.0)\n"
         << "  --normalize-blur <sigma>    Denoise blur (default: 0.8)\n"
         << "\n"
         << "Detail extraction:\n"
         << "  --threshold <0-255>         Light/dark threshold (default: 200)\n"
         << "  --detail-delta <n>          Local contrast kept as detail, <= 0 disables (default: 60)\n"
         << "  --blur <sigma>              Pre-threshold blur (default: 0.6)\n"
         << "  --dilate-px <n>             Material dilation (default: 1)\n"
         << "  --detail-join-px <n>        Gap joining radius (default: 2)\n"
         << "  --min-bridge-mm <mm>        Thicken bridges thinner than this (default: 0, off)\n"
         << "  --invert-mode <auto|light|dark>  Which side becomes material (default: auto)\n"
         << "  --flip-silhouette           Same as --invert-mode dark\n"
         << "\n"
         << "Vectorization:\n"
         << "  --antialias-radius <px>     Contour smoothing (default: 0.8)\n"
         << "  --min-region-px <area>      Drop specks smaller than this (default: 0, off)\n"
         << "\n"
         << "Layout:\n"
         << "  --cols <n> --rows <n>       Grid (default: 3 x 4)\n"
         << "  --page <A3|A4|A5|Letter|Legal>  Page size (default: A4)\n"
         << "  --page-width-mm <mm> --page-height-mm <mm>  Explicit page size\n"
         << "  --margin-mm <mm>            Page margin (default: 10)\n"
         << "  --fit-mode <fit|fill|stretch>  (default: fit)\n"
         << "  --layout-mode <tile|repeat>    (default: tile)\n"
         << "  --shift-x-mm <mm> --shift-y-mm <mm>  Move the design (default: 0)\n"
         << "\n"
         << "General:\n"
         << "  -v, --verbose               Enable verbose output\n"
         << "  -h, --help                  Show this help message\n"
         << "  --version                   Print the version\n"
         << "\n"
         << "Examples:\n"
         << "  " << progName << " art.png --output out/art\n"
         << "  " << progName << " art.png --output out/art --format all --debug-panel\n"
         << "  " << progName << " art.png --output out/art --invert-mode dark --detail-join-px 3\n"
         << "  " << progName << " art.png --output out/art --layout-mode repeat --cols 2 --rows 2\n"
         << "  " << progName << " art.png --output out/art --normalize-preset print --normalize-blur 0.4\n"
         << endl;
}

// Progress callback for verbose mode
void progressCallback(double progress, const char* stage) {
    cout << "[PROGRESS] " << stage << ": " << static_cast<int>(progress * 100) << "%" << endl;
}

// Error callback for detailed error reporting
void errorCallback(PapercutResult error_code, const char* error_message) {
    cerr << "[ERROR] Code " << error_code << ": " << error_message << endl;
}

// Fills params from parsed arguments; throws std::invalid_argument
void buildParams(const Arguments& args, PapercutParams& params) {
    papercut_get_default_params(&params);

    if (papercut_apply_preset(&params, args.normalizePreset.c_str()) != PAPERCUT_SUCCESS) {
        throw invalid_argument("Unknown normalization preset: " + args.normalizePreset);
    }
    if (args.normalizeDpi) params.normalize_dpi = *args.normalizeDpi;
    if (args.sourceDpi) params.source_dpi = *args.sourceDpi;
    if (args.normalizeScale) params.normalize_scale = *args.normalizeScale;
    if (args.normalizeBlur) params.normalize_blur = *args.normalizeBlur;

    params.threshold = args.threshold;
    params.detail_delta = args.detailDelta;
    params.blur = args.blur;
    params.dilate_px = args.dilatePx;
    params.detail_join_px = args.detailJoinPx;
    params.min_bridge_mm = args.minBridgeMM;
    switch (Papercut::parseInvertMode(args.invertMode)) {
        case Papercut::InvertMode::Auto: params.invert_mode = PAPERCUT_INVERT_AUTO; break;
        case Papercut::InvertMode::Light: params.invert_mode = PAPERCUT_INVERT_LIGHT; break;
        case Papercut::InvertMode::Dark: params.invert_mode = PAPERCUT_INVERT_DARK; break;
    }

    params.antialias_radius = args.antialiasRadius;
    params.min_region_px = args.minRegionPx;

    params.rows = args.rows;
    params.cols = args.cols;
    double width = 0.0, height = 0.0;
    if (!Papercut::lookupPageSize(args.page, width, height)) {
        throw invalid_argument("Unknown page size: " + args.page + " (expected A3|A4|A5|Letter|Legal)");
    }
    params.page_width_mm = args.pageWidthMM.value_or(width);
    params.page_height_mm = args.pageHeightMM.value_or(height);
    params.margin_mm = args.marginMM;
    params.shift_x_mm = args.shiftXMM;
    params.shift_y_mm = args.shiftYMM;
    switch (Papercut::parseFitMode(args.fitMode)) {
        case Papercut::FitMode::Fit: params.fit_mode = PAPERCUT_FIT; break;
        case Papercut::FitMode::Fill: params.fit_mode = PAPERCUT_FILL; break;
        case Papercut::FitMode::Stretch: params.fit_mode = PAPERCUT_STRETCH; break;
    }
    switch (Papercut::parseLayoutMode(args.layoutMode)) {
        case Papercut::LayoutMode::Tile: params.layout_mode = PAPERCUT_LAYOUT_TILE; break;
        case Papercut::LayoutMode::Repeat: params.layout_mode = PAPERCUT_LAYOUT_REPEAT; break;
    }

    Papercut::ExportParams exports;
    exports.debugPanel = args.debugPanel;
    Papercut::applyFormatSelector(args.format, exports);
    params.export_pptx = exports.pptx;
    params.export_pdf = exports.pdf;
    params.export_dxf = exports.dxf;
    params.debug_panel = exports.debugPanel;
    params.preview_dpi = args.previewDpi;

    cv::Scalar bg = Papercut::parseBackgroundColor(args.background);
    params.background_rgb = (static_cast<uint32_t>(bg[2]) << 16) | (static_cast<uint32_t>(bg[1]) << 8) |
                            static_cast<uint32_t>(bg[0]);

    params.debug_output_dir = args.debugDir.empty() ? nullptr : args.debugDir.c_str();
    params.verbose = args.verbose;
}

int main(int argc, char* argv[]) {
    Arguments args;
    PapercutParams params;
    try {
        args = parseArguments(argc, argv);
        if (args.help) {
            printUsage(argv[0]);
            return 0;
        }
        if (args.version) {
            cout << "papercut " << papercut_get_version() << endl;
            return 0;
        }
        if (!args.valid) {
            printUsage(argv[0]);
            return 1;
        }
        buildParams(args, params);
    } catch (const invalid_argument& e) {
        cerr << "[ERROR] " << e.what() << endl;
        cerr << "Run with --help for usage." << endl;
        return 1;
    } catch (const out_of_range& e) {
        cerr << "[ERROR] Numeric argument out of range: " << e.what() << endl;
        return 1;
    }

    if (args.verbose) {
        cout << "[INFO] Papercut CLI v" << papercut_get_version() << endl;
        cout << "[INFO] Processing: " << args.inputPath << " -> " << args.outputBase << "_*" << endl;
    }

    // Validate parameters
    PapercutResult validation_result = papercut_validate_params(&params);
    if (validation_result != PAPERCUT_SUCCESS) {
        cerr << "[ERROR] " << papercut_get_error_message(validation_result) << endl;
        return 1;
    }

    if (args.verbose) {
        cout << "[INFO] Using parameters:" << endl;
        cout << "  Normalization: " << params.normalize_dpi << " dpi, scale " << params.normalize_scale
             << ", blur " << params.normalize_blur << " (preset " << args.normalizePreset << ")" << endl;
        cout << "  Threshold: " << params.threshold << ", detail delta " << params.detail_delta
             << ", blur " << params.blur << endl;
        cout << "  Dilate: " << params.dilate_px << "px, join " << params.detail_join_px << "px, min bridge "
             << params.min_bridge_mm << "mm" << endl;
        cout << "  Invert mode: " << args.invertMode << endl;
        cout << "  Antialias radius: " << params.antialias_radius << "px" << endl;
        cout << "  Grid: " << params.cols << "x" << params.rows << " on " << params.page_width_mm << "x"
             << params.page_height_mm << "mm, margin " << params.margin_mm << "mm, " << args.layoutMode
             << "/" << args.fitMode << endl;
        cout << "  Shift: " << params.shift_x_mm << ", " << params.shift_y_mm << " mm" << endl;
        cout << "  Formats: " << args.format << (params.debug_panel ? " + panel preview" : "") << endl;
    }

    Papercut::NormalizationParams normalization;
    normalization.targetDpi = params.normalize_dpi;
    normalization.scale = params.normalize_scale;

    PapercutSummary summary;
    PapercutResult result = papercut_process_image(
        args.inputPath.c_str(),
        args.outputBase.c_str(),
        &params,
        &summary,
        args.verbose ? progressCallback : nullptr,
        errorCallback
    );

    if (result == PAPERCUT_SUCCESS) {
        cout << "[SUCCESS] Stencil completed: " << summary.outer_contours << " outer and "
             << summary.hole_contours << " hole contours on " << summary.page_count << " page(s)" << endl;
        if (summary.layout_warnings > 0) {
            cout << "[WARN] Layout reported " << summary.layout_warnings << " warning(s); see above" << endl;
        }
        cout << "[INFO] " << summary.artifacts_written << " files written with prefix " << args.outputBase << endl;

        const string invertInfo = Papercut::parseInvertMode(args.invertMode) == Papercut::InvertMode::Auto
                                      ? string(summary.inverted ? "auto->dark" : "auto->light")
                                      : args.invertMode;
        cout << "DPI=" << Papercut::normalizedDpi(normalization) << ", margin=" << params.margin_mm
             << " mm, shift=" << params.shift_x_mm << "x" << params.shift_y_mm << " mm, threshold="
             << params.threshold << ", blur=" << params.blur << ", dilate=" << params.dilate_px
             << "px, invert=" << invertInfo << endl;
        cout << Papercut::bridgeRuleOfThumb(normalization) << endl;
        cout << "Adjust --shift-x-mm/--shift-y-mm if a seam hits a thin detail." << endl;
        return 0;
    } else {
        const char* error_msg = papercut_get_error_message(result);
        cerr << "[ERROR] Processing failed: " << error_msg << endl;
        return 1;
    }
}
