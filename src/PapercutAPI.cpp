#include "PapercutAPI.h"
#include "PapercutErrors.hpp"
#include "PapercutPipeline.hpp"
#include "PipelineConfig.hpp"
#include <opencv2/imgcodecs.hpp>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace Papercut;

// Internal helper functions
namespace {

    // Convert C parameters to the C++ configuration
    PipelineConfig convertParams(const PapercutParams* params) {
        PipelineConfig config;

        config.normalization.targetDpi = params->normalize_dpi;
        config.normalization.sourceDpi = params->source_dpi;
        config.normalization.scale = params->normalize_scale;
        config.normalization.blur = params->normalize_blur;

        config.extraction.threshold = params->threshold;
        config.extraction.detailDelta = params->detail_delta;
        config.extraction.blur = params->blur;
        config.extraction.dilatePx = params->dilate_px;
        config.extraction.detailJoinPx = params->detail_join_px;
        config.extraction.minBridgePx = mmToNormalizedPx(params->min_bridge_mm, config.normalization);
        switch (params->invert_mode) {
            case PAPERCUT_INVERT_LIGHT: config.extraction.invertMode = InvertMode::Light; break;
            case PAPERCUT_INVERT_DARK: config.extraction.invertMode = InvertMode::Dark; break;
            case PAPERCUT_INVERT_AUTO: config.extraction.invertMode = InvertMode::Auto; break;
            default: throw std::invalid_argument("Unknown invert mode " + std::to_string(params->invert_mode));
        }

        config.vectorize.antialiasRadius = params->antialias_radius;
        config.vectorize.minRegionPx = params->min_region_px;

        config.layout.rows = params->rows;
        config.layout.cols = params->cols;
        config.layout.pageWidthMM = params->page_width_mm;
        config.layout.pageHeightMM = params->page_height_mm;
        config.layout.pageName = pageSizeName(params->page_width_mm, params->page_height_mm);
        config.layout.marginMM = params->margin_mm;
        config.layout.shiftXMM = params->shift_x_mm;
        config.layout.shiftYMM = params->shift_y_mm;
        switch (params->fit_mode) {
            case PAPERCUT_FIT: config.layout.fitMode = FitMode::Fit; break;
            case PAPERCUT_FILL: config.layout.fitMode = FitMode::Fill; break;
            case PAPERCUT_STRETCH: config.layout.fitMode = FitMode::Stretch; break;
            default: throw std::invalid_argument("Unknown fit mode " + std::to_string(params->fit_mode));
        }
        switch (params->layout_mode) {
            case PAPERCUT_LAYOUT_TILE: config.layout.layoutMode = LayoutMode::Tile; break;
            case PAPERCUT_LAYOUT_REPEAT: config.layout.layoutMode = LayoutMode::Repeat; break;
            default: throw std::invalid_argument("Unknown layout mode " + std::to_string(params->layout_mode));
        }

        config.exports.pptx = params->export_pptx;
        config.exports.pdf = params->export_pdf;
        config.exports.dxf = params->export_dxf;
        config.exports.debugPanel = params->debug_panel;
        config.exports.previewDpi = params->preview_dpi;
        const uint32_t rgb = params->background_rgb;
        config.exports.background = cv::Scalar(rgb & 0xFF, (rgb >> 8) & 0xFF, (rgb >> 16) & 0xFF);

        config.debugOutputPath = params->debug_output_dir ? params->debug_output_dir : "";
        config.verbose = params->verbose;
        return config;
    }

    PapercutResult reportError(PapercutErrorCallback error_callback, PapercutResult code, const char* message) {
        if (error_callback) {
            error_callback(code, message);
        }
        return code;
    }

    void fillSummary(const PipelineResult& result, PapercutSummary* summary) {
        if (!summary) return;
        summary->mask_width = result.mask.mask.cols;
        summary->mask_height = result.mask.mask.rows;
        summary->light_fraction = result.mask.lightFraction;
        summary->inverted = result.mask.inverted;
        summary->outer_contours = static_cast<int32_t>(result.geometry.outerCount());
        summary->hole_contours = static_cast<int32_t>(result.geometry.holeCount());
        summary->page_count = result.layout.pageCount;
        summary->layout_warnings = static_cast<int32_t>(result.layout.warnings.size());
        summary->artifacts_failed = static_cast<int32_t>(result.failedArtifacts());
        summary->artifacts_written = static_cast<int32_t>(result.artifacts.size()) - summary->artifacts_failed;
    }
}

// API Implementation

void papercut_get_default_params(PapercutParams* params) {
    if (!params) return;

    const PipelineConfig defaults;

    params->normalize_dpi = defaults.normalization.targetDpi;
    params->source_dpi = defaults.normalization.sourceDpi;
    params->normalize_scale = defaults.normalization.scale;
    params->normalize_blur = defaults.normalization.blur;

    params->threshold = defaults.extraction.threshold;
    params->detail_delta = defaults.extraction.detailDelta;
    params->blur = defaults.extraction.blur;
    params->dilate_px = defaults.extraction.dilatePx;
    params->detail_join_px = defaults.extraction.detailJoinPx;
    params->min_bridge_mm = 0.0;
    params->invert_mode = PAPERCUT_INVERT_AUTO;

    params->antialias_radius = defaults.vectorize.antialiasRadius;
    params->min_region_px = defaults.vectorize.minRegionPx;

    params->rows = defaults.layout.rows;
    params->cols = defaults.layout.cols;
    params->page_width_mm = defaults.layout.pageWidthMM;
    params->page_height_mm = defaults.layout.pageHeightMM;
    params->margin_mm = defaults.layout.marginMM;
    params->shift_x_mm = 0.0;
    params->shift_y_mm = 0.0;
    params->fit_mode = PAPERCUT_FIT;
    params->layout_mode = PAPERCUT_LAYOUT_TILE;

    params->export_pptx = defaults.exports.pptx;
    params->export_pdf = defaults.exports.pdf;
    params->export_dxf = defaults.exports.dxf;
    params->debug_panel = defaults.exports.debugPanel;
    params->preview_dpi = defaults.exports.previewDpi;
    params->background_rgb = 0x8E8E8E;

    params->debug_output_dir = nullptr;
    params->verbose = false;
}

PapercutResult papercut_apply_preset(PapercutParams* params, const char* preset_name) {
    if (!params || !preset_name) return PAPERCUT_ERROR_INVALID_INPUT;

    try {
        NormalizationOverrides overrides;
        overrides.preset = preset_name;
        NormalizationParams resolved = resolveNormalization(overrides);
        params->normalize_dpi = resolved.targetDpi;
        params->normalize_scale = resolved.scale;
        params->normalize_blur = resolved.blur;
        return PAPERCUT_SUCCESS;
    } catch (const std::invalid_argument&) {
        return PAPERCUT_ERROR_INVALID_PARAMETERS;
    }
}

PapercutResult papercut_validate_params(const PapercutParams* params) {
    if (!params) return PAPERCUT_ERROR_INVALID_PARAMETERS;

    if (params->min_bridge_mm < 0.0 || params->min_bridge_mm > 20.0) {
        return PAPERCUT_ERROR_INVALID_PARAMETERS;
    }
    if (params->background_rgb > 0xFFFFFF) {
        return PAPERCUT_ERROR_INVALID_PARAMETERS;
    }

    try {
        validateConfig(convertParams(params));
    } catch (const std::invalid_argument& e) {
        if (params->verbose) {
            std::cerr << "[ERROR] Invalid parameter: " << e.what() << std::endl;
        }
        return PAPERCUT_ERROR_INVALID_PARAMETERS;
    }
    return PAPERCUT_SUCCESS;
}

PapercutResult papercut_process_image(
    const char* input_path,
    const char* output_base,
    const PapercutParams* params,
    PapercutSummary* summary,
    PapercutProgressCallback progress_callback,
    PapercutErrorCallback error_callback
) {
    if (!input_path || !output_base || output_base[0] == '\0') {
        return reportError(error_callback, PAPERCUT_ERROR_INVALID_INPUT, "Invalid input or output path");
    }

    if (summary) {
        *summary = PapercutSummary{};
    }

    // Check file exists
    std::ifstream file(input_path);
    if (!file.good()) {
        return reportError(error_callback, PAPERCUT_ERROR_FILE_NOT_FOUND, "Input file not found or not readable");
    }

    PapercutParams default_params;
    if (!params) {
        papercut_get_default_params(&default_params);
        params = &default_params;
    }

    PipelineConfig config;
    try {
        config = convertParams(params);
        if (params->min_bridge_mm < 0.0) {
            throw std::invalid_argument("min-bridge-mm must not be negative");
        }
        validateConfig(config);
    } catch (const std::invalid_argument& e) {
        return reportError(error_callback, PAPERCUT_ERROR_INVALID_PARAMETERS, e.what());
    }

    try {
        PapercutPipeline pipeline(config);
        PipelineResult result = pipeline.run(input_path, output_base,
            [progress_callback](double progress, const std::string& stage) {
                if (progress_callback) {
                    progress_callback(progress, stage.c_str());
                }
            });

        fillSummary(result, summary);

        if (!result.success()) {
            for (const auto& artifact : result.artifacts) {
                if (!artifact.ok) {
                    reportError(error_callback, PAPERCUT_ERROR_EXPORT_FAILED, artifact.error.c_str());
                }
            }
            return PAPERCUT_ERROR_EXPORT_FAILED;
        }
        return PAPERCUT_SUCCESS;

    } catch (const InvalidImageError& e) {
        return reportError(error_callback, PAPERCUT_ERROR_INVALID_IMAGE, e.what());
    } catch (const EmptyMaskError& e) {
        return reportError(error_callback, PAPERCUT_ERROR_EMPTY_MASK, e.what());
    } catch (const DegenerateGeometryError& e) {
        return reportError(error_callback, PAPERCUT_ERROR_DEGENERATE_GEOMETRY, e.what());
    } catch (const ExportIOError& e) {
        return reportError(error_callback, PAPERCUT_ERROR_EXPORT_FAILED, e.what());
    } catch (const std::invalid_argument& e) {
        return reportError(error_callback, PAPERCUT_ERROR_INVALID_PARAMETERS, e.what());
    } catch (const std::exception& e) {
        return reportError(error_callback, PAPERCUT_ERROR_PROCESSING_FAILED, e.what());
    }
}

const char* papercut_get_error_message(PapercutResult error_code) {
    switch (error_code) {
        case PAPERCUT_SUCCESS: return "Success";
        case PAPERCUT_ERROR_INVALID_INPUT: return "Invalid input parameters";
        case PAPERCUT_ERROR_FILE_NOT_FOUND: return "Input file not found or not readable";
        case PAPERCUT_ERROR_INVALID_IMAGE: return "Failed to decode image - check format and file integrity";
        case PAPERCUT_ERROR_EMPTY_MASK: return "Nothing left to cut - adjust threshold or invert mode";
        case PAPERCUT_ERROR_DEGENERATE_GEOMETRY: return "A contour collapsed during vectorization";
        case PAPERCUT_ERROR_EXPORT_FAILED: return "One or more output files could not be written";
        case PAPERCUT_ERROR_INVALID_PARAMETERS: return "Invalid processing parameters - check parameter ranges";
        case PAPERCUT_ERROR_PROCESSING_FAILED: return "Image processing failed - see error callback for details";
        default: return "Unknown error";
    }
}

const char* papercut_get_version(void) {
    return "1.0.0";
}

bool papercut_is_valid_image_file(const char* file_path) {
    if (!file_path) return false;

    try {
        cv::Mat img = cv::imread(file_path);
        return !img.empty();
    } catch (const cv::Exception&) {
        return false;
    }
}
