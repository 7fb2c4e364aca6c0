#ifndef PAPERCUT_API_H
#define PAPERCUT_API_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stdbool.h>

// Version information
#define PAPERCUT_VERSION_MAJOR 1
#define PAPERCUT_VERSION_MINOR 0
#define PAPERCUT_VERSION_PATCH 0

// Error codes
typedef enum {
    PAPERCUT_SUCCESS = 0,
    PAPERCUT_ERROR_INVALID_INPUT = -1,
    PAPERCUT_ERROR_FILE_NOT_FOUND = -2,
    PAPERCUT_ERROR_INVALID_IMAGE = -3,
    PAPERCUT_ERROR_EMPTY_MASK = -4,
    PAPERCUT_ERROR_DEGENERATE_GEOMETRY = -5,
    PAPERCUT_ERROR_EXPORT_FAILED = -6,
    PAPERCUT_ERROR_INVALID_PARAMETERS = -7,
    PAPERCUT_ERROR_PROCESSING_FAILED = -8
} PapercutResult;

typedef enum {
    PAPERCUT_INVERT_AUTO = 0,
    PAPERCUT_INVERT_LIGHT = 1,
    PAPERCUT_INVERT_DARK = 2
} PapercutInvertMode;

typedef enum {
    PAPERCUT_FIT = 0,
    PAPERCUT_FILL = 1,
    PAPERCUT_STRETCH = 2
} PapercutFitMode;

typedef enum {
    PAPERCUT_LAYOUT_TILE = 0,
    PAPERCUT_LAYOUT_REPEAT = 1
} PapercutLayoutMode;

// Processing parameters
typedef struct {
    // Normalization
    int32_t normalize_dpi;          // Target DPI, 0 disables DPI scaling (default: 300)
    int32_t source_dpi;             // Source DPI, 0 = same as target (default: 0)
    double normalize_scale;         // Extra resize factor (default: 2.0)
    double normalize_blur;          // Gaussian sigma after resampling (default: 0.8)

    // Detail extraction
    int32_t threshold;              // lum >= threshold counts as light (default: 200)
    int32_t detail_delta;           // 3x3 contrast for detail edges, <= 0 disables (default: 60)
    double blur;                    // Pre-threshold Gaussian sigma (default: 0.6)
    int32_t dilate_px;              // Material dilation radius (default: 1)
    int32_t detail_join_px;         // Gap closing radius (default: 2)
    double min_bridge_mm;           // Minimum bridge width, 0 disables (default: 0.0)
    PapercutInvertMode invert_mode; // (default: auto)

    // Vectorization
    double antialias_radius;        // Contour smoothing sigma in pixels (default: 0.8)
    double min_region_px;           // Drop specks below this area, 0 disables (default: 0.0)

    // Layout
    int32_t rows;                   // (default: 4)
    int32_t cols;                   // (default: 3)
    double page_width_mm;           // (default: 210.0, A4)
    double page_height_mm;          // (default: 297.0, A4)
    double margin_mm;               // (default: 10.0)
    double shift_x_mm;              // (default: 0.0)
    double shift_y_mm;              // (default: 0.0)
    PapercutFitMode fit_mode;       // (default: fit)
    PapercutLayoutMode layout_mode; // (default: tile)

    // Export
    bool export_pptx;               // (default: true)
    bool export_pdf;                // (default: true)
    bool export_dxf;                // (default: false)
    bool debug_panel;               // Write <base>_panel.png (default: false)
    int32_t preview_dpi;            // Panel preview resolution (default: 150)
    uint32_t background_rgb;        // Cell background as 0xRRGGBB (default: 0x8E8E8E)

    // Diagnostics
    const char* debug_output_dir;   // Numbered intermediate images, NULL disables (default: NULL)
    bool verbose;                   // (default: false)
} PapercutParams;

// Outcome of a successful or partially successful run
typedef struct {
    int32_t mask_width;
    int32_t mask_height;
    double light_fraction;
    bool inverted;
    int32_t outer_contours;
    int32_t hole_contours;
    int32_t page_count;
    int32_t layout_warnings;
    int32_t artifacts_written;
    int32_t artifacts_failed;
} PapercutSummary;

// Progress callback function type
typedef void (*PapercutProgressCallback)(double progress, const char* stage);

// Error callback function type for detailed error reporting
typedef void (*PapercutErrorCallback)(PapercutResult error_code, const char* error_message);

// Core API Functions

/**
 * Get default processing parameters
 * @param params Pointer to parameters structure to fill
 */
void papercut_get_default_params(PapercutParams* params);

/**
 * Apply a normalization preset (default, noblur, fast, print) to params
 * @return PAPERCUT_SUCCESS, or PAPERCUT_ERROR_INVALID_PARAMETERS for an unknown name
 */
PapercutResult papercut_apply_preset(PapercutParams* params, const char* preset_name);

/**
 * Validate processing parameters
 * @param params Pointer to parameters to validate
 * @return PAPERCUT_SUCCESS if valid, error code otherwise
 */
PapercutResult papercut_validate_params(const PapercutParams* params);

/**
 * Process one image into the stencil artifacts
 * @param input_path Path to input image file
 * @param output_base Output path prefix; artifact suffixes are appended
 * @param params Processing parameters (defaults if NULL)
 * @param summary Optional structure receiving run statistics
 * @param progress_callback Optional progress callback
 * @param error_callback Optional error callback, called once per failure
 * @return PAPERCUT_SUCCESS if every requested artifact was written
 */
PapercutResult papercut_process_image(
    const char* input_path,
    const char* output_base,
    const PapercutParams* params,
    PapercutSummary* summary,
    PapercutProgressCallback progress_callback,
    PapercutErrorCallback error_callback
);

// Utility functions

/**
 * Get human-readable error message for error code
 * @return Static string describing the error (do not free)
 */
const char* papercut_get_error_message(PapercutResult error_code);

/**
 * Get library version string
 * @return Static version string in format "major.minor.patch" (do not free)
 */
const char* papercut_get_version(void);

/**
 * Check if input file appears to be a valid image
 */
bool papercut_is_valid_image_file(const char* file_path);

#ifdef __cplusplus
}
#endif

#endif // PAPERCUT_API_H
