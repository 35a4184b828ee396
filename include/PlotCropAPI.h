#ifndef PLOT_CROP_API_H
#define PLOT_CROP_API_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stddef.h>
#include <stdint.h>
#include <stdbool.h>

// Version information
#define PLOT_CROP_VERSION_MAJOR 1
#define PLOT_CROP_VERSION_MINOR 0
#define PLOT_CROP_VERSION_PATCH 0

// Error codes
typedef enum {
    PLOT_CROP_SUCCESS = 0,
    PLOT_CROP_ERROR_INVALID_INPUT = -1,
    PLOT_CROP_ERROR_FILE_NOT_FOUND = -2,
    PLOT_CROP_ERROR_IMAGE_LOAD_FAILED = -3,
    PLOT_CROP_ERROR_INVALID_PARAMETERS = -4,
    PLOT_CROP_ERROR_WRITE_FAILED = -5,
    PLOT_CROP_ERROR_PROCESSING_FAILED = -6
} PlotCropResult;

// Processing parameters structure
typedef struct {
    // Edge detection
    double edge_low_threshold;      // Weak-edge cutoff (default: 60.0)
    double edge_high_threshold;     // Strong-edge cutoff (default: 140.0)

    // Gap closing
    int32_t dilation_iterations;    // Dilation passes before contour tracing (default: 1)

    // Rectangle selection
    double min_area_percent;        // Minimum rectangle area as % of image area (default: 20.0)

    // Cropping
    int32_t inset_margin_px;        // Pixels trimmed inward from detected edges (default: 10)

    // Orientation applied to the final image
    bool mirror_x;                  // Mirror horizontally (default: false)
    bool mirror_y;                  // Mirror vertically (default: false)

    bool verbose_output;            // Console progress output (default: false)
} PlotCropParams;

// Encoded output image
typedef struct {
    uint8_t* data;                  // PNG bytes
    size_t size;
    int32_t width;
    int32_t height;
} PlotCropImage;

// Progress callback function type for UI progress tracking
typedef void (*PlotCropProgressCallback)(double progress, const char* stage);

// Error callback function type for detailed error reporting
typedef void (*PlotCropErrorCallback)(PlotCropResult error_code, const char* error_message);

// Core API Functions

/**
 * Get default processing parameters
 * @param params Pointer to parameters structure to fill
 */
void plot_crop_get_default_params(PlotCropParams* params);

/**
 * Validate processing parameters
 * @param params Pointer to parameters to validate
 * @return PLOT_CROP_SUCCESS if valid, error code otherwise
 */
PlotCropResult plot_crop_validate_params(const PlotCropParams* params);

/**
 * Crop an encoded image to its inner plan rectangle
 * @param data Encoded image bytes (PNG, JPEG, ...)
 * @param size Number of bytes in data
 * @param params Processing parameters (defaults if NULL)
 * @param image Output image (caller must free with plot_crop_free_image)
 * @param progress_callback Optional progress callback
 * @param error_callback Optional error callback
 * @return PLOT_CROP_SUCCESS if successful, error code otherwise
 */
PlotCropResult plot_crop_process_buffer(
    const uint8_t* data,
    size_t size,
    const PlotCropParams* params,
    PlotCropImage* image,
    PlotCropProgressCallback progress_callback,
    PlotCropErrorCallback error_callback
);

/**
 * Complete processing: image file to cropped PNG file in one call
 * @param input_path Path to input image file
 * @param output_path Path for output PNG file
 * @param params Processing parameters (defaults if NULL)
 * @param image Optional output receiving the result size (data is left NULL)
 * @param progress_callback Optional progress callback
 * @param error_callback Optional error callback
 * @return PLOT_CROP_SUCCESS if successful, error code otherwise
 */
PlotCropResult plot_crop_process_image_to_file(
    const char* input_path,
    const char* output_path,
    const PlotCropParams* params,
    PlotCropImage* image,
    PlotCropProgressCallback progress_callback,
    PlotCropErrorCallback error_callback
);

// Memory management functions

/**
 * Free image memory allocated by plot_crop_process_buffer
 * @param image Pointer to image to free
 */
void plot_crop_free_image(PlotCropImage* image);

// Utility functions

/**
 * Get human-readable error message for error code
 * @return Static string describing the error (do not free)
 */
const char* plot_crop_get_error_message(PlotCropResult error_code);

/**
 * Get library version string
 * @return Static version string in format "major.minor.patch" (do not free)
 */
const char* plot_crop_get_version(void);

/**
 * Check if input file appears to be a valid image
 */
bool plot_crop_is_valid_image_file(const char* file_path);

#ifdef __cplusplus
}
#endif

#endif // PLOT_CROP_API_H
