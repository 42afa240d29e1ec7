#ifndef FOOT_MEASURE_API_H
#define FOOT_MEASURE_API_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stddef.h>
#include <stdint.h>
#include <stdbool.h>

// Version information
#define FOOT_MEASURE_VERSION_MAJOR 1
#define FOOT_MEASURE_VERSION_MINOR 0
#define FOOT_MEASURE_VERSION_PATCH 0

// Status codes
typedef enum {
    FOOT_MEASURE_SUCCESS = 0,
    FOOT_MEASURE_ERROR_INVALID_INPUT = -1,
    FOOT_MEASURE_ERROR_FILE_NOT_FOUND = -2,
    FOOT_MEASURE_ERROR_DECODE_FAILED = -3,
    FOOT_MEASURE_ERROR_NO_CONTOUR = -4,
    FOOT_MEASURE_ERROR_INVALID_PARAMETERS = -5,
    FOOT_MEASURE_ERROR_PROCESSING_FAILED = -6
} FootMeasureStatus;

// Declared encoding of the image bytes
typedef enum {
    FOOT_MEASURE_MIME_PNG = 0,
    FOOT_MEASURE_MIME_JPEG = 1
} FootMeasureMimeType;

// Processing parameters structure
typedef struct {
    int32_t blur_kernel_size;       // Gaussian kernel size, odd (default: 5)
    double blur_sigma;              // Gaussian sigma, 0 = from kernel size (default: 0.0)

    double canny_lower;             // Canny lower threshold (default: 50.0)
    double canny_upper;             // Canny upper threshold (default: 150.0)
    int32_t canny_aperture;         // Sobel aperture size (default: 3)
    bool l2_gradient;               // Use L2 gradient magnitude (default: false)

    double cm_per_pixel;            // Conversion factor (default: 0.2)

    bool enable_debug_output;       // Save stage images to ./debug/ (default: false)
    bool verbose_output;            // Log every stage to the console (default: false)
} FootMeasureParams;

// Measurement output
typedef struct {
    double length_cm;               // Rounded to two decimals
    int32_t box_x;
    int32_t box_y;
    int32_t box_width;
    int32_t box_height;
    int32_t contour_count;
} FootMeasureResult;

// Progress callback function type
typedef void (*FootMeasureProgressCallback)(double progress, const char* stage);

// Error callback function type for detailed error reporting
typedef void (*FootMeasureErrorCallback)(FootMeasureStatus error_code, const char* error_message);

/**
 * Get default processing parameters
 * @param params Pointer to parameters structure to fill
 */
void foot_measure_get_default_params(FootMeasureParams* params);

/**
 * Validate processing parameters
 * @param params Pointer to parameters to validate
 * @return FOOT_MEASURE_SUCCESS if valid, error code otherwise
 */
FootMeasureStatus foot_measure_validate_params(const FootMeasureParams* params);

/**
 * Measure the foot in an encoded image held in memory
 * @param data Encoded PNG or JPEG bytes
 * @param size Number of bytes
 * @param mime_type Declared encoding of the bytes
 * @param params Processing parameters (defaults if NULL)
 * @param result Pointer to result structure to fill
 * @param progress_callback Optional progress callback
 * @param error_callback Optional error callback
 * @return FOOT_MEASURE_SUCCESS, FOOT_MEASURE_ERROR_DECODE_FAILED,
 *         FOOT_MEASURE_ERROR_NO_CONTOUR or another error code
 */
FootMeasureStatus foot_measure_measure_buffer(
    const uint8_t* data,
    size_t size,
    FootMeasureMimeType mime_type,
    const FootMeasureParams* params,
    FootMeasureResult* result,
    FootMeasureProgressCallback progress_callback,
    FootMeasureErrorCallback error_callback
);

/**
 * Measure the foot in an image file, encoding taken from the extension
 * (.png, .jpg, .jpeg)
 */
FootMeasureStatus foot_measure_measure_file(
    const char* input_path,
    const FootMeasureParams* params,
    FootMeasureResult* result,
    FootMeasureProgressCallback progress_callback,
    FootMeasureErrorCallback error_callback
);

/**
 * Get human-readable error message for error code
 * @return Static string describing the error (do not free)
 */
const char* foot_measure_get_error_message(FootMeasureStatus error_code);

/**
 * Get library version string
 * @return Static version string in format "major.minor.patch" (do not free)
 */
const char* foot_measure_get_version(void);

/**
 * Check if input file appears to be a valid image
 */
bool foot_measure_is_valid_image_file(const char* file_path);

#ifdef __cplusplus
}
#endif

#endif // FOOT_MEASURE_API_H
