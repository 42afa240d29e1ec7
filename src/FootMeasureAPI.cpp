#include "FootMeasureAPI.h"
#include "FootProcessor.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

using namespace FootMeasure;

// Internal helper functions
namespace {

    // Convert C parameters to C++ parameters
    FootProcessor::ProcessingParams convertParams(const FootMeasureParams* params) {
        FootProcessor::ProcessingParams cpp_params;
        if (params) {
            cpp_params.blurKernelSize = params->blur_kernel_size;
            cpp_params.blurSigma = params->blur_sigma;

            cpp_params.cannyLower = params->canny_lower;
            cpp_params.cannyUpper = params->canny_upper;
            cpp_params.cannyAperture = params->canny_aperture;
            cpp_params.l2Gradient = params->l2_gradient;

            cpp_params.cmPerPixel = params->cm_per_pixel;

            cpp_params.enableDebugOutput = params->enable_debug_output;
            cpp_params.verboseOutput = params->verbose_output;
        }
        return cpp_params;
    }

    // Convert C++ result to C result
    void convertResult(const MeasurementResult& cpp_result, FootMeasureResult* c_result) {
        c_result->length_cm = cpp_result.lengthCm;
        c_result->box_x = cpp_result.boundingBox.x;
        c_result->box_y = cpp_result.boundingBox.y;
        c_result->box_width = cpp_result.boundingBox.width;
        c_result->box_height = cpp_result.boundingBox.height;
        c_result->contour_count = static_cast<int32_t>(cpp_result.contourCount);
    }

    FootMeasureStatus toStatus(MeasurementStatus status) {
        switch (status) {
            case MeasurementStatus::Success: return FOOT_MEASURE_SUCCESS;
            case MeasurementStatus::DecodeError: return FOOT_MEASURE_ERROR_DECODE_FAILED;
            case MeasurementStatus::NoContourFound: return FOOT_MEASURE_ERROR_NO_CONTOUR;
            case MeasurementStatus::InternalError: return FOOT_MEASURE_ERROR_PROCESSING_FAILED;
        }
        return FOOT_MEASURE_ERROR_PROCESSING_FAILED;
    }

    void reportError(FootMeasureErrorCallback callback, FootMeasureStatus code, const char* message) {
        if (callback) {
            callback(code, message);
        }
    }

    // Progress reporting helper
    void reportProgress(FootMeasureProgressCallback callback, double progress, const char* stage) {
        if (callback) {
            callback(progress, stage);
        }
    }

    bool mimeTypeFromPath(const std::string& path, FootMeasureMimeType* mime_type) {
        size_t dotPos = path.find_last_of('.');
        if (dotPos == std::string::npos) {
            return false;
        }

        std::string ext = path.substr(dotPos + 1);
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (ext == "png") {
            *mime_type = FOOT_MEASURE_MIME_PNG;
            return true;
        }
        if (ext == "jpg" || ext == "jpeg") {
            *mime_type = FOOT_MEASURE_MIME_JPEG;
            return true;
        }
        return false;
    }
}

// API Implementation

void foot_measure_get_default_params(FootMeasureParams* params) {
    if (!params) return;

    params->blur_kernel_size = 5;
    params->blur_sigma = 0.0;

    params->canny_lower = 50.0;
    params->canny_upper = 150.0;
    params->canny_aperture = 3;
    params->l2_gradient = false;

    // 0.2 cm per pixel assumes the fixed capture distance of the original setup
    params->cm_per_pixel = 0.2;

    params->enable_debug_output = false;
    params->verbose_output = false;
}

FootMeasureStatus foot_measure_validate_params(const FootMeasureParams* params) {
    if (!params) return FOOT_MEASURE_ERROR_INVALID_PARAMETERS;

    // Blur parameters
    if (params->blur_kernel_size <= 0 || params->blur_kernel_size > 31 || params->blur_kernel_size % 2 == 0) {
        return FOOT_MEASURE_ERROR_INVALID_PARAMETERS;
    }

    if (params->blur_sigma < 0.0) {
        return FOOT_MEASURE_ERROR_INVALID_PARAMETERS;
    }

    // Canny edge detection parameters
    if (params->canny_lower < 0.0 || params->canny_lower > 1000.0 ||
        params->canny_upper < 0.0 || params->canny_upper > 1000.0 ||
        params->canny_lower >= params->canny_upper) {
        return FOOT_MEASURE_ERROR_INVALID_PARAMETERS;
    }

    if (params->canny_aperture < 3 || params->canny_aperture > 7 || params->canny_aperture % 2 == 0) {
        return FOOT_MEASURE_ERROR_INVALID_PARAMETERS;
    }

    // Conversion factor
    if (params->cm_per_pixel <= 0.0 || params->cm_per_pixel > 10.0) {
        return FOOT_MEASURE_ERROR_INVALID_PARAMETERS;
    }

    return FOOT_MEASURE_SUCCESS;
}

FootMeasureStatus foot_measure_measure_buffer(
    const uint8_t* data,
    size_t size,
    FootMeasureMimeType mime_type,
    const FootMeasureParams* params,
    FootMeasureResult* result,
    FootMeasureProgressCallback progress_callback,
    FootMeasureErrorCallback error_callback
) {
    if (!result || (!data && size > 0)) {
        reportError(error_callback, FOOT_MEASURE_ERROR_INVALID_INPUT, "Invalid input parameters");
        return FOOT_MEASURE_ERROR_INVALID_INPUT;
    }

    if (mime_type != FOOT_MEASURE_MIME_PNG && mime_type != FOOT_MEASURE_MIME_JPEG) {
        reportError(error_callback, FOOT_MEASURE_ERROR_INVALID_INPUT, "Unsupported image type");
        return FOOT_MEASURE_ERROR_INVALID_INPUT;
    }

    // Initialize result
    *result = FootMeasureResult{0.0, 0, 0, 0, 0, 0};

    // Validate parameters
    FootMeasureParams default_params;
    if (!params) {
        foot_measure_get_default_params(&default_params);
        params = &default_params;
    }

    FootMeasureStatus validation_result = foot_measure_validate_params(params);
    if (validation_result != FOOT_MEASURE_SUCCESS) {
        reportError(error_callback, validation_result, "Invalid processing parameters");
        return validation_result;
    }

    try {
        reportProgress(progress_callback, 0.0, "Starting foot measurement");

        FootProcessor::ProcessingParams cpp_params = convertParams(params);
        std::vector<uchar> bytes;
        if (size > 0) {
            bytes.assign(data, data + size);
        }
        MimeType cpp_mime = (mime_type == FOOT_MEASURE_MIME_JPEG) ? MimeType::JPEG : MimeType::PNG;

        reportProgress(progress_callback, 0.1, "Decoding and processing image");

        MeasurementResult cpp_result = FootProcessor::measureFoot(bytes, cpp_mime, cpp_params);

        reportProgress(progress_callback, 0.9, "Converting measurement");

        FootMeasureStatus status = toStatus(cpp_result.status);
        if (status != FOOT_MEASURE_SUCCESS) {
            reportError(error_callback, status, cpp_result.message.c_str());
            return status;
        }

        convertResult(cpp_result, result);

        reportProgress(progress_callback, 1.0, "Foot measurement complete");

        return FOOT_MEASURE_SUCCESS;

    } catch (const std::exception& e) {
        reportError(error_callback, FOOT_MEASURE_ERROR_PROCESSING_FAILED, e.what());
        return FOOT_MEASURE_ERROR_PROCESSING_FAILED;
    }
}

FootMeasureStatus foot_measure_measure_file(
    const char* input_path,
    const FootMeasureParams* params,
    FootMeasureResult* result,
    FootMeasureProgressCallback progress_callback,
    FootMeasureErrorCallback error_callback
) {
    if (!input_path || !result) {
        reportError(error_callback, FOOT_MEASURE_ERROR_INVALID_INPUT, "Invalid input parameters");
        return FOOT_MEASURE_ERROR_INVALID_INPUT;
    }

    FootMeasureMimeType mime_type;
    if (!mimeTypeFromPath(input_path, &mime_type)) {
        reportError(error_callback, FOOT_MEASURE_ERROR_INVALID_INPUT, "Only .png, .jpg and .jpeg files are accepted");
        return FOOT_MEASURE_ERROR_INVALID_INPUT;
    }

    // Check file exists
    std::ifstream file(input_path, std::ios::binary);
    if (!file.good()) {
        reportError(error_callback, FOOT_MEASURE_ERROR_FILE_NOT_FOUND, "Input file not found or not readable");
        return FOOT_MEASURE_ERROR_FILE_NOT_FOUND;
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    return foot_measure_measure_buffer(bytes.data(), bytes.size(), mime_type, params, result,
                                       progress_callback, error_callback);
}

const char* foot_measure_get_error_message(FootMeasureStatus error_code) {
    switch (error_code) {
        case FOOT_MEASURE_SUCCESS: return "Success";
        case FOOT_MEASURE_ERROR_INVALID_INPUT: return "Invalid input parameters";
        case FOOT_MEASURE_ERROR_FILE_NOT_FOUND: return "Input file not found or not readable";
        case FOOT_MEASURE_ERROR_DECODE_FAILED: return "Failed to decode image - check format and file integrity";
        case FOOT_MEASURE_ERROR_NO_CONTOUR: return "Could not detect the foot in the image - ensure good contrast";
        case FOOT_MEASURE_ERROR_INVALID_PARAMETERS: return "Invalid processing parameters - check parameter ranges";
        case FOOT_MEASURE_ERROR_PROCESSING_FAILED: return "Image processing failed - see error callback for details";
        default: return "Unknown error";
    }
}

const char* foot_measure_get_version(void) {
    return "1.0.0";
}

bool foot_measure_is_valid_image_file(const char* file_path) {
    if (!file_path) return false;

    try {
        cv::Mat img = cv::imread(file_path);
        return !img.empty();
    } catch (const cv::Exception&) {
        return false;
    }
}
