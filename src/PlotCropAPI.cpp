#include "PlotCropAPI.h"
#include "ImageProcessor.hpp"
#include <iostream>
#include <fstream>
#include <cstring>
#include <cstdlib>

using namespace PlotCrop;

// Internal helper functions
namespace {

    // Convert C parameters to C++ parameters
    CropConfig convertParams(const PlotCropParams* params) {
        CropConfig config;
        if (params) {
            config.edgeLowThreshold = params->edge_low_threshold;
            config.edgeHighThreshold = params->edge_high_threshold;
            config.dilationIterations = params->dilation_iterations;
            config.minAreaPercent = params->min_area_percent;
            config.insetMarginPx = params->inset_margin_px;
            config.verboseOutput = params->verbose_output;
        }
        return config;
    }

    // Copy the C++ result into a malloc'd C image
    bool convertImage(const PipelineResult& result, PlotCropImage* image) {
        image->width = result.width;
        image->height = result.height;
        image->size = result.imageData.size();
        image->data = static_cast<uint8_t*>(malloc(image->size));
        if (!image->data) {
            image->size = 0;
            return false;
        }
        std::memcpy(image->data, result.imageData.data(), image->size);
        return true;
    }

    PlotCropResult reportError(PlotCropResult code, const char* message, PlotCropErrorCallback error_callback) {
        if (error_callback) {
            error_callback(code, message);
        }
        return code;
    }

    // Convert C++ exception to error code
    PlotCropResult handleException(const std::exception& e, PlotCropErrorCallback error_callback) {
        if (dynamic_cast<const DecodeError*>(&e)) {
            return reportError(PLOT_CROP_ERROR_IMAGE_LOAD_FAILED, e.what(), error_callback);
        }
        return reportError(PLOT_CROP_ERROR_PROCESSING_FAILED, e.what(), error_callback);
    }

    // Progress reporting helper
    void reportProgress(PlotCropProgressCallback callback, double progress, const char* stage) {
        if (callback) {
            callback(progress, stage);
        }
    }

    // Resolve NULL to defaults and validate
    PlotCropResult resolveParams(const PlotCropParams*& params, PlotCropParams& defaults,
                                 PlotCropErrorCallback error_callback) {
        if (!params) {
            plot_crop_get_default_params(&defaults);
            params = &defaults;
        }

        PlotCropResult validation_result = plot_crop_validate_params(params);
        if (validation_result != PLOT_CROP_SUCCESS) {
            return reportError(validation_result, "Invalid processing parameters", error_callback);
        }
        return PLOT_CROP_SUCCESS;
    }
}

// API Implementation

void plot_crop_get_default_params(PlotCropParams* params) {
    if (!params) return;

    CropConfig defaults;
    params->edge_low_threshold = defaults.edgeLowThreshold;
    params->edge_high_threshold = defaults.edgeHighThreshold;
    params->dilation_iterations = defaults.dilationIterations;
    params->min_area_percent = defaults.minAreaPercent;
    params->inset_margin_px = defaults.insetMarginPx;

    params->mirror_x = false;
    params->mirror_y = false;

    // Library callers get a quiet pipeline unless they ask for output
    params->verbose_output = false;
}

PlotCropResult plot_crop_validate_params(const PlotCropParams* params) {
    if (!params) return PLOT_CROP_ERROR_INVALID_PARAMETERS;

    // Edge thresholds, written as negated ranges so NaN is rejected
    if (!(params->edge_low_threshold >= 0.0 && params->edge_low_threshold <= 1000.0) ||
        !(params->edge_high_threshold >= 0.0 && params->edge_high_threshold <= 1000.0) ||
        !(params->edge_low_threshold <= params->edge_high_threshold)) {
        return PLOT_CROP_ERROR_INVALID_PARAMETERS;
    }

    if (params->dilation_iterations < 0 || params->dilation_iterations > 50) {
        return PLOT_CROP_ERROR_INVALID_PARAMETERS;
    }

    // Values above 100 are allowed and simply disable cropping
    if (!(params->min_area_percent >= 0.0)) {
        return PLOT_CROP_ERROR_INVALID_PARAMETERS;
    }

    if (params->inset_margin_px < 0) {
        return PLOT_CROP_ERROR_INVALID_PARAMETERS;
    }

    return PLOT_CROP_SUCCESS;
}

PlotCropResult plot_crop_process_buffer(
    const uint8_t* data,
    size_t size,
    const PlotCropParams* params,
    PlotCropImage* image,
    PlotCropProgressCallback progress_callback,
    PlotCropErrorCallback error_callback
) {
    if (!data || size == 0 || !image) {
        return reportError(PLOT_CROP_ERROR_INVALID_INPUT, "Invalid input parameters", error_callback);
    }

    // Initialize image
    image->data = nullptr;
    image->size = 0;
    image->width = 0;
    image->height = 0;

    PlotCropParams default_params;
    PlotCropResult param_result = resolveParams(params, default_params, error_callback);
    if (param_result != PLOT_CROP_SUCCESS) {
        return param_result;
    }

    try {
        reportProgress(progress_callback, 0.0, "Starting rectangle extraction");

        CropConfig config = convertParams(params);
        std::vector<uchar> encoded(data, data + size);

        reportProgress(progress_callback, 0.1, "Decoding and processing image");

        PipelineResult result = ImageProcessor::process(encoded, config, params->mirror_x, params->mirror_y);

        reportProgress(progress_callback, 0.9, "Copying result");

        if (!convertImage(result, image)) {
            return reportError(PLOT_CROP_ERROR_PROCESSING_FAILED, "Out of memory copying result image", error_callback);
        }

        reportProgress(progress_callback, 1.0, "Rectangle extraction complete");
        return PLOT_CROP_SUCCESS;

    } catch (const std::exception& e) {
        return handleException(e, error_callback);
    } catch (...) {
        return reportError(PLOT_CROP_ERROR_PROCESSING_FAILED, "Unknown error during rectangle extraction", error_callback);
    }
}

PlotCropResult plot_crop_process_image_to_file(
    const char* input_path,
    const char* output_path,
    const PlotCropParams* params,
    PlotCropImage* image,
    PlotCropProgressCallback progress_callback,
    PlotCropErrorCallback error_callback
) {
    if (!input_path || !output_path) {
        return reportError(PLOT_CROP_ERROR_INVALID_INPUT, "Invalid input or output path", error_callback);
    }

    // Check file exists
    std::ifstream file(input_path, std::ios::binary);
    if (!file.good()) {
        return reportError(PLOT_CROP_ERROR_FILE_NOT_FOUND, "Input file not found or not readable", error_callback);
    }
    file.close();

    PlotCropParams default_params;
    PlotCropResult param_result = resolveParams(params, default_params, error_callback);
    if (param_result != PLOT_CROP_SUCCESS) {
        return param_result;
    }

    try {
        reportProgress(progress_callback, 0.0, "Starting rectangle extraction");

        CropConfig config = convertParams(params);
        PipelineResult result = ImageProcessor::processFile(input_path, config, params->mirror_x, params->mirror_y);

        reportProgress(progress_callback, 0.9, "Writing output image");

        std::ofstream out(output_path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(result.imageData.data()),
                  static_cast<std::streamsize>(result.imageData.size()));
        if (!out.good()) {
            return reportError(PLOT_CROP_ERROR_WRITE_FAILED, "Failed to write output image", error_callback);
        }

        if (image) {
            image->data = nullptr;
            image->size = result.imageData.size();
            image->width = result.width;
            image->height = result.height;
        }

        reportProgress(progress_callback, 1.0, "Rectangle extraction complete");
        return PLOT_CROP_SUCCESS;

    } catch (const std::exception& e) {
        return handleException(e, error_callback);
    } catch (...) {
        return reportError(PLOT_CROP_ERROR_PROCESSING_FAILED, "Unknown error during rectangle extraction", error_callback);
    }
}

void plot_crop_free_image(PlotCropImage* image) {
    if (image && image->data) {
        free(image->data);
        image->data = nullptr;
        image->size = 0;
        image->width = 0;
        image->height = 0;
    }
}

const char* plot_crop_get_error_message(PlotCropResult error_code) {
    switch (error_code) {
        case PLOT_CROP_SUCCESS: return "Success";
        case PLOT_CROP_ERROR_INVALID_INPUT: return "Invalid input parameters";
        case PLOT_CROP_ERROR_FILE_NOT_FOUND: return "Input file not found or not readable";
        case PLOT_CROP_ERROR_IMAGE_LOAD_FAILED: return "Failed to decode image - check format and file integrity";
        case PLOT_CROP_ERROR_INVALID_PARAMETERS: return "Invalid processing parameters - check parameter ranges";
        case PLOT_CROP_ERROR_WRITE_FAILED: return "Failed to write output image - check output path permissions";
        case PLOT_CROP_ERROR_PROCESSING_FAILED: return "Image processing failed - see error callback for details";
        default: return "Unknown error";
    }
}

const char* plot_crop_get_version(void) {
    return "1.0.0";
}

bool plot_crop_is_valid_image_file(const char* file_path) {
    if (!file_path) return false;

    try {
        cv::Mat img = cv::imread(file_path);
        return !img.empty();
    } catch (const cv::Exception& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return false;
    }
}
