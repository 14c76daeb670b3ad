#include "NailSizeAPI.h"
#include "CardDetector.hpp"
#include "ImageProcessor.hpp"
#include "NailMeasurer.hpp"
#include "UnitConverter.hpp"
#include <cmath>
#include <iostream>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace NailSize;

struct NailSizeSession {
    CardDetector detector;
};

// Internal helper functions
namespace {

    // Convert C parameters to C++ parameters
    ImageProcessor::ProcessingParams convertParams(const NailSizeParams* params) {
        ImageProcessor::ProcessingParams cpp_params;
        if (params) {
            cpp_params.edgeThreshold = params->edge_threshold;
            cpp_params.maxContourPoints = params->max_contour_points;
            cpp_params.minContourLength = params->min_contour_length;
            cpp_params.maxContours = params->max_contours;

            cpp_params.minGuideFill = params->min_guide_fill;
            cpp_params.maxGuideFill = params->max_guide_fill;
            cpp_params.minFrameFill = params->min_frame_fill;
            cpp_params.maxFrameFill = params->max_frame_fill;

            cpp_params.smoothingWindow = params->smoothing_window;
            cpp_params.stableFrameCount = params->stable_frame_count;
            cpp_params.stableEpsilonPx = params->stable_epsilon_px;
            cpp_params.lockPaddingFraction = params->lock_padding_fraction;

            cpp_params.minPixelsPerMM = params->min_pixels_per_mm;
            cpp_params.maxPixelsPerMM = params->max_pixels_per_mm;

            cpp_params.nailBrightnessFraction = params->nail_brightness_fraction;
            cpp_params.skinBrightnessMultiple = params->skin_brightness_multiple;
            cpp_params.maxScanDistancePx = params->max_scan_distance_px;
            cpp_params.minNailWidthPx = params->min_nail_width_px;

            cpp_params.curvatureMultiplier = params->curvature_multiplier;

            cpp_params.enableDebugOutput = params->enable_debug_output;
            cpp_params.verboseOutput = params->verbose_output;
        }
        return cpp_params;
    }

    ReferenceObjectSpec convertReference(const NailSizeParams* params) {
        ReferenceObjectSpec reference = ReferenceObjectSpec::creditCard();
        if (params) {
            reference.widthMM = params->reference_width_mm;
            reference.heightMM = params->reference_height_mm;
            reference.aspectRatio = params->reference_width_mm / params->reference_height_mm;
            reference.aspectTolerance = params->aspect_tolerance;
        }
        return reference;
    }

    // Wrap a caller buffer as BGR/BGRA/gray without copying where possible
    cv::Mat wrapImage(const NailSizeImage* image) {
        if (!image || !image->data || image->width <= 0 || image->height <= 0) {
            throw std::invalid_argument("Image buffer is empty");
        }

        int type = CV_8UC1;
        switch (image->format) {
            case NAIL_SIZE_PIXEL_GRAY: type = CV_8UC1; break;
            case NAIL_SIZE_PIXEL_BGR:
            case NAIL_SIZE_PIXEL_RGB: type = CV_8UC3; break;
            case NAIL_SIZE_PIXEL_BGRA:
            case NAIL_SIZE_PIXEL_RGBA: type = CV_8UC4; break;
            default: throw std::invalid_argument("Unknown pixel format");
        }

        size_t rowBytes = static_cast<size_t>(image->width) * CV_ELEM_SIZE(type);
        if (image->stride != 0 && static_cast<size_t>(image->stride) < rowBytes) {
            throw std::invalid_argument("Image stride is smaller than one row of pixels");
        }
        size_t step = image->stride == 0 ? cv::Mat::AUTO_STEP : static_cast<size_t>(image->stride);

        // The pipeline only reads from the buffer
        cv::Mat wrapped(image->height, image->width, type, const_cast<uint8_t*>(image->data), step);

        cv::Mat converted;
        switch (image->format) {
            case NAIL_SIZE_PIXEL_RGB:
                cv::cvtColor(wrapped, converted, cv::COLOR_RGB2BGR);
                return converted;
            case NAIL_SIZE_PIXEL_RGBA:
                cv::cvtColor(wrapped, converted, cv::COLOR_RGBA2BGRA);
                return converted;
            default:
                return wrapped;
        }
    }

    NailSizeResult statusToResult(Status status) {
        switch (status) {
            case Status::Success: return NAIL_SIZE_SUCCESS;
            case Status::ReferenceNotFound: return NAIL_SIZE_ERROR_REFERENCE_NOT_FOUND;
            case Status::InvalidScale: return NAIL_SIZE_ERROR_INVALID_SCALE;
            case Status::InsufficientContourData: return NAIL_SIZE_ERROR_INSUFFICIENT_CONTOUR_DATA;
            case Status::BoundaryDetectionFailed: return NAIL_SIZE_ERROR_BOUNDARY_DETECTION_FAILED;
            default: return NAIL_SIZE_ERROR_PROCESSING_FAILED;
        }
    }

    NailSizeResult reportError(NailSizeResult code, const std::string& message, NailSizeErrorCallback error_callback) {
        if (error_callback) {
            error_callback(code, message.c_str());
        }
        return code;
    }

    // Convert C++ exception to error code
    NailSizeResult handleRuntimeError(const std::runtime_error& e, NailSizeErrorCallback error_callback) {
        std::string what = e.what();
        NailSizeResult code = NAIL_SIZE_ERROR_PROCESSING_FAILED;
        if (what.find("Failed to load image") != std::string::npos) {
            code = NAIL_SIZE_ERROR_IMAGE_LOAD_FAILED;
        } else if (what.find("too small") != std::string::npos) {
            code = NAIL_SIZE_ERROR_IMAGE_TOO_SMALL;
        }
        return reportError(code, what, error_callback);
    }

    // Progress reporting helper
    void reportProgress(NailSizeProgressCallback callback, double progress, const char* stage) {
        if (callback) {
            callback(progress, stage);
        }
    }

    std::vector<cv::Point2f> convertLandmarks(const NailSizePoint* landmarks, int32_t count) {
        std::vector<cv::Point2f> points;
        points.reserve(count);
        for (int32_t i = 0; i < count; i++) {
            points.emplace_back(static_cast<float>(landmarks[i].x), static_cast<float>(landmarks[i].y));
        }
        return points;
    }

    void convertCard(const CardDetection& detection, bool stable, bool locked, NailSizeCard* card) {
        for (size_t i = 0; i < 4; i++) {
            card->corners[i].x = detection.card.corners[i].x;
            card->corners[i].y = detection.card.corners[i].y;
        }
        card->width_px = detection.card.width;
        card->height_px = detection.card.height;
        card->aspect_ratio = detection.card.aspectRatio;
        card->score = detection.card.score;
        card->pixels_per_mm = detection.calibration.pixelsPerMM;
        card->stable = stable;
        card->locked = locked;
    }

    void convertNail(const NailMeasurement& measurement, NailSizeNail* nail) {
        nail->digit = static_cast<int32_t>(measurement.digit);
        nail->width_px = measurement.widthPixels;
        nail->chord_mm = measurement.chordMM;
        nail->curved_mm = measurement.curvedMM;
        nail->size = measurement.size;
        nail->confidence = measurement.confidence;
    }
}

// API Implementation

void nail_size_get_default_params(NailSizeParams* params) {
    if (!params) return;

    // Edge detection and contour tracing
    params->edge_threshold = 40.0;
    params->max_contour_points = 20000;
    params->min_contour_length = 200;
    params->max_contours = 5;

    // ID-1 card
    params->reference_width_mm = 85.6;
    params->reference_height_mm = 53.98;
    params->aspect_tolerance = 0.30;

    params->min_guide_fill = 0.50;
    params->max_guide_fill = 1.15;
    params->min_frame_fill = 0.20;
    params->max_frame_fill = 0.60;

    // Smoothing and lock
    params->smoothing_window = 5;
    params->stable_frame_count = 3;
    params->stable_epsilon_px = 12.0;
    params->lock_padding_fraction = 0.25;

    params->min_pixels_per_mm = 2.0;
    params->max_pixels_per_mm = 50.0;

    // Nail scan
    params->nail_brightness_fraction = 0.80;
    params->skin_brightness_multiple = 1.10;
    params->max_scan_distance_px = 80;
    params->min_nail_width_px = 10;

    params->curvature_multiplier = 1.06;

    // Debug settings
    params->enable_debug_output = false;
    params->verbose_output = false;
}

NailSizeResult nail_size_validate_params(const NailSizeParams* params) {
    if (!params) return NAIL_SIZE_ERROR_INVALID_PARAMETERS;

    // Double ranges are written as !(in range) so a NaN field is rejected

    // Edge detection and tracing
    if (!(params->edge_threshold > 0.0 && params->edge_threshold <= 1500.0)) {
        return NAIL_SIZE_ERROR_INVALID_PARAMETERS;
    }

    if (params->max_contour_points < 100 || params->max_contour_points > 1000000 ||
        params->min_contour_length < 4 || params->min_contour_length > params->max_contour_points) {
        return NAIL_SIZE_ERROR_INVALID_PARAMETERS;
    }

    if (params->max_contours < 1 || params->max_contours > 100) {
        return NAIL_SIZE_ERROR_INVALID_PARAMETERS;
    }

    // Reference object
    if (!(params->reference_width_mm > 0.0 && params->reference_width_mm <= 1000.0) ||
        !(params->reference_height_mm > 0.0 && params->reference_height_mm <= 1000.0)) {
        return NAIL_SIZE_ERROR_INVALID_PARAMETERS;
    }

    if (!(params->aspect_tolerance > 0.0 && params->aspect_tolerance <= 1.0)) {
        return NAIL_SIZE_ERROR_INVALID_PARAMETERS;
    }

    // Size filters
    if (!(params->min_guide_fill > 0.0 && params->min_guide_fill < params->max_guide_fill &&
          params->max_guide_fill <= 2.0)) {
        return NAIL_SIZE_ERROR_INVALID_PARAMETERS;
    }

    if (!(params->min_frame_fill > 0.0 && params->min_frame_fill < params->max_frame_fill &&
          params->max_frame_fill <= 1.0)) {
        return NAIL_SIZE_ERROR_INVALID_PARAMETERS;
    }

    // Smoothing and lock
    if (params->smoothing_window < 1 || params->smoothing_window > 60 ||
        params->stable_frame_count < 1 || params->stable_frame_count > 60) {
        return NAIL_SIZE_ERROR_INVALID_PARAMETERS;
    }

    if (!(params->stable_epsilon_px > 0.0 && params->stable_epsilon_px <= 200.0)) {
        return NAIL_SIZE_ERROR_INVALID_PARAMETERS;
    }

    if (!(params->lock_padding_fraction >= 0.0 && params->lock_padding_fraction <= 2.0)) {
        return NAIL_SIZE_ERROR_INVALID_PARAMETERS;
    }

    // Scale range
    if (!(params->min_pixels_per_mm > 0.0 && params->min_pixels_per_mm < params->max_pixels_per_mm &&
          std::isfinite(params->max_pixels_per_mm))) {
        return NAIL_SIZE_ERROR_INVALID_PARAMETERS;
    }

    // Nail scan
    if (!(params->nail_brightness_fraction > 0.0 && params->nail_brightness_fraction <= 1.0)) {
        return NAIL_SIZE_ERROR_INVALID_PARAMETERS;
    }

    if (!(params->skin_brightness_multiple >= 1.0 && params->skin_brightness_multiple <= 3.0)) {
        return NAIL_SIZE_ERROR_INVALID_PARAMETERS;
    }

    if (params->max_scan_distance_px < 1 || params->max_scan_distance_px > 2000 ||
        params->min_nail_width_px < 1 || params->min_nail_width_px > 2 * params->max_scan_distance_px) {
        return NAIL_SIZE_ERROR_INVALID_PARAMETERS;
    }

    if (!(params->curvature_multiplier >= 1.0 && params->curvature_multiplier <= 2.0)) {
        return NAIL_SIZE_ERROR_INVALID_PARAMETERS;
    }

    return NAIL_SIZE_SUCCESS;
}

NailSizeSession* nail_size_session_create(const NailSizeParams* params) {
    NailSizeParams default_params;
    if (!params) {
        nail_size_get_default_params(&default_params);
        params = &default_params;
    }

    if (nail_size_validate_params(params) != NAIL_SIZE_SUCCESS) {
        return nullptr;
    }

    try {
        return new NailSizeSession{CardDetector(convertParams(params), convertReference(params))};
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Could not create session: " << e.what() << std::endl;
        return nullptr;
    }
}

void nail_size_session_destroy(NailSizeSession* session) {
    delete session;
}

NailSizeResult nail_size_session_detect_card(
    NailSizeSession* session,
    const NailSizeImage* image,
    const NailSizeRect* guide,
    NailSizeCard* card,
    NailSizeErrorCallback error_callback
) {
    if (!session || !image || !card) {
        return reportError(NAIL_SIZE_ERROR_INVALID_INPUT, "Invalid input parameters", error_callback);
    }

    try {
        cv::Mat frame = wrapImage(image);
        if (frame.rows < 100 || frame.cols < 100) {
            return reportError(NAIL_SIZE_ERROR_IMAGE_TOO_SMALL,
                               "Image too small (minimum 100x100 pixels required)", error_callback);
        }

        std::optional<cv::Rect> guideRegion;
        if (guide) {
            guideRegion = cv::Rect(guide->x, guide->y, guide->width, guide->height);
        }

        Outcome<CardDetection> detection = session->detector.detect(frame, guideRegion);
        if (!detection.ok()) {
            return reportError(statusToResult(detection.status()), detection.message(), error_callback);
        }

        convertCard(detection.value(), session->detector.isStable(), session->detector.isLocked(), card);
        return NAIL_SIZE_SUCCESS;

    } catch (const std::invalid_argument& e) {
        return reportError(NAIL_SIZE_ERROR_INVALID_INPUT, e.what(), error_callback);
    } catch (const std::runtime_error& e) {
        return handleRuntimeError(e, error_callback);
    } catch (const std::exception& e) {
        return reportError(NAIL_SIZE_ERROR_PROCESSING_FAILED, e.what(), error_callback);
    }
}

NailSizeResult nail_size_session_accept(NailSizeSession* session) {
    if (!session) return NAIL_SIZE_ERROR_INVALID_INPUT;
    return session->detector.acceptDetection() ? NAIL_SIZE_SUCCESS : NAIL_SIZE_ERROR_REFERENCE_NOT_FOUND;
}

void nail_size_session_unlock(NailSizeSession* session) {
    if (session) {
        session->detector.unlock();
    }
}

bool nail_size_session_is_locked(const NailSizeSession* session) {
    return session && session->detector.isLocked();
}

bool nail_size_session_is_stable(const NailSizeSession* session) {
    return session && session->detector.isStable();
}

NailSizeResult nail_size_measure_hand(
    const NailSizeImage* image,
    const NailSizePoint* landmarks,
    int32_t landmark_count,
    double pixels_per_mm,
    double hand_confidence,
    const NailSizeParams* params,
    NailSizeNail* nails,
    NailSizeErrorCallback error_callback
) {
    if (!image || !landmarks || !nails || landmark_count < NAIL_SIZE_LANDMARK_COUNT) {
        return reportError(NAIL_SIZE_ERROR_INVALID_INPUT, "Invalid input parameters", error_callback);
    }

    NailSizeParams default_params;
    if (!params) {
        nail_size_get_default_params(&default_params);
        params = &default_params;
    }

    NailSizeResult validation_result = nail_size_validate_params(params);
    if (validation_result != NAIL_SIZE_SUCCESS) {
        return reportError(validation_result, "Invalid processing parameters", error_callback);
    }

    if (!(pixels_per_mm >= params->min_pixels_per_mm && pixels_per_mm <= params->max_pixels_per_mm)) {
        return reportError(NAIL_SIZE_ERROR_INVALID_SCALE, "Scale outside the plausible range", error_callback);
    }

    try {
        cv::Mat frame = wrapImage(image);
        NailMeasurer measurer(convertParams(params));

        Outcome<std::vector<NailMeasurement>> hand = measurer.measureHand(
            frame, convertLandmarks(landmarks, landmark_count),
            Calibration{pixels_per_mm, params->reference_width_mm}, hand_confidence);
        if (!hand.ok()) {
            return reportError(statusToResult(hand.status()), hand.message(), error_callback);
        }

        for (size_t i = 0; i < hand.value().size(); i++) {
            convertNail(hand.value()[i], &nails[i]);
        }
        return NAIL_SIZE_SUCCESS;

    } catch (const std::invalid_argument& e) {
        return reportError(NAIL_SIZE_ERROR_INVALID_INPUT, e.what(), error_callback);
    } catch (const std::runtime_error& e) {
        return handleRuntimeError(e, error_callback);
    } catch (const std::exception& e) {
        return reportError(NAIL_SIZE_ERROR_PROCESSING_FAILED, e.what(), error_callback);
    }
}

NailSizeResult nail_size_measure_image(
    const char* input_path,
    const NailSizePoint* landmarks,
    int32_t landmark_count,
    const NailSizeRect* guide,
    const NailSizeParams* params,
    NailSizeHandResult* result,
    NailSizeProgressCallback progress_callback,
    NailSizeErrorCallback error_callback
) {
    if (!input_path || !landmarks || !result || landmark_count < NAIL_SIZE_LANDMARK_COUNT) {
        return reportError(NAIL_SIZE_ERROR_INVALID_INPUT, "Invalid input parameters", error_callback);
    }

    result->nail_count = 0;

    // Check file exists
    std::ifstream file(input_path);
    if (!file.good()) {
        return reportError(NAIL_SIZE_ERROR_FILE_NOT_FOUND, "Input file not found or not readable", error_callback);
    }

    // Validate parameters
    NailSizeParams default_params;
    if (!params) {
        nail_size_get_default_params(&default_params);
        params = &default_params;
    }

    NailSizeResult validation_result = nail_size_validate_params(params);
    if (validation_result != NAIL_SIZE_SUCCESS) {
        return reportError(validation_result, "Invalid processing parameters", error_callback);
    }

    try {
        reportProgress(progress_callback, 0.0, "Starting nail measurement");

        ImageProcessor::ProcessingParams cpp_params = convertParams(params);

        reportProgress(progress_callback, 0.1, "Loading image");
        cv::Mat image = ImageProcessor::loadImage(input_path);

        reportProgress(progress_callback, 0.3, "Detecting reference card");
        CardDetector detector(cpp_params, convertReference(params));
        std::optional<cv::Rect> guideRegion;
        if (guide) {
            guideRegion = cv::Rect(guide->x, guide->y, guide->width, guide->height);
        }

        Outcome<CardDetection> detection = detector.detect(image, guideRegion);
        if (!detection.ok()) {
            return reportError(statusToResult(detection.status()), detection.message(), error_callback);
        }
        convertCard(detection.value(), detector.isStable(), detector.isLocked(), &result->card);

        reportProgress(progress_callback, 0.6, "Measuring nails");
        NailMeasurer measurer(cpp_params);
        Outcome<std::vector<NailMeasurement>> hand = measurer.measureHand(
            image, convertLandmarks(landmarks, landmark_count), detection.value().calibration);
        if (!hand.ok()) {
            return reportError(statusToResult(hand.status()), hand.message(), error_callback);
        }

        reportProgress(progress_callback, 0.9, "Converting measurement data");
        for (size_t i = 0; i < hand.value().size(); i++) {
            convertNail(hand.value()[i], &result->nails[i]);
        }
        result->nail_count = static_cast<int32_t>(hand.value().size());

        reportProgress(progress_callback, 1.0, "Measurement complete");
        return NAIL_SIZE_SUCCESS;

    } catch (const std::invalid_argument& e) {
        return reportError(NAIL_SIZE_ERROR_INVALID_INPUT, e.what(), error_callback);
    } catch (const std::runtime_error& e) {
        return handleRuntimeError(e, error_callback);
    } catch (const std::exception& e) {
        return reportError(NAIL_SIZE_ERROR_PROCESSING_FAILED, e.what(), error_callback);
    }
}

NailSizeResult nail_size_size_to_mm(int32_t size, double* min_mm, double* max_mm, double* average_mm) {
    if (!min_mm || !max_mm || !average_mm) return NAIL_SIZE_ERROR_INVALID_INPUT;

    try {
        SizeBand band = UnitConverter().sizeToMM(size);
        *min_mm = band.minMM;
        *max_mm = band.maxMM;
        *average_mm = band.averageMM;
        return NAIL_SIZE_SUCCESS;
    } catch (const std::out_of_range&) {
        return NAIL_SIZE_ERROR_INVALID_INPUT;
    }
}

const char* nail_size_get_error_message(NailSizeResult error_code) {
    switch (error_code) {
        case NAIL_SIZE_SUCCESS: return "Success";
        case NAIL_SIZE_ERROR_INVALID_INPUT: return "Invalid input parameters";
        case NAIL_SIZE_ERROR_FILE_NOT_FOUND: return "Input file not found or not readable";
        case NAIL_SIZE_ERROR_IMAGE_LOAD_FAILED: return "Failed to load image - check format and file integrity";
        case NAIL_SIZE_ERROR_IMAGE_TOO_SMALL: return "Image too small - minimum 100x100 pixels required";
        case NAIL_SIZE_ERROR_REFERENCE_NOT_FOUND: return "Reference card not found - place the whole card flat in view";
        case NAIL_SIZE_ERROR_INVALID_SCALE: return "Card scale implausible - move the camera closer or further away";
        case NAIL_SIZE_ERROR_INSUFFICIENT_CONTOUR_DATA: return "Not enough edge detail - improve lighting and contrast";
        case NAIL_SIZE_ERROR_BOUNDARY_DETECTION_FAILED: return "Could not find a nail edge - check lighting on the fingertips";
        case NAIL_SIZE_ERROR_INVALID_PARAMETERS: return "Invalid processing parameters - check parameter ranges";
        case NAIL_SIZE_ERROR_PROCESSING_FAILED: return "Image processing failed - see error callback for details";
        default: return "Unknown error";
    }
}

const char* nail_size_get_version(void) {
    return "1.0.0";
}

bool nail_size_is_valid_image_file(const char* file_path) {
    if (!file_path) return false;

    try {
        cv::Mat img = cv::imread(file_path);
        return !img.empty();
    } catch (const cv::Exception& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return false;
    }
}
