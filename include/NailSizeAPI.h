#ifndef NAIL_SIZE_API_H
#define NAIL_SIZE_API_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stdbool.h>

// Version information
#define NAIL_SIZE_VERSION_MAJOR 1
#define NAIL_SIZE_VERSION_MINOR 0
#define NAIL_SIZE_VERSION_PATCH 0

#define NAIL_SIZE_LANDMARK_COUNT 21
#define NAIL_SIZE_NAIL_COUNT 5

// Error codes for Swift/Kotlin integration
typedef enum {
    NAIL_SIZE_SUCCESS = 0,
    NAIL_SIZE_ERROR_INVALID_INPUT = -1,
    NAIL_SIZE_ERROR_FILE_NOT_FOUND = -2,
    NAIL_SIZE_ERROR_IMAGE_LOAD_FAILED = -3,
    NAIL_SIZE_ERROR_IMAGE_TOO_SMALL = -4,
    NAIL_SIZE_ERROR_REFERENCE_NOT_FOUND = -5,
    NAIL_SIZE_ERROR_INVALID_SCALE = -6,
    NAIL_SIZE_ERROR_INSUFFICIENT_CONTOUR_DATA = -7,
    NAIL_SIZE_ERROR_BOUNDARY_DETECTION_FAILED = -8,
    NAIL_SIZE_ERROR_INVALID_PARAMETERS = -9,
    NAIL_SIZE_ERROR_PROCESSING_FAILED = -10
} NailSizeResult;

// Processing parameters structure
typedef struct {
    // Edge detection and contour tracing
    double edge_threshold;          // Sobel magnitude threshold (default: 40.0)
    int32_t max_contour_points;     // Point cap per traced contour (default: 20000)
    int32_t min_contour_length;     // Shorter contours are discarded (default: 200)
    int32_t max_contours;           // Longest contours kept (default: 5)

    // Reference object (ID-1 payment card)
    double reference_width_mm;      // Physical card width (default: 85.6)
    double reference_height_mm;     // Physical card height (default: 53.98)
    double aspect_tolerance;        // Relative aspect ratio tolerance (default: 0.30)

    // Card size filters
    double min_guide_fill;          // Card width / guide width (default: 0.50)
    double max_guide_fill;          // (default: 1.15)
    double min_frame_fill;          // Card width / frame width without a guide (default: 0.20)
    double max_frame_fill;          // (default: 0.60)

    // Temporal smoothing and lock
    int32_t smoothing_window;       // Detections averaged (default: 5)
    int32_t stable_frame_count;     // Consecutive agreeing detections for stability (default: 3)
    double stable_epsilon_px;       // Max corner movement between agreeing detections (default: 12.0)
    double lock_padding_fraction;   // Search region padding around a locked card (default: 0.25)

    // Scale plausibility
    double min_pixels_per_mm;       // (default: 2.0)
    double max_pixels_per_mm;       // (default: 50.0)

    // Nail boundary scan
    double nail_brightness_fraction; // Threshold fraction of tip brightness (default: 0.80)
    double skin_brightness_multiple; // Threshold multiple of skin brightness (default: 1.10)
    int32_t max_scan_distance_px;   // Scan cap each side of the tip (default: 80)
    int32_t min_nail_width_px;      // Narrower boundaries are failures (default: 10)

    // Unit conversion
    double curvature_multiplier;    // Curved width / chord width (default: 1.06)

    // Debug visualization
    bool enable_debug_output;       // Enable debug image output (default: false)
    bool verbose_output;            // Console logging (default: false)
} NailSizeParams;

typedef enum {
    NAIL_SIZE_PIXEL_GRAY = 0,
    NAIL_SIZE_PIXEL_BGR,
    NAIL_SIZE_PIXEL_BGRA,
    NAIL_SIZE_PIXEL_RGB,
    NAIL_SIZE_PIXEL_RGBA
} NailSizePixelFormat;

// Caller-owned 8-bit pixel buffer, read only
typedef struct {
    const uint8_t* data;
    int32_t width;
    int32_t height;
    int32_t stride;                 // Bytes per row, 0 for tightly packed
    NailSizePixelFormat format;
} NailSizeImage;

typedef struct {
    double x;
    double y;
} NailSizePoint;

typedef struct {
    int32_t x;
    int32_t y;
    int32_t width;
    int32_t height;
} NailSizeRect;

typedef struct {
    NailSizePoint corners[4];       // Top-left, top-right, bottom-right, bottom-left
    double width_px;
    double height_px;
    double aspect_ratio;
    double score;
    double pixels_per_mm;
    bool stable;
    bool locked;
} NailSizeCard;

typedef struct {
    int32_t digit;                  // 0 thumb .. 4 pinky
    double width_px;
    double chord_mm;
    double curved_mm;
    int32_t size;
    double confidence;
} NailSizeNail;

typedef struct {
    NailSizeCard card;
    NailSizeNail nails[NAIL_SIZE_NAIL_COUNT];
    int32_t nail_count;
} NailSizeHandResult;

// Card detection session; one per camera stream, not thread safe
typedef struct NailSizeSession NailSizeSession;

// Progress callback function type for UI progress tracking
typedef void (*NailSizeProgressCallback)(double progress, const char* stage);

// Error callback function type for detailed error reporting
typedef void (*NailSizeErrorCallback)(NailSizeResult error_code, const char* error_message);

// Core API Functions

/**
 * Get default processing parameters
 * @param params Pointer to parameters structure to fill
 */
void nail_size_get_default_params(NailSizeParams* params);

/**
 * Validate processing parameters
 * @param params Pointer to parameters to validate
 * @return NAIL_SIZE_SUCCESS if valid, NAIL_SIZE_ERROR_INVALID_PARAMETERS otherwise
 */
NailSizeResult nail_size_validate_params(const NailSizeParams* params);

/**
 * Create a card detection session
 * @param params Processing parameters (defaults if NULL)
 * @return Session handle (free with nail_size_session_destroy), NULL if params are invalid
 */
NailSizeSession* nail_size_session_create(const NailSizeParams* params);

void nail_size_session_destroy(NailSizeSession* session);

/**
 * Detect the reference card in one frame. Searches the whole frame (or guide)
 * while unlocked and only around the accepted card while locked; a failed
 * locked frame unlocks the session.
 * @param session Session handle
 * @param image Frame pixels
 * @param guide Optional guide rectangle the card should fill (NULL for none)
 * @param card Filled on success
 * @param error_callback Optional error callback
 * @return NAIL_SIZE_SUCCESS or one failure code
 */
NailSizeResult nail_size_session_detect_card(
    NailSizeSession* session,
    const NailSizeImage* image,
    const NailSizeRect* guide,
    NailSizeCard* card,
    NailSizeErrorCallback error_callback
);

/**
 * Accept the current smoothed card and lock onto it
 * @return NAIL_SIZE_SUCCESS, or NAIL_SIZE_ERROR_REFERENCE_NOT_FOUND with nothing to lock
 */
NailSizeResult nail_size_session_accept(NailSizeSession* session);

void nail_size_session_unlock(NailSizeSession* session);
bool nail_size_session_is_locked(const NailSizeSession* session);
bool nail_size_session_is_stable(const NailSizeSession* session);

/**
 * Measure the five nails of one hand in a frame with a known scale
 * @param image Frame pixels
 * @param landmarks Hand landmarks in pixel coordinates (at least NAIL_SIZE_LANDMARK_COUNT)
 * @param landmark_count Number of landmarks
 * @param pixels_per_mm Scale from card detection
 * @param hand_confidence Landmark estimator confidence, 0-1
 * @param params Processing parameters (defaults if NULL)
 * @param nails Array of NAIL_SIZE_NAIL_COUNT entries filled thumb first
 * @param error_callback Optional error callback
 */
NailSizeResult nail_size_measure_hand(
    const NailSizeImage* image,
    const NailSizePoint* landmarks,
    int32_t landmark_count,
    double pixels_per_mm,
    double hand_confidence,
    const NailSizeParams* params,
    NailSizeNail* nails,
    NailSizeErrorCallback error_callback
);

/**
 * Complete processing: photo file to card, scale and nail sizes in one call
 * @param input_path Path to input image file
 * @param landmarks Hand landmarks in pixel coordinates
 * @param landmark_count Number of landmarks
 * @param guide Optional guide rectangle (NULL for none)
 * @param params Processing parameters (defaults if NULL)
 * @param result Filled on success
 * @param progress_callback Optional progress callback for UI updates
 * @param error_callback Optional error callback for detailed error reporting
 * @return NAIL_SIZE_SUCCESS if successful, error code otherwise
 */
NailSizeResult nail_size_measure_image(
    const char* input_path,
    const NailSizePoint* landmarks,
    int32_t landmark_count,
    const NailSizeRect* guide,
    const NailSizeParams* params,
    NailSizeHandResult* result,
    NailSizeProgressCallback progress_callback,
    NailSizeErrorCallback error_callback
);

// Utility functions

/**
 * Look up the millimetre band of a nail size in the default table
 * @return NAIL_SIZE_SUCCESS, or NAIL_SIZE_ERROR_INVALID_INPUT for an unknown size
 */
NailSizeResult nail_size_size_to_mm(int32_t size, double* min_mm, double* max_mm, double* average_mm);

/**
 * Get human-readable error message for error code
 * @param error_code Error code from NailSizeResult
 * @return Static string describing the error (do not free)
 */
const char* nail_size_get_error_message(NailSizeResult error_code);

/**
 * Get library version string
 * @return Static version string in format "major.minor.patch" (do not free)
 */
const char* nail_size_get_version(void);

/**
 * Check if input file appears to be a valid image
 * @param file_path Path to image file
 * @return true if file appears to be a valid image, false otherwise
 */
bool nail_size_is_valid_image_file(const char* file_path);

#ifdef __cplusplus
}
#endif

#endif // NAIL_SIZE_API_H
