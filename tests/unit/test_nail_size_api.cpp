/**
 * @file test_nail_size_api.cpp
 * @brief Tests for the C interface: parameters, sessions and one-shot measurement
 */

#include <gtest/gtest.h>

#include "NailSizeAPI.h"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>
#include <vector>

namespace {
    NailSizeResult g_lastError = NAIL_SIZE_SUCCESS;
    std::string g_lastMessage;
    double g_lastProgress = -1.0;

    void RecordError(NailSizeResult code, const char* message) {
        g_lastError = code;
        g_lastMessage = message ? message : "";
    }

    void RecordProgress(double progress, const char*) {
        g_lastProgress = progress;
    }

    NailSizeImage WrapImage(const cv::Mat& img, NailSizePixelFormat format) {
        NailSizeImage image;
        image.data = img.data;
        image.width = img.cols;
        image.height = img.rows;
        image.stride = static_cast<int32_t>(img.step);
        image.format = format;
        return image;
    }

    cv::Mat CreateCardScene(const cv::Rect& card) {
        cv::Mat img(480, 640, CV_8UC3, cv::Scalar(60, 60, 60));
        cv::rectangle(img, card, cv::Scalar(235, 235, 235), cv::FILLED);
        return img;
    }

    const int kPatchX[5] = {63, 218, 365, 520, 675};
    const int kPatchWidth[5] = {75, 65, 70, 60, 50};

    // Card at 5 pixels/mm with five nail bands below it
    cv::Mat CreateHandScene() {
        cv::Mat img(700, 1000, CV_8UC3, cv::Scalar(60, 60, 60));
        cv::rectangle(img, cv::Rect(40, 40, 427, 269), cv::Scalar(235, 235, 235), cv::FILLED);
        for (int i = 0; i < 5; i++) {
            cv::rectangle(img, cv::Rect(kPatchX[i], 450, kPatchWidth[i], 61), cv::Scalar(230, 230, 230), cv::FILLED);
        }
        return img;
    }

    std::vector<NailSizePoint> CreateLandmarks() {
        std::vector<NailSizePoint> landmarks(NAIL_SIZE_LANDMARK_COUNT, NailSizePoint{500.0, 650.0});
        const int tips[5] = {4, 8, 12, 16, 20};
        for (int i = 0; i < 5; i++) {
            double cx = kPatchX[i] + kPatchWidth[i] / 2;
            landmarks[tips[i]] = NailSizePoint{cx, 480.0};
            landmarks[tips[i] - 3] = NailSizePoint{cx, 560.0};
        }
        return landmarks;
    }
}

// ============================================================================
// Parameters and utilities
// ============================================================================

TEST(NailSizeAPITest, DefaultParamsAreValid) {
    NailSizeParams params;
    nail_size_get_default_params(&params);

    EXPECT_EQ(nail_size_validate_params(&params), NAIL_SIZE_SUCCESS);
    EXPECT_DOUBLE_EQ(params.reference_width_mm, 85.6);
    EXPECT_DOUBLE_EQ(params.reference_height_mm, 53.98);
    EXPECT_DOUBLE_EQ(params.curvature_multiplier, 1.06);
    EXPECT_EQ(params.smoothing_window, 5);
    EXPECT_EQ(params.stable_frame_count, 3);
    EXPECT_FALSE(params.verbose_output);
}

TEST(NailSizeAPITest, RejectsInvalidParams) {
    EXPECT_EQ(nail_size_validate_params(nullptr), NAIL_SIZE_ERROR_INVALID_PARAMETERS);

    NailSizeParams params;
    nail_size_get_default_params(&params);
    params.min_pixels_per_mm = params.max_pixels_per_mm;
    EXPECT_EQ(nail_size_validate_params(&params), NAIL_SIZE_ERROR_INVALID_PARAMETERS);

    nail_size_get_default_params(&params);
    params.curvature_multiplier = 0.9;
    EXPECT_EQ(nail_size_validate_params(&params), NAIL_SIZE_ERROR_INVALID_PARAMETERS);

    nail_size_get_default_params(&params);
    params.smoothing_window = 0;
    EXPECT_EQ(nail_size_validate_params(&params), NAIL_SIZE_ERROR_INVALID_PARAMETERS);
    EXPECT_EQ(nail_size_session_create(&params), nullptr);
}

TEST(NailSizeAPITest, RejectsNaNParams) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    NailSizeParams params;

    nail_size_get_default_params(&params);
    params.aspect_tolerance = nan;
    EXPECT_EQ(nail_size_validate_params(&params), NAIL_SIZE_ERROR_INVALID_PARAMETERS);
    EXPECT_EQ(nail_size_session_create(&params), nullptr);

    nail_size_get_default_params(&params);
    params.lock_padding_fraction = nan;
    EXPECT_EQ(nail_size_validate_params(&params), NAIL_SIZE_ERROR_INVALID_PARAMETERS);

    nail_size_get_default_params(&params);
    params.edge_threshold = nan;
    EXPECT_EQ(nail_size_validate_params(&params), NAIL_SIZE_ERROR_INVALID_PARAMETERS);

    nail_size_get_default_params(&params);
    params.max_pixels_per_mm = nan;
    EXPECT_EQ(nail_size_validate_params(&params), NAIL_SIZE_ERROR_INVALID_PARAMETERS);

    nail_size_get_default_params(&params);
    params.curvature_multiplier = nan;
    EXPECT_EQ(nail_size_validate_params(&params), NAIL_SIZE_ERROR_INVALID_PARAMETERS);
}

TEST(NailSizeAPITest, ErrorMessagesAndVersion) {
    const NailSizeResult codes[] = {
        NAIL_SIZE_SUCCESS, NAIL_SIZE_ERROR_INVALID_INPUT, NAIL_SIZE_ERROR_FILE_NOT_FOUND,
        NAIL_SIZE_ERROR_IMAGE_LOAD_FAILED, NAIL_SIZE_ERROR_IMAGE_TOO_SMALL,
        NAIL_SIZE_ERROR_REFERENCE_NOT_FOUND, NAIL_SIZE_ERROR_INVALID_SCALE,
        NAIL_SIZE_ERROR_INSUFFICIENT_CONTOUR_DATA, NAIL_SIZE_ERROR_BOUNDARY_DETECTION_FAILED,
        NAIL_SIZE_ERROR_INVALID_PARAMETERS, NAIL_SIZE_ERROR_PROCESSING_FAILED,
    };
    for (NailSizeResult code : codes) {
        EXPECT_STRNE(nail_size_get_error_message(code), "Unknown error") << code;
    }
    EXPECT_STREQ(nail_size_get_version(), "1.0.0");
}

TEST(NailSizeAPITest, SizeToMillimetres) {
    double minMM = 0.0, maxMM = 0.0, avgMM = 0.0;
    ASSERT_EQ(nail_size_size_to_mm(1, &minMM, &maxMM, &avgMM), NAIL_SIZE_SUCCESS);
    EXPECT_DOUBLE_EQ(minMM, 15.0);
    EXPECT_DOUBLE_EQ(maxMM, 16.0);
    EXPECT_DOUBLE_EQ(avgMM, 15.5);

    EXPECT_EQ(nail_size_size_to_mm(99, &minMM, &maxMM, &avgMM), NAIL_SIZE_ERROR_INVALID_INPUT);
    EXPECT_EQ(nail_size_size_to_mm(1, nullptr, &maxMM, &avgMM), NAIL_SIZE_ERROR_INVALID_INPUT);
}

TEST(NailSizeAPITest, ValidImageFileCheck) {
    EXPECT_FALSE(nail_size_is_valid_image_file(nullptr));
    EXPECT_FALSE(nail_size_is_valid_image_file("/nonexistent/hand.png"));
}

// ============================================================================
// Sessions
// ============================================================================

TEST(NailSizeAPITest, SessionDetectsAcceptsAndLosesCard) {
    NailSizeSession* session = nail_size_session_create(nullptr);
    ASSERT_NE(session, nullptr);

    cv::Mat bgr = CreateCardScene(cv::Rect(100, 100, 256, 161));
    cv::Mat rgba;
    cv::cvtColor(bgr, rgba, cv::COLOR_BGR2RGBA);
    NailSizeImage frame = WrapImage(rgba, NAIL_SIZE_PIXEL_RGBA);

    EXPECT_EQ(nail_size_session_accept(session), NAIL_SIZE_ERROR_REFERENCE_NOT_FOUND);

    NailSizeCard card;
    ASSERT_EQ(nail_size_session_detect_card(session, &frame, nullptr, &card, nullptr), NAIL_SIZE_SUCCESS);
    EXPECT_NEAR(card.pixels_per_mm, 3.0, 0.05);
    EXPECT_NEAR(card.corners[0].x, 99.0, 1.0);
    EXPECT_FALSE(card.locked);

    ASSERT_EQ(nail_size_session_accept(session), NAIL_SIZE_SUCCESS);
    EXPECT_TRUE(nail_size_session_is_locked(session));

    ASSERT_EQ(nail_size_session_detect_card(session, &frame, nullptr, &card, nullptr), NAIL_SIZE_SUCCESS);
    EXPECT_TRUE(card.locked);

    cv::Mat blank(480, 640, CV_8UC4, cv::Scalar(60, 60, 60, 255));
    NailSizeImage empty = WrapImage(blank, NAIL_SIZE_PIXEL_RGBA);
    g_lastError = NAIL_SIZE_SUCCESS;
    EXPECT_EQ(nail_size_session_detect_card(session, &empty, nullptr, &card, RecordError),
              NAIL_SIZE_ERROR_INSUFFICIENT_CONTOUR_DATA);
    EXPECT_EQ(g_lastError, NAIL_SIZE_ERROR_INSUFFICIENT_CONTOUR_DATA);
    EXPECT_FALSE(nail_size_session_is_locked(session));
    EXPECT_FALSE(nail_size_session_is_stable(session));

    nail_size_session_destroy(session);
}

TEST(NailSizeAPITest, SessionReportsStability) {
    NailSizeSession* session = nail_size_session_create(nullptr);
    ASSERT_NE(session, nullptr);

    cv::Mat bgr = CreateCardScene(cv::Rect(100, 100, 256, 161));
    NailSizeImage frame = WrapImage(bgr, NAIL_SIZE_PIXEL_BGR);
    NailSizeCard card;
    for (int i = 0; i < 3; i++) {
        ASSERT_EQ(nail_size_session_detect_card(session, &frame, nullptr, &card, nullptr), NAIL_SIZE_SUCCESS);
    }
    EXPECT_TRUE(card.stable);
    EXPECT_TRUE(nail_size_session_is_stable(session));

    nail_size_session_destroy(session);
}

TEST(NailSizeAPITest, SessionRejectsBadInput) {
    NailSizeSession* session = nail_size_session_create(nullptr);
    ASSERT_NE(session, nullptr);
    NailSizeCard card;

    EXPECT_EQ(nail_size_session_detect_card(session, nullptr, nullptr, &card, nullptr),
              NAIL_SIZE_ERROR_INVALID_INPUT);

    cv::Mat tiny(50, 50, CV_8UC1, cv::Scalar(0));
    NailSizeImage small = WrapImage(tiny, NAIL_SIZE_PIXEL_GRAY);
    EXPECT_EQ(nail_size_session_detect_card(session, &small, nullptr, &card, nullptr),
              NAIL_SIZE_ERROR_IMAGE_TOO_SMALL);

    NailSizeImage noPixels = small;
    noPixels.data = nullptr;
    EXPECT_EQ(nail_size_session_detect_card(session, &noPixels, nullptr, &card, nullptr),
              NAIL_SIZE_ERROR_INVALID_INPUT);

    EXPECT_FALSE(nail_size_session_is_locked(nullptr));
    nail_size_session_destroy(session);
}

// ============================================================================
// Measurement
// ============================================================================

TEST(NailSizeAPITest, MeasureHandFromBuffer) {
    cv::Mat scene = CreateHandScene();
    NailSizeImage frame = WrapImage(scene, NAIL_SIZE_PIXEL_BGR);
    std::vector<NailSizePoint> landmarks = CreateLandmarks();
    NailSizeNail nails[NAIL_SIZE_NAIL_COUNT];

    ASSERT_EQ(nail_size_measure_hand(&frame, landmarks.data(), NAIL_SIZE_LANDMARK_COUNT, 5.0, 0.9,
                                     nullptr, nails, nullptr),
              NAIL_SIZE_SUCCESS);
    EXPECT_EQ(nails[0].digit, 0);
    EXPECT_EQ(nails[0].size, 1);
    EXPECT_NEAR(nails[0].curved_mm, 15.9, 1e-9);
    EXPECT_NEAR(nails[0].confidence, 0.9, 1e-9);
    EXPECT_EQ(nails[4].digit, 4);
    EXPECT_EQ(nails[4].size, 6);

    EXPECT_EQ(nail_size_measure_hand(&frame, landmarks.data(), NAIL_SIZE_LANDMARK_COUNT, 0.5, 1.0,
                                     nullptr, nails, nullptr),
              NAIL_SIZE_ERROR_INVALID_SCALE);
    EXPECT_EQ(nail_size_measure_hand(&frame, landmarks.data(), 20, 5.0, 1.0, nullptr, nails, nullptr),
              NAIL_SIZE_ERROR_INVALID_INPUT);
    EXPECT_EQ(nail_size_measure_hand(&frame, landmarks.data(), NAIL_SIZE_LANDMARK_COUNT, 5.0, 2.0,
                                     nullptr, nails, nullptr),
              NAIL_SIZE_ERROR_INVALID_INPUT);

    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ(nail_size_measure_hand(&frame, landmarks.data(), NAIL_SIZE_LANDMARK_COUNT, nan, 1.0,
                                     nullptr, nails, nullptr),
              NAIL_SIZE_ERROR_INVALID_SCALE);
    EXPECT_EQ(nail_size_measure_hand(&frame, landmarks.data(), NAIL_SIZE_LANDMARK_COUNT, 5.0, nan,
                                     nullptr, nails, nullptr),
              NAIL_SIZE_ERROR_INVALID_INPUT);
}

TEST(NailSizeAPITest, MeasureImageEndToEnd) {
    std::filesystem::path path = std::filesystem::temp_directory_path() / "nailsize_hand.png";
    ASSERT_TRUE(cv::imwrite(path.string(), CreateHandScene()));
    std::vector<NailSizePoint> landmarks = CreateLandmarks();

    NailSizeHandResult result;
    g_lastProgress = -1.0;
    NailSizeResult code = nail_size_measure_image(path.string().c_str(), landmarks.data(),
                                                  NAIL_SIZE_LANDMARK_COUNT, nullptr, nullptr, &result,
                                                  RecordProgress, RecordError);
    std::filesystem::remove(path);

    ASSERT_EQ(code, NAIL_SIZE_SUCCESS) << g_lastMessage;
    EXPECT_DOUBLE_EQ(g_lastProgress, 1.0);
    EXPECT_NEAR(result.card.pixels_per_mm, 5.0, 0.01);
    ASSERT_EQ(result.nail_count, NAIL_SIZE_NAIL_COUNT);

    const int expectedSizes[NAIL_SIZE_NAIL_COUNT] = {1, 3, 2, 4, 6};
    for (int i = 0; i < NAIL_SIZE_NAIL_COUNT; i++) {
        EXPECT_EQ(result.nails[i].digit, i);
        EXPECT_EQ(result.nails[i].size, expectedSizes[i]);
    }
}

TEST(NailSizeAPITest, MeasureImageFailures) {
    std::vector<NailSizePoint> landmarks = CreateLandmarks();
    NailSizeHandResult result;

    EXPECT_EQ(nail_size_measure_image(nullptr, landmarks.data(), NAIL_SIZE_LANDMARK_COUNT, nullptr, nullptr,
                                      &result, nullptr, nullptr),
              NAIL_SIZE_ERROR_INVALID_INPUT);
    EXPECT_EQ(nail_size_measure_image("/nonexistent/hand.png", landmarks.data(), NAIL_SIZE_LANDMARK_COUNT,
                                      nullptr, nullptr, &result, nullptr, nullptr),
              NAIL_SIZE_ERROR_FILE_NOT_FOUND);

    std::filesystem::path corrupt = std::filesystem::temp_directory_path() / "nailsize_corrupt.png";
    {
        std::ofstream out(corrupt.string());
        out << "not an image";
    }
    EXPECT_EQ(nail_size_measure_image(corrupt.string().c_str(), landmarks.data(), NAIL_SIZE_LANDMARK_COUNT,
                                      nullptr, nullptr, &result, nullptr, nullptr),
              NAIL_SIZE_ERROR_IMAGE_LOAD_FAILED);
    std::filesystem::remove(corrupt);

    NailSizeParams params;
    nail_size_get_default_params(&params);
    params.max_contours = 0;
    std::filesystem::path blank = std::filesystem::temp_directory_path() / "nailsize_blank.png";
    ASSERT_TRUE(cv::imwrite(blank.string(), cv::Mat(480, 640, CV_8UC3, cv::Scalar(60, 60, 60))));
    EXPECT_EQ(nail_size_measure_image(blank.string().c_str(), landmarks.data(), NAIL_SIZE_LANDMARK_COUNT,
                                      nullptr, &params, &result, nullptr, nullptr),
              NAIL_SIZE_ERROR_INVALID_PARAMETERS);
    EXPECT_EQ(nail_size_measure_image(blank.string().c_str(), landmarks.data(), NAIL_SIZE_LANDMARK_COUNT,
                                      nullptr, nullptr, &result, nullptr, nullptr),
              NAIL_SIZE_ERROR_INSUFFICIENT_CONTOUR_DATA);
    EXPECT_EQ(result.nail_count, 0);
    std::filesystem::remove(blank);
}
