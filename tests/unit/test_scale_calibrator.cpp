/**
 * @file test_scale_calibrator.cpp
 * @brief Unit tests for pixels-per-millimetre calibration
 */

#include <gtest/gtest.h>

#include "ScaleCalibrator.hpp"

#include <stdexcept>

using namespace NailSize;

TEST(ScaleCalibratorTest, DividesWidthByKnownWidth) {
    auto result = ScaleCalibrator::calibrate(428.0, 85.6, ImageProcessor::ProcessingParams());

    ASSERT_TRUE(result.ok());
    EXPECT_NEAR(result.value().pixelsPerMM, 5.0, 1e-9);
    EXPECT_DOUBLE_EQ(result.value().referenceWidthMM, 85.6);
}

TEST(ScaleCalibratorTest, UsesReferenceWidthForCards) {
    CardCandidate card;
    card.width = 856.0;
    auto result = ScaleCalibrator::calibrate(card, ReferenceObjectSpec::creditCard(),
                                             ImageProcessor::ProcessingParams());

    ASSERT_TRUE(result.ok());
    EXPECT_NEAR(result.value().pixelsPerMM, 10.0, 1e-9);
}

TEST(ScaleCalibratorTest, RejectsImplausibleScales) {
    ImageProcessor::ProcessingParams params;

    auto tooFar = ScaleCalibrator::calibrate(100.0, 85.6, params);
    EXPECT_FALSE(tooFar.ok());
    EXPECT_EQ(tooFar.status(), Status::InvalidScale);
    EXPECT_FALSE(tooFar.message().empty());

    auto tooClose = ScaleCalibrator::calibrate(5000.0, 85.6, params);
    EXPECT_EQ(tooClose.status(), Status::InvalidScale);

    auto zero = ScaleCalibrator::calibrate(0.0, 85.6, params);
    EXPECT_EQ(zero.status(), Status::InvalidScale);
}

TEST(ScaleCalibratorTest, RangeBoundsAreInclusive) {
    ImageProcessor::ProcessingParams params;
    EXPECT_TRUE(ScaleCalibrator::calibrate(20.0, 10.0, params).ok());
    EXPECT_TRUE(ScaleCalibrator::calibrate(500.0, 10.0, params).ok());
    EXPECT_FALSE(ScaleCalibrator::calibrate(19.9, 10.0, params).ok());
    EXPECT_FALSE(ScaleCalibrator::calibrate(500.1, 10.0, params).ok());
}

TEST(ScaleCalibratorTest, KnownWidthMustBePositive) {
    ImageProcessor::ProcessingParams params;
    EXPECT_THROW(ScaleCalibrator::calibrate(428.0, 0.0, params), std::invalid_argument);
    EXPECT_THROW(ScaleCalibrator::calibrate(428.0, -85.6, params), std::invalid_argument);
}
