#pragma once

#include "ImageProcessor.hpp"
#include "NailBoundaryDetector.hpp"
#include "Types.hpp"
#include "UnitConverter.hpp"
#include <string>
#include <utility>
#include <vector>

namespace NailSize {

struct MeasurementSummary {
    int count = 0;
    double meanMM = 0.0;
    double minMM = 0.0;
    double maxMM = 0.0;
    double meanSize = 0.0;
    int sizeRange = 0;      // largest size minus smallest size
};

struct HandDiagnostics {
    double processingTimeMs = 0.0;
    int digitsMeasured = 0;
};

class NailMeasurer {
public:
    using ProcessingParams = ImageProcessor::ProcessingParams;

    explicit NailMeasurer(const ProcessingParams& params = ProcessingParams(),
                          SizeTable table = SizeTable::defaultNailTable());

    // Measures all five nails of one hand, thumb first. Any digit that fails
    // fails the whole hand.
    Outcome<std::vector<NailMeasurement>> measureHand(const cv::Mat& image,
                                                      const std::vector<cv::Point2f>& landmarks,
                                                      const Calibration& calibration,
                                                      double handConfidence = 1.0);

    Outcome<NailMeasurement> measureDigit(const cv::Mat& grayImg,
                                          const Fingertip& finger,
                                          const Calibration& calibration,
                                          double handConfidence = 1.0) const;

    // Human-readable plausibility warnings; nothing is rejected
    static std::vector<std::string> reviewMeasurements(const std::vector<NailMeasurement>& measurements);

    static MeasurementSummary summarize(const std::vector<NailMeasurement>& measurements);

    static std::string formatReport(const std::vector<NailMeasurement>& left,
                                    const std::vector<NailMeasurement>& right);

    // Sizes commonly seen on each digit, inclusive
    static std::pair<int, int> typicalSizeRange(Digit digit);

    const UnitConverter& converter() const { return converter_; }
    // Timing and progress of the last measureHand call
    const HandDiagnostics& diagnostics() const { return diagnostics_; }

private:
    ProcessingParams params_;
    UnitConverter converter_;
    HandDiagnostics diagnostics_;
};

} // namespace NailSize
