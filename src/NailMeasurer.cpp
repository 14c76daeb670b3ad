#include "NailMeasurer.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <algorithm>
#include <cmath>

using namespace cv;
using namespace std;

namespace NailSize {

namespace {

string formatMM(double mm) {
    ostringstream out;
    out << fixed << setprecision(1) << mm;
    return out.str();
}

} // namespace

NailMeasurer::NailMeasurer(const ProcessingParams& params, SizeTable table)
    : params_(params), converter_(std::move(table), params.curvatureMultiplier) {}

Outcome<vector<NailMeasurement>> NailMeasurer::measureHand(const Mat& image,
                                                           const vector<Point2f>& landmarks,
                                                           const Calibration& calibration,
                                                           double handConfidence) {
    TickMeter timer;
    timer.start();
    diagnostics_ = HandDiagnostics();

    FingertipSet fingertips = FingertipSet::fromLandmarks(landmarks);
    Mat gray = ImageProcessor::convertToGrayscale(image);

    Mat debugImg;
    if (params_.enableDebugOutput) {
        cvtColor(gray, debugImg, COLOR_GRAY2BGR);
    }

    vector<NailMeasurement> measurements;
    for (const Fingertip& finger : fingertips.fingers) {
        Outcome<NailMeasurement> measurement = measureDigit(gray, finger, calibration, handConfidence);
        if (!measurement.ok()) {
            if (params_.verboseOutput) {
                cout << "[WARN] " << digitName(finger.digit) << " failed: " << measurement.message() << endl;
            }
            ImageProcessor::flushDebugStack(params_);
            timer.stop();
            diagnostics_.processingTimeMs = timer.getTimeMilli();
            return Failure{measurement.status(),
                           string(digitName(finger.digit)) + ": " + measurement.message()};
        }
        measurements.push_back(measurement.value());
        diagnostics_.digitsMeasured++;

        if (!debugImg.empty()) {
            circle(debugImg, finger.tip, 4, Scalar(0, 0, 255), -1);
            circle(debugImg, finger.base, cvRound(params_.skinRingRadiusPx), Scalar(255, 0, 0), 1);
            int halfWidth = cvRound(measurement.value().widthPixels / 2.0);
            Point tip(cvRound(finger.tip.x), cvRound(finger.tip.y));
            line(debugImg, Point(tip.x - halfWidth, tip.y), Point(tip.x + halfWidth, tip.y),
                 Scalar(0, 255, 0), 2);
        }
    }

    ImageProcessor::pushDebugImage(debugImg, "nail_scans", params_);
    ImageProcessor::flushDebugStack(params_);

    timer.stop();
    diagnostics_.processingTimeMs = timer.getTimeMilli();
    if (params_.verboseOutput) {
        cout << "[INFO] Measured " << diagnostics_.digitsMeasured << " nails in "
             << diagnostics_.processingTimeMs << " ms" << endl;
    }
    return measurements;
}

Outcome<NailMeasurement> NailMeasurer::measureDigit(const Mat& grayImg,
                                                    const Fingertip& finger,
                                                    const Calibration& calibration,
                                                    double handConfidence) const {
    if (!(handConfidence >= 0.0 && handConfidence <= 1.0)) {
        throw invalid_argument("Hand confidence must be between 0 and 1");
    }

    Outcome<NailBoundary> boundary = NailBoundaryDetector::detect(grayImg, finger.tip, finger.base, params_);
    if (!boundary.ok()) {
        return boundary.failure();
    }

    NailMeasurement measurement = converter_.convert(finger.digit, boundary.value().widthPixels, calibration,
                                                     boundary.value().confidence * handConfidence);

    if (params_.verboseOutput) {
        cout << "[INFO] " << digitName(finger.digit) << ": " << measurement.widthPixels << "px, "
             << formatMM(measurement.chordMM) << "mm chord, " << formatMM(measurement.curvedMM)
             << "mm curved, size " << measurement.size << endl;
    }
    return measurement;
}

pair<int, int> NailMeasurer::typicalSizeRange(Digit digit) {
    switch (digit) {
        case Digit::Thumb: return {0, 2};
        case Digit::Index: return {3, 5};
        case Digit::Middle: return {4, 6};
        case Digit::Ring: return {6, 8};
        case Digit::Pinky: return {8, 11};
        default: throw invalid_argument("Unknown digit");
    }
}

vector<string> NailMeasurer::reviewMeasurements(const vector<NailMeasurement>& measurements) {
    vector<string> issues;

    if (measurements.size() != FingertipSet::kTipIndices.size()) {
        issues.push_back("Expected 5 nail measurements, got " + to_string(measurements.size()));
        return issues;
    }

    for (const auto& m : measurements) {
        if (!UnitConverter::isPlausibleNailMM(m.curvedMM)) {
            issues.push_back(string(digitName(m.digit)) + ": " + formatMM(m.curvedMM) +
                             "mm is outside the plausible 5-20mm range");
        }

        auto [minSize, maxSize] = typicalSizeRange(m.digit);
        if (m.size < minSize - 2 || m.size > maxSize + 2) {
            issues.push_back(string(digitName(m.digit)) + ": size " + to_string(m.size) +
                             " is unusual for this finger (typical " + to_string(minSize) + "-" +
                             to_string(maxSize) + ")");
        }
    }
    return issues;
}

MeasurementSummary NailMeasurer::summarize(const vector<NailMeasurement>& measurements) {
    if (measurements.empty()) {
        throw invalid_argument("Cannot summarize an empty measurement list");
    }

    MeasurementSummary summary;
    summary.count = static_cast<int>(measurements.size());
    summary.minMM = measurements.front().curvedMM;
    summary.maxMM = measurements.front().curvedMM;
    int minSize = measurements.front().size;
    int maxSize = measurements.front().size;

    double mmTotal = 0.0, sizeTotal = 0.0;
    for (const auto& m : measurements) {
        mmTotal += m.curvedMM;
        sizeTotal += m.size;
        summary.minMM = min(summary.minMM, m.curvedMM);
        summary.maxMM = max(summary.maxMM, m.curvedMM);
        minSize = min(minSize, m.size);
        maxSize = max(maxSize, m.size);
    }

    summary.meanMM = mmTotal / summary.count;
    summary.meanSize = sizeTotal / summary.count;
    summary.sizeRange = maxSize - minSize;
    return summary;
}

string NailMeasurer::formatReport(const vector<NailMeasurement>& left, const vector<NailMeasurement>& right) {
    ostringstream report;
    report << "My Nail Sizes\n";

    auto writeHand = [&report](const char* title, const vector<NailMeasurement>& hand) {
        report << "\n" << title << "\n";
        if (hand.empty()) {
            report << "(not measured)\n";
            return;
        }
        for (const auto& nail : hand) {
            report << digitName(nail.digit) << ": Size " << nail.size << " (" << formatMM(nail.curvedMM) << "mm)\n";
        }
    };

    writeHand("LEFT HAND", left);
    writeHand("RIGHT HAND", right);
    return report.str();
}

} // namespace NailSize
