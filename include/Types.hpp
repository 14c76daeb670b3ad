#pragma once

#include <opencv2/core.hpp>
#include <array>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace NailSize {

enum class Status {
    Success = 0,
    ReferenceNotFound,        // no polygon survived filtering/scoring
    InvalidScale,             // pixels-per-mm outside the plausible range
    InsufficientContourData,  // no contour met the length threshold
    BoundaryDetectionFailed   // nail width below the minimum plausible pixel count
};

const char* statusToString(Status status);

struct Failure {
    Status status;
    std::string message;
};

// Either a fully valid value or exactly one named failure.
template <typename T>
class Outcome {
public:
    Outcome(T value) : data_(std::move(value)) {}
    Outcome(Failure failure) : data_(std::move(failure)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }

    Status status() const {
        return ok() ? Status::Success : std::get<Failure>(data_).status;
    }

    const std::string& message() const {
        static const std::string empty;
        return ok() ? empty : std::get<Failure>(data_).message;
    }

    const T& value() const { return std::get<T>(data_); }
    const Failure& failure() const { return std::get<Failure>(data_); }

private:
    std::variant<T, Failure> data_;
};

// Four corners ordered top-left, top-right, bottom-right, bottom-left.
// An empty polygon means no usable quadrilateral was found.
using Polygon = std::vector<cv::Point2f>;

struct ReferenceObjectSpec {
    std::string name = "Credit Card";
    double widthMM = 85.6;
    double heightMM = 53.98;
    double aspectRatio = 1.586;
    double aspectTolerance = 0.30;

    // ISO/IEC 7810 ID-1
    static ReferenceObjectSpec creditCard() { return ReferenceObjectSpec(); }
};

struct CardCandidate {
    Polygon corners;
    double width = 0.0;
    double height = 0.0;
    double aspectRatio = 0.0;
    double aspectError = 0.0;
    double guideFill = -1.0;  // negative when no guide region was supplied
    double brightness = 0.0;
    double uniformity = 0.0;
    double score = 0.0;
};

struct Calibration {
    double pixelsPerMM = 0.0;
    double referenceWidthMM = 0.0;
};

enum class Digit { Thumb = 0, Index, Middle, Ring, Pinky };

const char* digitName(Digit digit);

struct Fingertip {
    Digit digit;
    cv::Point2f tip;
    cv::Point2f base;
};

// Hand-pose landmark layout: 21 points per hand, fingertips at fixed indices,
// the joint three positions before each tip is used as the skin reference.
struct FingertipSet {
    static constexpr int kLandmarkCount = 21;
    static constexpr int kBaseOffset = -3;
    static constexpr std::array<int, 5> kTipIndices = {4, 8, 12, 16, 20};

    std::array<Fingertip, 5> fingers;

    static FingertipSet fromLandmarks(const std::vector<cv::Point2f>& landmarks);
};

struct NailMeasurement {
    Digit digit = Digit::Thumb;
    double widthPixels = 0.0;
    double chordMM = 0.0;
    double curvedMM = 0.0;
    int size = 0;
    double confidence = 0.0;
};

} // namespace NailSize
