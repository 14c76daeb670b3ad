#include "Types.hpp"
#include <stdexcept>

namespace NailSize {

const char* statusToString(Status status) {
    switch (status) {
        case Status::Success: return "Success";
        case Status::ReferenceNotFound: return "ReferenceNotFound";
        case Status::InvalidScale: return "InvalidScale";
        case Status::InsufficientContourData: return "InsufficientContourData";
        case Status::BoundaryDetectionFailed: return "BoundaryDetectionFailed";
        default: return "Unknown";
    }
}

const char* digitName(Digit digit) {
    switch (digit) {
        case Digit::Thumb: return "Thumb";
        case Digit::Index: return "Index";
        case Digit::Middle: return "Middle";
        case Digit::Ring: return "Ring";
        case Digit::Pinky: return "Pinky";
        default: return "Unknown";
    }
}

FingertipSet FingertipSet::fromLandmarks(const std::vector<cv::Point2f>& landmarks) {
    if (landmarks.size() < static_cast<size_t>(kLandmarkCount)) {
        throw std::invalid_argument("Expected at least " + std::to_string(kLandmarkCount) +
                                    " hand landmarks, got " + std::to_string(landmarks.size()));
    }

    FingertipSet set;
    for (size_t i = 0; i < kTipIndices.size(); i++) {
        int tipIndex = kTipIndices[i];
        set.fingers[i] = Fingertip{static_cast<Digit>(i),
                                   landmarks[tipIndex],
                                   landmarks[tipIndex + kBaseOffset]};
    }
    return set;
}

} // namespace NailSize
