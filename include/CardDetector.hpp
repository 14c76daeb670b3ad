#pragma once

#include "CornerSmoother.hpp"
#include "ImageProcessor.hpp"
#include "Types.hpp"
#include <optional>

namespace NailSize {

struct CardDetection {
    CardCandidate card;          // corners are the smoothed polygon
    Calibration calibration;
};

struct DetectionDiagnostics {
    double processingTimeMs = 0.0;
    int edgePixels = 0;
    int contours = 0;
    int polygons = 0;
    int candidates = 0;
    bool ranLocked = false;
    cv::Rect searchRegion;
};

// One detection session. UNLOCKED searches the whole frame (or the guide
// region); after acceptDetection() it is LOCKED and searches only a padded
// region around the accepted card until a frame fails.
class CardDetector {
public:
    using ProcessingParams = ImageProcessor::ProcessingParams;

    explicit CardDetector(const ProcessingParams& params = ProcessingParams(),
                          const ReferenceObjectSpec& reference = ReferenceObjectSpec::creditCard());

    Outcome<CardDetection> detect(const cv::Mat& image,
                                  const std::optional<cv::Rect>& guideRegion = std::nullopt);

    // Locks onto the current smoothed card; false when nothing has been detected yet
    bool acceptDetection();
    void unlock();
    bool isLocked() const { return smoother_.isLocked(); }
    bool isStable() const { return smoother_.isStable(); }
    void reset();

    const DetectionDiagnostics& diagnostics() const { return diagnostics_; }
    const ProcessingParams& params() const { return params_; }
    const ReferenceObjectSpec& reference() const { return reference_; }

private:
    Outcome<CardDetection> fail(Status status, const std::string& message);

    ProcessingParams params_;
    ReferenceObjectSpec reference_;
    CornerSmoother smoother_;
    DetectionDiagnostics diagnostics_;
};

} // namespace NailSize
