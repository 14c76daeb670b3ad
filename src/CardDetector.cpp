#include "CardDetector.hpp"
#include "CardCandidateSelector.hpp"
#include "ScaleCalibrator.hpp"
#include <iostream>
#include <cmath>
#include <stdexcept>
#include <tuple>

using namespace cv;
using namespace std;

namespace NailSize {

CardDetector::CardDetector(const ProcessingParams& params, const ReferenceObjectSpec& reference)
    : params_(params),
      reference_(reference),
      smoother_(params.smoothingWindow, params.stableFrameCount, params.stableEpsilonPx) {
    if (!(reference_.widthMM > 0.0) || !(reference_.heightMM > 0.0) || !(reference_.aspectRatio > 0.0)) {
        throw invalid_argument("Reference object dimensions must be positive");
    }
}

Outcome<CardDetection> CardDetector::detect(const Mat& image, const optional<Rect>& guideRegion) {
    TickMeter timer;
    timer.start();
    diagnostics_ = DetectionDiagnostics();

    Mat gray = ImageProcessor::convertToGrayscale(image);
    Rect frame(0, 0, gray.cols, gray.rows);

    // Guided traces start inside the guide but may follow the card past its edge.
    // A locked search never leaves the lock ROI.
    Rect walkBounds = frame;
    diagnostics_.ranLocked = smoother_.isLocked();
    if (diagnostics_.ranLocked) {
        diagnostics_.searchRegion = smoother_.regionOfInterest(gray.size(), params_.lockPaddingFraction);
        walkBounds = diagnostics_.searchRegion;
    } else if (guideRegion) {
        diagnostics_.searchRegion = *guideRegion & frame;
    } else {
        diagnostics_.searchRegion = frame;
    }

    if (params_.verboseOutput) {
        cout << "[INFO] Card detection on " << gray.cols << "x" << gray.rows
             << (diagnostics_.ranLocked ? " (locked)" : "") << ", search region "
             << diagnostics_.searchRegion << endl;
    }

    Mat edges = ImageProcessor::detectEdges(gray, params_);
    diagnostics_.edgePixels = countNonZero(edges);
    ImageProcessor::pushDebugImage(gray, "grayscale", params_);
    ImageProcessor::pushDebugImage(edges, "edges", params_);

    vector<vector<Point>> contours = ImageProcessor::traceContours(edges, diagnostics_.searchRegion,
                                                                         walkBounds, params_);
    diagnostics_.contours = static_cast<int>(contours.size());
    ImageProcessor::pushDebugContours(gray, contours, "contours", params_);

    if (contours.empty()) {
        timer.stop();
        diagnostics_.processingTimeMs = timer.getTimeMilli();
        return fail(Status::InsufficientContourData,
                    "No contour of at least " + to_string(params_.minContourLength) + " edge pixels found");
    }

    vector<Polygon> polygons;
    for (const auto& contour : contours) {
        Polygon polygon = ImageProcessor::approximateQuadrilateral(contour, params_);
        if (!polygon.empty()) {
            polygons.push_back(polygon);
        }
    }
    diagnostics_.polygons = static_cast<int>(polygons.size());

    vector<CardCandidate> candidates =
        CardCandidateSelector::filterCandidates(polygons, gray, guideRegion, reference_, params_);
    diagnostics_.candidates = static_cast<int>(candidates.size());

    optional<CardCandidate> best =
        CardCandidateSelector::selectBest(std::move(candidates), guideRegion.has_value(), params_);

    timer.stop();
    diagnostics_.processingTimeMs = timer.getTimeMilli();

    if (!best) {
        return fail(Status::ReferenceNotFound,
                    "No card-shaped quadrilateral among " + to_string(polygons.size()) + " polygons");
    }

    // Report the smoothed polygon with geometry recomputed from it
    CardCandidate card = *best;
    card.corners = smoother_.update(best->corners);
    tie(card.width, card.height) = ImageProcessor::measureQuadrilateral(card.corners);
    card.aspectRatio = card.height > 0.0 ? card.width / card.height : 0.0;
    card.aspectError = abs(card.aspectRatio - reference_.aspectRatio) / reference_.aspectRatio;

    Outcome<Calibration> calibration = ScaleCalibrator::calibrate(card, reference_, params_);
    if (!calibration.ok()) {
        return fail(calibration.status(), calibration.message());
    }

    ImageProcessor::pushDebugPolygon(image, card.corners, "card", params_);
    ImageProcessor::flushDebugStack(params_);

    if (params_.verboseOutput) {
        cout << "[INFO] Card " << card.width << "x" << card.height << "px, score " << card.score
             << ", " << calibration.value().pixelsPerMM << " pixels/mm, stable frames "
             << smoother_.consecutiveStableFrames() << " (" << diagnostics_.processingTimeMs << "ms)" << endl;
    }

    return CardDetection{card, calibration.value()};
}

bool CardDetector::acceptDetection() {
    bool locked = smoother_.lock();
    if (params_.verboseOutput) {
        cout << (locked ? "[INFO] Card detection locked" : "[WARN] Nothing to lock onto") << endl;
    }
    return locked;
}

void CardDetector::unlock() {
    smoother_.unlock();
}

void CardDetector::reset() {
    smoother_.reset();
    diagnostics_ = DetectionDiagnostics();
}

Outcome<CardDetection> CardDetector::fail(Status status, const string& message) {
    // A failed frame breaks the stability run and drops any lock
    smoother_.clearHistory();
    if (smoother_.isLocked()) {
        smoother_.unlock();
        if (params_.verboseOutput) {
            cout << "[INFO] Lost locked card, searching the full frame again" << endl;
        }
    }

    if (params_.verboseOutput) {
        cout << "[WARN] " << statusToString(status) << ": " << message << endl;
    }
    ImageProcessor::flushDebugStack(params_);
    return Failure{status, message};
}

} // namespace NailSize
