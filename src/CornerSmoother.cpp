#include "CornerSmoother.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

using namespace cv;
using namespace std;

namespace NailSize {

CornerSmoother::CornerSmoother(int windowSize, int stableFrameCount, double stableEpsilonPx)
    : windowSize_(windowSize), stableFrameCount_(stableFrameCount), stableEpsilonPx_(stableEpsilonPx) {
    if (windowSize_ < 1) {
        throw invalid_argument("Smoothing window must hold at least one detection");
    }
    if (stableFrameCount_ < 1) {
        throw invalid_argument("Stable frame count must be at least 1");
    }
}

Polygon CornerSmoother::update(const Polygon& corners) {
    if (corners.size() != 4) {
        throw invalid_argument("Corner smoother expects exactly 4 corners");
    }

    if (!history_.empty() && withinEpsilon(history_.back(), corners)) {
        consecutive_++;
    } else {
        consecutive_ = 1;
    }

    history_.push_back(corners);
    while (static_cast<int>(history_.size()) > windowSize_) {
        history_.pop_front();
    }

    Polygon averaged(4, Point2f(0.f, 0.f));
    for (const Polygon& detection : history_) {
        for (size_t i = 0; i < 4; i++) {
            averaged[i] += detection[i];
        }
    }
    float count = static_cast<float>(history_.size());
    for (auto& corner : averaged) {
        corner.x /= count;
        corner.y /= count;
    }

    smoothed_ = averaged;
    return smoothed_;
}

void CornerSmoother::clearHistory() {
    history_.clear();
    smoothed_.clear();
    consecutive_ = 0;
}

void CornerSmoother::reset() {
    clearHistory();
    locked_ = false;
}

bool CornerSmoother::isStable() const {
    return consecutive_ >= stableFrameCount_;
}

bool CornerSmoother::lock() {
    if (smoothed_.size() != 4) {
        return false;
    }
    locked_ = true;
    return true;
}

Rect CornerSmoother::regionOfInterest(const Size& frameSize, double paddingFraction) const {
    Rect frame(0, 0, frameSize.width, frameSize.height);
    if (smoothed_.size() != 4) {
        return frame;
    }

    Rect bounds = boundingRect(smoothed_);
    int padding = static_cast<int>(ceil(max(bounds.width, bounds.height) * paddingFraction));
    Rect padded(bounds.x - padding, bounds.y - padding,
                bounds.width + 2 * padding, bounds.height + 2 * padding);
    return padded & frame;
}

bool CornerSmoother::withinEpsilon(const Polygon& a, const Polygon& b) const {
    for (size_t i = 0; i < 4; i++) {
        if (norm(a[i] - b[i]) > stableEpsilonPx_) {
            return false;
        }
    }
    return true;
}

} // namespace NailSize
