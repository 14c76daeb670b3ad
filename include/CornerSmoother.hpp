#pragma once

#include "Types.hpp"
#include <deque>

namespace NailSize {

// Windowed mean over the last N accepted polygons, plus the lock/ROI state
// of one detection session. Not safe for concurrent use.
class CornerSmoother {
public:
    CornerSmoother(int windowSize = 5, int stableFrameCount = 3, double stableEpsilonPx = 12.0);

    // Adds a detection and returns the smoothed polygon
    Polygon update(const Polygon& corners);

    // Clears history and stability; lock state is kept
    void clearHistory();
    void reset();

    const Polygon& smoothed() const { return smoothed_; }
    bool hasHistory() const { return !history_.empty(); }
    size_t historySize() const { return history_.size(); }
    int consecutiveStableFrames() const { return consecutive_; }
    bool isStable() const;

    bool lock();
    void unlock() { locked_ = false; }
    bool isLocked() const { return locked_; }

    // Bounding box of the smoothed polygon padded by paddingFraction * max(w, h),
    // clipped to the frame. Full frame when there is nothing to track.
    cv::Rect regionOfInterest(const cv::Size& frameSize, double paddingFraction) const;

private:
    bool withinEpsilon(const Polygon& a, const Polygon& b) const;

    int windowSize_;
    int stableFrameCount_;
    double stableEpsilonPx_;

    std::deque<Polygon> history_;
    Polygon smoothed_;
    int consecutive_ = 0;
    bool locked_ = false;
};

} // namespace NailSize
