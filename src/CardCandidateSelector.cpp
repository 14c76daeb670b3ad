#include "CardCandidateSelector.hpp"
#include <iostream>
#include <algorithm>
#include <cmath>

using namespace cv;
using namespace std;

namespace NailSize {

vector<CardCandidate> CardCandidateSelector::filterCandidates(const vector<Polygon>& polygons,
                                                              const Mat& grayImg,
                                                              const optional<Rect>& guideRegion,
                                                              const ReferenceObjectSpec& reference,
                                                              const ProcessingParams& params) {
    vector<CardCandidate> candidates;
    int rejectedCorners = 0, rejectedAspect = 0, rejectedSize = 0;

    for (const Polygon& polygon : polygons) {
        if (polygon.size() != 4) {
            rejectedCorners++;
            continue;
        }

        auto [width, height] = ImageProcessor::measureQuadrilateral(polygon);
        if (width <= 0.0 || height <= 0.0) {
            rejectedCorners++;
            continue;
        }

        double aspectRatio = width / height;
        double aspectError = abs(aspectRatio - reference.aspectRatio) / reference.aspectRatio;
        if (aspectError > reference.aspectTolerance) {
            rejectedAspect++;
            if (params.verboseOutput) {
                cout << "[INFO] Rejected aspect ratio " << aspectRatio << " (error "
                     << aspectError * 100.0 << "%)" << endl;
            }
            continue;
        }

        double guideFill = -1.0;
        if (guideRegion && guideRegion->width > 0) {
            guideFill = width / guideRegion->width;
            if (guideFill < params.minGuideFill || guideFill > params.maxGuideFill) {
                rejectedSize++;
                if (params.verboseOutput) {
                    cout << "[INFO] Rejected guide fill " << guideFill * 100.0 << "% (want "
                         << params.minGuideFill * 100.0 << "-" << params.maxGuideFill * 100.0 << "%)" << endl;
                }
                continue;
            }
        } else {
            double frameFill = width / grayImg.cols;
            if (frameFill < params.minFrameFill || frameFill > params.maxFrameFill) {
                rejectedSize++;
                continue;
            }
        }

        CardCandidate candidate;
        candidate.corners = polygon;
        candidate.width = width;
        candidate.height = height;
        candidate.aspectRatio = aspectRatio;
        candidate.aspectError = aspectError;
        candidate.guideFill = guideFill;
        tie(candidate.brightness, candidate.uniformity) =
            ImageProcessor::sampleRegionStats(grayImg, polygon, params.brightnessSampleGrid);
        candidates.push_back(candidate);
    }

    if (params.verboseOutput) {
        cout << "[INFO] " << candidates.size() << " card candidates; rejected " << rejectedCorners
             << " corners, " << rejectedAspect << " aspect ratio, " << rejectedSize << " size" << endl;
    }
    return candidates;
}

void CardCandidateSelector::scoreCandidates(vector<CardCandidate>& candidates,
                                            bool hasGuide,
                                            const ProcessingParams& params) {
    if (candidates.empty()) return;

    double maxWidth = 0.0;
    for (const auto& candidate : candidates) {
        maxWidth = max(maxWidth, candidate.width);
    }

    for (auto& candidate : candidates) {
        double sizeScore = candidate.width / maxWidth;
        double aspectScore = 1.0 - candidate.aspectError;

        double guideScore = 1.0;
        if (hasGuide && candidate.guideFill >= 0.0) {
            double fillError = abs(candidate.guideFill - params.targetGuideFill);
            guideScore = max(0.0, 1.0 - fillError * 2.0);
        }

        candidate.score = sizeScore * params.sizeWeight +
                          aspectScore * params.aspectWeight +
                          guideScore * params.guideWeight +
                          candidate.brightness * params.brightnessWeight +
                          candidate.uniformity * params.uniformityWeight;

        if (params.verboseOutput) {
            cout << "[INFO] Candidate " << candidate.width << "x" << candidate.height
                 << " score " << candidate.score << " (size " << sizeScore << ", aspect " << aspectScore
                 << ", guide " << guideScore << ", brightness " << candidate.brightness
                 << ", uniformity " << candidate.uniformity << ")" << endl;
        }
    }
}

optional<CardCandidate> CardCandidateSelector::selectBest(vector<CardCandidate> candidates,
                                                          bool hasGuide,
                                                          const ProcessingParams& params) {
    if (candidates.empty()) {
        return nullopt;
    }

    scoreCandidates(candidates, hasGuide, params);

    // max_element keeps the first of equal scores
    auto best = max_element(candidates.begin(), candidates.end(),
                            [](const CardCandidate& a, const CardCandidate& b) { return a.score < b.score; });
    return *best;
}

optional<CardCandidate> CardCandidateSelector::selectBest(const vector<Polygon>& polygons,
                                                          const Mat& grayImg,
                                                          const optional<Rect>& guideRegion,
                                                          const ReferenceObjectSpec& reference,
                                                          const ProcessingParams& params) {
    return selectBest(filterCandidates(polygons, grayImg, guideRegion, reference, params),
                      guideRegion.has_value(), params);
}

} // namespace NailSize
