#pragma once

#include "ImageProcessor.hpp"
#include "Types.hpp"
#include <optional>
#include <vector>

namespace NailSize {

class CardCandidateSelector {
public:
    using ProcessingParams = ImageProcessor::ProcessingParams;

    // Applies the aspect-ratio and size filters; survivors carry their
    // geometry and region stats but are not yet scored.
    static std::vector<CardCandidate> filterCandidates(const std::vector<Polygon>& polygons,
                                                       const cv::Mat& grayImg,
                                                       const std::optional<cv::Rect>& guideRegion,
                                                       const ReferenceObjectSpec& reference,
                                                       const ProcessingParams& params);

    static void scoreCandidates(std::vector<CardCandidate>& candidates,
                                bool hasGuide,
                                const ProcessingParams& params);

    // Scores the filtered candidates and returns the best; first of equal scores wins
    static std::optional<CardCandidate> selectBest(std::vector<CardCandidate> candidates,
                                                   bool hasGuide,
                                                   const ProcessingParams& params);

    // Highest scoring candidate, or nothing when no polygon passes the filters
    static std::optional<CardCandidate> selectBest(const std::vector<Polygon>& polygons,
                                                   const cv::Mat& grayImg,
                                                   const std::optional<cv::Rect>& guideRegion,
                                                   const ReferenceObjectSpec& reference,
                                                   const ProcessingParams& params);
};

} // namespace NailSize
