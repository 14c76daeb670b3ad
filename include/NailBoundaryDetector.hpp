#pragma once

#include "ImageProcessor.hpp"
#include "Types.hpp"

namespace NailSize {

struct NailBoundary {
    double widthPixels = 0.0;
    int row = -1;           // image row of the widest scan
    int leftEdge = -1;      // last column at or above threshold, inclusive
    int rightEdge = -1;
    double skinBrightness = 0.0;
    double nailBrightness = 0.0;
    double edgeThreshold = 0.0;
    int validRows = 0;
    int scannedRows = 0;
    double confidence = 0.0;
};

// Shadow/brightness edge scan around a fingertip. The nail is assumed brighter
// than the surrounding skin; rows are scanned horizontally from the tip.
class NailBoundaryDetector {
public:
    static Outcome<NailBoundary> detect(const cv::Mat& grayImg,
                                        const cv::Point2f& tip,
                                        const cv::Point2f& base,
                                        const ImageProcessor::ProcessingParams& params);

    // Mean brightness on a ring around the point, negative when no sample lands in the image
    static double sampleRingBrightness(const cv::Mat& grayImg, const cv::Point2f& center,
                                       double radius, int samples);

    // Brightest pixel within a square neighborhood, negative when the point is outside the image
    static double sampleMaxBrightness(const cv::Mat& grayImg, const cv::Point2f& center, int radius);
};

} // namespace NailSize
