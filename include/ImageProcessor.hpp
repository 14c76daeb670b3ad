#pragma once

#include "Types.hpp"
#include <opencv2/opencv.hpp>
#include <string>
#include <utility>
#include <vector>

namespace NailSize {

class ImageProcessor {
public:
    struct ProcessingParams {
        // Edge detection (3x3 Sobel magnitude)
        double edgeThreshold = 40.0;

        // Contour tracing
        int maxContourPoints = 20000;    // Hard cap per trace
        int minContourLength = 200;      // Shorter traces are text/surface noise
        int maxContours = 5;             // Keep only the K longest traces

        // Polygon approximation (epsilon as a fraction of the hull perimeter)
        std::vector<double> epsilonSteps = {0.02, 0.03, 0.04, 0.05, 0.06, 0.08, 0.10};
        double minPolygonArea = 100.0;

        // Card candidate filters
        double minGuideFill = 0.50;      // Card width / guide width
        double maxGuideFill = 1.15;
        double targetGuideFill = 0.85;
        double minFrameFill = 0.20;      // Card width / frame width when no guide is given
        double maxFrameFill = 0.60;

        // Card candidate scoring weights
        double sizeWeight = 0.40;
        double aspectWeight = 0.25;
        double guideWeight = 0.15;
        double brightnessWeight = 0.10;
        double uniformityWeight = 0.10;
        int brightnessSampleGrid = 5;    // N x N samples inside the polygon

        // Temporal smoothing and lock
        int smoothingWindow = 5;
        int stableFrameCount = 3;
        double stableEpsilonPx = 12.0;
        double lockPaddingFraction = 0.25;

        // Scale calibration plausibility
        double minPixelsPerMM = 2.0;
        double maxPixelsPerMM = 50.0;

        // Nail boundary scan
        double skinRingRadiusPx = 12.0;
        int skinRingSamples = 16;
        int tipNeighborhoodRadiusPx = 5;
        double nailBrightnessFraction = 0.80;
        double skinBrightnessMultiple = 1.10;
        int verticalWindowPx = 6;
        int rowStepPx = 2;
        int maxScanDistancePx = 80;
        int minNailWidthPx = 10;

        // Unit conversion
        double curvatureMultiplier = 1.06;  // Arc length over chord for a convex nail

        // Debug visualization
        bool enableDebugOutput = false;
        bool verboseOutput = false;
        std::string debugOutputPath = "./debug/";

        // Debug image stack (for automatic numbering)
        mutable std::vector<std::pair<cv::Mat, std::string>> debugImageStack;
    };

    static cv::Mat loadImage(const std::string& path);
    static cv::Mat convertToGrayscale(const cv::Mat& img);

    static cv::Mat detectEdges(const cv::Mat& grayImg, const ProcessingParams& params);
    static std::vector<std::vector<cv::Point>> traceContours(const cv::Mat& edgeImg,
                                                             const cv::Rect& searchRegion,
                                                             const ProcessingParams& params);
    // Seeds only inside seedRegion but follows connected edges anywhere in walkBounds
    static std::vector<std::vector<cv::Point>> traceContours(const cv::Mat& edgeImg,
                                                             const cv::Rect& seedRegion,
                                                             const cv::Rect& walkBounds,
                                                             const ProcessingParams& params);

    static Polygon approximateQuadrilateral(const std::vector<cv::Point>& contour,
                                            const ProcessingParams& params);
    static Polygon findExtremeCorners(const std::vector<cv::Point>& points);
    static Polygon orderCorners(const Polygon& corners);
    static std::pair<double, double> measureQuadrilateral(const Polygon& corners);

    // Mean brightness (0-1) and uniformity (0-1) over a bilinear sample grid inside the quad
    static std::pair<double, double> sampleRegionStats(const cv::Mat& grayImg,
                                                       const Polygon& corners,
                                                       int gridSize);

    static void pushDebugImage(const cv::Mat& image, const std::string& name, const ProcessingParams& params);
    static void pushDebugContours(const cv::Mat& image, const std::vector<std::vector<cv::Point>>& contours,
                                  const std::string& name, const ProcessingParams& params);
    static void pushDebugPolygon(const cv::Mat& image, const Polygon& polygon,
                                 const std::string& name, const ProcessingParams& params);
    static void flushDebugStack(const ProcessingParams& params);
};

} // namespace NailSize
