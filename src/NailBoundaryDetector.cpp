#include "NailBoundaryDetector.hpp"
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <algorithm>
#include <cmath>
#include <vector>

using namespace cv;
using namespace std;

namespace NailSize {

double NailBoundaryDetector::sampleRingBrightness(const Mat& grayImg, const Point2f& center,
                                                  double radius, int samples) {
    double sum = 0.0;
    int count = 0;

    for (int i = 0; i < samples; i++) {
        double angle = (static_cast<double>(i) / samples) * 2.0 * CV_PI;
        int x = cvRound(center.x + radius * cos(angle));
        int y = cvRound(center.y + radius * sin(angle));

        if (x >= 0 && x < grayImg.cols && y >= 0 && y < grayImg.rows) {
            sum += grayImg.at<uchar>(y, x);
            count++;
        }
    }

    return count > 0 ? sum / count : -1.0;
}

double NailBoundaryDetector::sampleMaxBrightness(const Mat& grayImg, const Point2f& center, int radius) {
    int cx = cvRound(center.x);
    int cy = cvRound(center.y);
    if (cx < 0 || cx >= grayImg.cols || cy < 0 || cy >= grayImg.rows) {
        return -1.0;
    }

    Rect window = Rect(cx - radius, cy - radius, 2 * radius + 1, 2 * radius + 1) &
                  Rect(0, 0, grayImg.cols, grayImg.rows);
    double maxVal = 0.0;
    minMaxLoc(grayImg(window), nullptr, &maxVal);
    return maxVal;
}

Outcome<NailBoundary> NailBoundaryDetector::detect(const Mat& grayImg,
                                                   const Point2f& tip,
                                                   const Point2f& base,
                                                   const ImageProcessor::ProcessingParams& params) {
    if (grayImg.empty() || grayImg.type() != CV_8UC1) {
        throw invalid_argument("Nail boundary detection requires a non-empty 8-bit grayscale image");
    }

    NailBoundary boundary;

    boundary.nailBrightness = sampleMaxBrightness(grayImg, tip, params.tipNeighborhoodRadiusPx);
    if (boundary.nailBrightness < 0.0) {
        return Failure{Status::BoundaryDetectionFailed, "Fingertip lies outside the image"};
    }

    boundary.skinBrightness = sampleRingBrightness(grayImg, base, params.skinRingRadiusPx,
                                                   params.skinRingSamples);
    if (boundary.skinBrightness < 0.0) {
        return Failure{Status::BoundaryDetectionFailed, "Skin reference ring lies outside the image"};
    }

    boundary.edgeThreshold = max(params.nailBrightnessFraction * boundary.nailBrightness,
                                 params.skinBrightnessMultiple * boundary.skinBrightness);

    int cx = cvRound(tip.x);
    int cy = cvRound(tip.y);
    int step = max(1, params.rowStepPx);

    // Tip row first, then outward in both directions
    vector<int> offsets = {0};
    for (int d = step; d <= params.verticalWindowPx; d += step) {
        offsets.push_back(-d);
        offsets.push_back(d);
    }

    for (int offset : offsets) {
        int y = cy + offset;
        if (y < 0 || y >= grayImg.rows) continue;
        boundary.scannedRows++;

        const uchar* row = grayImg.ptr<uchar>(y);
        if (row[cx] < boundary.edgeThreshold) continue;

        // A scan that reaches the border or the distance cap found no edge
        int left = cx;
        bool leftFound = false;
        for (int d = 1; d <= params.maxScanDistancePx; d++) {
            int x = cx - d;
            if (x < 0) break;
            if (row[x] < boundary.edgeThreshold) {
                leftFound = true;
                break;
            }
            left = x;
        }

        int right = cx;
        bool rightFound = false;
        for (int d = 1; d <= params.maxScanDistancePx; d++) {
            int x = cx + d;
            if (x >= grayImg.cols) break;
            if (row[x] < boundary.edgeThreshold) {
                rightFound = true;
                break;
            }
            right = x;
        }

        if (!leftFound || !rightFound) continue;

        boundary.validRows++;
        int width = right - left + 1;
        if (width > boundary.widthPixels) {
            boundary.widthPixels = width;
            boundary.row = y;
            boundary.leftEdge = left;
            boundary.rightEdge = right;
        }
    }

    if (boundary.widthPixels < params.minNailWidthPx) {
        ostringstream msg;
        msg << "Nail boundary not found: widest scan " << boundary.widthPixels << "px is below "
            << params.minNailWidthPx << "px (threshold " << boundary.edgeThreshold
            << ", nail " << boundary.nailBrightness << ", skin " << boundary.skinBrightness << ")";
        if (params.verboseOutput) {
            cout << "[WARN] " << msg.str() << endl;
        }
        return Failure{Status::BoundaryDetectionFailed, msg.str()};
    }

    double contrast = (boundary.nailBrightness - boundary.skinBrightness) / boundary.nailBrightness;
    double rowFraction = static_cast<double>(boundary.validRows) / boundary.scannedRows;
    boundary.confidence = rowFraction * min(1.0, max(0.0, 2.0 * contrast));

    if (params.verboseOutput) {
        cout << "[INFO] Nail boundary: " << boundary.widthPixels << "px on row " << boundary.row
             << " [" << boundary.leftEdge << ", " << boundary.rightEdge << "], threshold "
             << boundary.edgeThreshold << ", confidence " << boundary.confidence << endl;
    }
    return boundary;
}

} // namespace NailSize
