#include "ImageProcessor.hpp"
#include <iostream>
#include <stdexcept>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <filesystem>

using namespace cv;
using namespace std;

namespace NailSize {

Mat ImageProcessor::loadImage(const string& path) {
    if (path.empty()) {
        throw invalid_argument("Image path cannot be empty");
    }

    Mat img = imread(path, IMREAD_COLOR);
    if (img.empty()) {
        cerr << "[ERROR] Could not load image from " << path << endl;
        throw runtime_error("Failed to load image: " + path);
    }

    if (img.rows < 100 || img.cols < 100) {
        throw runtime_error("Image too small (minimum 100x100 pixels required)");
    }

    return img;
}

Mat ImageProcessor::convertToGrayscale(const Mat& img) {
    if (img.empty()) {
        throw invalid_argument("Cannot convert an empty image to grayscale");
    }
    if (img.depth() != CV_8U) {
        throw invalid_argument("Expected an 8-bit image, got depth " + to_string(img.depth()));
    }

    Mat gray;
    switch (img.channels()) {
        case 1:
            gray = img.clone();
            break;
        case 3:
            cvtColor(img, gray, COLOR_BGR2GRAY);
            break;
        case 4:
            cvtColor(img, gray, COLOR_BGRA2GRAY);
            break;
        default:
            throw invalid_argument("Unsupported channel count: " + to_string(img.channels()));
    }
    return gray;
}

Mat ImageProcessor::detectEdges(const Mat& grayImg, const ProcessingParams& params) {
    if (grayImg.empty() || grayImg.type() != CV_8UC1) {
        throw invalid_argument("Edge detection requires a non-empty 8-bit grayscale image");
    }

    Mat edges = Mat::zeros(grayImg.size(), CV_8UC1);
    if (grayImg.rows < 3 || grayImg.cols < 3) {
        return edges;
    }

    Mat gradX, gradY, gradMag;
    Sobel(grayImg, gradX, CV_32F, 1, 0, 3);
    Sobel(grayImg, gradY, CV_32F, 0, 1, 3);
    magnitude(gradX, gradY, gradMag);

    edges = gradMag > params.edgeThreshold;

    // Border pixels lack a full 3x3 neighborhood
    edges.row(0).setTo(0);
    edges.row(edges.rows - 1).setTo(0);
    edges.col(0).setTo(0);
    edges.col(edges.cols - 1).setTo(0);

    if (params.verboseOutput) {
        cout << "[INFO] Edge map: " << countNonZero(edges) << " edge pixels above magnitude "
             << params.edgeThreshold << endl;
    }
    return edges;
}

vector<vector<Point>> ImageProcessor::traceContours(const Mat& edgeImg,
                                                    const Rect& searchRegion,
                                                    const ProcessingParams& params) {
    return traceContours(edgeImg, searchRegion, searchRegion, params);
}

vector<vector<Point>> ImageProcessor::traceContours(const Mat& edgeImg,
                                                    const Rect& seedRegion,
                                                    const Rect& walkBounds,
                                                    const ProcessingParams& params) {
    vector<vector<Point>> contours;
    Rect region = seedRegion & Rect(0, 0, edgeImg.cols, edgeImg.rows);
    // A trace never leaves walkBounds, and seeds outside it are never used
    Rect bounds = walkBounds & Rect(0, 0, edgeImg.cols, edgeImg.rows);
    region &= bounds;
    if (region.empty()) {
        return contours;
    }

    Mat visited = Mat::zeros(edgeImg.size(), CV_8UC1);
    vector<Point> stack;
    int discarded = 0;

    for (int y = region.y; y < region.y + region.height; y++) {
        const uchar* edgeRow = edgeImg.ptr<uchar>(y);
        for (int x = region.x; x < region.x + region.width; x++) {
            if (edgeRow[x] == 0 || visited.at<uchar>(y, x)) continue;

            vector<Point> contour;
            stack.clear();
            stack.emplace_back(x, y);
            visited.at<uchar>(y, x) = 1;

            while (!stack.empty() && static_cast<int>(contour.size()) < params.maxContourPoints) {
                Point p = stack.back();
                stack.pop_back();
                contour.push_back(p);

                for (int dy = -1; dy <= 1; dy++) {
                    for (int dx = -1; dx <= 1; dx++) {
                        if (dx == 0 && dy == 0) continue;
                        Point q(p.x + dx, p.y + dy);
                        if (!bounds.contains(q)) continue;
                        if (edgeImg.at<uchar>(q) == 0 || visited.at<uchar>(q)) continue;
                        visited.at<uchar>(q) = 1;
                        stack.push_back(q);
                    }
                }
            }

            // Pixels still queued when the cap hit are left for later traces
            for (const Point& p : stack) {
                visited.at<uchar>(p) = 0;
            }

            if (static_cast<int>(contour.size()) >= params.minContourLength) {
                contours.push_back(std::move(contour));
            } else {
                discarded++;
            }
        }
    }

    stable_sort(contours.begin(), contours.end(),
                [](const vector<Point>& a, const vector<Point>& b) { return a.size() > b.size(); });

    if (static_cast<int>(contours.size()) > params.maxContours) {
        contours.resize(params.maxContours);
    }

    if (params.verboseOutput) {
        cout << "[INFO] Traced " << contours.size() << " contours (" << discarded
             << " discarded below " << params.minContourLength << " points)" << endl;
    }
    return contours;
}

Polygon ImageProcessor::approximateQuadrilateral(const vector<Point>& contour, const ProcessingParams& params) {
    if (contour.size() < 4) {
        return {};
    }

    // Traced pixels are in traversal order; the hull gives a closed boundary path
    vector<Point> hull;
    convexHull(contour, hull);
    if (hull.size() < 4) {
        return {};
    }

    double perimeter = arcLength(hull, true);
    Polygon corners;

    for (double factor : params.epsilonSteps) {
        vector<Point> approx;
        approxPolyDP(hull, approx, factor * perimeter, true);
        if (approx.size() == 4) {
            for (const Point& pt : approx) {
                corners.emplace_back(static_cast<float>(pt.x), static_cast<float>(pt.y));
            }
            if (params.verboseOutput) {
                cout << "[INFO] Found 4-corner approximation with epsilon factor " << factor << endl;
            }
            break;
        }
    }

    if (corners.empty()) {
        if (params.verboseOutput) {
            cout << "[INFO] Douglas-Peucker did not converge, using extreme-point corners" << endl;
        }
        corners = findExtremeCorners(hull);
    }

    corners = orderCorners(corners);
    if (corners.size() != 4 || contourArea(corners) < params.minPolygonArea) {
        return {};
    }
    return corners;
}

Polygon ImageProcessor::findExtremeCorners(const vector<Point>& points) {
    if (points.empty()) {
        return {};
    }

    Point topLeft = points[0];
    Point topRight = points[0];
    Point bottomRight = points[0];
    Point bottomLeft = points[0];

    for (const Point& pt : points) {
        if (pt.x + pt.y < topLeft.x + topLeft.y) topLeft = pt;
        if (pt.x - pt.y > topRight.x - topRight.y) topRight = pt;
        if (pt.x + pt.y > bottomRight.x + bottomRight.y) bottomRight = pt;
        if (pt.y - pt.x > bottomLeft.y - bottomLeft.x) bottomLeft = pt;
    }

    return {Point2f(topLeft), Point2f(topRight), Point2f(bottomRight), Point2f(bottomLeft)};
}

Polygon ImageProcessor::orderCorners(const Polygon& corners) {
    if (corners.size() != 4) {
        return corners;
    }

    Point2f center(0.f, 0.f);
    for (const auto& pt : corners) {
        center += pt;
    }
    center *= 0.25f;

    // Ascending angle with y pointing down walks TL, TR, BR, BL
    Polygon ordered = corners;
    sort(ordered.begin(), ordered.end(), [center](const Point2f& a, const Point2f& b) {
        return atan2(a.y - center.y, a.x - center.x) < atan2(b.y - center.y, b.x - center.x);
    });

    auto topLeft = min_element(ordered.begin(), ordered.end(), [](const Point2f& a, const Point2f& b) {
        return a.x + a.y < b.x + b.y;
    });
    rotate(ordered.begin(), topLeft, ordered.end());
    return ordered;
}

pair<double, double> ImageProcessor::measureQuadrilateral(const Polygon& corners) {
    if (corners.size() != 4) {
        return {0.0, 0.0};
    }

    double top = norm(corners[1] - corners[0]);
    double bottom = norm(corners[2] - corners[3]);
    double right = norm(corners[2] - corners[1]);
    double left = norm(corners[3] - corners[0]);

    return {(top + bottom) / 2.0, (right + left) / 2.0};
}

pair<double, double> ImageProcessor::sampleRegionStats(const Mat& grayImg, const Polygon& corners, int gridSize) {
    if (corners.size() != 4 || gridSize <= 0 || grayImg.empty()) {
        return {0.0, 0.0};
    }

    vector<double> samples;
    samples.reserve(static_cast<size_t>(gridSize) * gridSize);

    for (int i = 0; i < gridSize; i++) {
        for (int j = 0; j < gridSize; j++) {
            double t = (i + 0.5) / gridSize;
            double s = (j + 0.5) / gridSize;

            double x = (1 - t) * (1 - s) * corners[0].x + t * (1 - s) * corners[1].x +
                       t * s * corners[2].x + (1 - t) * s * corners[3].x;
            double y = (1 - t) * (1 - s) * corners[0].y + t * (1 - s) * corners[1].y +
                       t * s * corners[2].y + (1 - t) * s * corners[3].y;

            int px = static_cast<int>(floor(x));
            int py = static_cast<int>(floor(y));
            if (px >= 0 && px < grayImg.cols && py >= 0 && py < grayImg.rows) {
                samples.push_back(grayImg.at<uchar>(py, px));
            }
        }
    }

    if (samples.empty()) {
        return {0.0, 0.0};
    }

    double sum = 0.0;
    for (double v : samples) sum += v;
    double mean = sum / samples.size();

    double variance = 0.0;
    for (double v : samples) variance += (v - mean) * (v - mean);
    variance /= samples.size();

    return {min(mean / 255.0, 1.0), 1.0 / (1.0 + variance / 1000.0)};
}

// Debug visualization methods

void ImageProcessor::pushDebugImage(const Mat& image, const string& name, const ProcessingParams& params) {
    if (!params.enableDebugOutput || image.empty()) return;
    params.debugImageStack.emplace_back(image.clone(), name);
}

void ImageProcessor::pushDebugContours(const Mat& image, const vector<vector<Point>>& contours,
                                       const string& name, const ProcessingParams& params) {
    if (!params.enableDebugOutput || image.empty()) return;

    Mat debugImg;
    if (image.channels() == 1) {
        cvtColor(image, debugImg, COLOR_GRAY2BGR);
    } else {
        debugImg = image.clone();
    }

    // Longest contour in red, the rest fading to yellow
    for (size_t i = 0; i < contours.size(); i++) {
        Vec3b color = (i == 0) ? Vec3b(0, 0, 255) : Vec3b(0, 255, 255);
        for (const Point& pt : contours[i]) {
            if (pt.x >= 0 && pt.y >= 0 && pt.x < debugImg.cols && pt.y < debugImg.rows) {
                debugImg.at<Vec3b>(pt) = color;
            }
        }
    }

    params.debugImageStack.emplace_back(debugImg, name);
}

void ImageProcessor::pushDebugPolygon(const Mat& image, const Polygon& polygon,
                                      const string& name, const ProcessingParams& params) {
    if (!params.enableDebugOutput || image.empty() || polygon.size() != 4) return;

    Mat debugImg;
    if (image.channels() == 1) {
        cvtColor(image, debugImg, COLOR_GRAY2BGR);
    } else {
        debugImg = image.clone();
    }

    vector<Point> intCorners;
    for (const Point2f& corner : polygon) {
        intCorners.emplace_back(cvRound(corner.x), cvRound(corner.y));
    }
    polylines(debugImg, vector<vector<Point>>{intCorners}, true, Scalar(0, 255, 0), 3);

    for (size_t i = 0; i < intCorners.size(); i++) {
        circle(debugImg, intCorners[i], 6, Scalar(255, 255, 0), -1);
        putText(debugImg, to_string(i), Point(intCorners[i].x + 8, intCorners[i].y - 8),
                FONT_HERSHEY_SIMPLEX, 0.6, Scalar(255, 255, 0), 2);
    }

    params.debugImageStack.emplace_back(debugImg, name);
}

void ImageProcessor::flushDebugStack(const ProcessingParams& params) {
    if (!params.enableDebugOutput || params.debugImageStack.empty()) return;

    cout << "[DEBUG] Flushing " << params.debugImageStack.size() << " debug images..." << endl;

    error_code ec;
    filesystem::create_directories(params.debugOutputPath, ec);
    if (ec) {
        cout << "[WARN] Could not create debug directory " << params.debugOutputPath
             << ": " << ec.message() << endl;
        params.debugImageStack.clear();
        return;
    }

    // Save all images with sequential numbering
    for (size_t i = 0; i < params.debugImageStack.size(); i++) {
        const auto& [image, name] = params.debugImageStack[i];

        // Format: 01_name.jpg, 02_name.jpg, etc.
        char indexStr[8];
        snprintf(indexStr, sizeof(indexStr), "%02zu", i + 1);
        string filename = string(indexStr) + "_" + name + ".jpg";
        string fullPath = (filesystem::path(params.debugOutputPath) / filename).string();

        if (imwrite(fullPath, image)) {
            cout << "[DEBUG] Saved: " << filename << endl;
        } else {
            cout << "[WARN] Failed to save: " << filename << endl;
        }
    }

    params.debugImageStack.clear();
}

} // namespace NailSize
