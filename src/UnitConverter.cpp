#include "UnitConverter.hpp"
#include <stdexcept>
#include <cmath>
#include <limits>
#include <string>
#include <utility>

using namespace std;

namespace NailSize {

SizeTable::SizeTable(vector<Entry> entries) : entries_(std::move(entries)) {
    if (entries_.empty()) {
        throw invalid_argument("Size table must contain at least one entry");
    }

    for (size_t i = 0; i < entries_.size(); i++) {
        const Entry& entry = entries_[i];
        if (!(entry.minMM < entry.maxMM)) {
            throw invalid_argument("Size " + to_string(entry.size) + " has an empty millimetre band");
        }
        if (i == 0) continue;

        const Entry& previous = entries_[i - 1];
        if (entry.size <= previous.size) {
            throw invalid_argument("Sizes must be strictly increasing (size " + to_string(entry.size) +
                                   " follows " + to_string(previous.size) + ")");
        }
        if (!(entry.maxMM <= previous.minMM)) {
            throw invalid_argument("Bands must be strictly decreasing in mm (size " + to_string(entry.size) +
                                   " overlaps size " + to_string(previous.size) + ")");
        }
    }
}

SizeTable SizeTable::defaultNailTable() {
    vector<Entry> entries = {
        {0, 16.0, 18.0},
        {1, 15.0, 16.0},
        {2, 14.0, 15.0},
        {3, 13.0, 14.0},
        {4, 12.0, 13.0},
        {5, 11.0, 12.0},
        {6, 10.0, 11.0},
        {7, 9.0, 10.0},
        {8, 8.0, 9.0},
        {9, 7.0, 8.0},
        {10, 6.0, 7.0},
        {11, 5.0, 6.0},
    };
    return SizeTable(std::move(entries));
}

UnitConverter::UnitConverter(SizeTable table, double curvatureMultiplier)
    : table_(std::move(table)), curvatureMultiplier_(curvatureMultiplier) {
    if (!(curvatureMultiplier_ > 0.0)) {
        throw invalid_argument("Curvature multiplier must be positive");
    }
}

double UnitConverter::pixelsToMM(double pixels, const Calibration& calibration) const {
    if (!(calibration.pixelsPerMM > 0.0)) {
        throw invalid_argument("Calibration must have a positive pixels-per-mm scale");
    }
    return pixels / calibration.pixelsPerMM;
}

double UnitConverter::applyCurvature(double chordMM) const {
    return chordMM * curvatureMultiplier_;
}

int UnitConverter::mmToSize(double mm) const {
    const auto& entries = table_.entries();

    for (const auto& entry : entries) {
        if (mm >= entry.minMM && mm < entry.maxMM) {
            return entry.size;
        }
    }

    // Gaps and out-of-range values: nearest band edge, earlier entry on ties
    int bestSize = entries.front().size;
    double bestDistance = numeric_limits<double>::max();
    for (const auto& entry : entries) {
        double distance = mm < entry.minMM ? entry.minMM - mm : mm - entry.maxMM;
        if (distance < bestDistance) {
            bestDistance = distance;
            bestSize = entry.size;
        }
    }
    return bestSize;
}

SizeBand UnitConverter::sizeToMM(int size) const {
    for (const auto& entry : table_.entries()) {
        if (entry.size == size) {
            return SizeBand{entry.minMM, entry.maxMM, (entry.minMM + entry.maxMM) / 2.0};
        }
    }
    throw out_of_range("Size " + to_string(size) + " is not in the size table");
}

NailMeasurement UnitConverter::convert(Digit digit, double widthPixels, const Calibration& calibration,
                                       double confidence) const {
    NailMeasurement measurement;
    measurement.digit = digit;
    measurement.widthPixels = widthPixels;
    measurement.chordMM = pixelsToMM(widthPixels, calibration);
    measurement.curvedMM = applyCurvature(measurement.chordMM);
    measurement.size = mmToSize(measurement.curvedMM);
    measurement.confidence = confidence;
    return measurement;
}

bool UnitConverter::isPlausibleNailMM(double mm) {
    return mm >= 5.0 && mm <= 20.0;
}

} // namespace NailSize
