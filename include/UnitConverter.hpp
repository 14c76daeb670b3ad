#pragma once

#include "Types.hpp"
#include <vector>

namespace NailSize {

struct SizeBand {
    double minMM = 0.0;
    double maxMM = 0.0;
    double averageMM = 0.0;
};

// Ordinal sizes mapped to half-open millimetre bands [minMM, maxMM).
// Entries are ordered by size ascending, which means bands descending in mm.
class SizeTable {
public:
    struct Entry {
        int size;
        double minMM;
        double maxMM;
    };

    explicit SizeTable(std::vector<Entry> entries);

    // Nail widths for sizes 0 (16-18mm) through 11 (5-6mm)
    static SizeTable defaultNailTable();

    const std::vector<Entry>& entries() const { return entries_; }

private:
    std::vector<Entry> entries_;
};

class UnitConverter {
public:
    explicit UnitConverter(SizeTable table = SizeTable::defaultNailTable(),
                           double curvatureMultiplier = 1.06);

    double pixelsToMM(double pixels, const Calibration& calibration) const;
    double applyCurvature(double chordMM) const;

    // Containing band wins; otherwise the nearest band, so values off either
    // end of the table clamp to the first or last size.
    int mmToSize(double mm) const;
    SizeBand sizeToMM(int size) const;

    NailMeasurement convert(Digit digit, double widthPixels, const Calibration& calibration,
                            double confidence) const;

    static bool isPlausibleNailMM(double mm);

    double curvatureMultiplier() const { return curvatureMultiplier_; }
    const SizeTable& table() const { return table_; }

private:
    SizeTable table_;
    double curvatureMultiplier_;
};

} // namespace NailSize
