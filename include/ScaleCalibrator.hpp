#pragma once

#include "ImageProcessor.hpp"
#include "Types.hpp"

namespace NailSize {

class ScaleCalibrator {
public:
    // pixelsPerMM = widthPixels / knownWidthMM, rejected as InvalidScale
    // outside [params.minPixelsPerMM, params.maxPixelsPerMM]
    static Outcome<Calibration> calibrate(double widthPixels,
                                          double knownWidthMM,
                                          const ImageProcessor::ProcessingParams& params);

    static Outcome<Calibration> calibrate(const CardCandidate& card,
                                          const ReferenceObjectSpec& reference,
                                          const ImageProcessor::ProcessingParams& params);
};

} // namespace NailSize
