#include "ScaleCalibrator.hpp"
#include <iostream>
#include <sstream>
#include <stdexcept>

using namespace std;

namespace NailSize {

Outcome<Calibration> ScaleCalibrator::calibrate(double widthPixels,
                                                double knownWidthMM,
                                                const ImageProcessor::ProcessingParams& params) {
    if (knownWidthMM <= 0.0) {
        throw invalid_argument("Reference physical width must be positive");
    }

    double pixelsPerMM = widthPixels / knownWidthMM;
    if (!(pixelsPerMM >= params.minPixelsPerMM && pixelsPerMM <= params.maxPixelsPerMM)) {
        ostringstream msg;
        msg << "Invalid scale: " << pixelsPerMM << " pixels/mm (expected "
            << params.minPixelsPerMM << "-" << params.maxPixelsPerMM << ")";
        if (params.verboseOutput) {
            cout << "[WARN] " << msg.str() << endl;
        }
        return Failure{Status::InvalidScale, msg.str()};
    }

    if (params.verboseOutput) {
        cout << "[INFO] Scale: " << widthPixels << "px / " << knownWidthMM << "mm = "
             << pixelsPerMM << " pixels/mm" << endl;
    }
    return Calibration{pixelsPerMM, knownWidthMM};
}

Outcome<Calibration> ScaleCalibrator::calibrate(const CardCandidate& card,
                                                const ReferenceObjectSpec& reference,
                                                const ImageProcessor::ProcessingParams& params) {
    return calibrate(card.width, reference.widthMM, params);
}

} // namespace NailSize
