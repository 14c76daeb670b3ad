#include <NailSizeAPI.h>
#include "NailMeasurer.hpp"
#include <iostream>
#include <iomanip>
#include <string>
#include <fstream>
#include <sstream>
#include <vector>
#include <cstdio>

using namespace std;

struct Arguments {
    string inputPath;
    string landmarksPath;
    bool valid = false;
    bool verbose = false;
    bool debug = false;
    bool leftHand = false;

    bool hasGuide = false;
    NailSizeRect guide = {0, 0, 0, 0};

    double curvature = 0.0;            // 0 = library default
    double edgeThreshold = 0.0;        // 0 = library default
};

bool parseGuide(const string& text, NailSizeRect* guide) {
    int x, y, w, h;
    char trailing;
    if (sscanf(text.c_str(), "%d,%d,%d,%d%c", &x, &y, &w, &h, &trailing) != 4 || w <= 0 || h <= 0) {
        return false;
    }
    *guide = {x, y, w, h};
    return true;
}

Arguments parseArguments(int argc, char* argv[]) {
    Arguments args;

    if (argc < 2) {
        return args;
    }

    for (int i = 1; i < argc; i++) {
        string arg = argv[i];
        if ((arg == "-i" || arg == "--input") && (i + 1 < argc)) {
            args.inputPath = argv[++i];
        } else if ((arg == "-l" || arg == "--landmarks") && (i + 1 < argc)) {
            args.landmarksPath = argv[++i];
        } else if ((arg == "-g" || arg == "--guide") && (i + 1 < argc)) {
            if (!parseGuide(argv[++i], &args.guide)) {
                cerr << "[ERROR] Guide must be x,y,width,height" << endl;
                return args;
            }
            args.hasGuide = true;
        } else if ((arg == "--curvature") && (i + 1 < argc)) {
            args.curvature = stod(argv[++i]);
        } else if ((arg == "--edge-threshold") && (i + 1 < argc)) {
            args.edgeThreshold = stod(argv[++i]);
        } else if (arg == "--left") {
            args.leftHand = true;
        } else if (arg == "-v" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-d" || arg == "--debug") {
            args.debug = true;
        } else if (arg == "--help" || arg == "-h") {
            return args; // Will trigger usage display
        }
    }

    if (args.inputPath.empty() || args.landmarksPath.empty()) {
        return args;
    }

    args.valid = true;
    return args;
}

void printUsage(const char* progName) {
    cout << "NailSize CLI - Measure fingernails against a payment card\n"
         << "Using libnailsize v" << nail_size_get_version() << "\n"
         << "\n"
         << "Usage: " << progName << " -i <photo> -l <landmarks.txt> [options]\n"
         << "\n"
         << "Required:\n"
         << "  -i, --input      Photo with the card and one hand in view\n"
         << "  -l, --landmarks  Hand landmark file, 21 lines of \"x y\" pixel coordinates\n"
         << "\n"
         << "Optional:\n"
         << "  -g, --guide <x,y,w,h>  Guide rectangle the card should fill\n"
         << "  --curvature <k>        Curved/chord width multiplier (default: 1.06)\n"
         << "  --edge-threshold <t>   Sobel magnitude threshold for card edges (default: 40)\n"
         << "  --left                 Report the measurements as the left hand\n"
         << "\n"
         << "General:\n"
         << "  -v, --verbose Enable verbose output\n"
         << "  -d, --debug   Enable debug visualization (saves step-by-step images)\n"
         << "  -h, --help    Show this help message\n"
         << "\n"
         << "Examples:\n"
         << "  " << progName << " -i hand.jpg -l hand.txt\n"
         << "  " << progName << " -i hand.jpg -l hand.txt -g 200,150,880,560\n"
         << "  " << progName << " -i hand.jpg -l hand.txt --curvature 1.1 --left\n"
         << "  " << progName << " -i hand.jpg -l hand.txt -v\n"
         << "  " << progName << " -i hand.jpg -l hand.txt -d  # Saves debug images to ./debug/\n"
         << endl;
}

bool loadLandmarks(const string& path, vector<NailSizePoint>& landmarks) {
    ifstream file(path);
    if (!file.good()) {
        return false;
    }

    string line;
    while (getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;
        istringstream fields(line);
        NailSizePoint point;
        if (!(fields >> point.x >> point.y)) {
            cerr << "[ERROR] Malformed landmark line: " << line << endl;
            return false;
        }
        landmarks.push_back(point);
    }
    return true;
}

// Progress callback for verbose mode
void progressCallback(double progress, const char* stage) {
    cout << "[PROGRESS] " << stage << ": " << (int)(progress * 100) << "%" << endl;
}

// Error callback for detailed error reporting
void errorCallback(NailSizeResult error_code, const char* error_message) {
    cerr << "[ERROR] Code " << error_code << ": " << error_message << endl;
}

int main(int argc, char* argv[]) {
    Arguments args = parseArguments(argc, argv);

    if (!args.valid) {
        printUsage(argv[0]);
        return 1;
    }

    if (args.verbose) {
        cout << "[INFO] NailSize CLI v" << nail_size_get_version() << endl;
        cout << "[INFO] Processing: " << args.inputPath << " with landmarks " << args.landmarksPath << endl;
    }

    // Validate input file
    if (!nail_size_is_valid_image_file(args.inputPath.c_str())) {
        cerr << "[ERROR] Input file is not a valid image or does not exist: " << args.inputPath << endl;
        return 1;
    }

    vector<NailSizePoint> landmarks;
    if (!loadLandmarks(args.landmarksPath, landmarks)) {
        cerr << "[ERROR] Could not read landmarks from " << args.landmarksPath << endl;
        return 1;
    }
    if (landmarks.size() < NAIL_SIZE_LANDMARK_COUNT) {
        cerr << "[ERROR] Expected " << NAIL_SIZE_LANDMARK_COUNT << " landmarks, found " << landmarks.size() << endl;
        return 1;
    }

    // Get default parameters
    NailSizeParams params;
    nail_size_get_default_params(&params);
    params.verbose_output = args.verbose;

    // Enable debug output if requested
    if (args.debug) {
        params.enable_debug_output = true;
        cout << "[INFO] Debug mode enabled - images will be saved to ./debug/" << endl;
    }

    if (args.curvature > 0.0) {
        params.curvature_multiplier = args.curvature;
        cout << "[INFO] Curvature multiplier: " << args.curvature << endl;
    }

    if (args.edgeThreshold > 0.0) {
        params.edge_threshold = args.edgeThreshold;
        cout << "[INFO] Edge threshold: " << args.edgeThreshold << endl;
    }

    // Validate parameters
    NailSizeResult validation_result = nail_size_validate_params(&params);
    if (validation_result != NAIL_SIZE_SUCCESS) {
        cerr << "[ERROR] Invalid parameters: " << nail_size_get_error_message(validation_result) << endl;
        return 1;
    }

    NailSizeHandResult result;
    NailSizeResult status = nail_size_measure_image(
        args.inputPath.c_str(),
        landmarks.data(),
        static_cast<int32_t>(landmarks.size()),
        args.hasGuide ? &args.guide : nullptr,
        &params,
        &result,
        args.verbose ? progressCallback : nullptr,
        errorCallback
    );

    if (status != NAIL_SIZE_SUCCESS) {
        cerr << "[ERROR] Measurement failed: " << nail_size_get_error_message(status) << endl;
        return 1;
    }

    cout << fixed << setprecision(2);
    cout << "[SUCCESS] Card found: " << result.card.width_px << "x" << result.card.height_px
         << "px, scale " << result.card.pixels_per_mm << " pixels/mm" << endl;

    vector<NailSize::NailMeasurement> measurements;
    for (int i = 0; i < result.nail_count; i++) {
        const NailSizeNail& nail = result.nails[i];
        NailSize::NailMeasurement m;
        m.digit = static_cast<NailSize::Digit>(nail.digit);
        m.widthPixels = nail.width_px;
        m.chordMM = nail.chord_mm;
        m.curvedMM = nail.curved_mm;
        m.size = nail.size;
        m.confidence = nail.confidence;
        measurements.push_back(m);

        cout << "  " << NailSize::digitName(m.digit) << ": " << m.widthPixels << "px, "
             << m.chordMM << "mm chord, " << m.curvedMM << "mm curved, size " << m.size
             << " (confidence " << m.confidence << ")" << endl;
    }

    for (const string& issue : NailSize::NailMeasurer::reviewMeasurements(measurements)) {
        cout << "[WARN] " << issue << endl;
    }

    vector<NailSize::NailMeasurement> none;
    cout << "\n" << (args.leftHand ? NailSize::NailMeasurer::formatReport(measurements, none)
                                   : NailSize::NailMeasurer::formatReport(none, measurements));
    return 0;
}
