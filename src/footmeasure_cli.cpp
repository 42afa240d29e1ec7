#include <FootMeasureAPI.h>
#include <iostream>
#include <iomanip>
#include <stdexcept>
#include <string>

using namespace std;

struct Arguments {
    string inputPath;
    bool valid = false;
    bool verbose = false;
    bool debug = false;
    double cmPerPixel = 0.2;
    double cannyLower = 50.0;
    double cannyUpper = 150.0;
    int blurSize = 5;
};

Arguments parseArguments(int argc, char* argv[]) {
    Arguments args;

    if (argc < 2) {
        return args;
    }

    for (int i = 1; i < argc; i++) {
        string arg = argv[i];
        if ((arg == "-i" || arg == "--input") && (i + 1 < argc)) {
            args.inputPath = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-d" || arg == "--debug") {
            args.debug = true;
        } else if ((arg == "--cm-per-pixel") && (i + 1 < argc)) {
            args.cmPerPixel = stod(argv[++i]);
        } else if ((arg == "--canny-lower") && (i + 1 < argc)) {
            args.cannyLower = stod(argv[++i]);
        } else if ((arg == "--canny-upper") && (i + 1 < argc)) {
            args.cannyUpper = stod(argv[++i]);
        } else if ((arg == "--blur-size") && (i + 1 < argc)) {
            args.blurSize = stoi(argv[++i]);
        } else if (arg == "--help" || arg == "-h") {
            return args; // Will trigger usage display
        }
    }

    if (args.inputPath.empty()) {
        return args;
    }

    args.valid = true;
    return args;
}

void printUsage(const char* progName) {
    cout << "FootMeasure CLI - Estimate foot length from a photo\n"
         << "Using libfootmeasure v" << foot_measure_get_version() << "\n"
         << "\n"
         << "Usage: " << progName << " -i <input_image> [options]\n"
         << "\n"
         << "Required:\n"
         << "  -i, --input   Input image file path (.png, .jpg, .jpeg)\n"
         << "\n"
         << "Measurement:\n"
         << "  --cm-per-pixel <cm>  Pixel to centimeter conversion factor (default: 0.2)\n"
         << "  --canny-lower <0-1000>  Lower edge threshold (default: 50)\n"
         << "  --canny-upper <0-1000>  Upper edge threshold (default: 150)\n"
         << "  --blur-size <odd>  Gaussian blur kernel size (default: 5)\n"
         << "\n"
         << "General:\n"
         << "  -v, --verbose Enable verbose output\n"
         << "  -d, --debug   Enable debug visualization (saves step-by-step images)\n"
         << "  -h, --help    Show this help message\n"
         << "\n"
         << "Examples:\n"
         << "  " << progName << " -i foot.jpg\n"
         << "  " << progName << " -i foot.png --cm-per-pixel 0.15\n"
         << "  " << progName << " -i foot.png -d  # Saves debug images to ./debug/\n"
         << endl;
}

// Progress callback for verbose mode
void progressCallback(double progress, const char* stage) {
    cout << "[PROGRESS] " << stage << ": " << static_cast<int>(progress * 100) << "%" << endl;
}

// Error callback for detailed error reporting
void errorCallback(FootMeasureStatus error_code, const char* error_message) {
    cerr << "[ERROR] Code " << error_code << ": " << error_message << endl;
}

int main(int argc, char* argv[]) {
    Arguments args;
    try {
        args = parseArguments(argc, argv);
    } catch (const invalid_argument& e) {
        cerr << "[ERROR] Invalid numeric option: " << e.what() << endl;
        return 1;
    } catch (const out_of_range& e) {
        cerr << "[ERROR] Numeric option out of range: " << e.what() << endl;
        return 1;
    }

    if (!args.valid) {
        printUsage(argv[0]);
        return 1;
    }

    if (args.verbose) {
        cout << "[INFO] FootMeasure CLI v" << foot_measure_get_version() << endl;
        cout << "[INFO] Processing: " << args.inputPath << endl;
    }

    FootMeasureParams params;
    foot_measure_get_default_params(&params);

    params.cm_per_pixel = args.cmPerPixel;
    params.canny_lower = args.cannyLower;
    params.canny_upper = args.cannyUpper;
    params.blur_kernel_size = args.blurSize;
    params.verbose_output = args.verbose;

    if (args.debug) {
        params.enable_debug_output = true;
        cout << "[INFO] Debug mode enabled - images will be saved to ./debug/" << endl;
    }

    FootMeasureStatus validation_result = foot_measure_validate_params(&params);
    if (validation_result != FOOT_MEASURE_SUCCESS) {
        cerr << "[ERROR] " << foot_measure_get_error_message(validation_result) << endl;
        return 1;
    }

    if (args.verbose) {
        cout << "[INFO] Using parameters:" << endl;
        cout << "  Blur kernel: " << params.blur_kernel_size << "x" << params.blur_kernel_size << endl;
        cout << "  Canny edges: " << params.canny_lower << "-" << params.canny_upper << endl;
        cout << "  Conversion factor: " << params.cm_per_pixel << " cm/pixel" << endl;
    }

    FootMeasureResult result;
    FootMeasureStatus status = foot_measure_measure_file(
        args.inputPath.c_str(),
        &params,
        &result,
        args.verbose ? progressCallback : nullptr,
        args.verbose ? errorCallback : nullptr
    );

    if (status == FOOT_MEASURE_SUCCESS) {
        cout << "[SUCCESS] Foot length: " << fixed << setprecision(2) << result.length_cm << " cm" << endl;
        if (args.verbose) {
            cout << "[INFO] Bounding box: " << result.box_width << "x" << result.box_height
                 << " px at (" << result.box_x << "," << result.box_y << ")" << endl;
        }
        return 0;
    }

    cerr << "[ERROR] Measurement failed: " << foot_measure_get_error_message(status) << endl;
    return status == FOOT_MEASURE_ERROR_NO_CONTOUR ? 2 : 1;
}
