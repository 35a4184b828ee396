#include <PlotCropAPI.h>
#include <iostream>
#include <string>
#include <fstream>
#include <stdexcept>

using namespace std;

struct Arguments {
    string inputPath;
    string outputPath;
    bool valid = false;
    bool verbose = false;

    // Edge detection
    double lowThreshold = 60.0;
    double highThreshold = 140.0;

    // Rectangle search
    int dilationIterations = 1;
    double minAreaPercent = 20.0;
    int insetMargin = 10;

    // Orientation
    bool mirrorX = false;
    bool mirrorY = false;
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
        } else if ((arg == "-o" || arg == "--output") && (i + 1 < argc)) {
            args.outputPath = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            args.verbose = true;
        } else if ((arg == "--low") && (i + 1 < argc)) {
            args.lowThreshold = stod(argv[++i]);
        } else if ((arg == "--high") && (i + 1 < argc)) {
            args.highThreshold = stod(argv[++i]);
        } else if ((arg == "--dilate") && (i + 1 < argc)) {
            args.dilationIterations = stoi(argv[++i]);
        } else if ((arg == "--min-area") && (i + 1 < argc)) {
            args.minAreaPercent = stod(argv[++i]);
        } else if ((arg == "--inset") && (i + 1 < argc)) {
            args.insetMargin = stoi(argv[++i]);
        } else if (arg == "--mirror-x") {
            args.mirrorX = true;
        } else if (arg == "--mirror-y") {
            args.mirrorY = true;
        } else if (arg == "--help" || arg == "-h") {
            return args; // Will trigger usage display
        }
    }

    if (args.inputPath.empty()) {
        return args;
    }

    // Auto-generate output path if not provided
    if (args.outputPath.empty()) {
        size_t dotPos = args.inputPath.find_last_of('.');
        size_t slashPos = args.inputPath.find_last_of("/\\");
        if (dotPos == string::npos || (slashPos != string::npos && dotPos < slashPos)) {
            args.outputPath = args.inputPath + "_cropped.png";
        } else {
            args.outputPath = args.inputPath.substr(0, dotPos) + "_cropped.png";
        }
    }

    args.valid = true;
    return args;
}

void printUsage(const char* progName) {
    cout << "PlotCrop CLI - Crop photos of plans to their inner rectangle\n"
         << "Using libplotcrop v" << plot_crop_get_version() << "\n"
         << "\n"
         << "Usage: " << progName << " -i <input_image> [-o <output_png>] [options]\n"
         << "\n"
         << "Required:\n"
         << "  -i, --input   Input image file path\n"
         << "\n"
         << "Optional:\n"
         << "  -o, --output  Output PNG file path (default: <input>_cropped.png)\n"
         << "\n"
         << "Rectangle Detection:\n"
         << "  --low <value>       Weak edge threshold (default: 60)\n"
         << "  --high <value>      Strong edge threshold (default: 140)\n"
         << "  --dilate <n>        Dilation passes to close edge gaps (default: 1)\n"
         << "  --min-area <pct>    Minimum rectangle area as % of the image (default: 20)\n"
         << "  --inset <px>        Pixels trimmed inside the detected rectangle (default: 10)\n"
         << "\n"
         << "Orientation:\n"
         << "  --mirror-x    Mirror the result horizontally\n"
         << "  --mirror-y    Mirror the result vertically\n"
         << "\n"
         << "General:\n"
         << "  -v, --verbose Enable verbose output\n"
         << "  -h, --help    Show this help message\n"
         << "\n"
         << "Examples:\n"
         << "  " << progName << " -i plan.jpg\n"
         << "  " << progName << " -i plan.jpg -o plot.png\n"
         << "  " << progName << " -i plan.jpg --inset 0          # Keep the detected edges\n"
         << "  " << progName << " -i plan.jpg --min-area 10      # Accept smaller plans\n"
         << "  " << progName << " -i plan.jpg --mirror-x --mirror-y  # Rotate result by 180 degrees\n"
         << endl;
}

// Progress callback for verbose mode
void progressCallback(double progress, const char* stage) {
    cout << "[PROGRESS] " << stage << ": " << static_cast<int>(progress * 100) << "%" << endl;
}

// Error callback for detailed error reporting
void errorCallback(PlotCropResult error_code, const char* error_message) {
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
        cout << "[INFO] PlotCrop CLI v" << plot_crop_get_version() << endl;
        cout << "[INFO] Processing: " << args.inputPath << " -> " << args.outputPath << endl;
    }

    if (!std::ifstream(args.inputPath).good()) {
        cerr << "[ERROR] Input file is not readable: " << args.inputPath << endl;
        return 1;
    }

    PlotCropParams params;
    plot_crop_get_default_params(&params);
    params.edge_low_threshold = args.lowThreshold;
    params.edge_high_threshold = args.highThreshold;
    params.dilation_iterations = args.dilationIterations;
    params.min_area_percent = args.minAreaPercent;
    params.inset_margin_px = args.insetMargin;
    params.mirror_x = args.mirrorX;
    params.mirror_y = args.mirrorY;
    params.verbose_output = args.verbose;

    PlotCropResult validation_result = plot_crop_validate_params(&params);
    if (validation_result != PLOT_CROP_SUCCESS) {
        cerr << "[ERROR] " << plot_crop_get_error_message(validation_result) << endl;
        return 1;
    }

    if (args.verbose) {
        cout << "[INFO] Using parameters:" << endl;
        cout << "  Edge thresholds: " << params.edge_low_threshold << "-" << params.edge_high_threshold << endl;
        cout << "  Dilation passes: " << params.dilation_iterations << endl;
        cout << "  Min rectangle area: " << params.min_area_percent << "%" << endl;
        cout << "  Inset margin: " << params.inset_margin_px << "px" << endl;
        cout << "  Mirror: " << (params.mirror_x ? "x " : "") << (params.mirror_y ? "y" : "")
             << (!params.mirror_x && !params.mirror_y ? "none" : "") << endl;
    }

    PlotCropImage image = {nullptr, 0, 0, 0};
    PlotCropResult result = plot_crop_process_image_to_file(
        args.inputPath.c_str(),
        args.outputPath.c_str(),
        &params,
        &image,
        args.verbose ? progressCallback : nullptr,
        errorCallback
    );

    if (result == PLOT_CROP_SUCCESS) {
        cout << "[SUCCESS] Image size: " << image.width << " x " << image.height << endl;
        cout << "[INFO] Output saved to: " << args.outputPath << endl;
        return 0;
    } else {
        cerr << "[ERROR] Processing failed: " << plot_crop_get_error_message(result) << endl;
        return 1;
    }
}
