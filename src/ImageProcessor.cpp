#include "ImageProcessor.hpp"
#include <iostream>
#include <fstream>
#include <iterator>
#include <algorithm>
#include <cmath>

using namespace cv;
using namespace std;

namespace PlotCrop {

namespace {

uchar roundHalfUp(double value) {
    return static_cast<uchar>(std::floor(value + 0.5));
}

void requireSingleChannel(const Mat& img, const char* stage) {
    if (img.empty()) {
        throw ProcessingError(string(stage) + ": input buffer is empty");
    }
    if (img.type() != CV_8UC1) {
        throw ProcessingError(string(stage) + ": expected a single channel 8-bit buffer");
    }
}

} // namespace

// Loading

vector<uchar> ImageProcessor::readFileBytes(const string& path) {
    if (path.empty()) {
        throw DecodeError("Image path cannot be empty");
    }

    ifstream file(path, ios::binary);
    if (!file.good()) {
        cerr << "[ERROR] Could not open image " << path << endl;
        throw DecodeError("Failed to open image: " + path);
    }

    vector<uchar> bytes((istreambuf_iterator<char>(file)), istreambuf_iterator<char>());
    if (bytes.empty()) {
        throw DecodeError("Image file is empty: " + path);
    }
    return bytes;
}

Mat ImageProcessor::decodeAndScale(const vector<uchar>& encoded, const CropConfig& config) {
    if (encoded.empty()) {
        throw DecodeError("Failed to decode image: input buffer is empty");
    }

    Mat img;
    try {
        // Keep an 8-bit alpha channel for the returned canvas; everything
        // else is normalised to 8-bit BGR
        img = imdecode(encoded, IMREAD_UNCHANGED);
        if (!img.empty() && img.type() != CV_8UC4) {
            img = imdecode(encoded, IMREAD_COLOR);
        }
    } catch (const cv::Exception& e) {
        throw DecodeError(string("Failed to decode image: ") + e.what());
    }

    if (img.empty()) {
        cerr << "[ERROR] Could not decode " << encoded.size() << " bytes as an image" << endl;
        throw DecodeError("Failed to decode image: unsupported or corrupt data");
    }

    if (config.verboseOutput) {
        cout << "[INFO] Image decoded successfully. Shape: " << img.cols << " x " << img.rows << endl;
    }

    Mat scaled = scaleToMaxSide(img);
    if (config.verboseOutput && scaled.size() != img.size()) {
        cout << "[INFO] Scaled image down to " << scaled.cols << " x " << scaled.rows << endl;
    }
    return scaled;
}

Mat ImageProcessor::scaleToMaxSide(const Mat& img, int maxSide) {
    if (img.empty()) {
        throw DecodeError("Cannot scale an empty image");
    }

    double scale = min(1.0, static_cast<double>(maxSide) / max(img.cols, img.rows));
    if (scale >= 1.0) {
        return img.clone();
    }

    int width = max(1, static_cast<int>(std::floor(img.cols * scale + 0.5)));
    int height = max(1, static_cast<int>(std::floor(img.rows * scale + 0.5)));

    Mat scaled;
    resize(img, scaled, Size(width, height), 0, 0, INTER_AREA);
    return scaled;
}

// Pixel stages

Mat ImageProcessor::convertToGrayscale(const Mat& img) {
    if (img.empty()) {
        throw ProcessingError("Grayscale: input buffer is empty");
    }
    if (img.depth() != CV_8U) {
        throw ProcessingError("Grayscale: expected an 8-bit image");
    }
    if (img.channels() == 1) {
        return img.clone();
    }

    const int channels = img.channels();
    if (channels != 3 && channels != 4) {
        throw ProcessingError("Grayscale: unsupported channel count " + to_string(channels));
    }

    // Channel order is B, G, R[, A]; alpha is ignored
    Mat gray(img.size(), CV_8UC1);
    for (int y = 0; y < img.rows; y++) {
        const uchar* src = img.ptr<uchar>(y);
        uchar* dst = gray.ptr<uchar>(y);
        for (int x = 0; x < img.cols; x++) {
            const uchar* px = src + x * channels;
            dst[x] = roundHalfUp(0.299 * px[2] + 0.587 * px[1] + 0.114 * px[0]);
        }
    }
    return gray;
}

Mat ImageProcessor::applyBlur(const Mat& gray) {
    requireSingleChannel(gray, "Blur");

    static const int kernel[3][3] = {
        {1, 2, 1},
        {2, 4, 2},
        {1, 2, 1}
    };
    const int kernelSum = 16;

    // The one pixel border stays at zero
    Mat blurred = Mat::zeros(gray.size(), CV_8UC1);
    for (int y = 1; y < gray.rows - 1; y++) {
        uchar* dst = blurred.ptr<uchar>(y);
        for (int x = 1; x < gray.cols - 1; x++) {
            int sum = 0;
            for (int ky = -1; ky <= 1; ky++) {
                const uchar* row = gray.ptr<uchar>(y + ky);
                for (int kx = -1; kx <= 1; kx++) {
                    sum += row[x + kx] * kernel[ky + 1][kx + 1];
                }
            }
            dst[x] = static_cast<uchar>((sum + kernelSum / 2) / kernelSum);
        }
    }
    return blurred;
}

Mat ImageProcessor::detectEdges(const Mat& blurred, double lowThreshold, double highThreshold) {
    requireSingleChannel(blurred, "Edge detection");

    static const int sobelX[3][3] = {
        {-1, 0, 1},
        {-2, 0, 2},
        {-1, 0, 1}
    };
    static const int sobelY[3][3] = {
        {-1, -2, -1},
        { 0,  0,  0},
        { 1,  2,  1}
    };

    const int width = blurred.cols;
    const int height = blurred.rows;

    // 1. Gradients
    Mat magnitude = Mat::zeros(blurred.size(), CV_32FC1);
    Mat direction = Mat::zeros(blurred.size(), CV_32FC1);
    for (int y = 1; y < height - 1; y++) {
        for (int x = 1; x < width - 1; x++) {
            int gx = 0, gy = 0;
            for (int ky = -1; ky <= 1; ky++) {
                const uchar* row = blurred.ptr<uchar>(y + ky);
                for (int kx = -1; kx <= 1; kx++) {
                    int value = row[x + kx];
                    gx += value * sobelX[ky + 1][kx + 1];
                    gy += value * sobelY[ky + 1][kx + 1];
                }
            }
            magnitude.at<float>(y, x) = static_cast<float>(std::sqrt(static_cast<double>(gx * gx + gy * gy)));
            direction.at<float>(y, x) = static_cast<float>(std::atan2(static_cast<double>(gy), static_cast<double>(gx)));
        }
    }

    // 2. Non-maximum suppression with strong (255) / weak (128) classification
    Mat suppressed = Mat::zeros(blurred.size(), CV_8UC1);
    for (int y = 1; y < height - 1; y++) {
        for (int x = 1; x < width - 1; x++) {
            float mag = magnitude.at<float>(y, x);
            double angle = direction.at<float>(y, x);
            if (angle < 0) angle += CV_PI;

            float neighbor1, neighbor2;
            if (angle < CV_PI / 8 || angle >= 7 * CV_PI / 8) {
                // Horizontal gradient
                neighbor1 = magnitude.at<float>(y, x - 1);
                neighbor2 = magnitude.at<float>(y, x + 1);
            } else if (angle < 3 * CV_PI / 8) {
                neighbor1 = magnitude.at<float>(y - 1, x - 1);
                neighbor2 = magnitude.at<float>(y + 1, x + 1);
            } else if (angle < 5 * CV_PI / 8) {
                // Vertical gradient
                neighbor1 = magnitude.at<float>(y - 1, x);
                neighbor2 = magnitude.at<float>(y + 1, x);
            } else {
                neighbor1 = magnitude.at<float>(y - 1, x + 1);
                neighbor2 = magnitude.at<float>(y + 1, x - 1);
            }

            if (mag >= neighbor1 && mag >= neighbor2) {
                suppressed.at<uchar>(y, x) = mag > highThreshold ? 255 : (mag > lowThreshold ? 128 : 0);
            }
        }
    }

    // 3. Hysteresis
    Mat edges = Mat::zeros(blurred.size(), CV_8UC1);
    for (int y = 1; y < height - 1; y++) {
        for (int x = 1; x < width - 1; x++) {
            if (suppressed.at<uchar>(y, x) == 255) {
                edges.at<uchar>(y, x) = 255;
                traceWeakEdges(suppressed, edges, x, y);
            }
        }
    }

    return edges;
}

void ImageProcessor::traceWeakEdges(const Mat& suppressed, Mat& edges, int startX, int startY) {
    vector<Point> stack;
    stack.emplace_back(startX, startY);

    while (!stack.empty()) {
        Point p = stack.back();
        stack.pop_back();

        for (int dy = -1; dy <= 1; dy++) {
            for (int dx = -1; dx <= 1; dx++) {
                int nx = p.x + dx;
                int ny = p.y + dy;
                if (nx < 0 || nx >= edges.cols || ny < 0 || ny >= edges.rows) continue;

                if (suppressed.at<uchar>(ny, nx) == 128 && edges.at<uchar>(ny, nx) == 0) {
                    edges.at<uchar>(ny, nx) = 255;
                    stack.emplace_back(nx, ny);
                }
            }
        }
    }
}

Mat ImageProcessor::dilateEdges(const Mat& edges, int iterations) {
    if (iterations < 0) {
        throw ProcessingError("Dilation iterations must be non-negative, got " + to_string(iterations));
    }
    requireSingleChannel(edges, "Dilation");

    Mat dilated = edges.clone();
    for (int iter = 0; iter < iterations; iter++) {
        // Write into a fresh buffer so one pass does not cascade
        Mat next = dilated.clone();
        for (int y = 1; y < dilated.rows - 1; y++) {
            const uchar* src = dilated.ptr<uchar>(y);
            for (int x = 1; x < dilated.cols - 1; x++) {
                if (src[x] != 255) continue;
                for (int dy = -1; dy <= 1; dy++) {
                    uchar* dst = next.ptr<uchar>(y + dy);
                    dst[x - 1] = 255;
                    dst[x] = 255;
                    dst[x + 1] = 255;
                }
            }
        }
        dilated = next;
    }
    return dilated;
}

vector<Contour> ImageProcessor::findContours(const Mat& mask) {
    requireSingleChannel(mask, "Contour tracing");

    Mat visited = Mat::zeros(mask.size(), CV_8UC1);
    vector<Contour> contours;

    for (int y = 0; y < mask.rows; y++) {
        for (int x = 0; x < mask.cols; x++) {
            if (mask.at<uchar>(y, x) == 255 && visited.at<uchar>(y, x) == 0) {
                Contour contour = traceContour(mask, visited, x, y);
                if (contour.size() >= kMinContourPixels) {
                    contours.push_back(std::move(contour));
                }
            }
        }
    }
    return contours;
}

Contour ImageProcessor::traceContour(const Mat& mask, Mat& visited, int startX, int startY) {
    Contour contour;
    vector<Point> stack;
    stack.emplace_back(startX, startY);

    while (!stack.empty()) {
        Point p = stack.back();
        stack.pop_back();

        // A pixel may be pushed more than once before it is visited
        if (visited.at<uchar>(p) != 0 || mask.at<uchar>(p) != 255) continue;

        visited.at<uchar>(p) = 1;
        contour.push_back(p);

        for (int dy = -1; dy <= 1; dy++) {
            for (int dx = -1; dx <= 1; dx++) {
                int nx = p.x + dx;
                int ny = p.y + dy;
                if (nx < 0 || nx >= mask.cols || ny < 0 || ny >= mask.rows) continue;

                if (visited.at<uchar>(ny, nx) == 0 && mask.at<uchar>(ny, nx) == 255) {
                    stack.emplace_back(nx, ny);
                }
            }
        }
    }
    return contour;
}

// Width and height are max - min, not pixel counts
Rect ImageProcessor::boundingBox(const Contour& contour) {
    int minX = contour[0].x, maxX = contour[0].x;
    int minY = contour[0].y, maxY = contour[0].y;
    for (const Point& pt : contour) {
        minX = min(minX, pt.x);
        maxX = max(maxX, pt.x);
        minY = min(minY, pt.y);
        maxY = max(maxY, pt.y);
    }
    return Rect(minX, minY, maxX - minX, maxY - minY);
}

// Coarse orientation from the first and last traced points, in degrees.
// Not a minimum-area rectangle fit.
double ImageProcessor::estimateAngle(const Contour& contour) {
    if (contour.size() <= 2) return 0.0;

    const Point& first = contour.front();
    const Point& last = contour.back();
    return std::atan2(static_cast<double>(last.y - first.y),
                      static_cast<double>(last.x - first.x)) * 180.0 / CV_PI;
}

optional<CandidateRect> ImageProcessor::findBestRectangle(const vector<Contour>& contours,
                                                          int width, int height,
                                                          double minAreaPercent) {
    const double imageArea = static_cast<double>(width) * height;
    const double minArea = imageArea * (minAreaPercent / 100.0);
    const int borderPad = static_cast<int>(std::floor(min(width, height) * 0.02 + 0.5));

    optional<CandidateRect> best;
    double bestScore = 0.0;

    for (const Contour& contour : contours) {
        if (contour.empty()) continue;

        Rect box = boundingBox(contour);
        double boxArea = static_cast<double>(box.width) * box.height;
        if (boxArea < minArea) continue;

        // Plan rectangles are assumed to sit inside the image, not on its frame
        if (box.x <= borderPad || box.y <= borderPad ||
            box.x + box.width >= width - borderPad ||
            box.y + box.height >= height - borderPad) {
            continue;
        }

        double angle = estimateAngle(contour);
        double folded = std::fabs(std::fmod(angle, 90.0));
        double axisAlignmentFactor = 1.0 - min(folded, 90.0 - folded) / 10.0;
        double score = boxArea * axisAlignmentFactor;

        if (!best || score > bestScore) {
            best = CandidateRect{box.x, box.y, box.width, box.height, angle};
            bestScore = score;
        }
    }

    return best;
}

Mat ImageProcessor::cropToRectangle(const Mat& canvas, const CandidateRect& rect, int insetMarginPx) {
    if (canvas.empty()) {
        throw ProcessingError("Crop: canvas is empty");
    }

    // Inset is limited to a quarter of the rectangle on each axis
    double margin = max(0, insetMarginPx);
    double insetX = min(margin, rect.width / 4.0);
    double insetY = min(margin, rect.height / 4.0);

    int cropX = max(0, static_cast<int>(std::floor(rect.x + insetX)));
    int cropY = max(0, static_cast<int>(std::floor(rect.y + insetY)));
    if (cropX >= canvas.cols || cropY >= canvas.rows) {
        throw ProcessingError("Crop: origin lies outside the image");
    }

    int cropWidth = min(canvas.cols - cropX, static_cast<int>(rect.width - 2.0 * insetX));
    int cropHeight = min(canvas.rows - cropY, static_cast<int>(rect.height - 2.0 * insetY));
    cropWidth = max(1, cropWidth);
    cropHeight = max(1, cropHeight);

    return canvas(Rect(cropX, cropY, cropWidth, cropHeight)).clone();
}

Mat ImageProcessor::mirrorImage(const Mat& img, bool mirrorX, bool mirrorY) {
    if (img.empty()) {
        throw ProcessingError("Mirror: input image is empty");
    }
    if (!mirrorX && !mirrorY) {
        return img.clone();
    }

    // flip codes: 1 = around the vertical axis, 0 = around the horizontal axis, -1 = both
    int flipCode = (mirrorX && mirrorY) ? -1 : (mirrorX ? 1 : 0);
    Mat mirrored;
    flip(img, mirrored, flipCode);
    return mirrored;
}

vector<uchar> ImageProcessor::encodeImage(const Mat& img) {
    if (img.empty()) {
        throw ProcessingError("Cannot encode an empty image");
    }

    vector<uchar> encoded;
    if (!imencode(".png", img, encoded)) {
        throw ProcessingError("Failed to encode image as PNG");
    }
    return encoded;
}

// Pipeline

optional<CandidateRect> ImageProcessor::locateRectangle(const Mat& scaled, const CropConfig& config) {
    if (config.verboseOutput) {
        cout << "[INFO] Searching for plan rectangle in " << scaled.cols << " x " << scaled.rows << " image" << endl;
    }

    Mat gray = convertToGrayscale(scaled);
    Mat blurred = applyBlur(gray);
    Mat edges = detectEdges(blurred, config.edgeLowThreshold, config.edgeHighThreshold);
    Mat dilated = dilateEdges(edges, config.dilationIterations);

    vector<Contour> contours = findContours(dilated);
    if (config.verboseOutput) {
        cout << "[INFO] Found " << contours.size() << " contours" << endl;
    }

    return findBestRectangle(contours, scaled.cols, scaled.rows, config.minAreaPercent);
}

Mat ImageProcessor::runCropPipeline(const Mat& scaled, const CropConfig& config) {
    return runCropPipeline(scaled, config, &ImageProcessor::locateRectangle);
}

Mat ImageProcessor::runCropPipeline(const Mat& scaled, const CropConfig& config, const RectangleLocator& locate) {
    try {
        optional<CandidateRect> best = locate(scaled, config);
        if (!best) {
            cout << "[WARN] No qualifying rectangle found, keeping full image" << endl;
            return scaled.clone();
        }

        if (config.verboseOutput) {
            cout << "[INFO] Selected rectangle at (" << best->x << ", " << best->y << ") size "
                 << best->width << " x " << best->height << ", angle " << best->angle << endl;
        }

        Mat cropped = cropToRectangle(scaled, *best, config.insetMarginPx);
        if (config.verboseOutput) {
            cout << "[INFO] Cropped to " << cropped.cols << " x " << cropped.rows << endl;
        }
        return cropped;

    } catch (const ProcessingError& e) {
        cout << "[WARN] Rectangle extraction failed: " << e.what() << ", keeping full image" << endl;
    } catch (const cv::Exception& e) {
        cout << "[WARN] OpenCV error during rectangle extraction: " << e.what() << ", keeping full image" << endl;
    } catch (const std::exception& e) {
        cout << "[WARN] Unexpected error during rectangle extraction: " << e.what() << ", keeping full image" << endl;
    }
    return scaled.clone();
}

PipelineResult ImageProcessor::process(const vector<uchar>& encoded, const CropConfig& config,
                                       bool mirrorX, bool mirrorY) {
    // Decode failures propagate; everything after this point degrades instead
    Mat scaled = decodeAndScale(encoded, config);
    Mat result = runCropPipeline(scaled, config);

    PipelineResult out;
    try {
        Mat oriented = mirrorImage(result, mirrorX, mirrorY);
        out.imageData = encodeImage(oriented);
        out.width = oriented.cols;
        out.height = oriented.rows;
    } catch (const std::exception& e) {
        cout << "[WARN] Could not finalize cropped image: " << e.what() << ", returning scaled image" << endl;
        Mat oriented = mirrorImage(scaled, mirrorX, mirrorY);
        out.imageData = encodeImage(oriented);
        out.width = oriented.cols;
        out.height = oriented.rows;
    }

    if (config.verboseOutput) {
        cout << "[INFO] Pipeline finished. Result: " << out.width << " x " << out.height
             << " (" << out.imageData.size() << " bytes)" << endl;
    }
    return out;
}

PipelineResult ImageProcessor::processFile(const string& inputPath, const CropConfig& config,
                                           bool mirrorX, bool mirrorY) {
    if (config.verboseOutput) {
        cout << "[INFO] Loading image from: " << inputPath << endl;
    }
    vector<uchar> bytes = readFileBytes(inputPath);
    return process(bytes, config, mirrorX, mirrorY);
}

} // namespace PlotCrop
