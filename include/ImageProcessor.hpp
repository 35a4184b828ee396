#pragma once

#include <opencv2/opencv.hpp>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace PlotCrop {

// Source image could not be read or decoded. Always propagated to the caller.
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

// Failure inside a pixel stage. Recovered by falling back to the scaled image.
class ProcessingError : public std::runtime_error {
public:
    explicit ProcessingError(const std::string& what) : std::runtime_error(what) {}
};

struct CropConfig {
    // Edge detection parameters
    double edgeLowThreshold  = 60.0;   // Weak-edge cutoff
    double edgeHighThreshold = 140.0;  // Strong-edge cutoff

    // Gap closing before contour tracing
    int dilationIterations = 1;

    // Rectangle selection
    double minAreaPercent = 20.0;      // Minimum box area as % of image area

    // Cropping
    int insetMarginPx = 10;            // Trimmed inward from each detected edge

    bool verboseOutput = true;         // Enable [INFO] console output
};

struct CandidateRect {
    int x = 0;
    int y = 0;
    int width = 0;       // maxX - minX of the contour
    int height = 0;      // maxY - minY of the contour
    double angle = 0.0;  // Degrees, first-to-last contour point direction
};

struct PipelineResult {
    std::vector<uchar> imageData;  // PNG encoded
    int width = 0;
    int height = 0;
};

using Contour = std::vector<cv::Point>;

class ImageProcessor {
public:
    static constexpr int kMaxSide = 1400;
    static constexpr size_t kMinContourPixels = 10;

    // Loading
    static cv::Mat decodeAndScale(const std::vector<uchar>& encoded, const CropConfig& config);
    static cv::Mat scaleToMaxSide(const cv::Mat& img, int maxSide = kMaxSide);

    // Pixel stages
    static cv::Mat convertToGrayscale(const cv::Mat& img);
    static cv::Mat applyBlur(const cv::Mat& gray);
    static cv::Mat detectEdges(const cv::Mat& blurred, double lowThreshold, double highThreshold);
    static cv::Mat dilateEdges(const cv::Mat& edges, int iterations);
    static std::vector<Contour> findContours(const cv::Mat& mask);
    static std::optional<CandidateRect> findBestRectangle(const std::vector<Contour>& contours,
                                                          int width, int height,
                                                          double minAreaPercent);
    static cv::Mat cropToRectangle(const cv::Mat& canvas, const CandidateRect& rect, int insetMarginPx);
    static cv::Mat mirrorImage(const cv::Mat& img, bool mirrorX, bool mirrorY);

    // Grayscale through rectangle selection on an already scaled image
    static std::optional<CandidateRect> locateRectangle(const cv::Mat& scaled, const CropConfig& config);

    using RectangleLocator = std::function<std::optional<CandidateRect>(const cv::Mat&, const CropConfig&)>;

    // Runs the locator and crops; returns the unmodified input when no
    // rectangle qualifies or any step throws.
    static cv::Mat runCropPipeline(const cv::Mat& scaled, const CropConfig& config);
    static cv::Mat runCropPipeline(const cv::Mat& scaled, const CropConfig& config,
                                   const RectangleLocator& locate);

    static std::vector<uchar> encodeImage(const cv::Mat& img);

    // Entry points
    static PipelineResult process(const std::vector<uchar>& encoded,
                                  const CropConfig& config,
                                  bool mirrorX = false, bool mirrorY = false);
    static PipelineResult processFile(const std::string& inputPath,
                                      const CropConfig& config,
                                      bool mirrorX = false, bool mirrorY = false);

    static std::vector<uchar> readFileBytes(const std::string& path);

private:
    static void traceWeakEdges(const cv::Mat& suppressed, cv::Mat& edges, int startX, int startY);
    static Contour traceContour(const cv::Mat& mask, cv::Mat& visited, int startX, int startY);
    static cv::Rect boundingBox(const Contour& contour);
    static double estimateAngle(const Contour& contour);
};

} // namespace PlotCrop
