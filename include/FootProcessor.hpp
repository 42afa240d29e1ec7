#pragma once

#include <opencv2/opencv.hpp>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace FootMeasure {

// Thrown by the decode stage when the bytes are not a valid image of the declared type
class ImageDecodeError : public std::runtime_error {
public:
    explicit ImageDecodeError(const std::string& what) : std::runtime_error(what) {}
};

enum class MimeType {
    PNG,
    JPEG
};

enum class MeasurementStatus {
    Success,
    DecodeError,
    NoContourFound,
    InternalError
};

struct MeasurementResult {
    MeasurementStatus status = MeasurementStatus::InternalError;
    double lengthCm = 0.0;          // Rounded to two decimals, valid on Success
    cv::Rect boundingBox;           // Bounding box of the selected contour in pixels
    double contourArea = 0.0;
    size_t contourCount = 0;
    std::string message;

    bool ok() const { return status == MeasurementStatus::Success; }
};

// Stage images collected during one invocation, written out at the end of the call
struct DebugStack {
    std::vector<std::pair<cv::Mat, std::string>> images;
};

class FootProcessor {
public:
    struct ProcessingParams {
        // Noise suppression
        int blurKernelSize = 5;         // Square Gaussian kernel, odd
        double blurSigma = 0.0;         // 0 = derived from kernel size

        // Edge detection parameters
        double cannyLower = 50.0;
        double cannyUpper = 150.0;
        int cannyAperture = 3;
        bool l2Gradient = false;

        // Pixel to metric conversion (uncalibrated camera distance)
        double cmPerPixel = 0.2;

        // Debug visualization
        bool enableDebugOutput = false;
        bool verboseOutput = true;      // Enable console output for each stage
        std::string debugOutputPath = "./debug/";
    };

    static const char* mimeTypeName(MimeType mimeType);
    static const char* statusName(MeasurementStatus status);
    static bool hasSignature(const std::vector<uchar>& bytes, MimeType mimeType);

    // Pipeline stages
    static cv::Mat decodeImage(const std::vector<uchar>& bytes, MimeType mimeType,
                               const ProcessingParams& params);
    // Expects the 3-channel BGR image produced by decodeImage
    static cv::Mat convertToGrayscale(const cv::Mat& img, const ProcessingParams& params);
    static cv::Mat suppressNoise(const cv::Mat& grayImg, const ProcessingParams& params);
    static cv::Mat detectEdges(const cv::Mat& blurredImg, const ProcessingParams& params);
    static std::vector<std::vector<cv::Point>> extractContours(const cv::Mat& edgeImg,
                                                              const ProcessingParams& params);
    static int selectLargestContour(const std::vector<std::vector<cv::Point>>& contours,
                                    const ProcessingParams& params);
    static cv::Rect measureBoundingBox(const std::vector<cv::Point>& contour);
    static double pixelsToCentimeters(int widthPx, double cmPerPixel);

    // Complete pipeline, never throws
    static MeasurementResult measureFoot(const std::vector<uchar>& imageBytes,
                                         MimeType mimeType,
                                         const ProcessingParams& params);
    static MeasurementResult measureFoot(const std::vector<uchar>& imageBytes,
                                         MimeType mimeType);

    // Debug stack methods
    static void pushDebugImage(DebugStack& stack, const cv::Mat& image, const std::string& name,
                               const ProcessingParams& params);
    static void pushDebugContours(DebugStack& stack, const cv::Mat& image,
                                  const std::vector<std::vector<cv::Point>>& contours,
                                  int selectedIdx, const std::string& name,
                                  const ProcessingParams& params);
    static void flushDebugStack(DebugStack& stack, const ProcessingParams& params);
};

} // namespace FootMeasure
