#include "FootProcessor.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>

using namespace cv;
using namespace std;

namespace FootMeasure {

namespace {

const uchar kPngSignature[] = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};
const uchar kJpegSignature[] = {0xFF, 0xD8, 0xFF};

// Topmost row first, then leftmost column within that row
Point firstRasterPoint(const vector<Point>& contour) {
    return *min_element(contour.begin(), contour.end(), [](const Point& a, const Point& b) {
        return a.y < b.y || (a.y == b.y && a.x < b.x);
    });
}

} // namespace

const char* FootProcessor::mimeTypeName(MimeType mimeType) {
    switch (mimeType) {
        case MimeType::PNG: return "image/png";
        case MimeType::JPEG: return "image/jpeg";
    }
    return "unknown";
}

const char* FootProcessor::statusName(MeasurementStatus status) {
    switch (status) {
        case MeasurementStatus::Success: return "Success";
        case MeasurementStatus::DecodeError: return "DecodeError";
        case MeasurementStatus::NoContourFound: return "NoContourFound";
        case MeasurementStatus::InternalError: return "InternalError";
    }
    return "Unknown";
}

bool FootProcessor::hasSignature(const vector<uchar>& bytes, MimeType mimeType) {
    const uchar* signature = kPngSignature;
    size_t length = sizeof(kPngSignature);
    if (mimeType == MimeType::JPEG) {
        signature = kJpegSignature;
        length = sizeof(kJpegSignature);
    }

    if (bytes.size() < length) {
        return false;
    }
    return equal(signature, signature + length, bytes.begin());
}

Mat FootProcessor::decodeImage(const vector<uchar>& bytes, MimeType mimeType, const ProcessingParams& params) {
    if (bytes.empty()) {
        throw ImageDecodeError("Image buffer is empty");
    }

    if (!hasSignature(bytes, mimeType)) {
        throw ImageDecodeError(string("Image data is not a valid ") + mimeTypeName(mimeType) + " stream");
    }

    if (params.verboseOutput) {
        cout << "[INFO] Decoding " << bytes.size() << " bytes as " << mimeTypeName(mimeType) << endl;
    }

    Mat img;
    try {
        img = imdecode(bytes, IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        throw ImageDecodeError(string("Failed to decode image: ") + e.what());
    }

    if (img.empty()) {
        throw ImageDecodeError(string("Failed to decode image as ") + mimeTypeName(mimeType));
    }

    if (params.verboseOutput) {
        cout << "[INFO] Image loaded for processing. Shape: " << img.rows << " x " << img.cols
             << " x " << img.channels() << endl;
    }
    return img;
}

Mat FootProcessor::convertToGrayscale(const Mat& img, const ProcessingParams& params) {
    if (params.verboseOutput) {
        cout << "[INFO] Converting image to grayscale." << endl;
    }

    Mat gray;
    cvtColor(img, gray, COLOR_BGR2GRAY);
    return gray;
}

Mat FootProcessor::suppressNoise(const Mat& grayImg, const ProcessingParams& params) {
    if (params.verboseOutput) {
        cout << "[INFO] Applying " << params.blurKernelSize << "x" << params.blurKernelSize
             << " Gaussian blur (sigma " << params.blurSigma << ")" << endl;
    }

    Mat blurred;
    GaussianBlur(grayImg, blurred, Size(params.blurKernelSize, params.blurKernelSize),
                 params.blurSigma, params.blurSigma, BORDER_REPLICATE);
    return blurred;
}

Mat FootProcessor::detectEdges(const Mat& blurredImg, const ProcessingParams& params) {
    if (params.verboseOutput) {
        cout << "[INFO] Detecting edges with Canny (" << params.cannyLower << ", "
             << params.cannyUpper << ")" << endl;
    }

    Mat edges;
    Canny(blurredImg, edges, params.cannyLower, params.cannyUpper, params.cannyAperture, params.l2Gradient);

    if (params.verboseOutput) {
        cout << "[INFO] Edge pixels: " << countNonZero(edges) << endl;
    }
    return edges;
}

vector<vector<Point>> FootProcessor::extractContours(const Mat& edgeImg, const ProcessingParams& params) {
    vector<vector<Point>> contours;
    findContours(edgeImg, contours, RETR_EXTERNAL, CHAIN_APPROX_SIMPLE);

    // findContours does not promise an order, so fix it to raster order of the first boundary pixel
    vector<pair<Point, size_t>> keys;
    keys.reserve(contours.size());
    for (size_t i = 0; i < contours.size(); i++) {
        keys.emplace_back(firstRasterPoint(contours[i]), i);
    }
    stable_sort(keys.begin(), keys.end(), [](const pair<Point, size_t>& a, const pair<Point, size_t>& b) {
        return a.first.y < b.first.y || (a.first.y == b.first.y && a.first.x < b.first.x);
    });

    vector<vector<Point>> ordered;
    ordered.reserve(contours.size());
    for (const auto& key : keys) {
        ordered.push_back(std::move(contours[key.second]));
    }

    if (params.verboseOutput) {
        cout << "[INFO] Found " << ordered.size() << " outer contours" << endl;
    }
    return ordered;
}

int FootProcessor::selectLargestContour(const vector<vector<Point>>& contours, const ProcessingParams& params) {
    if (contours.empty()) {
        return -1;
    }

    // Strictly larger wins, so equal areas keep the earlier contour
    int maxIdx = 0;
    double maxArea = contourArea(contours[0]);
    for (size_t i = 1; i < contours.size(); i++) {
        double area = contourArea(contours[i]);
        if (area > maxArea) {
            maxArea = area;
            maxIdx = static_cast<int>(i);
        }
    }

    if (params.verboseOutput) {
        cout << "[INFO] Largest contour found for processing: index " << maxIdx
             << " with area " << maxArea << endl;
    }
    return maxIdx;
}

Rect FootProcessor::measureBoundingBox(const vector<Point>& contour) {
    if (contour.empty()) {
        throw invalid_argument("Cannot measure an empty contour");
    }
    return boundingRect(contour);
}

double FootProcessor::pixelsToCentimeters(int widthPx, double cmPerPixel) {
    // std::round rounds half away from zero
    return std::round(widthPx * cmPerPixel * 100.0) / 100.0;
}

MeasurementResult FootProcessor::measureFoot(const vector<uchar>& imageBytes, MimeType mimeType,
                                             const ProcessingParams& params) {
    MeasurementResult result;
    DebugStack debugStack;

    try {
        Mat img = decodeImage(imageBytes, mimeType, params);
        pushDebugImage(debugStack, img, "original", params);

        Mat gray = convertToGrayscale(img, params);
        pushDebugImage(debugStack, gray, "grayscale", params);

        Mat blurred = suppressNoise(gray, params);
        pushDebugImage(debugStack, blurred, "blurred", params);

        Mat edges = detectEdges(blurred, params);
        pushDebugImage(debugStack, edges, "edges", params);

        vector<vector<Point>> contours = extractContours(edges, params);
        result.contourCount = contours.size();
        pushDebugContours(debugStack, blurred, contours, -1, "contours", params);

        int selectedIdx = selectLargestContour(contours, params);
        if (selectedIdx < 0) {
            if (params.verboseOutput) {
                cout << "[WARN] No contour found in the image." << endl;
            }
            result.status = MeasurementStatus::NoContourFound;
            result.message = "No contour found in the image";
            flushDebugStack(debugStack, params);
            return result;
        }

        const vector<Point>& selected = contours[selectedIdx];
        pushDebugContours(debugStack, img, contours, selectedIdx, "selected", params);

        Rect box = measureBoundingBox(selected);
        if (params.verboseOutput) {
            cout << "[INFO] Bounding Box - Width: " << box.width << " pixels, Height: "
                 << box.height << " pixels" << endl;
        }

        result.status = MeasurementStatus::Success;
        result.boundingBox = box;
        result.contourArea = contourArea(selected);
        result.lengthCm = pixelsToCentimeters(box.width, params.cmPerPixel);
        result.message = "Foot measured";

        if (params.verboseOutput) {
            cout << "[INFO] Foot size calculated: " << result.lengthCm << " cm" << endl;
        }
    } catch (const ImageDecodeError& e) {
        cerr << "[ERROR] " << e.what() << endl;
        result = MeasurementResult();
        result.status = MeasurementStatus::DecodeError;
        result.message = e.what();
    } catch (const cv::Exception& e) {
        cerr << "[ERROR] OpenCV failure while measuring foot: " << e.what() << endl;
        result = MeasurementResult();
        result.status = MeasurementStatus::InternalError;
        result.message = e.what();
    } catch (const exception& e) {
        cerr << "[ERROR] Error calculating foot size: " << e.what() << endl;
        result = MeasurementResult();
        result.status = MeasurementStatus::InternalError;
        result.message = e.what();
    }

    flushDebugStack(debugStack, params);
    return result;
}

MeasurementResult FootProcessor::measureFoot(const vector<uchar>& imageBytes, MimeType mimeType) {
    ProcessingParams params;
    return measureFoot(imageBytes, mimeType, params);
}

// Debug visualization methods

void FootProcessor::pushDebugImage(DebugStack& stack, const Mat& image, const string& name,
                                   const ProcessingParams& params) {
    if (!params.enableDebugOutput) return;

    stack.images.emplace_back(image.clone(), name);
}

void FootProcessor::pushDebugContours(DebugStack& stack, const Mat& image, const vector<vector<Point>>& contours,
                                      int selectedIdx, const string& name, const ProcessingParams& params) {
    if (!params.enableDebugOutput) return;

    Mat debugImg;
    if (image.channels() == 1) {
        cvtColor(image, debugImg, COLOR_GRAY2BGR);
    } else {
        debugImg = image.clone();
    }

    drawContours(debugImg, contours, -1, Scalar(255, 128, 0), 1);

    if (selectedIdx >= 0 && selectedIdx < static_cast<int>(contours.size())) {
        drawContours(debugImg, contours, selectedIdx, Scalar(0, 255, 0), 2);
        rectangle(debugImg, boundingRect(contours[selectedIdx]), Scalar(0, 0, 255), 1);
    }

    stack.images.emplace_back(debugImg, name);
}

void FootProcessor::flushDebugStack(DebugStack& stack, const ProcessingParams& params) {
    if (!params.enableDebugOutput || stack.images.empty()) return;

    cout << "[DEBUG] Flushing " << stack.images.size() << " debug images..." << endl;

    error_code ec;
    filesystem::create_directories(params.debugOutputPath, ec);
    if (ec) {
        cout << "[WARN] Could not create debug directory " << params.debugOutputPath
             << ": " << ec.message() << endl;
        stack.images.clear();
        return;
    }

    for (size_t i = 0; i < stack.images.size(); i++) {
        const auto& [image, name] = stack.images[i];

        // Format: 01_name.png, 02_name.png, etc.
        char indexStr[8];
        snprintf(indexStr, sizeof(indexStr), "%02zu", i + 1);
        string filename = string(indexStr) + "_" + name + ".png";
        string fullPath = (filesystem::path(params.debugOutputPath) / filename).string();

        bool success = false;
        try {
            success = imwrite(fullPath, image);
        } catch (const cv::Exception& e) {
            cout << "[WARN] " << e.what() << endl;
        }

        if (success) {
            cout << "[DEBUG] Saved: " << filename << endl;
        } else {
            cout << "[WARN] Failed to save: " << filename << endl;
        }
    }

    stack.images.clear();
}

} // namespace FootMeasure
