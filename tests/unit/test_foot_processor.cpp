/**
 * @file test_foot_processor.cpp
 * @brief Unit tests for the individual measurement pipeline stages
 */

#include <gtest/gtest.h>
#include <FootProcessor.hpp>

#include "test_helpers.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

using namespace FootMeasure;
using namespace FootMeasure::TestHelpers;

// ============================================================================
// Test Fixture
// ============================================================================

class FootProcessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        params = QuietParams();
    }

    // Single-channel map with a vertical step between two intensities
    cv::Mat CreateStepImage(int width, int height, int edgeX, uchar leftVal = 50, uchar rightVal = 200) {
        cv::Mat img(height, width, CV_8UC1);
        for (int y = 0; y < height; ++y) {
            for (int x = 0; x < width; ++x) {
                img.at<uchar>(y, x) = (x < edgeX) ? leftVal : rightVal;
            }
        }
        return img;
    }

    std::vector<cv::Point> Square(int x, int y, int side) {
        return {cv::Point(x, y), cv::Point(x + side, y), cv::Point(x + side, y + side), cv::Point(x, y + side)};
    }

    FootProcessor::ProcessingParams params;
};

// ============================================================================
// Decoder
// ============================================================================

TEST_F(FootProcessorTest, HasSignature_RecognizesPngAndJpeg) {
    cv::Mat img = CreateCanvas(16, 16);
    std::vector<uchar> png = EncodePng(img);
    std::vector<uchar> jpeg = EncodeJpeg(img);

    EXPECT_TRUE(FootProcessor::hasSignature(png, MimeType::PNG));
    EXPECT_FALSE(FootProcessor::hasSignature(png, MimeType::JPEG));
    EXPECT_TRUE(FootProcessor::hasSignature(jpeg, MimeType::JPEG));
    EXPECT_FALSE(FootProcessor::hasSignature(jpeg, MimeType::PNG));
    EXPECT_FALSE(FootProcessor::hasSignature({}, MimeType::PNG));
    EXPECT_FALSE(FootProcessor::hasSignature({0x89, 0x50}, MimeType::PNG));
}

TEST_F(FootProcessorTest, DecodeImage_ReturnsColorRaster) {
    cv::Mat img = CreateScenarioImage();
    cv::Mat decoded = FootProcessor::decodeImage(EncodePng(img), MimeType::PNG, params);

    EXPECT_EQ(decoded.cols, 200);
    EXPECT_EQ(decoded.rows, 100);
    EXPECT_EQ(decoded.type(), CV_8UC3);
    EXPECT_EQ(cv::norm(decoded, img, cv::NORM_INF), 0.0);
}

TEST_F(FootProcessorTest, DecodeImage_GrayscalePngExpandsToThreeChannels) {
    cv::Mat gray(40, 60, CV_8UC1, cv::Scalar(90));
    cv::Mat decoded = FootProcessor::decodeImage(EncodePng(gray), MimeType::PNG, params);

    EXPECT_EQ(decoded.channels(), 3);
    EXPECT_EQ(decoded.cols, 60);
    EXPECT_EQ(decoded.rows, 40);
}

TEST_F(FootProcessorTest, DecodeImage_EmptyBufferThrows) {
    EXPECT_THROW(FootProcessor::decodeImage({}, MimeType::PNG, params), ImageDecodeError);
}

TEST_F(FootProcessorTest, DecodeImage_WrongDeclaredTypeThrows) {
    std::vector<uchar> png = EncodePng(CreateScenarioImage());
    EXPECT_THROW(FootProcessor::decodeImage(png, MimeType::JPEG, params), ImageDecodeError);
}

TEST_F(FootProcessorTest, DecodeImage_TruncatedStreamThrows) {
    std::vector<uchar> png = EncodePng(CreateScenarioImage());
    png.resize(24);
    EXPECT_THROW(FootProcessor::decodeImage(png, MimeType::PNG, params), ImageDecodeError);
}

// ============================================================================
// Preprocessor
// ============================================================================

TEST_F(FootProcessorTest, ConvertToGrayscale_UsesLuminanceWeights) {
    cv::Mat img(10, 30, CV_8UC3);
    img(cv::Rect(0, 0, 10, 10)).setTo(cv::Scalar(255, 0, 0));   // blue
    img(cv::Rect(10, 0, 10, 10)).setTo(cv::Scalar(0, 255, 0));  // green
    img(cv::Rect(20, 0, 10, 10)).setTo(cv::Scalar(0, 0, 255));  // red

    cv::Mat gray = FootProcessor::convertToGrayscale(img, params);

    ASSERT_EQ(gray.type(), CV_8UC1);
    EXPECT_EQ(gray.size(), img.size());
    EXPECT_NEAR(gray.at<uchar>(5, 5), 29, 1);
    EXPECT_NEAR(gray.at<uchar>(5, 15), 150, 1);
    EXPECT_NEAR(gray.at<uchar>(5, 25), 76, 1);
}

TEST_F(FootProcessorTest, ConvertToGrayscale_RejectsSingleChannelInput) {
    cv::Mat gray(10, 10, CV_8UC1, cv::Scalar(128));
    EXPECT_THROW(FootProcessor::convertToGrayscale(gray, params), cv::Exception);
}

TEST_F(FootProcessorTest, SuppressNoise_KeepsUniformImageUniform) {
    cv::Mat gray(50, 80, CV_8UC1, cv::Scalar(128));
    cv::Mat blurred = FootProcessor::suppressNoise(gray, params);

    EXPECT_EQ(blurred.size(), gray.size());
    EXPECT_EQ(blurred.type(), CV_8UC1);
    EXPECT_EQ(cv::norm(blurred, gray, cv::NORM_INF), 0.0);
}

TEST_F(FootProcessorTest, SuppressNoise_SoftensStep) {
    cv::Mat step = CreateStepImage(40, 20, 20);
    cv::Mat blurred = FootProcessor::suppressNoise(step, params);

    uchar left = blurred.at<uchar>(10, 19);
    uchar right = blurred.at<uchar>(10, 20);
    EXPECT_GT(left, 50);
    EXPECT_LT(right, 200);
    EXPECT_LT(left, right);
    // Far from the step the values are untouched
    EXPECT_EQ(blurred.at<uchar>(10, 2), 50);
    EXPECT_EQ(blurred.at<uchar>(10, 37), 200);
}

// ============================================================================
// EdgeDetector
// ============================================================================

TEST_F(FootProcessorTest, DetectEdges_UniformImageHasNoEdges) {
    cv::Mat gray(60, 60, CV_8UC1, cv::Scalar(128));
    cv::Mat edges = FootProcessor::detectEdges(gray, params);

    EXPECT_EQ(edges.size(), gray.size());
    EXPECT_EQ(cv::countNonZero(edges), 0);
}

TEST_F(FootProcessorTest, DetectEdges_OutputIsBinaryAndNearStep) {
    cv::Mat step = FootProcessor::suppressNoise(CreateStepImage(60, 30, 30), params);
    cv::Mat edges = FootProcessor::detectEdges(step, params);

    ASSERT_GT(cv::countNonZero(edges), 0);
    for (int y = 0; y < edges.rows; ++y) {
        for (int x = 0; x < edges.cols; ++x) {
            uchar v = edges.at<uchar>(y, x);
            EXPECT_TRUE(v == 0 || v == 255);
            if (v != 0) {
                EXPECT_NEAR(x, 30, 2);
            }
        }
    }
}

TEST_F(FootProcessorTest, DetectEdges_WeakStepBelowThresholdsIgnored) {
    cv::Mat step = FootProcessor::suppressNoise(CreateStepImage(60, 30, 30, 120, 124), params);
    cv::Mat edges = FootProcessor::detectEdges(step, params);
    EXPECT_EQ(cv::countNonZero(edges), 0);
}

// ============================================================================
// ContourExtractor
// ============================================================================

TEST_F(FootProcessorTest, ExtractContours_EmptyEdgeMapGivesNoContours) {
    cv::Mat edges = cv::Mat::zeros(50, 50, CV_8UC1);
    EXPECT_TRUE(FootProcessor::extractContours(edges, params).empty());
}

TEST_F(FootProcessorTest, ExtractContours_IgnoresNestedBoundaries) {
    cv::Mat edges = cv::Mat::zeros(100, 100, CV_8UC1);
    cv::rectangle(edges, cv::Point(10, 10), cv::Point(89, 89), cv::Scalar(255), 1);
    cv::rectangle(edges, cv::Point(30, 30), cv::Point(59, 59), cv::Scalar(255), 1);

    auto contours = FootProcessor::extractContours(edges, params);

    ASSERT_EQ(contours.size(), 1u);
    cv::Rect box = FootProcessor::measureBoundingBox(contours[0]);
    EXPECT_EQ(box, cv::Rect(10, 10, 80, 80));
}

TEST_F(FootProcessorTest, ExtractContours_SimplifiesStraightSegments) {
    cv::Mat edges = cv::Mat::zeros(60, 60, CV_8UC1);
    cv::rectangle(edges, cv::Point(10, 10), cv::Point(49, 29), cv::Scalar(255), 1);

    auto contours = FootProcessor::extractContours(edges, params);

    ASSERT_EQ(contours.size(), 1u);
    EXPECT_EQ(contours[0].size(), 4u);
}

TEST_F(FootProcessorTest, ExtractContours_OrderedByFirstRasterPixel) {
    cv::Mat edges = cv::Mat::zeros(120, 120, CV_8UC1);
    cv::rectangle(edges, cv::Point(70, 60), cv::Point(89, 79), cv::Scalar(255), 1);  // lower
    cv::rectangle(edges, cv::Point(60, 10), cv::Point(79, 29), cv::Scalar(255), 1);  // top, right
    cv::rectangle(edges, cv::Point(10, 10), cv::Point(29, 29), cv::Scalar(255), 1);  // top, left

    auto contours = FootProcessor::extractContours(edges, params);

    ASSERT_EQ(contours.size(), 3u);
    EXPECT_EQ(FootProcessor::measureBoundingBox(contours[0]).tl(), cv::Point(10, 10));
    EXPECT_EQ(FootProcessor::measureBoundingBox(contours[1]).tl(), cv::Point(60, 10));
    EXPECT_EQ(FootProcessor::measureBoundingBox(contours[2]).tl(), cv::Point(70, 60));
}

// ============================================================================
// RegionSelector
// ============================================================================

TEST_F(FootProcessorTest, SelectLargestContour_EmptySetReturnsNegative) {
    EXPECT_EQ(FootProcessor::selectLargestContour({}, params), -1);
}

TEST_F(FootProcessorTest, SelectLargestContour_PicksMaximumArea) {
    std::vector<std::vector<cv::Point>> contours = {Square(0, 0, 10), Square(50, 0, 30), Square(0, 50, 20)};
    EXPECT_EQ(FootProcessor::selectLargestContour(contours, params), 1);
}

TEST_F(FootProcessorTest, SelectLargestContour_TieKeepsFirst) {
    std::vector<std::vector<cv::Point>> contours = {Square(0, 0, 5), Square(40, 0, 20), Square(0, 40, 20)};
    EXPECT_EQ(FootProcessor::selectLargestContour(contours, params), 1);
}

TEST_F(FootProcessorTest, SelectLargestContour_OrientationDoesNotMatter) {
    std::vector<cv::Point> clockwise = Square(0, 0, 10);
    std::vector<cv::Point> counterClockwise(Square(50, 50, 12));
    std::reverse(counterClockwise.begin(), counterClockwise.end());

    EXPECT_EQ(FootProcessor::selectLargestContour({clockwise, counterClockwise}, params), 1);
}

TEST_F(FootProcessorTest, SelectLargestContour_DegenerateContoursStillSelectable) {
    std::vector<std::vector<cv::Point>> contours = {{cv::Point(3, 3)}, {cv::Point(5, 5), cv::Point(9, 5)}};
    EXPECT_EQ(FootProcessor::selectLargestContour(contours, params), 0);
}

// ============================================================================
// Measurer
// ============================================================================

TEST_F(FootProcessorTest, MeasureBoundingBox_InclusiveExtent) {
    std::vector<cv::Point> contour = {cv::Point(5, 5), cv::Point(14, 5), cv::Point(14, 9), cv::Point(5, 9)};
    cv::Rect box = FootProcessor::measureBoundingBox(contour);

    EXPECT_EQ(box.x, 5);
    EXPECT_EQ(box.y, 5);
    EXPECT_EQ(box.width, 10);
    EXPECT_EQ(box.height, 5);
}

TEST_F(FootProcessorTest, MeasureBoundingBox_SinglePointIsOnePixel) {
    cv::Rect box = FootProcessor::measureBoundingBox({cv::Point(7, 3)});
    EXPECT_EQ(box.width, 1);
    EXPECT_EQ(box.height, 1);
}

TEST_F(FootProcessorTest, MeasureBoundingBox_EmptyContourThrows) {
    EXPECT_THROW(FootProcessor::measureBoundingBox({}), std::invalid_argument);
}

TEST_F(FootProcessorTest, PixelsToCentimeters_DefaultFactor) {
    EXPECT_DOUBLE_EQ(FootProcessor::pixelsToCentimeters(100, 0.2), 20.0);
    EXPECT_DOUBLE_EQ(FootProcessor::pixelsToCentimeters(101, 0.2), 20.2);
    EXPECT_DOUBLE_EQ(FootProcessor::pixelsToCentimeters(0, 0.2), 0.0);
}

TEST_F(FootProcessorTest, PixelsToCentimeters_RoundsHalfAwayFromZero) {
    // 0.125 and 0.375 are exact in binary, so the halfway case is real
    EXPECT_DOUBLE_EQ(FootProcessor::pixelsToCentimeters(1, 0.125), 0.13);
    EXPECT_DOUBLE_EQ(FootProcessor::pixelsToCentimeters(3, 0.125), 0.38);
    EXPECT_DOUBLE_EQ(FootProcessor::pixelsToCentimeters(7, 0.001), 0.01);
    EXPECT_DOUBLE_EQ(FootProcessor::pixelsToCentimeters(4, 0.001), 0.0);
}

TEST_F(FootProcessorTest, NamesForEnums) {
    EXPECT_STREQ(FootProcessor::mimeTypeName(MimeType::PNG), "image/png");
    EXPECT_STREQ(FootProcessor::mimeTypeName(MimeType::JPEG), "image/jpeg");
    EXPECT_STREQ(FootProcessor::statusName(MeasurementStatus::NoContourFound), "NoContourFound");
    EXPECT_STREQ(FootProcessor::statusName(MeasurementStatus::DecodeError), "DecodeError");
}
