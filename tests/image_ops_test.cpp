#include <gtest/gtest.h>

#include "util/ImageOps.hpp"
#include "models/PipelineError.hpp"
#include "TestImages.hpp"

#include <opencv2/opencv.hpp>

TEST(ImageOpsTest, AlphaBounds)
{
    cv::Mat img = makeCutout(cv::Size(50, 40), cv::Rect(5, 6, 10, 20));
    BoundingBox box;
    ASSERT_TRUE(util::findAlphaBounds(img, 0, box));
    EXPECT_EQ(box, BoundingBox(5, 6, 14, 25));
    EXPECT_FALSE(util::findAlphaBounds(cv::Mat(10, 10, CV_8UC4, cv::Scalar::all(0)), 0, box));
}

TEST(ImageOpsTest, ChannelConversions)
{
    cv::Mat gray(4, 4, CV_8UC1, cv::Scalar(9));
    cv::Mat bgra = util::toBGRA(gray);
    EXPECT_EQ(bgra.type(), CV_8UC4);
    EXPECT_EQ(bgra.at<cv::Vec4b>(0, 0), cv::Vec4b(9, 9, 9, 255));
    EXPECT_EQ(util::toBGR(bgra).type(), CV_8UC3);
    EXPECT_THROW(util::toBGRA(cv::Mat()), InvalidImageError);
    EXPECT_THROW(util::toBGR(cv::Mat(4, 4, CV_16UC3, cv::Scalar::all(0))), InvalidImageError);
    EXPECT_THROW(util::toBGRA(cv::Mat(4, 4, CV_8UC2, cv::Scalar::all(0))), InvalidImageError);
}

TEST(ImageOpsTest, PremultiplyScalesColourByAlpha)
{
    cv::Mat px(1, 1, CV_8UC4, cv::Scalar(255, 102, 0, 51));
    cv::Mat p = util::premultiply(px);
    ASSERT_EQ(p.type(), CV_32FC4);
    cv::Vec4f v = p.at<cv::Vec4f>(0, 0);
    EXPECT_NEAR(v[0], 0.2, 1e-6);
    EXPECT_NEAR(v[1], 0.08, 1e-6);
    EXPECT_NEAR(v[2], 0.0, 1e-6);
    EXPECT_NEAR(v[3], 0.2, 1e-6);
}

TEST(ImageOpsTest, EncodeJpegDropsAlphaAndPngKeepsIt)
{
    cv::Mat cutout = makeCutout(cv::Size(32, 32), cv::Rect(8, 8, 16, 16));

    std::vector<uchar> jpg = util::encodeImage(cutout, ".jpg");
    cv::Mat decodedJpg = cv::imdecode(jpg, cv::IMREAD_UNCHANGED);
    EXPECT_EQ(decodedJpg.channels(), 3);
    EXPECT_EQ(decodedJpg.size(), cutout.size());

    std::vector<uchar> png = util::encodeImage(cutout, ".png");
    cv::Mat decodedPng = cv::imdecode(png, cv::IMREAD_UNCHANGED);
    EXPECT_TRUE(identical(decodedPng, cutout));
}

TEST(ImageOpsTest, EncodeRejectsUnknownFormatAndEmptyImage)
{
    cv::Mat img(8, 8, CV_8UC3, cv::Scalar::all(0));
    EXPECT_THROW(util::encodeImage(img, ".gif"), EncodingError);
    EXPECT_THROW(util::encodeImage(cv::Mat(), ".png"), EncodingError);
}
