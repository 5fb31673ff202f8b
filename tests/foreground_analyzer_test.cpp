#include <gtest/gtest.h>

#include "foreground/foreground_analyzer.hpp"
#include "models/PipelineError.hpp"
#include "TestImages.hpp"

#include <string>

TEST(ForegroundAnalyzerTest, FullyTransparentIsEmptyForeground)
{
    cv::Mat img(120, 80, CV_8UC4, cv::Scalar(255, 255, 255, 0));
    EXPECT_THROW(analyzeForeground(img), EmptyForegroundError);
}

TEST(ForegroundAnalyzerTest, NoiseAtOrBelowThresholdIsIgnored)
{
    cv::Mat img(120, 80, CV_8UC4, cv::Scalar(0, 0, 0, 0));
    img(cv::Rect(0, 0, 10, 10)).setTo(cv::Scalar(0, 0, 0, 8));
    EXPECT_THROW(analyzeForeground(img), EmptyForegroundError);

    AnalyzerSettings s;
    s.alphaThreshold = 5;
    ForegroundAnalysis fg = analyzeForeground(img, s);
    EXPECT_EQ(fg.box, BoundingBox(0, 0, 9, 9));
}

TEST(ForegroundAnalyzerTest, RejectsNonBgraInput)
{
    EXPECT_THROW(analyzeForeground(cv::Mat()), InvalidImageError);
    EXPECT_THROW(analyzeForeground(cv::Mat(10, 10, CV_8UC3, cv::Scalar::all(0))), InvalidImageError);
}

TEST(ForegroundAnalyzerTest, WrongDepthIsNamedInError)
{
    // Four channels but 16-bit: the channel count alone would not explain the rejection.
    try
    {
        analyzeForeground(cv::Mat(10, 10, CV_16UC4, cv::Scalar::all(65535)));
        FAIL() << "expected InvalidImageError";
    }
    catch (const InvalidImageError& e)
    {
        EXPECT_NE(std::string(e.what()).find("CV_16UC4"), std::string::npos) << e.what();
    }
}

TEST(ForegroundAnalyzerTest, TrimsToOpaqueBox)
{
    cv::Mat img = makeCutout(cv::Size(500, 400), cv::Rect(50, 70, 300, 200));
    ForegroundAnalysis fg = analyzeForeground(img);
    EXPECT_EQ(fg.box, BoundingBox(50, 70, 349, 269));
    EXPECT_EQ(fg.trimmed.cols, 300);
    EXPECT_EQ(fg.trimmed.rows, 200);
    EXPECT_EQ(fg.trimmed.type(), CV_8UC4);
    EXPECT_DOUBLE_EQ(fg.ratio, 1.5);
    EXPECT_EQ(fg.orientation, Orientation::Side);
}

TEST(ForegroundAnalyzerTest, ClassifiesTallAndSquareBoxes)
{
    EXPECT_EQ(analyzeForeground(makeCutout(cv::Size(300, 300), cv::Rect(10, 10, 180, 260))).orientation,
              Orientation::FrontOrBack);
    EXPECT_EQ(analyzeForeground(makeCutout(cv::Size(300, 300), cv::Rect(30, 30, 240, 240))).orientation,
              Orientation::ThreeQuarter);
}

TEST(ForegroundAnalyzerTest, BoundaryRatiosAreThreeQuarter)
{
    EXPECT_EQ(analyzeForeground(makeCutout(cv::Size(200, 200), cv::Rect(0, 0, 130, 100))).orientation,
              Orientation::ThreeQuarter);
    EXPECT_EQ(analyzeForeground(makeCutout(cv::Size(200, 200), cv::Rect(0, 0, 80, 100))).orientation,
              Orientation::ThreeQuarter);
    EXPECT_EQ(analyzeForeground(makeCutout(cv::Size(200, 200), cv::Rect(0, 0, 131, 100))).orientation,
              Orientation::Side);
    EXPECT_EQ(analyzeForeground(makeCutout(cv::Size(200, 200), cv::Rect(0, 0, 79, 100))).orientation,
              Orientation::FrontOrBack);
}

TEST(ForegroundAnalyzerTest, ClassifyBoxBoundaries)
{
    EXPECT_EQ(classifyBox(1301, 1000), Orientation::Side);
    EXPECT_EQ(classifyBox(1300, 1000), Orientation::ThreeQuarter);
    EXPECT_EQ(classifyBox(800, 1000), Orientation::ThreeQuarter);
    EXPECT_EQ(classifyBox(799, 1000), Orientation::FrontOrBack);
    EXPECT_EQ(classifyBox(1948, 2435), Orientation::ThreeQuarter);
    EXPECT_EQ(classifyBox(1, 1), Orientation::ThreeQuarter);
}

TEST(ForegroundAnalyzerTest, InputIsNotModified)
{
    cv::Mat img = makeCutout(cv::Size(200, 150), cv::Rect(20, 20, 100, 60));
    cv::Mat before = img.clone();
    ForegroundAnalysis fg = analyzeForeground(img);
    fg.trimmed.setTo(cv::Scalar::all(0));
    EXPECT_TRUE(identical(img, before));
}
