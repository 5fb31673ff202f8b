#include <gtest/gtest.h>

#include "region_mask/region_mask.hpp"
#include "models/PipelineError.hpp"
#include "TestImages.hpp"

#include <opencv2/opencv.hpp>

namespace
{
    const BoundingBox kPlate(20, 10, 120, 70);

    cv::Mat blankedRegion(const cv::Mat& img, const BoundingBox& region)
    {
        cv::Mat out = img.clone();
        out(region.toRect()).setTo(cv::Scalar::all(0));
        return out;
    }
}

class RegionMaskTest : public ::testing::TestWithParam<MaskMethod>
{
};

TEST_P(RegionMaskTest, MaskingTwiceChangesNothing)
{
    cv::Mat img = makeTexture(cv::Size(200, 100));
    cv::Mat once = maskRegion(img, kPlate, GetParam());
    cv::Mat twice = maskRegion(once, kPlate, GetParam());
    EXPECT_TRUE(identical(once, twice));
}

TEST_P(RegionMaskTest, IdempotentWithUnevenCellSizes)
{
    MaskerSettings s;
    s.pixelBlockSize = 11;
    s.blurCellSize = 23;
    cv::Mat img = makeTexture(cv::Size(157, 93), 3);
    const BoundingBox region(5, 7, 150, 88);
    cv::Mat once = maskRegion(img, region, GetParam(), s);
    EXPECT_TRUE(identical(once, maskRegion(once, region, GetParam(), s)));
}

TEST_P(RegionMaskTest, PixelsOutsideRegionAreUntouched)
{
    cv::Mat img = makeTexture(cv::Size(200, 100));
    cv::Mat out = maskRegion(img, kPlate, GetParam());
    EXPECT_TRUE(identical(blankedRegion(out, kPlate), blankedRegion(img, kPlate)));
    EXPECT_FALSE(identical(out, img));
}

TEST_P(RegionMaskTest, InputIsNotModified)
{
    cv::Mat img = makeTexture(cv::Size(200, 100));
    cv::Mat before = img.clone();
    maskRegion(img, kPlate, GetParam());
    EXPECT_TRUE(identical(img, before));
}

TEST_P(RegionMaskTest, RegionOutsideImageThrows)
{
    cv::Mat img = makeTexture(cv::Size(200, 100));
    EXPECT_THROW(maskRegion(img, BoundingBox(150, 10, 200, 50), GetParam()), OutOfBoundsError);
    EXPECT_THROW(maskRegion(img, BoundingBox(-1, 10, 50, 50), GetParam()), OutOfBoundsError);
    EXPECT_THROW(maskRegion(img, BoundingBox(60, 10, 50, 50), GetParam()), OutOfBoundsError);
}

TEST_P(RegionMaskTest, WorksOnBgra)
{
    cv::Mat bgra;
    cv::cvtColor(makeTexture(cv::Size(200, 100)), bgra, cv::COLOR_BGR2BGRA);
    cv::Mat once = maskRegion(bgra, kPlate, GetParam());
    EXPECT_EQ(once.type(), CV_8UC4);
    EXPECT_TRUE(identical(once, maskRegion(once, kPlate, GetParam())));
}

INSTANTIATE_TEST_SUITE_P(Methods, RegionMaskTest, ::testing::Values(MaskMethod::Blur, MaskMethod::Pixelate));

TEST(RegionMaskPixelateTest, BlocksAreFlat)
{
    cv::Mat out = maskRegion(makeTexture(cv::Size(200, 100)), kPlate, MaskMethod::Pixelate);
    cv::Mat block = out(cv::Rect(kPlate.xMin, kPlate.yMin, 16, 16));
    cv::Scalar mean, stddev;
    cv::meanStdDev(block, mean, stddev);
    EXPECT_EQ(stddev[0], 0.0);
    EXPECT_EQ(stddev[1], 0.0);
    EXPECT_EQ(stddev[2], 0.0);
}

TEST(RegionMaskPixelateTest, TinyBlockIsRaisedToMinimum)
{
    cv::Mat img = makeTexture(cv::Size(200, 100));
    MaskerSettings tiny;
    tiny.pixelBlockSize = 2;
    MaskerSettings minimum;
    minimum.pixelBlockSize = kMinMaskCellSize;
    EXPECT_TRUE(identical(maskRegion(img, kPlate, MaskMethod::Pixelate, tiny),
                          maskRegion(img, kPlate, MaskMethod::Pixelate, minimum)));
}

TEST(RegionMaskBlurTest, SmoothsDetail)
{
    cv::Mat img = makeTexture(cv::Size(200, 100));
    cv::Mat out = maskRegion(img, kPlate, MaskMethod::Blur);
    cv::Scalar m0, s0, m1, s1;
    cv::Mat dx0, dx1;
    cv::Sobel(img(kPlate.toRect()).clone(), dx0, CV_32F, 1, 0);
    cv::Sobel(out(kPlate.toRect()).clone(), dx1, CV_32F, 1, 0);
    cv::meanStdDev(dx0, m0, s0);
    cv::meanStdDev(dx1, m1, s1);
    EXPECT_LT(s1[0], s0[0] / 4);
}

TEST(RegionMaskMethodTest, ParseMethod)
{
    EXPECT_EQ(parseMaskMethod("blur"), MaskMethod::Blur);
    EXPECT_EQ(parseMaskMethod("pixelate"), MaskMethod::Pixelate);
    EXPECT_FALSE(parseMaskMethod("mosaic").has_value());
    EXPECT_STREQ(toString(MaskMethod::Blur), "blur");
}

TEST(RegionMaskMethodTest, RejectsEmptyAndFloatImages)
{
    EXPECT_THROW(maskRegion(cv::Mat(), kPlate, MaskMethod::Blur), InvalidImageError);
    cv::Mat f(100, 200, CV_32FC3, cv::Scalar::all(0));
    EXPECT_THROW(maskRegion(f, kPlate, MaskMethod::Pixelate), InvalidImageError);
}
