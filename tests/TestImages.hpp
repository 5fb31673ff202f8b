#pragma once
#include <opencv2/core.hpp>

// Transparent canvas with an opaque solid rectangle at (x, y, w, h).
inline cv::Mat makeCutout(cv::Size canvas, cv::Rect body, const cv::Scalar& colour = cv::Scalar(40, 60, 200, 255))
{
    cv::Mat img(canvas, CV_8UC4, cv::Scalar(0, 0, 0, 0));
    img(body).setTo(colour);
    return img;
}

// Deterministic noisy BGR texture, so masking has detail to destroy.
inline cv::Mat makeTexture(cv::Size size, unsigned seed = 7)
{
    cv::Mat img(size, CV_8UC3);
    unsigned v = seed;
    for (int y = 0; y < img.rows; ++y)
    {
        cv::Vec3b* row = img.ptr<cv::Vec3b>(y);
        for (int x = 0; x < img.cols; ++x)
        {
            v = v * 1103515245u + 12345u;
            row[x] = cv::Vec3b(static_cast<uchar>(v >> 16), static_cast<uchar>(v >> 8), static_cast<uchar>(v >> 24));
        }
    }
    return img;
}

inline bool identical(const cv::Mat& a, const cv::Mat& b)
{
    if (a.size() != b.size() || a.type() != b.type()) return false;
    for (int y = 0; y < a.rows; ++y)
    {
        const uchar* ra = a.ptr<uchar>(y);
        const uchar* rb = b.ptr<uchar>(y);
        for (size_t i = 0; i < a.cols * a.elemSize(); ++i)
            if (ra[i] != rb[i]) return false;
    }
    return true;
}
