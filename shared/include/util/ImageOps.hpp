#pragma once
#include <string>
#include <vector>
#include <opencv2/opencv.hpp>

#include "models/BoundingBox.hpp"

namespace util {

// Collapse rows/cols of the alpha plane to find the tightest box of pixels with alpha > threshold
bool findAlphaBounds(const cv::Mat& bgra, int threshold, BoundingBox& box);

// Gray, BGR or BGRA in; BGRA out (opaque alpha added where missing). Throws InvalidImageError.
cv::Mat toBGRA(const cv::Mat& img);

// Gray, BGR or BGRA in; BGR out (alpha discarded). Throws InvalidImageError.
cv::Mat toBGR(const cv::Mat& img);

// BGRA (8U) to premultiplied CV_32FC4 with colour and alpha in [0,1]
cv::Mat premultiply(const cv::Mat& bgra);

// Encode for the calling layer (".jpg" or ".png"). JPEG drops alpha. Throws EncodingError.
std::vector<uchar> encodeImage(const cv::Mat& img, const std::string& ext, int jpegQuality = 92);

}
