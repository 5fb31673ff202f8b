#include "util/ImageOps.hpp"
#include "models/PipelineError.hpp"
#include <algorithm>

namespace util {

bool findAlphaBounds(const cv::Mat& bgra, int threshold, BoundingBox& box)
{
    if (bgra.empty() || bgra.type() != CV_8UC4) return false;
    cv::Mat alpha;
    cv::extractChannel(bgra, alpha, 3);
    cv::Mat mask;
    cv::threshold(alpha, mask, threshold, 255, cv::THRESH_BINARY); // foreground = 255

    cv::Mat rows, cols;
    cv::reduce(mask, rows, 1, cv::REDUCE_MAX, CV_8U); // cols collapsed
    cv::reduce(mask, cols, 0, cv::REDUCE_MAX, CV_8U); // rows collapsed

    int top = -1, bot = -1;
    for (int r = 0; r < rows.rows; ++r)
    {
        if (rows.at<uchar>(r, 0)) { if (top == -1) top = r; bot = r; }
    }
    if (top == -1) return false;

    int left = -1, right = -1;
    for (int c = 0; c < cols.cols; ++c)
    {
        if (cols.at<uchar>(0, c)) { if (left == -1) left = c; right = c; }
    }
    box = BoundingBox(left, top, right, bot);
    return true;
}

cv::Mat toBGRA(const cv::Mat& img)
{
    if (img.empty()) throw InvalidImageError("toBGRA: empty image");
    if (img.depth() != CV_8U) throw InvalidImageError("toBGRA: expected 8-bit channels");
    cv::Mat out;
    switch (img.channels())
    {
        case 1: cv::cvtColor(img, out, cv::COLOR_GRAY2BGRA); break;
        case 3: cv::cvtColor(img, out, cv::COLOR_BGR2BGRA); break;
        case 4: out = img.clone(); break;
        default: throw InvalidImageError("toBGRA: unsupported channel count " + std::to_string(img.channels()));
    }
    return out;
}

cv::Mat toBGR(const cv::Mat& img)
{
    if (img.empty()) throw InvalidImageError("toBGR: empty image");
    if (img.depth() != CV_8U) throw InvalidImageError("toBGR: expected 8-bit channels");
    cv::Mat out;
    switch (img.channels())
    {
        case 1: cv::cvtColor(img, out, cv::COLOR_GRAY2BGR); break;
        case 3: out = img.clone(); break;
        case 4: cv::cvtColor(img, out, cv::COLOR_BGRA2BGR); break;
        default: throw InvalidImageError("toBGR: unsupported channel count " + std::to_string(img.channels()));
    }
    return out;
}

cv::Mat premultiply(const cv::Mat& bgra)
{
    cv::Mat f;
    bgra.convertTo(f, CV_32FC4, 1.0 / 255.0);
    std::vector<cv::Mat> ch;
    cv::split(f, ch);
    for (int i = 0; i < 3; ++i) cv::multiply(ch[i], ch[3], ch[i]);
    cv::Mat out;
    cv::merge(ch, out);
    return out;
}

std::vector<uchar> encodeImage(const cv::Mat& img, const std::string& ext, int jpegQuality)
{
    if (img.empty()) throw EncodingError("encodeImage: empty image");
    std::vector<int> params;
    cv::Mat src = img;
    if (ext == ".jpg" || ext == ".jpeg")
    {
        params = { cv::IMWRITE_JPEG_QUALITY, std::clamp(jpegQuality, 0, 100) };
        if (img.channels() == 4) src = toBGR(img);
    }
    else if (ext != ".png")
    {
        throw EncodingError("encodeImage: unsupported format '" + ext + "'");
    }
    std::vector<uchar> buf;
    if (!cv::imencode(ext, src, buf, params)) throw EncodingError("encodeImage: OpenCV failed to encode " + ext);
    return buf;
}

}
