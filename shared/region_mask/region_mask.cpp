#include "region_mask.hpp"
#include "models/PipelineError.hpp"

#include <opencv2/opencv.hpp>
#include <algorithm>
#include <sstream>
#include <vector>

namespace
{
    /* Pixelate ---------------------------------------------------------------- */
    static void pixelate(cv::Mat& roi, int block)
    {
        for (int y0 = 0; y0 < roi.rows; y0 += block)
        {
            for (int x0 = 0; x0 < roi.cols; x0 += block)
            {
                cv::Rect blk(x0, y0, std::min(block, roi.cols - x0), std::min(block, roi.rows - y0));
                cv::Mat cell = roi(blk);
                cell.setTo(cv::mean(cell));
            }
        }
    }

    // Knot positions along one axis: the centre of every cell, the last one pulled
    // inside the region. Strictly increasing.
    static std::vector<int> knotPositions(int length, int cell)
    {
        std::vector<int> k;
        for (int start = 0; start < length; start += cell)
            k.push_back(std::min(start + cell / 2, length - 1));
        return k;
    }

    struct Span { int i0; int i1; double t; };

    // For every coordinate, the surrounding knots and the interpolation weight.
    // Coordinates outside the first/last knot hold the edge sample.
    static std::vector<Span> spansFor(int length, const std::vector<int>& knots)
    {
        std::vector<Span> spans(length);
        size_t i = 0;
        const int last = static_cast<int>(knots.size()) - 1;
        for (int x = 0; x < length; ++x)
        {
            if (x <= knots.front()) { spans[x] = { 0, 0, 0.0 }; continue; }
            if (x >= knots.back()) { spans[x] = { last, last, 0.0 }; continue; }
            while (knots[i + 1] <= x) ++i;
            double t = static_cast<double>(x - knots[i]) / (knots[i + 1] - knots[i]);
            spans[x] = { static_cast<int>(i), static_cast<int>(i) + 1, t };
        }
        return spans;
    }

    /* Lattice blur ------------------------------------------------------------- */
    // At a knot t is 0 on both axes, so the pixel gets its own sample back unchanged;
    // re-running on the output samples the same values and reproduces it exactly.
    static void latticeBlur(cv::Mat& roi, int cell)
    {
        const int cn = roi.channels();
        const std::vector<int> kx = knotPositions(roi.cols, cell);
        const std::vector<int> ky = knotPositions(roi.rows, cell);
        const int nx = static_cast<int>(kx.size());

        std::vector<double> samples(ky.size() * kx.size() * cn);
        for (size_t j = 0; j < ky.size(); ++j)
        {
            const uchar* row = roi.ptr<uchar>(ky[j]);
            for (int i = 0; i < nx; ++i)
                for (int c = 0; c < cn; ++c)
                    samples[(j * nx + i) * cn + c] = row[kx[i] * cn + c];
        }
        auto sample = [&](int j, int i, int c) { return samples[(static_cast<size_t>(j) * nx + i) * cn + c]; };

        const std::vector<Span> sx = spansFor(roi.cols, kx);
        const std::vector<Span> sy = spansFor(roi.rows, ky);
        for (int y = 0; y < roi.rows; ++y)
        {
            uchar* row = roi.ptr<uchar>(y);
            const Span& vy = sy[y];
            for (int x = 0; x < roi.cols; ++x)
            {
                const Span& vx = sx[x];
                for (int c = 0; c < cn; ++c)
                {
                    double top = (1.0 - vx.t) * sample(vy.i0, vx.i0, c) + vx.t * sample(vy.i0, vx.i1, c);
                    double bot = (1.0 - vx.t) * sample(vy.i1, vx.i0, c) + vx.t * sample(vy.i1, vx.i1, c);
                    row[x * cn + c] = cv::saturate_cast<uchar>((1.0 - vy.t) * top + vy.t * bot);
                }
            }
        }
    }
}

std::optional<MaskMethod> parseMaskMethod(const std::string& s)
{
    if (s == "blur") return MaskMethod::Blur;
    if (s == "pixelate") return MaskMethod::Pixelate;
    return std::nullopt;
}

cv::Mat maskRegion(const cv::Mat& image, const BoundingBox& region, MaskMethod method, const MaskerSettings& settings)
{
    if (image.empty()) throw InvalidImageError("maskRegion: empty image");
    if (image.depth() != CV_8U) throw InvalidImageError("maskRegion: expected 8-bit channels");
    if (!region.fitsWithin(image.cols, image.rows))
    {
        std::ostringstream os;
        os << "maskRegion: region (" << region.xMin << "," << region.yMin << ")-(" << region.xMax << "," << region.yMax
           << ") is not inside the " << image.cols << "x" << image.rows << " image";
        throw OutOfBoundsError(os.str());
    }

    cv::Mat out = image.clone();
    cv::Mat roi = out(region.toRect());
    switch (method)
    {
        case MaskMethod::Pixelate:
            pixelate(roi, std::max(settings.pixelBlockSize, kMinMaskCellSize));
            break;
        case MaskMethod::Blur:
            latticeBlur(roi, std::max(settings.blurCellSize, kMinMaskCellSize));
            break;
    }
    return out;
}
