#include "foreground_analyzer.hpp"
#include "models/PipelineError.hpp"
#include "util/ImageOps.hpp"

#include <algorithm>
#include <string>

Orientation classifyBox(int width, int height)
{
    const long long w = width, h = height;
    if (w * 10 > h * 13) return Orientation::Side;      // w/h > 1.3
    if (w * 5 < h * 4) return Orientation::FrontOrBack;  // w/h < 0.8
    return Orientation::ThreeQuarter;
}

ForegroundAnalysis analyzeForeground(const cv::Mat& cutout, const AnalyzerSettings& settings)
{
    if (cutout.empty()) throw InvalidImageError("analyzeForeground: empty cutout");
    if (cutout.type() != CV_8UC4)
        throw InvalidImageError("analyzeForeground: cutout must be CV_8UC4 (8-bit BGRA), got " +
                                cv::typeToString(cutout.type()));

    const int thr = std::clamp(settings.alphaThreshold, 0, 254);
    BoundingBox box;
    if (!util::findAlphaBounds(cutout, thr, box))
        throw EmptyForegroundError("analyzeForeground: no pixel with alpha above " + std::to_string(thr) +
                                   " in " + std::to_string(cutout.cols) + "x" + std::to_string(cutout.rows) + " cutout");

    ForegroundAnalysis out;
    out.box = box;
    out.trimmed = cutout(box.toRect()).clone();
    out.ratio = static_cast<double>(box.width()) / box.height();
    out.orientation = classifyBox(box.width(), box.height());
    return out;
}
