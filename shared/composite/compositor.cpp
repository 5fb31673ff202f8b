// Shared compositor implementation
#include "compositor.hpp"
#include "models/PipelineError.hpp"
#include "util/ImageOps.hpp"

#include <opencv2/opencv.hpp>
#include <algorithm>
#include <sstream>
#include <vector>

using namespace cv;

namespace
{
    // Absorbs representation error such as 1080 * 0.3 landing a hair under 324.
    constexpr double kTruncEpsilon = 1e-9;

    inline int truncPx(double v) { return static_cast<int>(v + kTruncEpsilon); }

    inline int oddAtLeast(int k, int minimum) { k = std::max(k, minimum); return k | 1; }

    /* Lanczos overshoot --------------------------------------------------------- */
    // Keeps premultiplied data valid: alpha in [0,1], colour in [0, alpha].
    static void clampPremultiplied(std::vector<Mat>& ch)
    {
        cv::min(ch[3], 1.0, ch[3]);
        cv::max(ch[3], 0.0, ch[3]);
        for (int i = 0; i < 3; ++i)
        {
            cv::max(ch[i], 0.0, ch[i]);
            cv::min(ch[i], ch[3], ch[i]);
        }
    }

    /* Over blend --------------------------------------------------------------- */
    // dst (CV_32FC3 view) = src.rgb + dst * (1 - src.a); src channels are premultiplied.
    static void blendOver(Mat dst, const std::vector<Mat>& src)
    {
        Mat inv = 1.0 - src[3];
        std::vector<Mat> d;
        split(dst, d);
        for (int i = 0; i < 3; ++i) d[i] = d[i].mul(inv) + src[i];
        Mat merged;
        merge(d, merged);
        merged.copyTo(dst);
    }

    /* Contact shadow ----------------------------------------------------------- */
    static void drawShadow(Mat& canvas, const Rect& car, double opacity, const CompositorSettings& s)
    {
        if (opacity <= 0.0) return;
        const int groundRow = car.y + car.height - 1;
        Point center(car.x + car.width / 2, groundRow);
        Size axes(std::max(1, cvRound(car.width * s.shadowWidthFactor / 2.0)),
                  std::max(2, cvRound(car.width * s.shadowHeightFactor / 2.0)));

        Mat mask = Mat::zeros(canvas.size(), CV_8U);
        ellipse(mask, center, axes, 0.0, 0.0, 360.0, Scalar(255), FILLED, LINE_8);
        if (s.shadowSoftness > 0.0)
        {
            int k = oddAtLeast(cvRound(car.width * s.shadowSoftness), 3);
            GaussianBlur(mask, mask, Size(k, k), 0);
        }

        Mat shade;
        mask.convertTo(shade, CV_32F, -opacity / 255.0, 1.0); // 1 - opacity * mask
        std::vector<Mat> ch;
        split(canvas, ch);
        for (auto& c : ch) c = c.mul(shade);
        merge(ch, canvas);
    }

    /* Floor reflection --------------------------------------------------------- */
    static void drawReflection(Mat& canvas, const Mat& fgPremul, const Rect& car, double opacity, const CompositorSettings& s)
    {
        if (opacity <= 0.0) return;
        const int bottom = car.y + car.height;
        const int fade = std::min({ car.height, s.reflectionFadePx, canvas.rows - bottom });
        if (fade <= 0) return;

        Mat flipped;
        flip(fgPremul, flipped, 0);
        Mat band = flipped.rowRange(0, fade).clone();
        for (int r = 0; r < fade; ++r)
        {
            Mat row = band.row(r);
            row *= opacity * (1.0 - static_cast<double>(r) / fade);
        }
        std::vector<Mat> ch;
        split(band, ch);
        blendOver(canvas(Rect(car.x, bottom, car.width, fade)), ch);
    }
}

cv::Size scaledForegroundSize(cv::Size foreground, const PlacementPlan& plan, cv::Size canvas,
                              double* appliedScale)
{
    if (foreground.width <= 0 || foreground.height <= 0)
        throw CompositingError("scaledForegroundSize: empty foreground");

    int w = 0, h = 0;
    switch (plan.scaleReference)
    {
        case ScaleReference::CanvasWidth:
            w = truncPx(canvas.width * plan.scaleFactor);
            h = truncPx(foreground.height * static_cast<double>(w) / foreground.width);
            break;
        case ScaleReference::CanvasHeight:
            h = truncPx(canvas.height * plan.scaleFactor);
            w = truncPx(foreground.width * static_cast<double>(h) / foreground.height);
            break;
    }

    double scale = plan.scaleFactor;
    if (plan.maxHeightFraction)
    {
        const int maxH = truncPx(canvas.height * *plan.maxHeightFraction);
        if (h > maxH)
        {
            h = maxH;
            w = truncPx(foreground.width * static_cast<double>(h) / foreground.height);
            scale = (plan.scaleReference == ScaleReference::CanvasWidth)
                        ? static_cast<double>(w) / canvas.width
                        : static_cast<double>(h) / canvas.height;
        }
    }
    if (w < 1 || h < 1)
    {
        std::ostringstream os;
        os << "scaledForegroundSize: scale " << plan.scaleFactor << " collapses " << foreground
           << " to " << w << "x" << h << " on a " << canvas << " canvas";
        throw CompositingError(os.str());
    }
    if (appliedScale) *appliedScale = scale;
    return Size(w, h);
}

cv::Rect placeForeground(cv::Size scaled, const PlacementPlan& plan, cv::Size canvas)
{
    const int left = cvRound(plan.anchorX * canvas.width - scaled.width / 2.0);
    int top = 0;
    switch (plan.verticalReference)
    {
        case VerticalReference::Ground:
            top = cvRound(plan.anchorY * canvas.height) - scaled.height;
            break;
        case VerticalReference::Center:
            top = cvRound(plan.anchorY * canvas.height - scaled.height / 2.0);
            break;
    }
    Rect r(left, top, scaled.width, scaled.height);
    if ((r & Rect(Point(0, 0), canvas)) != r)
    {
        std::ostringstream os;
        os << "placeForeground: " << scaled << " car at " << r.tl() << " leaves the " << canvas
           << " canvas (scale " << plan.scaleFactor << ", anchor " << plan.anchorX << "," << plan.anchorY
           << ", " << toString(plan.verticalReference) << ")";
        throw CompositingError(os.str());
    }
    return r;
}

cv::Mat compositeOnto(const cv::Mat& trimmed, const PlacementPlan& plan, const Backdrop& backdrop,
                      bool shadow, bool reflection, const CompositorSettings& settings, cv::Rect* placedOut,
                      double* scaleOut)
{
    if (trimmed.empty() || trimmed.type() != CV_8UC4)
        throw InvalidImageError("compositeOnto: foreground must be a non-empty 8-bit BGRA image");
    if (backdrop.image.empty() || backdrop.image.type() != CV_8UC3)
        throw InvalidImageError("compositeOnto: backdrop '" + backdrop.id + "' has no BGR image");

    const Size canvasSize = backdrop.image.size();
    double scale = plan.scaleFactor;
    const Size target = scaledForegroundSize(trimmed.size(), plan, canvasSize, &scale);
    const Rect car = placeForeground(target, plan, canvasSize);

    Mat fg = util::premultiply(trimmed);
    const int interp = (target.width < trimmed.cols) ? INTER_AREA : INTER_LANCZOS4;
    Mat scaled;
    resize(fg, scaled, target, 0, 0, interp);
    std::vector<Mat> fgCh;
    split(scaled, fgCh);
    clampPremultiplied(fgCh);
    merge(fgCh, scaled);

    Mat canvas;
    backdrop.image.convertTo(canvas, CV_32FC3, 1.0 / 255.0);

    if (shadow) drawShadow(canvas, car, backdrop.settings.shadowOpacity, settings);
    if (reflection) drawReflection(canvas, scaled, car, backdrop.settings.reflectionOpacity, settings);
    blendOver(canvas(car), fgCh);

    Mat out;
    canvas.convertTo(out, CV_8UC3, 255.0);
    if (placedOut) *placedOut = car;
    if (scaleOut) *scaleOut = scale;
    return out;
}
