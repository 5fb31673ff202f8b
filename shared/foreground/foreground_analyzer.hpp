#pragma once
#include <opencv2/core.hpp>

#include "models/BoundingBox.hpp"
#include "models/Orientation.hpp"
#include "models/PipelineSettings.hpp"

struct ForegroundAnalysis
{
    cv::Mat trimmed;          // CV_8UC4, deep copy of the box
    BoundingBox box;          // in source coordinates
    double ratio {0.0};       // trimmed.cols / trimmed.rows
    Orientation orientation {Orientation::ThreeQuarter};
};

// View from the width/height ratio of the trimmed box. Side owns (1.3, inf),
// FrontOrBack owns [0, 0.8), ThreeQuarter owns the closed interval [0.8, 1.3].
// Compared with integer cross products, so boxes exactly on a boundary
// (130x100, 80x100) never drift across it.
Orientation classifyBox(int width, int height);

// Trims transparent margins and classifies the view. Input must be CV_8UC4 and is not modified.
// Throws InvalidImageError for empty/non-BGRA input, EmptyForegroundError when nothing
// exceeds settings.alphaThreshold.
ForegroundAnalysis analyzeForeground(const cv::Mat& cutout, const AnalyzerSettings& settings = AnalyzerSettings{});
