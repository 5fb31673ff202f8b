/**
 * @file CompositeResult.hpp
 * Output of one pipeline run. Ownership passes to the caller, which decides where
 * the images are stored or served from.
 */
#pragma once
#include <chrono>
#include <string>
#include <opencv2/core.hpp>

#include "models/BoundingBox.hpp"
#include "models/Orientation.hpp"

struct CompositeResult
{
    cv::Mat finalImage;          // CV_8UC3, backdrop sized
    cv::Mat transparentCutout;   // CV_8UC4, trimmed, before compositing
    Orientation orientation {Orientation::ThreeQuarter};
    double scaleUsed {0.0};      // effective, after the height cap
    BoundingBox foregroundBox;   // trim box in the source cutout
    cv::Rect placedRect;         // where the car landed on the canvas
    std::string backdropId;
    bool plateMasked {false};
    std::chrono::duration<double> processingDuration {0.0};
};
