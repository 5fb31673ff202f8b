#pragma once
#include <optional>
#include <string>
#include <opencv2/core.hpp>

#include "models/BoundingBox.hpp"
#include "models/PipelineSettings.hpp"

enum class MaskMethod
{
    Blur = 0,
    Pixelate = 1,
};

inline const char* toString(MaskMethod m)
{
    switch (m)
    {
        case MaskMethod::Blur: return "blur";
        case MaskMethod::Pixelate: return "pixelate";
    }
    return "unknown";
}

std::optional<MaskMethod> parseMaskMethod(const std::string& s);

// Destroys the detail inside region (plate redaction) and returns a new image; every
// pixel outside region is byte-identical to the input. Both methods are projections:
// masking an already masked region with the same method changes nothing.
//   Pixelate: flat blocks of settings.pixelBlockSize holding the block's mean colour.
//   Blur:     one sample per settings.blurCellSize cell, rebuilt by bilinear interpolation.
// Block/cell sizes below kMinMaskCellSize are raised to it.
// Throws OutOfBoundsError if region is not inside image, InvalidImageError for empty or
// non 8-bit input.
cv::Mat maskRegion(const cv::Mat& image, const BoundingBox& region, MaskMethod method,
                   const MaskerSettings& settings = MaskerSettings{});
