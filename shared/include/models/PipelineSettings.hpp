/**
 * @file PipelineSettings.hpp
 * Tuning parameters for the compositing pipeline, filled from CLI flags or UI controls.
 */
#pragma once

struct AnalyzerSettings
{
    // Pixels with alpha at or below this value count as empty when trimming.
    // Kept low so soft anti-aliased edges survive the crop.
    int alphaThreshold {8};
};

struct CompositorSettings
{
    // Shadow ellipse size relative to the placed car width
    double shadowWidthFactor {0.9};
    double shadowHeightFactor {0.08};
    // Softening of the ellipse edge, relative to the placed car width (0 = hard edge)
    double shadowSoftness {0.04};

    // Reflection fades to transparent within this many rows below the ground line
    int reflectionFadePx {160};
};

struct MaskerSettings
{
    int pixelBlockSize {16};  // pixelate: edge of each flat block
    int blurCellSize {14};    // blur: lattice spacing between interpolation knots
};

// Smallest block/cell the masker accepts; anything finer leaves plates legible.
constexpr int kMinMaskCellSize = 8;

struct PipelineSettings
{
    AnalyzerSettings analyzer;
    CompositorSettings compositor;
    MaskerSettings masker;
    bool verbose {false};     // [DEBUG] lines on stdout
};
