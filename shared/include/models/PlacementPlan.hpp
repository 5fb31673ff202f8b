/**
 * @file PlacementPlan.hpp
 * Where and how large the trimmed vehicle goes on the backdrop canvas.
 */
#pragma once
#include <optional>

// Which canvas dimension scaleFactor is a fraction of.
enum class ScaleReference
{
    CanvasWidth = 0,
    CanvasHeight = 1,
};

// Ground: bottom edge of the car sits on anchorY * canvas height (floor line).
// Center: the car's vertical center sits on anchorY * canvas height.
enum class VerticalReference
{
    Ground = 0,
    Center = 1,
};

struct PlacementPlan
{
    double scaleFactor {0.38};                          // (0, 2]
    ScaleReference scaleReference {ScaleReference::CanvasWidth};
    double anchorX {0.5};                               // [0, 1], horizontal center of the car
    double anchorY {0.85};                              // [0, 1]
    VerticalReference verticalReference {VerticalReference::Ground};
    std::optional<double> maxHeightFraction;            // cap on car height / canvas height, table scales only
};

// Caller supplied values that replace the table defaults. Unset fields keep the default.
struct PlacementOverrides
{
    std::optional<double> scaleFactor;
    std::optional<double> anchorX;
    std::optional<double> anchorY;
    std::optional<VerticalReference> verticalReference;

    bool empty() const { return !scaleFactor && !anchorX && !anchorY && !verticalReference; }
};

inline const char* toString(VerticalReference v)
{
    switch (v)
    {
        case VerticalReference::Ground: return "ground";
        case VerticalReference::Center: return "center";
    }
    return "unknown";
}
