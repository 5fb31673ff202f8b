#include "placement_planner.hpp"
#include "models/PipelineError.hpp"

#include <cmath>
#include <sstream>

namespace
{
    void requireUnit(const char* field, double v)
    {
        if (std::isnan(v) || v < 0.0 || v > 1.0)
        {
            std::ostringstream os;
            os << "planPlacement: " << field << " " << v << " outside [0, 1]";
            throw InvalidPlacementError(os.str());
        }
    }

    void requireScale(double v)
    {
        if (std::isnan(v) || v <= 0.0 || v > kMaxScale)
        {
            std::ostringstream os;
            os << "planPlacement: scale " << v << " outside (0, " << kMaxScale << "]";
            throw InvalidPlacementError(os.str());
        }
    }
}

PlacementPlan planPlacement(Orientation orientation, const PlacementOverrides& overrides, double groundLevel)
{
    requireUnit("groundLevel", groundLevel);

    PlacementPlan plan;
    plan.anchorX = 0.5;
    plan.anchorY = groundLevel;
    plan.verticalReference = VerticalReference::Ground;
    switch (orientation)
    {
        case Orientation::Side:
            plan.scaleFactor = kSideScale;
            plan.scaleReference = ScaleReference::CanvasWidth;
            break;
        case Orientation::FrontOrBack:
            plan.scaleFactor = kFrontBackScale;
            plan.scaleReference = ScaleReference::CanvasHeight;
            break;
        case Orientation::ThreeQuarter:
            plan.scaleFactor = kThreeQuarterScale;
            plan.scaleReference = ScaleReference::CanvasWidth;
            break;
    }

    if (overrides.scaleFactor)
    {
        requireScale(*overrides.scaleFactor);
        plan.scaleFactor = *overrides.scaleFactor;
    }
    else
    {
        plan.maxHeightFraction = kMaxHeightFraction;
    }
    if (overrides.anchorX) { requireUnit("anchorX", *overrides.anchorX); plan.anchorX = *overrides.anchorX; }
    if (overrides.anchorY) { requireUnit("anchorY", *overrides.anchorY); plan.anchorY = *overrides.anchorY; }
    if (overrides.verticalReference) plan.verticalReference = *overrides.verticalReference;
    return plan;
}
