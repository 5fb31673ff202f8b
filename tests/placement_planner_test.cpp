#include <gtest/gtest.h>

#include "placement/placement_planner.hpp"
#include "models/PipelineError.hpp"

#include <limits>

TEST(PlacementPlannerTest, DefaultTable)
{
    PlacementPlan side = planPlacement(Orientation::Side);
    EXPECT_DOUBLE_EQ(side.scaleFactor, 0.45);
    EXPECT_EQ(side.scaleReference, ScaleReference::CanvasWidth);

    PlacementPlan front = planPlacement(Orientation::FrontOrBack);
    EXPECT_DOUBLE_EQ(front.scaleFactor, 0.30);
    EXPECT_EQ(front.scaleReference, ScaleReference::CanvasHeight);

    PlacementPlan tq = planPlacement(Orientation::ThreeQuarter);
    EXPECT_DOUBLE_EQ(tq.scaleFactor, 0.38);
    EXPECT_EQ(tq.scaleReference, ScaleReference::CanvasWidth);

    for (const auto& p : { side, front, tq })
    {
        EXPECT_DOUBLE_EQ(p.anchorX, 0.5);
        EXPECT_DOUBLE_EQ(p.anchorY, kDefaultGroundLevel);
        EXPECT_EQ(p.verticalReference, VerticalReference::Ground);
    }
}

TEST(PlacementPlannerTest, GroundLevelBecomesAnchorY)
{
    EXPECT_DOUBLE_EQ(planPlacement(Orientation::Side, {}, 0.9).anchorY, 0.9);
    EXPECT_THROW(planPlacement(Orientation::Side, {}, 1.2), InvalidPlacementError);
}

TEST(PlacementPlannerTest, OverridesReplaceDefaults)
{
    PlacementOverrides o;
    o.scaleFactor = 0.6;
    o.anchorX = 0.25;
    o.anchorY = 0.5;
    o.verticalReference = VerticalReference::Center;
    PlacementPlan p = planPlacement(Orientation::FrontOrBack, o);
    EXPECT_DOUBLE_EQ(p.scaleFactor, 0.6);
    EXPECT_EQ(p.scaleReference, ScaleReference::CanvasHeight);
    EXPECT_DOUBLE_EQ(p.anchorX, 0.25);
    EXPECT_DOUBLE_EQ(p.anchorY, 0.5);
    EXPECT_EQ(p.verticalReference, VerticalReference::Center);
}

TEST(PlacementPlannerTest, HeightCapOnlyForTableScales)
{
    for (Orientation o : { Orientation::Side, Orientation::FrontOrBack, Orientation::ThreeQuarter })
    {
        PlacementPlan p = planPlacement(o);
        ASSERT_TRUE(p.maxHeightFraction) << toString(o);
        EXPECT_DOUBLE_EQ(*p.maxHeightFraction, kMaxHeightFraction);
    }

    PlacementOverrides anchorsOnly;
    anchorsOnly.anchorX = 0.3;
    EXPECT_TRUE(planPlacement(Orientation::Side, anchorsOnly).maxHeightFraction);

    PlacementOverrides scaled;
    scaled.scaleFactor = 0.45;
    EXPECT_FALSE(planPlacement(Orientation::Side, scaled).maxHeightFraction);
}

TEST(PlacementPlannerTest, RangeEndsAreAccepted)
{
    PlacementOverrides o;
    o.scaleFactor = kMaxScale;
    o.anchorX = 0.0;
    o.anchorY = 1.0;
    EXPECT_NO_THROW(planPlacement(Orientation::Side, o));
}

TEST(PlacementPlannerTest, InvalidOverridesThrowAndAreNeverClamped)
{
    const double nan = std::numeric_limits<double>::quiet_NaN();
    for (double bad : { 0.0, -0.1, 2.01, nan })
    {
        PlacementOverrides o;
        o.scaleFactor = bad;
        EXPECT_THROW(planPlacement(Orientation::Side, o), InvalidPlacementError) << bad;
    }
    for (double bad : { -0.01, 1.01, nan })
    {
        PlacementOverrides ox;
        ox.anchorX = bad;
        EXPECT_THROW(planPlacement(Orientation::ThreeQuarter, ox), InvalidPlacementError) << bad;
        PlacementOverrides oy;
        oy.anchorY = bad;
        EXPECT_THROW(planPlacement(Orientation::ThreeQuarter, oy), InvalidPlacementError) << bad;
    }
}

TEST(PlacementPlannerTest, InvalidPlacementCarriesKind)
{
    PlacementOverrides o;
    o.scaleFactor = -1.0;
    try
    {
        planPlacement(Orientation::Side, o);
        FAIL() << "expected InvalidPlacementError";
    }
    catch (const PipelineError& e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidPlacement);
    }
}
