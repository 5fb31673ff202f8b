#pragma once
#include "models/Orientation.hpp"
#include "models/PlacementPlan.hpp"

// Floor line used when a backdrop does not declare its own.
constexpr double kDefaultGroundLevel = 0.85;

constexpr double kSideScale = 0.45;          // of canvas width
constexpr double kFrontBackScale = 0.30;     // of canvas height
constexpr double kThreeQuarterScale = 0.38;  // of canvas width
constexpr double kMaxScale = 2.0;

// Table scales never make the car taller than this fraction of the canvas.
constexpr double kMaxHeightFraction = 0.5;

/**
 * @brief Maps an orientation to its scale/anchor policy, then applies caller overrides.
 *
 * @param orientation  Classified (or overridden) view of the vehicle.
 * @param overrides    Explicit values that replace the table entries. Each one is
 *                     range checked: scale in (0, 2], anchors in [0, 1]. An explicit
 *                     scale also drops the kMaxHeightFraction cap.
 * @param groundLevel  Default anchorY for ground alignment, usually the backdrop's floor level.
 * @throws InvalidPlacementError when an override or groundLevel is out of range (never clamped).
 */
PlacementPlan planPlacement(Orientation orientation,
                            const PlacementOverrides& overrides = PlacementOverrides{},
                            double groundLevel = kDefaultGroundLevel);
