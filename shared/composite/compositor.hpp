/*========================  compositor.hpp  ========================

   Places a trimmed vehicle cutout on a backdrop.
   --------------------------------------------------------------------
   • resizes on premultiplied alpha (INTER_AREA down, INTER_LANCZOS4 up)
   • ground alignment: the car's bottom edge sits on the plan's anchorY line
   • optional soft elliptical shadow and faded floor reflection, both drawn
     before the car so the car covers them
   • output always has the backdrop's exact size; a placement that would
     leave the canvas throws CompositingError instead of clipping

=====================================================================*/
#pragma once
#include <opencv2/core.hpp>

#include "backdrops/backdrop_registry.hpp"
#include "models/PipelineSettings.hpp"
#include "models/PlacementPlan.hpp"

// Size of the foreground after applying plan.scaleFactor to the referenced canvas
// dimension, aspect ratio preserved. When plan.maxHeightFraction is set the height is
// capped at that share of the canvas and the width follows. appliedScale, if given,
// receives the scale actually used against the plan's reference dimension.
// Throws CompositingError if the result collapses to 0 px.
cv::Size scaledForegroundSize(cv::Size foreground, const PlacementPlan& plan, cv::Size canvas,
                              double* appliedScale = nullptr);

// Canvas rectangle for a foreground of the given size. Throws CompositingError when the
// rectangle is not entirely inside the canvas.
cv::Rect placeForeground(cv::Size scaled, const PlacementPlan& plan, cv::Size canvas);

/**
 * @brief Composites a trimmed BGRA cutout over a copy of the backdrop.
 *
 * @param trimmed     CV_8UC4 cutout, already trimmed to its alpha bounds.
 * @param plan        Scale and anchor produced by planPlacement().
 * @param backdrop    Registered backdrop; its image is copied, never written.
 * @param shadow      Draw a soft contact shadow under the car.
 * @param reflection  Draw a vertically flipped, fading floor reflection.
 * @param settings    Shadow/reflection geometry.
 * @param placedOut   Optional, receives the rectangle the car occupies.
 * @param scaleOut    Optional, receives the effective scale (differs from plan.scaleFactor
 *                    when the height cap applied).
 * @return CV_8UC3 image with the backdrop's dimensions.
 */
cv::Mat compositeOnto(const cv::Mat& trimmed,
                      const PlacementPlan& plan,
                      const Backdrop& backdrop,
                      bool shadow,
                      bool reflection,
                      const CompositorSettings& settings = CompositorSettings{},
                      cv::Rect* placedOut = nullptr,
                      double* scaleOut = nullptr);
