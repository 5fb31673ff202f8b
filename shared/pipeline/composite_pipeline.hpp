#pragma once
#include <memory>
#include <optional>
#include <string>
#include <opencv2/core.hpp>

#include "backdrops/backdrop_registry.hpp"
#include "models/BoundingBox.hpp"
#include "models/CompositeResult.hpp"
#include "models/Orientation.hpp"
#include "models/PipelineSettings.hpp"
#include "models/PlacementPlan.hpp"
#include "region_mask/region_mask.hpp"

enum class PipelineStage
{
    Received,
    Analyzed,
    Planned,
    Composited,
    Masked,
    Done,
};

const char* toString(PipelineStage stage);

struct PipelineRequest
{
    std::string backdropId {"studio_white"};
    std::optional<Orientation> orientationOverride;
    PlacementOverrides placement;
    bool shadow {true};
    bool reflection {false};
    std::optional<BoundingBox> plateRegion;   // in final image coordinates
    MaskMethod maskMethod {MaskMethod::Pixelate};
};

/**
 * @brief Runs analyze -> plan -> composite -> (mask) for one cutout.
 *
 * Holds only the shared read-only registry and settings, so a single instance can be
 * used from several threads at once. The first PipelineError raised by any stage is
 * logged and rethrown unchanged; no partial result is ever returned.
 */
class CompositePipeline
{
public:
    explicit CompositePipeline(std::shared_ptr<const BackdropRegistry> registry,
                               PipelineSettings settings = PipelineSettings{});

    // cutout: CV_8UC4 with the background already removed.
    CompositeResult run(const cv::Mat& cutout, const PipelineRequest& request) const;

    const BackdropRegistry& registry() const { return *registry_; }
    const PipelineSettings& settings() const { return settings_; }

private:
    std::shared_ptr<const BackdropRegistry> registry_;
    PipelineSettings settings_;
};
