#include "composite_pipeline.hpp"
#include "composite/compositor.hpp"
#include "foreground/foreground_analyzer.hpp"
#include "models/PipelineError.hpp"
#include "placement/placement_planner.hpp"

#include <chrono>
#include <iostream>

const char* toString(PipelineStage stage)
{
    switch (stage)
    {
        case PipelineStage::Received: return "received";
        case PipelineStage::Analyzed: return "analyzed";
        case PipelineStage::Planned: return "planned";
        case PipelineStage::Composited: return "composited";
        case PipelineStage::Masked: return "masked";
        case PipelineStage::Done: return "done";
    }
    return "unknown";
}

CompositePipeline::CompositePipeline(std::shared_ptr<const BackdropRegistry> registry, PipelineSettings settings)
    : registry_(std::move(registry)), settings_(settings)
{
    if (!registry_) throw std::invalid_argument("CompositePipeline: registry is null");
}

CompositeResult CompositePipeline::run(const cv::Mat& cutout, const PipelineRequest& request) const
{
    using Clock = std::chrono::steady_clock;
    PipelineStage stage = PipelineStage::Received;
    try
    {
        const Backdrop& backdrop = registry_->get(request.backdropId);

        ForegroundAnalysis fg = analyzeForeground(cutout, settings_.analyzer);
        stage = PipelineStage::Analyzed;
        const auto started = Clock::now();
        if (settings_.verbose)
            std::cout << "[DEBUG] analyzed: box " << fg.box.width() << "x" << fg.box.height()
                      << " ratio=" << fg.ratio << " orientation=" << toString(fg.orientation) << std::endl;

        const Orientation orientation = request.orientationOverride.value_or(fg.orientation);
        PlacementPlan plan = planPlacement(orientation, request.placement, backdrop.settings.floorLevel);
        stage = PipelineStage::Planned;
        if (settings_.verbose)
            std::cout << "[DEBUG] planned: " << toString(orientation) << " scale=" << plan.scaleFactor
                      << " anchor=(" << plan.anchorX << "," << plan.anchorY << ") " << toString(plan.verticalReference) << std::endl;

        CompositeResult result;
        result.finalImage = compositeOnto(fg.trimmed, plan, backdrop, request.shadow, request.reflection,
                                          settings_.compositor, &result.placedRect, &result.scaleUsed);
        stage = PipelineStage::Composited;

        if (request.plateRegion)
        {
            result.finalImage = maskRegion(result.finalImage, *request.plateRegion, request.maskMethod, settings_.masker);
            result.plateMasked = true;
            stage = PipelineStage::Masked;
        }

        result.transparentCutout = std::move(fg.trimmed);
        result.orientation = orientation;
        result.foregroundBox = fg.box;
        result.backdropId = backdrop.id;
        stage = PipelineStage::Done;
        result.processingDuration = Clock::now() - started;
        if (settings_.verbose)
            std::cout << "[DEBUG] done in " << result.processingDuration.count() << "s, placed at "
                      << result.placedRect << " scale=" << result.scaleUsed << std::endl;
        return result;
    }
    catch (const PipelineError& e)
    {
        std::cerr << "[CompositePipeline] failed after stage " << toString(stage) << ": "
                  << toString(e.kind()) << ": " << e.what() << "\n";
        throw;
    }
}
