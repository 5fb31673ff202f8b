/*========================  backdrop_registry.hpp  ========================

   Named backdrops the compositor can place a vehicle on.
   --------------------------------------------------------------------
   • built once through BackdropRegistry::Builder, then immutable
   • shared between worker threads as shared_ptr<const BackdropRegistry>;
     lookups never lock
   • sources: in-memory images, synthesized studio gradients, a folder of
     images, or a JSON manifest carrying per-backdrop floor/shadow settings

=====================================================================*/
#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

struct BackdropSettings
{
    double floorLevel {0.85};        // ground line as a fraction of canvas height
    double shadowOpacity {0.45};     // darkening at the shadow core (0..1)
    double reflectionOpacity {0.35}; // reflection opacity at the ground line (0..1)
};

struct Backdrop
{
    std::string id;
    std::string displayName;
    std::string category {"custom"};
    cv::Mat image;                   // CV_8UC3, never written after registration
    BackdropSettings settings;
};

class BackdropRegistry
{
public:
    class Builder;

    // Throws NotFoundError for unknown ids.
    const Backdrop& get(const std::string& id) const;
    bool contains(const std::string& id) const;
    std::vector<std::string> ids() const;
    std::vector<const Backdrop*> byCategory(const std::string& category) const;
    size_t size() const { return backdrops_.size(); }

private:
    explicit BackdropRegistry(std::map<std::string, Backdrop> backdrops);

    const std::map<std::string, Backdrop> backdrops_;
};

class BackdropRegistry::Builder
{
public:
    // Image is normalised to CV_8UC3. Throws InvalidImageError for an empty image and
    // InvalidBackdropError for an empty or duplicate id / out-of-range settings.
    Builder& add(Backdrop backdrop);

    // Vertical gradient from top to bottom colour (BGR), optionally darkened towards
    // the bottom to suggest a studio floor.
    Builder& addStudioGradient(const std::string& id, const std::string& displayName,
                               cv::Size size, const cv::Scalar& top, const cv::Scalar& bottom,
                               bool withFloor, const BackdropSettings& settings = BackdropSettings{});

    // studio_white, studio_grey, studio_black
    Builder& addDefaultStudios(cv::Size size = cv::Size(1920, 1080));

    // Registers every .jpg/.jpeg/.png in dir under its file stem. Unreadable files are
    // logged and skipped; a missing or unlistable directory throws InvalidBackdropError.
    Builder& loadDirectory(const std::string& dir);

    // JSON manifest: {"backdrops": [{"id": "...", "file": "...", "name": "...",
    // "category": "...", "floor_level": 0.85, "shadow_opacity": 0.45,
    // "reflection_opacity": 0.35}]}. Relative files resolve against the manifest folder.
    // Throws InvalidBackdropError on malformed manifests, unreadable images or ids that
    // clash with each other or with earlier registrations. Nothing is added on failure.
    Builder& loadManifest(const std::string& path);

    std::shared_ptr<const BackdropRegistry> build();

private:
    std::map<std::string, Backdrop> pending_;
};

// Same gradient the builder registers, exposed for callers that only need the image.
cv::Mat makeStudioGradient(cv::Size size, const cv::Scalar& top, const cv::Scalar& bottom, bool withFloor);
