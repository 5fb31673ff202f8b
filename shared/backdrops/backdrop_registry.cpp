#include "backdrop_registry.hpp"
#include "models/PipelineError.hpp"
#include "util/ImageOps.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <opencv2/opencv.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <iostream>

namespace
{
    bool isImagePath(const std::filesystem::path& p)
    {
        std::string ext = p.extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        return ext == ".jpg" || ext == ".jpeg" || ext == ".png";
    }

    bool inUnitRange(double v) { return !std::isnan(v) && v >= 0.0 && v <= 1.0; }

    // Floor zone covers the bottom 30% and darkens up to 15% at the very bottom row.
    constexpr double kFloorRatio = 0.30;
    constexpr double kFloorDarken = 0.15;
}

cv::Mat makeStudioGradient(cv::Size size, const cv::Scalar& top, const cv::Scalar& bottom, bool withFloor)
{
    if (size.width <= 0 || size.height <= 0) throw InvalidImageError("makeStudioGradient: empty size");
    cv::Mat img(size, CV_8UC3);
    const int H = size.height;
    const int floorH = withFloor ? static_cast<int>(H * kFloorRatio) : 0;
    for (int y = 0; y < H; ++y)
    {
        double t = static_cast<double>(y) / H;
        cv::Scalar c;
        for (int i = 0; i < 3; ++i) c[i] = static_cast<int>(top[i] + (bottom[i] - top[i]) * t);
        if (floorH > 0 && y >= H - floorH)
        {
            double progress = static_cast<double>(y - (H - floorH)) / floorH;
            int a = static_cast<int>(255 * kFloorDarken * progress);
            for (int i = 0; i < 3; ++i) c[i] = std::round(c[i] * (255 - a) / 255.0);
        }
        img.row(y).setTo(c);
    }
    return img;
}

BackdropRegistry::BackdropRegistry(std::map<std::string, Backdrop> backdrops)
    : backdrops_(std::move(backdrops))
{
}

const Backdrop& BackdropRegistry::get(const std::string& id) const
{
    auto it = backdrops_.find(id);
    if (it == backdrops_.end()) throw NotFoundError("backdrop '" + id + "' is not registered");
    return it->second;
}

bool BackdropRegistry::contains(const std::string& id) const
{
    return backdrops_.count(id) != 0;
}

std::vector<std::string> BackdropRegistry::ids() const
{
    std::vector<std::string> out;
    out.reserve(backdrops_.size());
    for (const auto& kv : backdrops_) out.push_back(kv.first);
    return out;
}

std::vector<const Backdrop*> BackdropRegistry::byCategory(const std::string& category) const
{
    std::vector<const Backdrop*> out;
    for (const auto& kv : backdrops_)
        if (kv.second.category == category) out.push_back(&kv.second);
    return out;
}

BackdropRegistry::Builder& BackdropRegistry::Builder::add(Backdrop backdrop)
{
    if (backdrop.id.empty()) throw InvalidBackdropError("add: backdrop id is empty");
    if (pending_.count(backdrop.id)) throw InvalidBackdropError("add: duplicate backdrop id '" + backdrop.id + "'");
    const BackdropSettings& s = backdrop.settings;
    if (!inUnitRange(s.floorLevel) || !inUnitRange(s.shadowOpacity) || !inUnitRange(s.reflectionOpacity))
        throw InvalidBackdropError("add: settings of '" + backdrop.id + "' must lie in [0, 1]");
    backdrop.image = util::toBGR(backdrop.image);
    if (backdrop.displayName.empty()) backdrop.displayName = backdrop.id;
    std::string id = backdrop.id;
    pending_.emplace(std::move(id), std::move(backdrop));
    return *this;
}

BackdropRegistry::Builder& BackdropRegistry::Builder::addStudioGradient(const std::string& id, const std::string& displayName,
                                                                        cv::Size size, const cv::Scalar& top, const cv::Scalar& bottom,
                                                                        bool withFloor, const BackdropSettings& settings)
{
    Backdrop b;
    b.id = id;
    b.displayName = displayName;
    b.category = "studio";
    b.image = makeStudioGradient(size, top, bottom, withFloor);
    b.settings = settings;
    return add(std::move(b));
}

BackdropRegistry::Builder& BackdropRegistry::Builder::addDefaultStudios(cv::Size size)
{
    BackdropSettings dark;
    dark.shadowOpacity = 0.3;
    addStudioGradient("studio_white", "Studio White", size, cv::Scalar(255, 255, 255), cv::Scalar(240, 240, 240), true);
    addStudioGradient("studio_grey", "Studio Grey", size, cv::Scalar(160, 160, 160), cv::Scalar(100, 100, 100), true);
    addStudioGradient("studio_black", "Studio Black", size, cv::Scalar(55, 50, 50), cv::Scalar(18, 15, 15), true, dark);
    return *this;
}

BackdropRegistry::Builder& BackdropRegistry::Builder::loadDirectory(const std::string& dir)
{
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) throw InvalidBackdropError("loadDirectory: not a directory: " + dir);

    std::vector<fs::path> files;
    fs::directory_iterator it(dir, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec))
    {
        std::error_code typeEc;
        if (it->is_regular_file(typeEc) && isImagePath(it->path())) files.push_back(it->path());
        else if (typeEc) std::cerr << "[loadDirectory] cannot stat " << it->path() << ": " << typeEc.message() << ", skipping\n";
    }
    if (ec) throw InvalidBackdropError("loadDirectory: cannot list " + dir + ": " + ec.message());
    std::sort(files.begin(), files.end());

    for (const auto& p : files)
    {
        cv::Mat img = cv::imread(p.string(), cv::IMREAD_COLOR);
        if (img.empty()) { std::cerr << "[loadDirectory] cannot read " << p << ", skipping\n"; continue; }
        const std::string id = p.stem().string();
        if (pending_.count(id)) { std::cerr << "[loadDirectory] '" << id << "' already registered, skipping " << p << "\n"; continue; }
        Backdrop b;
        b.id = id;
        b.image = img;
        add(std::move(b));
    }
    return *this;
}

BackdropRegistry::Builder& BackdropRegistry::Builder::loadManifest(const std::string& path)
{
    namespace fs = std::filesystem;
    namespace pt = boost::property_tree;

    pt::ptree tree;
    std::vector<Backdrop> parsed;
    try
    {
        pt::read_json(path, tree);
        const fs::path base = fs::path(path).parent_path();
        for (const auto& item : tree.get_child("backdrops"))
        {
            const pt::ptree& node = item.second;
            Backdrop b;
            b.id = node.get<std::string>("id");
            fs::path file = node.get<std::string>("file");
            if (file.is_relative()) file = base / file;
            b.displayName = node.get<std::string>("name", b.id);
            b.category = node.get<std::string>("category", "custom");
            b.settings.floorLevel = node.get<double>("floor_level", b.settings.floorLevel);
            b.settings.shadowOpacity = node.get<double>("shadow_opacity", b.settings.shadowOpacity);
            b.settings.reflectionOpacity = node.get<double>("reflection_opacity", b.settings.reflectionOpacity);
            b.image = cv::imread(file.string(), cv::IMREAD_COLOR);
            if (b.image.empty()) throw InvalidBackdropError("loadManifest: cannot read image " + file.string() + " for '" + b.id + "'");
            parsed.push_back(std::move(b));
        }
    }
    catch (const pt::ptree_error& e)
    {
        throw InvalidBackdropError("loadManifest: " + path + ": " + e.what());
    }

    // All or nothing: a bad entry leaves the builder as it was.
    Builder staged;
    staged.pending_ = pending_;
    for (auto& b : parsed) staged.add(std::move(b));
    pending_.swap(staged.pending_);
    return *this;
}

std::shared_ptr<const BackdropRegistry> BackdropRegistry::Builder::build()
{
    std::shared_ptr<const BackdropRegistry> reg(new BackdropRegistry(std::move(pending_)));
    pending_.clear();
    return reg;
}
