// Command-line front end for the compositing pipeline.
// Build via CMake target: vehicle_studio_cli
//
// Usage:
//   vehicle_studio_cli --input car.png [--input more.png ...] --output <dir> [options]
//     --backdrop <id>          registered backdrop (default studio_white)
//     --backdrops-dir <dir>    register every image in dir under its file stem
//     --manifest <json>        register backdrops listed in a JSON manifest
//     --orientation <o>        side | front | three_quarter (skip classification)
//     --scale <s>              override scale (0, 2]
//     --anchor-x <x>           override horizontal anchor [0, 1]
//     --anchor-y <y>           override ground line / vertical anchor [0, 1]
//     --center                 anchor the car's vertical center instead of its bottom edge
//     --shadow | --no-shadow   contact shadow (default on)
//     --reflection             floor reflection
//     --plate x0,y0,x1,y1      redact this region of the final image
//     --mask blur|pixelate     redaction method (default pixelate)
//     --alpha-threshold <n>    alpha at or below n counts as empty when trimming
//     --block <n>              pixelate block / blur cell size
//     --jobs <n>               worker threads for batches
//     --list-backdrops         print registered backdrops and exit
//     --verbose

#include "pipeline/composite_pipeline.hpp"
#include "util/ImageOps.hpp"
#include "models/PipelineError.hpp"

#include <opencv2/opencv.hpp>
#include <algorithm>
#include <atomic>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace
{
    struct CliOptions
    {
        std::vector<std::string> inputs;
        std::string outputDir;
        std::string backdropsDir;
        std::string manifest;
        PipelineRequest request;
        PipelineSettings settings;
        int jobs {1};
        bool listBackdrops {false};
    };

    void printUsage(const char* argv0)
    {
        std::cerr << "Usage: " << argv0 << " --input <cutout.png> [--input ...] --output <dir>"
                  << " [--backdrop id] [--backdrops-dir dir] [--manifest file.json]"
                  << " [--orientation side|front|three_quarter] [--scale s] [--anchor-x x] [--anchor-y y] [--center]"
                  << " [--shadow|--no-shadow] [--reflection] [--plate x0,y0,x1,y1] [--mask blur|pixelate]"
                  << " [--alpha-threshold n] [--block n] [--jobs n] [--list-backdrops] [--verbose]\n";
    }

    bool parsePlate(const std::string& s, BoundingBox& box)
    {
        int x0, y0, x1, y1;
        char tail;
        if (std::sscanf(s.c_str(), "%d,%d,%d,%d%c", &x0, &y0, &x1, &y1, &tail) != 4) return false;
        box = BoundingBox(x0, y0, x1, y1);
        return true;
    }

    // Returns false on a usage error (message already printed).
    bool parseArgs(int argc, char** argv, CliOptions& o)
    {
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            auto next = [&](std::string& out) {
                if (i + 1 >= argc) { std::cerr << "Missing value for " << arg << "\n"; return false; }
                out = argv[++i];
                return true;
            };
            std::string v;
            try
            {
                if (arg == "--input") { if (!next(v)) return false; o.inputs.push_back(v); }
                else if (arg == "--output") { if (!next(o.outputDir)) return false; }
                else if (arg == "--backdrop") { if (!next(o.request.backdropId)) return false; }
                else if (arg == "--backdrops-dir") { if (!next(o.backdropsDir)) return false; }
                else if (arg == "--manifest") { if (!next(o.manifest)) return false; }
                else if (arg == "--orientation")
                {
                    if (!next(v)) return false;
                    o.request.orientationOverride = parseOrientation(v);
                    if (!o.request.orientationOverride) { std::cerr << "Unknown orientation '" << v << "'\n"; return false; }
                }
                else if (arg == "--scale") { if (!next(v)) return false; o.request.placement.scaleFactor = std::stod(v); }
                else if (arg == "--anchor-x") { if (!next(v)) return false; o.request.placement.anchorX = std::stod(v); }
                else if (arg == "--anchor-y") { if (!next(v)) return false; o.request.placement.anchorY = std::stod(v); }
                else if (arg == "--center") o.request.placement.verticalReference = VerticalReference::Center;
                else if (arg == "--shadow") o.request.shadow = true;
                else if (arg == "--no-shadow") o.request.shadow = false;
                else if (arg == "--reflection") o.request.reflection = true;
                else if (arg == "--plate")
                {
                    BoundingBox box;
                    if (!next(v)) return false;
                    if (!parsePlate(v, box)) { std::cerr << "Bad --plate '" << v << "', expected x0,y0,x1,y1\n"; return false; }
                    o.request.plateRegion = box;
                }
                else if (arg == "--mask")
                {
                    if (!next(v)) return false;
                    auto m = parseMaskMethod(v);
                    if (!m) { std::cerr << "Unknown mask method '" << v << "'\n"; return false; }
                    o.request.maskMethod = *m;
                }
                else if (arg == "--alpha-threshold") { if (!next(v)) return false; o.settings.analyzer.alphaThreshold = std::stoi(v); }
                else if (arg == "--block")
                {
                    if (!next(v)) return false;
                    o.settings.masker.pixelBlockSize = o.settings.masker.blurCellSize = std::stoi(v);
                }
                else if (arg == "--jobs") { if (!next(v)) return false; o.jobs = std::max(1, std::stoi(v)); }
                else if (arg == "--list-backdrops") o.listBackdrops = true;
                else if (arg == "--verbose") o.settings.verbose = true;
                else { std::cerr << "Unknown option " << arg << "\n"; return false; }
            }
            catch (const std::logic_error&)
            {
                std::cerr << "Bad numeric value '" << v << "' for " << arg << "\n";
                return false;
            }
        }
        return true;
    }

    bool writeBytes(const std::filesystem::path& p, const std::vector<uchar>& bytes)
    {
        std::ofstream f(p, std::ios::binary);
        f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        return static_cast<bool>(f);
    }

    // One input end to end. Returns true on success; failures are reported on stderr.
    bool processOne(const CompositePipeline& pipeline, const CliOptions& o, const std::string& inPath, std::mutex& logMutex)
    {
        namespace fs = std::filesystem;
        try
        {
            cv::Mat img = cv::imread(inPath, cv::IMREAD_UNCHANGED);
            if (img.empty())
            {
                std::lock_guard<std::mutex> lk(logMutex);
                std::cerr << "[processOne] cannot open: " << inPath << "\n";
                return false;
            }
            CompositeResult r = pipeline.run(util::toBGRA(img), o.request);
            const fs::path stem = fs::path(o.outputDir) / fs::path(inPath).stem();
            const fs::path finalPath = stem.string() + "_final.jpg";
            const fs::path cutoutPath = stem.string() + "_transparent.png";
            if (!writeBytes(finalPath, util::encodeImage(r.finalImage, ".jpg", 92)) ||
                !writeBytes(cutoutPath, util::encodeImage(r.transparentCutout, ".png")))
            {
                std::lock_guard<std::mutex> lk(logMutex);
                std::cerr << "[processOne] cannot write results for " << inPath << " to " << o.outputDir << "\n";
                return false;
            }
            std::lock_guard<std::mutex> lk(logMutex);
            std::cout << inPath << ": " << toString(r.orientation) << " scale=" << r.scaleUsed
                      << " backdrop=" << r.backdropId << (r.plateMasked ? " plate=masked" : "")
                      << " (" << r.processingDuration.count() << "s) -> " << finalPath.string() << "\n";
            return true;
        }
        catch (const PipelineError& e)
        {
            std::lock_guard<std::mutex> lk(logMutex);
            std::cerr << inPath << ": " << toString(e.kind()) << ": " << e.what() << "\n";
            return false;
        }
        catch (const cv::Exception& e)
        {
            std::lock_guard<std::mutex> lk(logMutex);
            std::cerr << inPath << ": OpenCV: " << e.what() << "\n";
            return false;
        }
        catch (const std::exception& e)
        {
            std::lock_guard<std::mutex> lk(logMutex);
            std::cerr << inPath << ": " << e.what() << "\n";
            return false;
        }
    }
}

int main(int argc, char** argv)
{
    CliOptions opts;
    if (!parseArgs(argc, argv, opts)) { printUsage(argv[0]); return 1; }

    std::shared_ptr<const BackdropRegistry> registry;
    try
    {
        BackdropRegistry::Builder builder;
        builder.addDefaultStudios();
        if (!opts.backdropsDir.empty()) builder.loadDirectory(opts.backdropsDir);
        if (!opts.manifest.empty()) builder.loadManifest(opts.manifest);
        registry = builder.build();
    }
    catch (const PipelineError& e)
    {
        std::cerr << "Backdrop setup failed: " << toString(e.kind()) << ": " << e.what() << "\n";
        return 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Backdrop setup failed: " << e.what() << "\n";
        return 1;
    }

    if (opts.listBackdrops)
    {
        for (const auto& id : registry->ids())
        {
            const Backdrop& b = registry->get(id);
            std::cout << id << "\t" << b.category << "\t" << b.image.cols << "x" << b.image.rows
                      << "\t" << b.displayName << "\n";
        }
        return 0;
    }

    if (opts.inputs.empty() || opts.outputDir.empty()) { printUsage(argv[0]); return 1; }
    std::error_code ec;
    std::filesystem::create_directories(opts.outputDir, ec);
    if (ec) { std::cerr << "Cannot create output folder " << opts.outputDir << ": " << ec.message() << "\n"; return 1; }

    const CompositePipeline pipeline(registry, opts.settings);
    std::mutex logMutex;
    std::atomic<size_t> nextIndex {0};
    std::atomic<int> ok {0};
    const int workers = std::min<int>(opts.jobs, static_cast<int>(opts.inputs.size()));
    std::vector<std::thread> pool;
    for (int w = 0; w < workers; ++w)
    {
        pool.emplace_back([&] {
            for (size_t i = nextIndex++; i < opts.inputs.size(); i = nextIndex++)
                if (processOne(pipeline, opts, opts.inputs[i], logMutex)) ++ok;
        });
    }
    for (auto& t : pool) t.join();

    std::cout << "Processed " << ok << "/" << opts.inputs.size() << " image(s)\n";
    return ok == static_cast<int>(opts.inputs.size()) ? 0 : 2;
}
