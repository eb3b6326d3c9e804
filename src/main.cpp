#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include "frame.hpp"
#include "hand_pose.hpp"
#include "hand_pose_config.hpp"
#include "pose_json.hpp"

namespace
{
    constexpr uint64_t kFrameIntervalNs = 33333333; // 30 fps replay clock

    void print_usage(const char *argv0)
    {
        std::cout << "Usage: " << argv0 << " [options] frame.ppm...\n\n"
                  << "Options:\n"
                  << "  --config <file>      Load detector configuration\n"
                  << "  --orientation        Use the orientation-only detector\n"
                  << "  --no-background      Disable the adaptive background model\n"
                  << "  --exclude x,y,w,h    Exclude a region (repeatable)\n"
                  << "  --annotate <prefix>  Write annotated frames as <prefix>_NNNN.ppm\n"
                  << "  --verbose            Log per-frame diagnostics to stderr\n"
                  << "  --help               Show this help\n\n";
    }

    bool parse_rect(const std::string &text, handpose::camera::Rect &rect)
    {
        std::istringstream iss(text);
        char c1 = 0, c2 = 0, c3 = 0;
        int x = 0, y = 0, w = 0, h = 0;
        if (!(iss >> x >> c1 >> y >> c2 >> w >> c3 >> h))
            return false;
        if (c1 != ',' || c2 != ',' || c3 != ',' || w <= 0 || h <= 0)
            return false;
        std::string rest;
        if (iss >> rest)
            return false;
        rect = handpose::camera::Rect(x, y, w, h);
        return true;
    }

    std::string annotated_path(const std::string &prefix, size_t index)
    {
        char suffix[32];
        std::snprintf(suffix, sizeof(suffix), "_%04zu.ppm", index);
        return prefix + suffix;
    }
}

int main(int argc, char **argv)
{
    using namespace handpose;

    std::string config_path;
    std::string annotate_prefix;
    bool orientation_mode = false;
    bool no_background = false;
    bool verbose = false;
    std::vector<camera::Rect> excluded;
    std::vector<std::string> frames;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            return 0;
        }
        else if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if (arg == "--orientation")
        {
            orientation_mode = true;
        }
        else if (arg == "--no-background")
        {
            no_background = true;
        }
        else if (arg == "--exclude" && i + 1 < argc)
        {
            camera::Rect rect;
            if (!parse_rect(argv[++i], rect))
            {
                std::cerr << "[Replay] Bad --exclude value '" << argv[i] << "' (expected x,y,w,h)\n";
                return 1;
            }
            excluded.push_back(rect);
        }
        else if (arg == "--annotate" && i + 1 < argc)
        {
            annotate_prefix = argv[++i];
        }
        else if (arg == "--verbose")
        {
            verbose = true;
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            std::cerr << "[Replay] Unknown or incomplete option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
        else
        {
            frames.push_back(arg);
        }
    }

    if (frames.empty())
    {
        std::cerr << "[Replay] No input frames\n";
        print_usage(argv[0]);
        return 1;
    }

    DetectorConfig config = orientation_mode ? DetectorConfig::orientation() : DetectorConfig::pointer();
    if (!config_path.empty() && !config.load_from_file(config_path))
    {
        std::cerr << "[Replay] Could not load configuration from " << config_path << "\n";
        return 1;
    }
    if (no_background)
        config.background.enabled = false;
    if (verbose)
        config.verbose = true;

    if (!config.validate())
    {
        std::cerr << "[Replay] Invalid configuration\n";
        return 1;
    }

    std::unique_ptr<PoseDetector> detector;
    if (orientation_mode)
        detector.reset(new OrientationDetector(config));
    else
        detector.reset(new HandPoseDetector(config));

    camera::Mask exclusion;
    for (size_t index = 0; index < frames.size(); ++index)
    {
        const std::string &path = frames[index];
        nlohmann::json line;
        line["frame"] = index;
        line["path"] = path;

        camera::Frame frame;
        if (!camera::utils::load_ppm(path, frame))
        {
            line["error"] = "unreadable frame";
            std::cout << line.dump() << std::endl;
            continue;
        }
        frame.timestamp_ns = index * kFrameIntervalNs;

        const camera::Mask *exclusion_ptr = nullptr;
        if (!excluded.empty())
        {
            if (!exclusion.same_size(frame.width, frame.height))
                exclusion = camera::utils::make_exclusion_mask(frame.width, frame.height, excluded);
            exclusion_ptr = &exclusion;
        }

        const PoseResult pose = detector->process(frame, exclusion_ptr);
        line["pose"] = pose_to_json(pose);
        std::cout << line.dump() << std::endl;

        if (!annotate_prefix.empty())
        {
            utils::draw_pose(frame, pose);
            const std::string out = annotated_path(annotate_prefix, index);
            if (!camera::utils::save_ppm(out, frame))
            {
                std::cerr << "[Replay] Failed to write " << out << "\n";
            }
        }
    }

    if (verbose)
    {
        std::cerr << "[Replay] Stats: " << nlohmann::json(detector->stats()).dump() << "\n";
    }

    return 0;
}
