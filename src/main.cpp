#include "watermark_detector.hpp"
#include "mask_writer.hpp"
#include "video_probe.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] VIDEO_PATH\n"
              << "Locate a static watermark in a video and write its mask.\n"
              << "Options:\n"
              << "  -k, --keyframes NUM  Maximum frames to sample (default: 50)\n"
              << "  --seed NUM           Sampling seed (default: 42)\n"
              << "  -t, --threads NUM    Concurrent decode calls (default: auto)\n"
              << "  --timeout MS         Per-frame decode deadline (default: 30000)\n"
              << "  --no-keyframes       Sample a uniform time grid instead of keyframes\n"
              << "  --ffprobe PATH       ffprobe binary (default: ffprobe)\n"
              << "  -c, --config FILE    JSON config file, flags override its values\n"
              << "  -o, --mask FILE      Output mask image (default: <input>_mask.png)\n"
              << "  --report FILE        Write the JSON run report to FILE\n"
              << "  --info               Show video information only\n"
              << "  -v, --verbose        Show progress\n"
              << "  -h, --help           Show this help\n";
}

std::string default_mask_path(const std::string& video_path) {
    std::filesystem::path input(video_path);
    return (input.parent_path() / (input.stem().string() + "_mask.png")).string();
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string video_path;
    std::string config_file;
    std::string mask_file;
    std::string report_file;
    bool info_only = false;

    // Flags are applied after the config file is loaded
    json overrides = json::object();

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-k" || arg == "--keyframes") {
                if (++i < argc) overrides["max_samples"] = std::stoi(argv[i]);
            } else if (arg == "--seed") {
                if (++i < argc) overrides["seed"] = std::stoll(argv[i]);
            } else if (arg == "-t" || arg == "--threads") {
                if (++i < argc) overrides["num_workers"] = std::stoi(argv[i]);
            } else if (arg == "--timeout") {
                if (++i < argc) overrides["decode_timeout_ms"] = std::stoi(argv[i]);
            } else if (arg == "--no-keyframes") {
                overrides["use_keyframes"] = false;
            } else if (arg == "--ffprobe") {
                if (++i < argc) overrides["ffprobe_path"] = argv[i];
            } else if (arg == "-c" || arg == "--config") {
                if (++i < argc) config_file = argv[i];
            } else if (arg == "-o" || arg == "--mask") {
                if (++i < argc) mask_file = argv[i];
            } else if (arg == "--report") {
                if (++i < argc) report_file = argv[i];
            } else if (arg == "--info") {
                info_only = true;
            } else if (arg == "-v" || arg == "--verbose") {
                overrides["verbose"] = true;
            } else if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if (video_path.empty()) {
                video_path = arg;
            } else {
                std::cerr << "Error: Unexpected argument: " << arg << "\n";
                return 1;
            }
        }
    } catch (const std::logic_error& e) {
        std::cerr << "Error: Invalid numeric argument (" << e.what() << ")\n";
        return 1;
    }

    if (video_path.empty()) {
        std::cerr << "Error: No video path provided\n";
        return 1;
    }

    try {
        if (info_only) {
            auto info = watermask::get_video_info(video_path);

            json info_json;
            info_json["video_path"] = video_path;
            info_json["total_frames"] = info.total_frames;
            info_json["fps"] = info.fps;
            info_json["duration"] = info.duration;
            info_json["frame_size"] = {info.frame_size.width, info.frame_size.height};
            info_json["codec"] = info.codec;

            std::cout << info_json.dump(2) << std::endl;
            return 0;
        }

        watermask::DetectorConfig config;
        if (!config_file.empty()) {
            config = watermask::load_config(config_file);
        }
        json merged = config;
        merged.update(overrides);
        config = merged.get<watermask::DetectorConfig>();

        if (mask_file.empty()) {
            mask_file = default_mask_path(video_path);
        }

        watermask::WatermarkDetector detector(config);
        auto result = detector.detect(video_path);

        watermask::ImageFileMaskWriter writer;
        writer.write(result.mask, mask_file);

        json report_json = result.report;
        report_json["mask_path"] = mask_file;

        if (!report_file.empty()) {
            std::ofstream file(report_file);
            if (!file) {
                std::cerr << "Error: Cannot write report to " << report_file << std::endl;
                return 1;
            }
            file << report_json.dump(2);
            std::cout << "Mask saved to: " << mask_file << std::endl;
            std::cout << "Report saved to: " << report_file << std::endl;
        } else {
            std::cout << report_json.dump(2) << std::endl;
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
