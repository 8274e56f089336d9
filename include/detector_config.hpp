#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>

namespace watermask {

struct DetectorConfig {
    int max_samples = 50;
    std::uint32_t seed = 42;
    bool use_keyframes = true;
    int num_workers = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    int decode_timeout_ms = 30000;
    std::string ffprobe_path = "ffprobe";
    bool verbose = false;
};

void to_json(nlohmann::json& j, const DetectorConfig& config);
void from_json(const nlohmann::json& j, DetectorConfig& config);

// Throws ConfigError on out-of-range values
void validate(const DetectorConfig& config);

// Missing keys keep their defaults. Throws ConfigError.
DetectorConfig load_config(const std::string& path);

} // namespace watermask
