#include "detector_config.hpp"
#include "errors.hpp"
#include <cstdint>
#include <fstream>
#include <limits>

namespace watermask {

namespace {

// Whole numbers only; floats and out-of-range values are rejected, not truncated
template <typename T>
T integer_value(const nlohmann::json& j, const char* key, T fallback) {
    auto it = j.find(key);
    if (it == j.end()) {
        return fallback;
    }

    bool fits = false;
    if (it->is_number_unsigned()) {
        fits = it->get<std::uint64_t>() <=
               static_cast<std::uint64_t>(std::numeric_limits<T>::max());
    } else if (it->is_number_integer()) {
        auto value = it->get<std::int64_t>();
        fits = value >= static_cast<std::int64_t>(std::numeric_limits<T>::min()) &&
               (value < 0 || static_cast<std::uint64_t>(value) <=
                   static_cast<std::uint64_t>(std::numeric_limits<T>::max()));
    }
    if (!fits) {
        throw ConfigError(std::string(key) + " must be an integer in [" +
                          std::to_string(std::numeric_limits<T>::min()) + ", " +
                          std::to_string(std::numeric_limits<T>::max()) + "], got " +
                          it->dump());
    }
    return it->get<T>();
}

} // namespace

void to_json(nlohmann::json& j, const DetectorConfig& config) {
    j = nlohmann::json{
        {"max_samples", config.max_samples},
        {"seed", config.seed},
        {"use_keyframes", config.use_keyframes},
        {"num_workers", config.num_workers},
        {"decode_timeout_ms", config.decode_timeout_ms},
        {"ffprobe_path", config.ffprobe_path},
        {"verbose", config.verbose}
    };
}

void from_json(const nlohmann::json& j, DetectorConfig& config) {
    config.max_samples = integer_value(j, "max_samples", config.max_samples);
    config.seed = integer_value(j, "seed", config.seed);
    config.use_keyframes = j.value("use_keyframes", config.use_keyframes);
    config.num_workers = integer_value(j, "num_workers", config.num_workers);
    config.decode_timeout_ms = integer_value(j, "decode_timeout_ms", config.decode_timeout_ms);
    config.ffprobe_path = j.value("ffprobe_path", config.ffprobe_path);
    config.verbose = j.value("verbose", config.verbose);
}

void validate(const DetectorConfig& config) {
    if (config.max_samples < 1) {
        throw ConfigError("max_samples must be at least 1, got " + std::to_string(config.max_samples));
    }
    if (config.num_workers < 1) {
        throw ConfigError("num_workers must be at least 1, got " + std::to_string(config.num_workers));
    }
    if (config.decode_timeout_ms <= 0) {
        throw ConfigError("decode_timeout_ms must be positive, got " +
                          std::to_string(config.decode_timeout_ms));
    }
    if (config.use_keyframes && config.ffprobe_path.empty()) {
        throw ConfigError("ffprobe_path is empty but keyframe sampling is enabled");
    }
}

DetectorConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Cannot open config file: " + path);
    }

    DetectorConfig config;
    try {
        nlohmann::json j = nlohmann::json::parse(file);
        if (!j.is_object()) {
            throw ConfigError("Config file must contain a JSON object: " + path);
        }
        config = j.get<DetectorConfig>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Invalid config file " + path + ": " + e.what());
    }

    validate(config);
    return config;
}

} // namespace watermask
