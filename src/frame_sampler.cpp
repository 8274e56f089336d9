#include "frame_sampler.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace watermask {

void deterministic_shuffle(std::vector<double>& values, std::mt19937& engine) {
    // std::shuffle goes through uniform_int_distribution, whose algorithm is
    // left to the library; reduce the engine output directly instead.
    for (size_t i = values.size(); i > 1; --i) {
        size_t j = static_cast<size_t>(engine() % i);
        std::swap(values[i - 1], values[j]);
    }
}

std::vector<double> uniform_timestamps(double duration, int count) {
    std::vector<double> times;
    times.reserve(static_cast<size_t>(count));

    double interval = duration / count;
    for (int i = 1; i <= count; ++i) {
        times.push_back(std::round(i * interval * 10000.0) / 10000.0);
    }
    return times;
}

std::vector<double> select_timestamps(const ProbeResult& probe,
                                      int max_count,
                                      std::uint32_t seed) {
    if (max_count < 1) {
        throw InputError("Sample count must be positive, got " + std::to_string(max_count));
    }

    std::vector<double> keyframes = usable_keyframes(probe.keyframes);

    if (!keyframes.empty()) {
        std::sort(keyframes.begin(), keyframes.end());
        keyframes.erase(std::unique(keyframes.begin(), keyframes.end()), keyframes.end());

        std::mt19937 engine(seed);
        deterministic_shuffle(keyframes, engine);

        if (keyframes.size() > static_cast<size_t>(max_count)) {
            keyframes.resize(static_cast<size_t>(max_count));
        }
        return keyframes;
    }

    if (!probe.duration || !std::isfinite(*probe.duration) || *probe.duration <= 0.0) {
        throw InputError("Video duration is unknown and no keyframes were found");
    }
    return uniform_timestamps(*probe.duration, max_count);
}

} // namespace watermask
