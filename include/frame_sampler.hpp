#pragma once

#include "video_probe.hpp"
#include <cstdint>
#include <random>
#include <vector>

namespace watermask {

constexpr std::uint32_t kDefaultSamplingSeed = 42;

/**
 * Choose the timestamps (seconds) to decode.
 *
 * With keyframes: dedupe, sort, shuffle with a Fisher-Yates pass driven by
 * the raw output of std::mt19937(seed), keep the first max_count.
 * Without keyframes: max_count points evenly spaced over the duration,
 * starting one interval after t=0.
 *
 * Throws InputError if max_count < 1, or if there are no keyframes and the
 * duration is unknown or non-positive.
 */
std::vector<double> select_timestamps(const ProbeResult& probe,
                                      int max_count,
                                      std::uint32_t seed = kDefaultSamplingSeed);

std::vector<double> uniform_timestamps(double duration, int count);

// In-place shuffle that only depends on the engine's specified output sequence
void deterministic_shuffle(std::vector<double>& values, std::mt19937& engine);

} // namespace watermask
