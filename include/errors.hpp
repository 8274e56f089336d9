#pragma once

#include <stdexcept>
#include <string>

namespace watermask {

class WatermarkError : public std::runtime_error {
public:
    explicit WatermarkError(const std::string& message)
        : std::runtime_error(message) {}
};

// Unreadable video, unknown duration without keyframes, unusable frame shape
class InputError : public WatermarkError {
public:
    using WatermarkError::WatermarkError;
};

// A single sample failed to decode (or timed out); the run skips it
class DecodeError : public WatermarkError {
public:
    using WatermarkError::WatermarkError;
};

class DimensionMismatchError : public WatermarkError {
public:
    using WatermarkError::WatermarkError;
};

class InsufficientSamplesError : public WatermarkError {
public:
    using WatermarkError::WatermarkError;
};

class ConfigError : public WatermarkError {
public:
    using WatermarkError::WatermarkError;
};

class OutputError : public WatermarkError {
public:
    using WatermarkError::WatermarkError;
};

} // namespace watermask
