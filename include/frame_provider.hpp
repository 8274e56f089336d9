#pragma once

#include <opencv2/core.hpp>
#include <string>

namespace watermask {

class FrameProvider {
public:
    virtual ~FrameProvider() = default;

    // Decode the frame shown at `timestamp` seconds. Throws DecodeError.
    // Implementations must tolerate concurrent calls.
    virtual cv::Mat decode(const std::string& video_path, double timestamp) const = 0;
};

class OpenCVFrameProvider : public FrameProvider {
public:
    explicit OpenCVFrameProvider(int timeout_ms = 30000);

    cv::Mat decode(const std::string& video_path, double timestamp) const override;

private:
    int timeout_ms_;
};

} // namespace watermask
