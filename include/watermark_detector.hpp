#pragma once

#include "detector_config.hpp"
#include "frame_provider.hpp"
#include "video_probe.hpp"
#include <opencv2/core.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace watermask {

struct SkippedSample {
    double timestamp;
    std::string reason;
};

struct DetectionReport {
    std::string video_path;
    bool used_keyframes = false;
    std::vector<double> timestamps;
    std::size_t decoded_frames = 0;
    std::vector<SkippedSample> skipped;
    cv::Size frame_size;
    int salient_pixels = 0;
    int mask_pixels = 0;
    std::chrono::milliseconds processing_time{0};
};

struct DetectionResult {
    cv::Mat mask;
    DetectionReport report;
};

void to_json(nlohmann::json& j, const DetectionReport& report);

class WatermarkDetector {
public:
    // Null collaborators are replaced by the ffprobe/OpenCV implementations
    explicit WatermarkDetector(const DetectorConfig& config = {},
                               std::shared_ptr<const TimestampSource> timestamps = nullptr,
                               std::shared_ptr<const FrameProvider> frames = nullptr);
    ~WatermarkDetector();

    DetectionResult detect(const std::string& video_path);
    cv::Mat compute_mask(const std::string& video_path);

    const DetectorConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

cv::Mat compute_watermark_mask(const std::string& video_path, int max_sample_count);

} // namespace watermask
