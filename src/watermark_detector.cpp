#include "watermark_detector.hpp"
#include "errors.hpp"
#include "frame_sampler.hpp"
#include "gradient_accumulator.hpp"
#include "mask_builder.hpp"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <future>
#include <iostream>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

namespace watermask {

void to_json(nlohmann::json& j, const DetectionReport& report) {
    nlohmann::json skipped = nlohmann::json::array();
    for (const auto& sample : report.skipped) {
        skipped.push_back({{"timestamp", sample.timestamp}, {"reason", sample.reason}});
    }

    j = nlohmann::json{
        {"video_path", report.video_path},
        {"used_keyframes", report.used_keyframes},
        {"timestamps", report.timestamps},
        {"decoded_frames", report.decoded_frames},
        {"skipped", skipped},
        {"frame_size", {report.frame_size.width, report.frame_size.height}},
        {"salient_pixels", report.salient_pixels},
        {"mask_pixels", report.mask_pixels},
        {"processing_time_ms", report.processing_time.count()}
    };
}

namespace {

// Decode calls in flight, including timed out ones still running detached
class WorkerSlots {
public:
    // Waits up to `timeout` for a free slot, then claims as many as are free,
    // at most `wanted`. Returns 0 if none freed up in time.
    size_t acquire(size_t wanted, size_t limit, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!released_.wait_for(lock, timeout, [&] { return running_ < limit; })) {
            return 0;
        }
        size_t claimed = std::min(wanted, limit - running_);
        running_ += claimed;
        return claimed;
    }

    void release(size_t count = 1) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ -= count;
        }
        released_.notify_all();
    }

    size_t running() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable released_;
    size_t running_ = 0;
};

} // namespace

class WatermarkDetector::Impl {
public:
    Impl(const DetectorConfig& config,
         std::shared_ptr<const TimestampSource> timestamps,
         std::shared_ptr<const FrameProvider> frames)
        : config_(config)
        , timestamps_(std::move(timestamps))
        , frames_(std::move(frames)) {

        validate(config_);

        if (!timestamps_) {
            timestamps_ = std::make_shared<FfprobeTimestampSource>(
                config_.ffprobe_path, config_.use_keyframes);
        }
        if (!frames_) {
            frames_ = std::make_shared<OpenCVFrameProvider>(config_.decode_timeout_ms);
        }

        if (config_.verbose) {
            std::cout << "WatermarkDetector initialized with:" << std::endl;
            std::cout << "  Max samples: " << config_.max_samples << std::endl;
            std::cout << "  Seed: " << config_.seed << std::endl;
            std::cout << "  Keyframe sampling: " << (config_.use_keyframes ? "on" : "off") << std::endl;
            std::cout << "  Workers: " << config_.num_workers << std::endl;
            std::cout << "  Decode timeout: " << config_.decode_timeout_ms << "ms" << std::endl;
        }
    }

    DetectionResult detect(const std::string& video_path) {
        auto start_time = std::chrono::high_resolution_clock::now();

        std::error_code ec;
        if (!std::filesystem::is_regular_file(video_path, ec)) {
            throw InputError("Video file does not exist or is not readable: " + video_path);
        }

        DetectionResult result;
        DetectionReport& report = result.report;
        report.video_path = video_path;

        ProbeResult probe = timestamps_->probe(video_path);
        report.used_keyframes = !usable_keyframes(probe.keyframes).empty();
        report.timestamps = select_timestamps(probe, config_.max_samples, config_.seed);

        if (config_.verbose) {
            std::cout << "Sampling " << report.timestamps.size() << " timestamps from "
                      << (report.used_keyframes ? "keyframes" : "uniform grid") << std::endl;
        }

        GradientAccumulator accumulator;
        accumulate(video_path, report, accumulator);

        report.decoded_frames = accumulator.frame_count();
        if (report.decoded_frames < GradientAccumulator::kMinimumFrames) {
            throw InsufficientSamplesError(
                "Decoded " + std::to_string(report.decoded_frames) + " of " +
                std::to_string(report.timestamps.size()) +
                " sampled frames, at least 2 are needed to extract a watermark");
        }
        report.frame_size = accumulator.frame_size();

        MaskStatistics stats;
        result.mask = MaskBuilder().build(accumulator.absolute_mean(), &stats);
        report.salient_pixels = stats.salient_pixels;
        report.mask_pixels = stats.mask_pixels;

        auto end_time = std::chrono::high_resolution_clock::now();
        report.processing_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            end_time - start_time);

        if (config_.verbose) {
            std::cout << "Mask computed from " << report.decoded_frames << " frames ("
                      << report.skipped.size() << " skipped): " << report.mask_pixels
                      << " masked pixels in " << report.processing_time.count() << "ms" << std::endl;
        }
        return result;
    }

    const DetectorConfig& config() const { return config_; }

private:
    // Decodes in batches of at most num_workers concurrent calls and folds the
    // frames into the accumulator in sample order, one at a time. A call that
    // misses its deadline is skipped and left running on its own thread; it
    // keeps its worker slot until it finishes, so later batches shrink.
    void accumulate(const std::string& video_path, DetectionReport& report,
                    GradientAccumulator& accumulator) {
        const auto& timestamps = report.timestamps;
        const auto timeout = std::chrono::milliseconds(config_.decode_timeout_ms);

        size_t next = 0;
        while (next < timestamps.size()) {
            size_t batch_size = slots_->acquire(timestamps.size() - next,
                                                static_cast<size_t>(config_.num_workers), timeout);
            if (batch_size == 0) {
                for (; next < timestamps.size(); ++next) {
                    skip(report, timestamps[next], "no decode worker became free within " +
                         std::to_string(config_.decode_timeout_ms) + "ms");
                }
                break;
            }
            size_t end_idx = next + batch_size;

            std::vector<std::future<cv::Mat>> futures;
            auto deadline = std::chrono::steady_clock::now() + timeout;
            for (size_t j = next; j < end_idx; ++j) {
                try {
                    futures.push_back(launch_decode(video_path, timestamps[j]));
                } catch (const std::system_error&) {
                    slots_->release(end_idx - j);
                    throw;
                }
            }

            for (size_t j = next; j < end_idx; ++j) {
                auto& future = futures[j - next];
                double t = timestamps[j];

                if (future.wait_until(deadline) == std::future_status::timeout) {
                    skip(report, t, "decode timed out after " +
                         std::to_string(config_.decode_timeout_ms) + "ms");
                    continue;
                }

                cv::Mat frame;
                try {
                    frame = future.get();
                } catch (const DecodeError& e) {
                    skip(report, t, e.what());
                    continue;
                }
                accumulator.add(frame);
            }
            next = end_idx;
        }

        size_t running = slots_->running();
        if (running > 0 && config_.verbose) {
            std::cout << "Leaving " << running << " timed out decode calls running" << std::endl;
        }
    }

    // The caller must already hold a slot for this call; the thread gives it back
    std::future<cv::Mat> launch_decode(const std::string& video_path, double timestamp) {
        std::packaged_task<cv::Mat()> task(
            [provider = frames_, video_path, timestamp]() {
                return provider->decode(video_path, timestamp);
            });
        auto future = task.get_future();
        std::thread([task = std::move(task), slots = slots_]() mutable {
            task();
            slots->release();
        }).detach();
        return future;
    }

    void skip(DetectionReport& report, double timestamp, const std::string& reason) {
        if (config_.verbose) {
            std::cout << "Skipping sample at " << timestamp << "s: " << reason << std::endl;
        }
        report.skipped.push_back({timestamp, reason});
    }

    DetectorConfig config_;
    std::shared_ptr<const TimestampSource> timestamps_;
    std::shared_ptr<const FrameProvider> frames_;
    std::shared_ptr<WorkerSlots> slots_ = std::make_shared<WorkerSlots>();
};

WatermarkDetector::WatermarkDetector(const DetectorConfig& config,
                                     std::shared_ptr<const TimestampSource> timestamps,
                                     std::shared_ptr<const FrameProvider> frames)
    : pimpl_(std::make_unique<Impl>(config, std::move(timestamps), std::move(frames))) {}

WatermarkDetector::~WatermarkDetector() = default;

DetectionResult WatermarkDetector::detect(const std::string& video_path) {
    return pimpl_->detect(video_path);
}

cv::Mat WatermarkDetector::compute_mask(const std::string& video_path) {
    return pimpl_->detect(video_path).mask;
}

const DetectorConfig& WatermarkDetector::config() const {
    return pimpl_->config();
}

cv::Mat compute_watermark_mask(const std::string& video_path, int max_sample_count) {
    DetectorConfig config;
    config.max_samples = max_sample_count;
    return WatermarkDetector(config).compute_mask(video_path);
}

} // namespace watermask
