#include <gtest/gtest.h>
#include "watermark_detector.hpp"
#include "errors.hpp"
#include "test_fakes.hpp"
#include <opencv2/opencv.hpp>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace watermask {

class WatermarkDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        // The detector only checks that the input exists; the fakes do the rest
        input_ = scratch_file(".mp4");
        std::ofstream(input_) << "not a real video";

        config_.max_samples = 10;
        config_.num_workers = 4;
        config_.decode_timeout_ms = 2000;

        provider_ = std::make_shared<SyntheticFrameProvider>();
        cv::RNG rng(2024);
        for (int i = 1; i <= 10; ++i) {
            double t = static_cast<double>(i);
            keyframes_.keyframes.push_back(t);
            provider_->set_frame(t, make_overlay_frame(rng, frame_size_, overlay_));
        }
    }

    void TearDown() override {
        std::remove(input_.c_str());
    }

    WatermarkDetector make_detector(const ProbeResult& probe) {
        return WatermarkDetector(config_, std::make_shared<FixedTimestampSource>(probe), provider_);
    }

    static bool only_binary_values(const cv::Mat& mask) {
        cv::Mat stray = (mask != 0) & (mask != 255);
        return cv::countNonZero(stray) == 0;
    }

    const cv::Size frame_size_{64, 64};
    const cv::Rect overlay_{40, 8, 16, 12};
    DetectorConfig config_;
    ProbeResult keyframes_;
    std::shared_ptr<SyntheticFrameProvider> provider_;
    std::string input_;
};

TEST_F(WatermarkDetectorTest, LocatesStaticOverlay) {
    auto detector = make_detector(keyframes_);
    auto result = detector.detect(input_);
    const cv::Mat& mask = result.mask;

    ASSERT_EQ(mask.size(), frame_size_);
    EXPECT_EQ(mask.type(), CV_8UC1);
    EXPECT_TRUE(only_binary_values(mask));

    EXPECT_EQ(cv::countNonZero(mask(overlay_)), overlay_.area());

    // Far from the overlay and the frame border the noise averages out
    cv::Rect quiet(8, 32, 32, 24);
    EXPECT_EQ(cv::countNonZero(mask(quiet)), 0);

    EXPECT_EQ(result.report.decoded_frames, 10u);
    EXPECT_TRUE(result.report.skipped.empty());
    EXPECT_TRUE(result.report.used_keyframes);
    EXPECT_EQ(result.report.frame_size, frame_size_);
    EXPECT_EQ(result.report.mask_pixels, cv::countNonZero(mask));
}

TEST_F(WatermarkDetectorTest, SkipsFramesThatFailToDecode) {
    keyframes_.keyframes.push_back(11.0);
    keyframes_.keyframes.push_back(12.0);
    config_.max_samples = 12;

    auto detector = make_detector(keyframes_);
    auto result = detector.detect(input_);

    EXPECT_EQ(result.report.timestamps.size(), 12u);
    EXPECT_EQ(result.report.decoded_frames, 10u);
    ASSERT_EQ(result.report.skipped.size(), 2u);
    for (const auto& sample : result.report.skipped) {
        EXPECT_TRUE(sample.timestamp == 11.0 || sample.timestamp == 12.0);
        EXPECT_FALSE(sample.reason.empty());
    }
    EXPECT_EQ(cv::countNonZero(result.mask(overlay_)), overlay_.area());
}

TEST_F(WatermarkDetectorTest, OneDecodedFrameIsNotEnough) {
    ProbeResult probe;
    probe.keyframes = {1.0, 21.0, 22.0, 23.0, 24.0};
    config_.max_samples = 5;

    auto detector = make_detector(probe);
    EXPECT_THROW(detector.detect(input_), InsufficientSamplesError);
    EXPECT_EQ(provider_->calls(), 5);
}

TEST_F(WatermarkDetectorTest, SingleRequestedSampleIsNotEnough) {
    config_.max_samples = 1;

    auto detector = make_detector(keyframes_);
    EXPECT_THROW(detector.detect(input_), InsufficientSamplesError);
}

TEST_F(WatermarkDetectorTest, InconsistentFrameSizesAbort) {
    provider_->set_frame(5.0, cv::Mat(32, 64, CV_8UC3, cv::Scalar::all(128)));

    auto detector = make_detector(keyframes_);
    EXPECT_THROW(detector.detect(input_), DimensionMismatchError);
}

TEST_F(WatermarkDetectorTest, TimedOutDecodesAreSkippedConsistently) {
    ProbeResult without_slow = keyframes_;
    without_slow.keyframes.erase(without_slow.keyframes.begin() + 2);  // 3.0

    config_.decode_timeout_ms = 100;
    provider_->set_delay(3.0, std::chrono::milliseconds(600));

    auto slow = make_detector(keyframes_).detect(input_);

    ASSERT_EQ(slow.report.skipped.size(), 1u);
    EXPECT_DOUBLE_EQ(slow.report.skipped[0].timestamp, 3.0);
    EXPECT_NE(slow.report.skipped[0].reason.find("timed out"), std::string::npos);
    EXPECT_EQ(slow.report.decoded_frames, 9u);

    auto reference = make_detector(without_slow).detect(input_);
    EXPECT_EQ(cv::norm(slow.mask, reference.mask, cv::NORM_INF), 0.0);
}

TEST_F(WatermarkDetectorTest, StalledDecodeDoesNotHoldUpTheRun) {
    ProbeResult grid;
    grid.duration = 4.0;
    config_.max_samples = 4;
    config_.num_workers = 4;
    config_.decode_timeout_ms = 100;
    provider_->set_delay(4.0, std::chrono::milliseconds(3000));

    auto detector = make_detector(grid);
    auto start = std::chrono::steady_clock::now();
    auto result = detector.detect(input_);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, std::chrono::milliseconds(1500));
    ASSERT_EQ(result.report.skipped.size(), 1u);
    EXPECT_DOUBLE_EQ(result.report.skipped[0].timestamp, 4.0);
    EXPECT_EQ(result.report.decoded_frames, 3u);
}

TEST_F(WatermarkDetectorTest, TimedOutDecodesKeepTheirWorker) {
    ProbeResult grid;
    grid.duration = 10.0;
    config_.num_workers = 2;
    config_.decode_timeout_ms = 100;
    provider_->set_delay(1.0, std::chrono::milliseconds(1000));

    auto result = make_detector(grid).detect(input_);

    EXPECT_LE(provider_->peak_concurrency(), 2);
    ASSERT_EQ(result.report.skipped.size(), 1u);
    EXPECT_DOUBLE_EQ(result.report.skipped[0].timestamp, 1.0);
    EXPECT_EQ(result.report.decoded_frames, 9u);
}

TEST_F(WatermarkDetectorTest, SamplesAreSkippedWhenNoWorkerFreesUp) {
    ProbeResult grid;
    grid.duration = 4.0;
    config_.max_samples = 4;
    config_.num_workers = 1;
    config_.decode_timeout_ms = 100;
    provider_->set_delay(3.0, std::chrono::milliseconds(2000));

    auto start = std::chrono::steady_clock::now();
    auto result = make_detector(grid).detect(input_);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, std::chrono::milliseconds(1500));
    EXPECT_EQ(provider_->peak_concurrency(), 1);
    EXPECT_EQ(result.report.decoded_frames, 2u);
    ASSERT_EQ(result.report.skipped.size(), 2u);
    EXPECT_DOUBLE_EQ(result.report.skipped[0].timestamp, 3.0);
    EXPECT_NE(result.report.skipped[0].reason.find("timed out"), std::string::npos);
    EXPECT_DOUBLE_EQ(result.report.skipped[1].timestamp, 4.0);
    EXPECT_NE(result.report.skipped[1].reason.find("no decode worker"), std::string::npos);
}

TEST_F(WatermarkDetectorTest, RepeatedRunsAreIdentical) {
    cv::RNG rng(77);
    for (int i = 11; i <= 40; ++i) {
        double t = static_cast<double>(i);
        keyframes_.keyframes.push_back(t);
        provider_->set_frame(t, make_overlay_frame(rng, frame_size_, overlay_));
    }

    auto first = make_detector(keyframes_).detect(input_);
    auto second = make_detector(keyframes_).detect(input_);

    EXPECT_EQ(first.report.timestamps, second.report.timestamps);
    EXPECT_EQ(first.report.decoded_frames, second.report.decoded_frames);
    EXPECT_EQ(cv::norm(first.mask, second.mask, cv::NORM_INF), 0.0);
}

TEST_F(WatermarkDetectorTest, UniformFramesGiveEmptyMask) {
    ProbeResult probe;
    probe.duration = 4.0;
    config_.max_samples = 4;

    auto flat = std::make_shared<SyntheticFrameProvider>();
    for (double t : {1.0, 2.0, 3.0, 4.0}) {
        flat->set_frame(t, cv::Mat(24, 32, CV_8UC3, cv::Scalar(90, 90, 90)));
    }

    WatermarkDetector detector(config_, std::make_shared<FixedTimestampSource>(probe), flat);
    auto result = detector.detect(input_);

    EXPECT_FALSE(result.report.used_keyframes);
    EXPECT_EQ(result.report.timestamps, (std::vector<double>{1.0, 2.0, 3.0, 4.0}));
    EXPECT_EQ(result.mask.size(), cv::Size(32, 24));
    EXPECT_EQ(cv::countNonZero(result.mask), 0);
}

TEST_F(WatermarkDetectorTest, NegativeKeyframesFallBackToGrid) {
    ProbeResult probe;
    probe.keyframes = {-0.04, -1.0};
    probe.duration = 4.0;
    config_.max_samples = 4;

    auto result = make_detector(probe).detect(input_);

    EXPECT_FALSE(result.report.used_keyframes);
    EXPECT_EQ(result.report.timestamps, (std::vector<double>{1.0, 2.0, 3.0, 4.0}));
    EXPECT_EQ(result.report.decoded_frames, 4u);
}

TEST_F(WatermarkDetectorTest, MissingVideoIsInputError) {
    auto detector = make_detector(keyframes_);
    EXPECT_THROW(detector.detect("no_such_video.mp4"), InputError);
    EXPECT_EQ(provider_->calls(), 0);
}

TEST_F(WatermarkDetectorTest, UnknownDurationIsInputError) {
    auto detector = make_detector(ProbeResult{});
    EXPECT_THROW(detector.detect(input_), InputError);
}

TEST_F(WatermarkDetectorTest, InvalidConfigRejected) {
    config_.num_workers = 0;
    EXPECT_THROW(make_detector(keyframes_), ConfigError);
}

TEST_F(WatermarkDetectorTest, ReportSerializesToJson) {
    keyframes_.keyframes.push_back(99.0);
    config_.max_samples = 11;

    auto result = make_detector(keyframes_).detect(input_);
    json j = result.report;

    EXPECT_EQ(j["video_path"], input_);
    EXPECT_EQ(j["decoded_frames"], 10);
    EXPECT_EQ(j["timestamps"].size(), 11u);
    ASSERT_EQ(j["skipped"].size(), 1u);
    EXPECT_DOUBLE_EQ(j["skipped"][0]["timestamp"].get<double>(), 99.0);
    EXPECT_EQ(j["frame_size"], json::array({64, 64}));
    EXPECT_EQ(j["mask_pixels"], result.report.mask_pixels);
    EXPECT_TRUE(j.contains("processing_time_ms"));
}

} // namespace watermask
