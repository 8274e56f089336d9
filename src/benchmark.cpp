#include "watermark_detector.hpp"
#include "gradient_accumulator.hpp"
#include "mask_builder.hpp"
#include <benchmark/benchmark.h>
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>
#include <iostream>
#include <thread>

namespace watermask {

class BenchmarkFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& /*state*/) override {
        config_.max_samples = 16;
        config_.use_keyframes = false;
        config_.num_workers = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));

        cv::RNG rng(1234);
        frames_.clear();
        for (int i = 0; i < 16; ++i) {
            frames_.push_back(make_frame(rng, i));
        }

        create_synthetic_video();
    }

    void TearDown(const ::benchmark::State& /*state*/) override {
        std::remove("benchmark_video.avi");
    }

protected:
    static cv::Mat make_frame(cv::RNG& rng, int index) {
        cv::Mat frame(720, 1280, CV_8UC3);
        rng.fill(frame, cv::RNG::UNIFORM, cv::Scalar::all(0), cv::Scalar::all(256));

        int circle_x = (index * 37) % frame.cols;
        cv::circle(frame, cv::Point(circle_x, 360), 80, cv::Scalar(255, 255, 255), -1);

        // Static logo in the top-right corner
        cv::rectangle(frame, cv::Rect(1100, 40, 140, 48), cv::Scalar(240, 240, 240), -1);
        cv::putText(frame, "LOGO", cv::Point(1110, 78), cv::FONT_HERSHEY_SIMPLEX, 1.2,
                    cv::Scalar(20, 20, 20), 3);
        return frame;
    }

    void create_synthetic_video() {
        cv::VideoWriter writer;
        int fourcc = cv::VideoWriter::fourcc('M', 'J', 'P', 'G');

        if (!writer.open("benchmark_video.avi", fourcc, 30.0, cv::Size(1280, 720))) {
            throw std::runtime_error("Failed to create benchmark video file");
        }

        cv::RNG rng(99);
        // 10 seconds at 30fps
        for (int i = 0; i < 300; ++i) {
            writer << make_frame(rng, i);
        }
        writer.release();

        std::cout << "Created benchmark video: benchmark_video.avi" << std::endl;
    }

    DetectorConfig config_;
    std::vector<cv::Mat> frames_;
};

BENCHMARK_DEFINE_F(BenchmarkFixture, GradientAccumulation)(benchmark::State& state) {
    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();

        GradientAccumulator accumulator;
        for (const auto& frame : frames_) {
            accumulator.add(frame);
        }
        auto mean = accumulator.absolute_mean();
        benchmark::DoNotOptimize(mean.dx.data);

        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(
            end - start);

        state.SetIterationTime(elapsed_seconds.count());
        state.counters["frames"] = static_cast<double>(frames_.size());
        state.counters["frames_per_second"] = static_cast<double>(frames_.size()) / elapsed_seconds.count();
    }
}

BENCHMARK_DEFINE_F(BenchmarkFixture, GaussianSmoothing)(benchmark::State& state) {
    GradientAccumulator accumulator;
    for (const auto& frame : frames_) {
        accumulator.add(frame);
    }
    cv::Mat salient = salient_field(accumulator.absolute_mean());

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();

        cv::Mat smoothed = gaussian_smooth(salient);
        benchmark::DoNotOptimize(smoothed.data);

        auto end = std::chrono::high_resolution_clock::now();
        state.SetIterationTime(std::chrono::duration<double>(end - start).count());
    }
}

BENCHMARK_DEFINE_F(BenchmarkFixture, MaskBuild)(benchmark::State& state) {
    GradientAccumulator accumulator;
    for (const auto& frame : frames_) {
        accumulator.add(frame);
    }
    auto mean = accumulator.absolute_mean();
    MaskBuilder builder;

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();

        MaskStatistics stats;
        cv::Mat mask = builder.build(mean, &stats);
        benchmark::DoNotOptimize(mask.data);

        auto end = std::chrono::high_resolution_clock::now();
        state.SetIterationTime(std::chrono::duration<double>(end - start).count());
        state.counters["mask_pixels"] = stats.mask_pixels;
    }
}

// Sample count scaling of the whole pipeline, decode included
BENCHMARK_DEFINE_F(BenchmarkFixture, FullDetection)(benchmark::State& state) {
    config_.max_samples = static_cast<int>(state.range(0));
    WatermarkDetector detector(config_);

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();

        auto result = detector.detect("benchmark_video.avi");

        auto end = std::chrono::high_resolution_clock::now();
        state.SetIterationTime(std::chrono::duration<double>(end - start).count());
        state.counters["samples"] = static_cast<double>(config_.max_samples);
        state.counters["decoded"] = static_cast<double>(result.report.decoded_frames);
    }
}

BENCHMARK_REGISTER_F(BenchmarkFixture, GradientAccumulation)->UseManualTime()->Unit(benchmark::kMillisecond);
BENCHMARK_REGISTER_F(BenchmarkFixture, GaussianSmoothing)->UseManualTime()->Unit(benchmark::kMillisecond);
BENCHMARK_REGISTER_F(BenchmarkFixture, MaskBuild)->UseManualTime()->Unit(benchmark::kMillisecond);
BENCHMARK_REGISTER_F(BenchmarkFixture, FullDetection)->Range(4, 32)->UseManualTime()->Unit(benchmark::kMillisecond);

} // namespace watermask

int main(int argc, char** argv) {
    std::cout << "Watermark Mask Extraction - Performance Benchmarks" << std::endl;
    std::cout << "==================================================" << std::endl;
    std::cout << "System Information:" << std::endl;
    std::cout << "  CPU Cores: " << std::thread::hardware_concurrency() << std::endl;
    std::cout << "  OpenCV: " << CV_VERSION << std::endl;
    std::cout << std::endl;

    ::benchmark::Initialize(&argc, argv);
    if (::benchmark::ReportUnrecognizedArguments(argc, argv)) return 1;
    ::benchmark::RunSpecifiedBenchmarks();

    std::cout << std::endl << "Benchmark completed!" << std::endl;

    return 0;
}
