#pragma once

#include "gradient_accumulator.hpp"
#include <opencv2/core.hpp>
#include <vector>

namespace watermask {

constexpr double kSalienceThreshold = 10.0;
constexpr double kSmoothingSigma = 3.0;
constexpr double kKernelTruncate = 4.0;
constexpr double kBinarizeCutoff = 0.2;

struct MaskStatistics {
    int salient_pixels = 0;
    int mask_pixels = 0;
};

// 1.0 where either |mean gradient| exceeds the threshold, else 0.0 (CV_64FC1)
cv::Mat salient_field(const GradientField& absolute_mean,
                      double threshold = kSalienceThreshold);

// Normalized 1-D Gaussian weights, radius int(truncate * sigma + 0.5)
std::vector<double> gaussian_kernel(double sigma, double truncate = kKernelTruncate);

// Separable Gaussian with half-sample symmetric borders
cv::Mat gaussian_smooth(const cv::Mat& field, double sigma = kSmoothingSigma);

// Rescale into [0, 1]; a uniform field maps to all zeros
cv::Mat normalize_min_max(const cv::Mat& field);

// CV_8UC1 with 255 where value > cutoff, else 0
cv::Mat binarize(const cv::Mat& normalized, double cutoff = kBinarizeCutoff);

class MaskBuilder {
public:
    cv::Mat build(const GradientField& absolute_mean,
                  MaskStatistics* stats = nullptr) const;
};

} // namespace watermask
