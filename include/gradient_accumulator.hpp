#pragma once

#include <opencv2/core.hpp>
#include <cstddef>

namespace watermask {

// Per-pixel directional derivatives, CV_64FC1
struct GradientField {
    cv::Mat dx;  // along columns
    cv::Mat dy;  // along rows
};

// Channel-averaged intensity gradient of one frame on the 0-255 scale.
// Central differences inside, one-sided differences on the borders.
GradientField compute_gradient(const cv::Mat& frame);

class GradientAccumulator {
public:
    static constexpr std::size_t kMinimumFrames = 2;

    GradientAccumulator() = default;

    // Throws DimensionMismatchError if the size differs from the first frame
    void add(const cv::Mat& frame);
    void add(const GradientField& gradient);

    // |mean(dx)|, |mean(dy)|; the mean is taken over signed values first
    GradientField absolute_mean() const;

    std::size_t frame_count() const { return count_; }
    cv::Size frame_size() const { return size_; }
    void reset();

private:
    cv::Mat sum_dx_;
    cv::Mat sum_dy_;
    cv::Size size_;
    std::size_t count_ = 0;
};

} // namespace watermask
