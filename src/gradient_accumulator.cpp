#include "gradient_accumulator.hpp"
#include "errors.hpp"
#include <cmath>
#include <string>

namespace watermask {

namespace {

std::string size_string(const cv::Size& size) {
    return std::to_string(size.width) + "x" + std::to_string(size.height);
}

// Mean over channels, as double on the 0-255 scale
cv::Mat to_intensity(const cv::Mat& frame) {
    double scale;
    switch (frame.depth()) {
        case CV_8U:  scale = 1.0; break;
        case CV_16U: scale = 255.0 / 65535.0; break;
        default:
            throw InputError("Unsupported frame depth " + std::to_string(frame.depth()) +
                             ", expected 8 or 16 bit unsigned");
    }

    cv::Mat as_double;
    frame.convertTo(as_double, CV_64F, scale);

    int channels = frame.channels();
    if (channels == 1) {
        return as_double;
    }

    cv::Mat weights(1, channels, CV_64F, cv::Scalar(1.0 / channels));
    cv::Mat intensity;
    cv::transform(as_double, intensity, weights);
    return intensity;
}

} // namespace

GradientField compute_gradient(const cv::Mat& frame) {
    if (frame.empty()) {
        throw InputError("Cannot compute gradient of an empty frame");
    }
    if (frame.cols < 2 || frame.rows < 2) {
        throw InputError("Frame too small for gradients: " + size_string(frame.size()));
    }

    cv::Mat img = to_intensity(frame);
    const int rows = img.rows;
    const int cols = img.cols;

    GradientField g;
    g.dx.create(rows, cols, CV_64F);
    g.dy.create(rows, cols, CV_64F);

    for (int y = 0; y < rows; ++y) {
        const double* p = img.ptr<double>(y);
        double* dx = g.dx.ptr<double>(y);

        dx[0] = p[1] - p[0];
        for (int x = 1; x < cols - 1; ++x) {
            dx[x] = (p[x + 1] - p[x - 1]) / 2.0;
        }
        dx[cols - 1] = p[cols - 1] - p[cols - 2];
    }

    for (int y = 0; y < rows; ++y) {
        const double* above = img.ptr<double>(y == 0 ? 0 : y - 1);
        const double* below = img.ptr<double>(y == rows - 1 ? rows - 1 : y + 1);
        const double divisor = (y == 0 || y == rows - 1) ? 1.0 : 2.0;
        double* dy = g.dy.ptr<double>(y);

        for (int x = 0; x < cols; ++x) {
            dy[x] = (below[x] - above[x]) / divisor;
        }
    }

    return g;
}

void GradientAccumulator::add(const cv::Mat& frame) {
    if (count_ > 0 && frame.size() != size_) {
        throw DimensionMismatchError("Frame size " + size_string(frame.size()) +
                                     " differs from first frame " + size_string(size_));
    }
    add(compute_gradient(frame));
}

void GradientAccumulator::add(const GradientField& gradient) {
    if (count_ == 0) {
        size_ = gradient.dx.size();
        sum_dx_ = cv::Mat::zeros(size_, CV_64F);
        sum_dy_ = cv::Mat::zeros(size_, CV_64F);
    } else if (gradient.dx.size() != size_ || gradient.dy.size() != size_) {
        throw DimensionMismatchError("Gradient size " + size_string(gradient.dx.size()) +
                                     " differs from first frame " + size_string(size_));
    }

    sum_dx_ += gradient.dx;
    sum_dy_ += gradient.dy;
    ++count_;
}

GradientField GradientAccumulator::absolute_mean() const {
    if (count_ < kMinimumFrames) {
        throw InsufficientSamplesError("Need at least " + std::to_string(kMinimumFrames) +
                                       " frames to locate a watermark, got " +
                                       std::to_string(count_));
    }

    // Average the signed gradients first: a static overlay keeps its sign
    // in every frame, moving content cancels out.
    GradientField mean;
    mean.dx = cv::abs(sum_dx_ / static_cast<double>(count_));
    mean.dy = cv::abs(sum_dy_ / static_cast<double>(count_));
    return mean;
}

void GradientAccumulator::reset() {
    sum_dx_.release();
    sum_dy_.release();
    size_ = cv::Size();
    count_ = 0;
}

} // namespace watermask
