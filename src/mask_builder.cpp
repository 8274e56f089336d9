#include "mask_builder.hpp"
#include "errors.hpp"
#include <cmath>

namespace watermask {

namespace {

// Half-sample symmetric mirror (d c b a | a b c d | d c b a), periodic in 2n
// so radii larger than the signal still resolve.
int reflect_index(int i, int n) {
    const int period = 2 * n;
    i %= period;
    if (i < 0) i += period;
    return i < n ? i : period - 1 - i;
}

void convolve_line(const double* src, int src_step, double* dst, int dst_step, int n,
                   const std::vector<double>& kernel) {
    const int radius = static_cast<int>(kernel.size() / 2);
    for (int i = 0; i < n; ++i) {
        double acc = 0.0;
        for (int k = -radius; k <= radius; ++k) {
            acc += kernel[static_cast<size_t>(k + radius)] * src[reflect_index(i + k, n) * src_step];
        }
        dst[i * dst_step] = acc;
    }
}

} // namespace

cv::Mat salient_field(const GradientField& absolute_mean, double threshold) {
    if (absolute_mean.dx.size() != absolute_mean.dy.size()) {
        throw DimensionMismatchError("Horizontal and vertical gradient fields differ in size");
    }

    cv::Mat salient = (absolute_mean.dx > threshold) | (absolute_mean.dy > threshold);
    cv::Mat field;
    salient.convertTo(field, CV_64F, 1.0 / 255.0);
    return field;
}

std::vector<double> gaussian_kernel(double sigma, double truncate) {
    const int radius = static_cast<int>(truncate * sigma + 0.5);
    std::vector<double> kernel(static_cast<size_t>(2 * radius + 1));

    double sum = 0.0;
    for (int x = -radius; x <= radius; ++x) {
        double w = std::exp(-0.5 * x * x / (sigma * sigma));
        kernel[static_cast<size_t>(x + radius)] = w;
        sum += w;
    }
    for (double& w : kernel) {
        w /= sum;
    }
    return kernel;
}

cv::Mat gaussian_smooth(const cv::Mat& field, double sigma) {
    if (field.empty()) {
        return cv::Mat();
    }
    if (field.channels() != 1) {
        throw InputError("Gaussian smoothing expects a single-channel field");
    }

    cv::Mat src;
    field.convertTo(src, CV_64F);
    if (!src.isContinuous()) {
        src = src.clone();
    }

    const std::vector<double> kernel = gaussian_kernel(sigma);
    const int rows = src.rows;
    const int cols = src.cols;

    cv::Mat horizontal(rows, cols, CV_64F);
    for (int y = 0; y < rows; ++y) {
        convolve_line(src.ptr<double>(y), 1, horizontal.ptr<double>(y), 1, cols, kernel);
    }

    cv::Mat smoothed(rows, cols, CV_64F);
    const double* h = horizontal.ptr<double>(0);
    double* out = smoothed.ptr<double>(0);
    for (int x = 0; x < cols; ++x) {
        convolve_line(h + x, cols, out + x, cols, rows, kernel);
    }
    return smoothed;
}

cv::Mat normalize_min_max(const cv::Mat& field) {
    cv::Mat values;
    field.convertTo(values, CV_64F);
    if (values.empty()) {
        return values;
    }

    double min_val, max_val;
    cv::minMaxLoc(values, &min_val, &max_val);
    if (max_val - min_val == 0.0) {
        return cv::Mat::zeros(values.size(), CV_64F);
    }
    return (values - min_val) / (max_val - min_val);
}

cv::Mat binarize(const cv::Mat& normalized, double cutoff) {
    cv::Mat mask = normalized > cutoff;
    return mask;
}

cv::Mat MaskBuilder::build(const GradientField& absolute_mean, MaskStatistics* stats) const {
    cv::Mat salient = salient_field(absolute_mean, kSalienceThreshold);
    cv::Mat smoothed = gaussian_smooth(salient, kSmoothingSigma);
    cv::Mat mask = binarize(normalize_min_max(smoothed), kBinarizeCutoff);

    if (stats) {
        stats->salient_pixels = cv::countNonZero(salient);
        stats->mask_pixels = cv::countNonZero(mask);
    }
    return mask;
}

} // namespace watermask
