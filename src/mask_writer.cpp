#include "mask_writer.hpp"
#include "errors.hpp"
#include <opencv2/imgcodecs.hpp>

namespace watermask {

void validate_mask(const cv::Mat& mask) {
    if (mask.empty()) {
        throw OutputError("Mask is empty");
    }
    if (mask.type() != CV_8UC1) {
        throw OutputError("Mask must be single-channel 8-bit");
    }

    cv::Mat stray = (mask != 0) & (mask != 255);
    if (cv::countNonZero(stray) > 0) {
        throw OutputError("Mask contains values other than 0 and 255");
    }
}

void ImageFileMaskWriter::write(const cv::Mat& mask, const std::string& path) const {
    validate_mask(mask);

    bool written = false;
    try {
        written = cv::imwrite(path, mask);
    } catch (const cv::Exception& e) {
        throw OutputError("Failed to write mask to " + path + ": " + e.what());
    }
    if (!written) {
        throw OutputError("Failed to write mask to " + path);
    }
}

} // namespace watermask
