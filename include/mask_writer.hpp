#pragma once

#include <opencv2/core.hpp>
#include <string>

namespace watermask {

class MaskWriter {
public:
    virtual ~MaskWriter() = default;
    virtual void write(const cv::Mat& mask, const std::string& path) const = 0;
};

// Writes the mask as a single-channel image; format follows the extension
class ImageFileMaskWriter : public MaskWriter {
public:
    void write(const cv::Mat& mask, const std::string& path) const override;
};

// Throws OutputError unless mask is a non-empty CV_8UC1 holding only 0 and 255
void validate_mask(const cv::Mat& mask);

} // namespace watermask
