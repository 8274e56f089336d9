#include "frame_provider.hpp"
#include "errors.hpp"
#include <opencv2/videoio.hpp>
#include <sstream>
#include <vector>

namespace watermask {

namespace {

std::string describe(const std::string& video_path, double timestamp) {
    std::ostringstream out;
    out << video_path << " @ " << timestamp << "s";
    return out.str();
}

} // namespace

OpenCVFrameProvider::OpenCVFrameProvider(int timeout_ms)
    : timeout_ms_(timeout_ms) {}

cv::Mat OpenCVFrameProvider::decode(const std::string& video_path, double timestamp) const {
    try {
        // A capture per call keeps concurrent decodes independent
        std::vector<int> params = {
            cv::CAP_PROP_OPEN_TIMEOUT_MSEC, timeout_ms_,
            cv::CAP_PROP_READ_TIMEOUT_MSEC, timeout_ms_
        };
        cv::VideoCapture cap(video_path, cv::CAP_ANY, params);
        if (!cap.isOpened()) {
            throw DecodeError("Failed to open video: " + describe(video_path, timestamp));
        }

        if (!cap.set(cv::CAP_PROP_POS_MSEC, timestamp * 1000.0)) {
            throw DecodeError("Seek failed: " + describe(video_path, timestamp));
        }

        cv::Mat frame;
        if (!cap.read(frame) || frame.empty()) {
            throw DecodeError("No frame decoded: " + describe(video_path, timestamp));
        }
        return frame;
    } catch (const cv::Exception& e) {
        throw DecodeError("OpenCV error decoding " + describe(video_path, timestamp) + ": " + e.what());
    }
}

} // namespace watermask
