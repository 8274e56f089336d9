#include "video_probe.hpp"
#include "errors.hpp"
#include <opencv2/videoio.hpp>
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iterator>
#include <memory>
#include <sstream>
#include <utility>

namespace watermask {

namespace {

struct PipeCloser {
    int* status;
    void operator()(FILE* pipe) const {
        int rc = pclose(pipe);
        if (status) *status = rc;
    }
};

std::string shell_quote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

// Runs the command and returns its stdout, or nothing if it could not be
// started or exited non-zero.
std::optional<std::string> run_command(const std::string& command) {
    int status = -1;
    std::string output;
    {
        std::unique_ptr<FILE, PipeCloser> pipe(popen(command.c_str(), "r"), PipeCloser{&status});
        if (!pipe) {
            return std::nullopt;
        }

        std::array<char, 4096> buffer;
        size_t n;
        while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe.get())) > 0) {
            output.append(buffer.data(), n);
        }
    }
    if (status != 0) {
        return std::nullopt;
    }
    return output;
}

bool parse_seconds(const std::string& text, double& value) {
    if (text.empty()) return false;
    const char* begin = text.c_str();
    char* end = nullptr;
    value = std::strtod(begin, &end);
    if (end == begin) return false;
    while (*end == ' ' || *end == '\t' || *end == '\r') ++end;
    return *end == '\0' && std::isfinite(value);
}

} // namespace

std::vector<double> parse_keyframe_times(const std::string& ffprobe_output) {
    static const std::string key = "pkt_dts_time=";

    std::vector<double> times;
    std::istringstream stream(ffprobe_output);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.compare(0, key.size(), key) != 0) continue;
        std::string value = line.substr(key.size());
        if (value.find("N/A") != std::string::npos) continue;

        double seconds;
        if (parse_seconds(value, seconds)) {
            times.push_back(seconds);
        }
    }
    return times;
}

FfprobeTimestampSource::FfprobeTimestampSource(std::string ffprobe_path, bool use_keyframes)
    : ffprobe_path_(std::move(ffprobe_path))
    , use_keyframes_(use_keyframes) {}

bool is_usable_timestamp(double seconds) {
    return std::isfinite(seconds) && seconds >= 0.0;
}

std::vector<double> usable_keyframes(const std::vector<double>& keyframes) {
    std::vector<double> usable;
    usable.reserve(keyframes.size());
    std::copy_if(keyframes.begin(), keyframes.end(), std::back_inserter(usable), is_usable_timestamp);
    return usable;
}

ProbeResult FfprobeTimestampSource::probe(const std::string& video_path) const {
    ProbeResult result;
    if (use_keyframes_) {
        result.keyframes = query_keyframes(video_path);
    }
    if (usable_keyframes(result.keyframes).empty()) {
        result.duration = query_duration(video_path);
    }
    return result;
}

std::vector<double> FfprobeTimestampSource::query_keyframes(const std::string& video_path) const {
    std::string command = shell_quote(ffprobe_path_) +
        " -hide_banner -loglevel warning -select_streams v -skip_frame nokey"
        " -show_frames -show_entries frame=pkt_dts_time " +
        shell_quote(video_path) + " 2>/dev/null";

    auto output = run_command(command);
    if (!output) {
        return {};
    }
    return parse_keyframe_times(*output);
}

std::optional<double> FfprobeTimestampSource::query_duration(const std::string& video_path) const {
    std::string command = shell_quote(ffprobe_path_) +
        " -hide_banner -loglevel warning -show_entries format=duration -of csv=p=0 " +
        shell_quote(video_path) + " 2>/dev/null";

    auto output = run_command(command);
    if (output) {
        std::string first = output->substr(0, output->find_first_of(",\n"));
        double seconds;
        if (parse_seconds(first, seconds) && seconds > 0.0) {
            return seconds;
        }
    }

    // ffprobe missing or silent; ask the container through OpenCV instead
    cv::VideoCapture cap(video_path);
    if (!cap.isOpened()) {
        return std::nullopt;
    }
    double frames = cap.get(cv::CAP_PROP_FRAME_COUNT);
    double fps = cap.get(cv::CAP_PROP_FPS);
    if (frames > 0.0 && fps > 0.0) {
        return frames / fps;
    }
    return std::nullopt;
}

VideoInfo get_video_info(const std::string& video_path) {
    cv::VideoCapture cap(video_path);
    if (!cap.isOpened()) {
        throw InputError("Cannot open video file: " + video_path);
    }

    VideoInfo info;
    info.total_frames = static_cast<int>(cap.get(cv::CAP_PROP_FRAME_COUNT));
    info.fps = cap.get(cv::CAP_PROP_FPS);
    info.duration = info.fps > 0.0 ? info.total_frames / info.fps : 0.0;
    info.frame_size = cv::Size(
        static_cast<int>(cap.get(cv::CAP_PROP_FRAME_WIDTH)),
        static_cast<int>(cap.get(cv::CAP_PROP_FRAME_HEIGHT))
    );

    int fourcc = static_cast<int>(cap.get(cv::CAP_PROP_FOURCC));
    char codec_chars[5];
    codec_chars[0] = fourcc & 0xFF;
    codec_chars[1] = (fourcc >> 8) & 0xFF;
    codec_chars[2] = (fourcc >> 16) & 0xFF;
    codec_chars[3] = (fourcc >> 24) & 0xFF;
    codec_chars[4] = '\0';
    info.codec = std::string(codec_chars);

    return info;
}

} // namespace watermask
