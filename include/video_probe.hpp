#pragma once

#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <vector>

namespace watermask {

struct VideoInfo {
    int total_frames = 0;
    double fps = 0.0;
    double duration = 0.0;
    cv::Size frame_size;
    std::string codec;
};

struct ProbeResult {
    std::vector<double> keyframes;   // seconds, as reported; may be empty
    std::optional<double> duration;  // seconds, unset when unknown
};

// Source of candidate sample points for a video
class TimestampSource {
public:
    virtual ~TimestampSource() = default;

    // Never throws on probe failure; reports what it could find
    virtual ProbeResult probe(const std::string& video_path) const = 0;
};

// Queries keyframes and duration through the ffprobe binary, falling back
// to OpenCV's container metadata for the duration.
class FfprobeTimestampSource : public TimestampSource {
public:
    explicit FfprobeTimestampSource(std::string ffprobe_path = "ffprobe",
                                    bool use_keyframes = true);

    ProbeResult probe(const std::string& video_path) const override;

    std::vector<double> query_keyframes(const std::string& video_path) const;
    std::optional<double> query_duration(const std::string& video_path) const;

private:
    std::string ffprobe_path_;
    bool use_keyframes_;
};

// Container metadata via cv::VideoCapture; throws InputError if unreadable
VideoInfo get_video_info(const std::string& video_path);

// Keyframe times worth sampling: finite and not before the start of the video
bool is_usable_timestamp(double seconds);
std::vector<double> usable_keyframes(const std::vector<double>& keyframes);

// Parses "pkt_dts_time=<seconds>" lines of ffprobe's default writer output
std::vector<double> parse_keyframe_times(const std::string& ffprobe_output);

} // namespace watermask
