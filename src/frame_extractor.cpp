#include "frame_extractor.hpp"
#include <opencv2/opencv.hpp>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <optional>
#include <set>

namespace v2n {

namespace {

// Tolerates float error when mapping probe times onto frame indices
constexpr double kIndexEpsilon = 1e-3;

struct Candidate {
    int index = 0;
    double seconds = 0.0;  // where the decoder actually landed
    double sharpness = 0.0;
    cv::Mat frame;
};

} // namespace

VideoInfo probe_video(const std::string& video_path) {
    cv::VideoCapture cap(video_path);
    if (!cap.isOpened()) {
        throw PipelineError(ErrorCode::VideoUnavailable, "Cannot open video file: " + video_path);
    }

    VideoInfo info;
    info.total_frames = static_cast<int>(cap.get(cv::CAP_PROP_FRAME_COUNT));
    info.fps = cap.get(cv::CAP_PROP_FPS);
    info.duration = info.fps > 0 ? info.total_frames / info.fps : 0.0;
    info.width = static_cast<int>(cap.get(cv::CAP_PROP_FRAME_WIDTH));
    info.height = static_cast<int>(cap.get(cv::CAP_PROP_FRAME_HEIGHT));

    int fourcc = static_cast<int>(cap.get(cv::CAP_PROP_FOURCC));
    char codec_chars[5];
    codec_chars[0] = static_cast<char>(fourcc & 0xFF);
    codec_chars[1] = static_cast<char>((fourcc >> 8) & 0xFF);
    codec_chars[2] = static_cast<char>((fourcc >> 16) & 0xFF);
    codec_chars[3] = static_cast<char>((fourcc >> 24) & 0xFF);
    codec_chars[4] = '\0';
    info.codec = std::string(codec_chars);

    return info;
}

class FrameExtractor::Impl {
public:
    Impl(std::shared_ptr<DecoderPool> decoders, const FrameConfig& config, std::string output_dir)
        : decoders_(std::move(decoders)), config_(config), output_dir_(std::move(output_dir)) {}

    FrameResult extract(size_t index, double target_seconds, const CancellationToken& cancel) const {
        std::shared_ptr<cv::VideoCapture> cap;
        try {
            cap = decoders_->acquire();
        } catch (const VideoOpenError& e) {
            std::cerr << "[frames] " << e.what() << std::endl;
            return FrameFailure{FrameFailureReason::OpenFailed};
        }

        double fps = cap->get(cv::CAP_PROP_FPS);
        int total_frames = static_cast<int>(cap->get(cv::CAP_PROP_FRAME_COUNT));
        if (fps <= 0.0 || total_frames <= 0) {
            return FrameFailure{FrameFailureReason::DecodeFailed};
        }

        double duration = total_frames / fps;
        if (target_seconds < 0.0 || target_seconds > duration + 1.0 / fps) {
            return FrameFailure{FrameFailureReason::SeekOutOfRange};
        }

        std::set<int> visited;
        std::optional<Candidate> best;

        auto probe = [&](double seconds) {
            int frame_index = index_for(seconds, fps, total_frames);
            if (!visited.insert(frame_index).second) {
                return;
            }
            cv::Mat frame;
            cap->set(cv::CAP_PROP_POS_FRAMES, frame_index);
            if (!cap->read(frame) || frame.empty()) {
                return;
            }
            double landed = FrameExtractor::landed_seconds(cap->get(cv::CAP_PROP_POS_MSEC), frame_index, fps);
            double score = FrameExtractor::sharpness(frame);
            if (!best || score > best->sharpness) {
                best = Candidate{frame_index, landed, score, frame.clone()};
            }
        };

        probe(target_seconds);

        // Expanding symmetric rings, nearest samples first
        int ring_end = 0;
        int max_step = static_cast<int>(std::llround(config_.max_search_radius / config_.probe_interval));
        for (int ring = 1; !is_sharp(best) && ring_end < max_step; ++ring) {
            int next_end = static_cast<int>(std::llround(ring * config_.window_step / config_.probe_interval));
            next_end = std::min(std::max(next_end, ring_end + 1), max_step);
            for (int step = ring_end + 1; step <= next_end; ++step) {
                if (cancel.cancelled()) {
                    return FrameFailure{FrameFailureReason::Cancelled};
                }
                double offset = step * config_.probe_interval;
                probe(target_seconds + offset);
                probe(target_seconds - offset);
            }
            ring_end = next_end;
        }

        if (!best) {
            std::cerr << "[frames] No decodable frame near " << target_seconds << "s" << std::endl;
            return FrameFailure{FrameFailureReason::DecodeFailed};
        }

        std::string path = FrameExtractor::frame_path(output_dir_, index);
        try {
            std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, config_.jpeg_quality};
            if (!cv::imwrite(path, best->frame, params)) {
                std::cerr << "[frames] Could not write " << path << std::endl;
                return FrameFailure{FrameFailureReason::WriteFailed};
            }
        } catch (const cv::Exception& e) {
            std::cerr << "[frames] Could not write " << path << ": " << e.what() << std::endl;
            return FrameFailure{FrameFailureReason::WriteFailed};
        }

        FrameSuccess success;
        success.path = std::filesystem::absolute(path).string();
        success.sharpness = best->sharpness;
        success.offset_seconds = std::abs(best->seconds - target_seconds);
        success.quality_degraded = best->sharpness < config_.sharpness_threshold;

        if (success.quality_degraded) {
            std::cout << "[frames] Moment " << index << ": no frame above sharpness "
                      << config_.sharpness_threshold << ", keeping best (" << best->sharpness << ")" << std::endl;
        }
        return success;
    }

private:
    static int index_for(double seconds, double fps, int total_frames) {
        int frame_index = static_cast<int>(std::floor(seconds * fps + kIndexEpsilon));
        return std::clamp(frame_index, 0, total_frames - 1);
    }

    bool is_sharp(const std::optional<Candidate>& candidate) const {
        return candidate && candidate->sharpness >= config_.sharpness_threshold;
    }

    std::shared_ptr<DecoderPool> decoders_;
    FrameConfig config_;
    std::string output_dir_;
};

FrameExtractor::FrameExtractor(std::shared_ptr<DecoderPool> decoders, const FrameConfig& config,
                               std::string output_dir)
    : pimpl_(std::make_unique<Impl>(std::move(decoders), config, std::move(output_dir))) {}

FrameExtractor::~FrameExtractor() = default;

FrameResult FrameExtractor::extract(size_t index, double target_seconds, const CancellationToken& cancel) const {
    return pimpl_->extract(index, target_seconds, cancel);
}

double FrameExtractor::sharpness(const cv::Mat& frame) {
    if (frame.empty()) {
        return 0.0;
    }
    cv::Mat gray;
    if (frame.channels() == 3) {
        cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
    } else if (frame.channels() == 4) {
        cv::cvtColor(frame, gray, cv::COLOR_BGRA2GRAY);
    } else {
        gray = frame;
    }

    cv::Mat laplacian;
    cv::Laplacian(gray, laplacian, CV_64F);

    cv::Scalar mean, stddev;
    cv::meanStdDev(laplacian, mean, stddev);
    return stddev[0] * stddev[0];
}

double FrameExtractor::landed_seconds(double position_msec, int requested_index, double fps) {
    // Some backends report 0 (or nothing) instead of the decoded frame's position
    if (std::isfinite(position_msec) && (position_msec > 0.0 || requested_index == 0)) {
        return position_msec / 1000.0;
    }
    return fps > 0.0 ? requested_index / fps : 0.0;
}

std::string FrameExtractor::frame_path(const std::string& output_dir, size_t index) {
    char name[32];
    std::snprintf(name, sizeof(name), "frame_%04zu.jpg", index);
    return (std::filesystem::path(output_dir) / name).string();
}

} // namespace v2n
