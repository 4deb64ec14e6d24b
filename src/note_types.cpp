#include "note_types.hpp"
#include <algorithm>
#include <cctype>

namespace v2n {

std::string to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::UnsupportedFormat: return "UnsupportedFormat";
        case ErrorCode::MalformedModelResponse: return "MalformedModelResponse";
        case ErrorCode::ModelUnavailable: return "ModelUnavailable";
        case ErrorCode::FrameDecodeFailure: return "FrameDecodeFailure";
        case ErrorCode::PipelineTimeout: return "PipelineTimeout";
        case ErrorCode::NoUsableContent: return "NoUsableContent";
        case ErrorCode::VideoUnavailable: return "VideoUnavailable";
        case ErrorCode::InvalidConfig: return "InvalidConfig";
    }
    return "Unknown";
}

std::string to_string(NoteStyle style) {
    switch (style) {
        case NoteStyle::Professional: return "professional";
        case NoteStyle::Blog: return "blog";
        case NoteStyle::Tutorial: return "tutorial";
    }
    return "professional";
}

NoteStyle parse_style(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "professional") return NoteStyle::Professional;
    if (lowered == "blog") return NoteStyle::Blog;
    if (lowered == "tutorial") return NoteStyle::Tutorial;

    throw PipelineError(ErrorCode::InvalidConfig, "Unknown note style: " + name);
}

std::string to_string(FrameFailureReason reason) {
    switch (reason) {
        case FrameFailureReason::OpenFailed: return "OpenFailed";
        case FrameFailureReason::SeekOutOfRange: return "SeekOutOfRange";
        case FrameFailureReason::DecodeFailed: return "DecodeFailed";
        case FrameFailureReason::WriteFailed: return "WriteFailed";
        case FrameFailureReason::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

void PipelineConfig::validate() const {
    auto reject = [](const std::string& what) {
        throw PipelineError(ErrorCode::InvalidConfig, "Invalid configuration: " + what);
    };

    if (segmenter.chunk_char_budget == 0) reject("chunk_char_budget must be positive");
    if (segmenter.last_cue_duration <= 0.0) reject("last_cue_duration must be positive");
    if (segmenter.fallback_duration < 0.0) reject("fallback_duration must not be negative");
    if (extractor.min_separation < 0.0) reject("min_separation must not be negative");
    if (extractor.max_attempts < 1) reject("max_attempts must be at least 1");
    if (frames.window_step <= 0.0) reject("window_step must be positive");
    if (frames.probe_interval <= 0.0) reject("probe_interval must be positive");
    if (frames.max_search_radius < 0.0) reject("max_search_radius must not be negative");
    if (frames.jpeg_quality < 1 || frames.jpeg_quality > 100) reject("jpeg_quality must be in [1, 100]");
    if (model_concurrency < 1) reject("model_concurrency must be at least 1");
    if (frame_workers < 0) reject("frame_workers must not be negative");
    if (timeout.count() <= 0) reject("timeout must be positive");
}

} // namespace v2n
