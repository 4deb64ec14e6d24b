#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace v2n {

enum class ErrorCode {
    UnsupportedFormat,
    MalformedModelResponse,
    ModelUnavailable,
    FrameDecodeFailure,
    PipelineTimeout,
    NoUsableContent,
    VideoUnavailable,
    InvalidConfig
};

std::string to_string(ErrorCode code);

// Fatal pipeline failure surfaced to the caller
class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

enum class NoteStyle { Professional, Blog, Tutorial };

std::string to_string(NoteStyle style);
NoteStyle parse_style(const std::string& name);

struct TimedCue {
    double start_seconds = 0.0;
    double end_seconds = 0.0;
    std::string text;
};

struct TranscriptChunk {
    std::vector<TimedCue> cues;
    size_t char_budget = 0;

    double start_seconds() const { return cues.empty() ? 0.0 : cues.front().start_seconds; }
    double end_seconds() const { return cues.empty() ? 0.0 : cues.back().end_seconds; }
};

struct Moment {
    double seconds = 0.0;
    std::string title;
    std::string content;  // markdown
};

enum class FrameFailureReason { OpenFailed, SeekOutOfRange, DecodeFailed, WriteFailed, Cancelled };

std::string to_string(FrameFailureReason reason);

struct FrameSuccess {
    std::string path;
    double sharpness = 0.0;
    double offset_seconds = 0.0;
    bool quality_degraded = false;
};

struct FrameFailure {
    FrameFailureReason reason = FrameFailureReason::DecodeFailed;
};

using FrameResult = std::variant<FrameSuccess, FrameFailure>;

struct NoteNode {
    std::string id;
    std::string timestamp;
    double seconds = 0.0;
    std::string title;
    std::string content;
    std::string image_path;
    bool edited = false;
};

struct VideoInfo {
    int total_frames = 0;
    double fps = 0.0;
    double duration = 0.0;
    int width = 0;
    int height = 0;
    std::string codec;
};

struct ModelConfig {
    std::string api_key;
    std::string base_url = "https://api.openai.com/v1";
    std::string model = "gpt-4o-mini";
    std::chrono::seconds request_timeout{180};
};

struct SegmenterConfig {
    size_t chunk_char_budget = 12000;
    double last_cue_duration = 3.0;      // plain timed lines have no end time
    bool whole_document_fallback = false;
    double fallback_duration = 0.0;      // span of the single fallback cue
};

struct ExtractorConfig {
    double min_separation = 5.0;
    double range_tolerance = 1.0;
    int max_attempts = 4;
    std::chrono::milliseconds initial_backoff{500};
    double temperature = 0.3;
    int max_tokens = 8000;
};

struct FrameConfig {
    double sharpness_threshold = 100.0;
    double window_step = 0.5;
    double max_search_radius = 2.0;
    double probe_interval = 0.1;
    int jpeg_quality = 90;
};

struct PipelineConfig {
    SegmenterConfig segmenter;
    ExtractorConfig extractor;
    FrameConfig frames;
    int model_concurrency = 4;
    int frame_workers = static_cast<int>(std::thread::hardware_concurrency());
    std::chrono::milliseconds timeout{std::chrono::minutes(10)};
    std::string output_dir;  // base for per-run frame directories; empty: system temp dir

    void validate() const;
};

// Chunk- or moment-scoped failure absorbed by the pipeline
struct Diagnostic {
    ErrorCode code;
    std::string scope;  // "chunk 3", "moment 7", ...
    std::string message;
};

struct SynthesisResult {
    std::vector<NoteNode> notes;
    std::vector<Diagnostic> diagnostics;
    bool timed_out = false;
    std::string output_dir;
};

} // namespace v2n
