#pragma once

#include "language_model.hpp"
#include "note_types.hpp"
#include "worker_pool.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace v2n {

// Model output that does not match the moment schema, even after the corrective retry
class MalformedResponseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class MomentExtractor {
public:
    MomentExtractor(LanguageModel& model, NoteStyle style, const ExtractorConfig& config);

    // Moments for one chunk, bounded to the chunk's cue range and to video_duration when known.
    // Throws MalformedResponseError, ModelUnavailableError or OperationCancelled.
    std::vector<Moment> extract_chunk(const TranscriptChunk& chunk,
                                      const CancellationToken& cancel,
                                      double video_duration = 0.0);

    // Concatenates per-chunk results in chunk order, sorts by seconds and drops any
    // moment closer than min_separation to the previously kept one.
    static std::vector<Moment> merge(const std::vector<std::vector<Moment>>& per_chunk,
                                     double min_separation);

    static std::string system_prompt(NoteStyle style, double min_separation);
    static std::string user_prompt(const TranscriptChunk& chunk);
    static std::string corrective_prompt(const std::string& problem);

    static std::vector<Moment> parse_response(const std::string& raw_response);
    static std::string strip_code_fences(const std::string& raw_response);

private:
    std::string call_with_backoff(const std::vector<ChatMessage>& messages, const CancellationToken& cancel);

    LanguageModel& model_;
    NoteStyle style_;
    ExtractorConfig config_;
};

} // namespace v2n
