#pragma once

#include "note_types.hpp"
#include <string>
#include <vector>

namespace v2n {

enum class SubtitleFormat {
    CueBlock,    // SRT / WebVTT blocks with "start --> end" lines
    TimedLines,  // one "[MM:SS] text" entry per line
    Untimed
};

class SubtitleSegmenter {
public:
    explicit SubtitleSegmenter(const SegmenterConfig& config = {});

    static SubtitleFormat detect_format(const std::string& subtitle_text);

    // Ordered, non-overlapping cues. Untimed text throws PipelineError(UnsupportedFormat)
    // unless whole-document fallback is enabled; duration_hint bounds the synthetic cue
    // and the open-ended last cue of plain timed lines.
    std::vector<TimedCue> parse(const std::string& subtitle_text, double duration_hint = 0.0) const;

    // Groups consecutive cues, splitting only between cues. A cue larger than the
    // budget ends up alone in its chunk.
    std::vector<TranscriptChunk> chunk(const std::vector<TimedCue>& cues) const;

    // Single transcript line as sent to the model
    static std::string serialize_cue(const TimedCue& cue);
    static std::string serialize_chunk(const TranscriptChunk& chunk);

private:
    std::vector<TimedCue> parse_cue_blocks(const std::string& text) const;
    std::vector<TimedCue> parse_timed_lines(const std::string& text, double duration_hint) const;
    std::vector<TimedCue> whole_document(const std::string& text, double duration_hint) const;

    SegmenterConfig config_;
};

} // namespace v2n
