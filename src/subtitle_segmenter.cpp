#include "subtitle_segmenter.hpp"
#include "timestamp.hpp"
#include <algorithm>
#include <iostream>
#include <optional>
#include <regex>
#include <sstream>

namespace v2n {

namespace {

const std::regex& cue_timing_regex() {
    static const std::regex pattern(R"(^\s*((?:\d+:)?\d{1,2}:\d{2}(?:[.,]\d{1,3})?)\s*-->\s*((?:\d+:)?\d{1,2}:\d{2}(?:[.,]\d{1,3})?))");
    return pattern;
}

// Timestamp prefix only; the text after it is taken with substr so line length
// never feeds the regex engine
const std::regex& timed_line_prefix_regex() {
    static const std::regex pattern(R"(^[ \t]*\[?((?:\d+:)?\d{1,2}:\d{2}(?:[.,]\d{1,3})?)\]?[ \t]*[-:]?[ \t]+)");
    return pattern;
}

// Timing prefixes are matched against the start of a line only
constexpr size_t kPrefixWindow = 256;

std::string line_head(const std::string& line) {
    return line.substr(0, kPrefixWindow);
}

std::string trim(const std::string& text) {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string normalize_newlines(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    size_t start = 0;
    // UTF-8 byte order mark
    if (text.size() >= 3 && text.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        start = 3;
    }
    for (size_t i = start; i < text.size(); ++i) {
        if (text[i] == '\r') {
            result.push_back('\n');
            if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
        } else {
            result.push_back(text[i]);
        }
    }
    return result;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::stringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    return lines;
}

// Removes "<...>" tags; an unclosed '<' is kept as text
std::string strip_markup(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '<') {
            auto close = text.find('>', i + 1);
            if (close != std::string::npos) {
                i = close + 1;
                continue;
            }
        }
        result.push_back(text[i]);
        ++i;
    }
    return result;
}

struct TimedLine {
    double start_seconds = 0.0;
    std::string text;
};

std::optional<TimedLine> match_timed_line(const std::string& line) {
    std::string head = line_head(line);
    std::smatch match;
    if (!std::regex_search(head, match, timed_line_prefix_regex())) {
        return std::nullopt;
    }
    auto start = parse_timestamp(match[1].str());
    std::string text = trim(line.substr(static_cast<size_t>(match.length(0))));
    if (!start || text.empty()) {
        return std::nullopt;
    }
    return TimedLine{*start, text};
}

// Sorted, overlap-free, non-empty cues
std::vector<TimedCue> normalize_cues(std::vector<TimedCue> cues) {
    std::stable_sort(cues.begin(), cues.end(), [](const TimedCue& a, const TimedCue& b) {
        return a.start_seconds < b.start_seconds;
    });

    // Cues sharing a start time (several speakers) become one cue
    std::vector<TimedCue> merged;
    merged.reserve(cues.size());
    for (auto& cue : cues) {
        if (!merged.empty() && merged.back().start_seconds == cue.start_seconds) {
            auto& previous = merged.back();
            previous.end_seconds = std::max(previous.end_seconds, cue.end_seconds);
            if (!cue.text.empty()) {
                if (!previous.text.empty()) previous.text += ' ';
                previous.text += cue.text;
            }
            continue;
        }
        merged.push_back(std::move(cue));
    }
    cues = std::move(merged);

    for (size_t i = 0; i + 1 < cues.size(); ++i) {
        cues[i].end_seconds = std::min(cues[i].end_seconds, cues[i + 1].start_seconds);
    }

    cues.erase(std::remove_if(cues.begin(), cues.end(), [](const TimedCue& cue) {
        return cue.end_seconds <= cue.start_seconds || cue.text.empty();
    }), cues.end());

    return cues;
}

} // namespace

SubtitleSegmenter::SubtitleSegmenter(const SegmenterConfig& config) : config_(config) {}

SubtitleFormat SubtitleSegmenter::detect_format(const std::string& subtitle_text) {
    auto lines = split_lines(normalize_newlines(subtitle_text));

    bool has_timed_line = false;
    for (const auto& line : lines) {
        if (std::regex_search(line_head(line), cue_timing_regex())) {
            return SubtitleFormat::CueBlock;
        }
        if (!has_timed_line && match_timed_line(line)) {
            has_timed_line = true;
        }
    }
    return has_timed_line ? SubtitleFormat::TimedLines : SubtitleFormat::Untimed;
}

std::vector<TimedCue> SubtitleSegmenter::parse(const std::string& subtitle_text, double duration_hint) const {
    std::string text = normalize_newlines(subtitle_text);
    if (trim(text).empty()) {
        return {};
    }

    switch (detect_format(text)) {
        case SubtitleFormat::CueBlock:
            return normalize_cues(parse_cue_blocks(text));
        case SubtitleFormat::TimedLines:
            return normalize_cues(parse_timed_lines(text, duration_hint));
        case SubtitleFormat::Untimed:
            break;
    }

    if (!config_.whole_document_fallback) {
        throw PipelineError(ErrorCode::UnsupportedFormat,
                            "Subtitle text carries no timing information");
    }
    return whole_document(text, duration_hint);
}

std::vector<TimedCue> SubtitleSegmenter::parse_cue_blocks(const std::string& text) const {
    std::vector<TimedCue> cues;
    auto lines = split_lines(text);

    size_t dropped = 0;
    size_t i = 0;
    while (i < lines.size()) {
        // Collect one blank-line separated block
        std::vector<std::string> block;
        while (i < lines.size() && trim(lines[i]).empty()) ++i;
        while (i < lines.size() && !trim(lines[i]).empty()) {
            block.push_back(lines[i]);
            ++i;
        }
        if (block.empty()) continue;

        auto timing = std::find_if(block.begin(), block.end(), [](const std::string& line) {
            return line.find("-->") != std::string::npos;
        });
        if (timing == block.end()) {
            continue;  // WEBVTT header, NOTE, STYLE, stray index
        }

        std::string head = line_head(*timing);
        std::smatch match;
        if (!std::regex_search(head, match, cue_timing_regex())) {
            ++dropped;
            continue;
        }
        auto start = parse_timestamp(match[1].str());
        auto end = parse_timestamp(match[2].str());
        if (!start || !end || *end <= *start) {
            ++dropped;
            continue;
        }

        std::string joined;
        for (auto it = timing + 1; it != block.end(); ++it) {
            std::string piece = trim(strip_markup(*it));
            if (piece.empty()) continue;
            if (!joined.empty()) joined += ' ';
            joined += piece;
        }
        if (joined.empty()) {
            ++dropped;
            continue;
        }

        cues.push_back({*start, *end, joined});
    }

    if (dropped > 0) {
        std::cerr << "[segmenter] Dropped " << dropped << " malformed cue block(s)" << std::endl;
    }
    return cues;
}

std::vector<TimedCue> SubtitleSegmenter::parse_timed_lines(const std::string& text, double duration_hint) const {
    std::vector<TimedCue> cues;

    for (const auto& line : split_lines(text)) {
        if (auto timed = match_timed_line(line)) {
            cues.push_back({timed->start_seconds, 0.0, trim(strip_markup(timed->text))});
        } else if (!cues.empty() && !trim(line).empty()) {
            // Wrapped continuation of the previous entry
            cues.back().text += ' ' + trim(strip_markup(line));
        }
    }

    std::stable_sort(cues.begin(), cues.end(), [](const TimedCue& a, const TimedCue& b) {
        return a.start_seconds < b.start_seconds;
    });

    for (size_t i = 0; i < cues.size(); ++i) {
        if (i + 1 < cues.size()) {
            cues[i].end_seconds = cues[i + 1].start_seconds;
        } else {
            double end = cues[i].start_seconds + config_.last_cue_duration;
            if (duration_hint > cues[i].start_seconds) {
                end = std::min(end, duration_hint);
            }
            cues[i].end_seconds = end;
        }
    }
    return cues;
}

std::vector<TimedCue> SubtitleSegmenter::whole_document(const std::string& text, double duration_hint) const {
    double duration = config_.fallback_duration > 0.0 ? config_.fallback_duration : duration_hint;
    if (duration <= 0.0) {
        throw PipelineError(ErrorCode::UnsupportedFormat,
                            "Whole-document fallback needs a known duration");
    }

    std::string joined;
    for (const auto& line : split_lines(text)) {
        std::string piece = trim(line);
        if (piece.empty()) continue;
        if (!joined.empty()) joined += ' ';
        joined += piece;
    }

    std::cout << "[segmenter] Untimed subtitles, using whole-document cue of "
              << duration << "s" << std::endl;
    return {TimedCue{0.0, duration, joined}};
}

std::vector<TranscriptChunk> SubtitleSegmenter::chunk(const std::vector<TimedCue>& cues) const {
    std::vector<TranscriptChunk> chunks;
    TranscriptChunk current;
    current.char_budget = config_.chunk_char_budget;
    size_t current_length = 0;

    for (const auto& cue : cues) {
        size_t cue_length = serialize_cue(cue).size() + 1;
        if (!current.cues.empty() && current_length + cue_length > config_.chunk_char_budget) {
            chunks.push_back(std::move(current));
            current = TranscriptChunk{};
            current.char_budget = config_.chunk_char_budget;
            current_length = 0;
        }
        current.cues.push_back(cue);
        current_length += cue_length;
    }

    if (!current.cues.empty()) {
        chunks.push_back(std::move(current));
    }
    return chunks;
}

std::string SubtitleSegmenter::serialize_cue(const TimedCue& cue) {
    return "[" + format_clock(cue.start_seconds) + "] " + cue.text;
}

std::string SubtitleSegmenter::serialize_chunk(const TranscriptChunk& chunk) {
    std::string text;
    for (const auto& cue : chunk.cues) {
        text += serialize_cue(cue);
        text += '\n';
    }
    return text;
}

} // namespace v2n
