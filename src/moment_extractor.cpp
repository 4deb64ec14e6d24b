#include "moment_extractor.hpp"
#include "subtitle_segmenter.hpp"
#include "timestamp.hpp"
#include <algorithm>
#include <iostream>
#include <nlohmann/json.hpp>
#include <regex>
#include <sstream>

using json = nlohmann::json;

namespace v2n {

namespace {

const char* style_directive(NoteStyle style) {
    switch (style) {
        case NoteStyle::Blog:
            return "Relaxed, readable blog tone. Use analogies and short examples where they help.";
        case NoteStyle::Tutorial:
            return "Step-by-step tutorial tone. Explain every concept and action in detail, in order.";
        case NoteStyle::Professional:
            break;
    }
    return "Precise, professional technical documentation tone. Concise and accurate wording.";
}

const char* kMomentSchema =
    R"([{"timestamp": "HH:MM:SS", "title": "string", "content": "markdown string"}])";

double moment_seconds(const json& value) {
    if (value.is_number()) {
        double seconds = value.get<double>();
        if (seconds < 0.0) {
            throw MalformedResponseError("negative timestamp");
        }
        return seconds;
    }
    if (value.is_string()) {
        auto parsed = parse_timestamp(value.get<std::string>());
        if (!parsed) {
            throw MalformedResponseError("unparseable timestamp '" + value.get<std::string>() + "'");
        }
        return *parsed;
    }
    throw MalformedResponseError("timestamp must be a string or a number");
}

} // namespace

MomentExtractor::MomentExtractor(LanguageModel& model, NoteStyle style, const ExtractorConfig& config)
    : model_(model), style_(style), config_(config) {}

std::string MomentExtractor::system_prompt(NoteStyle style, double min_separation) {
    std::ostringstream prompt;
    prompt << "# Role\n"
           << "You are an expert video content editor and technical writer. You analyse a video "
              "transcript and pick the moments worth capturing as screenshots for an illustrated "
              "tutorial.\n\n"
           << "# Goal\n"
           << "Find the moments with high VISUAL information value: a diagram being drawn, code "
              "being typed or changed, a menu or dialog being opened, a UI state change, a key "
              "slide, the final result being shown.\n\n"
           << "# Rules\n"
           << "1. Skip greetings, self-introductions, filler and stretches with no visual change.\n"
           << "2. Favour moments where the speaker clicks, selects, types, opens or points at something.\n"
           << "3. Describe what the screen shows at that moment, not what the speaker says.\n"
           << "4. Keep moments at least " << min_separation
           << " seconds apart; when two candidates are closer, keep the more representative one.\n"
           << "5. Every timestamp must be a time that appears in the transcript, formatted HH:MM:SS.\n"
           << "6. You may reference other screenshots inside content with inline markers such as [MM:SS].\n\n"
           << "# Output style\n"
           << style_directive(style) << " The style affects the wording of content only, never "
              "which moments you choose.\n\n"
           << "# Output format\n"
           << "Return ONLY a JSON array, no prose and no markdown code fences:\n"
           << kMomentSchema << "\n"
           << "title: 5 to 15 words. content: 100 to 300 words of markdown. Order entries by timestamp.";
    return prompt.str();
}

std::string MomentExtractor::user_prompt(const TranscriptChunk& chunk) {
    return "Analyse the following video transcript:\n\n" + SubtitleSegmenter::serialize_chunk(chunk);
}

std::string MomentExtractor::corrective_prompt(const std::string& problem) {
    return "Your previous reply could not be used (" + problem +
           "). Return valid structured output matching schema " + kMomentSchema +
           " and nothing else.";
}

std::string MomentExtractor::strip_code_fences(const std::string& raw_response) {
    static const std::regex leading(R"(^\s*```[A-Za-z]*\s*)");
    static const std::regex trailing(R"(\s*```\s*$)");
    std::string text = std::regex_replace(raw_response, leading, "");
    return std::regex_replace(text, trailing, "");
}

std::vector<Moment> MomentExtractor::parse_response(const std::string& raw_response) {
    json document;
    try {
        document = json::parse(strip_code_fences(raw_response));
    } catch (const json::parse_error& e) {
        throw MalformedResponseError(std::string("not valid JSON: ") + e.what());
    }

    const json* entries = &document;
    if (document.is_object()) {
        if (document.contains("moments")) {
            entries = &document["moments"];
        } else if (document.contains("notes")) {
            entries = &document["notes"];
        }
    }
    if (!entries->is_array()) {
        throw MalformedResponseError("expected a JSON array of moments");
    }

    std::vector<Moment> moments;
    moments.reserve(entries->size());
    for (size_t i = 0; i < entries->size(); ++i) {
        const auto& entry = (*entries)[i];
        if (!entry.is_object()) {
            throw MalformedResponseError("entry " + std::to_string(i) + " is not an object");
        }
        if (!entry.contains("timestamp")) {
            throw MalformedResponseError("entry " + std::to_string(i) + " has no timestamp");
        }
        if (!entry.contains("title") || !entry["title"].is_string() ||
            entry["title"].get<std::string>().empty()) {
            throw MalformedResponseError("entry " + std::to_string(i) + " has no title");
        }
        if (entry.contains("content") && !entry["content"].is_string()) {
            throw MalformedResponseError("entry " + std::to_string(i) + " has non-string content");
        }

        Moment moment;
        moment.seconds = moment_seconds(entry["timestamp"]);
        moment.title = entry["title"].get<std::string>();
        moment.content = entry.value("content", std::string());
        moments.push_back(std::move(moment));
    }
    return moments;
}

std::string MomentExtractor::call_with_backoff(const std::vector<ChatMessage>& messages,
                                               const CancellationToken& cancel) {
    CompletionOptions options;
    options.temperature = config_.temperature;
    options.max_tokens = config_.max_tokens;

    auto backoff = config_.initial_backoff;
    for (int attempt = 1;; ++attempt) {
        if (cancel.cancelled()) {
            throw OperationCancelled();
        }
        try {
            return model_.complete(messages, options, cancel);
        } catch (const ModelUnavailableError& e) {
            if (!e.transient() || attempt >= config_.max_attempts) {
                throw;
            }
            std::cerr << "[moments] Model call failed (attempt " << attempt << "/" << config_.max_attempts
                      << "): " << e.what() << ", retrying in " << backoff.count() << "ms" << std::endl;
        }
        if (!cancel.sleep_for(backoff)) {
            throw OperationCancelled();
        }
        backoff *= 2;
    }
}

std::vector<Moment> MomentExtractor::extract_chunk(const TranscriptChunk& chunk,
                                                   const CancellationToken& cancel,
                                                   double video_duration) {
    std::vector<ChatMessage> messages = {
        {"system", system_prompt(style_, config_.min_separation)},
        {"user", user_prompt(chunk)},
    };

    std::string raw = call_with_backoff(messages, cancel);
    std::vector<Moment> moments;
    try {
        moments = parse_response(raw);
    } catch (const MalformedResponseError& e) {
        std::cerr << "[moments] Malformed model response (" << e.what() << "), asking once more" << std::endl;
        messages.push_back({"assistant", raw});
        messages.push_back({"user", corrective_prompt(e.what())});
        raw = call_with_backoff(messages, cancel);
        try {
            moments = parse_response(raw);
        } catch (const MalformedResponseError& retry_error) {
            throw MalformedResponseError(std::string("after corrective retry: ") + retry_error.what());
        }
    }

    double lower = chunk.start_seconds() - config_.range_tolerance;
    double upper = chunk.end_seconds() + config_.range_tolerance;
    if (video_duration > 0.0) {
        upper = std::min(upper, video_duration);
    }
    lower = std::max(lower, 0.0);

    size_t before = moments.size();
    moments.erase(std::remove_if(moments.begin(), moments.end(), [lower, upper](const Moment& m) {
        return m.seconds < lower || m.seconds > upper;
    }), moments.end());

    if (moments.size() != before) {
        std::cerr << "[moments] Discarded " << (before - moments.size())
                  << " moment(s) outside " << format_timestamp(lower) << "-" << format_timestamp(upper)
                  << std::endl;
    }
    return moments;
}

std::vector<Moment> MomentExtractor::merge(const std::vector<std::vector<Moment>>& per_chunk,
                                           double min_separation) {
    std::vector<Moment> all;
    for (const auto& chunk_moments : per_chunk) {
        all.insert(all.end(), chunk_moments.begin(), chunk_moments.end());
    }

    // Stable so that equal timestamps keep chunk order
    std::stable_sort(all.begin(), all.end(), [](const Moment& a, const Moment& b) {
        return a.seconds < b.seconds;
    });

    std::vector<Moment> merged;
    merged.reserve(all.size());
    for (auto& moment : all) {
        if (!merged.empty() && moment.seconds - merged.back().seconds < min_separation) {
            continue;
        }
        merged.push_back(std::move(moment));
    }
    return merged;
}

} // namespace v2n
