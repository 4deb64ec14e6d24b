#pragma once

#include "language_model.hpp"
#include "note_types.hpp"
#include <functional>
#include <memory>
#include <string>

namespace v2n {

enum class PipelineState { Parsing, Extracting, FrameResolving, Assembling, Done, Failed };

std::string to_string(PipelineState state);

using StateObserver = std::function<void(PipelineState)>;

class NotePipeline {
public:
    explicit NotePipeline(const PipelineConfig& config = {},
                          ModelFactory model_factory = create_openai_model,
                          StateObserver observer = nullptr);
    ~NotePipeline();

    // Subtitle text + video -> notes ordered by seconds.
    // Chunk- and moment-scoped failures are reported in SynthesisResult::diagnostics;
    // only runs that cannot produce any note throw PipelineError.
    // Safe to call concurrently; every run owns its pools and decode handles.
    SynthesisResult synthesize(const std::string& video_path,
                               const std::string& subtitle_text,
                               NoteStyle style,
                               const ModelConfig& model_config) const;

    const PipelineConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace v2n
