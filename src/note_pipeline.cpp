#include "note_pipeline.hpp"
#include "decoder_pool.hpp"
#include "frame_extractor.hpp"
#include "moment_extractor.hpp"
#include "note_assembler.hpp"
#include "subtitle_segmenter.hpp"
#include "worker_pool.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <future>
#include <iostream>
#include <random>
#include <set>
#include <sstream>

namespace v2n {

namespace {

using Clock = std::chrono::steady_clock;

std::string make_run_id() {
    std::random_device device;
    std::uniform_int_distribution<unsigned int> hex(0, 15);
    std::string id;
    for (int i = 0; i < 8; ++i) {
        id += "0123456789abcdef"[hex(device)];
    }
    return id;
}

std::string scope_name(const char* kind, size_t index) {
    return std::string(kind) + " " + std::to_string(index);
}

template <typename T>
bool ready_by(std::future<T>& future, Clock::time_point deadline) {
    return future.wait_until(deadline) == std::future_status::ready;
}

template <typename T>
bool ready_now(std::future<T>& future) {
    return future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

} // namespace

std::string to_string(PipelineState state) {
    switch (state) {
        case PipelineState::Parsing: return "Parsing";
        case PipelineState::Extracting: return "Extracting";
        case PipelineState::FrameResolving: return "FrameResolving";
        case PipelineState::Assembling: return "Assembling";
        case PipelineState::Done: return "Done";
        case PipelineState::Failed: return "Failed";
    }
    return "Unknown";
}

class NotePipeline::Impl {
public:
    Impl(const PipelineConfig& config, ModelFactory model_factory, StateObserver observer)
        : config_(config), model_factory_(std::move(model_factory)), observer_(std::move(observer)) {
        config_.validate();
        if (!model_factory_) {
            throw PipelineError(ErrorCode::InvalidConfig, "No language model factory supplied");
        }
    }

    SynthesisResult synthesize(const std::string& video_path,
                               const std::string& subtitle_text,
                               NoteStyle style,
                               const ModelConfig& model_config) const {
        try {
            return run(video_path, subtitle_text, style, model_config);
        } catch (const PipelineError& e) {
            std::cerr << "[pipeline] Failed (" << to_string(e.code()) << "): " << e.what() << std::endl;
            notify(PipelineState::Failed);
            throw;
        }
    }

    const PipelineConfig& config() const { return config_; }

private:
    struct RunContext {
        Clock::time_point deadline;
        CancellationToken cancel;
        SynthesisResult result;
    };

    SynthesisResult run(const std::string& video_path,
                        const std::string& subtitle_text,
                        NoteStyle style,
                        const ModelConfig& model_config) const {
        auto start_time = Clock::now();
        RunContext ctx;
        ctx.deadline = start_time + config_.timeout;

        notify(PipelineState::Parsing);
        VideoInfo info = video_info_or_degrade(video_path);
        SubtitleSegmenter segmenter(config_.segmenter);
        auto cues = segmenter.parse(subtitle_text, info.duration);
        if (cues.empty()) {
            throw PipelineError(ErrorCode::NoUsableContent, "Subtitle text contains no usable cues");
        }
        auto chunks = segmenter.chunk(cues);

        std::cout << "[pipeline] " << cues.size() << " cues in " << chunks.size() << " chunk(s), video "
                  << info.duration << "s @ " << info.fps << " fps" << std::endl;

        notify(PipelineState::Extracting);
        auto moments = extract_moments(chunks, style, model_config, info.duration, ctx);
        if (moments.empty()) {
            if (ctx.result.timed_out) {
                throw PipelineError(ErrorCode::PipelineTimeout,
                                    "Timed out before any key moment was extracted");
            }
            throw PipelineError(ErrorCode::NoUsableContent,
                                "No key moments extracted from " + std::to_string(chunks.size()) +
                                    " chunk(s)" + summarize(ctx.result.diagnostics));
        }

        notify(PipelineState::FrameResolving);
        InlineImageMap inline_images;
        auto frames = resolve_frames(video_path, moments, inline_images, ctx);

        notify(PipelineState::Assembling);
        ctx.result.notes = NoteAssembler::assemble(moments, frames, inline_images);

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_time);
        std::cout << "[pipeline] Assembled " << ctx.result.notes.size() << " note(s) in " << elapsed.count()
                  << "ms (" << ctx.result.diagnostics.size() << " diagnostic(s)"
                  << (ctx.result.timed_out ? ", timed out" : "") << ")" << std::endl;

        notify(PipelineState::Done);
        return std::move(ctx.result);
    }

    // Only a missing file is fatal. A file that exists but cannot be decoded still
    // yields notes; every frame request then fails on its own.
    static VideoInfo video_info_or_degrade(const std::string& video_path) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(video_path, ec)) {
            throw PipelineError(ErrorCode::VideoUnavailable, "Video file not found: " + video_path);
        }
        try {
            return probe_video(video_path);
        } catch (const PipelineError& e) {
            std::cerr << "[pipeline] " << e.what() << ", continuing without frames" << std::endl;
        }
        return VideoInfo{};
    }

    std::vector<Moment> extract_moments(const std::vector<TranscriptChunk>& chunks,
                                        NoteStyle style,
                                        const ModelConfig& model_config,
                                        double video_duration,
                                        RunContext& ctx) const {
        size_t workers = std::min(chunks.size(), static_cast<size_t>(config_.model_concurrency));
        WorkerPool pool("model-pool", workers);

        CancellationToken cancel = ctx.cancel;
        std::vector<std::future<std::vector<Moment>>> futures;
        futures.reserve(chunks.size());
        for (const auto& chunk : chunks) {
            futures.push_back(pool.submit([this, &chunk, &model_config, style, video_duration, cancel]() {
                if (cancel.cancelled()) {
                    throw OperationCancelled();
                }
                auto model = model_factory_(model_config);
                MomentExtractor extractor(*model, style, config_.extractor);
                return extractor.extract_chunk(chunk, cancel, video_duration);
            }));
        }

        std::vector<std::vector<Moment>> per_chunk(chunks.size());
        for (size_t i = 0; i < futures.size(); ++i) {
            bool ready = ctx.result.timed_out ? ready_now(futures[i]) : ready_by(futures[i], ctx.deadline);
            if (!ready) {
                if (!ctx.result.timed_out) {
                    std::cerr << "[pipeline] Timeout while waiting for model responses" << std::endl;
                    ctx.result.timed_out = true;
                    ctx.cancel.cancel();
                }
                record(ctx, ErrorCode::PipelineTimeout, scope_name("chunk", i), "cancelled by timeout");
                continue;
            }
            collect_chunk(futures[i], i, per_chunk[i], ctx);
        }
        pool.shutdown(ctx.result.timed_out);

        auto merged = MomentExtractor::merge(per_chunk, config_.extractor.min_separation);
        std::cout << "[pipeline] " << merged.size() << " key moment(s) after merge" << std::endl;
        return merged;
    }

    void collect_chunk(std::future<std::vector<Moment>>& future, size_t index,
                       std::vector<Moment>& target, RunContext& ctx) const {
        std::string scope = scope_name("chunk", index);
        try {
            target = future.get();
        } catch (const MalformedResponseError& e) {
            record(ctx, ErrorCode::MalformedModelResponse, scope, e.what());
        } catch (const ModelUnavailableError& e) {
            record(ctx, ErrorCode::ModelUnavailable, scope, e.what());
        } catch (const OperationCancelled& e) {
            record(ctx, ErrorCode::PipelineTimeout, scope, e.what());
        } catch (const std::exception& e) {
            record(ctx, ErrorCode::ModelUnavailable, scope, std::string("unexpected error: ") + e.what());
        }
    }

    std::vector<FrameResult> resolve_frames(const std::string& video_path,
                                            const std::vector<Moment>& moments,
                                            InlineImageMap& inline_images,
                                            RunContext& ctx) const {
        std::vector<FrameResult> frames(moments.size(), FrameFailure{FrameFailureReason::Cancelled});
        if (ctx.result.timed_out) {
            return frames;
        }

        std::string output_dir = prepare_output_dir(ctx);

        // Inline "[MM:SS]" markers get their own frames after the moment frames
        std::set<long long> inline_seconds;
        for (const auto& moment : moments) {
            for (long long seconds : NoteAssembler::inline_references(moment.content)) {
                inline_seconds.insert(seconds);
            }
        }

        std::vector<double> targets;
        targets.reserve(moments.size() + inline_seconds.size());
        for (const auto& moment : moments) {
            targets.push_back(moment.seconds);
        }
        for (long long seconds : inline_seconds) {
            targets.push_back(static_cast<double>(seconds));
        }

        size_t workers = config_.frame_workers > 0 ? static_cast<size_t>(config_.frame_workers)
                                                   : std::max(1u, std::thread::hardware_concurrency());
        workers = std::min(workers, targets.size());

        auto decoders = std::make_shared<DecoderPool>(video_path, workers);
        FrameExtractor extractor(decoders, config_.frames, output_dir);
        WorkerPool pool("frame-pool", workers);

        CancellationToken cancel = ctx.cancel;
        std::vector<std::future<FrameResult>> futures;
        futures.reserve(targets.size());
        for (size_t i = 0; i < targets.size(); ++i) {
            double target = targets[i];
            futures.push_back(pool.submit([&extractor, i, target, cancel]() -> FrameResult {
                if (cancel.cancelled()) {
                    return FrameFailure{FrameFailureReason::Cancelled};
                }
                return extractor.extract(i, target, cancel);
            }));
        }

        std::vector<FrameResult> results(targets.size(), FrameFailure{FrameFailureReason::Cancelled});
        for (size_t i = 0; i < futures.size(); ++i) {
            bool ready = ctx.result.timed_out ? ready_now(futures[i]) : ready_by(futures[i], ctx.deadline);
            if (!ready) {
                if (!ctx.result.timed_out) {
                    std::cerr << "[pipeline] Timeout while extracting frames" << std::endl;
                    ctx.result.timed_out = true;
                    ctx.cancel.cancel();
                }
                record(ctx, ErrorCode::PipelineTimeout, scope_name("frame", i), "cancelled by timeout");
                continue;
            }
            try {
                results[i] = futures[i].get();
            } catch (const std::exception& e) {
                std::cerr << "[pipeline] Frame worker " << i << " failed: " << e.what() << std::endl;
                results[i] = FrameFailure{FrameFailureReason::DecodeFailed};
            }
            if (const auto* failure = std::get_if<FrameFailure>(&results[i])) {
                record(ctx, ErrorCode::FrameDecodeFailure, scope_name("frame", i),
                       "frame at " + std::to_string(targets[i]) + "s: " + to_string(failure->reason));
            }
        }
        pool.shutdown(ctx.result.timed_out);

        std::copy(results.begin(), results.begin() + moments.size(), frames.begin());
        size_t k = moments.size();
        for (long long seconds : inline_seconds) {
            if (const auto* success = std::get_if<FrameSuccess>(&results[k])) {
                inline_images[seconds] = success->path;
            }
            ++k;
        }
        return frames;
    }

    std::string prepare_output_dir(RunContext& ctx) const {
        std::error_code ec;
        std::filesystem::path base(config_.output_dir);
        if (base.empty()) {
            base = std::filesystem::temp_directory_path(ec);
            if (ec) {
                base = std::filesystem::current_path();
                ec.clear();
            }
            base /= "video2note_frames";
        }
        // Fresh directory per run so earlier runs' frames are never overwritten
        std::filesystem::path dir = base / make_run_id();

        std::filesystem::create_directories(dir, ec);
        if (ec) {
            // Frame writes will fail individually and surface as image-less notes
            std::cerr << "[pipeline] Could not create " << dir << ": " << ec.message() << std::endl;
            record(ctx, ErrorCode::FrameDecodeFailure, "output", "cannot create " + dir.string() + ": " + ec.message());
        }
        ctx.result.output_dir = dir.string();
        return ctx.result.output_dir;
    }

    static void record(RunContext& ctx, ErrorCode code, const std::string& scope, const std::string& message) {
        std::cerr << "[pipeline] " << scope << ": " << to_string(code) << ": " << message << std::endl;
        ctx.result.diagnostics.push_back({code, scope, message});
    }

    static std::string summarize(const std::vector<Diagnostic>& diagnostics) {
        if (diagnostics.empty()) {
            return "";
        }
        std::ostringstream summary;
        summary << " (";
        for (size_t i = 0; i < diagnostics.size(); ++i) {
            if (i > 0) summary << "; ";
            summary << diagnostics[i].scope << ": " << to_string(diagnostics[i].code);
        }
        summary << ")";
        return summary.str();
    }

    void notify(PipelineState state) const {
        if (observer_) {
            observer_(state);
        }
    }

    PipelineConfig config_;
    ModelFactory model_factory_;
    StateObserver observer_;
};

NotePipeline::NotePipeline(const PipelineConfig& config, ModelFactory model_factory, StateObserver observer)
    : pimpl_(std::make_unique<Impl>(config, std::move(model_factory), std::move(observer))) {}

NotePipeline::~NotePipeline() = default;

SynthesisResult NotePipeline::synthesize(const std::string& video_path,
                                         const std::string& subtitle_text,
                                         NoteStyle style,
                                         const ModelConfig& model_config) const {
    return pimpl_->synthesize(video_path, subtitle_text, style, model_config);
}

const PipelineConfig& NotePipeline::config() const {
    return pimpl_->config();
}

} // namespace v2n
