#include <gtest/gtest.h>
#include "note_pipeline.hpp"
#include "test_support.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <future>
#include <mutex>
#include <thread>

namespace v2n {

namespace fs = std::filesystem;

using testing_support::ScriptedModel;
using testing_support::factory_for;

namespace {

// Answers per chunk: "slow" chunks block until cancelled, "broken" chunks never return JSON
class ChunkAwareModel : public LanguageModel {
public:
    std::string complete(const std::vector<ChatMessage>& messages,
                         const CompletionOptions&,
                         const CancellationToken& cancel) override {
        const std::string& transcript = messages.at(1).content;
        if (transcript.find("slow") != std::string::npos) {
            cancel.sleep_for(std::chrono::seconds(30));
            throw OperationCancelled();
        }
        if (transcript.find("broken") != std::string::npos) {
            return "I could not find anything interesting.";
        }
        return R"([{"timestamp": "00:00:03", "title": "Intro screen", "content": "The start page"}])";
    }

    std::string name() const override { return "chunk-aware"; }
};

ModelFactory chunk_aware_factory() {
    return [](const ModelConfig&) -> std::unique_ptr<LanguageModel> {
        return std::make_unique<ChunkAwareModel>();
    };
}

} // namespace

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        work_dir_ = fs::temp_directory_path() /
                    ("v2n_pipeline_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
                     ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(work_dir_);
        video_path_ = (work_dir_ / "lecture.avi").string();

        // 30s at 10 fps, every frame in focus
        if (!testing_support::write_test_video(video_path_, 300, 10.0, [](int) { return true; })) {
            FAIL() << "Could not create test video file";
        }

        config_.output_dir = (work_dir_ / "frames").string();
        config_.frame_workers = 2;
        config_.extractor.initial_backoff = std::chrono::milliseconds(1);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(work_dir_, ec);
    }

    static std::string three_cue_srt() {
        return "1\n00:00:02,000 --> 00:00:05,000\nLet me open the settings panel\n\n"
               "2\n00:00:08,000 --> 00:00:12,000\nWe switch the theme to dark\n\n"
               "3\n00:00:15,000 --> 00:00:20,000\nThe editor now shows the new colours\n\n";
    }

    static ErrorCode error_code_of(const std::function<void()>& call) {
        try {
            call();
        } catch (const PipelineError& e) {
            return e.code();
        }
        ADD_FAILURE() << "Expected PipelineError";
        return ErrorCode::InvalidConfig;
    }

    static bool has_diagnostic(const SynthesisResult& result, ErrorCode code, const std::string& scope_prefix) {
        for (const auto& diagnostic : result.diagnostics) {
            if (diagnostic.code == code && diagnostic.scope.compare(0, scope_prefix.size(), scope_prefix) == 0) {
                return true;
            }
        }
        return false;
    }

    fs::path work_dir_;
    std::string video_path_;
    PipelineConfig config_;
    ModelConfig model_config_;
};

TEST_F(PipelineTest, ProducesOrderedNotesWithImages) {
    auto model = std::make_shared<ScriptedModel>(std::vector<std::string>{R"([
        {"timestamp": "00:00:16", "title": "Editor colours", "content": "The editor uses the dark palette"},
        {"timestamp": "00:00:04", "title": "Settings panel", "content": "Open **Settings** from the menu"}
    ])"});
    NotePipeline pipeline(config_, factory_for(model));

    auto result = pipeline.synthesize(video_path_, three_cue_srt(), NoteStyle::Professional, model_config_);

    ASSERT_EQ(result.notes.size(), 2u);
    EXPECT_FALSE(result.timed_out);
    EXPECT_TRUE(result.diagnostics.empty());
    EXPECT_EQ(result.notes[0].title, "Settings panel");
    EXPECT_EQ(result.notes[0].timestamp, "0:04");
    EXPECT_EQ(result.notes[1].title, "Editor colours");
    EXPECT_LT(result.notes[0].seconds, result.notes[1].seconds);
    EXPECT_NE(result.notes[0].id, result.notes[1].id);

    for (const auto& note : result.notes) {
        EXPECT_FALSE(note.title.empty());
        EXPECT_FALSE(note.content.empty());
        ASSERT_FALSE(note.image_path.empty());
        EXPECT_TRUE(fs::exists(note.image_path));
        EXPECT_EQ(fs::path(note.image_path).parent_path(), fs::path(result.output_dir));
    }
    EXPECT_EQ(fs::path(result.output_dir).parent_path(), fs::path(config_.output_dir));
    EXPECT_EQ(model->calls(), 1);
}

TEST_F(PipelineTest, EachRunGetsItsOwnFrameDirectory) {
    auto model = std::make_shared<ScriptedModel>(std::vector<std::string>{
        R"([{"timestamp": "00:00:10", "title": "Theme", "content": "Dark theme"}])"});
    NotePipeline pipeline(config_, factory_for(model));

    auto first = std::async(std::launch::async, [&] {
        return pipeline.synthesize(video_path_, three_cue_srt(), NoteStyle::Blog, model_config_);
    });
    auto second = std::async(std::launch::async, [&] {
        return pipeline.synthesize(video_path_, three_cue_srt(), NoteStyle::Tutorial, model_config_);
    });
    auto a = first.get();
    auto b = second.get();

    ASSERT_EQ(a.notes.size(), 1u);
    ASSERT_EQ(b.notes.size(), 1u);
    EXPECT_NE(a.output_dir, b.output_dir);
    EXPECT_NE(a.notes[0].image_path, b.notes[0].image_path);
}

TEST_F(PipelineTest, InlineMarkersBecomeImages) {
    auto model = std::make_shared<ScriptedModel>(std::vector<std::string>{R"([
        {"timestamp": "00:00:04", "title": "Settings", "content": "Compare with the result at [00:18]"}
    ])"});
    NotePipeline pipeline(config_, factory_for(model));

    auto result = pipeline.synthesize(video_path_, three_cue_srt(), NoteStyle::Tutorial, model_config_);

    ASSERT_EQ(result.notes.size(), 1u);
    EXPECT_NE(result.notes[0].content.find("![0:18](file://"), std::string::npos);
}

TEST_F(PipelineTest, DuplicateMomentsAreMerged) {
    auto model = std::make_shared<ScriptedModel>(std::vector<std::string>{R"([
        {"timestamp": "00:00:10", "title": "First", "content": "a"},
        {"timestamp": "00:00:11", "title": "Too close", "content": "b"}
    ])"});
    NotePipeline pipeline(config_, factory_for(model));

    auto result = pipeline.synthesize(video_path_, three_cue_srt(), NoteStyle::Professional, model_config_);

    ASSERT_EQ(result.notes.size(), 1u);
    EXPECT_EQ(result.notes[0].title, "First");
}

TEST_F(PipelineTest, EmptySubtitlesAreNoUsableContent) {
    NotePipeline pipeline(config_, factory_for(std::make_shared<ScriptedModel>(std::vector<std::string>{"[]"})));

    EXPECT_EQ(error_code_of([&] { pipeline.synthesize(video_path_, "", NoteStyle::Blog, model_config_); }),
              ErrorCode::NoUsableContent);
}

TEST_F(PipelineTest, UntimedSubtitlesAreUnsupported) {
    NotePipeline pipeline(config_, factory_for(std::make_shared<ScriptedModel>(std::vector<std::string>{"[]"})));

    EXPECT_EQ(error_code_of([&] {
                  pipeline.synthesize(video_path_, "Just a paragraph of prose.", NoteStyle::Blog, model_config_);
              }),
              ErrorCode::UnsupportedFormat);
}

TEST_F(PipelineTest, MissingVideoIsUnavailable) {
    NotePipeline pipeline(config_, factory_for(std::make_shared<ScriptedModel>(std::vector<std::string>{"[]"})));

    EXPECT_EQ(error_code_of([&] {
                  pipeline.synthesize((work_dir_ / "missing.mp4").string(), three_cue_srt(), NoteStyle::Blog,
                                      model_config_);
              }),
              ErrorCode::VideoUnavailable);
}

TEST_F(PipelineTest, UndecodableVideoStillYieldsNotes) {
    auto broken_path = work_dir_ / "broken.mp4";
    {
        std::ofstream file(broken_path, std::ios::binary);
        file << std::string(4096, '\x5a') << "not a container";
    }
    auto model = std::make_shared<ScriptedModel>(std::vector<std::string>{
        R"([{"timestamp": "00:00:04", "title": "Settings panel", "content": "Open the settings"}])"});
    NotePipeline pipeline(config_, factory_for(model));

    auto result = pipeline.synthesize(broken_path.string(), three_cue_srt(), NoteStyle::Professional, model_config_);

    ASSERT_EQ(result.notes.size(), 1u);
    EXPECT_EQ(result.notes[0].title, "Settings panel");
    EXPECT_TRUE(result.notes[0].image_path.empty());
    EXPECT_FALSE(result.timed_out);
    EXPECT_TRUE(has_diagnostic(result, ErrorCode::FrameDecodeFailure, "frame"));
}

TEST_F(PipelineTest, UnwritableFrameDirectoryKeepsNotes) {
    auto blocker = work_dir_ / "blocker";
    {
        std::ofstream file(blocker);
        file << "regular file";
    }
    config_.output_dir = (blocker / "frames").string();
    auto model = std::make_shared<ScriptedModel>(std::vector<std::string>{R"([
        {"timestamp": "00:00:04", "title": "Settings panel", "content": "Open the settings"},
        {"timestamp": "00:00:16", "title": "Editor colours", "content": "Dark palette"}
    ])"});
    NotePipeline pipeline(config_, factory_for(model));

    SynthesisResult result;
    ASSERT_NO_THROW(result = pipeline.synthesize(video_path_, three_cue_srt(), NoteStyle::Blog, model_config_));

    ASSERT_EQ(result.notes.size(), 2u);
    for (const auto& note : result.notes) {
        EXPECT_TRUE(note.image_path.empty());
    }
    EXPECT_TRUE(has_diagnostic(result, ErrorCode::FrameDecodeFailure, "output"));
    EXPECT_TRUE(has_diagnostic(result, ErrorCode::FrameDecodeFailure, "frame"));
}

TEST_F(PipelineTest, NoMomentsIsNoUsableContent) {
    auto model = std::make_shared<ScriptedModel>(std::vector<std::string>{"[]"});
    NotePipeline pipeline(config_, factory_for(model));

    EXPECT_EQ(error_code_of([&] {
                  pipeline.synthesize(video_path_, three_cue_srt(), NoteStyle::Blog, model_config_);
              }),
              ErrorCode::NoUsableContent);
}

TEST_F(PipelineTest, AllChunksFailingIsNoUsableContent) {
    auto model = std::make_shared<ScriptedModel>(std::vector<std::string>{"!auth"});
    NotePipeline pipeline(config_, factory_for(model));

    try {
        pipeline.synthesize(video_path_, three_cue_srt(), NoteStyle::Blog, model_config_);
        FAIL() << "Expected PipelineError";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NoUsableContent);
        EXPECT_NE(std::string(e.what()).find("ModelUnavailable"), std::string::npos);
    }
}

TEST_F(PipelineTest, FailedChunkIsReportedAndOthersSurvive) {
    config_.segmenter.chunk_char_budget = 40;
    NotePipeline pipeline(config_, chunk_aware_factory());
    std::string srt =
        "1\n00:00:02,000 --> 00:00:05,000\nfast intro here\n\n"
        "2\n00:00:20,000 --> 00:00:24,000\nbroken part here\n\n";

    auto result = pipeline.synthesize(video_path_, srt, NoteStyle::Professional, model_config_);

    ASSERT_EQ(result.notes.size(), 1u);
    EXPECT_EQ(result.notes[0].title, "Intro screen");
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].code, ErrorCode::MalformedModelResponse);
    EXPECT_EQ(result.diagnostics[0].scope, "chunk 1");
}

TEST_F(PipelineTest, TimeoutKeepsCompletedChunks) {
    config_.segmenter.chunk_char_budget = 40;
    config_.timeout = std::chrono::milliseconds(300);
    NotePipeline pipeline(config_, chunk_aware_factory());
    std::string srt =
        "1\n00:00:02,000 --> 00:00:05,000\nfast intro here\n\n"
        "2\n00:00:20,000 --> 00:00:24,000\nslow part here\n\n";

    auto start = std::chrono::steady_clock::now();
    auto result = pipeline.synthesize(video_path_, srt, NoteStyle::Professional, model_config_);

    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
    EXPECT_TRUE(result.timed_out);
    ASSERT_EQ(result.notes.size(), 1u);
    EXPECT_EQ(result.notes[0].title, "Intro screen");
    EXPECT_TRUE(result.notes[0].image_path.empty());

    bool timeout_reported = false;
    for (const auto& diagnostic : result.diagnostics) {
        timeout_reported = timeout_reported || diagnostic.code == ErrorCode::PipelineTimeout;
    }
    EXPECT_TRUE(timeout_reported);
}

TEST_F(PipelineTest, TimeoutDuringFrameResolutionKeepsAllNotes) {
    auto long_video = (work_dir_ / "long.avi").string();
    // 120s at 10 fps, nothing in focus so every search runs to the full radius
    ASSERT_TRUE(testing_support::write_test_video(long_video, 1200, 10.0, [](int) { return false; }));

    std::string moments = "[";
    for (int i = 1; i <= 20; ++i) {
        int seconds = i * 5;
        char timestamp[16];
        std::snprintf(timestamp, sizeof(timestamp), "00:%02d:%02d", seconds / 60, seconds % 60);
        moments += std::string(i > 1 ? "," : "") + R"({"timestamp": ")" + timestamp +
                   R"(", "title": "Step )" + std::to_string(i) + R"(", "content": "Details"})";
    }
    moments += "]";

    config_.timeout = std::chrono::seconds(1);
    config_.frame_workers = 1;
    auto model = std::make_shared<ScriptedModel>(std::vector<std::string>{moments});
    // Frame resolution begins only after the deadline has passed
    NotePipeline pipeline(config_, factory_for(model), [](PipelineState state) {
        if (state == PipelineState::FrameResolving) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1200));
        }
    });
    std::string srt = "1\n00:00:00,000 --> 00:01:50,000\nA long walkthrough of every step\n\n";

    auto result = pipeline.synthesize(long_video, srt, NoteStyle::Tutorial, model_config_);

    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.notes.size(), 20u);
    EXPECT_TRUE(has_diagnostic(result, ErrorCode::PipelineTimeout, "frame"));
    EXPECT_FALSE(has_diagnostic(result, ErrorCode::PipelineTimeout, "chunk"));
}

TEST_F(PipelineTest, TimeoutWithoutMomentsThrows) {
    config_.timeout = std::chrono::milliseconds(200);
    NotePipeline pipeline(config_, chunk_aware_factory());
    std::string srt = "1\n00:00:02,000 --> 00:00:05,000\nslow everything\n\n";

    EXPECT_EQ(error_code_of([&] { pipeline.synthesize(video_path_, srt, NoteStyle::Blog, model_config_); }),
              ErrorCode::PipelineTimeout);
}

TEST_F(PipelineTest, ObserverSeesStateSequence) {
    std::mutex mutex;
    std::vector<PipelineState> states;
    auto model = std::make_shared<ScriptedModel>(std::vector<std::string>{
        R"([{"timestamp": "00:00:09", "title": "Theme", "content": "Dark"}])"});
    NotePipeline pipeline(config_, factory_for(model), [&](PipelineState state) {
        std::lock_guard<std::mutex> lock(mutex);
        states.push_back(state);
    });

    pipeline.synthesize(video_path_, three_cue_srt(), NoteStyle::Professional, model_config_);

    std::vector<PipelineState> expected = {PipelineState::Parsing, PipelineState::Extracting,
                                           PipelineState::FrameResolving, PipelineState::Assembling,
                                           PipelineState::Done};
    EXPECT_EQ(states, expected);

    states.clear();
    EXPECT_THROW(pipeline.synthesize(video_path_, "", NoteStyle::Professional, model_config_), PipelineError);
    ASSERT_FALSE(states.empty());
    EXPECT_EQ(states.back(), PipelineState::Failed);
}

TEST_F(PipelineTest, RejectsInvalidConfiguration) {
    config_.model_concurrency = 0;
    EXPECT_EQ(error_code_of([&] { NotePipeline pipeline(config_); }), ErrorCode::InvalidConfig);

    config_.model_concurrency = 2;
    EXPECT_EQ(error_code_of([&] { NotePipeline pipeline(config_, nullptr); }), ErrorCode::InvalidConfig);
}

} // namespace v2n
