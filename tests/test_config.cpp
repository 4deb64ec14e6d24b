#include <gtest/gtest.h>
#include "config.hpp"
#include <filesystem>
#include <fstream>

namespace v2n {

using json = nlohmann::json;

TEST(ConfigTest, DefaultsAreValid) {
    PipelineConfig config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_DOUBLE_EQ(config.extractor.min_separation, 5.0);
    EXPECT_DOUBLE_EQ(config.frames.sharpness_threshold, 100.0);
    EXPECT_EQ(config.frames.jpeg_quality, 90);
}

TEST(ConfigTest, ReadsSectionsAndOverrides) {
    auto config = pipeline_config_from_json(json::parse(R"({
        "segmenter": {"chunk_char_budget": 4000, "whole_document_fallback": true},
        "extractor": {"min_separation": 8.5, "max_attempts": 2, "initial_backoff": 0.25},
        "frames": {"sharpness_threshold": 60.0, "jpeg_quality": 75},
        "model_concurrency": 2,
        "frame_workers": 3,
        "timeout": 90,
        "output_dir": "/var/tmp/notes",
        "unknown_key": "ignored"
    })"));

    EXPECT_EQ(config.segmenter.chunk_char_budget, 4000u);
    EXPECT_TRUE(config.segmenter.whole_document_fallback);
    EXPECT_DOUBLE_EQ(config.segmenter.last_cue_duration, 3.0);
    EXPECT_DOUBLE_EQ(config.extractor.min_separation, 8.5);
    EXPECT_EQ(config.extractor.max_attempts, 2);
    EXPECT_EQ(config.extractor.initial_backoff, std::chrono::milliseconds(250));
    EXPECT_DOUBLE_EQ(config.frames.sharpness_threshold, 60.0);
    EXPECT_EQ(config.frames.jpeg_quality, 75);
    EXPECT_EQ(config.model_concurrency, 2);
    EXPECT_EQ(config.frame_workers, 3);
    EXPECT_EQ(config.timeout, std::chrono::seconds(90));
    EXPECT_EQ(config.output_dir, "/var/tmp/notes");
}

TEST(ConfigTest, WrongTypesAreInvalidConfig) {
    for (const char* text : {R"({"model_concurrency": "four"})", R"({"frames": []})",
                             R"({"extractor": {"min_separation": "5s"}})", R"([1, 2, 3])"}) {
        try {
            pipeline_config_from_json(json::parse(text));
            ADD_FAILURE() << "Expected PipelineError for " << text;
        } catch (const PipelineError& e) {
            EXPECT_EQ(e.code(), ErrorCode::InvalidConfig);
        }
    }
}

TEST(ConfigTest, OutOfRangeValuesAreRejected) {
    EXPECT_THROW(pipeline_config_from_json(json::parse(R"({"frames": {"jpeg_quality": 0}})")), PipelineError);
    EXPECT_THROW(pipeline_config_from_json(json::parse(R"({"model_concurrency": 0})")), PipelineError);
    EXPECT_THROW(pipeline_config_from_json(json::parse(R"({"frames": {"probe_interval": 0}})")), PipelineError);
    EXPECT_THROW(pipeline_config_from_json(json::parse(R"({"timeout": 0})")), PipelineError);
}

TEST(ConfigTest, NonPositiveChunkBudgetIsInvalidConfig) {
    for (const char* text : {R"({"segmenter": {"chunk_char_budget": -5}})",
                             R"({"segmenter": {"chunk_char_budget": 0}})"}) {
        try {
            pipeline_config_from_json(json::parse(text));
            ADD_FAILURE() << "Expected PipelineError for " << text;
        } catch (const PipelineError& e) {
            EXPECT_EQ(e.code(), ErrorCode::InvalidConfig);
        }
    }
}

TEST(ConfigTest, ReadsModelSection) {
    ModelConfig base;
    base.api_key = "from-env";

    auto model = model_config_from_json(json::parse(R"({
        "model": {"base_url": "http://localhost:8080/v1", "name": "local-model", "request_timeout": 30}
    })"), base);

    EXPECT_EQ(model.api_key, "from-env");
    EXPECT_EQ(model.base_url, "http://localhost:8080/v1");
    EXPECT_EQ(model.model, "local-model");
    EXPECT_EQ(model.request_timeout, std::chrono::seconds(30));
}

TEST(ConfigTest, LoadsFromFile) {
    auto path = std::filesystem::temp_directory_path() /
                ("v2n_config_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + ".json");
    {
        std::ofstream file(path);
        file << R"({"frames": {"max_search_radius": 3.0}})";
    }

    auto config = load_pipeline_config(path.string());
    EXPECT_DOUBLE_EQ(config.frames.max_search_radius, 3.0);

    std::filesystem::remove(path);
    EXPECT_THROW(load_pipeline_config(path.string()), PipelineError);
}

TEST(ConfigTest, ParsesStyles) {
    EXPECT_EQ(parse_style("Blog"), NoteStyle::Blog);
    EXPECT_EQ(parse_style("tutorial"), NoteStyle::Tutorial);
    EXPECT_EQ(parse_style("PROFESSIONAL"), NoteStyle::Professional);
    EXPECT_THROW(parse_style("haiku"), PipelineError);
    EXPECT_EQ(to_string(NoteStyle::Blog), "blog");
}

} // namespace v2n
