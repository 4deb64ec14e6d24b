#include "config.hpp"
#include <fstream>
#include <iostream>

namespace v2n {

namespace {

template <typename T>
void read_value(const nlohmann::json& section, const char* key, T& target) {
    if (!section.contains(key)) {
        return;
    }
    try {
        target = section.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw PipelineError(ErrorCode::InvalidConfig,
                            std::string("Invalid value for '") + key + "': " + e.what());
    }
}

template <typename Duration>
void read_duration(const nlohmann::json& section, const char* key, Duration& target) {
    if (!section.contains(key)) {
        return;
    }
    double seconds = 0.0;
    read_value(section, key, seconds);
    target = std::chrono::duration_cast<Duration>(std::chrono::duration<double>(seconds));
}

const nlohmann::json& section_of(const nlohmann::json& config_json, const char* key) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (!config_json.contains(key)) {
        return empty;
    }
    const auto& section = config_json.at(key);
    if (!section.is_object()) {
        throw PipelineError(ErrorCode::InvalidConfig, std::string("Section '") + key + "' must be an object");
    }
    return section;
}

} // namespace

PipelineConfig pipeline_config_from_json(const nlohmann::json& config_json) {
    if (!config_json.is_object()) {
        throw PipelineError(ErrorCode::InvalidConfig, "Configuration root must be a JSON object");
    }

    PipelineConfig config;

    const auto& segmenter = section_of(config_json, "segmenter");
    // Read signed so a negative budget is rejected instead of wrapping
    long long budget = static_cast<long long>(config.segmenter.chunk_char_budget);
    read_value(segmenter, "chunk_char_budget", budget);
    if (budget <= 0) {
        throw PipelineError(ErrorCode::InvalidConfig, "chunk_char_budget must be positive");
    }
    config.segmenter.chunk_char_budget = static_cast<size_t>(budget);
    read_value(segmenter, "last_cue_duration", config.segmenter.last_cue_duration);
    read_value(segmenter, "whole_document_fallback", config.segmenter.whole_document_fallback);
    read_value(segmenter, "fallback_duration", config.segmenter.fallback_duration);

    const auto& extractor = section_of(config_json, "extractor");
    read_value(extractor, "min_separation", config.extractor.min_separation);
    read_value(extractor, "range_tolerance", config.extractor.range_tolerance);
    read_value(extractor, "max_attempts", config.extractor.max_attempts);
    read_duration(extractor, "initial_backoff", config.extractor.initial_backoff);
    read_value(extractor, "temperature", config.extractor.temperature);
    read_value(extractor, "max_tokens", config.extractor.max_tokens);

    const auto& frames = section_of(config_json, "frames");
    read_value(frames, "sharpness_threshold", config.frames.sharpness_threshold);
    read_value(frames, "window_step", config.frames.window_step);
    read_value(frames, "max_search_radius", config.frames.max_search_radius);
    read_value(frames, "probe_interval", config.frames.probe_interval);
    read_value(frames, "jpeg_quality", config.frames.jpeg_quality);

    read_value(config_json, "model_concurrency", config.model_concurrency);
    read_value(config_json, "frame_workers", config.frame_workers);
    read_duration(config_json, "timeout", config.timeout);
    read_value(config_json, "output_dir", config.output_dir);

    config.validate();
    return config;
}

ModelConfig model_config_from_json(const nlohmann::json& config_json, ModelConfig base) {
    const auto& model = section_of(config_json, "model");
    read_value(model, "api_key", base.api_key);
    read_value(model, "base_url", base.base_url);
    read_value(model, "name", base.model);
    read_duration(model, "request_timeout", base.request_timeout);
    return base;
}

PipelineConfig load_pipeline_config(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw PipelineError(ErrorCode::InvalidConfig, "Could not open config file: " + config_path);
    }

    nlohmann::json config_json;
    try {
        file >> config_json;
    } catch (const nlohmann::json::parse_error& e) {
        throw PipelineError(ErrorCode::InvalidConfig,
                            "Config file is not valid JSON: " + config_path + " (" + e.what() + ")");
    }

    std::cout << "Loaded pipeline configuration from " << config_path << std::endl;
    return pipeline_config_from_json(config_json);
}

} // namespace v2n
