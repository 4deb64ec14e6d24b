#pragma once

#include "note_types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace v2n {

// Missing keys keep their defaults, wrong types raise PipelineError(InvalidConfig).
PipelineConfig pipeline_config_from_json(const nlohmann::json& config_json);
PipelineConfig load_pipeline_config(const std::string& config_path);

// Reads the optional "model" section of the same file
ModelConfig model_config_from_json(const nlohmann::json& config_json, ModelConfig base = {});

} // namespace v2n
