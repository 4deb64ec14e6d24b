#include "config.hpp"
#include "console.hpp"
#include "frame_extractor.hpp"
#include "note_pipeline.hpp"
#include "timestamp.hpp"
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] VIDEO_PATH SUBTITLE_FILE\n"
              << "Options:\n"
              << "  -k, --api-key KEY    Model API key (default: $OPENAI_API_KEY)\n"
              << "  -u, --base-url URL   OpenAI-compatible endpoint base URL\n"
              << "  -m, --model NAME     Model name (default: gpt-4o-mini)\n"
              << "  -s, --style STYLE    professional, blog or tutorial (default: professional)\n"
              << "  -c, --config FILE    Pipeline configuration JSON\n"
              << "  -d, --frames-dir DIR Base directory for extracted frames\n"
              << "  -t, --timeout SEC    Overall timeout in seconds\n"
              << "  --output FILE        Write the response JSON to FILE\n"
              << "  --info               Show video information only\n"
              << "  -h, --help           Show this help\n";
}

json note_to_json(const v2n::NoteNode& note) {
    return {
        {"id", note.id},
        {"timestamp", note.timestamp},
        {"seconds", note.seconds},
        {"title", note.title},
        {"content", note.content},
        {"imagePath", note.image_path},
        {"isEdited", note.edited},
    };
}

void emit(const json& output, const std::string& output_file) {
    if (!output_file.empty()) {
        std::ofstream file(output_file);
        if (!file) {
            throw std::runtime_error("Cannot write output file: " + output_file);
        }
        file << output.dump(2);
        std::cout << "Results saved to: " << output_file << std::endl;
    } else {
        std::cout << output.dump(2) << std::endl;
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    v2n::ModelConfig model_config;
    if (const char* key = std::getenv("OPENAI_API_KEY")) {
        model_config.api_key = key;
    }

    std::string video_path;
    std::string subtitle_path;
    std::string config_path;
    std::string output_file;
    std::string style_name = "professional";
    std::string frames_dir;
    long timeout_seconds = 0;
    bool info_only = false;

    // Command line values override the config file
    v2n::ModelConfig overrides;
    bool has_key = false, has_url = false, has_model = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-k" || arg == "--api-key") {
            if (++i < argc) { overrides.api_key = argv[i]; has_key = true; }
        } else if (arg == "-u" || arg == "--base-url") {
            if (++i < argc) { overrides.base_url = argv[i]; has_url = true; }
        } else if (arg == "-m" || arg == "--model") {
            if (++i < argc) { overrides.model = argv[i]; has_model = true; }
        } else if (arg == "-s" || arg == "--style") {
            if (++i < argc) style_name = argv[i];
        } else if (arg == "-c" || arg == "--config") {
            if (++i < argc) config_path = argv[i];
        } else if (arg == "-d" || arg == "--frames-dir") {
            if (++i < argc) frames_dir = argv[i];
        } else if (arg == "-t" || arg == "--timeout") {
            if (++i < argc) timeout_seconds = std::stol(argv[i]);
        } else if (arg == "--output") {
            if (++i < argc) output_file = argv[i];
        } else if (arg == "--info") {
            info_only = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (video_path.empty()) {
            video_path = arg;
        } else if (subtitle_path.empty()) {
            subtitle_path = arg;
        }
    }

    if (video_path.empty()) {
        std::cerr << "Error: No video path provided\n";
        return 1;
    }

    try {
        if (info_only) {
            auto info = v2n::probe_video(video_path);

            json info_json;
            info_json["video_path"] = video_path;
            info_json["total_frames"] = info.total_frames;
            info_json["fps"] = info.fps;
            info_json["duration"] = info.duration;
            info_json["duration_formatted"] = v2n::format_clock(info.duration);
            info_json["frame_size"] = {info.width, info.height};
            info_json["codec"] = info.codec;

            emit(info_json, output_file);
            return 0;
        }

        if (subtitle_path.empty()) {
            std::cerr << "Error: No subtitle file provided\n";
            return 1;
        }

        json output;
        int exit_code = 0;
        {
            // Progress goes to stderr so stdout carries only the response JSON
            v2n::ScopedStdoutRedirect progress_to_stderr(std::cerr);

            v2n::PipelineConfig config;
            if (!config_path.empty()) {
                config = v2n::load_pipeline_config(config_path);

                std::ifstream file(config_path);
                model_config = v2n::model_config_from_json(json::parse(file), model_config);
            }
            if (has_key) model_config.api_key = overrides.api_key;
            if (has_url) model_config.base_url = overrides.base_url;
            if (has_model) model_config.model = overrides.model;
            if (!frames_dir.empty()) config.output_dir = frames_dir;
            if (timeout_seconds > 0) config.timeout = std::chrono::seconds(timeout_seconds);

            std::ifstream subtitle_file(subtitle_path);
            if (!subtitle_file) {
                std::cerr << "Error: Cannot read subtitle file: " << subtitle_path << std::endl;
                return 1;
            }
            std::stringstream subtitle_text;
            subtitle_text << subtitle_file.rdbuf();

            v2n::NotePipeline pipeline(config, v2n::create_openai_model, [](v2n::PipelineState state) {
                std::cerr << "[pipeline] State: " << v2n::to_string(state) << std::endl;
            });

            try {
                auto result = pipeline.synthesize(video_path, subtitle_text.str(),
                                                  v2n::parse_style(style_name), model_config);

                output["success"] = true;
                output["data"] = json::array();
                for (const auto& note : result.notes) {
                    output["data"].push_back(note_to_json(note));
                }
                output["error"] = nullptr;
                output["partial"] = result.timed_out || !result.diagnostics.empty();
                output["framesDir"] = result.output_dir;
            } catch (const v2n::PipelineError& e) {
                output["success"] = false;
                output["data"] = json::array();
                output["error"] = {{"code", v2n::to_string(e.code())}, {"message", e.what()}};
                exit_code = 1;
            }
        }

        emit(output, output_file);
        return exit_code;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
