#include "language_model.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace v2n {

OpenAIChatModel::OpenAIChatModel(ModelConfig config) : config_(std::move(config)) {}

std::string OpenAIChatModel::name() const {
    return config_.model;
}

std::string OpenAIChatModel::endpoint() const {
    std::string base = config_.base_url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/chat/completions";
}

bool OpenAIChatModel::is_transient_status(long status) {
    return status == 408 || status == 409 || status == 429 || status >= 500;
}

std::string OpenAIChatModel::complete(const std::vector<ChatMessage>& messages,
                                      const CompletionOptions& options,
                                      const CancellationToken& cancel) {
    if (config_.api_key.empty()) {
        throw ModelUnavailableError("No API key configured for model " + config_.model, false);
    }

    json request;
    request["model"] = config_.model;
    request["temperature"] = options.temperature;
    request["max_tokens"] = options.max_tokens;
    request["messages"] = json::array();
    for (const auto& message : messages) {
        request["messages"].push_back({{"role", message.role}, {"content", message.content}});
    }

    HttpResponse response;
    try {
        response = http_.post_json(endpoint(), request.dump(),
                                   {{"Authorization", "Bearer " + config_.api_key}},
                                   config_.request_timeout, &cancel);
    } catch (const HttpError& e) {
        if (e.cancelled()) {
            throw OperationCancelled();
        }
        throw ModelUnavailableError(e.what(), true);
    }

    if (response.status != 200) {
        std::string detail = response.body.substr(0, 300);
        try {
            auto error_json = json::parse(response.body);
            if (error_json.contains("error") && error_json["error"].contains("message")) {
                detail = error_json["error"]["message"].get<std::string>();
            }
        } catch (const json::exception&) {
            // Keep the raw body excerpt
        }
        throw ModelUnavailableError("Model endpoint returned HTTP " + std::to_string(response.status) +
                                        ": " + detail,
                                    is_transient_status(response.status), response.status);
    }

    try {
        auto body = json::parse(response.body);
        const auto& content = body.at("choices").at(0).at("message").at("content");
        if (content.is_null()) {
            return "";
        }
        return content.get<std::string>();
    } catch (const json::exception& e) {
        throw ModelUnavailableError(std::string("Unexpected completion envelope: ") + e.what(), true,
                                    response.status);
    }
}

std::unique_ptr<LanguageModel> create_openai_model(const ModelConfig& config) {
    return std::make_unique<OpenAIChatModel>(config);
}

} // namespace v2n
