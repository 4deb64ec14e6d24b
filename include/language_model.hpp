#pragma once

#include "http_client.hpp"
#include "note_types.hpp"
#include "worker_pool.hpp"
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace v2n {

struct ChatMessage {
    std::string role;  // "system", "user" or "assistant"
    std::string content;
};

struct CompletionOptions {
    double temperature = 0.3;
    int max_tokens = 8000;
};

// Auth, rate-limit or network failure talking to the model endpoint
class ModelUnavailableError : public std::runtime_error {
public:
    ModelUnavailableError(const std::string& message, bool transient, long status = 0)
        : std::runtime_error(message), transient_(transient), status_(status) {}

    bool transient() const { return transient_; }
    long status() const { return status_; }

private:
    bool transient_;
    long status_;
};

class LanguageModel {
public:
    virtual ~LanguageModel() = default;

    // Returns the assistant message text. Throws ModelUnavailableError or OperationCancelled.
    virtual std::string complete(const std::vector<ChatMessage>& messages,
                                 const CompletionOptions& options,
                                 const CancellationToken& cancel) = 0;

    virtual std::string name() const = 0;
};

// OpenAI-compatible chat completions endpoint
class OpenAIChatModel : public LanguageModel {
public:
    explicit OpenAIChatModel(ModelConfig config);
    ~OpenAIChatModel() override = default;

    std::string complete(const std::vector<ChatMessage>& messages,
                         const CompletionOptions& options,
                         const CancellationToken& cancel) override;

    std::string name() const override;

    static bool is_transient_status(long status);

private:
    std::string endpoint() const;

    ModelConfig config_;
    HttpClient http_;
};

using ModelFactory = std::function<std::unique_ptr<LanguageModel>(const ModelConfig&)>;

std::unique_ptr<LanguageModel> create_openai_model(const ModelConfig& config);

} // namespace v2n
