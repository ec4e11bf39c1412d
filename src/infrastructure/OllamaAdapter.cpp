/**
 * @file OllamaAdapter.cpp
 * @brief Implementation of the OllamaAdapter class.
 */
#include "infrastructure/OllamaAdapter.hpp"
#include "domain/BackendError.hpp"
#include "domain/TextUtils.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace draftlens::infrastructure {

namespace {
constexpr double kDeterministicTemperature = 0.0;
constexpr double kDeterministicTopP = 1.0;
constexpr int kDeterministicSeed = 42;

HttpEndpoint ParseEndpoint(const std::string& endpoint) {
    if (domain::TextUtils::IsBlank(endpoint)) {
        throw domain::BackendError(domain::BackendErrorCode::InvalidConfiguration,
                                   "Local LLM endpoint is required when using local provider");
    }
    try {
        return HttpEndpoint::Parse(domain::TextUtils::Trim(endpoint));
    } catch (const std::invalid_argument& e) {
        throw domain::BackendError(domain::BackendErrorCode::InvalidConfiguration, e.what());
    }
}
}

OllamaAdapter::OllamaAdapter(const std::string& endpoint, const std::string& model, const AdapterSettings& settings,
                             std::shared_ptr<RateLimiterRegistry> registry)
    : RemoteReviewAdapter("local", domain::TextUtils::Trim(model), settings, std::move(registry)),
      m_endpoint(ParseEndpoint(endpoint)) {
    if (modelName().empty()) {
        throw domain::BackendError(domain::BackendErrorCode::InvalidConfiguration,
                                   "Local LLM model name is required when using local provider");
    }
}

HttpReply OllamaAdapter::postPrompt(const std::string& systemPrompt, const std::string& userPrompt) {
    json requestData = {
        {"model", modelName()},
        {"system", systemPrompt},
        {"prompt", userPrompt},
        {"stream", false},
        {"format", "json"},
        {"options", {
            {"temperature", kDeterministicTemperature},
            {"top_p", kDeterministicTopP},
            {"seed", kDeterministicSeed}
        }}
    };
    return postJson(m_endpoint, "/api/generate", {}, requestData);
}

RemoteReviewAdapter::Completion OllamaAdapter::extractCompletion(const json& body) const {
    if (!body.contains("response") || !body["response"].is_string()) {
        throw domain::BackendError(domain::BackendErrorCode::ParseError, "Ollama response has no 'response' field");
    }
    Completion completion;
    completion.content = body["response"].get<std::string>();
    // Ollama reports evaluation counts; local inference has no cost.
    completion.usage.promptTokens = body.value("prompt_eval_count", 0);
    completion.usage.completionTokens = body.value("eval_count", 0);
    completion.usage.totalTokens = completion.usage.promptTokens + completion.usage.completionTokens;
    return completion;
}

} // namespace draftlens::infrastructure
