/**
 * @file ClaudeAdapter.cpp
 * @brief Implementation of ClaudeAdapter.
 */

#include "infrastructure/ClaudeAdapter.hpp"
#include "domain/BackendError.hpp"
#include "domain/TextUtils.hpp"
#include <map>

namespace draftlens::infrastructure {

using json = nlohmann::json;
using domain::BackendError;
using domain::BackendErrorCode;

namespace {

constexpr const char* kBaseUrl = "https://api.anthropic.com";
constexpr const char* kApiVersion = "2023-06-01";
constexpr const char* kDefaultModel = "claude-3-sonnet-20240229";
constexpr int kMaxOutputTokens = 4096;
constexpr double kTemperature = 0.3;

} // namespace

ClaudeAdapter::ClaudeAdapter(const std::string& apiKey, const std::string& model, const AdapterSettings& settings,
                             std::shared_ptr<RateLimiterRegistry> registry)
    : RemoteReviewAdapter("claude", ResolveModelAlias(model), settings, std::move(registry)),
      m_apiKey(domain::TextUtils::Trim(apiKey)),
      m_endpoint(HttpEndpoint::Parse(kBaseUrl)) {
    if (m_apiKey.empty()) {
        throw BackendError(BackendErrorCode::InvalidConfiguration, "Claude API key is required");
    }
}

std::string ClaudeAdapter::ResolveModelAlias(const std::string& model) {
    static const std::map<std::string, std::string> aliases = {
        {"claude-3-opus", "claude-3-opus-20240229"},
        {"claude-3-sonnet", "claude-3-sonnet-20240229"},
        {"claude-3-haiku", "claude-3-haiku-20240307"}
    };
    auto it = aliases.find(model);
    if (it != aliases.end()) return it->second;
    return domain::TextUtils::IsBlank(model) ? kDefaultModel : model;
}

double ClaudeAdapter::EstimateCost(const std::string& model, int promptTokens, int completionTokens) {
    double input = 0.000003;   // sonnet
    double output = 0.000015;
    if (model == "claude-3-opus-20240229") {
        input = 0.000015;
        output = 0.000075;
    } else if (model == "claude-3-haiku-20240307") {
        input = 0.00000025;
        output = 0.00000125;
    }
    return promptTokens * input + completionTokens * output;
}

HttpReply ClaudeAdapter::postPrompt(const std::string& systemPrompt, const std::string& userPrompt) {
    json requestData = {
        {"model", modelName()},
        {"max_tokens", kMaxOutputTokens},
        {"temperature", kTemperature},
        {"system", systemPrompt},
        {"messages", json::array({
            {{"role", "user"}, {"content", userPrompt}}
        })}
    };
    return postJson(m_endpoint, "/v1/messages",
                    {{"x-api-key", m_apiKey}, {"anthropic-version", kApiVersion}}, requestData);
}

RemoteReviewAdapter::Completion ClaudeAdapter::extractCompletion(const json& body) const {
    Completion completion;
    if (!body.contains("content") || !body["content"].is_array() || body["content"].empty()) {
        throw BackendError(BackendErrorCode::ParseError, "Claude response has no content blocks");
    }
    const auto& first = body["content"][0];
    if (first.value("type", "") != "text" || !first.contains("text") || !first["text"].is_string()) {
        throw BackendError(BackendErrorCode::ParseError, "Claude response does not start with a text block");
    }
    completion.content = first["text"].get<std::string>();

    if (body.contains("usage") && body["usage"].is_object()) {
        completion.usage.promptTokens = body["usage"].value("input_tokens", 0);
        completion.usage.completionTokens = body["usage"].value("output_tokens", 0);
    }
    completion.usage.totalTokens = completion.usage.promptTokens + completion.usage.completionTokens;
    completion.usage.estimatedCost =
        EstimateCost(modelName(), completion.usage.promptTokens, completion.usage.completionTokens);
    return completion;
}

} // namespace draftlens::infrastructure
