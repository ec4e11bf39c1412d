/**
 * @file OpenAIAdapter.cpp
 * @brief Implementation of OpenAIAdapter.
 */

#include "infrastructure/OpenAIAdapter.hpp"
#include "domain/BackendError.hpp"
#include "domain/TextUtils.hpp"
#include <stdexcept>

namespace draftlens::infrastructure {

using json = nlohmann::json;
using domain::BackendError;
using domain::BackendErrorCode;

namespace {

constexpr const char* kDefaultBaseUrl = "https://api.openai.com/v1";
constexpr double kTemperature = 0.3;

struct TokenPrice {
    double input;
    double output;
};

HttpEndpoint ResolveEndpoint(const std::optional<std::string>& baseUrl) {
    if (!baseUrl || domain::TextUtils::IsBlank(*baseUrl)) {
        return HttpEndpoint::Parse(kDefaultBaseUrl);
    }
    try {
        HttpEndpoint ep = HttpEndpoint::ParseSecure(domain::TextUtils::Trim(*baseUrl));
        if (!domain::TextUtils::EndsWith(ep.basePath, "/v1")) {
            ep.basePath += "/v1";
        }
        return ep;
    } catch (const std::invalid_argument& e) {
        throw BackendError(BackendErrorCode::InvalidConfiguration, e.what());
    }
}

} // namespace

OpenAIAdapter::OpenAIAdapter(const std::string& apiKey, const std::string& model,
                             const std::optional<std::string>& baseUrl, const AdapterSettings& settings,
                             std::shared_ptr<RateLimiterRegistry> registry)
    : RemoteReviewAdapter("openai", model.empty() ? "gpt-4" : model, settings, std::move(registry)),
      m_apiKey(domain::TextUtils::Trim(apiKey)),
      m_endpoint(ResolveEndpoint(baseUrl)) {
    if (m_apiKey.empty()) {
        throw BackendError(BackendErrorCode::InvalidConfiguration, "OpenAI API key is required");
    }
}

double OpenAIAdapter::EstimateCost(const std::string& model, int promptTokens, int completionTokens) {
    TokenPrice price{0.00003, 0.00006}; // gpt-4
    if (model == "gpt-4-turbo") {
        price = {0.00001, 0.00003};
    } else if (model == "gpt-3.5-turbo") {
        price = {0.0000015, 0.000002};
    }
    return promptTokens * price.input + completionTokens * price.output;
}

HttpReply OpenAIAdapter::postPrompt(const std::string& systemPrompt, const std::string& userPrompt) {
    json requestData = {
        {"model", modelName()},
        {"messages", json::array({
            {{"role", "system"}, {"content", systemPrompt}},
            {{"role", "user"}, {"content", userPrompt}}
        })},
        {"temperature", kTemperature},
        {"response_format", {{"type", "json_object"}}}
    };
    return postJson(m_endpoint, "/chat/completions", {{"Authorization", "Bearer " + m_apiKey}}, requestData);
}

RemoteReviewAdapter::Completion OpenAIAdapter::extractCompletion(const json& body) const {
    Completion completion;
    if (!body.contains("choices") || !body["choices"].is_array() || body["choices"].empty()) {
        throw BackendError(BackendErrorCode::ParseError, "OpenAI response has no choices");
    }
    const auto& message = body["choices"][0].value("message", json::object());
    if (!message.contains("content") || !message["content"].is_string()) {
        throw BackendError(BackendErrorCode::ParseError, "OpenAI response has no message content");
    }
    completion.content = message["content"].get<std::string>();

    if (body.contains("usage") && body["usage"].is_object()) {
        const auto& usage = body["usage"];
        completion.usage.promptTokens = usage.value("prompt_tokens", 0);
        completion.usage.completionTokens = usage.value("completion_tokens", 0);
        completion.usage.totalTokens = usage.value("total_tokens", 0);
    }
    completion.usage.estimatedCost =
        EstimateCost(modelName(), completion.usage.promptTokens, completion.usage.completionTokens);
    return completion;
}

} // namespace draftlens::infrastructure
