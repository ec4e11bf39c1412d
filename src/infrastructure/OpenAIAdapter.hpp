/**
 * @file OpenAIAdapter.hpp
 * @brief Adapter for OpenAI and OpenAI-compatible chat completion endpoints.
 */

#pragma once

#include <optional>
#include "infrastructure/RemoteReviewAdapter.hpp"

namespace draftlens::infrastructure {

class OpenAIAdapter : public RemoteReviewAdapter {
public:
    /**
     * @param apiKey Bearer credential. Must not be blank.
     * @param model Chat model id.
     * @param baseUrl Optional OpenAI-compatible endpoint; "/v1" is appended when missing.
     * @throws domain::BackendError{InvalidConfiguration} on a blank key or an invalid URL.
     */
    OpenAIAdapter(const std::string& apiKey, const std::string& model, const std::optional<std::string>& baseUrl,
                  const AdapterSettings& settings, std::shared_ptr<RateLimiterRegistry> registry);

    const HttpEndpoint& endpoint() const { return m_endpoint; }

    /** @brief USD estimate from the published per-token prices; unknown models use gpt-4 rates. */
    static double EstimateCost(const std::string& model, int promptTokens, int completionTokens);

protected:
    HttpReply postPrompt(const std::string& systemPrompt, const std::string& userPrompt) override;
    Completion extractCompletion(const nlohmann::json& body) const override;

private:
    std::string m_apiKey;
    HttpEndpoint m_endpoint;
};

} // namespace draftlens::infrastructure
