/**
 * @file ClaudeAdapter.hpp
 * @brief Adapter for the Anthropic messages API.
 */

#pragma once

#include "infrastructure/RemoteReviewAdapter.hpp"

namespace draftlens::infrastructure {

class ClaudeAdapter : public RemoteReviewAdapter {
public:
    /**
     * @param model Full model id or a short alias ("claude-3-sonnet").
     * @throws domain::BackendError{InvalidConfiguration} on a blank key.
     */
    ClaudeAdapter(const std::string& apiKey, const std::string& model, const AdapterSettings& settings,
                  std::shared_ptr<RateLimiterRegistry> registry);

    /** @brief Maps short aliases to dated model ids; other names pass through. */
    static std::string ResolveModelAlias(const std::string& model);

    static double EstimateCost(const std::string& model, int promptTokens, int completionTokens);

protected:
    HttpReply postPrompt(const std::string& systemPrompt, const std::string& userPrompt) override;
    Completion extractCompletion(const nlohmann::json& body) const override;

private:
    std::string m_apiKey;
    HttpEndpoint m_endpoint;
};

} // namespace draftlens::infrastructure
