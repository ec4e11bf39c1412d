/**
 * @file OllamaAdapter.hpp
 * @brief Adapter for communication with a local Ollama server.
 */

#pragma once
#include "infrastructure/RemoteReviewAdapter.hpp"
#include <string>

namespace draftlens::infrastructure {

/**
 * @class OllamaAdapter
 * @brief Reviews text through the Ollama /api/generate endpoint. No credential needed.
 */
class OllamaAdapter : public RemoteReviewAdapter {
public:
    /**
     * @param endpoint Server base URL, e.g. "http://localhost:11434".
     * @param model Target model name.
     * @throws domain::BackendError{InvalidConfiguration} on a blank model or malformed endpoint.
     */
    OllamaAdapter(const std::string& endpoint, const std::string& model, const AdapterSettings& settings,
                  std::shared_ptr<RateLimiterRegistry> registry);

    const HttpEndpoint& endpoint() const { return m_endpoint; }

protected:
    HttpReply postPrompt(const std::string& systemPrompt, const std::string& userPrompt) override;
    Completion extractCompletion(const nlohmann::json& body) const override;

private:
    HttpEndpoint m_endpoint; ///< Ollama server.
};

} // namespace draftlens::infrastructure
