/**
 * @file RemoteReviewAdapter.hpp
 * @brief Shared retry, admission and caching logic for HTTP review backends.
 */

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/BackendAdapter.hpp"
#include "infrastructure/AppConfig.hpp"
#include "infrastructure/HttpEndpoint.hpp"
#include "infrastructure/RateLimiter.hpp"
#include "infrastructure/ResponseCache.hpp"

namespace draftlens::infrastructure {

/** @brief Tuning shared by every remote adapter. */
struct AdapterSettings {
    RetryConfig retry;
    RateLimitConfig rateLimit;
    CacheConfig cache;
};

/** @brief Outcome of one HTTP exchange. status == 0 means the request never got a response. */
struct HttpReply {
    int status = 0;
    std::string body;
    std::string error;
};

/**
 * @class RemoteReviewAdapter
 * @brief BackendAdapter that talks to a remote model through a prompt/completion exchange.
 *
 * Subclasses only describe the wire format: how to post a prompt and how to pull
 * the completion text and token usage out of a response body. Every attempt is
 * gated by the registry's limiter for providerName().
 */
class RemoteReviewAdapter : public domain::BackendAdapter {
public:
    RemoteReviewAdapter(std::string providerName, std::string model, const AdapterSettings& settings,
                        std::shared_ptr<RateLimiterRegistry> registry);

    domain::BackendResponse<domain::RawCritique> reviewText(const std::string& text,
                                                            const domain::ReviewContext& context) override;

    domain::BackendResponse<domain::DiffAnalysis> analyzeDiff(const std::string& diffText,
                                                              const domain::AnalysisContext& context = {}) override;

    std::string providerName() const override { return m_providerName; }
    std::string modelName() const override { return m_model; }

    const ResponseCache& cache() const { return m_cache; }

protected:
    struct Completion {
        std::string content;
        domain::TokenUsage usage;
    };

    /** @brief Sends one request. Must not throw for HTTP or network failures. */
    virtual HttpReply postPrompt(const std::string& systemPrompt, const std::string& userPrompt) = 0;

    /**
     * @brief Pulls the completion text out of a successful response body.
     * @throws domain::BackendError{ParseError} when the envelope lacks it.
     */
    virtual Completion extractCompletion(const nlohmann::json& body) const = 0;

    /** @brief POSTs a JSON body through httplib. */
    HttpReply postJson(const HttpEndpoint& endpoint, const std::string& path,
                       const std::map<std::string, std::string>& headers, const nlohmann::json& body) const;

    /** @brief Runs the admission + retry loop around postPrompt(). */
    Completion complete(const std::string& userPrompt);

    const AdapterSettings& settings() const { return m_settings; }

private:
    std::string m_providerName;
    std::string m_model;
    AdapterSettings m_settings;
    std::shared_ptr<RateLimiterRegistry> m_registry;
    ResponseCache m_cache;
};

} // namespace draftlens::infrastructure
