/**
 * @file RemoteReviewAdapter.cpp
 * @brief Implementation of RemoteReviewAdapter.
 */

#include "infrastructure/RemoteReviewAdapter.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include "infrastructure/ReviewPayloadParser.hpp"
#include "domain/BackendError.hpp"
#include <httplib.h>
#include <iostream>
#include <thread>

namespace draftlens::infrastructure {

using json = nlohmann::json;
using domain::BackendError;
using domain::BackendErrorCode;

namespace {

std::string Snippet(const std::string& body) {
    constexpr size_t kMax = 200;
    return body.size() > kMax ? body.substr(0, kMax) + "..." : body;
}

} // namespace

RemoteReviewAdapter::RemoteReviewAdapter(std::string providerName, std::string model,
                                         const AdapterSettings& settings,
                                         std::shared_ptr<RateLimiterRegistry> registry)
    : m_providerName(std::move(providerName)),
      m_model(std::move(model)),
      m_settings(settings),
      m_registry(std::move(registry)),
      m_cache(settings.cache) {
    if (!m_registry) {
        m_registry = std::make_shared<RateLimiterRegistry>(m_settings.rateLimit.maxTokens,
                                                           m_settings.rateLimit.refillRate);
    }
    if (m_settings.retry.maxAttempts < 1) {
        m_settings.retry.maxAttempts = 1;
    }
}

domain::BackendResponse<domain::RawCritique> RemoteReviewAdapter::reviewText(const std::string& text,
                                                                             const domain::ReviewContext& context) {
    std::string contextKey = m_model + "|" + context.documentType + "|" + context.writingStyle + "|" +
                             context.targetAudience.value_or("");
    std::string key = ResponseCache::MakeKey("text-review", text, contextKey);

    if (auto cached = m_cache.get(key)) {
        domain::BackendResponse<domain::RawCritique> response;
        response.data = ReviewPayloadParser::ParseTextReview(cached->at("content").get<std::string>());
        response.modelId = m_model;
        return response;
    }

    std::cout << "[RemoteReviewAdapter] " << m_providerName << " reviewText with model: " << m_model << std::endl;
    Completion completion = complete(PromptCatalog::BuildTextReviewPrompt(text, context));

    domain::BackendResponse<domain::RawCritique> response;
    response.data = ReviewPayloadParser::ParseTextReview(completion.content);
    response.modelId = m_model;
    response.tokenUsage = completion.usage;
    m_cache.put(key, json{{"content", completion.content}});
    return response;
}

domain::BackendResponse<domain::DiffAnalysis> RemoteReviewAdapter::analyzeDiff(const std::string& diffText,
                                                                               const domain::AnalysisContext& context) {
    std::string contextKey = m_model + "|" + context.documentType.value_or("") + "|" + context.filePath.value_or("");
    std::string key = ResponseCache::MakeKey("diff-analysis", diffText, contextKey);

    if (auto cached = m_cache.get(key)) {
        domain::BackendResponse<domain::DiffAnalysis> response;
        response.data = ReviewPayloadParser::ParseDiffAnalysis(cached->at("content").get<std::string>(), diffText);
        response.modelId = m_model;
        return response;
    }

    Completion completion = complete(PromptCatalog::BuildDiffAnalysisPrompt(diffText, context));

    domain::BackendResponse<domain::DiffAnalysis> response;
    response.data = ReviewPayloadParser::ParseDiffAnalysis(completion.content, diffText);
    response.modelId = m_model;
    response.tokenUsage = completion.usage;
    m_cache.put(key, json{{"content", completion.content}});
    return response;
}

RemoteReviewAdapter::Completion RemoteReviewAdapter::complete(const std::string& userPrompt) {
    const int maxAttempts = m_settings.retry.maxAttempts;
    auto limiter = m_registry->getOrCreate(m_providerName, m_settings.rateLimit.maxTokens,
                                           m_settings.rateLimit.refillRate);
    std::string lastError;

    for (int attempt = 0; attempt < maxAttempts; ++attempt) {
        try {
            limiter->consume(1, m_settings.rateLimit.maxWaitMs);
        } catch (const RateLimitTimeout& e) {
            throw BackendError(BackendErrorCode::RateLimitTimeout, e.what());
        }

        HttpReply reply = postPrompt(PromptCatalog::GetSystemPrompt(), userPrompt);

        if (reply.status >= 200 && reply.status < 300) {
            json body;
            try {
                body = json::parse(reply.body);
            } catch (const json::parse_error& e) {
                throw BackendError(BackendErrorCode::ParseError,
                                   "Response body is not JSON: " + std::string(e.what()), reply.status);
            }
            return extractCompletion(body);
        }

        if (reply.status == 401 || reply.status == 403) {
            throw BackendError(BackendErrorCode::InvalidCredential,
                               "Invalid " + m_providerName + " API key", reply.status);
        }

        if (reply.status == 0) {
            lastError = "Network error: " + reply.error;
        } else if (reply.status == 429 || reply.status >= 500) {
            lastError = "HTTP " + std::to_string(reply.status) + ": " + Snippet(reply.body);
        } else {
            throw BackendError(BackendErrorCode::RequestRejected,
                               "HTTP " + std::to_string(reply.status) + ": " + Snippet(reply.body), reply.status);
        }

        std::cerr << "[RemoteReviewAdapter] " << m_providerName << " attempt " << (attempt + 1) << "/"
                  << maxAttempts << " failed: " << lastError << std::endl;

        if (attempt < maxAttempts - 1) {
            auto delay = std::chrono::milliseconds(m_settings.retry.backoffBaseMs * (1LL << attempt));
            std::this_thread::sleep_for(delay);
        }
    }

    throw BackendError(BackendErrorCode::MaxRetriesExceeded,
                       "Failed after " + std::to_string(maxAttempts) + " attempts: " + lastError);
}

HttpReply RemoteReviewAdapter::postJson(const HttpEndpoint& endpoint, const std::string& path,
                                        const std::map<std::string, std::string>& headers,
                                        const json& body) const {
    httplib::Client cli(endpoint.origin());
    cli.set_connection_timeout(10);
    cli.set_read_timeout(m_settings.retry.timeoutSeconds);
    cli.set_write_timeout(m_settings.retry.timeoutSeconds);

    httplib::Headers httpHeaders;
    for (const auto& [name, value] : headers) {
        httpHeaders.emplace(name, value);
    }

    HttpReply reply;
    auto res = cli.Post(endpoint.resolve(path), httpHeaders, body.dump(), "application/json");
    if (res) {
        reply.status = res->status;
        reply.body = res->body;
    } else {
        reply.error = "Connection failed: " + std::to_string(static_cast<int>(res.error()));
    }
    return reply;
}

} // namespace draftlens::infrastructure
