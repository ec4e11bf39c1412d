/**
 * @file ProviderResolver.cpp
 * @brief Implementation of ProviderResolver.
 */

#include "infrastructure/ProviderResolver.hpp"
#include "infrastructure/ClaudeAdapter.hpp"
#include "infrastructure/OllamaAdapter.hpp"
#include "infrastructure/OpenAIAdapter.hpp"
#include "domain/BackendError.hpp"
#include "domain/TextUtils.hpp"
#include <stdexcept>
#include <type_traits>

namespace draftlens::infrastructure {

ProviderResolution ProviderResolution::Ready(std::string providerId, std::unique_ptr<domain::BackendAdapter> adapter) {
    ProviderResolution r;
    r.status = ResolutionStatus::Ready;
    r.providerId = std::move(providerId);
    r.adapter = std::move(adapter);
    r.message = "Provider " + r.providerId + " ready (" + r.adapter->modelName() + ")";
    return r;
}

ProviderResolution ProviderResolution::CredentialMissing(std::string providerId) {
    ProviderResolution r;
    r.status = ResolutionStatus::CredentialMissing;
    r.providerId = std::move(providerId);
    r.message = "No API key configured for " + r.providerId;
    return r;
}

ProviderResolution ProviderResolution::ConfigurationError(std::string providerId, std::string message) {
    ProviderResolution r;
    r.status = ResolutionStatus::ConfigurationError;
    r.providerId = std::move(providerId);
    r.message = std::move(message);
    return r;
}

ProviderResolver::ProviderResolver(std::shared_ptr<RateLimiterRegistry> registry)
    : m_registry(std::move(registry)) {}

std::optional<std::string> ProviderResolver::CredentialKeyFor(const ProviderConfig& provider) {
    return std::visit([](auto&& p) -> std::optional<std::string> {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, OpenAIProviderConfig>) {
            return std::string("openai");
        } else if constexpr (std::is_same_v<T, ClaudeProviderConfig>) {
            return std::string("claude");
        } else {
            return std::nullopt;
        }
    }, provider);
}

ProviderResolution ProviderResolver::resolve(const AppConfig& config, const domain::CredentialStore& credentials) const {
    const std::string providerId = ProviderId(config.provider);

    std::string secret;
    if (auto key = CredentialKeyFor(config.provider)) {
        auto stored = credentials.get(*key);
        if (!stored || domain::TextUtils::IsBlank(*stored)) {
            return ProviderResolution::CredentialMissing(providerId);
        }
        secret = domain::TextUtils::Trim(*stored);
    }

    AdapterSettings settings{config.retry, config.rateLimit, config.cache};

    try {
        std::unique_ptr<domain::BackendAdapter> adapter = std::visit(
            [&](auto&& p) -> std::unique_ptr<domain::BackendAdapter> {
                using T = std::decay_t<decltype(p)>;
                if constexpr (std::is_same_v<T, OpenAIProviderConfig>) {
                    return std::make_unique<OpenAIAdapter>(secret, p.model, p.baseUrl, settings, m_registry);
                } else if constexpr (std::is_same_v<T, ClaudeProviderConfig>) {
                    return std::make_unique<ClaudeAdapter>(secret, p.model, settings, m_registry);
                } else {
                    return std::make_unique<OllamaAdapter>(p.endpoint, p.model, settings, m_registry);
                }
            },
            config.provider);
        return ProviderResolution::Ready(providerId, std::move(adapter));
    } catch (const domain::BackendError& e) {
        return ProviderResolution::ConfigurationError(providerId, e.what());
    } catch (const std::invalid_argument& e) {
        return ProviderResolution::ConfigurationError(providerId, e.what());
    }
}

} // namespace draftlens::infrastructure
