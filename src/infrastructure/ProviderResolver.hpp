/**
 * @file ProviderResolver.hpp
 * @brief Builds the configured backend adapter, if one can be built.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include "domain/BackendAdapter.hpp"
#include "domain/CredentialStore.hpp"
#include "infrastructure/AppConfig.hpp"
#include "infrastructure/RateLimiter.hpp"

namespace draftlens::infrastructure {

enum class ResolutionStatus {
    Ready,
    CredentialMissing,  ///< Expected; callers fall back to offline review.
    ConfigurationError  ///< The selected adapter rejected its configuration.
};

inline std::string ResolutionStatusToString(ResolutionStatus status) {
    switch (status) {
        case ResolutionStatus::Ready: return "ready";
        case ResolutionStatus::CredentialMissing: return "credential-missing";
        case ResolutionStatus::ConfigurationError: return "configuration-error";
    }
    return "unknown";
}

/**
 * @struct ProviderResolution
 * @brief Result of one resolve() call. Owns the adapter when status is Ready.
 */
struct ProviderResolution {
    ResolutionStatus status = ResolutionStatus::CredentialMissing;
    std::string providerId;
    std::unique_ptr<domain::BackendAdapter> adapter;
    std::string message;

    bool isReady() const { return status == ResolutionStatus::Ready && adapter != nullptr; }

    static ProviderResolution Ready(std::string providerId, std::unique_ptr<domain::BackendAdapter> adapter);
    static ProviderResolution CredentialMissing(std::string providerId);
    static ProviderResolution ConfigurationError(std::string providerId, std::string message);
};

class ProviderResolver {
public:
    explicit ProviderResolver(std::shared_ptr<RateLimiterRegistry> registry);

    /**
     * @brief Selects the adapter family and instantiates exactly one adapter.
     *
     * Never throws for a missing credential.
     */
    ProviderResolution resolve(const AppConfig& config, const domain::CredentialStore& credentials) const;

    /** @brief Credential key for the family, nullopt when it needs none. */
    static std::optional<std::string> CredentialKeyFor(const ProviderConfig& provider);

private:
    std::shared_ptr<RateLimiterRegistry> m_registry;
};

} // namespace draftlens::infrastructure
