/**
 * @file CredentialStore.hpp
 * @brief Interface for secret lookup.
 */

#pragma once

#include <optional>
#include <string>

namespace draftlens::domain {

class CredentialStore {
public:
    virtual ~CredentialStore() = default;

    /**
     * @brief Fetches a secret.
     * @param providerKey Provider family key ("openai", "claude").
     * @return The secret, or nullopt when none is stored.
     */
    virtual std::optional<std::string> get(const std::string& providerKey) const = 0;
};

} // namespace draftlens::domain
