/**
 * @file CredentialStores.hpp
 * @brief Concrete secret sources.
 */

#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "domain/CredentialStore.hpp"

namespace draftlens::infrastructure {

/**
 * @class EnvCredentialStore
 * @brief Reads DRAFTLENS_<PROVIDER>_API_KEY; "openai" also falls back to API_KEY.
 */
class EnvCredentialStore : public domain::CredentialStore {
public:
    std::optional<std::string> get(const std::string& providerKey) const override;

    /** @brief Environment variable consulted first for @p providerKey. */
    static std::string VariableFor(const std::string& providerKey);
};

/**
 * @class JsonFileCredentialStore
 * @brief Reads { "openai": "...", "claude": "..." } from a JSON file.
 */
class JsonFileCredentialStore : public domain::CredentialStore {
public:
    explicit JsonFileCredentialStore(std::string path);

    std::optional<std::string> get(const std::string& providerKey) const override;

    /** @brief $XDG_CONFIG_HOME/draftlens/credentials.json */
    static std::string DefaultPath();

private:
    std::string m_path;
};

/** @brief Queries stores in order and returns the first non-blank secret. */
class ChainedCredentialStore : public domain::CredentialStore {
public:
    explicit ChainedCredentialStore(std::vector<std::shared_ptr<domain::CredentialStore>> stores);

    std::optional<std::string> get(const std::string& providerKey) const override;

private:
    std::vector<std::shared_ptr<domain::CredentialStore>> m_stores;
};

class InMemoryCredentialStore : public domain::CredentialStore {
public:
    InMemoryCredentialStore() = default;
    explicit InMemoryCredentialStore(std::map<std::string, std::string> secrets);

    void set(const std::string& providerKey, const std::string& secret);
    std::optional<std::string> get(const std::string& providerKey) const override;

private:
    std::map<std::string, std::string> m_secrets;
};

} // namespace draftlens::infrastructure
