/**
 * @file CredentialStores.cpp
 * @brief Implementation of the credential stores.
 */

#include "infrastructure/CredentialStores.hpp"
#include "infrastructure/PathUtils.hpp"
#include "domain/TextUtils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace draftlens::infrastructure {

namespace {

std::optional<std::string> NonBlankEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value && !domain::TextUtils::IsBlank(value)) {
        return domain::TextUtils::Trim(value);
    }
    return std::nullopt;
}

} // namespace

std::string EnvCredentialStore::VariableFor(const std::string& providerKey) {
    std::string upper = providerKey;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return "DRAFTLENS_" + upper + "_API_KEY";
}

std::optional<std::string> EnvCredentialStore::get(const std::string& providerKey) const {
    if (auto value = NonBlankEnv(VariableFor(providerKey))) {
        return value;
    }
    if (providerKey == "openai") {
        return NonBlankEnv("API_KEY");
    }
    return std::nullopt;
}

JsonFileCredentialStore::JsonFileCredentialStore(std::string path) : m_path(std::move(path)) {}

std::string JsonFileCredentialStore::DefaultPath() {
    return (PathUtils::GetAppConfigDir() / "credentials.json").string();
}

std::optional<std::string> JsonFileCredentialStore::get(const std::string& providerKey) const {
    if (m_path.empty() || !std::filesystem::exists(m_path)) {
        return std::nullopt;
    }
    try {
        std::ifstream f(m_path);
        auto j = nlohmann::json::parse(f);
        if (j.is_object() && j.contains(providerKey) && j[providerKey].is_string()) {
            std::string secret = j[providerKey].get<std::string>();
            if (!domain::TextUtils::IsBlank(secret)) {
                return domain::TextUtils::Trim(secret);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[JsonFileCredentialStore] Error reading " << m_path << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

ChainedCredentialStore::ChainedCredentialStore(std::vector<std::shared_ptr<domain::CredentialStore>> stores)
    : m_stores(std::move(stores)) {}

std::optional<std::string> ChainedCredentialStore::get(const std::string& providerKey) const {
    for (const auto& store : m_stores) {
        if (!store) continue;
        auto secret = store->get(providerKey);
        if (secret && !domain::TextUtils::IsBlank(*secret)) {
            return secret;
        }
    }
    return std::nullopt;
}

InMemoryCredentialStore::InMemoryCredentialStore(std::map<std::string, std::string> secrets)
    : m_secrets(std::move(secrets)) {}

void InMemoryCredentialStore::set(const std::string& providerKey, const std::string& secret) {
    m_secrets[providerKey] = secret;
}

std::optional<std::string> InMemoryCredentialStore::get(const std::string& providerKey) const {
    auto it = m_secrets.find(providerKey);
    if (it == m_secrets.end()) return std::nullopt;
    return it->second;
}

} // namespace draftlens::infrastructure
