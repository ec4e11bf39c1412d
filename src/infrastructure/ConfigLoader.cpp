/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include "domain/TextUtils.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace draftlens::infrastructure {

using json = nlohmann::json;

namespace {

template <typename T>
void ReadNumber(const json& section, const char* key, T& target, std::vector<std::string>& errors,
                const std::string& prefix) {
    if (!section.contains(key)) return;
    const auto& value = section.at(key);
    if (!value.is_number()) {
        errors.push_back(prefix + "." + key + " must be a number");
        return;
    }
    target = value.get<T>();
}

void ReadString(const json& section, const char* key, std::string& target, std::vector<std::string>& errors,
                const std::string& prefix) {
    if (!section.contains(key)) return;
    const auto& value = section.at(key);
    if (!value.is_string()) {
        errors.push_back(prefix + "." + key + " must be a string");
        return;
    }
    target = value.get<std::string>();
}

const json& Section(const json& j, const char* key) {
    static const json empty = json::object();
    if (j.contains(key) && j.at(key).is_object()) {
        return j.at(key);
    }
    return empty;
}

} // namespace

AppConfig ConfigLoader::Parse(const json& j, std::vector<std::string>& errors) {
    AppConfig config;
    if (!j.is_object()) {
        errors.push_back("settings root must be a JSON object");
        return config;
    }

    OpenAIProviderConfig openai;
    const json& openaiSection = Section(j, "openai");
    ReadString(openaiSection, "model", openai.model, errors, "openai");
    std::string baseUrl;
    ReadString(openaiSection, "baseUrl", baseUrl, errors, "openai");
    if (!domain::TextUtils::IsBlank(baseUrl)) {
        openai.baseUrl = domain::TextUtils::Trim(baseUrl);
    }

    ClaudeProviderConfig claude;
    ReadString(Section(j, "claude"), "model", claude.model, errors, "claude");

    LocalProviderConfig local;
    const json& localSection = Section(j, "local");
    ReadString(localSection, "endpoint", local.endpoint, errors, "local");
    ReadString(localSection, "model", local.model, errors, "local");

    std::string provider = "openai";
    ReadString(j, "provider", provider, errors, "settings");
    if (provider == "openai") {
        config.provider = openai;
    } else if (provider == "claude") {
        config.provider = claude;
    } else if (provider == "local") {
        config.provider = local;
    } else {
        errors.push_back("Invalid AI provider: " + provider);
        config.provider = openai;
    }

    const json& performance = Section(j, "performance");
    if (performance.contains("enableCache")) {
        if (performance.at("enableCache").is_boolean()) {
            config.cache.enabled = performance.at("enableCache").get<bool>();
        } else {
            errors.push_back("performance.enableCache must be a boolean");
        }
    }
    ReadNumber(performance, "cacheTTL", config.cache.ttlMs, errors, "performance");
    ReadNumber(performance, "cacheMaxSize", config.cache.maxBytes, errors, "performance");

    const json& rateLimit = Section(j, "rateLimit");
    ReadNumber(rateLimit, "maxTokens", config.rateLimit.maxTokens, errors, "rateLimit");
    ReadNumber(rateLimit, "refillRate", config.rateLimit.refillRate, errors, "rateLimit");
    ReadNumber(rateLimit, "maxWaitMs", config.rateLimit.maxWaitMs, errors, "rateLimit");

    const json& retry = Section(j, "retry");
    ReadNumber(retry, "maxAttempts", config.retry.maxAttempts, errors, "retry");
    ReadNumber(retry, "backoffBaseMs", config.retry.backoffBaseMs, errors, "retry");
    ReadNumber(retry, "timeoutSeconds", config.retry.timeoutSeconds, errors, "retry");

    ReadNumber(Section(j, "apply"), "settleDelayMs", config.apply.settleDelayMs, errors, "apply");

    return config;
}

AppConfig ConfigLoader::Load(const std::string& settingsPath) {
    std::filesystem::path configPath(settingsPath);
    if (!std::filesystem::exists(configPath)) {
        return AppConfig{};
    }

    try {
        std::ifstream f(configPath);
        json j = json::parse(f);

        std::vector<std::string> errors;
        AppConfig config = Parse(j, errors);
        for (const auto& err : errors) {
            std::cerr << "[ConfigLoader] " << err << std::endl;
        }
        return config;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << settingsPath << ": " << e.what() << std::endl;
    }

    return AppConfig{};
}

std::vector<std::string> ConfigLoader::Validate(const AppConfig& config) {
    std::vector<std::string> errors;
    using domain::TextUtils;

    if (const auto* local = std::get_if<LocalProviderConfig>(&config.provider)) {
        if (TextUtils::IsBlank(local->endpoint)) {
            errors.push_back("Local LLM endpoint is required when using local provider");
        }
        if (TextUtils::IsBlank(local->model)) {
            errors.push_back("Local LLM model name is required when using local provider");
        }
    } else if (const auto* openai = std::get_if<OpenAIProviderConfig>(&config.provider)) {
        if (TextUtils::IsBlank(openai->model)) {
            errors.push_back("OpenAI model name is required");
        }
    } else if (const auto* claude = std::get_if<ClaudeProviderConfig>(&config.provider)) {
        if (TextUtils::IsBlank(claude->model)) {
            errors.push_back("Claude model name is required");
        }
    }

    if (config.rateLimit.maxTokens <= 0) errors.push_back("rateLimit.maxTokens must be greater than 0");
    if (config.rateLimit.refillRate <= 0) errors.push_back("rateLimit.refillRate must be greater than 0");
    if (config.rateLimit.maxWaitMs < 0) errors.push_back("rateLimit.maxWaitMs must not be negative");
    if (config.retry.maxAttempts < 1) errors.push_back("retry.maxAttempts must be at least 1");
    if (config.retry.backoffBaseMs < 0) errors.push_back("retry.backoffBaseMs must not be negative");
    if (config.retry.timeoutSeconds <= 0) errors.push_back("retry.timeoutSeconds must be greater than 0");
    if (config.cache.ttlMs < 0) errors.push_back("performance.cacheTTL must not be negative");
    if (config.apply.settleDelayMs < 0) errors.push_back("apply.settleDelayMs must not be negative");

    return errors;
}

std::string ConfigLoader::DefaultSettingsPath() {
    return (PathUtils::GetAppConfigDir() / "settings.json").string();
}

json ConfigLoader::ToJson(const AppConfig& config) {
    json j;
    j["provider"] = ProviderId(config.provider);

    OpenAIProviderConfig openai;
    ClaudeProviderConfig claude;
    LocalProviderConfig local;
    if (const auto* p = std::get_if<OpenAIProviderConfig>(&config.provider)) openai = *p;
    if (const auto* p = std::get_if<ClaudeProviderConfig>(&config.provider)) claude = *p;
    if (const auto* p = std::get_if<LocalProviderConfig>(&config.provider)) local = *p;

    j["openai"] = {{"model", openai.model}};
    if (openai.baseUrl) j["openai"]["baseUrl"] = *openai.baseUrl;
    j["claude"] = {{"model", claude.model}};
    j["local"] = {{"endpoint", local.endpoint}, {"model", local.model}};
    j["performance"] = {
        {"enableCache", config.cache.enabled},
        {"cacheTTL", config.cache.ttlMs},
        {"cacheMaxSize", config.cache.maxBytes}
    };
    j["rateLimit"] = {
        {"maxTokens", config.rateLimit.maxTokens},
        {"refillRate", config.rateLimit.refillRate},
        {"maxWaitMs", config.rateLimit.maxWaitMs}
    };
    j["retry"] = {
        {"maxAttempts", config.retry.maxAttempts},
        {"backoffBaseMs", config.retry.backoffBaseMs},
        {"timeoutSeconds", config.retry.timeoutSeconds}
    };
    j["apply"] = {{"settleDelayMs", config.apply.settleDelayMs}};
    return j;
}

} // namespace draftlens::infrastructure
