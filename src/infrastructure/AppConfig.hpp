/**
 * @file AppConfig.hpp
 * @brief Typed view of settings.json.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>

namespace draftlens::infrastructure {

struct OpenAIProviderConfig {
    std::string model = "gpt-4";
    std::optional<std::string> baseUrl; ///< OpenAI-compatible endpoint override.
};

struct ClaudeProviderConfig {
    std::string model = "claude-3-sonnet";
};

struct LocalProviderConfig {
    std::string endpoint = "http://localhost:11434";
    std::string model = "llama2";
};

/** @brief Closed set of provider families. */
using ProviderConfig = std::variant<OpenAIProviderConfig, ClaudeProviderConfig, LocalProviderConfig>;

inline std::string ProviderId(const ProviderConfig& provider) {
    if (std::holds_alternative<OpenAIProviderConfig>(provider)) return "openai";
    if (std::holds_alternative<ClaudeProviderConfig>(provider)) return "claude";
    return "local";
}

struct CacheConfig {
    bool enabled = true;
    long long ttlMs = 3600000;
    std::size_t maxBytes = 100 * 1024 * 1024;
};

struct RateLimitConfig {
    double maxTokens = 10.0;
    double refillRate = 1.0;  ///< tokens per second
    long long maxWaitMs = 30000;
};

struct RetryConfig {
    int maxAttempts = 3;
    long long backoffBaseMs = 1000;
    int timeoutSeconds = 60;
};

struct ApplyConfig {
    long long settleDelayMs = 50;
};

struct AppConfig {
    ProviderConfig provider = OpenAIProviderConfig{};
    CacheConfig cache;
    RateLimitConfig rateLimit;
    RetryConfig retry;
    ApplyConfig apply;
};

} // namespace draftlens::infrastructure
