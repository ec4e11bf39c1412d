/**
 * @file RateLimiter.hpp
 * @brief Token-bucket admission control for outbound backend calls.
 */

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace draftlens::infrastructure {

/**
 * @class RateLimitTimeout
 * @brief Thrown by RateLimiter::consume when the wait budget runs out.
 */
class RateLimitTimeout : public std::runtime_error {
public:
    explicit RateLimitTimeout(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @class RateLimiter
 * @brief Token bucket with lazy refill. No background timer.
 */
class RateLimiter {
public:
    /**
     * @param maxTokens Bucket capacity. Must be > 0.
     * @param refillRate Tokens per second. Must be > 0.
     * @param pollInterval Sleep between attempts inside consume().
     * @throws std::invalid_argument on non-positive capacity or rate.
     */
    RateLimiter(double maxTokens, double refillRate,
                std::chrono::milliseconds pollInterval = std::chrono::milliseconds(100));

    /** @brief Takes @p tokens if available right now. */
    bool tryConsume(double tokens = 1.0);

    /**
     * @brief Blocks until @p tokens can be taken or @p maxWaitMs elapses.
     * @throws RateLimitTimeout when the budget is exhausted.
     */
    void consume(double tokens = 1.0, long long maxWaitMs = 30000);

    /** @brief Whole tokens currently available. */
    int availableTokens();

    /** @brief Milliseconds until at least one token is available, 0 if one already is. */
    long long timeUntilNextToken();

    /** @brief Refills the bucket to capacity. */
    void reset();

    double maxTokens() const { return m_maxTokens; }
    double refillRate() const { return m_refillRate; }

private:
    void refill();

    double m_maxTokens;
    double m_refillRate;
    std::chrono::milliseconds m_pollInterval;
    double m_tokens;
    std::chrono::steady_clock::time_point m_lastRefill;
    std::mutex m_mutex;
};

/**
 * @class RateLimiterRegistry
 * @brief Owns one RateLimiter per backend identity.
 *
 * Passed explicitly to the resolver and adapters; tests build their own instance.
 */
class RateLimiterRegistry {
public:
    RateLimiterRegistry(double defaultMaxTokens = 10.0, double defaultRefillRate = 1.0,
                        std::chrono::milliseconds pollInterval = std::chrono::milliseconds(100));

    /** @brief Returns the limiter for @p key, creating it with the default tuning on first use. */
    std::shared_ptr<RateLimiter> getOrCreate(const std::string& key);

    /** @brief Returns the limiter for @p key, creating it with the given tuning on first use. */
    std::shared_ptr<RateLimiter> getOrCreate(const std::string& key, double maxTokens, double refillRate);

    /** @brief Refills every limiter. */
    void resetAll();

    /** @brief Drops every limiter; the next getOrCreate starts fresh. */
    void clearAll();

    std::size_t size() const;

private:
    double m_defaultMaxTokens;
    double m_defaultRefillRate;
    std::chrono::milliseconds m_pollInterval;
    std::map<std::string, std::shared_ptr<RateLimiter>> m_limiters;
    mutable std::mutex m_mutex;
};

} // namespace draftlens::infrastructure
