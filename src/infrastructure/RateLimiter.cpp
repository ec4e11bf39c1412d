/**
 * @file RateLimiter.cpp
 * @brief Implementation of RateLimiter and RateLimiterRegistry.
 */

#include "infrastructure/RateLimiter.hpp"
#include <algorithm>
#include <cmath>
#include <thread>

namespace draftlens::infrastructure {

RateLimiter::RateLimiter(double maxTokens, double refillRate, std::chrono::milliseconds pollInterval)
    : m_maxTokens(maxTokens),
      m_refillRate(refillRate),
      m_pollInterval(pollInterval),
      m_tokens(maxTokens),
      m_lastRefill(std::chrono::steady_clock::now()) {
    if (maxTokens <= 0) {
        throw std::invalid_argument("maxTokens must be greater than 0");
    }
    if (refillRate <= 0) {
        throw std::invalid_argument("refillRate must be greater than 0");
    }
    if (m_pollInterval.count() <= 0) {
        m_pollInterval = std::chrono::milliseconds(1);
    }
}

void RateLimiter::refill() {
    auto now = std::chrono::steady_clock::now();
    std::chrono::duration<double> elapsed = now - m_lastRefill;
    m_tokens = std::min(m_maxTokens, m_tokens + elapsed.count() * m_refillRate);
    m_lastRefill = now;
}

bool RateLimiter::tryConsume(double tokens) {
    std::lock_guard<std::mutex> lock(m_mutex);
    refill();
    if (m_tokens >= tokens) {
        m_tokens -= tokens;
        return true;
    }
    return false;
}

void RateLimiter::consume(double tokens, long long maxWaitMs) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(maxWaitMs);
    while (true) {
        if (tryConsume(tokens)) {
            return;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            throw RateLimitTimeout("Rate limit wait exceeded " + std::to_string(maxWaitMs) + "ms");
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(m_pollInterval, remaining + std::chrono::milliseconds(1)));
    }
}

int RateLimiter::availableTokens() {
    std::lock_guard<std::mutex> lock(m_mutex);
    refill();
    return static_cast<int>(std::floor(m_tokens));
}

long long RateLimiter::timeUntilNextToken() {
    std::lock_guard<std::mutex> lock(m_mutex);
    refill();
    if (m_tokens >= 1.0) {
        return 0;
    }
    double missing = 1.0 - m_tokens;
    return static_cast<long long>(std::ceil(missing / m_refillRate * 1000.0));
}

void RateLimiter::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_tokens = m_maxTokens;
    m_lastRefill = std::chrono::steady_clock::now();
}

RateLimiterRegistry::RateLimiterRegistry(double defaultMaxTokens, double defaultRefillRate,
                                         std::chrono::milliseconds pollInterval)
    : m_defaultMaxTokens(defaultMaxTokens),
      m_defaultRefillRate(defaultRefillRate),
      m_pollInterval(pollInterval) {}

std::shared_ptr<RateLimiter> RateLimiterRegistry::getOrCreate(const std::string& key) {
    return getOrCreate(key, m_defaultMaxTokens, m_defaultRefillRate);
}

std::shared_ptr<RateLimiter> RateLimiterRegistry::getOrCreate(const std::string& key, double maxTokens,
                                                              double refillRate) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_limiters.find(key);
    if (it != m_limiters.end()) {
        return it->second;
    }
    auto limiter = std::make_shared<RateLimiter>(maxTokens, refillRate, m_pollInterval);
    m_limiters[key] = limiter;
    return limiter;
}

void RateLimiterRegistry::resetAll() {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& [key, limiter] : m_limiters) {
        limiter->reset();
    }
}

void RateLimiterRegistry::clearAll() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_limiters.clear();
}

std::size_t RateLimiterRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_limiters.size();
}

} // namespace draftlens::infrastructure
