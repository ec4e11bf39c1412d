/**
 * @file ResponseCache.hpp
 * @brief In-memory cache of backend responses.
 */

#pragma once
#include <chrono>
#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "infrastructure/AppConfig.hpp"

namespace draftlens::infrastructure {

/**
 * @class ResponseCache
 * @brief LRU cache bounded by entry age and total payload size.
 */
class ResponseCache {
public:
    explicit ResponseCache(const CacheConfig& config = CacheConfig{});

    /** @brief SHA-256 hex digest of operation, content and serialized context. */
    static std::string MakeKey(const std::string& operation, const std::string& content,
                               const std::string& context = "");

    /** @brief Retrieves a response if present and not expired. Refreshes its recency. */
    std::optional<nlohmann::json> get(const std::string& key);

    /** @brief Stores a response, evicting least recently used entries to stay under maxBytes. */
    void put(const std::string& key, const nlohmann::json& value);

    void clear();

    bool enabled() const { return m_config.enabled; }
    std::size_t size() const;
    std::size_t currentBytes() const;
    std::size_t hits() const;
    std::size_t misses() const;

private:
    struct CacheEntry {
        nlohmann::json data;
        std::size_t bytes = 0;
        std::chrono::steady_clock::time_point storedAt;
        std::list<std::string>::iterator recency;
    };

    void evictLocked(const std::string& key);

    CacheConfig m_config;
    std::unordered_map<std::string, CacheEntry> m_entries;
    std::list<std::string> m_recency; ///< Most recent first.
    std::size_t m_currentBytes = 0;
    std::size_t m_hits = 0;
    std::size_t m_misses = 0;
    mutable std::mutex m_mutex;
};

} // namespace draftlens::infrastructure
