/**
 * @file ResponseCache.cpp
 * @brief Implementation of ResponseCache.
 */

#include "infrastructure/ResponseCache.hpp"
#include <iomanip>
#include <sstream>
#include <openssl/sha.h>

namespace draftlens::infrastructure {

ResponseCache::ResponseCache(const CacheConfig& config) : m_config(config) {}

std::string ResponseCache::MakeKey(const std::string& operation, const std::string& content,
                                   const std::string& context) {
    std::string material = operation + ":" + content + ":" + context;
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(material.data()), material.size(), digest);

    std::ostringstream oss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return oss.str();
}

std::optional<nlohmann::json> ResponseCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_config.enabled) return std::nullopt;

    auto it = m_entries.find(key);
    if (it == m_entries.end()) {
        ++m_misses;
        return std::nullopt;
    }

    auto age = std::chrono::steady_clock::now() - it->second.storedAt;
    if (age > std::chrono::milliseconds(m_config.ttlMs)) {
        evictLocked(key);
        ++m_misses;
        return std::nullopt;
    }

    m_recency.splice(m_recency.begin(), m_recency, it->second.recency);
    ++m_hits;
    return it->second.data;
}

void ResponseCache::put(const std::string& key, const nlohmann::json& value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_config.enabled) return;

    std::size_t bytes = value.dump().size() + key.size();
    if (bytes > m_config.maxBytes) return;

    if (m_entries.count(key)) {
        evictLocked(key);
    }
    while (!m_recency.empty() && m_currentBytes + bytes > m_config.maxBytes) {
        evictLocked(m_recency.back());
    }

    m_recency.push_front(key);
    CacheEntry entry;
    entry.data = value;
    entry.bytes = bytes;
    entry.storedAt = std::chrono::steady_clock::now();
    entry.recency = m_recency.begin();
    m_entries[key] = std::move(entry);
    m_currentBytes += bytes;
}

void ResponseCache::evictLocked(const std::string& key) {
    auto it = m_entries.find(key);
    if (it == m_entries.end()) return;
    m_currentBytes -= it->second.bytes;
    m_recency.erase(it->second.recency);
    m_entries.erase(it);
}

void ResponseCache::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
    m_recency.clear();
    m_currentBytes = 0;
    m_hits = 0;
    m_misses = 0;
}

std::size_t ResponseCache::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

std::size_t ResponseCache::currentBytes() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_currentBytes;
}

std::size_t ResponseCache::hits() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_hits;
}

std::size_t ResponseCache::misses() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_misses;
}

} // namespace draftlens::infrastructure
