#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include "infrastructure/ResponseCache.hpp"

using namespace draftlens::infrastructure;
using json = nlohmann::json;

int main() {
    std::cout << "[Test] Starting ResponseCache Test..." << std::endl;

    std::string key = ResponseCache::MakeKey("text-review", "内容", "gpt-4|markdown");
    assert(key.size() == 64);
    assert(key == ResponseCache::MakeKey("text-review", "内容", "gpt-4|markdown"));
    assert(key != ResponseCache::MakeKey("diff-analysis", "内容", "gpt-4|markdown"));
    assert(key != ResponseCache::MakeKey("text-review", "内容", "gpt-4|latex"));
    std::cout << "[PASS] make key" << std::endl;

    ResponseCache cache;
    assert(!cache.get(key));
    assert(cache.misses() == 1);
    cache.put(key, json{{"content", "{}"}});
    auto hit = cache.get(key);
    assert(hit && (*hit)["content"] == "{}");
    assert(cache.hits() == 1);
    assert(cache.size() == 1);
    assert(cache.currentBytes() > 0);
    cache.clear();
    assert(cache.size() == 0 && cache.currentBytes() == 0);
    std::cout << "[PASS] get and put" << std::endl;

    CacheConfig shortLived;
    shortLived.ttlMs = 20;
    ResponseCache expiring(shortLived);
    expiring.put("k", json{{"content", "x"}});
    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    assert(!expiring.get("k"));
    assert(expiring.size() == 0);
    std::cout << "[PASS] ttl expiry" << std::endl;

    json value = {{"content", "aaaaaaaaaa"}};
    const std::size_t entryBytes = value.dump().size() + 2;
    CacheConfig small;
    small.maxBytes = entryBytes * 2;
    ResponseCache lru(small);
    lru.put("k1", value);
    lru.put("k2", value);
    assert(lru.get("k1"));
    lru.put("k3", value);
    assert(lru.size() == 2);
    assert(!lru.get("k2") && "Least recently used entry is evicted.");
    assert(lru.get("k1"));
    assert(lru.get("k3"));
    assert(lru.currentBytes() <= small.maxBytes);

    lru.put("huge", json{{"content", std::string(entryBytes * 4, 'x')}});
    assert(!lru.get("huge"));
    assert(lru.size() == 2);
    std::cout << "[PASS] lru eviction and size limit" << std::endl;

    CacheConfig off;
    off.enabled = false;
    ResponseCache disabled(off);
    disabled.put(key, value);
    assert(!disabled.get(key));
    assert(disabled.size() == 0);
    assert(!disabled.enabled());
    std::cout << "[PASS] disabled cache" << std::endl;

    std::cout << "[Test] ResponseCache Test completed." << std::endl;
    return 0;
}
