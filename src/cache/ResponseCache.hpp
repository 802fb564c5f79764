#pragma once
#include <string>
#include <optional>
#include <list>
#include <unordered_map>
#include <chrono>
#include <mutex>

namespace Loopnet {
    // Bounded TTL cache of response bodies keyed by request URL.
    // Expiry is enforced lazily in Get(); there is no sweeper thread.
    // When a new key would exceed max_entries, the entry stored earliest is evicted.
    class ResponseCache {
    public:
        using Clock = std::chrono::steady_clock;

        ResponseCache(size_t max_entries, Clock::duration ttl);

        std::optional<std::string> Get(const std::string& key);
        void Set(const std::string& key, const std::string& value);
        void Clear();
        size_t Size() const;

    private:
        struct CacheEntry {
            std::string key;
            std::string value;
            Clock::time_point stored_at;
        };

        size_t max_entries_;
        Clock::duration ttl_;
        // Ordered by stored_at, newest first.
        std::list<CacheEntry> entries_;
        std::unordered_map<std::string, std::list<CacheEntry>::iterator> index_;
        mutable std::mutex cache_mutex_;
    };
}
