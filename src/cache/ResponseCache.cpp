#include "ResponseCache.hpp"

namespace Loopnet {

ResponseCache::ResponseCache(size_t max_entries, Clock::duration ttl)
    : max_entries_(max_entries), ttl_(ttl) {}

std::optional<std::string> ResponseCache::Get(const std::string& key) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) {
        return std::nullopt;
    }

    if (Clock::now() - it->second->stored_at >= ttl_) {
        entries_.erase(it->second);
        index_.erase(it);
        return std::nullopt;
    }

    return it->second->value;
}

void ResponseCache::Set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = index_.find(key);

    if (it != index_.end()) {
        // Overwrite: refresh stored_at, never evict.
        entries_.erase(it->second);
        index_.erase(it);
    } else if (index_.size() >= max_entries_ && !entries_.empty()) {
        index_.erase(entries_.back().key);
        entries_.pop_back();
    }

    entries_.push_front({key, value, Clock::now()});
    index_[key] = entries_.begin();
}

void ResponseCache::Clear() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    index_.clear();
    entries_.clear();
}

size_t ResponseCache::Size() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return index_.size();
}

}
