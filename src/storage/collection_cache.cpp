#include "storage/collection_cache.hpp"

#include <mutex>
#include <shared_mutex>

namespace shardb {

CollectionCache::CollectionCache(std::size_t capacity)
    : capacity_{capacity}
{}

std::optional<std::string> CollectionCache::get(std::string_view key) const {
    std::shared_lock lock(mutex_);
    auto it = map_.find(std::string(key));
    if (it == map_.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

void CollectionCache::put(std::string key, std::string value) {
    if (capacity_ == 0) {
        return;
    }

    std::unique_lock lock(mutex_);
    insert_locked(std::move(key), std::move(value));
}

bool CollectionCache::fill(std::string key, std::string value, uint64_t generation) {
    if (capacity_ == 0) {
        return false;
    }

    std::unique_lock lock(mutex_);
    if (generation != generation_) {
        return false;
    }
    insert_locked(std::move(key), std::move(value));
    return true;
}

void CollectionCache::insert_locked(std::string key, std::string value) {
    if (auto it = map_.find(key); it != map_.end()) {
        it->second.value = std::move(value);
        return;
    }

    while (map_.size() >= capacity_ && !order_.empty()) {
        map_.erase(order_.front());
        order_.pop_front();
    }
    auto position = order_.insert(order_.end(), key);
    map_.emplace(std::move(key), Entry{std::move(value), position});
}

bool CollectionCache::erase(std::string_view key) {
    std::unique_lock lock(mutex_);
    ++generation_;
    auto it = map_.find(std::string(key));
    if (it == map_.end()) {
        return false;
    }
    order_.erase(it->second.position);
    map_.erase(it);
    return true;
}

std::size_t CollectionCache::size() const {
    std::shared_lock lock(mutex_);
    return map_.size();
}

uint64_t CollectionCache::generation() const {
    std::shared_lock lock(mutex_);
    return generation_;
}

void CollectionCache::clear() {
    std::unique_lock lock(mutex_);
    ++generation_;
    map_.clear();
    order_.clear();
}

} // namespace shardb
