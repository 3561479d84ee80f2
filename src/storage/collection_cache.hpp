#pragma once

#include <cstddef>
#include <cstdint>
#include <list>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace shardb {

// Bounded, thread-safe value cache sitting in front of a collection's shards.
//
// Concurrency model:
//   - get() / size() acquire a shared (read) lock.
//   - put() / erase() / clear() acquire an exclusive (write) lock.
//
// When full, the oldest inserted key is evicted first.
//
// Fill protocol for readers backed by the shards: take generation() before
// reading the shard, then offer the value with fill().  Every erase() or
// clear() advances the generation, so a value read before a concurrent
// write is never cached after that write's invalidation.
class CollectionCache {
public:
    static constexpr std::size_t kDefaultCapacity = 4096;

    explicit CollectionCache(std::size_t capacity = kDefaultCapacity);

    // Not copyable – copies of a live cache would silently race.
    CollectionCache(const CollectionCache&)            = delete;
    CollectionCache& operator=(const CollectionCache&) = delete;

    // Returns the cached value for `key`, or std::nullopt on a miss.
    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;

    // Inserts or overwrites `key`.  A zero-capacity cache stores nothing.
    void put(std::string key, std::string value);

    // Inserts `key` only if no erase() or clear() happened since
    // `generation` was taken.  Returns true if the value was stored.
    bool fill(std::string key, std::string value, uint64_t generation);

    // Removes `key` and advances the generation. Returns true if the key
    // was cached.
    bool erase(std::string_view key);

    [[nodiscard]] uint64_t generation() const;

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t capacity() const { return capacity_; }

    void clear();

private:
    void insert_locked(std::string key, std::string value);

    const std::size_t capacity_;
    mutable std::shared_mutex mutex_;
    struct Entry {
        std::string value;
        std::list<std::string>::iterator position;
    };

    std::unordered_map<std::string, Entry> map_;
    std::list<std::string> order_;  // insertion order, oldest first
    uint64_t generation_ = 0;
};

} // namespace shardb
