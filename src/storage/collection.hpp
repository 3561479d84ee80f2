#pragma once

#include "storage/collection_cache.hpp"
#include "storage/concurrent_map.hpp"
#include "storage/type_registry.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <json/value.h>

namespace shardb {

// ── CollectionDescriptor ─────────────────────────────────────────────────────
//
// Collection-level metadata persisted as <name>.json.gzip:
//   {"name": ..., "objects": ..., "path": ..., "shard_count": ...}
// `path` is the collection directory relative to the database root.

struct CollectionDescriptor {
    std::string name;
    std::string path;
    uint64_t    objects     = 0;
    uint32_t    shard_count = kShardCount;

    [[nodiscard]] Json::Value to_json() const;

    // Errc::corrupted_collection if a field is missing or has the wrong type.
    [[nodiscard]] static std::error_code from_json(const Json::Value& json,
                                                   CollectionDescriptor& out);
};

// ── Collection ───────────────────────────────────────────────────────────────
//
// A named dataset: one ConcurrentMap holding the elements and a
// CollectionCache in front of it.  The name never changes after construction.
//
// Thread-safety: element operations are safe from any thread (locking is per
// shard and inside the cache).  sync() and optimize() may run concurrently
// with element operations; each shard is locked for its own step.

class Collection {
public:
    // `map` and `cache` must be non-null.  Throws std::invalid_argument.
    Collection(std::string name,
               std::string path,
               std::unique_ptr<ConcurrentMap> map,
               std::unique_ptr<CollectionCache> cache);

    // Attach a reattached map and a fresh cache to a decoded descriptor.
    Collection(const CollectionDescriptor& descriptor,
               std::unique_ptr<ConcurrentMap> map,
               std::unique_ptr<CollectionCache> cache);

    Collection(const Collection&)            = delete;
    Collection& operator=(const Collection&) = delete;

    // "<name>.json.gzip"
    [[nodiscard]] static std::string descriptor_filename(const std::string& name);

    // Decompress and decode a descriptor file.
    [[nodiscard]] static std::error_code load_descriptor(const std::filesystem::path& file,
                                                         CollectionDescriptor& out);

    [[nodiscard]] std::error_code save_descriptor() const;
    [[nodiscard]] CollectionDescriptor descriptor() const;

    // ── Elements ─────────────────────────────────────────────────────────────

    // Store raw bytes under `key`, replacing any previous element.
    [[nodiscard]] std::error_code set(std::string_view key, std::string_view value);

    // Store `value` under a freshly allocated identifier; its decimal form is
    // the key.
    [[nodiscard]] std::error_code add(std::string_view value, uint64_t& id);

    // Errc::not_found if absent.
    [[nodiscard]] std::error_code get(std::string_view key, std::string& value) const;

    // Store a registered structure as its flat field index.
    // Errc::unknown_type if value's type is not in `registry`.
    [[nodiscard]] std::error_code put_structure(std::string_view key,
                                                const CustomStructure& value,
                                                const TypeRegistry& registry);

    // Rebuild a structure stored by put_structure().
    [[nodiscard]] std::error_code get_structure(std::string_view key,
                                                const TypeRegistry& registry,
                                                std::unique_ptr<CustomStructure>& out) const;

    // Removes `key`. Returns true if it existed.
    bool del(std::string_view key);

    [[nodiscard]] bool contains(std::string_view key) const;
    [[nodiscard]] std::vector<std::string> keys() const;

    // Live element count across all shards.
    [[nodiscard]] std::size_t size() const;

    // ── Persistence ──────────────────────────────────────────────────────────

    // Shard data + shard metadata + map.index, then the descriptor.
    [[nodiscard]] std::error_code sync();

    // Compact every shard.  Live elements are untouched; `reclaimed` receives
    // the stale bytes removed.
    [[nodiscard]] std::error_code optimize(uint64_t& reclaimed);

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::string& path() const { return path_; }
    [[nodiscard]] const std::filesystem::path& storage_path() const { return map_->base_path(); }

    [[nodiscard]] ConcurrentMap& map() const { return *map_; }
    [[nodiscard]] CollectionCache& cache() const { return *cache_; }

private:
    const std::string name_;
    const std::string path_;
    std::unique_ptr<ConcurrentMap> map_;
    std::unique_ptr<CollectionCache> cache_;
};

} // namespace shardb
