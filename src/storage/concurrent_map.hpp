#pragma once

#include "storage/shard.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace shardb {

// Number of shards per collection.  Part of the on-disk format.
inline constexpr std::size_t kShardCount = 16;

// ── ConcurrentMap ────────────────────────────────────────────────────────────
//
// A collection's key space split over kShardCount independently locked,
// independently persisted shards.
//
// On disk (inside the collection directory):
//   shard_<i>.gobs            data file, one per shard ordinal
//   shard_<i>_meta.gob.gzip   encoded + compressed ShardMeta
//   map.index                 line 1: counter (decimal u64)
//                             line 2: sync destination, relative to the root
//
// Routing is 32-bit FNV-1a of the key modulo kShardCount, so a key lands in
// the same shard in every process.  Element operations lock only the owning
// shard; there is no map-wide lock.

class ConcurrentMap {
public:
    static constexpr const char* kIndexFilename = "map.index";

    // `shards` must hold exactly kShardCount shards, shard i at index i.
    // Throws std::invalid_argument otherwise.
    //   base_path        – collection directory holding the shard files
    //   root             – database root the sync destination is relative to
    //   sync_destination – relative directory used to stage compacted data
    ConcurrentMap(std::filesystem::path base_path,
                  std::filesystem::path root,
                  std::string sync_destination,
                  std::vector<std::unique_ptr<Shard>> shards);

    // Not copyable or movable – shards are referenced by address.
    ConcurrentMap(const ConcurrentMap&)            = delete;
    ConcurrentMap& operator=(const ConcurrentMap&) = delete;

    // Create kShardCount fresh, empty shard data files under
    // `root / relative_dir`.  The sync destination starts as `relative_dir`.
    [[nodiscard]] static std::error_code create(const std::filesystem::path& root,
                                                const std::string& relative_dir,
                                                std::unique_ptr<ConcurrentMap>& out);

    // Reattach the map under `root / relative_dir`: every shard_<i>.gobs with
    // its metadata, then map.index.  Fewer than kShardCount data files, an id
    // outside [0, kShardCount), a duplicate id, a missing or malformed index,
    // or any shard open/decode failure returns Errc::corrupted_collection.
    // An index without a second line keeps `relative_dir` as destination.
    [[nodiscard]] static std::error_code open(const std::filesystem::path& root,
                                              const std::string& relative_dir,
                                              std::unique_ptr<ConcurrentMap>& out);

    // ── Routing ──────────────────────────────────────────────────────────────

    [[nodiscard]] static std::size_t shard_index(std::string_view key);

    [[nodiscard]] Shard& shard_for(std::string_view key) const;
    [[nodiscard]] Shard& shard(std::size_t index) const;

    // ── Elements ─────────────────────────────────────────────────────────────

    [[nodiscard]] std::error_code put(const pb::Element& element);
    [[nodiscard]] std::error_code get(std::string_view key, pb::Element& out) const;
    bool erase(std::string_view key);
    [[nodiscard]] bool contains(std::string_view key) const;

    // Total live keys across all shards.
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::vector<std::string> keys() const;

    // ── Identifier allocation ────────────────────────────────────────────────

    // Returns the next identifier (previous counter + 1).
    [[nodiscard]] uint64_t next_id();
    [[nodiscard]] uint64_t counter() const;
    void set_counter_index(uint64_t value);

    // ── Persistence ──────────────────────────────────────────────────────────

    // Sync every shard (data + metadata), then rewrite map.index.
    // Stops at the first failure.
    [[nodiscard]] std::error_code sync();

    // Compact every shard through the sync destination.
    // `reclaimed` receives the total stale bytes removed.
    [[nodiscard]] std::error_code optimize(uint64_t& reclaimed);

    [[nodiscard]] const std::filesystem::path& base_path() const { return base_path_; }
    [[nodiscard]] const std::string& sync_destination() const { return sync_destination_; }
    [[nodiscard]] std::filesystem::path sync_destination_path() const;

private:
    [[nodiscard]] std::error_code save_index() const;

    std::filesystem::path base_path_;
    std::filesystem::path root_;
    std::string sync_destination_;
    std::vector<std::unique_ptr<Shard>> shards_;
    std::atomic<uint64_t> counter_{0};
};

} // namespace shardb
