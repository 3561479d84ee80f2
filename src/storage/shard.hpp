#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <vector>

#include "shardb.pb.h"

namespace shardb {

// ── ShardOffset ──────────────────────────────────────────────────────────────
// Where one record lives inside a shard data file.

struct ShardOffset {
    uint64_t position = 0;
    uint64_t length   = 0;

    bool operator==(const ShardOffset&) const = default;
};

// ── ShardMeta ────────────────────────────────────────────────────────────────
//
// The persisted half of a shard: id plus offset index.  Holds no file handle,
// so it can be encoded and decoded freely.  Written to
// shard_<id>_meta.gob.gzip as a protobuf ShardMeta with entries sorted by key.

struct ShardMeta {
    uint32_t id = 0;
    std::unordered_map<std::string, ShardOffset> offsets;

    [[nodiscard]] pb::ShardMeta to_proto() const;
    [[nodiscard]] static ShardMeta from_proto(const pb::ShardMeta& proto);
};

// ── Shard ────────────────────────────────────────────────────────────────────
//
// One partition of a collection: the runtime pairing of a ShardMeta with the
// open data file it describes.
//
// Data file format (append-only):
//
//   [crc32: u32 LE][payload: protobuf Element]   × N
//
// A ShardOffset covers a whole record (crc + payload).  Overwriting or
// erasing a key leaves its old record behind as stale bytes until compact().
//
// Concurrency model:
//   - get() / contains() / size() / keys() acquire a shared (read) lock.
//   - put() / erase() / sync() / compact() acquire an exclusive (write) lock.
//   Different shards never contend with each other.

class Shard {
public:
    // Takes ownership of `fd`; `end` is the current data file size.
    Shard(std::filesystem::path dir, ShardMeta meta, int fd, uint64_t end);
    ~Shard();

    // Not copyable or movable – owns a file descriptor and a mutex.
    Shard(const Shard&)            = delete;
    Shard& operator=(const Shard&) = delete;
    Shard(Shard&&)                 = delete;
    Shard& operator=(Shard&&)      = delete;

    // Create a fresh, empty shard_<id>.gobs in `dir` (truncating any old one).
    [[nodiscard]] static std::error_code create(const std::filesystem::path& dir,
                                                uint32_t id,
                                                std::unique_ptr<Shard>& out);

    // Reopen an existing shard: open `data_path` read-write, decode its
    // companion metadata package and check every offset lies inside the file.
    // Any failure returns Errc::corrupted_collection (the cause is logged).
    [[nodiscard]] static std::error_code open(const std::filesystem::path& data_path,
                                              std::unique_ptr<Shard>& out);

    // "shard_<id>.gobs" / "shard_<id>_meta.gob.gzip"
    [[nodiscard]] static std::string data_filename(uint32_t id);
    [[nodiscard]] static std::string meta_filename(uint32_t id);

    // Append `element` as a new record and point element.key() at it.
    [[nodiscard]] std::error_code put(const pb::Element& element);

    // Read and verify the record for `key`.  Errc::not_found if absent,
    // Errc::corrupted_element if the checksum or payload is bad.
    [[nodiscard]] std::error_code get(std::string_view key, pb::Element& out) const;

    // Removes `key` from the index.  Returns true if the key existed.
    bool erase(std::string_view key);

    [[nodiscard]] bool contains(std::string_view key) const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::vector<std::string> keys() const;

    // Bytes in the data file / bytes still referenced by the index.
    [[nodiscard]] uint64_t file_bytes() const;
    [[nodiscard]] uint64_t live_bytes() const;

    // fdatasync the data file, then rewrite the metadata package.
    [[nodiscard]] std::error_code sync();

    // Rewrite live records in file order into a staging file under
    // `staging_dir` and stage the new metadata beside the live package.  Then
    // rename the data file and the metadata into place, in that order.  A
    // failure before the data rename leaves the old files and the in-memory
    // index untouched.  `reclaimed` receives the number of bytes dropped.
    [[nodiscard]] std::error_code compact(const std::filesystem::path& staging_dir,
                                          uint64_t& reclaimed);

    [[nodiscard]] uint32_t id() const { return id_; }
    [[nodiscard]] std::filesystem::path data_path() const;
    [[nodiscard]] std::filesystem::path meta_path() const;

    // Copy of the persisted half, taken under the read lock.
    [[nodiscard]] ShardMeta meta() const;

private:
    [[nodiscard]] std::error_code save_meta_locked() const;
    void close_locked();

    mutable std::shared_mutex mutex_;
    const std::filesystem::path dir_;
    const uint32_t id_;
    std::unordered_map<std::string, ShardOffset> offsets_;
    int fd_ = -1;
    uint64_t end_ = 0;
};

} // namespace shardb
