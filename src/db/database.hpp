#pragma once

#include "storage/collection.hpp"
#include "storage/type_registry.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <shared_mutex>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

namespace shardb {

inline constexpr int kDatabaseVersion = 1;

// Version gap at which a header is rejected instead of loaded with a warning.
inline constexpr int kMajorVersionGap = 10;

inline constexpr const char* kCollectionsDirName = "collections";
inline constexpr const char* kHeaderSuffix       = ".shardb";

// ── SyncReport ───────────────────────────────────────────────────────────────
// Outcome of one Database::sync() pass, per collection.

struct SyncReport {
    std::map<std::string, std::error_code> collections;  // empty code = synced
    std::error_code header;

    [[nodiscard]] bool ok() const;
    [[nodiscard]] std::size_t failures() const;
};

// ── Database ─────────────────────────────────────────────────────────────────
//
// Registry of named collections rooted at one directory:
//
//   <root>/<name>.shardb                 header {"name", "version"} as JSON
//   <root>/collections/<collection>/...  one directory per collection
//
// Concurrency model:
//   - get_collection() / collections_count() / total_objects_count() /
//     random_collection() acquire a shared (read) lock.
//   - add_collection() / drop_collection() / the insert step of load()
//     acquire an exclusive (write) lock.
//   - optimize() holds the exclusive lock for its whole duration.
//   - sync() snapshots the registry under the shared lock, releases it, then
//     syncs every collection of the snapshot in parallel.
//
// Call initialize_runtime() once before constructing a Database.

class Database {
public:
    // `seed` == 0 draws the random seed from std::random_device.
    explicit Database(std::string name,
                      std::filesystem::path root = ".",
                      uint64_t seed = 0);

    Database(const Database&)            = delete;
    Database& operator=(const Database&) = delete;

    // ── Discovery & load ─────────────────────────────────────────────────────

    // Find the header file in `dir` (empty = current directory).  With several
    // candidates the lexicographically first wins and a warning is logged.
    // Errc::not_found if there is none.
    [[nodiscard]] static std::error_code locate_header(const std::filesystem::path& dir,
                                                       std::filesystem::path& out);

    // Load the database rooted at `path`: header, version check, then every
    // collection directory.  Fails fast: the first broken collection aborts
    // the whole load and nothing after it is registered.
    //   Errc::not_found               no header
    //   Errc::corrupted_header        header is not {name, version}
    //   Errc::version_incompatible    |disk - running| >= kMajorVersionGap
    //   Errc::missing_collections_dir no <path>/collections
    //   Errc::corrupted_collection    see ConcurrentMap::open()
    [[nodiscard]] std::error_code load(const std::filesystem::path& path);

    // ── Persistence ──────────────────────────────────────────────────────────

    // Sync every collection in parallel, then write the header.  A failing
    // collection is logged and recorded in `report`; it never stops the
    // others.  The returned code is the header write result only.
    [[nodiscard]] std::error_code sync(SyncReport& report);
    [[nodiscard]] std::error_code sync();

    // Compact every collection under the exclusive lock.  The first failure
    // aborts the call and `reclaimed` is reported as 0; compactions already
    // finished for earlier collections stay on disk.
    [[nodiscard]] std::error_code optimize(uint64_t& reclaimed);

    // ── Registry ─────────────────────────────────────────────────────────────

    // Create <root>/collections/<name> with kShardCount empty shards.
    // Errc::already_exists if the name is taken.
    [[nodiscard]] std::error_code add_collection(const std::string& name,
                                                 std::shared_ptr<Collection>& out);

    // nullptr if absent.
    [[nodiscard]] std::shared_ptr<Collection> get_collection(const std::string& name) const;

    // Removes `name` from the registry; its files stay on disk.
    // Returns true if it was registered.
    bool drop_collection(const std::string& name);

    [[nodiscard]] std::size_t collections_count() const;
    [[nodiscard]] uint64_t total_objects_count() const;
    [[nodiscard]] std::vector<std::string> collection_names() const;

    // Uniform pick.  Errc::empty_registry if there are no collections.
    [[nodiscard]] std::error_code random_collection(std::shared_ptr<Collection>& out) const;

    // ── Structure types ──────────────────────────────────────────────────────

    template <typename T>
    void register_type() { types_.register_type<T>(); }

    template <typename T>
    void register_type_name(std::string name) { types_.register_type_name<T>(std::move(name)); }

    [[nodiscard]] const TypeRegistry& types() const { return types_; }

    // ── Accessors ────────────────────────────────────────────────────────────

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] int version() const { return version_; }
    [[nodiscard]] const std::filesystem::path& root() const { return root_; }
    [[nodiscard]] std::filesystem::path header_path() const;

    // "db-<name>"; follows the name adopted from the header by load().
    [[nodiscard]] const std::shared_ptr<spdlog::logger>& logger() const { return logger_; }

private:
    // Collection Reconstruction Protocol for <root>/collections/<dir_name>.
    [[nodiscard]] std::error_code load_collection(const std::string& dir_name,
                                                  std::shared_ptr<Collection>& out) const;

    [[nodiscard]] std::error_code save_header() const;

    std::string name_;
    const int version_ = kDatabaseVersion;
    std::filesystem::path root_;

    mutable std::shared_mutex collections_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Collection>> collections_;

    mutable std::mutex rng_mutex_;
    mutable std::mt19937_64 rng_;

    TypeRegistry types_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace shardb
