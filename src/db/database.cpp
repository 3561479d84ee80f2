#include "db/database.hpp"

#include "common/errors.hpp"
#include "common/logger.hpp"
#include "persistence/package.hpp"

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <iterator>
#include <thread>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <json/value.h>

namespace asio = boost::asio;

namespace shardb {

// ── SyncReport ───────────────────────────────────────────────────────────────

bool SyncReport::ok() const {
    return !header && failures() == 0;
}

std::size_t SyncReport::failures() const {
    return static_cast<std::size_t>(std::count_if(
        collections.begin(), collections.end(),
        [](const auto& entry) { return static_cast<bool>(entry.second); }));
}

// ── Database ─────────────────────────────────────────────────────────────────

Database::Database(std::string name, std::filesystem::path root, uint64_t seed)
    : name_{std::move(name)}
    , root_{std::move(root)}
    , rng_{seed != 0 ? seed : std::random_device{}()}
    , logger_{make_database_logger(name_, spdlog::default_logger()->level())}
{}

std::filesystem::path Database::header_path() const {
    return root_ / (name_ + kHeaderSuffix);
}

// ── Discovery & load ─────────────────────────────────────────────────────────

std::error_code Database::locate_header(const std::filesystem::path& dir,
                                        std::filesystem::path& out) {
    const std::filesystem::path prefix = dir.empty() ? std::filesystem::path(".") : dir;

    std::vector<std::filesystem::path> candidates;
    std::error_code ec;
    for (std::filesystem::directory_iterator it{prefix, ec}, end; !ec && it != end;
         it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (it->is_regular_file() && name.ends_with(kHeaderSuffix)) {
            candidates.push_back(it->path());
        }
    }
    if (ec) {
        spdlog::error("Cannot scan {} for a database header: {}",
                      prefix.string(), ec.message());
        return ec;
    }

    if (candidates.empty()) {
        return make_error_code(Errc::not_found);
    }

    std::sort(candidates.begin(), candidates.end());
    if (candidates.size() > 1) {
        spdlog::warn("Found {} database headers in {}, using {}",
                     candidates.size(), prefix.string(),
                     candidates.front().filename().string());
    }

    out = candidates.front();
    return {};
}

std::error_code Database::load(const std::filesystem::path& path) {
    const std::filesystem::path root =
        path.empty() ? std::filesystem::path(".") : path.lexically_normal();

    // Locate the header and compare the version of the database.
    std::filesystem::path header_file;
    if (auto ec = locate_header(root, header_file)) {
        logger_->error("Failed to locate the header in {}: {}", root.string(), ec.message());
        return ec;
    }

    Json::Value header;
    if (auto ec = persistence::load_json(header_file, header, /*compressed=*/false)) {
        logger_->error("Failed to load the header {}: {}", header_file.string(), ec.message());
        return make_error_code(Errc::corrupted_header);
    }
    if (!header.isObject() || !header["name"].isString() || !header["version"].isInt()) {
        logger_->error("Header {} is not a database header", header_file.string());
        return make_error_code(Errc::corrupted_header);
    }

    const int disk_version = header["version"].asInt();
    const int gap = std::abs(version_ - disk_version);
    if (gap != 0) {
        if (gap >= kMajorVersionGap) {
            logger_->error("Database version {} is incompatible with running version {}",
                           disk_version, version_);
            return make_error_code(Errc::version_incompatible);
        }
        logger_->warn("Loading a dataset with a different version {} (current {})",
                      disk_version, version_);
    }

    const auto collections_dir = root / kCollectionsDirName;
    std::error_code ec;
    if (!std::filesystem::is_directory(collections_dir, ec)) {
        logger_->error("Collections folder {} does not exist", collections_dir.string());
        return make_error_code(Errc::missing_collections_dir);
    }

    if (header["name"].asString() != name_) {
        name_   = header["name"].asString();
        logger_ = make_database_logger(name_, logger_->level());
    }
    root_ = root;

    std::vector<std::string> dir_names;
    for (std::filesystem::directory_iterator it{collections_dir, ec}, end; !ec && it != end;
         it.increment(ec)) {
        if (it->is_directory()) {
            dir_names.push_back(it->path().filename().string());
        }
    }
    if (ec) {
        logger_->error("Cannot list {}: {}", collections_dir.string(), ec.message());
        return ec;
    }
    std::sort(dir_names.begin(), dir_names.end());

    for (const auto& dir_name : dir_names) {
        std::shared_ptr<Collection> collection;
        if (auto load_ec = load_collection(dir_name, collection)) {
            logger_->error("Collection {} failed to load: {}", dir_name, load_ec.message());
            return load_ec;
        }

        std::unique_lock lock(collections_mutex_);
        if (collections_.contains(dir_name)) {
            logger_->warn("Collection {} replaced by the loaded copy", dir_name);
        }
        collections_.insert_or_assign(dir_name, std::move(collection));
    }

    logger_->info("Database {} loaded from {}: {} collections",
                  name_, root_.string(), dir_names.size());
    return {};
}

std::error_code Database::load_collection(const std::string& dir_name,
                                          std::shared_ptr<Collection>& out) const {
    const std::string relative =
        (std::filesystem::path(kCollectionsDirName) / dir_name).string();

    // Steps 1 and 2: shards with their metadata, then map.index.
    std::unique_ptr<ConcurrentMap> map;
    if (auto ec = ConcurrentMap::open(root_, relative, map)) {
        return ec;
    }

    // Step 3: the collection descriptor.
    CollectionDescriptor descriptor;
    const auto descriptor_file =
        map->base_path() / Collection::descriptor_filename(dir_name);
    if (auto ec = Collection::load_descriptor(descriptor_file, descriptor)) {
        return ec;
    }
    if (descriptor.name != dir_name || descriptor.shard_count != kShardCount) {
        logger_->error("Descriptor {} describes '{}' with {} shards",
                       descriptor_file.string(), descriptor.name, descriptor.shard_count);
        return make_error_code(Errc::corrupted_collection);
    }
    if (descriptor.objects != map->size()) {
        logger_->warn("Collection {}: descriptor lists {} objects, shards hold {}",
                      dir_name, descriptor.objects, map->size());
    }

    // Step 4: only now wire the map and a fresh cache into the collection.
    out = std::make_shared<Collection>(descriptor, std::move(map),
                                       std::make_unique<CollectionCache>());
    logger_->debug("Collection {} reconstructed: {} elements, counter {}",
                   dir_name, out->size(), out->map().counter());
    return {};
}

// ── Persistence ──────────────────────────────────────────────────────────────

std::error_code Database::sync() {
    SyncReport report;
    return sync(report);
}

std::error_code Database::sync(SyncReport& report) {
    report = {};

    std::vector<std::shared_ptr<Collection>> snapshot;
    {
        std::shared_lock lock(collections_mutex_);
        snapshot.reserve(collections_.size());
        for (const auto& [_, c] : collections_) {
            snapshot.push_back(c);
        }
    }

    if (!snapshot.empty()) {
        const std::size_t nthreads = std::min<std::size_t>(
            snapshot.size(), std::max(1u, std::thread::hardware_concurrency()));
        asio::thread_pool pool(nthreads);
        std::mutex report_mutex;

        for (const auto& c : snapshot) {
            asio::post(pool, [this, c, &report, &report_mutex] {
                logger_->info("Synchronizing {}", c->name());
                std::error_code ec;
                try {
                    ec = c->sync();
                } catch (const std::exception& e) {
                    logger_->error("Collection {} synchronization threw: {}",
                                   c->name(), e.what());
                    ec = std::make_error_code(std::errc::io_error);
                }
                if (ec) {
                    logger_->warn("Collection {} synchronization failed: {}",
                                  c->name(), ec.message());
                }
                std::lock_guard guard(report_mutex);
                report.collections.insert_or_assign(c->name(), ec);
            });
        }

        pool.join();
    }

    report.header = save_header();
    if (report.failures() > 0) {
        logger_->warn("Sync finished with {} of {} collections failed",
                      report.failures(), snapshot.size());
    }
    return report.header;
}

std::error_code Database::save_header() const {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        logger_->error("Failed to create database root {}: {}", root_.string(), ec.message());
        return ec;
    }

    Json::Value header(Json::objectValue);
    header["name"]    = name_;
    header["version"] = version_;
    ec = persistence::save_json(header_path(), header, /*compressed=*/false);
    if (ec) {
        logger_->error("Failed to write header {}: {}", header_path().string(), ec.message());
    }
    return ec;
}

std::error_code Database::optimize(uint64_t& reclaimed) {
    reclaimed = 0;
    std::unique_lock lock(collections_mutex_);

    std::vector<std::string> names;
    names.reserve(collections_.size());
    for (const auto& [n, _] : collections_) {
        names.push_back(n);
    }
    std::sort(names.begin(), names.end());

    uint64_t total = 0;
    for (const auto& n : names) {
        uint64_t collection_reclaimed = 0;
        if (auto ec = collections_.at(n)->optimize(collection_reclaimed)) {
            logger_->error("Optimize aborted at collection {}: {}", n, ec.message());
            return ec;
        }
        total += collection_reclaimed;
    }

    reclaimed = total;
    logger_->info("Optimize reclaimed {} bytes over {} collections", total, names.size());
    return {};
}

// ── Registry ─────────────────────────────────────────────────────────────────

std::error_code Database::add_collection(const std::string& name,
                                         std::shared_ptr<Collection>& out) {
    if (name.empty() || name.find('/') != std::string::npos ||
        name == "." || name == "..") {
        return std::make_error_code(std::errc::invalid_argument);
    }

    std::unique_lock lock(collections_mutex_);
    if (collections_.contains(name)) {
        return make_error_code(Errc::already_exists);
    }

    const std::string relative =
        (std::filesystem::path(kCollectionsDirName) / name).string();

    std::unique_ptr<ConcurrentMap> map;
    if (auto ec = ConcurrentMap::create(root_, relative, map)) {
        logger_->error("Failed to create collection {}: {}", name, ec.message());
        return ec;
    }

    auto collection = std::make_shared<Collection>(
        name, relative, std::move(map), std::make_unique<CollectionCache>());
    collections_.emplace(name, collection);
    out = std::move(collection);

    logger_->info("Collection {} created", name);
    return {};
}

std::shared_ptr<Collection> Database::get_collection(const std::string& name) const {
    std::shared_lock lock(collections_mutex_);
    auto it = collections_.find(name);
    if (it == collections_.end()) {
        return nullptr;
    }
    return it->second;
}

bool Database::drop_collection(const std::string& name) {
    std::unique_lock lock(collections_mutex_);
    return collections_.erase(name) > 0;
}

std::size_t Database::collections_count() const {
    std::shared_lock lock(collections_mutex_);
    return collections_.size();
}

uint64_t Database::total_objects_count() const {
    std::shared_lock lock(collections_mutex_);
    uint64_t total = 0;
    for (const auto& [_, c] : collections_) {
        total += c->size();
    }
    return total;
}

std::vector<std::string> Database::collection_names() const {
    std::vector<std::string> names;
    {
        std::shared_lock lock(collections_mutex_);
        names.reserve(collections_.size());
        for (const auto& [n, _] : collections_) {
            names.push_back(n);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::error_code Database::random_collection(std::shared_ptr<Collection>& out) const {
    std::shared_lock lock(collections_mutex_);
    if (collections_.empty()) {
        return make_error_code(Errc::empty_registry);
    }

    std::size_t n = 0;
    {
        std::lock_guard guard(rng_mutex_);
        std::uniform_int_distribution<std::size_t> dist(0, collections_.size() - 1);
        n = dist(rng_);
    }
    out = std::next(collections_.begin(), static_cast<std::ptrdiff_t>(n))->second;
    return {};
}

} // namespace shardb
