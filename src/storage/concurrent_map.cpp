#include "storage/concurrent_map.hpp"

#include "common/errors.hpp"
#include "persistence/file_io.hpp"

#include <algorithm>
#include <charconv>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace shardb {

namespace {

constexpr uint32_t kFnvOffsetBasis = 2166136261u;
constexpr uint32_t kFnvPrime       = 16777619u;

bool is_shard_data_file(const std::string& name) {
    return name.starts_with("shard_") && name.ends_with(".gobs");
}

// Split map.index into its counter and optional sync destination lines.
[[nodiscard]] std::error_code parse_index(std::string_view text,
                                          uint64_t& counter,
                                          std::string& destination) {
    auto next_line = [&text]() -> std::string_view {
        auto nl = text.find('\n');
        std::string_view line = text.substr(0, nl);
        text = (nl == std::string_view::npos) ? std::string_view{} : text.substr(nl + 1);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        return line;
    };

    const auto counter_line = next_line();
    auto [ptr, ec] = std::from_chars(counter_line.data(),
                                     counter_line.data() + counter_line.size(),
                                     counter);
    if (counter_line.empty() || ec != std::errc{} ||
        ptr != counter_line.data() + counter_line.size()) {
        spdlog::error("map.index: invalid counter '{}'", counter_line);
        return make_error_code(Errc::corrupted_collection);
    }

    const auto destination_line = next_line();
    if (!destination_line.empty()) {
        destination = std::string(destination_line);
    }
    return {};
}

} // anonymous namespace

ConcurrentMap::ConcurrentMap(std::filesystem::path base_path,
                             std::filesystem::path root,
                             std::string sync_destination,
                             std::vector<std::unique_ptr<Shard>> shards)
    : base_path_{std::move(base_path)}
    , root_{std::move(root)}
    , sync_destination_{std::move(sync_destination)}
    , shards_{std::move(shards)}
{
    if (shards_.size() != kShardCount) {
        throw std::invalid_argument(
            "ConcurrentMap requires " + std::to_string(kShardCount) +
            " shards, got " + std::to_string(shards_.size()));
    }
    for (std::size_t i = 0; i < shards_.size(); ++i) {
        if (!shards_[i] || shards_[i]->id() != i) {
            throw std::invalid_argument(
                "ConcurrentMap shard slot " + std::to_string(i) + " is empty or misplaced");
        }
    }
}

// ── Construction ─────────────────────────────────────────────────────────────

std::error_code ConcurrentMap::create(const std::filesystem::path& root,
                                      const std::string& relative_dir,
                                      std::unique_ptr<ConcurrentMap>& out) {
    const auto base_path = root / relative_dir;

    std::error_code ec;
    std::filesystem::create_directories(base_path, ec);
    if (ec) {
        spdlog::error("ConcurrentMap: failed to create {}: {}",
                      base_path.string(), ec.message());
        return ec;
    }

    std::vector<std::unique_ptr<Shard>> shards(kShardCount);
    for (std::size_t i = 0; i < kShardCount; ++i) {
        if (auto shard_ec = Shard::create(base_path, static_cast<uint32_t>(i), shards[i])) {
            return shard_ec;
        }
    }

    out = std::make_unique<ConcurrentMap>(base_path, root, relative_dir,
                                          std::move(shards));
    return {};
}

std::error_code ConcurrentMap::open(const std::filesystem::path& root,
                                    const std::string& relative_dir,
                                    std::unique_ptr<ConcurrentMap>& out) {
    const auto base_path = root / relative_dir;

    // Step 1: shard data files with their metadata.
    std::vector<std::filesystem::path> data_files;
    std::error_code ec;
    for (std::filesystem::directory_iterator it{base_path, ec}, end; !ec && it != end;
         it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (it->is_regular_file() && is_shard_data_file(name)) {
            data_files.push_back(it->path());
        }
    }
    if (ec) {
        spdlog::error("ConcurrentMap: cannot list {}: {}", base_path.string(), ec.message());
        return make_error_code(Errc::corrupted_collection);
    }

    if (data_files.size() < kShardCount) {
        spdlog::error("ConcurrentMap: {} has {} shard files, expected {}",
                      base_path.string(), data_files.size(), kShardCount);
        return make_error_code(Errc::corrupted_collection);
    }
    std::sort(data_files.begin(), data_files.end());

    std::vector<std::unique_ptr<Shard>> shards(kShardCount);
    for (const auto& path : data_files) {
        std::unique_ptr<Shard> shard;
        if (auto shard_ec = Shard::open(path, shard)) {
            return make_error_code(Errc::corrupted_collection);
        }
        const auto id = shard->id();
        if (id >= kShardCount || shards[id]) {
            spdlog::error("ConcurrentMap: {} has invalid or duplicate shard id {}",
                          base_path.string(), id);
            return make_error_code(Errc::corrupted_collection);
        }
        shards[id] = std::move(shard);
    }

    // Step 2: counter + sync destination.
    std::string text;
    if (auto index_ec = persistence::read_file(base_path / kIndexFilename, text)) {
        spdlog::error("ConcurrentMap: {} not loaded: {}",
                      (base_path / kIndexFilename).string(), index_ec.message());
        return make_error_code(Errc::corrupted_collection);
    }
    uint64_t counter = 0;
    std::string destination = relative_dir;
    if (auto parse_ec = parse_index(text, counter, destination)) {
        return parse_ec;
    }

    out = std::make_unique<ConcurrentMap>(base_path, root, std::move(destination),
                                          std::move(shards));
    out->set_counter_index(counter);
    return {};
}

// ── Routing ──────────────────────────────────────────────────────────────────

std::size_t ConcurrentMap::shard_index(std::string_view key) {
    uint32_t hash = kFnvOffsetBasis;
    for (unsigned char c : key) {
        hash ^= c;
        hash *= kFnvPrime;
    }
    return hash % kShardCount;
}

Shard& ConcurrentMap::shard_for(std::string_view key) const {
    return *shards_[shard_index(key)];
}

Shard& ConcurrentMap::shard(std::size_t index) const {
    return *shards_.at(index);
}

// ── Elements ─────────────────────────────────────────────────────────────────

std::error_code ConcurrentMap::put(const pb::Element& element) {
    return shard_for(element.key()).put(element);
}

std::error_code ConcurrentMap::get(std::string_view key, pb::Element& out) const {
    return shard_for(key).get(key, out);
}

bool ConcurrentMap::erase(std::string_view key) {
    return shard_for(key).erase(key);
}

bool ConcurrentMap::contains(std::string_view key) const {
    return shard_for(key).contains(key);
}

std::size_t ConcurrentMap::size() const {
    std::size_t total = 0;
    for (const auto& s : shards_) {
        total += s->size();
    }
    return total;
}

std::vector<std::string> ConcurrentMap::keys() const {
    std::vector<std::string> result;
    for (const auto& s : shards_) {
        auto part = s->keys();
        result.insert(result.end(), std::make_move_iterator(part.begin()),
                      std::make_move_iterator(part.end()));
    }
    return result;
}

// ── Identifier allocation ────────────────────────────────────────────────────

uint64_t ConcurrentMap::next_id() {
    return counter_.fetch_add(1, std::memory_order_relaxed) + 1;
}

uint64_t ConcurrentMap::counter() const {
    return counter_.load(std::memory_order_relaxed);
}

void ConcurrentMap::set_counter_index(uint64_t value) {
    counter_.store(value, std::memory_order_relaxed);
}

// ── Persistence ──────────────────────────────────────────────────────────────

std::filesystem::path ConcurrentMap::sync_destination_path() const {
    return root_ / sync_destination_;
}

std::error_code ConcurrentMap::sync() {
    for (const auto& s : shards_) {
        if (auto ec = s->sync()) {
            return ec;
        }
    }
    return save_index();
}

std::error_code ConcurrentMap::optimize(uint64_t& reclaimed) {
    reclaimed = 0;

    const auto staging_dir = sync_destination_path();
    std::error_code ec;
    std::filesystem::create_directories(staging_dir, ec);
    if (ec) {
        spdlog::error("ConcurrentMap: sync destination {} unavailable: {}",
                      staging_dir.string(), ec.message());
        return ec;
    }

    for (const auto& s : shards_) {
        uint64_t shard_reclaimed = 0;
        if (auto compact_ec = s->compact(staging_dir, shard_reclaimed)) {
            return compact_ec;
        }
        reclaimed += shard_reclaimed;
    }
    return {};
}

std::error_code ConcurrentMap::save_index() const {
    const std::string text =
        std::to_string(counter()) + "\n" + sync_destination_ + "\n";
    return persistence::write_file_atomic(base_path_ / kIndexFilename, text);
}

} // namespace shardb
