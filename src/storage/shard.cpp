#include "storage/shard.hpp"

#include "common/errors.hpp"
#include "persistence/file_io.hpp"
#include "persistence/package.hpp"

#include <algorithm>
#include <charconv>
#include <mutex>

#include <fcntl.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace shardb {

using persistence::crc32;
using persistence::make_errno_error;

namespace {

constexpr std::size_t kRecordHeaderSize = sizeof(uint32_t);  // crc32

constexpr std::string_view kDataPrefix = "shard_";
constexpr std::string_view kDataSuffix = ".gobs";

// Parse <id> out of "shard_<id>.gobs".
bool parse_shard_id(std::string_view filename, uint32_t& id) {
    if (!filename.starts_with(kDataPrefix) || !filename.ends_with(kDataSuffix)) {
        return false;
    }
    auto digits = filename.substr(
        kDataPrefix.size(),
        filename.size() - kDataPrefix.size() - kDataSuffix.size());
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), id);
    return ec == std::errc{} && ptr == digits.data() + digits.size() && !digits.empty();
}

// Serialise one element as [crc32][payload].
[[nodiscard]] bool encode_record(const pb::Element& element, std::vector<uint8_t>& buf) {
    std::string payload;
    if (!element.SerializeToString(&payload)) {
        return false;
    }
    buf.clear();
    buf.reserve(kRecordHeaderSize + payload.size());
    persistence::write_u32_le(
        buf, crc32(reinterpret_cast<const uint8_t*>(payload.data()), payload.size()));
    buf.insert(buf.end(), payload.begin(), payload.end());
    return true;
}

} // anonymous namespace

// ── ShardMeta ────────────────────────────────────────────────────────────────

pb::ShardMeta ShardMeta::to_proto() const {
    // Sorted by key for deterministic output.
    std::vector<std::pair<std::string, ShardOffset>> sorted(offsets.begin(),
                                                            offsets.end());
    std::sort(sorted.begin(), sorted.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    pb::ShardMeta proto;
    proto.set_id(id);
    for (const auto& [key, off] : sorted) {
        auto* entry = proto.add_offsets();
        entry->set_key(key);
        entry->mutable_offset()->set_position(off.position);
        entry->mutable_offset()->set_length(off.length);
    }
    return proto;
}

ShardMeta ShardMeta::from_proto(const pb::ShardMeta& proto) {
    ShardMeta meta;
    meta.id = proto.id();
    meta.offsets.reserve(static_cast<std::size_t>(proto.offsets_size()));
    for (const auto& entry : proto.offsets()) {
        meta.offsets.insert_or_assign(
            entry.key(),
            ShardOffset{entry.offset().position(), entry.offset().length()});
    }
    return meta;
}

// ── Shard ────────────────────────────────────────────────────────────────────

Shard::Shard(std::filesystem::path dir, ShardMeta meta, int fd, uint64_t end)
    : dir_{std::move(dir)}
    , id_{meta.id}
    , offsets_{std::move(meta.offsets)}
    , fd_{fd}
    , end_{end}
{}

Shard::~Shard() {
    close_locked();
}

std::string Shard::data_filename(uint32_t id) {
    return "shard_" + std::to_string(id) + ".gobs";
}

std::string Shard::meta_filename(uint32_t id) {
    return "shard_" + std::to_string(id) + "_meta.gob.gzip";
}

std::filesystem::path Shard::data_path() const {
    return dir_ / data_filename(id_);
}

std::filesystem::path Shard::meta_path() const {
    return dir_ / meta_filename(id_);
}

std::error_code Shard::create(const std::filesystem::path& dir, uint32_t id,
                              std::unique_ptr<Shard>& out) {
    const auto path = dir / data_filename(id);
    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        auto ec = make_errno_error();
        spdlog::error("Shard: failed to create {}: {}", path.string(), ec.message());
        return ec;
    }

    ShardMeta meta;
    meta.id = id;
    out = std::make_unique<Shard>(dir, std::move(meta), fd, 0);
    return {};
}

std::error_code Shard::open(const std::filesystem::path& data_path,
                            std::unique_ptr<Shard>& out) {
    const auto filename = data_path.filename().string();
    uint32_t file_id = 0;
    if (!parse_shard_id(filename, file_id)) {
        spdlog::error("Shard: unexpected data file name {}", filename);
        return make_error_code(Errc::corrupted_collection);
    }

    int fd = ::open(data_path.c_str(), O_RDWR);
    if (fd < 0) {
        auto ec = make_errno_error();
        spdlog::error("Shard: {} is unavailable: {}", data_path.string(), ec.message());
        return make_error_code(Errc::corrupted_collection);
    }

    // Decode the companion metadata package.
    const auto dir = data_path.parent_path();
    pb::ShardMeta proto;
    persistence::EncodedCompressedPackage package{dir / meta_filename(file_id)};
    if (auto ec = package.load(proto)) {
        spdlog::error("Shard: metadata {} unreadable: {}",
                      package.path().string(), ec.message());
        ::close(fd);
        return make_error_code(Errc::corrupted_collection);
    }

    auto meta = ShardMeta::from_proto(proto);
    if (meta.id != file_id) {
        spdlog::error("Shard: {} carries id {} in its metadata", filename, meta.id);
        ::close(fd);
        return make_error_code(Errc::corrupted_collection);
    }

    uint64_t size = 0;
    if (auto ec = persistence::file_size(fd, size)) {
        ::close(fd);
        return ec;
    }

    // Every offset must address bytes that exist in the data file.
    for (const auto& [key, off] : meta.offsets) {
        if (off.length < kRecordHeaderSize || off.length > size ||
            off.position > size - off.length) {
            spdlog::error("Shard: {} offset for '{}' ({}+{}) exceeds file size {}",
                          filename, key, off.position, off.length, size);
            ::close(fd);
            return make_error_code(Errc::corrupted_collection);
        }
    }

    out = std::make_unique<Shard>(dir, std::move(meta), fd, size);
    return {};
}

std::error_code Shard::put(const pb::Element& element) {
    std::vector<uint8_t> record;
    if (!encode_record(element, record)) {
        return std::make_error_code(std::errc::invalid_argument);
    }

    std::unique_lock lock(mutex_);
    if (fd_ == -1) return std::make_error_code(std::errc::bad_file_descriptor);

    auto ec = persistence::pwrite_all(fd_, record.data(), record.size(),
                                      static_cast<off_t>(end_));
    if (ec) {
        spdlog::error("Shard {}: write failed: {}", id_, ec.message());
        return ec;
    }

    offsets_.insert_or_assign(element.key(), ShardOffset{end_, record.size()});
    end_ += record.size();
    return {};
}

std::error_code Shard::get(std::string_view key, pb::Element& out) const {
    std::shared_lock lock(mutex_);
    auto it = offsets_.find(std::string(key));
    if (it == offsets_.end()) {
        return make_error_code(Errc::not_found);
    }

    const auto off = it->second;
    std::vector<uint8_t> record(static_cast<std::size_t>(off.length));
    auto ec = persistence::pread_all(fd_, record.data(), record.size(),
                                     static_cast<off_t>(off.position));
    if (ec) {
        spdlog::error("Shard {}: read of '{}' failed: {}", id_, key, ec.message());
        return ec;
    }

    const uint8_t* payload = record.data() + kRecordHeaderSize;
    const std::size_t payload_len = record.size() - kRecordHeaderSize;
    if (persistence::read_u32_le(record.data()) != crc32(payload, payload_len)) {
        spdlog::error("Shard {}: CRC mismatch for '{}' at {}", id_, key, off.position);
        return make_error_code(Errc::corrupted_element);
    }
    if (!out.ParseFromArray(payload, static_cast<int>(payload_len))) {
        return make_error_code(Errc::corrupted_element);
    }
    return {};
}

bool Shard::erase(std::string_view key) {
    std::unique_lock lock(mutex_);
    return offsets_.erase(std::string(key)) > 0;
}

bool Shard::contains(std::string_view key) const {
    std::shared_lock lock(mutex_);
    return offsets_.contains(std::string(key));
}

std::size_t Shard::size() const {
    std::shared_lock lock(mutex_);
    return offsets_.size();
}

std::vector<std::string> Shard::keys() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> result;
    result.reserve(offsets_.size());
    for (const auto& [k, _] : offsets_) {
        result.push_back(k);
    }
    return result;
}

uint64_t Shard::file_bytes() const {
    std::shared_lock lock(mutex_);
    return end_;
}

uint64_t Shard::live_bytes() const {
    std::shared_lock lock(mutex_);
    uint64_t total = 0;
    for (const auto& [_, off] : offsets_) {
        total += off.length;
    }
    return total;
}

ShardMeta Shard::meta() const {
    std::shared_lock lock(mutex_);
    return ShardMeta{id_, offsets_};
}

std::error_code Shard::sync() {
    std::unique_lock lock(mutex_);
    if (fd_ == -1) return std::make_error_code(std::errc::bad_file_descriptor);

    if (::fdatasync(fd_) < 0) {
        auto ec = make_errno_error();
        spdlog::error("Shard {}: fdatasync failed: {}", id_, ec.message());
        return ec;
    }
    return save_meta_locked();
}

std::error_code Shard::compact(const std::filesystem::path& staging_dir,
                               uint64_t& reclaimed) {
    reclaimed = 0;
    std::unique_lock lock(mutex_);
    if (fd_ == -1) return std::make_error_code(std::errc::bad_file_descriptor);

    uint64_t live = 0;
    for (const auto& [_, off] : offsets_) {
        live += off.length;
    }
    if (live == end_) {
        return {};  // nothing stale
    }

    // Live records in file order, so the rewrite is a sequential copy.
    std::vector<std::pair<std::string, ShardOffset>> ordered(offsets_.begin(),
                                                             offsets_.end());
    std::sort(ordered.begin(), ordered.end(),
              [](const auto& a, const auto& b) {
                  return a.second.position < b.second.position;
              });

    const auto staging_path = staging_dir / (data_filename(id_) + ".compact");
    int tmp_fd = ::open(staging_path.c_str(), O_RDWR | O_CREAT | O_TRUNC, 0644);
    if (tmp_fd < 0) {
        auto ec = make_errno_error();
        spdlog::error("Shard {}: failed to open staging file {}: {}",
                      id_, staging_path.string(), ec.message());
        return ec;
    }

    std::unordered_map<std::string, ShardOffset> rewritten;
    rewritten.reserve(ordered.size());
    uint64_t pos = 0;
    std::vector<uint8_t> record;
    for (const auto& [key, off] : ordered) {
        record.resize(static_cast<std::size_t>(off.length));
        auto ec = persistence::pread_all(fd_, record.data(), record.size(),
                                         static_cast<off_t>(off.position));
        if (!ec) {
            ec = persistence::write_all(tmp_fd, record.data(), record.size());
        }
        if (ec) {
            spdlog::error("Shard {}: compaction copy failed: {}", id_, ec.message());
            ::close(tmp_fd);
            std::filesystem::remove(staging_path);
            return ec;
        }
        rewritten.emplace(key, ShardOffset{pos, off.length});
        pos += off.length;
    }

    if (::fdatasync(tmp_fd) < 0) {
        auto ec = make_errno_error();
        ::close(tmp_fd);
        std::filesystem::remove(staging_path);
        return ec;
    }

    // The new metadata is written beside the live one before the data file is
    // replaced.  Until the data rename the old pair stays consistent on disk.
    auto meta_staging = meta_path();
    meta_staging += ".compact";
    persistence::EncodedCompressedPackage staged_meta{meta_staging};
    if (auto ec = staged_meta.save(ShardMeta{id_, rewritten}.to_proto())) {
        spdlog::error("Shard {}: failed to stage compacted metadata: {}",
                      id_, ec.message());
        ::close(tmp_fd);
        std::filesystem::remove(staging_path);
        return ec;
    }

    std::error_code rename_ec;
    std::filesystem::rename(staging_path, data_path(), rename_ec);
    if (rename_ec) {
        spdlog::error("Shard {}: rename of compacted file failed: {}",
                      id_, rename_ec.message());
        ::close(tmp_fd);
        std::filesystem::remove(staging_path);
        std::filesystem::remove(meta_staging);
        return rename_ec;
    }

    // The staging descriptor now refers to the live data file.
    close_locked();
    fd_ = tmp_fd;
    const uint64_t dropped = end_ - pos;
    end_ = pos;
    offsets_ = std::move(rewritten);

    std::filesystem::rename(meta_staging, meta_path(), rename_ec);
    if (rename_ec) {
        spdlog::error("Shard {}: rename of compacted metadata failed: {}",
                      id_, rename_ec.message());
        return rename_ec;
    }

    reclaimed = dropped;
    spdlog::debug("Shard {}: compacted {} records, reclaimed {} bytes",
                  id_, offsets_.size(), reclaimed);
    return {};
}

std::error_code Shard::save_meta_locked() const {
    persistence::EncodedCompressedPackage package{meta_path()};
    auto ec = package.save(ShardMeta{id_, offsets_}.to_proto());
    if (ec) {
        spdlog::error("Shard {}: failed to save metadata: {}", id_, ec.message());
    }
    return ec;
}

void Shard::close_locked() {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace shardb
