#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

#include <json/value.h>

namespace google::protobuf {
class MessageLite;
} // namespace google::protobuf

namespace shardb::persistence {

// ── EncodedCompressedPackage ─────────────────────────────────────────────────
//
// One protobuf message per file, gzip-compressed:
//
//   file = gzip(message.SerializeAsString())
//
// save() goes through write_file_atomic(), so a reader sees either the old
// file or the complete new one.  Used for shard metadata.
//
// Thread-safety: no mutable state; callers serialise writes to one path.

class EncodedCompressedPackage {
public:
    explicit EncodedCompressedPackage(std::filesystem::path path);

    [[nodiscard]] std::error_code save(const google::protobuf::MessageLite& message) const;

    // Read, decompress and parse into `message`.  Parse failures return
    // std::errc::invalid_argument.
    [[nodiscard]] std::error_code load(google::protobuf::MessageLite& message) const;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// ── CompressedPackage ────────────────────────────────────────────────────────
//
// Raw bytes, gzip-compressed, one payload per file.

class CompressedPackage {
public:
    explicit CompressedPackage(std::filesystem::path path);

    [[nodiscard]] std::error_code save(std::string_view data) const;
    [[nodiscard]] std::error_code load(std::string& out) const;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// ── JSON documents ───────────────────────────────────────────────────────────
//
// Compact JSON via JsonCpp.  With `compressed` the document is wrapped in a
// CompressedPackage (collection descriptors); without it the file is plain
// JSON text (database header).

[[nodiscard]] std::error_code save_json(const std::filesystem::path& path,
                                        const Json::Value& document,
                                        bool compressed);

[[nodiscard]] std::error_code load_json(const std::filesystem::path& path,
                                        Json::Value& document,
                                        bool compressed);

} // namespace shardb::persistence
