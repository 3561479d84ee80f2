#include "persistence/package.hpp"
#include "persistence/file_io.hpp"
#include "persistence/gzip.hpp"

#include <memory>

#include <google/protobuf/message_lite.h>
#include <json/reader.h>
#include <json/writer.h>

#include <spdlog/spdlog.h>

namespace shardb::persistence {

// ── EncodedCompressedPackage ─────────────────────────────────────────────────

EncodedCompressedPackage::EncodedCompressedPackage(std::filesystem::path path)
    : path_{std::move(path)}
{}

std::error_code EncodedCompressedPackage::save(
    const google::protobuf::MessageLite& message) const {
    std::string encoded;
    if (!message.SerializeToString(&encoded)) {
        spdlog::error("Package: failed to encode {} for {}",
                      message.GetTypeName(), path_.string());
        return std::make_error_code(std::errc::invalid_argument);
    }
    return CompressedPackage{path_}.save(encoded);
}

std::error_code EncodedCompressedPackage::load(
    google::protobuf::MessageLite& message) const {
    std::string encoded;
    if (auto ec = CompressedPackage{path_}.load(encoded)) {
        return ec;
    }
    if (!message.ParseFromString(encoded)) {
        spdlog::error("Package: failed to decode {} from {}",
                      message.GetTypeName(), path_.string());
        return std::make_error_code(std::errc::invalid_argument);
    }
    return {};
}

// ── CompressedPackage ────────────────────────────────────────────────────────

CompressedPackage::CompressedPackage(std::filesystem::path path)
    : path_{std::move(path)}
{}

std::error_code CompressedPackage::save(std::string_view data) const {
    std::string compressed;
    if (auto ec = gzip_compress(data, compressed)) {
        spdlog::error("Package: compression for {} failed: {}",
                      path_.string(), ec.message());
        return ec;
    }
    return write_file_atomic(path_, compressed);
}

std::error_code CompressedPackage::load(std::string& out) const {
    std::string compressed;
    if (auto ec = read_file(path_, compressed)) {
        return ec;
    }
    if (auto ec = gzip_decompress(compressed, out)) {
        spdlog::error("Package: {} is not a valid gzip stream", path_.string());
        return ec;
    }
    return {};
}

// ── JSON documents ───────────────────────────────────────────────────────────

std::error_code save_json(const std::filesystem::path& path,
                          const Json::Value& document,
                          bool compressed) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    const std::string text = Json::writeString(builder, document);

    if (compressed) {
        return CompressedPackage{path}.save(text);
    }
    return write_file_atomic(path, text);
}

std::error_code load_json(const std::filesystem::path& path,
                          Json::Value& document,
                          bool compressed) {
    std::string text;
    auto ec = compressed ? CompressedPackage{path}.load(text)
                         : read_file(path, text);
    if (ec) {
        return ec;
    }

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &document, &errors)) {
        spdlog::error("Package: invalid JSON in {}: {}", path.string(), errors);
        return std::make_error_code(std::errc::invalid_argument);
    }
    return {};
}

} // namespace shardb::persistence
