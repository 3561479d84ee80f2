#include "persistence/gzip.hpp"

#include <array>
#include <climits>

#include <zlib.h>

#include <spdlog/spdlog.h>

namespace shardb::persistence {

namespace {

constexpr int kGzipWindowBits = 15 + 16;  // max window, gzip wrapper
constexpr int kAutoWindowBits = 15 + 32;  // max window, detect gzip/zlib
constexpr int kMemLevel       = 8;
constexpr std::size_t kChunk  = 16 * 1024;

} // anonymous namespace

std::error_code gzip_compress(std::string_view input, std::string& out) {
    if (input.size() > UINT_MAX) {
        return std::make_error_code(std::errc::file_too_large);
    }

    z_stream zs{};
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, kGzipWindowBits,
                     kMemLevel, Z_DEFAULT_STRATEGY) != Z_OK) {
        return std::make_error_code(std::errc::not_enough_memory);
    }

    zs.next_in  = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    zs.avail_in = static_cast<uInt>(input.size());

    out.clear();
    std::array<char, kChunk> buf;
    int rc = Z_OK;
    do {
        zs.next_out  = reinterpret_cast<Bytef*>(buf.data());
        zs.avail_out = static_cast<uInt>(buf.size());
        rc = deflate(&zs, Z_FINISH);
        if (rc == Z_STREAM_ERROR) {
            deflateEnd(&zs);
            return std::make_error_code(std::errc::io_error);
        }
        out.append(buf.data(), buf.size() - zs.avail_out);
    } while (rc != Z_STREAM_END);

    deflateEnd(&zs);
    return {};
}

std::error_code gzip_decompress(std::string_view input, std::string& out) {
    if (input.size() > UINT_MAX) {
        return std::make_error_code(std::errc::file_too_large);
    }

    z_stream zs{};
    if (inflateInit2(&zs, kAutoWindowBits) != Z_OK) {
        return std::make_error_code(std::errc::not_enough_memory);
    }

    zs.next_in  = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    zs.avail_in = static_cast<uInt>(input.size());

    out.clear();
    std::array<char, kChunk> buf;
    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        zs.next_out  = reinterpret_cast<Bytef*>(buf.data());
        zs.avail_out = static_cast<uInt>(buf.size());
        rc = inflate(&zs, Z_NO_FLUSH);
        if (rc == Z_NEED_DICT || rc == Z_DATA_ERROR || rc == Z_MEM_ERROR ||
            rc == Z_STREAM_ERROR) {
            spdlog::debug("gzip: inflate failed ({})", zs.msg ? zs.msg : "no message");
            inflateEnd(&zs);
            return std::make_error_code(std::errc::invalid_argument);
        }
        out.append(buf.data(), buf.size() - zs.avail_out);
        // No progress with input exhausted: the stream is truncated.
        if (rc == Z_BUF_ERROR || (zs.avail_in == 0 && rc != Z_STREAM_END &&
                                  zs.avail_out != 0)) {
            inflateEnd(&zs);
            return std::make_error_code(std::errc::invalid_argument);
        }
    }

    inflateEnd(&zs);
    return {};
}

} // namespace shardb::persistence
