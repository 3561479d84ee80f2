#include "persistence/file_io.hpp"

#include <array>
#include <cerrno>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace shardb::persistence {

// ── CRC32 (ISO 3309 polynomial 0xEDB88320) ──────────────────────────────────

namespace {

constexpr std::array<uint32_t, 256> make_crc32_table() {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int j = 0; j < 8; ++j) {
            if (crc & 1)
                crc = (crc >> 1) ^ 0xEDB88320;
            else
                crc >>= 1;
        }
        table[i] = crc;
    }
    return table;
}

constexpr auto kCrc32Table = make_crc32_table();

} // anonymous namespace

uint32_t crc32(const uint8_t* data, std::size_t length) {
    uint32_t crc = 0xFFFFFFFF;
    for (std::size_t i = 0; i < length; ++i) {
        crc = kCrc32Table[(crc ^ data[i]) & 0xFF] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFF;
}

// ── Little-endian helpers ────────────────────────────────────────────────────

void write_u32_le(std::vector<uint8_t>& buf, uint32_t v) {
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

uint32_t read_u32_le(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

// ── File descriptor I/O ──────────────────────────────────────────────────────

std::error_code make_errno_error() {
    return {errno, std::system_category()};
}

std::error_code write_all(int fd, const uint8_t* data, std::size_t len) {
    std::size_t written = 0;
    while (written < len) {
        auto n = ::write(fd, data + written, len - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return make_errno_error();
        }
        written += static_cast<std::size_t>(n);
    }
    return {};
}

std::error_code pwrite_all(int fd, const uint8_t* data, std::size_t len,
                           off_t offset) {
    std::size_t written = 0;
    while (written < len) {
        auto n = ::pwrite(fd, data + written, len - written,
                          offset + static_cast<off_t>(written));
        if (n < 0) {
            if (errno == EINTR) continue;
            return make_errno_error();
        }
        written += static_cast<std::size_t>(n);
    }
    return {};
}

std::error_code pread_all(int fd, uint8_t* buf, std::size_t len, off_t offset) {
    std::size_t total = 0;
    while (total < len) {
        auto n = ::pread(fd, buf + total, len - total,
                         offset + static_cast<off_t>(total));
        if (n < 0) {
            if (errno == EINTR) continue;
            return make_errno_error();
        }
        if (n == 0) {
            return std::make_error_code(std::errc::io_error);  // unexpected EOF
        }
        total += static_cast<std::size_t>(n);
    }
    return {};
}

std::error_code file_size(int fd, uint64_t& out) {
    struct stat st {};
    if (::fstat(fd, &st) < 0) {
        return make_errno_error();
    }
    out = static_cast<uint64_t>(st.st_size);
    return {};
}

// ── Whole-file helpers ───────────────────────────────────────────────────────

std::error_code read_file(const std::filesystem::path& path, std::string& out) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        return make_errno_error();
    }

    uint64_t size = 0;
    auto ec = file_size(fd, size);
    if (ec) {
        ::close(fd);
        return ec;
    }

    out.assign(static_cast<std::size_t>(size), '\0');
    if (size > 0) {
        ec = pread_all(fd, reinterpret_cast<uint8_t*>(out.data()), out.size(), 0);
    }
    ::close(fd);
    return ec;
}

std::error_code write_file_atomic(const std::filesystem::path& path,
                                  std::string_view data) {
    auto tmp_path = path;
    tmp_path += ".tmp";

    int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        auto ec = make_errno_error();
        spdlog::error("Failed to open tmp file {}: {}",
                      tmp_path.string(), ec.message());
        return ec;
    }

    auto ec = write_all(fd, reinterpret_cast<const uint8_t*>(data.data()),
                        data.size());
    if (ec) {
        spdlog::error("Write to {} failed: {}", tmp_path.string(), ec.message());
        ::close(fd);
        std::filesystem::remove(tmp_path);
        return ec;
    }

    if (::fsync(fd) < 0) {
        ec = make_errno_error();
        spdlog::error("fsync of {} failed: {}", tmp_path.string(), ec.message());
        ::close(fd);
        std::filesystem::remove(tmp_path);
        return ec;
    }

    ::close(fd);

    // Rename .tmp → final path.
    std::error_code rename_ec;
    std::filesystem::rename(tmp_path, path, rename_ec);
    if (rename_ec) {
        spdlog::error("Rename {} failed: {}", tmp_path.string(),
                      rename_ec.message());
        std::filesystem::remove(tmp_path);
        return rename_ec;
    }

    return {};
}

} // namespace shardb::persistence
