#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <sys/types.h>

// Shared file primitives.  Every on-disk format in shardb goes through them:
// shard records (storage/shard.cpp) take their checksum and positioned I/O
// from here, and packages, headers and map.index files are written with
// write_file_atomic().

namespace shardb::persistence {

// ── CRC32 utility ────────────────────────────────────────────────────────────

// Compute CRC32 (ISO 3309 / ITU-T V.42, same polynomial as zlib).
[[nodiscard]] uint32_t crc32(const uint8_t* data, std::size_t length);

// ── Little-endian helpers ────────────────────────────────────────────────────

void write_u32_le(std::vector<uint8_t>& buf, uint32_t v);

[[nodiscard]] uint32_t read_u32_le(const uint8_t* p);

// ── File descriptor I/O ──────────────────────────────────────────────────────
//
// Thin wrappers over POSIX calls that retry on EINTR and short transfers.
// All return an empty error_code on success, a system_category code otherwise.

[[nodiscard]] std::error_code make_errno_error();

// Write all bytes at the current file position.
[[nodiscard]] std::error_code write_all(int fd, const uint8_t* data, std::size_t len);

// Write all bytes at `offset` without moving the file position.
[[nodiscard]] std::error_code pwrite_all(int fd, const uint8_t* data,
                                         std::size_t len, off_t offset);

// Read exactly `len` bytes at `offset`.  A short file yields io_error.
[[nodiscard]] std::error_code pread_all(int fd, uint8_t* buf,
                                        std::size_t len, off_t offset);

// Size of the file behind `fd`.
[[nodiscard]] std::error_code file_size(int fd, uint64_t& out);

// ── Whole-file helpers ───────────────────────────────────────────────────────

// Read an entire file into `out`.
[[nodiscard]] std::error_code read_file(const std::filesystem::path& path,
                                        std::string& out);

// Atomic write: write to `<path>.tmp`, fsync, then rename over `path`.
[[nodiscard]] std::error_code write_file_atomic(const std::filesystem::path& path,
                                                std::string_view data);

} // namespace shardb::persistence
