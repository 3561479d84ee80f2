#pragma once

#include <string>
#include <string_view>
#include <system_error>

namespace shardb::persistence {

// ── gzip ─────────────────────────────────────────────────────────────────────
//
// One-shot gzip (RFC 1952) compression over zlib.  The gzip header written
// carries no name and a zero mtime, so equal input always yields equal output.

[[nodiscard]] std::error_code gzip_compress(std::string_view input, std::string& out);

// Accepts gzip or zlib framing.  Truncated or corrupt input yields
// std::errc::invalid_argument.
[[nodiscard]] std::error_code gzip_decompress(std::string_view input, std::string& out);

} // namespace shardb::persistence
