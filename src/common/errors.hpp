#pragma once

#include <system_error>

namespace shardb {

// ── Errc ──────────────────────────────────────────────────────────────────────
//
// Database-level failure kinds.  Filesystem failures are not listed here:
// they travel as std::system_category codes straight from the OS.

enum class Errc : int {
    not_found = 1,            // header or collection missing
    version_incompatible,     // on-disk version differs by a major gap
    corrupted_collection,     // shard count mismatch, decode failure, missing index/descriptor
    corrupted_header,         // header file unreadable as {name, version}
    corrupted_element,        // record checksum or decode failure in a shard data file
    already_exists,           // duplicate collection name
    empty_registry,           // no collections to pick from
    missing_collections_dir,  // <root>/collections absent on load
    unknown_type,             // structure type not present in the TypeRegistry
};

[[nodiscard]] const std::error_category& shardb_category() noexcept;

[[nodiscard]] std::error_code make_error_code(Errc e) noexcept;

} // namespace shardb

template <>
struct std::is_error_code_enum<shardb::Errc> : std::true_type {};
