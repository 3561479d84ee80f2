#pragma once

#include <cstdint>
#include <string>
#include <system_error>

namespace shardb {

// ── RuntimeOptions ────────────────────────────────────────────────────────────
// Process-wide settings applied once by initialize_runtime().

struct RuntimeOptions {
    std::string log_level      = "info";  // spdlog level string
    bool        profile_memory = true;    // log a memory sample at startup
};

// Install the default logger and take the startup memory sample.
// Call once at program start, before any Database is constructed.
void initialize_runtime(const RuntimeOptions& options);

// ── Memory profiling ──────────────────────────────────────────────────────────

struct MemorySample {
    uint64_t virtual_bytes  = 0;
    uint64_t resident_bytes = 0;
};

// Read the current process footprint from /proc/self/statm.
[[nodiscard]] std::error_code sample_memory(MemorySample& out);

// Log a memory sample through the default logger.  Failures are logged, not
// returned: profiling never blocks startup.
void profile_system_memory();

} // namespace shardb
