#include "common/runtime.hpp"
#include "common/logger.hpp"

#include <fstream>

#include <unistd.h>

#include <spdlog/spdlog.h>

namespace shardb {

void initialize_runtime(const RuntimeOptions& options) {
    init_default_logger(parse_log_level(options.log_level));
    if (options.profile_memory) {
        profile_system_memory();
    }
}

std::error_code sample_memory(MemorySample& out) {
    std::ifstream statm("/proc/self/statm");
    if (!statm) {
        return std::make_error_code(std::errc::no_such_file_or_directory);
    }

    uint64_t size_pages = 0;
    uint64_t resident_pages = 0;
    if (!(statm >> size_pages >> resident_pages)) {
        return std::make_error_code(std::errc::invalid_argument);
    }

    const auto page_size = static_cast<uint64_t>(::sysconf(_SC_PAGESIZE));
    out.virtual_bytes  = size_pages * page_size;
    out.resident_bytes = resident_pages * page_size;
    return {};
}

void profile_system_memory() {
    MemorySample sample;
    if (auto ec = sample_memory(sample)) {
        spdlog::warn("Memory profile unavailable: {}", ec.message());
        return;
    }
    spdlog::info("Memory profile: virtual={} KiB resident={} KiB",
                 sample.virtual_bytes / 1024, sample.resident_bytes / 1024);
}

} // namespace shardb
