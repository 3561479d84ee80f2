#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

namespace shardb {

// ── ToolConfig ────────────────────────────────────────────────────────────────
// Full configuration for one shardb-tool invocation.
// Populated by parse_config() from CLI arguments.

struct ToolConfig {
    std::string              root;       // Database root directory
    std::string              name;       // Database name used when no header exists yet
    std::string              log_level;  // spdlog level string
    uint64_t                 seed = 0;   // Random seed (0 = nondeterministic)
    std::string              command;    // info|create|drop|put|add|get|del|optimize|random
    std::vector<std::string> args;       // Positional arguments after the command
};

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into a ToolConfig.
//
// On success: returns a fully validated ToolConfig.
// On error  : throws std::runtime_error with a human-readable message
//             (--help is reported the same way, carrying the usage text).
//
// Validates:
//   - root and name are not empty
//   - command is known and has exactly the arguments it needs
//   - collection names contain no '/' and are not "." or ".."
//
// Usage: shardb-tool [options] COMMAND [ARGS...]
//   Example: shardb-tool --root ./data put users 42 '{"name":"ann"}'

[[nodiscard]] ToolConfig parse_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with shardb-tool
// options.  Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

// Number of positional arguments `command` takes, or -1 if unknown.
[[nodiscard]] int command_arity(const std::string& command);

// Commands that change the database and are followed by a sync.
[[nodiscard]] bool is_mutating(const std::string& command);

} // namespace shardb
