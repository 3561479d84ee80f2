#include "common/tool_config.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/program_options.hpp>
#include <spdlog/fmt/fmt.h>

namespace po = boost::program_options;

namespace shardb {

namespace {

// ── Helpers ───────────────────────────────────────────────────────────────────

struct CommandInfo {
    const char* name;
    int         arity;
    bool        mutating;
};

constexpr CommandInfo kCommands[] = {
    {"info",     0, false},
    {"create",   1, true},
    {"drop",     1, true},
    {"put",      3, true},
    {"add",      2, true},
    {"get",      2, false},
    {"del",      2, true},
    {"optimize", 0, true},
    {"random",   0, false},
};

const CommandInfo* find_command(const std::string& command) {
    for (const auto& entry : kCommands) {
        if (command == entry.name) {
            return &entry;
        }
    }
    return nullptr;
}

void validate_collection_name(const std::string& name) {
    if (name.empty() || name == "." || name == ".." ||
        name.find('/') != std::string::npos) {
        throw std::runtime_error(
            fmt::format("Invalid collection name: '{}'", name));
    }
}

// Validate the fully populated ToolConfig.
void validate(const ToolConfig& cfg) {
    if (cfg.root.empty()) {
        throw std::runtime_error("--root must not be empty");
    }
    if (cfg.name.empty()) {
        throw std::runtime_error("--name must not be empty");
    }

    const auto* entry = find_command(cfg.command);
    if (entry == nullptr) {
        throw std::runtime_error(
            fmt::format("Unknown command '{}'", cfg.command));
    }
    if (static_cast<int>(cfg.args.size()) != entry->arity) {
        throw std::runtime_error(
            fmt::format("Command '{}' takes {} argument(s), got {}",
                        cfg.command, entry->arity, cfg.args.size()));
    }
    if (entry->arity > 0) {
        validate_collection_name(cfg.args.front());
    }
}

} // anonymous namespace

int command_arity(const std::string& command) {
    const auto* entry = find_command(command);
    return entry ? entry->arity : -1;
}

bool is_mutating(const std::string& command) {
    const auto* entry = find_command(command);
    return entry != nullptr && entry->mutating;
}

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("root",
            po::value<std::string>()->default_value("."),
            "Database root directory")
        ("name",
            po::value<std::string>()->default_value("shardb"),
            "Database name (used when the root holds no header yet)")
        ("log-level",
            po::value<std::string>()->default_value("warn"),
            "Log level: trace|debug|info|warn|error|critical|off")
        ("seed",
            po::value<uint64_t>()->default_value(0),
            "Random seed for collection picks (0 = nondeterministic)")
        ("command",
            po::value<std::string>()->required(),
            "info|create|drop|put|add|get|del|optimize|random")
        ("args",
            po::value<std::vector<std::string>>()->multitoken(),
            "Command arguments");
}

// ── parse_config ──────────────────────────────────────────────────────────────

ToolConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("shardb-tool options");
    add_options(desc);

    po::positional_options_description positional;
    positional.add("command", 1);
    positional.add("args", -1);

    po::variables_map vm;
    try {
        po::store(
            po::command_line_parser(argc, argv)
                .options(desc)
                .positional(positional)
                .run(),
            vm);

        // Handle --help before notify() so a missing command doesn't error.
        if (vm.count("help")) {
            std::ostringstream oss;
            oss << "Usage: shardb-tool [options] COMMAND [ARGS...]\n" << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    ToolConfig cfg;
    cfg.root      = vm["root"].as<std::string>();
    cfg.name      = vm["name"].as<std::string>();
    cfg.log_level = vm["log-level"].as<std::string>();
    cfg.seed      = vm["seed"].as<uint64_t>();
    cfg.command   = vm["command"].as<std::string>();
    if (vm.count("args")) {
        cfg.args = vm["args"].as<std::vector<std::string>>();
    }

    validate(cfg);
    return cfg;
}

} // namespace shardb
