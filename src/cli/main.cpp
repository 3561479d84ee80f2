#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/runtime.hpp"
#include "common/tool_config.hpp"
#include "db/database.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>

namespace {

// Print a failure and map it to the process exit code.
int fail(const std::string& what, const std::error_code& ec) {
    fprintf(stderr, "%s: %s\n", what.c_str(), ec.message().c_str());
    return 1;
}

// Look up the collection named in args[0].
std::shared_ptr<shardb::Collection> require_collection(const shardb::Database& db,
                                                       const std::string& name) {
    auto c = db.get_collection(name);
    if (!c) {
        fprintf(stderr, "collection '%s' not found\n", name.c_str());
    }
    return c;
}

int run_command(shardb::Database& db, const shardb::ToolConfig& cfg) {
    const auto& cmd  = cfg.command;
    const auto& args = cfg.args;

    if (cmd == "info") {
        fprintf(stdout, "%s version=%d collections=%zu objects=%llu\n",
                db.name().c_str(), db.version(), db.collections_count(),
                static_cast<unsigned long long>(db.total_objects_count()));
        for (const auto& n : db.collection_names()) {
            auto c = db.get_collection(n);
            if (c) {
                fprintf(stdout, "  %s %zu\n", n.c_str(), c->size());
            }
        }
        return 0;
    }

    if (cmd == "create") {
        std::shared_ptr<shardb::Collection> c;
        if (auto ec = db.add_collection(args[0], c)) {
            return fail("create " + args[0], ec);
        }
        return 0;
    }

    if (cmd == "drop") {
        auto c = require_collection(db, args[0]);
        if (!c || !db.drop_collection(args[0])) {
            return 1;
        }
        // The registry forgets the collection; the tool also removes its
        // files so the next load does not bring it back.
        std::error_code ec;
        std::filesystem::remove_all(c->storage_path(), ec);
        if (ec) {
            return fail("drop " + args[0], ec);
        }
        return 0;
    }

    if (cmd == "optimize") {
        uint64_t reclaimed = 0;
        if (auto ec = db.optimize(reclaimed)) {
            return fail("optimize", ec);
        }
        fprintf(stdout, "%llu\n", static_cast<unsigned long long>(reclaimed));
        return 0;
    }

    if (cmd == "random") {
        std::shared_ptr<shardb::Collection> c;
        if (auto ec = db.random_collection(c)) {
            return fail("random", ec);
        }
        fprintf(stdout, "%s\n", c->name().c_str());
        return 0;
    }

    // Element commands: args[0] is the collection.
    auto c = require_collection(db, args[0]);
    if (!c) {
        return 1;
    }

    if (cmd == "put") {
        if (auto ec = c->set(args[1], args[2])) {
            return fail("put " + args[1], ec);
        }
    } else if (cmd == "add") {
        uint64_t id = 0;
        if (auto ec = c->add(args[1], id)) {
            return fail("add", ec);
        }
        fprintf(stdout, "%llu\n", static_cast<unsigned long long>(id));
    } else if (cmd == "get") {
        std::string value;
        if (auto ec = c->get(args[1], value)) {
            return fail("get " + args[1], ec);
        }
        fprintf(stdout, "%s\n", value.c_str());
    } else if (cmd == "del") {
        if (!c->del(args[1])) {
            return fail("del " + args[1], shardb::make_error_code(shardb::Errc::not_found));
        }
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    // ── Parse CLI arguments ──────────────────────────────────────────────────
    shardb::ToolConfig cfg;
    try {
        cfg = shardb::parse_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    // ── Runtime ──────────────────────────────────────────────────────────────
    shardb::RuntimeOptions options;
    options.log_level      = cfg.log_level;
    options.profile_memory = spdlog::level::debug >= shardb::parse_log_level(cfg.log_level);
    shardb::initialize_runtime(options);

    // ── Open or start the database ───────────────────────────────────────────
    shardb::Database db{cfg.name, cfg.root, cfg.seed};

    std::filesystem::path header;
    auto ec = shardb::Database::locate_header(cfg.root, header);
    if (!ec) {
        if (auto load_ec = db.load(cfg.root)) {
            return fail("load " + cfg.root, load_ec);
        }
    } else if (ec != shardb::make_error_code(shardb::Errc::not_found)) {
        return fail("scan " + cfg.root, ec);
    } else {
        spdlog::info("No database header under {}, starting '{}'", cfg.root, cfg.name);
    }

    // ── Run ──────────────────────────────────────────────────────────────────
    const int rc = run_command(db, cfg);
    if (rc != 0 || !shardb::is_mutating(cfg.command)) {
        return rc;
    }

    shardb::SyncReport report;
    if (auto sync_ec = db.sync(report)) {
        return fail("sync header", sync_ec);
    }
    if (!report.ok()) {
        for (const auto& [name, cec] : report.collections) {
            if (cec) {
                fprintf(stderr, "sync %s: %s\n", name.c_str(), cec.message().c_str());
            }
        }
        return 1;
    }
    return 0;
}
