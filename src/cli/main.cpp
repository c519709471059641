#include "cli/command.hpp"
#include "common/cli_config.hpp"
#include "common/logger.hpp"
#include "core/error.hpp"
#include "core/transaction_scope.hpp"
#include "schema/database.hpp"
#include "storage/memory_engine.hpp"
#include "storage/rocksdb_engine.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace asio = boost::asio;

namespace {

void print_json(const nlohmann::json& j) {
    fprintf(stdout, "%s\n", j.dump().c_str());
    fflush(stdout);
}

// Runs one command in its own transaction and returns the JSON to print.
asio::awaitable<nlohmann::json> run_command(rkv::Database& db, rkv::cli::Command cmd) {
    using rkv::cli::Verb;

    if (cmd.verb == Verb::Add) {
        auto value = cmd.options.value("value", nlohmann::json::object());
        std::optional<rkv::Key> key;
        if (auto it = cmd.options.find("key"); it != cmd.options.end()) key = *it;

        auto added = co_await db.with_transaction(
            {cmd.store},
            [&](rkv::TransactionScope& tx) -> asio::awaitable<rkv::Key> {
                co_return co_await tx[cmd.store].add(std::move(value), key);
            });
        co_return nlohmann::json{{"key", added}};
    }

    auto request = rkv::cli::build_request(cmd.verb, cmd.options);
    auto result = co_await db.with_transaction(
        {cmd.store},
        [&](rkv::TransactionScope& tx) -> asio::awaitable<rkv::Result> {
            auto& collection = tx[cmd.store];
            switch (cmd.verb) {
                case Verb::Upsert: co_return co_await collection.upsert(std::move(request));
                case Verb::Remove: co_return co_await collection.remove(std::move(request));
                default:           co_return co_await collection.fetch(std::move(request));
            }
        });
    co_return rkv::cli::result_to_json(result);
}

// ── REPL coroutine ───────────────────────────────────────────────────────────

asio::awaitable<void> repl(rkv::Database& db, std::shared_ptr<spdlog::logger> logger) {
    using rkv::cli::Verb;

    std::string line;
    while (true) {
        fprintf(stdout, "> ");
        fflush(stdout);
        if (!std::getline(std::cin, line)) break;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

        rkv::cli::Command cmd{Verb::Stores, {}};
        try {
            cmd = rkv::cli::parse_command(line);
        } catch (const std::runtime_error& e) {
            fprintf(stdout, "ERROR %s\n", e.what());
            continue;
        }

        if (cmd.verb == Verb::Quit) break;
        if (cmd.verb == Verb::Stores) {
            print_json(db.store_names());
            continue;
        }
        if (cmd.verb == Verb::Info) {
            print_json(db.info());
            continue;
        }

        try {
            print_json(co_await run_command(db, std::move(cmd)));
        } catch (const rkv::Error& e) {
            logger->debug("command failed: {} ({})", e.what(), e.code().message());
            fprintf(stdout, "ERROR %s\n", e.what());
        } catch (const std::runtime_error& e) {
            fprintf(stdout, "ERROR %s\n", e.what());
        } catch (const nlohmann::json::exception& e) {
            fprintf(stdout, "ERROR %s\n", e.what());
        }
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    // ── Parse CLI arguments ──────────────────────────────────────────────────
    rkv::CliConfig cfg;
    try {
        cfg = rkv::parse_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    // ── Database config ──────────────────────────────────────────────────────
    std::optional<rkv::DatabaseConfig> db_config;
    try {
        db_config = cfg.schema_path.empty()
            ? rkv::DatabaseConfig(cfg.name, cfg.version)
            : rkv::load_database_config(cfg.schema_path);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    // ── Logging ──────────────────────────────────────────────────────────────
    // parse_config() has already rejected unknown levels.
    const auto level = rkv::parse_log_level(cfg.log_level).value_or(spdlog::level::info);
    rkv::init_default_logger(level);
    auto logger = rkv::make_logger(db_config->name(), level);

    logger->info("rkv-cli starting – db={} version={} engine={}",
        db_config->name(), db_config->version(), cfg.engine);

    // ── Storage ──────────────────────────────────────────────────────────────
    std::unique_ptr<rkv::StorageEngine> engine;
    if (cfg.engine == "rocksdb") {
        namespace fs = std::filesystem;
        const fs::path data_dir{cfg.data_dir};
        std::error_code fs_ec;
        fs::create_directories(data_dir, fs_ec);
        if (fs_ec) {
            logger->error("Failed to create data directory {}: {}",
                          data_dir.string(), fs_ec.message());
            return 1;
        }

        const auto db_path = data_dir / db_config->name();
        try {
            engine = std::make_unique<rkv::RocksDBEngine>(db_path, logger);
        } catch (const std::runtime_error& e) {
            logger->error("Failed to open RocksDB engine: {}", e.what());
            return 1;
        }
        logger->info("Using RocksDB storage engine at {}", db_path.string());
    } else {
        engine = std::make_unique<rkv::MemoryEngine>();
        logger->info("Using in-memory storage engine");
    }

    // ── Open database ────────────────────────────────────────────────────────
    asio::io_context ioc;

    rkv::OpenOptions options;
    options.on_upgrade = [&logger](uint32_t old_version, uint32_t new_version) {
        logger->info("Schema upgraded from version {} to {}", old_version, new_version);
    };

    std::unique_ptr<rkv::Database> db;
    try {
        db = rkv::Database::open(*engine, ioc.get_executor(), *db_config,
                                 std::move(options), logger);
    } catch (const std::exception& e) {
        logger->error("Failed to open database: {}", e.what());
        return 1;
    }

    // ── REPL ─────────────────────────────────────────────────────────────────
    int exit_code = 0;
    asio::co_spawn(ioc, repl(*db, logger),
        [&](std::exception_ptr ep) {
            if (!ep) return;
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                logger->error("REPL terminated: {}", e.what());
                exit_code = 1;
            }
        });
    ioc.run();

    db->close();
    logger->info("rkv-cli stopped");
    return exit_code;
}
