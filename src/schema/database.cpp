#include "schema/database.hpp"

#include "schema/migration.hpp"

#include <fmt/format.h>

namespace rkv {

Database::Database(StorageEngine& engine,
                   boost::asio::any_io_executor executor,
                   DatabaseSchema schema,
                   std::shared_ptr<spdlog::logger> logger)
    : engine_(engine)
    , schema_(std::move(schema))
    , logger_(std::move(logger))
    , coordinator_(engine_, std::move(executor), schema_, logger_)
{}

std::unique_ptr<Database> Database::open(StorageEngine& engine,
                                         boost::asio::any_io_executor executor,
                                         DatabaseConfig config,
                                         OpenOptions options,
                                         std::shared_ptr<spdlog::logger> logger) {
    auto txn = engine.begin();

    auto stored = load_schema(*txn).value_or(DatabaseSchema{config.name(), 0, {}});
    const auto stored_version = stored.version;

    if (stored_version > config.version()) {
        txn->rollback();
        throw EngineError(Errc::version_mismatch, fmt::format(
            "database '{}' is at version {}, cannot open at lower version {}",
            config.name(), stored_version, config.version()));
    }

    if (stored_version == config.version()) {
        txn->rollback();
        if (logger) {
            logger->info("opened database '{}' at version {}", config.name(), stored_version);
        }
        return std::unique_ptr<Database>(
            new Database(engine, std::move(executor), std::move(stored), std::move(logger)));
    }

    if (logger) {
        logger->info("upgrading database '{}' from version {} to {}",
                     config.name(), stored_version, config.version());
    }

    DatabaseSchema upgraded;
    try {
        upgraded = migrate(*txn, stored, config.stores(), logger);
        upgraded.name    = config.name();
        upgraded.version = config.version();
        save_schema(*txn, upgraded);
        txn->commit();
    } catch (const std::exception& e) {
        if (logger) {
            logger->error("upgrade of database '{}' failed: {}", config.name(), e.what());
        }
        txn->rollback();
        throw;
    }

    if (options.on_upgrade) {
        options.on_upgrade(stored_version, upgraded.version);
    }

    return std::unique_ptr<Database>(
        new Database(engine, std::move(executor), std::move(upgraded), std::move(logger)));
}

boost::asio::awaitable<std::vector<std::string>>
Database::with_transaction(std::vector<std::string> names) {
    ensure_open();
    return coordinator_.run(std::move(names));
}

void Database::close() {
    if (!open_) return;
    open_ = false;
    if (logger_) {
        logger_->info("closed database '{}'", schema_.name);
    }
}

void Database::destroy() {
    engine_.clear();
    open_ = false;
    if (logger_) {
        logger_->info("destroyed database '{}'", schema_.name);
    }
}

nlohmann::json Database::info() const {
    return nlohmann::json(schema_);
}

void Database::ensure_open() const {
    if (!open_) {
        throw ContractViolation(Errc::database_closed, fmt::format(
            "database '{}' is closed", schema_.name));
    }
}

} // namespace rkv
