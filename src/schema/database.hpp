#pragma once

#include "core/error.hpp"
#include "core/transaction_coordinator.hpp"
#include "schema/database_config.hpp"
#include "schema/schema.hpp"
#include "storage/storage_engine.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace rkv {

struct OpenOptions {
    // Invoked after a successful upgrade with the stored and the new version
    // (0 for a fresh database).
    std::function<void(uint32_t old_version, uint32_t new_version)> on_upgrade;
};

// ── Database ─────────────────────────────────────────────────────────────────
//
// An open database on an injected storage engine.  All transactions run on
// the executor given to open(); the engine must outlive the Database.
//
//   auto db = Database::open(engine, ioc.get_executor(), config);
//   co_await db->with_transaction({"todos"}, [](TransactionScope& tx)
//       -> boost::asio::awaitable<void> {
//       co_await tx["todos"].upsert({.value = Record{{"title", "a"}}});
//   });

class Database {
public:
    // Opens the database described by `config`, creating or upgrading its
    // schema when the stored version is lower.
    //
    // Throws:
    //   EngineError(version_mismatch)      – stored version is higher
    //   EngineError(constraint_violation)  – unique index back-fill failed
    //   EngineError(storage_failure)       – engine or metadata failure
    [[nodiscard]] static std::unique_ptr<Database>
    open(StorageEngine& engine,
         boost::asio::any_io_executor executor,
         DatabaseConfig config,
         OpenOptions options = {},
         std::shared_ptr<spdlog::logger> logger = {});

    Database(const Database&)            = delete;
    Database& operator=(const Database&) = delete;

    // Runs `logic` (TransactionScope& → awaitable<T>) in one transaction over
    // `names` (every store when empty); see TransactionCoordinator.
    // Throws ContractViolation(database_closed) immediately once closed.
    template <typename Logic>
    [[nodiscard]] auto with_transaction(std::vector<std::string> names, Logic logic) {
        ensure_open();
        return coordinator_.run(std::move(names), std::move(logic));
    }

    template <typename Logic>
    [[nodiscard]] auto with_transaction(Logic logic) {
        return with_transaction(std::vector<std::string>{}, std::move(logic));
    }

    // Opens and completes an empty transaction; yields the store names.
    [[nodiscard]] boost::asio::awaitable<std::vector<std::string>>
    with_transaction(std::vector<std::string> names = {});

    // Further transactions fail with database_closed.
    void close();

    // Deletes every record, index entry and the schema, then closes.
    void destroy();

    [[nodiscard]] bool is_open() const noexcept { return open_; }

    [[nodiscard]] const std::string& name() const noexcept { return schema_.name; }
    [[nodiscard]] uint32_t version() const noexcept { return schema_.version; }
    [[nodiscard]] const DatabaseSchema& schema() const noexcept { return schema_; }
    [[nodiscard]] std::vector<std::string> store_names() const { return schema_.store_names(); }

    // Transactions running or waiting for a store another one holds.
    [[nodiscard]] std::size_t scopes_in_flight() const noexcept {
        return coordinator_.scopes_in_flight();
    }

    // {"name", "version", "stores": [...]} in the schema JSON form.
    [[nodiscard]] nlohmann::json info() const;

private:
    Database(StorageEngine& engine,
             boost::asio::any_io_executor executor,
             DatabaseSchema schema,
             std::shared_ptr<spdlog::logger> logger);

    void ensure_open() const;

    StorageEngine& engine_;
    DatabaseSchema schema_;
    std::shared_ptr<spdlog::logger> logger_;
    TransactionCoordinator coordinator_;
    bool open_ = true;
};

} // namespace rkv
