#pragma once

#include "storage/storage_engine.hpp"

#include <filesystem>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace rocksdb {
class TransactionDB;
class Transaction;
} // namespace rocksdb

namespace rkv {

// ── RocksDBEngine ────────────────────────────────────────────────────────────
//
// Persistent ordered storage backed by a RocksDB TransactionDB.
//
// Each EngineTransaction is a pessimistic RocksDB transaction; conflicting
// writers surface as EngineError(storage_failure) from the write or commit.
// The database directory is created on construction; the destructor closes
// the database cleanly.

class RocksDBEngine final : public StorageEngine {
public:
    // Opens (or creates) a RocksDB database at `db_path`.
    // Throws std::runtime_error if the database cannot be opened.
    explicit RocksDBEngine(const std::filesystem::path& db_path,
                           std::shared_ptr<spdlog::logger> logger = {});

    ~RocksDBEngine() override;

    // Not copyable or movable – RocksDB owns internal state.
    RocksDBEngine(const RocksDBEngine&)            = delete;
    RocksDBEngine& operator=(const RocksDBEngine&) = delete;
    RocksDBEngine(RocksDBEngine&&)                 = delete;
    RocksDBEngine& operator=(RocksDBEngine&&)      = delete;

    [[nodiscard]] std::unique_ptr<EngineTransaction> begin() override;
    void clear() override;

private:
    std::unique_ptr<rocksdb::TransactionDB> db_;
    std::shared_ptr<spdlog::logger> logger_;
};

class RocksDBTransaction final : public EngineTransaction {
public:
    RocksDBTransaction(rocksdb::TransactionDB& db,
                       std::shared_ptr<spdlog::logger> logger);
    ~RocksDBTransaction() override;

    [[nodiscard]] std::optional<std::string> get(std::string_view key) override;
    void put(std::string key, std::string value) override;
    void del(std::string_view key) override;
    [[nodiscard]] std::optional<Entry> seek(std::string_view target, SeekMode mode) override;
    void commit() override;
    void rollback() override;

private:
    rocksdb::Transaction& active() const;

    std::unique_ptr<rocksdb::Transaction> txn_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace rkv
