#include "storage/rocksdb_engine.hpp"
#include "core/error.hpp"

#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/utilities/transaction.h>
#include <rocksdb/utilities/transaction_db.h>
#include <rocksdb/write_batch.h>

#include <stdexcept>

namespace rkv {

namespace {

rocksdb::Slice to_slice(std::string_view sv) {
    return rocksdb::Slice{sv.data(), sv.size()};
}

[[noreturn]] void fail(const std::shared_ptr<spdlog::logger>& logger,
                       const char* what, const rocksdb::Status& status) {
    if (logger) {
        logger->error("RocksDB {} failed: {}", what, status.ToString());
    }
    throw EngineError(Errc::storage_failure,
                      std::string("RocksDB ") + what + " failed: " + status.ToString());
}

} // anonymous namespace

// ── RocksDBEngine ────────────────────────────────────────────────────────────

RocksDBEngine::RocksDBEngine(const std::filesystem::path& db_path,
                             std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger))
{
    rocksdb::Options options;
    options.create_if_missing = true;

    // Optimise for small-to-medium working sets typical of a record store.
    options.IncreaseParallelism();
    options.OptimizeLevelStyleCompaction();

    rocksdb::TransactionDBOptions txn_options;

    rocksdb::TransactionDB* raw_db = nullptr;
    auto status = rocksdb::TransactionDB::Open(options, txn_options,
                                               db_path.string(), &raw_db);
    if (!status.ok()) {
        throw std::runtime_error(
            "Failed to open RocksDB at " + db_path.string() + ": " +
            status.ToString());
    }
    db_.reset(raw_db);
    if (logger_) {
        logger_->info("RocksDB opened at {}", db_path.string());
    }
}

RocksDBEngine::~RocksDBEngine() {
    if (db_ && logger_) {
        logger_->info("Closing RocksDB");
    }
    // unique_ptr<rocksdb::TransactionDB> destructor closes the DB.
}

std::unique_ptr<EngineTransaction> RocksDBEngine::begin() {
    return std::make_unique<RocksDBTransaction>(*db_, logger_);
}

void RocksDBEngine::clear() {
    // Delete all keys via a WriteBatch.
    rocksdb::WriteBatch batch;
    std::unique_ptr<rocksdb::Iterator> it(
        db_->NewIterator(rocksdb::ReadOptions{}));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        batch.Delete(it->key());
    }
    if (!it->status().ok()) {
        fail(logger_, "clear() scan", it->status());
    }
    auto status = db_->Write(rocksdb::WriteOptions{}, &batch);
    if (!status.ok()) {
        fail(logger_, "clear()", status);
    }
}

// ── RocksDBTransaction ───────────────────────────────────────────────────────

RocksDBTransaction::RocksDBTransaction(rocksdb::TransactionDB& db,
                                       std::shared_ptr<spdlog::logger> logger)
    : txn_(db.BeginTransaction(rocksdb::WriteOptions{}))
    , logger_(std::move(logger))
{
}

RocksDBTransaction::~RocksDBTransaction() {
    if (txn_) {
        // Never committed – discard pending writes.
        txn_->Rollback().PermitUncheckedError();
    }
}

rocksdb::Transaction& RocksDBTransaction::active() const {
    if (!txn_) {
        throw EngineError(Errc::storage_failure, "RocksDB transaction already finished");
    }
    return *txn_;
}

std::optional<std::string> RocksDBTransaction::get(std::string_view key) {
    std::string value;
    auto status = active().Get(rocksdb::ReadOptions{}, to_slice(key), &value);
    if (status.IsNotFound()) {
        return std::nullopt;
    }
    if (!status.ok()) {
        fail(logger_, "Get", status);
    }
    return value;
}

void RocksDBTransaction::put(std::string key, std::string value) {
    auto status = active().Put(key, value);
    if (!status.ok()) {
        fail(logger_, "Put", status);
    }
}

void RocksDBTransaction::del(std::string_view key) {
    auto status = active().Delete(to_slice(key));
    if (!status.ok()) {
        fail(logger_, "Delete", status);
    }
}

std::optional<Entry> RocksDBTransaction::seek(std::string_view target, SeekMode mode) {
    // A fresh iterator per seek: it sees this transaction's writes made since
    // the previous seek.
    std::unique_ptr<rocksdb::Iterator> it(
        active().GetIterator(rocksdb::ReadOptions{}));
    const auto slice = to_slice(target);

    switch (mode) {
        case SeekMode::AtOrAfter:
            it->Seek(slice);
            break;
        case SeekMode::After:
            it->Seek(slice);
            if (it->Valid() && it->key() == slice) {
                it->Next();
            }
            break;
        case SeekMode::AtOrBefore:
            it->SeekForPrev(slice);
            break;
        case SeekMode::Before:
            it->SeekForPrev(slice);
            if (it->Valid() && it->key() == slice) {
                it->Prev();
            }
            break;
    }

    if (!it->status().ok()) {
        fail(logger_, "Seek", it->status());
    }
    if (!it->Valid()) {
        return std::nullopt;
    }
    return Entry{it->key().ToString(), it->value().ToString()};
}

void RocksDBTransaction::commit() {
    auto status = active().Commit();
    txn_.reset();
    if (!status.ok()) {
        fail(logger_, "Commit", status);
    }
}

void RocksDBTransaction::rollback() {
    if (!txn_) {
        return;
    }
    auto status = txn_->Rollback();
    txn_.reset();
    if (!status.ok()) {
        fail(logger_, "Rollback", status);
    }
}

} // namespace rkv
