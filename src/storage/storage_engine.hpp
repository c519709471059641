#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace rkv {

// One key/value pair returned by a seek.
struct Entry {
    std::string key;
    std::string value;
};

// Where a seek lands relative to the target key.
enum class SeekMode : uint8_t {
    AtOrAfter,   // smallest key >= target
    After,       // smallest key >  target
    AtOrBefore,  // largest key  <= target
    Before,      // largest key  <  target
};

// ── EngineTransaction ────────────────────────────────────────────────────────
//
// A read-write unit of work over the ordered byte keyspace.  Reads observe the
// committed state plus this transaction's own writes; nothing becomes visible
// to other transactions before commit().
//
// NOT thread-safe: a transaction is driven from one executor.
// Failures are reported as rkv::EngineError(storage_failure).

class EngineTransaction {
public:
    virtual ~EngineTransaction() = default;

    // Returns the value for `key`, or std::nullopt if not present.
    [[nodiscard]] virtual std::optional<std::string> get(std::string_view key) = 0;

    // Inserts or overwrites `key` with `value`.
    virtual void put(std::string key, std::string value) = 0;

    // Removes `key`.  Removing a missing key is not an error.
    virtual void del(std::string_view key) = 0;

    // Positions relative to `target` in bytewise key order.  Each call is
    // independent, so callers may mutate the keyspace between seeks.
    [[nodiscard]] virtual std::optional<Entry> seek(std::string_view target,
                                                    SeekMode mode) = 0;

    // Atomically publishes all writes.  The transaction is finished afterwards.
    virtual void commit() = 0;

    // Discards all writes.  The transaction is finished afterwards; rolling
    // back a finished transaction is a no-op.
    virtual void rollback() = 0;
};

// ── StorageEngine ────────────────────────────────────────────────────────────
//
// Abstract ordered key-value backend.  The concrete backend (in-memory map,
// RocksDB) is selected at startup and injected into rkv::Database.

class StorageEngine {
public:
    virtual ~StorageEngine() = default;

    // Starts a new read-write transaction.
    [[nodiscard]] virtual std::unique_ptr<EngineTransaction> begin() = 0;

    // Removes all entries.
    virtual void clear() = 0;
};

} // namespace rkv
