#pragma once

#include "core/key.hpp"
#include "core/key_range.hpp"
#include "schema/schema.hpp"
#include "storage/storage_engine.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rkv {

class IndexView;

// ── ObjectStore ──────────────────────────────────────────────────────────────
//
// Synchronous record operations on one store inside an engine transaction.
// Maintains the store's index entries and key generator on every write.
// Each method is one storage request; the asynchronous request plumbing lives
// in TransactionScope.
//
// Failures are EngineError: invalid_key, constraint_violation,
// index_not_found, storage_failure.

class ObjectStore {
public:
    ObjectStore(EngineTransaction& txn, const StoreDef& def)
        : txn_(txn)
        , def_(def)
    {}

    [[nodiscard]] const StoreDef& def() const noexcept { return def_; }
    [[nodiscard]] const std::string& name() const noexcept { return def_.name; }
    [[nodiscard]] EngineTransaction& txn() noexcept { return txn_; }

    // Inserts a new record.  Fails with constraint_violation if the key exists.
    Key add(Record value, const std::optional<Key>& key = std::nullopt);

    // Inserts or replaces a record.
    Key put(Record value, const std::optional<Key>& key = std::nullopt);

    [[nodiscard]] std::optional<Record> get(const Key& key);

    // Records with keys in `range`, ascending.  count == 0 → no limit.
    [[nodiscard]] std::vector<Record> get_all(const KeyRange& range, std::uint32_t count = 0);

    // Deletes the record at `key`; a missing key is not an error.
    void del(const Key& key);

    // Deletes every record and index entry.  The key generator is kept.
    void clear();

    // Throws EngineError(index_not_found) for an unknown index name.
    [[nodiscard]] IndexView index(std::string_view index_name);

    // Writes entries of `index` for every stored record (schema upgrade).
    void build_index(const IndexDef& index);

    // Index keys `record` contributes to `index`: none when the key path is
    // missing or not a valid key; distinct valid elements for multi-entry
    // arrays.
    [[nodiscard]] static std::vector<Key> index_keys(const IndexDef& index, const Record& record);

private:
    Key write(Record value, const std::optional<Key>& key, bool overwrite);
    Key resolve_key(Record& value, const std::optional<Key>& key, bool& generated);

    void check_unique(const IndexDef& index, const Key& index_key, const Key& primary_key);
    void write_index_entries(const Key& primary_key, const Record& record);
    void erase_index_entries(const Key& primary_key, const Record& record);

    [[nodiscard]] std::int64_t current_generator();
    void store_generator(std::int64_t value);

    EngineTransaction& txn_;
    const StoreDef& def_;
};

// ── IndexView ────────────────────────────────────────────────────────────────
//
// Read access to one index of a store.  Entries are ordered by indexed value,
// then primary key.

class IndexView {
public:
    IndexView(ObjectStore& store, const IndexDef& def);

    [[nodiscard]] const IndexDef& def() const noexcept { return def_; }
    [[nodiscard]] const std::string& prefix() const noexcept { return prefix_; }

    // Primary key of the first entry (lowest primary key) indexed under `key`.
    [[nodiscard]] std::optional<Key> get_key(const Key& key);

    // Record of the first entry indexed under `key`.
    [[nodiscard]] std::optional<Record> get(const Key& key);

    // Records whose indexed value lies in `range`, ascending by indexed value.
    [[nodiscard]] std::vector<Record> get_all(const KeyRange& range, std::uint32_t count = 0);

    // Record for an entry's primary key; a dangling entry is storage_failure.
    [[nodiscard]] Record load(const Key& primary_key);

private:
    ObjectStore& store_;
    const IndexDef& def_;
    std::string prefix_;
};

} // namespace rkv
