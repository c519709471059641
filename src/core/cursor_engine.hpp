#pragma once

#include "core/key.hpp"
#include "core/key_range.hpp"
#include "core/object_store.hpp"
#include "core/request.hpp"
#include "storage/keyspace.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/awaitable.hpp>

namespace rkv {

class TransactionScope;

// ── Cursor ───────────────────────────────────────────────────────────────────
//
// A restartable position over a store or one of its indexes, bounded by a
// key range and moving in one Direction.  The cursor keeps only the raw
// engine key of its current entry and re-seeks from it on every advance(),
// so the entry under the cursor may be updated or removed between steps.
//
// Unique directions visit one entry per distinct index key: the entry with
// the lowest primary key, whichever way the cursor moves.

class Cursor {
public:
    // Store cursor.
    Cursor(ObjectStore& store, const KeyRange& range, Direction direction);

    // Index cursor.
    Cursor(ObjectStore& store, IndexView index, const KeyRange& range, Direction direction);

    // Moves to the next entry in traversal order.  Returns false once the
    // range is exhausted; the cursor stays exhausted afterwards.
    [[nodiscard]] bool advance();

    [[nodiscard]] bool exhausted() const noexcept { return exhausted_; }

    // Valid after advance() returned true.
    [[nodiscard]] const Key& key() const noexcept { return key_; }
    [[nodiscard]] const Key& primary_key() const noexcept { return primary_key_; }
    [[nodiscard]] const Record& value() const noexcept { return value_; }

    // Replaces the record under the cursor; returns its primary key.
    Key update(Record value);

    // Deletes the record under the cursor.
    void remove();

private:
    [[nodiscard]] std::optional<Entry> step();
    void load(const Entry& entry);

    ObjectStore& store_;
    std::optional<IndexView> index_;
    std::string prefix_;
    keyspace::ByteRange bounds_;
    Direction direction_;

    bool started_   = false;
    bool exhausted_ = false;
    std::string position_;  // raw engine key of the current entry

    Key key_;
    Key primary_key_;
    Record value_;
};

// ── Cursor walks ─────────────────────────────────────────────────────────────
//
// Each walk is a loop of scope requests: one per cursor step (advance plus
// predicate) and one per sub-request (update, delete).  Every sub-request
// settles before the cursor advances.  A failing step or sub-request ends
// the walk; partial results are discarded and the failure propagates.
//
// `limit` == 0 means no limit.

// Collects truthy predicate results in traversal order.
[[nodiscard]] boost::asio::awaitable<std::vector<nlohmann::json>>
walk_fetch(TransactionScope& scope, Cursor& cursor, const Predicate& where,
           std::uint32_t limit = 0);

// Writes back non-empty object results; returns the updated primary keys.
[[nodiscard]] boost::asio::awaitable<std::vector<Key>>
walk_update(TransactionScope& scope, Cursor& cursor, const Predicate& where);

// Deletes entries whose predicate result is exactly `true`.
[[nodiscard]] boost::asio::awaitable<void>
walk_remove(TransactionScope& scope, Cursor& cursor, const Predicate& where);

} // namespace rkv
