#include "core/cursor_engine.hpp"

#include "core/error.hpp"
#include "core/result_accumulator.hpp"
#include "core/transaction_scope.hpp"

#include <utility>

namespace rkv {

using boost::asio::awaitable;

// ── Cursor ───────────────────────────────────────────────────────────────────

Cursor::Cursor(ObjectStore& store, const KeyRange& range, Direction direction)
    : store_(store)
    , prefix_(keyspace::record_prefix(store.name()))
    , bounds_(keyspace::to_byte_range(prefix_, range))
    , direction_(direction)
{}

Cursor::Cursor(ObjectStore& store, IndexView index, const KeyRange& range, Direction direction)
    : store_(store)
    , index_(std::move(index))
    , prefix_(index_->prefix())
    , bounds_(keyspace::to_byte_range(prefix_, range))
    , direction_(direction)
{}

bool Cursor::advance() {
    if (exhausted_) return false;

    auto entry = step();
    started_ = true;
    if (!entry) {
        exhausted_ = true;
        return false;
    }
    load(*entry);
    return true;
}

// Unique directions only differ from plain ones on indexes; store keys are
// already distinct.
std::optional<Entry> Cursor::step() {
    auto& txn = store_.txn();
    const bool unique = index_ && is_unique(direction_);

    if (!is_reverse(direction_)) {
        std::optional<Entry> entry;
        if (!started_) {
            entry = txn.seek(bounds_.begin, SeekMode::AtOrAfter);
        } else if (unique) {
            auto group = prefix_;
            codec::append_key(group, key_);
            entry = txn.seek(keyspace::prefix_end(group), SeekMode::AtOrAfter);
        } else {
            entry = txn.seek(position_, SeekMode::After);
        }
        if (!entry || entry->key >= bounds_.end) return std::nullopt;
        return entry;
    }

    std::optional<Entry> entry;
    if (!started_) {
        entry = txn.seek(bounds_.end, SeekMode::Before);
    } else if (unique) {
        auto group = prefix_;
        codec::append_key(group, key_);
        entry = txn.seek(group, SeekMode::Before);
    } else {
        entry = txn.seek(position_, SeekMode::Before);
    }
    if (!entry || entry->key < bounds_.begin) return std::nullopt;

    if (unique) {
        // Land on the first entry (lowest primary key) of this index key.
        std::string_view encoded = entry->key;
        encoded.remove_prefix(prefix_.size());
        auto group = prefix_;
        codec::append_key(group, codec::decode_key(encoded));
        entry = txn.seek(group, SeekMode::AtOrAfter);
        if (!entry) {
            throw EngineError(Errc::storage_failure, "index entry vanished during cursor step");
        }
    }
    return entry;
}

void Cursor::load(const Entry& entry) {
    std::string_view encoded = entry.key;
    encoded.remove_prefix(prefix_.size());

    if (index_) {
        key_ = codec::decode_key(encoded);
        std::string_view primary = entry.value;
        primary_key_ = codec::decode_key(primary);
        value_ = index_->load(primary_key_);
    } else {
        primary_key_ = codec::decode_key(encoded);
        key_ = primary_key_;
        value_ = keyspace::decode_record(entry.value);
    }
    position_ = entry.key;
}

Key Cursor::update(Record value) {
    return store_.put(std::move(value), primary_key_);
}

void Cursor::remove() {
    store_.del(primary_key_);
}

// ── Walks ────────────────────────────────────────────────────────────────────

awaitable<std::vector<nlohmann::json>>
walk_fetch(TransactionScope& scope, Cursor& cursor, const Predicate& where,
           std::uint32_t limit) {
    ResultAccumulator<nlohmann::json> results(limit);

    for (;;) {
        const bool more = co_await scope.issue([&] {
            if (!cursor.advance()) return false;
            auto out = where(cursor.value());
            if (!is_truthy(out)) return true;
            return results.append(std::move(out));
        });
        if (!more) break;
    }
    co_return results.take();
}

awaitable<std::vector<Key>>
walk_update(TransactionScope& scope, Cursor& cursor, const Predicate& where) {
    ResultAccumulator<Key> keys;

    for (;;) {
        std::optional<Record> replacement;
        const bool more = co_await scope.issue([&] {
            if (!cursor.advance()) return false;
            auto out = where(cursor.value());
            if (out.is_object() && !out.empty()) replacement = std::move(out);
            return true;
        });
        if (!more) break;

        if (replacement) {
            auto key = co_await scope.issue([&] { return cursor.update(std::move(*replacement)); });
            keys.append(std::move(key));
        }
    }
    co_return keys.take();
}

awaitable<void>
walk_remove(TransactionScope& scope, Cursor& cursor, const Predicate& where) {
    for (;;) {
        bool matched = false;
        const bool more = co_await scope.issue([&] {
            if (!cursor.advance()) return false;
            const auto out = where(cursor.value());
            matched = out.is_boolean() && out.get<bool>();
            return true;
        });
        if (!more) break;

        if (matched) {
            co_await scope.issue([&] { cursor.remove(); });
        }
    }
}

} // namespace rkv
