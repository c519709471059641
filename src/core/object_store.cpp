#include "core/object_store.hpp"

#include "core/error.hpp"
#include "storage/keyspace.hpp"

#include <charconv>
#include <cmath>
#include <set>
#include <utility>

#include <fmt/format.h>

namespace rkv {

namespace {

// Largest integer a generator may hand out (2^53).
constexpr std::int64_t kMaxGeneratedKey = std::int64_t{1} << 53;

[[nodiscard]] Key decode_primary_key(std::string_view bytes) {
    return codec::decode_key(bytes);
}

} // anonymous namespace

// ── Writes ───────────────────────────────────────────────────────────────────

Key ObjectStore::add(Record value, const std::optional<Key>& key) {
    return write(std::move(value), key, /*overwrite=*/false);
}

Key ObjectStore::put(Record value, const std::optional<Key>& key) {
    return write(std::move(value), key, /*overwrite=*/true);
}

Key ObjectStore::resolve_key(Record& value, const std::optional<Key>& key, bool& generated) {
    generated = false;

    if (def_.key_path) {
        const auto& path = *def_.key_path;
        const auto* in_record = evaluate_key_path(value, path);
        if (key) {
            validate_key(*key, "key");
            if (!in_record) {
                inject_key(value, path, *key);
                return *key;
            }
            if (!is_valid_key(*in_record) || compare_keys(*in_record, *key) != 0) {
                throw EngineError(Errc::invalid_key, fmt::format(
                    "record key at key path '{}' does not match the supplied key {}",
                    path, key->dump()));
            }
            return *key;
        }
        if (in_record) {
            validate_key(*in_record, "record key");
            return *in_record;
        }
        if (!def_.auto_increment) {
            throw EngineError(Errc::invalid_key, fmt::format(
                "record has no key at key path '{}' and store '{}' does not auto-increment",
                path, def_.name));
        }
    } else {
        if (key) {
            validate_key(*key, "key");
            return *key;
        }
        if (!def_.auto_increment) {
            throw EngineError(Errc::invalid_key, fmt::format(
                "store '{}' uses out-of-line keys and no key was supplied", def_.name));
        }
    }

    const auto next = current_generator() + 1;
    if (next > kMaxGeneratedKey) {
        throw EngineError(Errc::constraint_violation, fmt::format(
            "key generator of store '{}' is exhausted", def_.name));
    }
    generated = true;
    Key generated_key = next;
    if (def_.key_path) inject_key(value, *def_.key_path, generated_key);
    return generated_key;
}

Key ObjectStore::write(Record value, const std::optional<Key>& explicit_key, bool overwrite) {
    bool generated = false;
    Key key = resolve_key(value, explicit_key, generated);

    auto record_key = keyspace::record_key(def_.name, key);
    auto existing = txn_.get(record_key);
    if (existing && !overwrite) {
        throw EngineError(Errc::constraint_violation, fmt::format(
            "key {} already exists in store '{}'", key.dump(), def_.name));
    }

    // Unique constraints are checked before anything is written.
    for (const auto& index : def_.indexes) {
        if (!index.unique) continue;
        for (const auto& index_key : index_keys(index, value)) {
            check_unique(index, index_key, key);
        }
    }

    if (existing) {
        erase_index_entries(key, keyspace::decode_record(*existing));
    }
    txn_.put(std::move(record_key), keyspace::encode_record(value));
    write_index_entries(key, value);

    if (def_.auto_increment) {
        if (generated) {
            store_generator(key.get<std::int64_t>());
        } else if (key.is_number()) {
            const double explicit_value = std::floor(key.get<double>());
            if (explicit_value > static_cast<double>(current_generator())) {
                store_generator(explicit_value >= static_cast<double>(kMaxGeneratedKey)
                                    ? kMaxGeneratedKey
                                    : static_cast<std::int64_t>(explicit_value));
            }
        }
    }
    return key;
}

void ObjectStore::del(const Key& key) {
    validate_key(key, "key");
    const auto record_key = keyspace::record_key(def_.name, key);
    auto existing = txn_.get(record_key);
    if (!existing) return;

    erase_index_entries(key, keyspace::decode_record(*existing));
    txn_.del(record_key);
}

void ObjectStore::clear() {
    keyspace::erase_prefix(txn_, keyspace::record_prefix(def_.name));
    keyspace::erase_prefix(txn_, keyspace::store_index_prefix(def_.name));
}

// ── Reads ────────────────────────────────────────────────────────────────────

std::optional<Record> ObjectStore::get(const Key& key) {
    validate_key(key, "key");
    auto bytes = txn_.get(keyspace::record_key(def_.name, key));
    if (!bytes) return std::nullopt;
    return keyspace::decode_record(*bytes);
}

std::vector<Record> ObjectStore::get_all(const KeyRange& range, std::uint32_t count) {
    const auto bounds = keyspace::to_byte_range(keyspace::record_prefix(def_.name), range);

    std::vector<Record> records;
    auto entry = txn_.seek(bounds.begin, SeekMode::AtOrAfter);
    while (entry && entry->key < bounds.end) {
        records.push_back(keyspace::decode_record(entry->value));
        if (count != 0 && records.size() >= count) break;
        entry = txn_.seek(entry->key, SeekMode::After);
    }
    return records;
}

IndexView ObjectStore::index(std::string_view index_name) {
    const auto* def = def_.find_index(index_name);
    if (!def) {
        throw EngineError(Errc::index_not_found, fmt::format(
            "index '{}' not found in store '{}'", index_name, def_.name));
    }
    return IndexView(*this, *def);
}

// ── Index maintenance ────────────────────────────────────────────────────────

std::vector<Key> ObjectStore::index_keys(const IndexDef& index, const Record& record) {
    const auto* value = evaluate_key_path(record, index.key_path);
    if (!value) return {};

    if (index.multi_entry && value->is_array()) {
        std::vector<Key> keys;
        std::set<std::string> seen;
        for (const auto& element : *value) {
            if (!is_valid_key(element)) continue;
            if (seen.insert(codec::encode_key(element)).second) {
                keys.push_back(element);
            }
        }
        return keys;
    }

    if (!is_valid_key(*value)) return {};
    return {*value};
}

void ObjectStore::check_unique(const IndexDef& index, const Key& index_key,
                               const Key& primary_key) {
    auto group = keyspace::index_prefix(def_.name, index.name);
    codec::append_key(group, index_key);

    auto entry = txn_.seek(group, SeekMode::AtOrAfter);
    while (entry && keyspace::starts_with(entry->key, group)) {
        if (compare_keys(decode_primary_key(entry->value), primary_key) != 0) {
            throw EngineError(Errc::constraint_violation, fmt::format(
                "unique index '{}' of store '{}' already contains {}",
                index.name, def_.name, index_key.dump()));
        }
        entry = txn_.seek(entry->key, SeekMode::After);
    }
}

void ObjectStore::write_index_entries(const Key& primary_key, const Record& record) {
    const auto encoded_primary = codec::encode_key(primary_key);
    for (const auto& index : def_.indexes) {
        for (const auto& index_key : index_keys(index, record)) {
            txn_.put(keyspace::index_entry_key(def_.name, index.name, index_key, primary_key),
                     encoded_primary);
        }
    }
}

void ObjectStore::erase_index_entries(const Key& primary_key, const Record& record) {
    for (const auto& index : def_.indexes) {
        for (const auto& index_key : index_keys(index, record)) {
            txn_.del(keyspace::index_entry_key(def_.name, index.name, index_key, primary_key));
        }
    }
}

void ObjectStore::build_index(const IndexDef& index) {
    const auto prefix = keyspace::record_prefix(def_.name);

    auto entry = txn_.seek(prefix, SeekMode::AtOrAfter);
    while (entry && keyspace::starts_with(entry->key, prefix)) {
        std::string_view encoded = entry->key;
        encoded.remove_prefix(prefix.size());
        const auto primary_key = codec::decode_key(encoded);
        const auto record = keyspace::decode_record(entry->value);

        for (const auto& index_key : index_keys(index, record)) {
            if (index.unique) check_unique(index, index_key, primary_key);
            txn_.put(keyspace::index_entry_key(def_.name, index.name, index_key, primary_key),
                     codec::encode_key(primary_key));
        }
        entry = txn_.seek(entry->key, SeekMode::After);
    }
}

// ── Key generator ────────────────────────────────────────────────────────────

std::int64_t ObjectStore::current_generator() {
    auto bytes = txn_.get(keyspace::generator_key(def_.name));
    if (!bytes) return 0;

    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(bytes->data(), bytes->data() + bytes->size(), value);
    if (ec != std::errc{} || ptr != bytes->data() + bytes->size()) {
        throw EngineError(Errc::storage_failure, fmt::format(
            "corrupt key generator for store '{}'", def_.name));
    }
    return value;
}

void ObjectStore::store_generator(std::int64_t value) {
    txn_.put(keyspace::generator_key(def_.name), std::to_string(value));
}

// ── IndexView ────────────────────────────────────────────────────────────────

IndexView::IndexView(ObjectStore& store, const IndexDef& def)
    : store_(store)
    , def_(def)
    , prefix_(keyspace::index_prefix(store.name(), def.name))
{}

std::optional<Key> IndexView::get_key(const Key& key) {
    validate_key(key, "index key");
    auto group = prefix_;
    codec::append_key(group, key);

    auto entry = store_.txn().seek(group, SeekMode::AtOrAfter);
    if (!entry || !keyspace::starts_with(entry->key, group)) return std::nullopt;
    return decode_primary_key(entry->value);
}

std::optional<Record> IndexView::get(const Key& key) {
    auto primary_key = get_key(key);
    if (!primary_key) return std::nullopt;
    return load(*primary_key);
}

std::vector<Record> IndexView::get_all(const KeyRange& range, std::uint32_t count) {
    const auto bounds = keyspace::to_byte_range(prefix_, range);
    auto& txn = store_.txn();

    std::vector<Record> records;
    auto entry = txn.seek(bounds.begin, SeekMode::AtOrAfter);
    while (entry && entry->key < bounds.end) {
        records.push_back(load(decode_primary_key(entry->value)));
        if (count != 0 && records.size() >= count) break;
        entry = txn.seek(entry->key, SeekMode::After);
    }
    return records;
}

Record IndexView::load(const Key& primary_key) {
    auto record = store_.get(primary_key);
    if (!record) {
        throw EngineError(Errc::storage_failure, fmt::format(
            "index '{}' of store '{}' references missing record {}",
            def_.name, store_.name(), primary_key.dump()));
    }
    return std::move(*record);
}

} // namespace rkv
