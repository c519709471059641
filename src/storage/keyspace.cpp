#include "storage/keyspace.hpp"

#include "core/error.hpp"

#include <cstdint>
#include <vector>

namespace rkv::keyspace {

std::string schema_key() {
    std::string out(1, kMetaTag);
    out += "meta";
    return out;
}

std::string record_prefix(std::string_view store) {
    std::string out(1, kRecordTag);
    codec::append_name(out, store);
    return out;
}

std::string record_key(std::string_view store, const Key& key) {
    auto out = record_prefix(store);
    codec::append_key(out, key);
    return out;
}

std::string store_index_prefix(std::string_view store) {
    std::string out(1, kIndexTag);
    codec::append_name(out, store);
    return out;
}

std::string index_prefix(std::string_view store, std::string_view index) {
    auto out = store_index_prefix(store);
    codec::append_name(out, index);
    return out;
}

std::string index_entry_key(std::string_view store, std::string_view index,
                            const Key& index_key, const Key& primary_key) {
    auto out = index_prefix(store, index);
    codec::append_key(out, index_key);
    codec::append_key(out, primary_key);
    return out;
}

std::string generator_key(std::string_view store) {
    std::string out(1, kGeneratorTag);
    codec::append_name(out, store);
    return out;
}

// ── Byte ranges ──────────────────────────────────────────────────────────────

// Every encoded key starts with a type tag below 0xFF, so appending 0xFF
// sorts after all keys that extend the given bytes.
std::string prefix_end(std::string_view prefix) {
    std::string out(prefix);
    out.push_back('\xFF');
    return out;
}

ByteRange to_byte_range(std::string_view prefix, const KeyRange& range) {
    ByteRange out;

    out.begin.assign(prefix);
    if (range.lower) {
        codec::append_key(out.begin, *range.lower);
        if (range.lower_open) out.begin.push_back('\xFF');
    }

    out.end.assign(prefix);
    if (range.upper) {
        codec::append_key(out.end, *range.upper);
        if (!range.upper_open) out.end.push_back('\xFF');
    } else {
        out.end.push_back('\xFF');
    }
    return out;
}

bool starts_with(std::string_view key, std::string_view prefix) noexcept {
    return key.substr(0, prefix.size()) == prefix;
}

std::size_t erase_prefix(EngineTransaction& txn, std::string_view prefix) {
    std::size_t erased = 0;
    auto entry = txn.seek(prefix, SeekMode::AtOrAfter);
    while (entry && starts_with(entry->key, prefix)) {
        txn.del(entry->key);
        ++erased;
        entry = txn.seek(entry->key, SeekMode::After);
    }
    return erased;
}

// ── Records ──────────────────────────────────────────────────────────────────

std::string encode_record(const Record& record) {
    std::string out;
    nlohmann::json::to_msgpack(record, out);
    return out;
}

Record decode_record(std::string_view bytes) {
    try {
        return nlohmann::json::from_msgpack(bytes.begin(), bytes.end());
    } catch (const nlohmann::json::exception& e) {
        throw EngineError(Errc::storage_failure,
                          std::string("corrupt record: ") + e.what());
    }
}

} // namespace rkv::keyspace
