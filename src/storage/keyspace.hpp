#pragma once

#include "core/key.hpp"
#include "core/key_range.hpp"
#include "storage/storage_engine.hpp"

#include <string>
#include <string_view>

namespace rkv::keyspace {

// ── Layout ───────────────────────────────────────────────────────────────────
//
// All databases data lives in one ordered byte keyspace:
//
//   0x01 "meta"                                   → schema JSON
//   0x02 name(store) enc(key)                     → MessagePack record
//   0x03 name(store) name(index) enc(value) enc(key) → enc(key)
//   0x04 name(store)                              → key generator (decimal)
//
// name() is the escaped, terminated form from codec::append_name, so no
// store prefix is a prefix of another store's.

inline constexpr char kMetaTag      = '\x01';
inline constexpr char kRecordTag    = '\x02';
inline constexpr char kIndexTag     = '\x03';
inline constexpr char kGeneratorTag = '\x04';

[[nodiscard]] std::string schema_key();

[[nodiscard]] std::string record_prefix(std::string_view store);
[[nodiscard]] std::string record_key(std::string_view store, const Key& key);

// Prefix of every index entry of `store` (all its indexes).
[[nodiscard]] std::string store_index_prefix(std::string_view store);
[[nodiscard]] std::string index_prefix(std::string_view store, std::string_view index);
[[nodiscard]] std::string index_entry_key(std::string_view store, std::string_view index,
                                          const Key& index_key, const Key& primary_key);

[[nodiscard]] std::string generator_key(std::string_view store);

// ── Byte ranges ──────────────────────────────────────────────────────────────

// Half-open byte interval [begin, end).  Empty when begin >= end.
struct ByteRange {
    std::string begin;
    std::string end;
};

// Smallest string greater than every key that starts with `prefix`
// followed by an encoded key.
[[nodiscard]] std::string prefix_end(std::string_view prefix);

// Byte interval covering `prefix` + enc(k) for every k in `range`, including
// any suffix appended after the encoded key (the primary key of index
// entries).
[[nodiscard]] ByteRange to_byte_range(std::string_view prefix, const KeyRange& range);

[[nodiscard]] bool starts_with(std::string_view key, std::string_view prefix) noexcept;

// Deletes every key starting with `prefix`.  Returns the number deleted.
std::size_t erase_prefix(EngineTransaction& txn, std::string_view prefix);

// ── Records ──────────────────────────────────────────────────────────────────

[[nodiscard]] std::string encode_record(const Record& record);

// Throws EngineError(storage_failure) on a corrupt value.
[[nodiscard]] Record decode_record(std::string_view bytes);

} // namespace rkv::keyspace
