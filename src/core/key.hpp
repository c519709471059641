#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace rkv {

// A record is any JSON value; a key is a JSON value restricted to finite
// numbers, strings and arrays of keys.
using Record = nlohmann::json;
using Key    = nlohmann::json;

[[nodiscard]] bool is_valid_key(const Key& key);

// Throws EngineError(invalid_key) naming `what` when `key` is not a valid key.
void validate_key(const Key& key, std::string_view what);

// Three-way comparison in key order (numbers < strings < arrays).
// Both arguments must be valid keys.
[[nodiscard]] int compare_keys(const Key& a, const Key& b);

// ── Key paths ────────────────────────────────────────────────────────────────
//
// A key path is a dotted sequence of member names ("id", "owner.id").  The
// empty path designates the record itself.

// Returns the value at `path`, or nullptr when any segment is missing.
[[nodiscard]] const nlohmann::json* evaluate_key_path(const Record& record,
                                                     std::string_view path);

// Stores `key` at `path`, creating intermediate objects.  Throws
// EngineError(invalid_key) if a segment crosses a non-object value.
void inject_key(Record& record, std::string_view path, const Key& key);

// ── Order-preserving codec ───────────────────────────────────────────────────
//
// Encoded keys compare bytewise in key order and are self-delimiting, so an
// encoded key can be followed by further encoded components.
//
//   number : 0x10 + 8-byte big-endian double with the sign bit flipped
//            (all bits inverted for negatives)
//   string : 0x20 + bytes, 0x00 escaped as 0x00 0xFF, terminated by 0x00 0x00
//   array  : 0x30 + encoded elements + 0x00

namespace codec {

void append_key(std::string& out, const Key& key);

[[nodiscard]] std::string encode_key(const Key& key);

// Decodes one key from the front of `in` and advances `in` past it.
// Throws EngineError(storage_failure) on malformed input.
[[nodiscard]] Key decode_key(std::string_view& in);

// Appends an escaped, terminated name (store or index name).
void append_name(std::string& out, std::string_view name);

} // namespace codec

} // namespace rkv
