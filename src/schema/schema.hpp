#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace rkv {

// ── IndexDef ─────────────────────────────────────────────────────────────────
// A secondary index over one key path of a store's records.

struct IndexDef {
    std::string name;
    std::string key_path;       // defaults to `name` when built from JSON
    bool unique      = false;
    bool multi_entry = false;   // index every element of an array value

    bool operator==(const IndexDef&) const = default;
};

// ── StoreDef ─────────────────────────────────────────────────────────────────
// One object store (collection).  `key_path` absent means out-of-line keys:
// every write supplies its key explicitly unless the store auto-increments.

struct StoreDef {
    std::string name;
    std::optional<std::string> key_path = std::string{"id"};
    bool auto_increment = true;
    std::vector<IndexDef> indexes;

    [[nodiscard]] const IndexDef* find_index(std::string_view index_name) const;

    bool operator==(const StoreDef&) const = default;
};

// ── DatabaseSchema ───────────────────────────────────────────────────────────
// The persisted shape of a database: its version and the stores it holds.
// Only the migration path in Database::open() mutates it.

struct DatabaseSchema {
    std::string name;
    uint32_t version = 0;   // 0 = never created
    std::vector<StoreDef> stores;

    [[nodiscard]] const StoreDef* find_store(std::string_view store_name) const;
    [[nodiscard]] std::vector<std::string> store_names() const;
};

// JSON form used both for persistence and for DatabaseConfig files:
//   {"name": "users", "options": {"keyPath": "id", "autoIncrement": true},
//    "indexes": [{"name": "email", "keyPath": "email", "unique": true}]}
void to_json(nlohmann::json& j, const IndexDef& def);
void to_json(nlohmann::json& j, const StoreDef& def);
void to_json(nlohmann::json& j, const DatabaseSchema& schema);

// Throw std::runtime_error naming the offending store/index on malformed input.
[[nodiscard]] IndexDef parse_index_def(const nlohmann::json& j, std::string_view store_name);
[[nodiscard]] StoreDef parse_store_def(const nlohmann::json& j);
[[nodiscard]] DatabaseSchema parse_schema(const nlohmann::json& j);

// Throws ContractViolation(invalid_identifier) for an empty store or index
// name; `what` names the kind of identifier in the message.
void validate_identifier(std::string_view name, std::string_view what);

} // namespace rkv
