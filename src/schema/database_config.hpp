#pragma once

#include "schema/schema.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace rkv {

// ── DatabaseConfig ───────────────────────────────────────────────────────────
// Immutable description of the database to open: its name, the schema
// version, and the stores that version defines.  Validated once on
// construction.
//
// Throws:
//   ContractViolation(invalid_identifier) – empty database, store or index name
//   std::runtime_error                    – version 0, duplicate store names

class DatabaseConfig {
public:
    static constexpr const char* kDefaultName = "idb";
    static constexpr uint32_t    kDefaultVersion = 1;

    explicit DatabaseConfig(std::string name = kDefaultName,
                            uint32_t version = kDefaultVersion,
                            std::vector<StoreDef> stores = {});

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] uint32_t version() const noexcept { return version_; }
    [[nodiscard]] const std::vector<StoreDef>& stores() const noexcept { return stores_; }

private:
    std::string name_;
    uint32_t version_;
    std::vector<StoreDef> stores_;
};

// Builds a config from its JSON form:
//   {"name": "todo-db", "version": 2,
//    "stores": [{"name": "todos", "options": {...}, "indexes": [...]}]}
// Missing "name"/"version" take the defaults.  Throws std::runtime_error
// with a message naming the offending field.
[[nodiscard]] DatabaseConfig parse_database_config(const nlohmann::json& j);

// Reads and parses a JSON config file.
[[nodiscard]] DatabaseConfig load_database_config(const std::filesystem::path& path);

} // namespace rkv
