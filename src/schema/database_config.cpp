#include "schema/database_config.hpp"

#include <fstream>
#include <set>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace rkv {

DatabaseConfig::DatabaseConfig(std::string name, uint32_t version, std::vector<StoreDef> stores)
    : name_(std::move(name))
    , version_(version)
    , stores_(std::move(stores))
{
    validate_identifier(name_, "database");
    if (version_ == 0) {
        throw std::runtime_error("db version must be > 0");
    }

    std::set<std::string, std::less<>> seen;
    for (const auto& store : stores_) {
        validate_identifier(store.name, "store");
        if (!seen.insert(store.name).second) {
            throw std::runtime_error(
                fmt::format("Store \"{}\" is defined more than once", store.name));
        }
        for (const auto& index : store.indexes) {
            validate_identifier(index.name, "index");
        }
    }
}

DatabaseConfig parse_database_config(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Database config must be a JSON object");
    }

    std::string name = DatabaseConfig::kDefaultName;
    if (auto it = j.find("name"); it != j.end()) {
        if (!it->is_string()) throw std::runtime_error("db name must be a string");
        name = it->get<std::string>();
    }

    uint32_t version = DatabaseConfig::kDefaultVersion;
    if (auto it = j.find("version"); it != j.end()) {
        if (!it->is_number_unsigned() && !it->is_number_integer()) {
            throw std::runtime_error("db version must be a number");
        }
        const auto v = it->get<int64_t>();
        if (v <= 0 || v > static_cast<int64_t>(UINT32_MAX)) {
            throw std::runtime_error(fmt::format("db version must be in [1, {}], got {}",
                                                 UINT32_MAX, v));
        }
        version = static_cast<uint32_t>(v);
    }

    std::vector<StoreDef> stores;
    if (auto it = j.find("stores"); it != j.end()) {
        if (!it->is_array()) throw std::runtime_error("db stores must be an array");
        for (const auto& store : *it) {
            stores.push_back(parse_store_def(store));
        }
    }

    return DatabaseConfig(std::move(name), version, std::move(stores));
}

DatabaseConfig load_database_config(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error(
            fmt::format("Cannot open database config '{}'", path.string()));
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(
            fmt::format("Invalid JSON in '{}': {}", path.string(), e.what()));
    }
    return parse_database_config(j);
}

} // namespace rkv
