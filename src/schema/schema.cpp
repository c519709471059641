#include "schema/schema.hpp"

#include "core/error.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace rkv {

// ── Lookups ──────────────────────────────────────────────────────────────────

const IndexDef* StoreDef::find_index(std::string_view index_name) const {
    for (const auto& index : indexes) {
        if (index.name == index_name) return &index;
    }
    return nullptr;
}

const StoreDef* DatabaseSchema::find_store(std::string_view store_name) const {
    for (const auto& store : stores) {
        if (store.name == store_name) return &store;
    }
    return nullptr;
}

std::vector<std::string> DatabaseSchema::store_names() const {
    std::vector<std::string> names;
    names.reserve(stores.size());
    for (const auto& store : stores) names.push_back(store.name);
    return names;
}

void validate_identifier(std::string_view name, std::string_view what) {
    if (name.empty()) {
        throw ContractViolation(Errc::invalid_identifier,
                                fmt::format("{} name must be a non-empty string", what));
    }
}

// ── Serialization ────────────────────────────────────────────────────────────

void to_json(nlohmann::json& j, const IndexDef& def) {
    j = nlohmann::json{
        {"name",       def.name},
        {"keyPath",    def.key_path},
        {"unique",     def.unique},
        {"multiEntry", def.multi_entry},
    };
}

void to_json(nlohmann::json& j, const StoreDef& def) {
    nlohmann::json options = nlohmann::json::object();
    options["keyPath"] = def.key_path ? nlohmann::json(*def.key_path) : nlohmann::json(nullptr);
    options["autoIncrement"] = def.auto_increment;

    j = nlohmann::json{
        {"name",    def.name},
        {"options", std::move(options)},
        {"indexes", def.indexes},
    };
}

void to_json(nlohmann::json& j, const DatabaseSchema& schema) {
    j = nlohmann::json{
        {"name",    schema.name},
        {"version", schema.version},
        {"stores",  schema.stores},
    };
}

// ── Parsing ──────────────────────────────────────────────────────────────────

namespace {

[[nodiscard]] bool optional_bool(const nlohmann::json& j, const char* field,
                                 bool fallback, std::string_view context) {
    auto it = j.find(field);
    if (it == j.end()) return fallback;
    if (!it->is_boolean()) {
        throw std::runtime_error(
            fmt::format("{} has invalid \"{}\". Expected a boolean.", context, field));
    }
    return it->get<bool>();
}

} // anonymous namespace

IndexDef parse_index_def(const nlohmann::json& j, std::string_view store_name) {
    if (!j.is_object()) {
        throw std::runtime_error(fmt::format(
            "Store \"{}\" has an invalid index definition. Expected an object.", store_name));
    }
    auto name = j.find("name");
    if (name == j.end() || !name->is_string()) {
        throw std::runtime_error(fmt::format(
            "Store \"{}\" has an index without a name.", store_name));
    }

    IndexDef def;
    def.name = name->get<std::string>();
    validate_identifier(def.name, "index");

    const auto context = fmt::format("Index \"{}\" of store \"{}\"", def.name, store_name);
    def.key_path = def.name;
    if (auto kp = j.find("keyPath"); kp != j.end()) {
        if (!kp->is_string()) {
            throw std::runtime_error(
                fmt::format("{} has invalid \"keyPath\". Expected a string.", context));
        }
        def.key_path = kp->get<std::string>();
    }
    def.unique      = optional_bool(j, "unique", false, context);
    def.multi_entry = optional_bool(j, "multiEntry", false, context);
    return def;
}

StoreDef parse_store_def(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Invalid store definition. Expected an object.");
    }
    auto name = j.find("name");
    if (name == j.end() || !name->is_string()) {
        throw std::runtime_error("Invalid store definition. Expected \"name\" to be a string.");
    }

    StoreDef def;
    def.name = name->get<std::string>();
    validate_identifier(def.name, "store");

    nlohmann::json options = nlohmann::json::object();
    if (auto it = j.find("options"); it != j.end()) {
        if (!it->is_object()) {
            throw std::runtime_error(fmt::format(
                "Store \"{}\" has invalid options. Expected options to be an object.", def.name));
        }
        options = *it;
    }

    const auto context = fmt::format("Store \"{}\"", def.name);
    if (auto kp = options.find("keyPath"); kp != options.end()) {
        if (kp->is_null()) {
            def.key_path.reset();
        } else if (kp->is_string()) {
            def.key_path = kp->get<std::string>();
        } else {
            throw std::runtime_error(fmt::format(
                "{} has invalid \"keyPath\". Expected a string or null.", context));
        }
    }
    def.auto_increment = optional_bool(options, "autoIncrement",
                                       def.key_path && *def.key_path == "id", context);

    if (def.auto_increment && def.key_path && def.key_path->empty()) {
        throw std::runtime_error(fmt::format(
            "{} cannot auto-increment with an empty key path.", context));
    }

    if (auto it = j.find("indexes"); it != j.end()) {
        if (!it->is_array()) {
            throw std::runtime_error(fmt::format(
                "Store \"{}\" has invalid indexes definition. Expected indexes to be an array.",
                def.name));
        }
        for (const auto& index : *it) {
            auto parsed = parse_index_def(index, def.name);
            if (def.find_index(parsed.name)) {
                throw std::runtime_error(fmt::format(
                    "Store \"{}\" defines index \"{}\" more than once.", def.name, parsed.name));
            }
            def.indexes.push_back(std::move(parsed));
        }
    }
    return def;
}

DatabaseSchema parse_schema(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Invalid schema document. Expected an object.");
    }
    DatabaseSchema schema;
    schema.name    = j.value("name", std::string{});
    schema.version = j.value("version", uint32_t{0});
    for (const auto& store : j.value("stores", nlohmann::json::array())) {
        schema.stores.push_back(parse_store_def(store));
    }
    return schema;
}

} // namespace rkv
