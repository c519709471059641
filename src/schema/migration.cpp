#include "schema/migration.hpp"

#include "core/error.hpp"
#include "core/object_store.hpp"
#include "storage/keyspace.hpp"

#include <algorithm>

namespace rkv {

std::optional<DatabaseSchema> load_schema(EngineTransaction& txn) {
    auto bytes = txn.get(keyspace::schema_key());
    if (!bytes) return std::nullopt;

    try {
        return parse_schema(nlohmann::json::parse(*bytes));
    } catch (const nlohmann::json::exception& e) {
        throw EngineError(Errc::storage_failure,
                          std::string("corrupt schema metadata: ") + e.what());
    } catch (const std::runtime_error& e) {
        throw EngineError(Errc::storage_failure,
                          std::string("corrupt schema metadata: ") + e.what());
    }
}

void save_schema(EngineTransaction& txn, const DatabaseSchema& schema) {
    txn.put(keyspace::schema_key(), nlohmann::json(schema).dump());
}

namespace {

void drop_store(EngineTransaction& txn, const std::string& name) {
    keyspace::erase_prefix(txn, keyspace::record_prefix(name));
    keyspace::erase_prefix(txn, keyspace::store_index_prefix(name));
    txn.del(keyspace::generator_key(name));
}

} // anonymous namespace

DatabaseSchema migrate(EngineTransaction& txn,
                       const DatabaseSchema& stored,
                       const std::vector<StoreDef>& stores,
                       const std::shared_ptr<spdlog::logger>& logger) {
    std::vector<StoreDef> desired = stores;
    if (desired.empty()) {
        StoreDef fallback;
        fallback.name = kDefaultStoreName;
        desired.push_back(std::move(fallback));
    }

    for (const auto& existing : stored.stores) {
        const bool kept = std::any_of(desired.begin(), desired.end(),
            [&](const StoreDef& def) { return def.name == existing.name; });
        if (kept) continue;

        drop_store(txn, existing.name);
        if (logger) {
            logger->info("migration: deleted store '{}'", existing.name);
        }
    }

    DatabaseSchema result;
    result.name    = stored.name;
    result.version = stored.version;

    for (const auto& def : desired) {
        StoreDef store = def;
        if (const auto* existing = stored.find_store(def.name)) {
            store.key_path       = existing->key_path;
            store.auto_increment = existing->auto_increment;
            keyspace::erase_prefix(txn, keyspace::store_index_prefix(def.name));
        } else if (logger) {
            logger->info("migration: created store '{}'", def.name);
        }

        ObjectStore object_store(txn, store);
        for (const auto& index : store.indexes) {
            object_store.build_index(index);
            if (logger) {
                logger->debug("migration: built index '{}' on store '{}'",
                              index.name, store.name);
            }
        }
        result.stores.push_back(std::move(store));
    }
    return result;
}

} // namespace rkv
