#pragma once

#include "schema/schema.hpp"
#include "storage/storage_engine.hpp"

#include <memory>
#include <optional>
#include <vector>

#include <spdlog/spdlog.h>

namespace rkv {

// Store created when a database is configured without any store.
inline constexpr const char* kDefaultStoreName = "app";

// Reads the persisted schema; std::nullopt for a fresh database.
[[nodiscard]] std::optional<DatabaseSchema> load_schema(EngineTransaction& txn);

void save_schema(EngineTransaction& txn, const DatabaseSchema& schema);

// ── migrate ──────────────────────────────────────────────────────────────────
// Upgrades `stored` to the configured `stores` inside `txn`:
//
//   - stores no longer configured are deleted with their records, index
//     entries and key generator;
//   - missing stores are created with their configured key path and
//     auto-increment flag; existing stores keep theirs;
//   - every index of every configured store is dropped and recreated from
//     its definition, back-filled from the stored records;
//   - no configured stores → a single default store "app".
//
// Returns the resulting schema (name and version copied from `stored`; the
// caller sets them).  A unique-index violation during back-fill throws
// EngineError(constraint_violation); the caller rolls back.

[[nodiscard]] DatabaseSchema migrate(EngineTransaction& txn,
                                     const DatabaseSchema& stored,
                                     const std::vector<StoreDef>& stores,
                                     const std::shared_ptr<spdlog::logger>& logger = {});

} // namespace rkv
