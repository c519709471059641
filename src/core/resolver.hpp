#pragma once

#include "core/object_store.hpp"
#include "core/request.hpp"
#include "core/result.hpp"

#include <cstdint>
#include <string_view>

#include <boost/asio/awaitable.hpp>

namespace rkv {

class TransactionScope;

// ── Operation shapes ─────────────────────────────────────────────────────────
//
// Which fields of an OperationRequest are present selects exactly one
// variant.  The resolve_* functions are pure guards evaluated in order (first
// match wins); execute_* switch on the shape and issue the matching request.
// A present `where` always selects the cursor variant, whatever else is set.
// `value` plays no part in fetch or remove.

enum class FetchShape : uint8_t {
    KeyLookup,       // key
    StoreRange,      // (nothing) → every record, bounded by query
    IndexKeyLookup,  // key + index
    IndexRange,      // index → records via index, bounded by query
    Cursor,          // where (+ index, key ignored)
};

enum class UpsertShape : uint8_t {
    DirectWrite,     // value (+ key)
    CursorUpdate,    // where (+ index, key and value ignored)
    Unsupported,
};

enum class RemoveShape : uint8_t {
    DirectDelete,    // key
    CursorDelete,    // where (+ index, key ignored)
    Clear,           // (nothing)
    Unsupported,
};

[[nodiscard]] FetchShape  resolve_fetch(const OperationRequest& request) noexcept;
[[nodiscard]] UpsertShape resolve_upsert(const OperationRequest& request) noexcept;
[[nodiscard]] RemoveShape resolve_remove(const OperationRequest& request) noexcept;

[[nodiscard]] std::string_view to_string(FetchShape s) noexcept;
[[nodiscard]] std::string_view to_string(UpsertShape s) noexcept;
[[nodiscard]] std::string_view to_string(RemoveShape s) noexcept;

// ── Execution ────────────────────────────────────────────────────────────────
//
// Results per shape:
//   fetch   KeyLookup/IndexKeyLookup → RecordResult or NotFoundResult
//           StoreRange/IndexRange/Cursor → RecordsResult
//   upsert  DirectWrite → KeyResult;  CursorUpdate → KeysResult
//   remove  every shape → NoResult
//
// An Unsupported shape throws ContractViolation(unsupported_combination); an
// empty predicate throws ContractViolation(predicate_not_callable).  Both are
// raised before any request is issued.

[[nodiscard]] boost::asio::awaitable<Result>
execute_fetch(TransactionScope& scope, ObjectStore& store, OperationRequest request);

[[nodiscard]] boost::asio::awaitable<Result>
execute_upsert(TransactionScope& scope, ObjectStore& store, OperationRequest request);

[[nodiscard]] boost::asio::awaitable<Result>
execute_remove(TransactionScope& scope, ObjectStore& store, OperationRequest request);

} // namespace rkv
