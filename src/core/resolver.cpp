#include "core/resolver.hpp"

#include "core/cursor_engine.hpp"
#include "core/error.hpp"
#include "core/key_range.hpp"
#include "core/transaction_scope.hpp"

#include <utility>

#include <fmt/format.h>

namespace rkv {

using boost::asio::awaitable;

// ── Guards ───────────────────────────────────────────────────────────────────

FetchShape resolve_fetch(const OperationRequest& request) noexcept {
    const bool key   = request.key.has_value();
    const bool index = request.index.has_value();
    const bool where = request.where.has_value();

    if (key && !index && !where)      return FetchShape::KeyLookup;
    if (!key && !index && !where)     return FetchShape::StoreRange;
    if (key && index && !where)       return FetchShape::IndexKeyLookup;
    if (!key && index && !where)      return FetchShape::IndexRange;
    return FetchShape::Cursor;
}

UpsertShape resolve_upsert(const OperationRequest& request) noexcept {
    const bool value = request.value.has_value();
    const bool index = request.index.has_value();
    const bool where = request.where.has_value();

    if (value && !where && !index)    return UpsertShape::DirectWrite;
    if (where)                        return UpsertShape::CursorUpdate;
    return UpsertShape::Unsupported;
}

RemoveShape resolve_remove(const OperationRequest& request) noexcept {
    const bool key   = request.key.has_value();
    const bool index = request.index.has_value();
    const bool where = request.where.has_value();

    if (key && !where && !index)      return RemoveShape::DirectDelete;
    if (where)                        return RemoveShape::CursorDelete;
    if (!key && !index)               return RemoveShape::Clear;
    return RemoveShape::Unsupported;
}

std::string_view to_string(FetchShape s) noexcept {
    switch (s) {
        case FetchShape::KeyLookup:      return "key lookup";
        case FetchShape::StoreRange:     return "store range";
        case FetchShape::IndexKeyLookup: return "index key lookup";
        case FetchShape::IndexRange:     return "index range";
        case FetchShape::Cursor:         return "cursor";
    }
    return "cursor";
}

std::string_view to_string(UpsertShape s) noexcept {
    switch (s) {
        case UpsertShape::DirectWrite:  return "direct write";
        case UpsertShape::CursorUpdate: return "cursor update";
        case UpsertShape::Unsupported:  return "unsupported";
    }
    return "unsupported";
}

std::string_view to_string(RemoveShape s) noexcept {
    switch (s) {
        case RemoveShape::DirectDelete: return "direct delete";
        case RemoveShape::CursorDelete: return "cursor delete";
        case RemoveShape::Clear:        return "clear";
        case RemoveShape::Unsupported:  return "unsupported";
    }
    return "unsupported";
}

// ── Helpers ──────────────────────────────────────────────────────────────────

namespace {

[[noreturn]] void unsupported(std::string_view operation, const ObjectStore& store,
                              const OperationRequest& request) {
    std::string fields;
    auto mark = [&fields](bool present, std::string_view name) {
        if (!present) return;
        if (!fields.empty()) fields += ", ";
        fields += name;
    };
    mark(request.key.has_value(),   "key");
    mark(request.value.has_value(), "value");
    mark(request.index.has_value(), "index");
    mark(request.where.has_value(), "where");

    throw ContractViolation(Errc::unsupported_combination, fmt::format(
        "{} on store '{}' does not support the option combination [{}]",
        operation, store.name(), fields));
}

// The predicate must be callable before a walk starts.
const Predicate& callable_predicate(const OperationRequest& request) {
    if (!*request.where) {
        throw ContractViolation(Errc::predicate_not_callable, "where must be a function");
    }
    return *request.where;
}

[[nodiscard]] Cursor open_cursor(ObjectStore& store, const OperationRequest& request) {
    const auto range = build_range(request.query);
    if (request.index) {
        return Cursor(store, store.index(*request.index), range, request.direction);
    }
    return Cursor(store, range, request.direction);
}

} // anonymous namespace

// ── fetch ────────────────────────────────────────────────────────────────────

awaitable<Result> execute_fetch(TransactionScope& scope, ObjectStore& store,
                                OperationRequest request) {
    const auto count = request.count.value_or(0);

    switch (resolve_fetch(request)) {
        case FetchShape::KeyLookup: {
            auto record = co_await scope.issue([&] { return store.get(*request.key); });
            if (!record) co_return NotFoundResult{};
            co_return RecordResult{std::move(*record)};
        }

        case FetchShape::StoreRange: {
            auto records = co_await scope.issue([&] {
                return store.get_all(build_range(request.query), count);
            });
            co_return RecordsResult{std::move(records)};
        }

        case FetchShape::IndexKeyLookup: {
            auto record = co_await scope.issue([&] {
                return store.index(*request.index).get(*request.key);
            });
            if (!record) co_return NotFoundResult{};
            co_return RecordResult{std::move(*record)};
        }

        case FetchShape::IndexRange: {
            auto records = co_await scope.issue([&] {
                return store.index(*request.index).get_all(build_range(request.query), count);
            });
            co_return RecordsResult{std::move(records)};
        }

        case FetchShape::Cursor: {
            const auto& where = callable_predicate(request);
            auto cursor = co_await scope.issue([&] { return open_cursor(store, request); });
            auto results = co_await walk_fetch(scope, cursor, where, count);
            co_return RecordsResult{std::move(results)};
        }
    }
    co_return NotFoundResult{};
}

// ── upsert ───────────────────────────────────────────────────────────────────

awaitable<Result> execute_upsert(TransactionScope& scope, ObjectStore& store,
                                 OperationRequest request) {
    switch (resolve_upsert(request)) {
        case UpsertShape::DirectWrite: {
            auto key = co_await scope.issue([&] {
                return store.put(std::move(*request.value), request.key);
            });
            co_return KeyResult{std::move(key)};
        }

        case UpsertShape::CursorUpdate: {
            const auto& where = callable_predicate(request);
            auto cursor = co_await scope.issue([&] { return open_cursor(store, request); });
            auto keys = co_await walk_update(scope, cursor, where);
            co_return KeysResult{std::move(keys)};
        }

        case UpsertShape::Unsupported:
            break;
    }
    unsupported("upsert", store, request);
}

// ── remove ───────────────────────────────────────────────────────────────────

awaitable<Result> execute_remove(TransactionScope& scope, ObjectStore& store,
                                 OperationRequest request) {
    switch (resolve_remove(request)) {
        case RemoveShape::DirectDelete:
            co_await scope.issue([&] { store.del(*request.key); });
            co_return NoResult{};

        case RemoveShape::CursorDelete: {
            const auto& where = callable_predicate(request);
            auto cursor = co_await scope.issue([&] { return open_cursor(store, request); });
            co_await walk_remove(scope, cursor, where);
            co_return NoResult{};
        }

        case RemoveShape::Clear:
            co_await scope.issue([&] { store.clear(); });
            co_return NoResult{};

        case RemoveShape::Unsupported:
            break;
    }
    unsupported("remove", store, request);
}

} // namespace rkv
