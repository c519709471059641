#pragma once

#include "core/scope_gate.hpp"
#include "core/transaction_scope.hpp"
#include "schema/schema.hpp"
#include "storage/storage_engine.hpp"

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include <spdlog/spdlog.h>

namespace rkv {

// Value type of the awaitable returned by transactional logic:
//   Logic = callable (TransactionScope&) → boost::asio::awaitable<T>.
template <typename Logic>
using logic_value_t =
    typename std::invoke_result_t<Logic&, TransactionScope&>::value_type;

// ── TransactionCoordinator ───────────────────────────────────────────────────
//
// Runs caller logic inside one TransactionScope and settles the outcome:
//
//   1. wait until no earlier scope over any of the same stores is still
//      running, then open a scope over `names` (every store when empty) and
//      run the logic;
//   2. once the logic settles, wait for every request started in the scope;
//   3. a recorded request failure (or an explicit abort) rolls back and wins
//      over any logic result;
//   4. otherwise commit; a commit failure propagates as EngineError;
//   5. a failed logic rethrows its error (work done before it is committed);
//   6. otherwise yield the logic's value.

class TransactionCoordinator {
public:
    TransactionCoordinator(StorageEngine& engine,
                           boost::asio::any_io_executor executor,
                           const DatabaseSchema& schema,
                           std::shared_ptr<spdlog::logger> logger = {})
        : engine_(engine)
        , executor_(std::move(executor))
        , schema_(schema)
        , logger_(std::move(logger))
        , gate_(executor_)
    {}

    template <typename Logic>
    [[nodiscard]] boost::asio::awaitable<logic_value_t<Logic>>
    run(std::vector<std::string> names, Logic logic);

    // No logic: opens and completes an empty scope, yields the store names.
    [[nodiscard]] boost::asio::awaitable<std::vector<std::string>>
    run(std::vector<std::string> names);

    // Throws ContractViolation for an empty or unknown store name; an empty
    // list stands for every store.
    [[nodiscard]] std::vector<std::string> resolve_names(std::vector<std::string> names) const;

    [[nodiscard]] std::unique_ptr<TransactionScope> open_scope(std::vector<std::string> names);

    // Scopes running or waiting for their stores.
    [[nodiscard]] std::size_t scopes_in_flight() const noexcept { return gate_.size(); }

    // Steps 2–5 above.
    [[nodiscard]] boost::asio::awaitable<void> finish(TransactionScope& scope,
                                                      std::exception_ptr logic_error);

private:
    StorageEngine& engine_;
    boost::asio::any_io_executor executor_;
    const DatabaseSchema& schema_;
    std::shared_ptr<spdlog::logger> logger_;
    ScopeGate gate_;
};

template <typename Logic>
boost::asio::awaitable<logic_value_t<Logic>>
TransactionCoordinator::run(std::vector<std::string> names, Logic logic) {
    using T = logic_value_t<Logic>;

    names = resolve_names(std::move(names));
    auto lease = co_await gate_.acquire(names);
    auto scope = open_scope(std::move(names));
    std::exception_ptr logic_error;

    if constexpr (std::is_void_v<T>) {
        try {
            co_await logic(*scope);
        } catch (...) {
            logic_error = std::current_exception();
        }
        co_await finish(*scope, logic_error);
    } else {
        std::optional<T> value;
        try {
            value.emplace(co_await logic(*scope));
        } catch (...) {
            logic_error = std::current_exception();
        }
        co_await finish(*scope, logic_error);
        co_return std::move(*value);
    }
}

} // namespace rkv
