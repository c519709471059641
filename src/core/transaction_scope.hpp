#pragma once

#include "core/error.hpp"
#include "core/key.hpp"
#include "core/object_store.hpp"
#include "core/request.hpp"
#include "core/result.hpp"
#include "schema/schema.hpp"
#include "storage/storage_engine.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

namespace rkv {

class TransactionScope;

// ── Collection ───────────────────────────────────────────────────────────────
//
// The operation surface of one store inside a transaction scope.  Every call
// validates its request (contract violations are thrown before anything is
// issued), then runs as one scope request or one cursor walk.
//
// Valid only while its scope is open; it must not be retained afterwards.

class Collection {
public:
    Collection(TransactionScope& scope, EngineTransaction& txn, StoreDef def)
        : scope_(scope)
        , def_(std::move(def))
        , store_(txn, def_)
    {}

    Collection(const Collection&)            = delete;
    Collection& operator=(const Collection&) = delete;

    [[nodiscard]] const std::string& name() const noexcept { return def_.name; }
    [[nodiscard]] const StoreDef& def() const noexcept { return def_; }

    [[nodiscard]] boost::asio::awaitable<Result> fetch(OperationRequest request);
    [[nodiscard]] boost::asio::awaitable<Result> upsert(OperationRequest request);
    [[nodiscard]] boost::asio::awaitable<Result> remove(OperationRequest request);

    // Inserts a new record; fails with constraint_violation if the key exists.
    [[nodiscard]] boost::asio::awaitable<Key> add(Record value,
                                                  std::optional<Key> key = std::nullopt);

private:
    TransactionScope& scope_;
    StoreDef def_;
    ObjectStore store_;
};

// ── TransactionScope ─────────────────────────────────────────────────────────
//
// One read-write engine transaction over a fixed set of stores, shared by
// every operation the caller's logic starts.  All requests run on the scope's
// executor and are serialized into the engine transaction; each one suspends
// once (a post to the executor) before touching the engine.
//
// Lifecycle:  Open → Committing → Completed,  or  Open → Aborted.
//
// The scope counts in-flight requests so the coordinator can wait for every
// request (including ones the logic never awaited) before committing.  The
// first non-contract failure of any request is recorded and makes the whole
// transaction roll back.
//
// NOT thread-safe: driven from one executor.

enum class ScopeState : uint8_t { Open, Committing, Completed, Aborted };

[[nodiscard]] std::string_view to_string(ScopeState s) noexcept;

class TransactionScope {
public:
    // Throws ContractViolation(unknown_collection) if a name is not a store
    // of `schema`.  Empty `names` selects every store.
    TransactionScope(boost::asio::any_io_executor executor,
                     std::unique_ptr<EngineTransaction> txn,
                     const DatabaseSchema& schema,
                     std::vector<std::string> names,
                     std::shared_ptr<spdlog::logger> logger = {});

    // Rolls back if the scope was never finished.
    ~TransactionScope();

    TransactionScope(const TransactionScope&)            = delete;
    TransactionScope& operator=(const TransactionScope&) = delete;

    // Throws ContractViolation(unknown_collection) for a name outside the scope.
    [[nodiscard]] Collection& collection(std::string_view name);
    [[nodiscard]] Collection& operator[](std::string_view name) { return collection(name); }

    [[nodiscard]] const std::vector<std::string>& names() const noexcept { return names_; }
    [[nodiscard]] ScopeState state() const noexcept { return state_; }
    [[nodiscard]] std::size_t pending() const noexcept { return pending_; }
    [[nodiscard]] const boost::asio::any_io_executor& executor() const noexcept { return executor_; }

    // Aborts the transaction: rolls back and fails every pending and later
    // request.  Throws ContractViolation(transaction_inactive) if not open.
    void abort();

    // Runs `fn` as one request of this scope.  The request suspends once on
    // the executor, then runs `fn` synchronously against the engine.
    //   - ContractViolation propagates without failing the scope;
    //   - any other exception is recorded as the scope failure and rethrown.
    template <typename F>
    [[nodiscard]] boost::asio::awaitable<std::invoke_result_t<F&>> issue(F fn);

    // ── Coordinator hooks ────────────────────────────────────────────────────

    // Completes once no request is in flight.
    [[nodiscard]] boost::asio::awaitable<void> drain();

    // First recorded failure, or nullptr.
    [[nodiscard]] std::exception_ptr failure() const noexcept { return failure_; }

    // Commits the engine transaction.  On failure the scope is Aborted and
    // the engine error propagates.
    void commit();

    // Rolls back unless already finished.
    void rollback();

private:
    // Counts one in-flight request for the lifetime of the guard.
    class PendingGuard {
    public:
        explicit PendingGuard(TransactionScope& scope) : scope_(scope) { ++scope_.pending_; }
        ~PendingGuard() { scope_.request_done(); }

        PendingGuard(const PendingGuard&)            = delete;
        PendingGuard& operator=(const PendingGuard&) = delete;

    private:
        TransactionScope& scope_;
    };

    void ensure_open() const;
    void ensure_not_aborted() const;
    void record_failure(std::exception_ptr error);
    void request_done();

    boost::asio::any_io_executor executor_;
    std::unique_ptr<EngineTransaction> txn_;
    std::vector<std::string> names_;
    std::map<std::string, std::unique_ptr<Collection>, std::less<>> collections_;
    std::shared_ptr<spdlog::logger> logger_;

    ScopeState state_ = ScopeState::Open;
    std::size_t pending_ = 0;
    boost::asio::steady_timer* idle_signal_ = nullptr;
    std::exception_ptr failure_;
};

// ── issue() ──────────────────────────────────────────────────────────────────

template <typename F>
boost::asio::awaitable<std::invoke_result_t<F&>> TransactionScope::issue(F fn) {
    using R = std::invoke_result_t<F&>;

    ensure_open();
    PendingGuard guard(*this);

    co_await boost::asio::post(executor_, boost::asio::use_awaitable);

    try {
        ensure_not_aborted();
        if constexpr (std::is_void_v<R>) {
            fn();
        } else {
            co_return fn();
        }
    } catch (const ContractViolation&) {
        throw;
    } catch (...) {
        record_failure(std::current_exception());
        throw;
    }
}

} // namespace rkv
