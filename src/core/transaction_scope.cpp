#include "core/transaction_scope.hpp"

#include "core/resolver.hpp"

#include <boost/asio/redirect_error.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace rkv {

using boost::asio::awaitable;
using boost::asio::redirect_error;
using boost::asio::steady_timer;
using boost::asio::use_awaitable;

std::string_view to_string(ScopeState s) noexcept {
    switch (s) {
        case ScopeState::Open:       return "open";
        case ScopeState::Committing: return "committing";
        case ScopeState::Completed:  return "completed";
        case ScopeState::Aborted:    return "aborted";
    }
    return "unknown";
}

// ── Collection ───────────────────────────────────────────────────────────────

awaitable<Result> Collection::fetch(OperationRequest request) {
    co_return co_await execute_fetch(scope_, store_, std::move(request));
}

awaitable<Result> Collection::upsert(OperationRequest request) {
    co_return co_await execute_upsert(scope_, store_, std::move(request));
}

awaitable<Result> Collection::remove(OperationRequest request) {
    co_return co_await execute_remove(scope_, store_, std::move(request));
}

awaitable<Key> Collection::add(Record value, std::optional<Key> key) {
    co_return co_await scope_.issue([&] { return store_.add(std::move(value), key); });
}

// ── TransactionScope ─────────────────────────────────────────────────────────

TransactionScope::TransactionScope(boost::asio::any_io_executor executor,
                                   std::unique_ptr<EngineTransaction> txn,
                                   const DatabaseSchema& schema,
                                   std::vector<std::string> names,
                                   std::shared_ptr<spdlog::logger> logger)
    : executor_(std::move(executor))
    , txn_(std::move(txn))
    , logger_(std::move(logger))
{
    if (names.empty()) names = schema.store_names();

    for (auto& name : names) {
        validate_identifier(name, "store");
        const auto* def = schema.find_store(name);
        if (!def) {
            throw ContractViolation(Errc::unknown_collection,
                                    fmt::format("store '{}' does not exist", name));
        }
        if (collections_.count(name)) continue;

        collections_.emplace(name, std::make_unique<Collection>(*this, *txn_, *def));
        names_.push_back(std::move(name));
    }

    if (logger_) {
        logger_->debug("scope opened over [{}]", fmt::join(names_, ", "));
    }
}

TransactionScope::~TransactionScope() {
    if (state_ != ScopeState::Open && state_ != ScopeState::Committing) return;
    try {
        rollback();
    } catch (const std::exception& e) {
        if (logger_) {
            logger_->error("rollback of abandoned scope failed: {}", e.what());
        }
    }
}

Collection& TransactionScope::collection(std::string_view name) {
    ensure_open();
    auto it = collections_.find(name);
    if (it == collections_.end()) {
        throw ContractViolation(Errc::unknown_collection,
                                fmt::format("store '{}' is not part of this transaction", name));
    }
    return *it->second;
}

void TransactionScope::abort() {
    ensure_open();

    if (!failure_) {
        failure_ = std::make_exception_ptr(
            ScopeError(Errc::transaction_aborted, "transaction aborted"));
    }
    rollback();

    if (logger_) {
        logger_->debug("scope aborted with {} request(s) in flight", pending_);
    }
}

awaitable<void> TransactionScope::drain() {
    // Let coroutines spawned by the logic reach their first request.
    co_await boost::asio::post(executor_, use_awaitable);

    while (pending_ > 0) {
        steady_timer signal(executor_, steady_timer::time_point::max());
        idle_signal_ = &signal;

        // Cancelled by request_done() once the last request settles.
        boost::system::error_code ec;
        co_await signal.async_wait(redirect_error(use_awaitable, ec));
        idle_signal_ = nullptr;
    }
}

void TransactionScope::commit() {
    ensure_open();
    state_ = ScopeState::Committing;
    try {
        txn_->commit();
    } catch (const std::exception& e) {
        state_ = ScopeState::Aborted;
        if (logger_) {
            logger_->error("commit failed: {}", e.what());
        }
        throw;
    }
    state_ = ScopeState::Completed;

    if (logger_) {
        logger_->debug("scope committed over [{}]", fmt::join(names_, ", "));
    }
}

void TransactionScope::rollback() {
    if (state_ == ScopeState::Completed) return;
    const bool was_active = state_ != ScopeState::Aborted;
    state_ = ScopeState::Aborted;
    if (was_active) {
        txn_->rollback();
    }
}

void TransactionScope::ensure_open() const {
    if (state_ != ScopeState::Open) {
        throw ContractViolation(Errc::transaction_inactive, fmt::format(
            "transaction is {}; no further requests may be issued", to_string(state_)));
    }
}

void TransactionScope::ensure_not_aborted() const {
    if (state_ == ScopeState::Aborted) {
        throw ScopeError(Errc::transaction_aborted,
                         "request issued to a transaction that was aborted");
    }
}

void TransactionScope::record_failure(std::exception_ptr error) {
    if (failure_) return;
    failure_ = std::move(error);

    if (logger_) {
        try {
            std::rethrow_exception(failure_);
        } catch (const std::exception& e) {
            logger_->warn("request failed, transaction will roll back: {}", e.what());
        }
    }
}

void TransactionScope::request_done() {
    --pending_;
    if (pending_ == 0 && idle_signal_) {
        idle_signal_->cancel();
    }
}

} // namespace rkv
