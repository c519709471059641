#include "core/transaction_coordinator.hpp"

#include "core/error.hpp"

namespace rkv {

using boost::asio::awaitable;

std::vector<std::string>
TransactionCoordinator::resolve_names(std::vector<std::string> names) const {
    for (const auto& name : names) {
        validate_identifier(name, "store");
        if (!schema_.find_store(name)) {
            throw ContractViolation(Errc::unknown_collection,
                                    "store '" + name + "' does not exist");
        }
    }
    if (names.empty()) names = schema_.store_names();
    return names;
}

std::unique_ptr<TransactionScope>
TransactionCoordinator::open_scope(std::vector<std::string> names) {
    // Resolve names before starting an engine transaction.
    return std::make_unique<TransactionScope>(executor_, engine_.begin(), schema_,
                                              resolve_names(std::move(names)), logger_);
}

awaitable<std::vector<std::string>>
TransactionCoordinator::run(std::vector<std::string> names) {
    names = resolve_names(std::move(names));
    auto lease = co_await gate_.acquire(names);
    auto scope = open_scope(std::move(names));
    co_await finish(*scope, nullptr);
    co_return scope->names();
}

awaitable<void> TransactionCoordinator::finish(TransactionScope& scope,
                                               std::exception_ptr logic_error) {
    co_await scope.drain();

    if (auto failure = scope.failure()) {
        scope.rollback();
        if (logger_) {
            logger_->debug("transaction rolled back");
        }
        std::rethrow_exception(failure);
    }

    scope.commit();

    if (logic_error) {
        if (logger_) {
            logger_->debug("transaction committed; logic failed after its requests");
        }
        std::rethrow_exception(logic_error);
    }
}

} // namespace rkv
