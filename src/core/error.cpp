#include "core/error.hpp"

namespace rkv {

namespace {

class RkvErrorCategory final : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "rkv"; }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::unsupported_combination: return "unsupported combination of options";
            case Errc::predicate_not_callable:  return "predicate not callable";
            case Errc::invalid_identifier:      return "invalid store or index identifier";
            case Errc::unknown_collection:      return "collection is not part of the transaction";
            case Errc::transaction_inactive:    return "transaction is no longer active";
            case Errc::database_closed:         return "database is not open";
            case Errc::invalid_key:             return "invalid key";
            case Errc::constraint_violation:    return "constraint violation";
            case Errc::index_not_found:         return "index not found";
            case Errc::version_mismatch:        return "requested version is lower than the stored version";
            case Errc::storage_failure:         return "storage engine failure";
            case Errc::transaction_aborted:     return "transaction aborted";
        }
        return "unknown rkv error";
    }
};

} // anonymous namespace

const std::error_category& error_category() noexcept {
    static const RkvErrorCategory category;
    return category;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), error_category()};
}

bool is_contract_violation(Errc e) noexcept {
    switch (e) {
        case Errc::unsupported_combination:
        case Errc::predicate_not_callable:
        case Errc::invalid_identifier:
        case Errc::unknown_collection:
        case Errc::transaction_inactive:
        case Errc::database_closed:
            return true;
        default:
            return false;
    }
}

} // namespace rkv
