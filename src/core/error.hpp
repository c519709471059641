#pragma once

#include <string>
#include <system_error>

namespace rkv {

// ── Error codes ──────────────────────────────────────────────────────────────
//
// Every failure surfaced by rkv carries one of these codes in the "rkv"
// error category.  The exception type tells the caller which class of
// failure it is:
//
//   ContractViolation – the caller asked for something malformed.  Raised
//                       before any storage request is issued; the enclosing
//                       transaction is left untouched.
//   EngineError       – a storage request failed.  The enclosing transaction
//                       is marked failed and will roll back.
//   ScopeError        – the transaction itself was aborted.

enum class Errc {
    // Contract violations
    unsupported_combination = 1,
    predicate_not_callable,
    invalid_identifier,
    unknown_collection,
    transaction_inactive,
    database_closed,

    // Engine request failures
    invalid_key,
    constraint_violation,
    index_not_found,
    version_mismatch,
    storage_failure,

    // Scope failures
    transaction_aborted,
};

[[nodiscard]] const std::error_category& error_category() noexcept;

[[nodiscard]] std::error_code make_error_code(Errc e) noexcept;

// Returns true for codes that denote a caller contract violation.
[[nodiscard]] bool is_contract_violation(Errc e) noexcept;

class Error : public std::system_error {
public:
    Error(Errc code, const std::string& what)
        : std::system_error(make_error_code(code), what) {}

    [[nodiscard]] Errc errc() const noexcept {
        return static_cast<Errc>(code().value());
    }
};

class ContractViolation final : public Error {
public:
    using Error::Error;
};

class EngineError final : public Error {
public:
    using Error::Error;
};

class ScopeError final : public Error {
public:
    using Error::Error;
};

} // namespace rkv

namespace std {
template <>
struct is_error_code_enum<rkv::Errc> : true_type {};
} // namespace std
