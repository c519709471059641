#pragma once

#include "core/key.hpp"

#include <optional>

namespace rkv {

// Caller-facing bound descriptor.  Either {start, end} (both inclusive, either
// may be absent) or {only}; `only` wins when both forms are given.
struct Query {
    std::optional<Key> start;
    std::optional<Key> end;
    std::optional<Key> only;
};

// Normalized key interval.  An absent bound is unbounded on that side.
struct KeyRange {
    std::optional<Key> lower;
    std::optional<Key> upper;
    bool lower_open = false;
    bool upper_open = false;

    [[nodiscard]] static KeyRange unbounded() { return {}; }
    [[nodiscard]] static KeyRange only(Key key);
    [[nodiscard]] static KeyRange bound(Key lower, Key upper,
                                        bool lower_open = false,
                                        bool upper_open = false);
    [[nodiscard]] static KeyRange lower_bound(Key lower, bool open = false);
    [[nodiscard]] static KeyRange upper_bound(Key upper, bool open = false);

    [[nodiscard]] bool is_unbounded() const noexcept { return !lower && !upper; }

    // True if `key` lies inside the interval.
    [[nodiscard]] bool includes(const Key& key) const;
};

// Translates a Query into a KeyRange:
//   {only}        → [only, only]
//   {start, end}  → [start, end]
//   {start}       → [start, +inf)
//   {end}         → (-inf, end]
//   {} / nullopt  → unbounded
// Throws EngineError(invalid_key) when a bound is not a valid key.
[[nodiscard]] KeyRange build_range(const std::optional<Query>& query);

} // namespace rkv
