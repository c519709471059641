#pragma once

#include "core/key.hpp"
#include "core/key_range.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace rkv {

// Traversal order of a cursor.  The unique variants visit one entry per
// distinct index key.
enum class Direction : uint8_t {
    Next,
    Prev,
    NextUnique,
    PrevUnique,
};

[[nodiscard]] bool is_reverse(Direction d) noexcept;
[[nodiscard]] bool is_unique(Direction d) noexcept;

// "next", "prev", "nextunique", "prevunique".
[[nodiscard]] std::string_view to_string(Direction d) noexcept;

// Parses a direction string; returns nullopt on unrecognised input.
[[nodiscard]] std::optional<Direction> parse_direction(std::string_view s);

// Per-entry caller predicate.  How its result is interpreted depends on the
// call: fetch keeps truthy results, upsert writes non-empty objects back,
// remove deletes when the result is exactly `true`.
using Predicate = std::function<nlohmann::json(const Record&)>;

// ── OperationRequest ─────────────────────────────────────────────────────────
//
// The options record of one fetch/upsert/remove call.  Which fields are set
// selects the operation; see core/resolver.hpp.

struct OperationRequest {
    std::optional<Key> key;
    std::optional<Record> value;
    std::optional<std::string> index;
    std::optional<Predicate> where;  // present but empty → not callable
    std::optional<Query> query;
    std::optional<std::uint32_t> count;  // 0 means no limit
    Direction direction = Direction::Next;
};

// JavaScript-style truthiness: null, false, 0, NaN and "" are falsy.
[[nodiscard]] bool is_truthy(const nlohmann::json& value);

} // namespace rkv
