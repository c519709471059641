#include "core/request.hpp"

#include <cmath>

namespace rkv {

bool is_reverse(Direction d) noexcept {
    return d == Direction::Prev || d == Direction::PrevUnique;
}

bool is_unique(Direction d) noexcept {
    return d == Direction::NextUnique || d == Direction::PrevUnique;
}

std::string_view to_string(Direction d) noexcept {
    switch (d) {
        case Direction::Next:       return "next";
        case Direction::Prev:       return "prev";
        case Direction::NextUnique: return "nextunique";
        case Direction::PrevUnique: return "prevunique";
    }
    return "next";
}

std::optional<Direction> parse_direction(std::string_view s) {
    if (s == "next")       return Direction::Next;
    if (s == "prev")       return Direction::Prev;
    if (s == "nextunique") return Direction::NextUnique;
    if (s == "prevunique") return Direction::PrevUnique;
    return std::nullopt;
}

bool is_truthy(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::discarded:
            return false;
        case nlohmann::json::value_t::boolean:
            return value.get<bool>();
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
        case nlohmann::json::value_t::number_float: {
            const double d = value.get<double>();
            return d != 0.0 && !std::isnan(d);
        }
        case nlohmann::json::value_t::string:
            return !value.get_ref<const std::string&>().empty();
        default:
            return true;
    }
}

} // namespace rkv
