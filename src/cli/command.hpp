#pragma once

#include "core/request.hpp"
#include "core/result.hpp"

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace rkv::cli {

// One REPL line:
//   fetch|upsert|remove|add <store> [<json options>]
//   stores | info | quit
enum class Verb : uint8_t { Fetch, Upsert, Remove, Add, Stores, Info, Quit };

struct Command {
    Verb verb;
    std::string store;
    nlohmann::json options = nlohmann::json::object();
};

// Throws std::runtime_error with a usage message on malformed input.
[[nodiscard]] Command parse_command(std::string_view line);

// Builds the request for fetch/upsert/remove from JSON options:
//   key, value, index, count, direction ("next"|"prev"|...),
//   query {start, end, only},
//   where {field: value, ...}   – records whose fields equal every value;
//                                 dotted field names follow key paths
//   set   {field: value, ...}   – upsert only: merged into matching records
// Throws std::runtime_error on malformed options.
[[nodiscard]] OperationRequest build_request(Verb verb, const nlohmann::json& options);

// JSON rendering of a Result for display.
[[nodiscard]] nlohmann::json result_to_json(const Result& result);

} // namespace rkv::cli
