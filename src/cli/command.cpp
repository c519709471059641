#include "cli/command.hpp"

#include "core/key.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <type_traits>
#include <variant>

#include <fmt/format.h>

namespace rkv::cli {

namespace {

constexpr const char* kUsage =
    "usage: fetch|upsert|remove|add <store> [<json>] | stores | info | quit";

[[nodiscard]] std::string_view trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

// True if every field of `where` equals the value at that key path.
[[nodiscard]] bool matches(const Record& record, const nlohmann::json& where) {
    for (const auto& [path, expected] : where.items()) {
        const auto* actual = evaluate_key_path(record, path);
        if (!actual || *actual != expected) return false;
    }
    return true;
}

[[nodiscard]] Query parse_query(const nlohmann::json& j) {
    if (!j.is_object()) throw std::runtime_error("\"query\" must be an object");
    Query query;
    if (auto it = j.find("start"); it != j.end()) query.start = *it;
    if (auto it = j.find("end");   it != j.end()) query.end   = *it;
    if (auto it = j.find("only");  it != j.end()) query.only  = *it;
    return query;
}

} // anonymous namespace

Command parse_command(std::string_view line) {
    line = trim(line);
    const auto verb_end = line.find_first_of(" \t");
    const auto verb = line.substr(0, verb_end);
    auto rest = verb_end == std::string_view::npos ? std::string_view{}
                                                   : trim(line.substr(verb_end));

    if (verb == "stores") return Command{Verb::Stores, {}};
    if (verb == "info")   return Command{Verb::Info, {}};
    if (verb == "quit" || verb == "exit") return Command{Verb::Quit, {}};

    Command cmd{Verb::Fetch, {}};
    if (verb == "fetch")       cmd.verb = Verb::Fetch;
    else if (verb == "upsert") cmd.verb = Verb::Upsert;
    else if (verb == "remove") cmd.verb = Verb::Remove;
    else if (verb == "add")    cmd.verb = Verb::Add;
    else throw std::runtime_error(fmt::format("unknown command '{}'; {}", verb, kUsage));

    const auto store_end = rest.find_first_of(" \t");
    cmd.store = std::string(rest.substr(0, store_end));
    if (cmd.store.empty()) throw std::runtime_error(kUsage);

    if (store_end != std::string_view::npos) {
        const auto json_text = trim(rest.substr(store_end));
        if (!json_text.empty()) {
            try {
                cmd.options = nlohmann::json::parse(json_text);
            } catch (const nlohmann::json::parse_error& e) {
                throw std::runtime_error(fmt::format("invalid JSON options: {}", e.what()));
            }
            if (!cmd.options.is_object()) {
                throw std::runtime_error("options must be a JSON object");
            }
        }
    }
    return cmd;
}

OperationRequest build_request(Verb verb, const nlohmann::json& options) {
    OperationRequest request;

    if (auto it = options.find("key"); it != options.end())   request.key = *it;
    if (auto it = options.find("value"); it != options.end()) request.value = *it;
    if (auto it = options.find("index"); it != options.end()) {
        if (!it->is_string()) throw std::runtime_error("\"index\" must be a string");
        request.index = it->get<std::string>();
    }
    if (auto it = options.find("query"); it != options.end()) {
        request.query = parse_query(*it);
    }
    if (auto it = options.find("count"); it != options.end()) {
        if (!it->is_number_unsigned() ||
            it->get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max()) {
            throw std::runtime_error(fmt::format(
                "\"count\" must be an integer in [0, {}]",
                std::numeric_limits<std::uint32_t>::max()));
        }
        request.count = it->get<std::uint32_t>();
    }
    if (auto it = options.find("direction"); it != options.end()) {
        auto direction = it->is_string() ? parse_direction(it->get<std::string>())
                                         : std::nullopt;
        if (!direction) {
            throw std::runtime_error(
                "\"direction\" must be one of next, prev, nextunique, prevunique");
        }
        request.direction = *direction;
    }

    auto where = options.find("where");
    if (where == options.end()) return request;
    if (!where->is_object()) throw std::runtime_error("\"where\" must be an object");

    const nlohmann::json filter = *where;
    switch (verb) {
        case Verb::Fetch:
            request.where = [filter](const Record& r) -> nlohmann::json {
                return matches(r, filter) ? r : nlohmann::json(nullptr);
            };
            break;
        case Verb::Upsert: {
            auto set = options.value("set", nlohmann::json::object());
            if (!set.is_object()) throw std::runtime_error("\"set\" must be an object");
            request.where = [filter, set](const Record& r) -> nlohmann::json {
                if (!matches(r, filter)) return nullptr;
                auto updated = r;
                updated.merge_patch(set);
                return updated;
            };
            break;
        }
        case Verb::Remove:
            request.where = [filter](const Record& r) -> nlohmann::json {
                return matches(r, filter);
            };
            break;
        default:
            throw std::runtime_error("\"where\" is not valid for this command");
    }
    return request;
}

nlohmann::json result_to_json(const Result& result) {
    return std::visit(
        [](const auto& r) -> nlohmann::json {
            using T = std::decay_t<decltype(r)>;

            if constexpr (std::is_same_v<T, NoResult>) {
                return {{"ok", true}};
            } else if constexpr (std::is_same_v<T, NotFoundResult>) {
                return nullptr;
            } else if constexpr (std::is_same_v<T, RecordResult>) {
                return r.record;
            } else if constexpr (std::is_same_v<T, RecordsResult>) {
                return r.records;
            } else if constexpr (std::is_same_v<T, KeyResult>) {
                return {{"key", r.key}};
            } else if constexpr (std::is_same_v<T, KeysResult>) {
                return {{"keys", r.keys}};
            }
        },
        result);
}

} // namespace rkv::cli
