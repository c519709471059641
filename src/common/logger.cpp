#include "common/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace rkv {

namespace {

constexpr const char* kDefaultLogger = "rkv";
constexpr const char* kPattern = "[%H:%M:%S.%e] [%n] [%^%l%$] %v";

} // anonymous namespace

void init_default_logger(spdlog::level::level_enum level) {
    auto logger = spdlog::get(kDefaultLogger);
    if (!logger) {
        logger = spdlog::stderr_color_mt(kDefaultLogger);
        logger->set_pattern(kPattern);
        spdlog::set_default_logger(logger);
    }
    logger->set_level(level);
}

std::shared_ptr<spdlog::logger> make_logger(
    const std::string& db_name,
    spdlog::level::level_enum level)
{
    const std::string name = "db-" + db_name;
    if (auto existing = spdlog::get(name)) {
        return existing;
    }

    std::shared_ptr<spdlog::logger> logger;
    if (auto root = spdlog::get(kDefaultLogger)) {
        logger = std::make_shared<spdlog::logger>(name, root->sinks().begin(),
                                                  root->sinks().end());
        spdlog::register_logger(logger);
    } else {
        logger = spdlog::stderr_color_mt(name);
    }
    logger->set_pattern(kPattern);
    logger->set_level(level);
    return logger;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& s) {
    // from_str() maps unknown names to "off".
    const auto level = spdlog::level::from_str(s);
    if (level == spdlog::level::off && s != "off") {
        return std::nullopt;
    }
    return level;
}

} // namespace rkv
