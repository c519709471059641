#include "cli/command.hpp"
#include "common/cli_config.hpp"
#include "common/logger.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

using nlohmann::json;

// ── Helpers ───────────────────────────────────────────────────────────────────

// Build a fake argv array from a vector of strings.
// The returned pointers are valid as long as `args` is alive.
static std::vector<char*> make_argv(std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (auto& s : args) {
        argv.push_back(s.data());
    }
    return argv;
}

static rkv::CliConfig parse(std::vector<std::string> args) {
    args.insert(args.begin(), "rkv-cli");
    auto argv = make_argv(args);
    return rkv::parse_config(static_cast<int>(argv.size()), argv.data());
}

// ── parse_config() ────────────────────────────────────────────────────────────

TEST(CliConfigTest, DefaultsToMemoryEngine) {
    auto cfg = parse({});
    EXPECT_EQ(cfg.engine,      "memory");
    EXPECT_EQ(cfg.data_dir,    "./data");   // default
    EXPECT_EQ(cfg.schema_path, "");
    EXPECT_EQ(cfg.name,        "idb");
    EXPECT_EQ(cfg.version,     1u);
    EXPECT_EQ(cfg.log_level,   "info");
}

TEST(CliConfigTest, ParsesAllOptions) {
    auto cfg = parse({
        "--engine",    "rocksdb",
        "--data-dir",  "/tmp/rkv",
        "--schema",    "schema.json",
        "--name",      "todo-db",
        "--version",   "7",
        "--log-level", "debug",
    });
    EXPECT_EQ(cfg.engine,      "rocksdb");
    EXPECT_EQ(cfg.data_dir,    "/tmp/rkv");
    EXPECT_EQ(cfg.schema_path, "schema.json");
    EXPECT_EQ(cfg.name,        "todo-db");
    EXPECT_EQ(cfg.version,     7u);
    EXPECT_EQ(cfg.log_level,   "debug");
}

TEST(CliConfigTest, RejectsUnknownEngine) {
    EXPECT_THROW(parse({"--engine", "leveldb"}), std::runtime_error);
}

TEST(CliConfigTest, RocksdbRequiresDataDir) {
    EXPECT_THROW(parse({"--engine", "rocksdb", "--data-dir", ""}), std::runtime_error);
}

TEST(CliConfigTest, RejectsZeroVersion) {
    EXPECT_THROW(parse({"--version", "0"}), std::runtime_error);
}

TEST(CliConfigTest, RejectsEmptyName) {
    EXPECT_THROW(parse({"--name", ""}), std::runtime_error);
}

TEST(CliConfigTest, RejectsUnknownLogLevel) {
    EXPECT_THROW(parse({"--log-level", "verbose"}), std::runtime_error);
    EXPECT_EQ(parse({"--log-level", "off"}).log_level, "off");
}

TEST(CliConfigTest, RejectsUnknownOption) {
    EXPECT_THROW(parse({"--bogus"}), std::runtime_error);
}

TEST(CliConfigTest, HelpThrowsWithUsage) {
    try {
        parse({"--help"});
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("--engine"), std::string::npos);
    }
}

// ── Logging ───────────────────────────────────────────────────────────────────

TEST(LoggerTest, ParsesKnownLevelsOnly) {
    EXPECT_EQ(rkv::parse_log_level("debug").value(), spdlog::level::debug);
    EXPECT_EQ(rkv::parse_log_level("warn").value(),  spdlog::level::warn);
    EXPECT_EQ(rkv::parse_log_level("off").value(),   spdlog::level::off);
    EXPECT_FALSE(rkv::parse_log_level("loud"));
}

TEST(LoggerTest, DatabaseLoggerSharesDefaultSinks) {
    rkv::init_default_logger(spdlog::level::warn);
    auto root = spdlog::get("rkv");
    ASSERT_TRUE(root);

    auto logger = rkv::make_logger("cli-test", spdlog::level::debug);
    EXPECT_EQ(logger->name(), "db-cli-test");
    EXPECT_EQ(logger->level(), spdlog::level::debug);
    EXPECT_EQ(logger->sinks(), root->sinks());
    EXPECT_EQ(rkv::make_logger("cli-test"), logger);
}

// ── parse_command() ───────────────────────────────────────────────────────────

TEST(ParseCommandTest, ParsesVerbStoreAndOptions) {
    auto cmd = rkv::cli::parse_command("  upsert todos {\"value\": {\"title\": \"a b\"}}  ");
    EXPECT_EQ(cmd.verb, rkv::cli::Verb::Upsert);
    EXPECT_EQ(cmd.store, "todos");
    EXPECT_EQ(cmd.options["value"]["title"], "a b");
}

TEST(ParseCommandTest, OptionsDefaultToEmptyObject) {
    auto cmd = rkv::cli::parse_command("fetch todos");
    EXPECT_EQ(cmd.verb, rkv::cli::Verb::Fetch);
    EXPECT_TRUE(cmd.options.is_object());
    EXPECT_TRUE(cmd.options.empty());
}

TEST(ParseCommandTest, StandaloneVerbs) {
    EXPECT_EQ(rkv::cli::parse_command("stores").verb, rkv::cli::Verb::Stores);
    EXPECT_EQ(rkv::cli::parse_command("info").verb,   rkv::cli::Verb::Info);
    EXPECT_EQ(rkv::cli::parse_command("quit").verb,   rkv::cli::Verb::Quit);
    EXPECT_EQ(rkv::cli::parse_command("exit").verb,   rkv::cli::Verb::Quit);
}

TEST(ParseCommandTest, RejectsMalformedLines) {
    EXPECT_THROW((void)rkv::cli::parse_command("drop todos"), std::runtime_error);
    EXPECT_THROW((void)rkv::cli::parse_command("fetch"), std::runtime_error);
    EXPECT_THROW((void)rkv::cli::parse_command("fetch todos {not json"), std::runtime_error);
    EXPECT_THROW((void)rkv::cli::parse_command("fetch todos [1, 2]"), std::runtime_error);
}

// ── build_request() ───────────────────────────────────────────────────────────

TEST(BuildRequestTest, MapsPlainFields) {
    auto request = rkv::cli::build_request(rkv::cli::Verb::Fetch, json::parse(R"({
        "key": 5, "index": "userId", "count": 3, "direction": "prevunique",
        "query": {"start": 1, "end": 9}
    })"));
    EXPECT_EQ(*request.key, 5);
    EXPECT_EQ(*request.index, "userId");
    EXPECT_EQ(*request.count, 3u);
    EXPECT_EQ(request.direction, rkv::Direction::PrevUnique);
    ASSERT_TRUE(request.query);
    EXPECT_EQ(*request.query->start, 1);
    EXPECT_EQ(*request.query->end, 9);
    EXPECT_FALSE(request.query->only);
    EXPECT_FALSE(request.where);
}

TEST(BuildRequestTest, RejectsMalformedFields) {
    using rkv::cli::Verb;
    EXPECT_THROW((void)rkv::cli::build_request(Verb::Fetch, json{{"index", 1}}), std::runtime_error);
    EXPECT_THROW((void)rkv::cli::build_request(Verb::Fetch, json{{"count", -1}}), std::runtime_error);
    EXPECT_THROW((void)rkv::cli::build_request(Verb::Fetch, json{{"direction", "up"}}),
                 std::runtime_error);
    EXPECT_THROW((void)rkv::cli::build_request(Verb::Fetch, json{{"query", 3}}), std::runtime_error);
    EXPECT_THROW((void)rkv::cli::build_request(Verb::Fetch, json{{"where", "x"}}), std::runtime_error);
    EXPECT_THROW((void)rkv::cli::build_request(Verb::Add, json{{"where", json::object()}}),
                 std::runtime_error);
}

TEST(BuildRequestTest, FetchWhereKeepsMatchingRecords) {
    auto request = rkv::cli::build_request(rkv::cli::Verb::Fetch,
                                           json{{"where", {{"owner.id", 3}}}});
    ASSERT_TRUE(request.where);
    const json hit  = {{"owner", {{"id", 3}}}, {"id", 1}};
    const json miss = {{"owner", {{"id", 4}}}, {"id", 2}};
    EXPECT_EQ((*request.where)(hit), hit);
    EXPECT_TRUE((*request.where)(miss).is_null());
}

TEST(BuildRequestTest, UpsertWhereMergesSet) {
    auto request = rkv::cli::build_request(
        rkv::cli::Verb::Upsert,
        json{{"where", {{"userId", 1}}}, {"set", {{"done", true}}}});
    ASSERT_TRUE(request.where);

    const auto updated = (*request.where)(json{{"id", 1}, {"userId", 1}});
    EXPECT_EQ(updated["done"], true);
    EXPECT_EQ(updated["id"], 1);
    EXPECT_TRUE((*request.where)(json{{"id", 2}, {"userId", 2}}).is_null());
}

TEST(BuildRequestTest, RemoveWhereReturnsExactlyTrue) {
    auto request = rkv::cli::build_request(rkv::cli::Verb::Remove,
                                           json{{"where", {{"userId", 5}}}});
    EXPECT_EQ((*request.where)(json{{"userId", 5}}), true);
    EXPECT_EQ((*request.where)(json{{"userId", 6}}), false);
}

TEST(BuildRequestTest, CountAboveUint32RangeIsRejected) {
    using rkv::cli::Verb;
    auto max = rkv::cli::build_request(Verb::Fetch, json{{"count", 4294967295u}});
    EXPECT_EQ(*max.count, 4294967295u);
    EXPECT_THROW((void)rkv::cli::build_request(Verb::Fetch, json{{"count", 4294967296ull}}),
                 std::runtime_error);
}

// ── result_to_json() ──────────────────────────────────────────────────────────

TEST(ResultToJsonTest, RendersEveryResultKind) {
    using namespace rkv;
    EXPECT_EQ(cli::result_to_json(NoResult{}), json({{"ok", true}}));
    EXPECT_TRUE(cli::result_to_json(NotFoundResult{}).is_null());
    EXPECT_EQ(cli::result_to_json(RecordResult{json{{"id", 1}}}), json({{"id", 1}}));
    EXPECT_EQ(cli::result_to_json(RecordsResult{{json{{"id", 1}}, json{{"id", 2}}}}).size(), 2u);
    EXPECT_EQ(cli::result_to_json(KeyResult{json(4)}), json({{"key", 4}}));
    EXPECT_EQ(cli::result_to_json(KeysResult{{json(1), json(2)}})["keys"],
              json::array({1, 2}));
}
