#include "core/error.hpp"
#include "schema/database.hpp"
#include "schema/database_config.hpp"
#include "schema/migration.hpp"
#include "storage/keyspace.hpp"

#include "test_util.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

namespace rkv {

using boost::asio::awaitable;
using nlohmann::json;
using test::field_of;
using test::records_of;

namespace fs = std::filesystem;

// ── parse_database_config() ──────────────────────────────────────────────────

TEST(DatabaseConfigTest, MissingFieldsTakeDefaults) {
    const auto config = parse_database_config(json::object());
    EXPECT_EQ(config.name(), "idb");
    EXPECT_EQ(config.version(), 1u);
    EXPECT_TRUE(config.stores().empty());
}

TEST(DatabaseConfigTest, ParsesStoresAndIndexes) {
    const auto config = parse_database_config(json::parse(R"({
        "name": "todo-db",
        "version": 3,
        "stores": [
            {"name": "todos", "indexes": [{"name": "userId"}]},
            {"name": "blobs", "options": {"keyPath": null, "autoIncrement": false}},
            {"name": "users", "options": {"keyPath": "email"},
             "indexes": [{"name": "byTag", "keyPath": "tags", "multiEntry": true}]}
        ]
    })"));

    EXPECT_EQ(config.name(), "todo-db");
    EXPECT_EQ(config.version(), 3u);
    ASSERT_EQ(config.stores().size(), 3u);

    const auto& todos = config.stores()[0];
    EXPECT_EQ(todos.key_path, "id");
    EXPECT_TRUE(todos.auto_increment);
    ASSERT_EQ(todos.indexes.size(), 1u);
    EXPECT_EQ(todos.indexes[0].key_path, "userId");
    EXPECT_FALSE(todos.indexes[0].unique);

    const auto& blobs = config.stores()[1];
    EXPECT_FALSE(blobs.key_path.has_value());
    EXPECT_FALSE(blobs.auto_increment);

    const auto& users = config.stores()[2];
    EXPECT_EQ(users.key_path, "email");
    EXPECT_FALSE(users.auto_increment);
    EXPECT_TRUE(users.indexes[0].multi_entry);
    EXPECT_EQ(users.indexes[0].key_path, "tags");
}

TEST(DatabaseConfigTest, RejectsMalformedConfig) {
    EXPECT_THROW((void)parse_database_config(json::array()), std::runtime_error);
    EXPECT_THROW((void)parse_database_config(json{{"version", 0}}), std::runtime_error);
    EXPECT_THROW((void)parse_database_config(json{{"version", "2"}}), std::runtime_error);
    EXPECT_THROW((void)parse_database_config(json{{"stores", "todos"}}), std::runtime_error);
    EXPECT_THROW((void)parse_database_config(json::parse(
                     R"({"stores": [{"name": "a", "options": 5}]})")),
                 std::runtime_error);
    EXPECT_THROW((void)parse_database_config(json::parse(
                     R"({"stores": [{"name": "a"}, {"name": "a"}]})")),
                 std::runtime_error);
}

TEST(DatabaseConfigTest, InvalidStoreOptionsMessageNamesStore) {
    try {
        (void)parse_database_config(json::parse(R"({"stores": [{"name": "x", "options": []}]})"));
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("\"x\""), std::string::npos);
    }
}

TEST(DatabaseConfigTest, EmptyStoreNameIsInvalidIdentifier) {
    try {
        DatabaseConfig config("db", 1, {StoreDef{.name = ""}});
        FAIL() << "expected ContractViolation";
    } catch (const ContractViolation& e) {
        EXPECT_EQ(e.errc(), Errc::invalid_identifier);
    }
}

TEST(DatabaseConfigTest, LoadsFromFile) {
    const auto path = fs::temp_directory_path() /
        ("rkv_config_test_" +
         std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id())) + ".json");
    {
        std::ofstream out(path);
        out << R"({"name": "from-file", "version": 2, "stores": [{"name": "notes"}]})";
    }
    const auto config = load_database_config(path);
    fs::remove(path);

    EXPECT_EQ(config.name(), "from-file");
    EXPECT_EQ(config.version(), 2u);
    ASSERT_EQ(config.stores().size(), 1u);
    EXPECT_EQ(config.stores()[0].name, "notes");

    EXPECT_THROW((void)load_database_config(path), std::runtime_error);
}

// ── Database::open() ──────────────────────────────────────────────────────────

class DatabaseTest : public test::DatabaseFixture {
protected:
    void put_todo(json value) {
        tx([value = std::move(value)](TransactionScope& t) -> awaitable<void> {
            co_await t["todos"].upsert({.value = value});
        });
    }

    std::vector<Record> all(std::string store) {
        return tx([store = std::move(store)](TransactionScope& t) -> awaitable<std::vector<Record>> {
            co_return records_of(co_await t[store].fetch({}));
        });
    }

    Errc open_error(std::vector<StoreDef> stores, uint32_t version) {
        try {
            open(std::move(stores), version);
        } catch (const Error& e) {
            return e.errc();
        }
        ADD_FAILURE() << "expected rkv::Error";
        return Errc::storage_failure;
    }
};

TEST_F(DatabaseTest, NoStoresCreatesDefaultStore) {
    open({});
    EXPECT_EQ(db_->store_names(), (std::vector<std::string>{kDefaultStoreName}));
    EXPECT_EQ(db_->name(), "test-db");
    EXPECT_EQ(db_->version(), 1u);

    tx([](TransactionScope& t) -> awaitable<void> {
        co_await t["app"].upsert({.value = json{{"v", 1}}});
    });
    EXPECT_EQ(all("app").size(), 1u);
}

TEST_F(DatabaseTest, SchemaIsPersistedInMetadataKey) {
    open({test::todos_store()});
    auto txn = engine_.begin();
    auto schema = load_schema(*txn);
    ASSERT_TRUE(schema);
    EXPECT_EQ(schema->version, 1u);
    ASSERT_EQ(schema->stores.size(), 1u);
    EXPECT_EQ(schema->stores[0], test::todos_store());
}

TEST_F(DatabaseTest, ReopenAtSameVersionKeepsStoredSchema) {
    open({test::todos_store()});
    put_todo(json{{"title", "a"}});

    // A config for the same version is not re-applied.
    open({test::users_store()}, 1);
    EXPECT_EQ(db_->store_names(), (std::vector<std::string>{"todos"}));
    EXPECT_EQ(all("todos").size(), 1u);
}

TEST_F(DatabaseTest, LowerVersionIsVersionMismatch) {
    open({test::todos_store()}, 3);
    EXPECT_EQ(open_error({test::todos_store()}, 2), Errc::version_mismatch);
}

TEST_F(DatabaseTest, UpgradeDeletesRemovedStores) {
    open({test::todos_store(), test::users_store()});
    put_todo(json{{"title", "a"}});

    open({test::users_store()}, 2);
    EXPECT_EQ(db_->store_names(), (std::vector<std::string>{"users"}));

    // Recreating the store later starts from empty, generator included.
    open({test::todos_store()}, 3);
    EXPECT_TRUE(all("todos").empty());
    put_todo(json{{"title", "b"}});
    EXPECT_EQ(all("todos")[0]["id"], 1);
}

TEST_F(DatabaseTest, UpgradeRebuildsIndexesFromRecords) {
    auto plain = test::todos_store();
    plain.indexes.clear();
    open({plain});
    put_todo(json{{"title", "b"}, {"userId", 2}});
    put_todo(json{{"title", "a"}, {"userId", 1}});

    auto indexed = test::todos_store();
    indexed.indexes.push_back(IndexDef{"title", "title"});
    open({indexed}, 2);

    auto titles = tx([](TransactionScope& t) -> awaitable<std::vector<Record>> {
        co_return records_of(co_await t["todos"].fetch({.index = "title"}));
    });
    EXPECT_EQ(field_of(titles, "title"), (std::vector<json>{"a", "b"}));
}

TEST_F(DatabaseTest, UpgradeKeepsKeyPathOfExistingStore) {
    open({test::todos_store()});
    auto changed = test::todos_store();
    changed.key_path = "uuid";
    changed.auto_increment = false;
    open({changed}, 2);

    ASSERT_NE(db_->schema().find_store("todos"), nullptr);
    EXPECT_EQ(db_->schema().find_store("todos")->key_path, "id");
    EXPECT_TRUE(db_->schema().find_store("todos")->auto_increment);
}

TEST_F(DatabaseTest, FailedUniqueBackfillLeavesOldVersion) {
    open({test::todos_store()});
    put_todo(json{{"title", "same"}});
    put_todo(json{{"title", "same"}});

    auto unique = test::todos_store();
    unique.indexes.push_back(IndexDef{"title", "title", /*unique=*/true});
    EXPECT_EQ(open_error({unique}, 2), Errc::constraint_violation);

    open({test::todos_store()}, 1);
    EXPECT_EQ(db_->version(), 1u);
    EXPECT_EQ(all("todos").size(), 2u);
}

TEST_F(DatabaseTest, OnUpgradeReportsVersions) {
    std::vector<std::pair<uint32_t, uint32_t>> calls;
    OpenOptions options{.on_upgrade = [&](uint32_t from, uint32_t to) {
        calls.emplace_back(from, to);
    }};

    db_ = Database::open(engine_, ioc_.get_executor(),
                         DatabaseConfig("test-db", 1, {test::todos_store()}), options);
    db_ = Database::open(engine_, ioc_.get_executor(),
                         DatabaseConfig("test-db", 1, {test::todos_store()}), options);
    db_ = Database::open(engine_, ioc_.get_executor(),
                         DatabaseConfig("test-db", 4, {test::todos_store()}), options);

    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0], std::make_pair(0u, 1u));
    EXPECT_EQ(calls[1], std::make_pair(1u, 4u));
}

// ── Lifecycle ─────────────────────────────────────────────────────────────────

TEST_F(DatabaseTest, ClosedDatabaseRejectsTransactions) {
    open({test::todos_store()});
    db_->close();
    EXPECT_FALSE(db_->is_open());

    try {
        (void)db_->with_transaction();
        FAIL() << "expected ContractViolation";
    } catch (const ContractViolation& e) {
        EXPECT_EQ(e.errc(), Errc::database_closed);
    }
    EXPECT_NO_THROW(db_->close());
}

TEST_F(DatabaseTest, DestroyRemovesEverything) {
    open({test::todos_store()}, 2);
    put_todo(json{{"title", "a"}});
    db_->destroy();
    EXPECT_FALSE(db_->is_open());
    EXPECT_EQ(engine_.size(), 0u);

    // A destroyed database reopens fresh at any version.
    open({test::todos_store()}, 1);
    EXPECT_TRUE(all("todos").empty());
}

TEST_F(DatabaseTest, InfoDescribesSchema) {
    open({test::users_store()}, 5);
    const auto info = db_->info();
    EXPECT_EQ(info["name"], "test-db");
    EXPECT_EQ(info["version"], 5);
    ASSERT_EQ(info["stores"].size(), 1u);
    EXPECT_EQ(info["stores"][0]["name"], "users");
    EXPECT_EQ(info["stores"][0]["options"]["keyPath"], "id");
    EXPECT_EQ(info["stores"][0]["options"]["autoIncrement"], false);
    EXPECT_EQ(info["stores"][0]["indexes"].size(), 2u);
}

} // namespace rkv
