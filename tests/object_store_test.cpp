#include "core/error.hpp"
#include "core/object_store.hpp"
#include "storage/keyspace.hpp"
#include "storage/memory_engine.hpp"

#include "test_util.hpp"

#include <functional>
#include <memory>

#include <gtest/gtest.h>

namespace rkv {

using nlohmann::json;
using test::field_of;

// ── Fixture ───────────────────────────────────────────────────────────────────
// One engine transaction with a "todos" and a "users" store.

class ObjectStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        todos_def_ = test::todos_store();
        users_def_ = test::users_store();
        txn_ = engine_.begin();
        todos_ = std::make_unique<ObjectStore>(*txn_, todos_def_);
        users_ = std::make_unique<ObjectStore>(*txn_, users_def_);
    }

    static Errc errc_of(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const Error& e) {
            return e.errc();
        }
        ADD_FAILURE() << "expected rkv::Error";
        return Errc::storage_failure;
    }

    MemoryEngine engine_;
    StoreDef todos_def_;
    StoreDef users_def_;
    std::unique_ptr<EngineTransaction> txn_;
    std::unique_ptr<ObjectStore> todos_;
    std::unique_ptr<ObjectStore> users_;
};

// ── Keys ──────────────────────────────────────────────────────────────────────

TEST_F(ObjectStoreTest, GeneratedKeysStartAtOneAndAreInjected) {
    EXPECT_EQ(todos_->put(json{{"title", "a"}}), 1);
    EXPECT_EQ(todos_->put(json{{"title", "b"}}), 2);

    auto record = todos_->get(2);
    ASSERT_TRUE(record);
    EXPECT_EQ((*record)["id"], 2);
    EXPECT_EQ((*record)["title"], "b");
}

TEST_F(ObjectStoreTest, ExplicitKeyAdvancesGenerator) {
    todos_->put(json{{"id", 10}, {"title", "x"}});
    EXPECT_EQ(todos_->put(json{{"title", "y"}}), 11);
}

TEST_F(ObjectStoreTest, SmallerExplicitKeyKeepsGenerator) {
    todos_->put(json{{"id", 10}});
    todos_->put(json{{"id", 3}});
    EXPECT_EQ(todos_->put(json::object()), 11);
}

TEST_F(ObjectStoreTest, ExplicitKeyIsInjectedAtKeyPath) {
    EXPECT_EQ(todos_->put(json{{"title", "t"}}, json(5)), 5);
    EXPECT_EQ((*todos_->get(5))["id"], 5);
}

TEST_F(ObjectStoreTest, MismatchedExplicitKeyIsInvalidKey) {
    EXPECT_EQ(errc_of([&] { todos_->put(json{{"id", 1}}, json(2)); }), Errc::invalid_key);
}

TEST_F(ObjectStoreTest, MissingKeyWithoutAutoIncrementIsInvalidKey) {
    EXPECT_EQ(errc_of([&] { users_->put(json{{"email", "a@x"}}); }), Errc::invalid_key);
}

TEST_F(ObjectStoreTest, InvalidRecordKeyIsRejected) {
    EXPECT_EQ(errc_of([&] { users_->put(json{{"id", true}}); }), Errc::invalid_key);
}

TEST_F(ObjectStoreTest, OutOfLineStoreRequiresExplicitKey) {
    StoreDef def;
    def.name = "blobs";
    def.key_path.reset();
    def.auto_increment = false;
    ObjectStore blobs(*txn_, def);

    EXPECT_EQ(errc_of([&] { blobs.put(json("payload")); }), Errc::invalid_key);
    EXPECT_EQ(blobs.put(json("payload"), json("k1")), "k1");
    EXPECT_EQ(*blobs.get("k1"), "payload");
}

TEST_F(ObjectStoreTest, OutOfLineAutoIncrementGeneratesKeysWithoutInjecting) {
    StoreDef def;
    def.name = "events";
    def.key_path.reset();
    def.auto_increment = true;
    ObjectStore events(*txn_, def);

    EXPECT_EQ(events.put(json{{"kind", "click"}}), 1);
    EXPECT_FALSE(events.get(1)->contains("id"));
}

// ── add / put / del ───────────────────────────────────────────────────────────

TEST_F(ObjectStoreTest, AddRejectsExistingKey) {
    todos_->add(json{{"id", 1}});
    EXPECT_EQ(errc_of([&] { todos_->add(json{{"id", 1}}); }), Errc::constraint_violation);
}

TEST_F(ObjectStoreTest, PutReplacesExistingRecord) {
    todos_->put(json{{"id", 1}, {"title", "old"}});
    todos_->put(json{{"id", 1}, {"title", "new"}});
    EXPECT_EQ((*todos_->get(1))["title"], "new");
}

TEST_F(ObjectStoreTest, DeleteMissingKeyChangesNothing) {
    todos_->put(json{{"id", 1}});
    todos_->del(2);
    todos_->del(2);
    EXPECT_TRUE(todos_->get(1).has_value());
}

TEST_F(ObjectStoreTest, ClearRemovesRecordsAndIndexEntriesButKeepsGenerator) {
    todos_->put(json{{"userId", 1}});
    todos_->put(json{{"userId", 2}});
    todos_->clear();

    EXPECT_TRUE(todos_->get_all(KeyRange::unbounded()).empty());
    EXPECT_TRUE(todos_->index("userId").get_all(KeyRange::unbounded()).empty());
    EXPECT_EQ(todos_->put(json::object()), 3);
}

// ── get_all ───────────────────────────────────────────────────────────────────

TEST_F(ObjectStoreTest, GetAllIsOrderedBoundedAndCounted) {
    for (int i = 10; i >= 1; --i) todos_->put(json{{"id", i}});

    auto all = todos_->get_all(KeyRange::unbounded());
    ASSERT_EQ(all.size(), 10u);
    EXPECT_EQ(all.front()["id"], 1);
    EXPECT_EQ(all.back()["id"], 10);

    auto bounded = todos_->get_all(KeyRange::bound(3, 6), 2);
    EXPECT_EQ(field_of(bounded, "id"), (std::vector<json>{3, 4}));
}

TEST_F(ObjectStoreTest, StoresDoNotSeeEachOthersRecords) {
    todos_->put(json{{"id", 1}});
    users_->put(json{{"id", 1}, {"email", "a@x"}});
    EXPECT_EQ(todos_->get_all(KeyRange::unbounded()).size(), 1u);
    EXPECT_EQ(users_->get_all(KeyRange::unbounded()).size(), 1u);
}

// ── Indexes ───────────────────────────────────────────────────────────────────

TEST_F(ObjectStoreTest, IndexGetReturnsLowestPrimaryKey) {
    todos_->put(json{{"id", 7}, {"userId", 5}});
    todos_->put(json{{"id", 3}, {"userId", 5}});
    todos_->put(json{{"id", 9}, {"userId", 5}});

    auto record = todos_->index("userId").get(5);
    ASSERT_TRUE(record);
    EXPECT_EQ((*record)["id"], 3);
    EXPECT_FALSE(todos_->index("userId").get(6).has_value());
}

TEST_F(ObjectStoreTest, IndexRangeOrdersByIndexedValueThenPrimaryKey) {
    todos_->put(json{{"id", 1}, {"userId", 9}});
    todos_->put(json{{"id", 2}, {"userId", 8}});
    todos_->put(json{{"id", 3}, {"userId", 9}});
    todos_->put(json{{"id", 4}, {"userId", 12}});

    auto records = todos_->index("userId").get_all(KeyRange::bound(7, 10));
    EXPECT_EQ(field_of(records, "id"), (std::vector<json>{2, 1, 3}));
}

TEST_F(ObjectStoreTest, UpdatingRecordMovesIndexEntry) {
    todos_->put(json{{"id", 1}, {"userId", 1}});
    todos_->put(json{{"id", 1}, {"userId", 2}});

    EXPECT_FALSE(todos_->index("userId").get(1).has_value());
    EXPECT_TRUE(todos_->index("userId").get(2).has_value());
}

TEST_F(ObjectStoreTest, DeletingRecordRemovesIndexEntry) {
    todos_->put(json{{"id", 1}, {"userId", 1}});
    todos_->del(1);
    EXPECT_FALSE(todos_->index("userId").get(1).has_value());
}

TEST_F(ObjectStoreTest, RecordsWithoutIndexedValueAreNotIndexed) {
    todos_->put(json{{"id", 1}});
    todos_->put(json{{"id", 2}, {"userId", nullptr}});
    todos_->put(json{{"id", 3}, {"userId", 4}});
    EXPECT_EQ(todos_->index("userId").get_all(KeyRange::unbounded()).size(), 1u);
}

TEST_F(ObjectStoreTest, UnknownIndexIsIndexNotFound) {
    EXPECT_EQ(errc_of([&] { (void)todos_->index("nope"); }), Errc::index_not_found);
}

TEST_F(ObjectStoreTest, UniqueIndexRejectsDuplicateBeforeWriting) {
    users_->put(json{{"id", 1}, {"email", "a@x"}});
    EXPECT_EQ(errc_of([&] { users_->put(json{{"id", 2}, {"email", "a@x"}}); }),
              Errc::constraint_violation);
    EXPECT_FALSE(users_->get(2).has_value());
}

TEST_F(ObjectStoreTest, UniqueIndexAllowsRewritingSameRecord) {
    users_->put(json{{"id", 1}, {"email", "a@x"}, {"name", "A"}});
    EXPECT_NO_THROW(users_->put(json{{"id", 1}, {"email", "a@x"}, {"name", "B"}}));
}

TEST_F(ObjectStoreTest, MultiEntryIndexesEachDistinctElement) {
    users_->put(json{{"id", 1}, {"email", "a"}, {"tags", {"red", "blue", "red", true}}});
    users_->put(json{{"id", 2}, {"email", "b"}, {"tags", {"blue"}}});

    auto tags = users_->index("tags");
    EXPECT_EQ(tags.get_all(KeyRange::only("red")).size(), 1u);
    EXPECT_EQ(field_of(tags.get_all(KeyRange::only("blue")), "id"),
              (std::vector<json>{1, 2}));
    EXPECT_EQ(tags.get_all(KeyRange::unbounded()).size(), 3u);
}

TEST_F(ObjectStoreTest, BuildIndexBackfillsExistingRecords) {
    todos_->put(json{{"id", 1}, {"title", "b"}});
    todos_->put(json{{"id", 2}, {"title", "a"}});

    todos_def_.indexes.push_back(IndexDef{"title", "title"});
    todos_->build_index(todos_def_.indexes.back());

    auto records = todos_->index("title").get_all(KeyRange::unbounded());
    EXPECT_EQ(field_of(records, "id"), (std::vector<json>{2, 1}));
}

// ── Keyspace ──────────────────────────────────────────────────────────────────

TEST_F(ObjectStoreTest, RecordsAreStoredAsMessagePack) {
    todos_->put(json{{"id", 1}, {"title", "t"}});
    auto bytes = txn_->get(keyspace::record_key("todos", 1));
    ASSERT_TRUE(bytes);
    EXPECT_EQ(json::from_msgpack(*bytes)["title"], "t");
}

TEST_F(ObjectStoreTest, CorruptRecordIsStorageFailure) {
    txn_->put(keyspace::record_key("todos", 1), "\xC1");
    EXPECT_EQ(errc_of([&] { (void)todos_->get(1); }), Errc::storage_failure);
}

} // namespace rkv
