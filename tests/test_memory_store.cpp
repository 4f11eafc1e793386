#include <agentmem/memory/store.hpp>
#include <agentmem/core/errors.hpp>
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace agentmem;
using agentmem::test::basis;

class MemoryStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(db_.open(":memory:"));
    }

    Memory make_memory(const std::string& id, const std::string& text, const Embedding& embedding,
                       const Uuid& room = "room-1", const Uuid& agent = "agent-1") {
        Memory m;
        m.id = id;
        m.type = "messages";
        m.user_id = "user-1";
        m.agent_id = agent;
        m.room_id = room;
        m.content = Content(text);
        m.embedding = embedding;
        return m;
    }

    Memory stored(const Uuid& id) {
        Memory m;
        EXPECT_TRUE(db_.get_memory_by_id(id, m)) << "missing memory " << id;
        return m;
    }

    SqliteDatabaseAdapter db_;
};

// ============================================================================
// Create / read
// ============================================================================

TEST_F(MemoryStoreTest, ContentRoundTrips) {
    Memory m = make_memory("m1", "hello there", basis(0));
    m.content.extra["action"] = "GREET";
    Json attachment = {{"url", "https://example.com/a.png"}};
    m.content.extra["attachments"] = Json::array();
    m.content.extra["attachments"].push_back(attachment);
    m.content.extra["inReplyTo"] = nullptr;
    db_.create_memory(m, "messages");

    Memory out = stored("m1");
    EXPECT_TRUE(out.content == m.content);
    EXPECT_EQ(out.content.text, "hello there");
    EXPECT_EQ(out.content.extra["action"], "GREET");
    EXPECT_EQ(out.type, "messages");
    EXPECT_EQ(out.user_id, "user-1");
    EXPECT_EQ(out.agent_id, "agent-1");
    EXPECT_EQ(out.room_id, "room-1");
    EXPECT_EQ(out.embedding, m.embedding);
    EXPECT_GT(out.created_at, 0);
}

TEST_F(MemoryStoreTest, MissingMemoryIsAbsent) {
    Memory out;
    EXPECT_FALSE(db_.get_memory_by_id("nope", out));
}

TEST_F(MemoryStoreTest, GeneratesIdWhenMissing) {
    db_.create_memory(make_memory("", "anonymous", basis(0)), "messages");
    GetMemoriesParams params;
    params.room_id = "room-1";
    params.table_name = "messages";
    std::vector<Memory> all = db_.get_memories(params);
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].id.size(), 36u);
}

TEST_F(MemoryStoreTest, CallerSuppliedCreatedAtIsKept) {
    Memory m = make_memory("m1", "old", basis(0));
    m.created_at = 1234;
    db_.create_memory(m, "messages");
    EXPECT_EQ(stored("m1").created_at, 1234);
}

TEST_F(MemoryStoreTest, InsertReplacesOnSameId) {
    db_.create_memory(make_memory("m1", "first", basis(0)), "messages");
    db_.create_memory(make_memory("m1", "second", basis(5)), "messages");
    EXPECT_EQ(stored("m1").content.text, "second");
    EXPECT_EQ(db_.count_rows("memories"), 1);
}

TEST_F(MemoryStoreTest, EmptyEmbeddingStoredAsZeroVector) {
    db_.create_memory(make_memory("m1", "no vector", Embedding()), "messages");
    Memory out = stored("m1");
    EXPECT_EQ(out.embedding, zero_vector(384));
    EXPECT_TRUE(out.unique);
}

TEST_F(MemoryStoreTest, MismatchedEmbeddingCoercedToZeroVector) {
    test::QuietLogs quiet;
    db_.create_memory(make_memory("m1", "short vector", Embedding(10, 1.0f)), "messages");
    Memory out = stored("m1");
    EXPECT_EQ(out.embedding.size(), 384u);
    EXPECT_EQ(out.embedding, zero_vector(384));
    EXPECT_TRUE(out.unique);
}

TEST_F(MemoryStoreTest, ConfiguredDimensionality) {
    EmbeddingConfig ec;
    ec.dimensions = 16;
    SqliteDatabaseAdapter small(ec);
    ASSERT_TRUE(small.open(":memory:"));

    small.create_memory(make_memory("m1", "tiny", Embedding()), "messages");
    Memory out;
    ASSERT_TRUE(small.get_memory_by_id("m1", out));
    EXPECT_EQ(out.embedding.size(), 16u);
}

TEST_F(MemoryStoreTest, CreateRequiresTableName) {
    Memory m = make_memory("m1", "x", basis(0));
    m.type = "";
    EXPECT_THROW(db_.create_memory(m, ""), ValidationError);
}

TEST_F(MemoryStoreTest, InvalidUtf8ContentRejected) {
    EXPECT_THROW(db_.create_memory(make_memory("m1", "caf\xe9", basis(0)), "messages"), ValidationError);
    EXPECT_EQ(db_.count_memories("room-1", false, "messages"), 0);

    db_.create_memory(make_memory("m2", "caf\xc3\xa9", basis(1)), "messages");
    EXPECT_EQ(stored("m2").content.text, "caf\xc3\xa9");
}

TEST(MemoryStoreFileTest, CorruptContentIsDeserializationError) {
    test::TempDir dir;
    std::string path = dir.path() + "/corrupt.db";

    SqliteDatabaseAdapter db;
    ASSERT_TRUE(db.open(path));
    Memory m;
    m.id = "m1";
    m.type = "messages";
    m.room_id = "room-1";
    m.content = Content("fine");
    db.create_memory(m, "messages");
    db.close();

    sqlite3* raw = nullptr;
    ASSERT_EQ(sqlite3_open(path.c_str(), &raw), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(raw, "UPDATE memories SET content = '{broken' WHERE id = 'm1'",
                           nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(raw);

    ASSERT_TRUE(db.open(path));
    Memory out;
    EXPECT_THROW(db.get_memory_by_id("m1", out), DeserializationError);
}

TEST(MemoryStoreFileTest, ReopenKeepsDataAndSchemaVersion) {
    test::TempDir dir;
    std::string path = dir.path() + "/nested/dir/agent.db";

    SqliteDatabaseAdapter db;
    ASSERT_TRUE(db.open(path));
    EXPECT_EQ(db.schema_version(), SCHEMA_VERSION);
    db.create_room("kept");
    db.close();

    ASSERT_TRUE(db.open(path));
    Uuid room;
    EXPECT_TRUE(db.get_room("kept", room));
    EXPECT_EQ(db.schema_version(), SCHEMA_VERSION);
}

TEST(MemoryStoreFileTest, RefusesNewerSchema) {
    test::QuietLogs quiet;
    test::TempDir dir;
    std::string path = dir.path() + "/future.db";

    sqlite3* raw = nullptr;
    ASSERT_EQ(sqlite3_open(path.c_str(), &raw), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(raw, "PRAGMA user_version = 99", nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(raw);

    SqliteDatabaseAdapter db;
    EXPECT_FALSE(db.open(path));
    EXPECT_FALSE(db.is_open());
}

TEST_F(MemoryStoreTest, ClosedDatabaseThrowsStoreError) {
    SqliteDatabaseAdapter closed;
    Memory out;
    EXPECT_THROW(closed.get_memory_by_id("m1", out), StoreError);
    EXPECT_THROW(closed.create_memory(make_memory("m1", "x", Embedding()), "messages"), StoreError);
}

// ============================================================================
// Dedup
// ============================================================================

TEST_F(MemoryStoreTest, NearDuplicateIsNotUnique) {
    db_.create_memory(make_memory("m1", "original", basis(0)), "messages");

    Embedding near = basis(0);
    near[1] = 0.01f;    // distance 0.01, score ~0.99
    db_.create_memory(make_memory("m2", "near copy", near), "messages");

    EXPECT_TRUE(stored("m1").unique);
    EXPECT_FALSE(stored("m2").unique);
}

TEST_F(MemoryStoreTest, DissimilarMemoryIsUnique) {
    db_.create_memory(make_memory("m1", "original", basis(0)), "messages");

    Embedding apart = basis(0);
    apart[1] = 0.1f;    // distance 0.1, score ~0.909
    db_.create_memory(make_memory("m2", "different", apart), "messages");
    db_.create_memory(make_memory("m3", "orthogonal", basis(1)), "messages");

    EXPECT_TRUE(stored("m2").unique);
    EXPECT_TRUE(stored("m3").unique);
}

TEST_F(MemoryStoreTest, DedupIsScopedToTypeAgentAndRoom) {
    db_.create_memory(make_memory("m1", "original", basis(0)), "messages");

    db_.create_memory(make_memory("other-room", "same", basis(0), "room-2"), "messages");
    db_.create_memory(make_memory("other-agent", "same", basis(0), "room-1", "agent-2"), "messages");
    db_.create_memory(make_memory("other-type", "same", basis(0)), "facts");

    EXPECT_TRUE(stored("other-room").unique);
    EXPECT_TRUE(stored("other-agent").unique);
    EXPECT_TRUE(stored("other-type").unique);
}

// ============================================================================
// Listing and counting
// ============================================================================

TEST_F(MemoryStoreTest, GetMemoriesNewestFirst) {
    Memory a = make_memory("a", "a", basis(0));
    a.created_at = 1000;
    Memory b = make_memory("b", "b", basis(1));
    b.created_at = 3000;
    Memory c = make_memory("c", "c", basis(2));
    c.created_at = 2000;
    db_.create_memory(a, "messages");
    db_.create_memory(b, "messages");
    db_.create_memory(c, "messages");

    GetMemoriesParams params;
    params.room_id = "room-1";
    params.table_name = "messages";
    std::vector<Memory> all = db_.get_memories(params);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id, "b");
    EXPECT_EQ(all[1].id, "c");
    EXPECT_EQ(all[2].id, "a");

    params.count = 2;
    std::vector<Memory> capped = db_.get_memories(params);
    ASSERT_EQ(capped.size(), 2u);
    EXPECT_EQ(capped[0].id, "b");
    EXPECT_EQ(capped[1].id, "c");

    params.count = 0;
    params.start = 1500;
    params.end = 2500;
    std::vector<Memory> window = db_.get_memories(params);
    ASSERT_EQ(window.size(), 1u);
    EXPECT_EQ(window[0].id, "c");
}

TEST_F(MemoryStoreTest, GetMemoriesFilters) {
    db_.create_memory(make_memory("m1", "x", basis(0)), "messages");
    Embedding near = basis(0);
    near[1] = 0.001f;
    db_.create_memory(make_memory("dup", "x again", near), "messages");
    db_.create_memory(make_memory("m2", "other agent", basis(3), "room-1", "agent-2"), "messages");
    db_.create_memory(make_memory("m3", "elsewhere", basis(4), "room-2"), "messages");

    GetMemoriesParams params;
    params.room_id = "room-1";
    params.table_name = "messages";
    EXPECT_EQ(db_.get_memories(params).size(), 3u);

    params.unique = true;
    EXPECT_EQ(db_.get_memories(params).size(), 2u);

    params.agent_id = "agent-2";
    std::vector<Memory> agent2 = db_.get_memories(params);
    ASSERT_EQ(agent2.size(), 1u);
    EXPECT_EQ(agent2[0].id, "m2");
}

TEST_F(MemoryStoreTest, GetMemoriesRequiresTableAndRoom) {
    GetMemoriesParams params;
    params.room_id = "room-1";
    params.count = 5;
    EXPECT_THROW(db_.get_memories(params), ValidationError);

    params.room_id = "";
    params.table_name = "messages";
    EXPECT_THROW(db_.get_memories(params), ValidationError);
}

TEST_F(MemoryStoreTest, CountMemories) {
    db_.create_memory(make_memory("m1", "x", basis(0)), "messages");
    Embedding near = basis(0);
    near[2] = 0.001f;
    db_.create_memory(make_memory("m2", "x", near), "messages");
    db_.create_memory(make_memory("m3", "y", basis(1)), "messages");

    EXPECT_EQ(db_.count_memories("room-1", true, "messages"), 2);
    EXPECT_EQ(db_.count_memories("room-1", false, "messages"), 3);
    EXPECT_EQ(db_.count_memories("room-2", false, "messages"), 0);
    EXPECT_THROW(db_.count_memories("room-1", true, ""), ValidationError);
}

TEST_F(MemoryStoreTest, GetMemoriesByRoomIds) {
    db_.create_memory(make_memory("r1", "x", basis(0), "room-1"), "messages");
    db_.create_memory(make_memory("r2", "y", basis(1), "room-2"), "messages");
    db_.create_memory(make_memory("r3", "z", basis(2), "room-3"), "messages");
    db_.create_memory(make_memory("f1", "fact", basis(3), "room-1"), "facts");

    std::vector<Uuid> rooms = {"room-1", "room-2"};
    std::vector<Memory> found = db_.get_memories_by_room_ids("agent-1", rooms, "messages");
    ASSERT_EQ(found.size(), 2u);
    for (const auto& m : found) {
        EXPECT_NE(m.id, "r3");
        EXPECT_EQ(m.type, "messages");
    }

    EXPECT_EQ(db_.get_memories_by_room_ids("agent-1", rooms, "").size(), 2u);
    EXPECT_EQ(db_.get_memories_by_room_ids("agent-2", rooms, "messages").size(), 0u);
    EXPECT_TRUE(db_.get_memories_by_room_ids("agent-1", std::vector<Uuid>(), "messages").empty());
}

// ============================================================================
// Similarity search
// ============================================================================

class MemorySearchTest : public MemoryStoreTest {
protected:
    void SetUp() override {
        MemoryStoreTest::SetUp();
        // Distances from basis(0): 3, 0, 1
        db_.create_memory(make_memory("far", "far", basis(0, 4.0f)), "messages");
        db_.create_memory(make_memory("exact", "exact", basis(0)), "messages");
        db_.create_memory(make_memory("mid", "mid", basis(0, 2.0f)), "messages");
    }
};

TEST_F(MemorySearchTest, SearchMemoriesAscendingDistance) {
    SearchMemoriesParams params;
    params.table_name = "messages";
    params.room_id = "room-1";
    params.embedding = basis(0);
    params.match_count = 10;

    std::vector<MemoryDistanceHit> hits = db_.search_memories(params);
    ASSERT_EQ(hits.size(), 3u);
    EXPECT_EQ(hits[0].memory.id, "exact");
    EXPECT_EQ(hits[1].memory.id, "mid");
    EXPECT_EQ(hits[2].memory.id, "far");
    EXPECT_NEAR(hits[0].distance, 0.0, 1e-6);
    EXPECT_NEAR(hits[1].distance, 1.0, 1e-6);
    EXPECT_NEAR(hits[2].distance, 3.0, 1e-6);
    for (size_t i = 1; i < hits.size(); ++i) {
        EXPECT_LE(hits[i - 1].distance, hits[i].distance);
    }
}

TEST_F(MemorySearchTest, SearchMemoriesCapsAfterOrdering) {
    SearchMemoriesParams params;
    params.table_name = "messages";
    params.room_id = "room-1";
    params.embedding = basis(0, 4.0f);
    params.match_count = 1;

    std::vector<MemoryDistanceHit> hits = db_.search_memories(params);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].memory.id, "far");
}

TEST_F(MemorySearchTest, SearchMemoriesFiltersAgentAndRoom) {
    db_.create_memory(make_memory("elsewhere", "x", basis(0), "room-2"), "messages");
    db_.create_memory(make_memory("agent2", "x", basis(0), "room-1", "agent-2"), "messages");

    SearchMemoriesParams params;
    params.table_name = "messages";
    params.room_id = "room-1";
    params.embedding = basis(0);
    EXPECT_EQ(db_.search_memories(params).size(), 4u);

    params.agent_id = "agent-2";
    std::vector<MemoryDistanceHit> hits = db_.search_memories(params);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].memory.id, "agent2");
}

TEST_F(MemorySearchTest, SearchMemoriesRejectsWrongLengthQuery) {
    SearchMemoriesParams params;
    params.table_name = "messages";
    params.room_id = "room-1";
    params.embedding = Embedding(3, 0.5f);
    EXPECT_THROW(db_.search_memories(params), ValidationError);
}

TEST_F(MemorySearchTest, SearchByEmbeddingDescendingScore) {
    EmbeddingSearchParams params;
    params.agent_id = "agent-1";
    params.table_name = "messages";

    std::vector<MemorySearchHit> hits = db_.search_memories_by_embedding(basis(0), params);
    ASSERT_EQ(hits.size(), 3u);
    EXPECT_EQ(hits[0].memory.id, "exact");
    EXPECT_EQ(hits[1].memory.id, "mid");
    EXPECT_EQ(hits[2].memory.id, "far");
    EXPECT_NEAR(hits[0].score, 1.0, 1e-6);
    EXPECT_NEAR(hits[1].score, 0.5, 1e-6);
    EXPECT_NEAR(hits[2].score, 0.25, 1e-6);
    for (size_t i = 1; i < hits.size(); ++i) {
        EXPECT_GE(hits[i - 1].score, hits[i].score);
    }
}

TEST_F(MemorySearchTest, SearchByEmbeddingThresholdAndCount) {
    EmbeddingSearchParams params;
    params.agent_id = "agent-1";
    params.table_name = "messages";
    params.match_threshold = 0.4;

    std::vector<MemorySearchHit> hits = db_.search_memories_by_embedding(basis(0), params);
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[1].memory.id, "mid");

    params.match_threshold = 0;
    params.count = 1;
    hits = db_.search_memories_by_embedding(basis(0, 4.0f), params);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].memory.id, "far");
}

TEST_F(MemorySearchTest, SearchByEmbeddingOptionalRoom) {
    db_.create_memory(make_memory("elsewhere", "x", basis(7), "room-2"), "messages");

    EmbeddingSearchParams params;
    params.agent_id = "agent-1";
    params.table_name = "messages";
    EXPECT_EQ(db_.search_memories_by_embedding(basis(0), params).size(), 4u);

    params.room_id = "room-2";
    std::vector<MemorySearchHit> hits = db_.search_memories_by_embedding(basis(0), params);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].memory.id, "elsewhere");
}

// ============================================================================
// Cached embeddings, deletes, logs
// ============================================================================

TEST_F(MemoryStoreTest, CachedEmbeddingsOrderedByEditDistance) {
    Memory hello = make_memory("hello", "", basis(0));
    hello.content.extra["meta"] = {{"title", "Hello World"}};
    Memory help = make_memory("help", "", basis(1));
    help.content.extra["meta"] = {{"title", "help words"}};
    Memory other = make_memory("other", "", basis(2));
    other.content.extra["meta"] = {{"count", 3}};
    db_.create_memory(hello, "documents");
    db_.create_memory(help, "documents");
    db_.create_memory(other, "documents");

    CachedEmbeddingQuery query;
    query.query_table_name = "documents";
    query.query_input = "HELLO WORLD";
    query.query_field_name = "meta";
    query.query_field_sub_name = "title";

    std::vector<CachedEmbedding> rows = db_.get_cached_embeddings(query);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].embedding, basis(0));
    EXPECT_DOUBLE_EQ(rows[0].levenshtein_score, 0.0);
    EXPECT_EQ(rows[1].embedding, basis(1));
    EXPECT_GT(rows[1].levenshtein_score, 0.0);

    query.query_match_count = 1;
    EXPECT_EQ(db_.get_cached_embeddings(query).size(), 1u);
}

TEST_F(MemoryStoreTest, RemoveMemoryIsScopedByType) {
    db_.create_memory(make_memory("m1", "x", basis(0)), "messages");
    db_.remove_memory("m1", "facts");
    EXPECT_EQ(db_.count_rows("memories"), 1);
    db_.remove_memory("m1", "messages");
    EXPECT_EQ(db_.count_rows("memories"), 0);
}

TEST_F(MemoryStoreTest, RemoveAllMemoriesInRoom) {
    db_.create_memory(make_memory("a", "x", basis(0)), "messages");
    db_.create_memory(make_memory("b", "y", basis(1)), "messages");
    db_.create_memory(make_memory("c", "z", basis(2), "room-2"), "messages");
    db_.create_memory(make_memory("d", "w", basis(3)), "facts");

    db_.remove_all_memories("room-1", "messages");
    EXPECT_EQ(db_.count_memories("room-1", false, "messages"), 0);
    EXPECT_EQ(db_.count_memories("room-2", false, "messages"), 1);
    EXPECT_EQ(db_.count_memories("room-1", false, "facts"), 1);
}

TEST_F(MemoryStoreTest, LogIsAppendOnly) {
    LogEntry entry;
    entry.body = {{"event", "action"}, {"name", "GREET"}};
    entry.user_id = "user-1";
    entry.room_id = "room-1";
    entry.type = "action";
    db_.log(entry);
    db_.log(entry);
    EXPECT_EQ(db_.count_rows("logs"), 2);

    entry.body["name"] = "caf\xe9";
    EXPECT_THROW(db_.log(entry), ValidationError);
    EXPECT_EQ(db_.count_rows("logs"), 2);
}

// ============================================================================
// Room scenario
// ============================================================================

TEST_F(MemoryStoreTest, RoomScenario) {
    Uuid room = db_.create_room("R");
    ASSERT_EQ(room, "R");

    Memory m1 = make_memory("m1", "hello", Embedding(), room, "A");
    db_.create_memory(m1, "messages");

    Memory first = stored("m1");
    EXPECT_EQ(first.embedding, zero_vector(384));
    EXPECT_TRUE(first.unique);

    // Same text, explicit 384-d vector at distance 0 from m1's stored vector
    Memory m2 = make_memory("m2", "hello", zero_vector(384), room, "A");
    db_.create_memory(m2, "messages");
    EXPECT_FALSE(stored("m2").unique);

    GetMemoriesParams params;
    params.room_id = room;
    params.table_name = "messages";
    params.count = 10;
    std::vector<Memory> listed = db_.get_memories(params);
    ASSERT_EQ(listed.size(), 2u);
    EXPECT_EQ(listed[0].id, "m2");
    EXPECT_EQ(listed[1].id, "m1");
    EXPECT_GE(listed[0].created_at, listed[1].created_at);
}
