#include <agentmem/core/runtime.hpp>
#include <agentmem/core/errors.hpp>
#include <agentmem/core/utils.hpp>
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <sys/stat.h>

using namespace agentmem;

namespace {

Config runtime_config(const std::string& backend) {
    Config cfg;
    cfg.set_string("log_level", "error");
    cfg.set_string("agent_id", "agent-a");
    cfg.set_string("cache.backend", backend);
    return cfg;
}

// Encodes the text length in the first component
class LengthProvider : public EmbeddingProvider {
public:
    explicit LengthProvider(int dims) : calls(0), dims_(dims) {}

    Embedding embed(const std::string& text) override {
        ++calls;
        Embedding v = zero_vector(dims_);
        if (!v.empty()) v[0] = static_cast<float>(text.size());
        return v;
    }
    int dimensions() const override { return dims_; }

    int calls;

private:
    int dims_;
};

bool is_directory(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

} // namespace

TEST(AgentRuntimeTest, AccessBeforeInitThrows) {
    AgentRuntime runtime;
    EXPECT_FALSE(runtime.is_initialized());
    EXPECT_THROW(runtime.database(), Error);
    EXPECT_THROW(runtime.cache(), Error);
}

TEST(AgentRuntimeTest, MemoryBackend) {
    AgentRuntime runtime;
    ASSERT_TRUE(runtime.init(runtime_config("memory")));
    EXPECT_TRUE(runtime.is_initialized());
    EXPECT_EQ(runtime.agent_id(), "agent-a");
    EXPECT_EQ(runtime.cache_backend(), "memory");
    EXPECT_EQ(runtime.embedding().dimensions, DEFAULT_EMBEDDING_DIMENSIONS);

    runtime.cache().set("answer", 42);
    int out = 0;
    ASSERT_TRUE(runtime.cache().get("answer", out));
    EXPECT_EQ(out, 42);

    Memory m;
    m.type = "messages";
    m.room_id = "room-1";
    m.agent_id = runtime.agent_id();
    m.content = Content("hello");
    m.embedding = test::basis(0);
    runtime.database().create_memory(m, "messages");
    EXPECT_EQ(runtime.database().count_memories("room-1", false, "messages"), 1);
}

TEST(AgentRuntimeTest, DatabaseBackendIsScopedByAgent) {
    AgentRuntime runtime;
    ASSERT_TRUE(runtime.init(runtime_config("DB")));
    EXPECT_EQ(runtime.cache_backend(), "db");

    runtime.cache().set("k", std::string("v"));

    std::string raw;
    EXPECT_TRUE(runtime.sqlite().get_cache("k", "agent-a", raw));
    EXPECT_FALSE(runtime.sqlite().get_cache("k", "agent-b", raw));
}

TEST(AgentRuntimeTest, FilesystemBackendCreatesDirectory) {
    test::TempDir dir;
    std::string cache_dir = join_path(dir.path(), "nested/cache");
    Config cfg = runtime_config("fs");
    cfg.set_string("cache.dir", cache_dir);

    AgentRuntime runtime;
    ASSERT_TRUE(runtime.init(cfg));
    EXPECT_TRUE(is_directory(cache_dir));

    runtime.cache().set("k", true);
    struct stat st;
    EXPECT_EQ(stat(join_path(cache_dir, "k").c_str(), &st), 0);
}

TEST(AgentRuntimeTest, UnknownBackendFailsInit) {
    test::QuietLogs quiet;
    AgentRuntime runtime;
    EXPECT_FALSE(runtime.init(runtime_config("redis")));
    EXPECT_FALSE(runtime.is_initialized());
}

TEST(AgentRuntimeTest, GeneratesAgentIdWhenMissing) {
    Config cfg;
    cfg.set_string("log_level", "error");
    cfg.set_string("cache.backend", "memory");

    AgentRuntime runtime;
    ASSERT_TRUE(runtime.init(cfg));
    EXPECT_EQ(runtime.agent_id().size(), 36u);
}

TEST(AgentRuntimeTest, ProviderSetsEmbeddingLength) {
    Config cfg = runtime_config("memory");
    cfg.set_string("embedding.provider", "openai");

    AgentRuntime runtime;
    ASSERT_TRUE(runtime.init(cfg));
    EXPECT_EQ(runtime.embedding().dimensions, 1536);

    Memory m;
    m.id = "m1";
    m.type = "messages";
    m.room_id = "room-1";
    m.content = Content("no vector yet");
    runtime.database().create_memory(m, "messages");

    Memory out;
    ASSERT_TRUE(runtime.database().get_memory_by_id("m1", out));
    EXPECT_EQ(out.embedding.size(), 1536u);
}

TEST(AgentRuntimeTest, DatabaseFileFromConfig) {
    test::TempDir dir;
    std::string path = join_path(dir.path(), "data/agent.db");
    Config cfg = runtime_config("memory");
    cfg.set_string("database.path", path);

    {
        AgentRuntime runtime;
        ASSERT_TRUE(runtime.init(cfg));
        Account account;
        account.id = "user-1";
        account.name = "ada";
        ASSERT_TRUE(runtime.database().create_account(account));
    }

    AgentRuntime reopened;
    ASSERT_TRUE(reopened.init(cfg));
    Account out;
    EXPECT_TRUE(reopened.database().get_account_by_id("user-1", out));
    EXPECT_EQ(reopened.sqlite().schema_version(), SCHEMA_VERSION);
}

TEST(AgentRuntimeTest, ShutdownReleasesStore) {
    AgentRuntime runtime;
    ASSERT_TRUE(runtime.init(runtime_config("memory")));
    runtime.shutdown();
    EXPECT_FALSE(runtime.is_initialized());
    EXPECT_THROW(runtime.cache(), Error);
    runtime.shutdown();
}

TEST(AgentRuntimeTest, EmbedWithoutProviderGivesZeroVector) {
    AgentRuntime runtime;
    ASSERT_TRUE(runtime.init(runtime_config("memory")));
    EXPECT_EQ(runtime.embed("hello"), zero_vector(runtime.embedding()));

    test::QuietLogs quiet;
    EXPECT_TRUE(runtime.embed("   ").empty());
}

TEST(AgentRuntimeTest, EmbedUsesProvider) {
    auto provider = std::make_shared<LengthProvider>(DEFAULT_EMBEDDING_DIMENSIONS);
    AgentRuntime runtime;
    ASSERT_TRUE(runtime.init(runtime_config("memory")));
    runtime.set_embedding_provider(provider);

    Embedding v = runtime.embed("hello");
    ASSERT_EQ(v.size(), static_cast<size_t>(DEFAULT_EMBEDDING_DIMENSIONS));
    EXPECT_EQ(v[0], 5.0f);
    EXPECT_EQ(provider->calls, 1);
}

TEST(AgentRuntimeTest, EmbedReusesStoredMessageEmbedding) {
    auto provider = std::make_shared<LengthProvider>(DEFAULT_EMBEDDING_DIMENSIONS);
    AgentRuntime runtime;
    ASSERT_TRUE(runtime.init(runtime_config("memory")));
    runtime.set_embedding_provider(provider);

    Memory m;
    m.type = "messages";
    m.room_id = "room-1";
    m.content = Content("good morning");
    m.embedding = test::basis(3, 0.5f);
    runtime.database().create_memory(m, "messages");

    EXPECT_EQ(runtime.embed("Good Morning"), test::basis(3, 0.5f));
    EXPECT_EQ(provider->calls, 0);

    runtime.embed("good evening");
    EXPECT_EQ(provider->calls, 1);
}

TEST(AgentRuntimeTest, EmbedRejectsWrongProviderLength) {
    AgentRuntime runtime;
    ASSERT_TRUE(runtime.init(runtime_config("memory")));
    runtime.set_embedding_provider(std::make_shared<LengthProvider>(8));
    EXPECT_THROW(runtime.embed("hello"), ValidationError);
}
