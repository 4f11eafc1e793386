/*
 * agentmem C++ - Agent Runtime Implementation
 */
#include <agentmem/core/runtime.hpp>
#include <agentmem/core/errors.hpp>
#include <agentmem/core/logger.hpp>
#include <agentmem/core/utils.hpp>

namespace agentmem {

AgentRuntime::AgentRuntime() {}

AgentRuntime::~AgentRuntime() {
    shutdown();
}

void AgentRuntime::setup_logging(const Config& config) {
    auto log_level = config.get_string("log_level", "info");
    Logger::instance().set_level(parse_log_level(log_level, LogLevel::INFO));
}

bool AgentRuntime::init(const Config& config) {
    if (db_) {
        shutdown();
    }

    setup_logging(config);
    LOG_INFO("%s v%s starting...", AppInfo::NAME, AppInfo::VERSION);

    agent_id_ = config.get_string("agent_id", "");
    if (agent_id_.empty()) {
        agent_id_ = generate_uuid();
        LOG_INFO("[Runtime] No agent_id configured, using %s", agent_id_.c_str());
    }

    embedding_ = resolve_embedding_config(config);
    LOG_INFO("[Runtime] Embeddings: %s (%s, %d dimensions)",
             embedding_.provider.c_str(), embedding_.model.c_str(), embedding_.dimensions);

    std::unique_ptr<SqliteDatabaseAdapter> db(new SqliteDatabaseAdapter(embedding_));
    std::string db_path = config.get_string("database.path", ":memory:");
    if (!db->open(db_path)) {
        LOG_ERROR("[Runtime] Failed to open database '%s'", db_path.c_str());
        return false;
    }
    db_ = std::move(db);

    if (!setup_cache(config)) {
        db_.reset();
        return false;
    }

    LOG_INFO("[Runtime] Ready (agent %s, cache backend %s)", agent_id_.c_str(), cache_backend_.c_str());
    return true;
}

bool AgentRuntime::setup_cache(const Config& config) {
    cache_backend_ = to_lower(config.get_string("cache.backend", "database"));

    std::shared_ptr<CacheAdapter> adapter;
    if (cache_backend_ == "memory") {
        adapter = std::make_shared<MemoryCacheAdapter>();
    } else if (cache_backend_ == "fs" || cache_backend_ == "filesystem") {
        std::string dir = config.get_string("cache.dir", "./cache");
        if (!create_directories(dir)) {
            LOG_ERROR("[Runtime] Cannot create cache directory '%s'", dir.c_str());
            return false;
        }
        adapter = std::make_shared<FsCacheAdapter>(dir);
    } else if (cache_backend_ == "database" || cache_backend_ == "db") {
        adapter = std::make_shared<DbCacheAdapter>(*db_, agent_id_);
    } else {
        LOG_ERROR("[Runtime] Unknown cache backend '%s' (expected memory, fs or database)",
                  cache_backend_.c_str());
        return false;
    }

    cache_ = std::make_shared<CacheManager>(adapter);
    return true;
}

void AgentRuntime::shutdown() {
    if (!db_) return;

    cache_.reset();
    db_->close();
    db_.reset();
    LOG_INFO("[Runtime] Shut down");
}

Embedding AgentRuntime::embed(const std::string& text) {
    if (trim(text).empty()) {
        LOG_WARN("[Runtime] Refusing to embed empty input");
        return Embedding();
    }

    CachedEmbeddingQuery query;
    query.query_table_name = "messages";
    query.query_input = text;
    query.query_field_name = "text";
    query.query_match_count = 1;
    std::vector<CachedEmbedding> cached = sqlite().get_cached_embeddings(query);
    if (!cached.empty() && cached[0].levenshtein_score == 0 &&
        static_cast<int>(cached[0].embedding.size()) == embedding_.dimensions) {
        LOG_DEBUG("[Runtime] Reusing stored embedding for '%s'", text.c_str());
        return cached[0].embedding;
    }

    if (!provider_) {
        return zero_vector(embedding_);
    }

    Embedding v = provider_->embed(text);
    if (static_cast<int>(v.size()) != embedding_.dimensions) {
        throw ValidationError("embedding provider returned " + std::to_string(v.size()) +
                              " dimensions, expected " + std::to_string(embedding_.dimensions));
    }
    return v;
}

DatabaseAdapter& AgentRuntime::database() {
    return sqlite();
}

SqliteDatabaseAdapter& AgentRuntime::sqlite() {
    if (!db_) {
        throw Error("agent runtime is not initialized");
    }
    return *db_;
}

CacheManager& AgentRuntime::cache() {
    if (!cache_) {
        throw Error("agent runtime is not initialized");
    }
    return *cache_;
}

} // namespace agentmem
