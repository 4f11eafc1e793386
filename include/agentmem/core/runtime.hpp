/*
 * agentmem C++ - Agent Runtime
 *
 * Wires the storage layer together from a Config: logging level, the
 * SQLite adapter, the embedding dimensionality and the configured cache
 * backend behind a CacheManager. An EmbeddingProvider may be attached.
 *
 *   AgentRuntime runtime;
 *   if (!runtime.init(cfg)) return 1;
 *   runtime.database().create_memory(m, "messages");
 *   runtime.cache().set("key", value);
 */
#ifndef agentmem_CORE_RUNTIME_HPP
#define agentmem_CORE_RUNTIME_HPP

#include <agentmem/core/config.hpp>
#include <agentmem/cache/cache.hpp>
#include <agentmem/memory/store.hpp>
#include <memory>
#include <string>

namespace agentmem {

struct AppInfo {
    static constexpr const char* NAME = "agentmem";
    static constexpr const char* VERSION = "0.1.0";
};

class AgentRuntime {
public:
    AgentRuntime();
    ~AgentRuntime();

    // Returns false (after logging why) if the database cannot be opened
    // or the cache backend is unknown.
    bool init(const Config& config);
    void shutdown();
    bool is_initialized() const { return db_ != nullptr; }

    // Throw Error when called before init()
    DatabaseAdapter& database();
    SqliteDatabaseAdapter& sqlite();
    CacheManager& cache();

    // Text -> embedding: blank text gives an empty vector, a stored
    // memory with the exact same text is reused, otherwise the provider
    // is asked. Without a provider the zero vector is returned.
    Embedding embed(const std::string& text);
    void set_embedding_provider(std::shared_ptr<EmbeddingProvider> provider) { provider_ = provider; }

    const Uuid& agent_id() const { return agent_id_; }
    const EmbeddingConfig& embedding() const { return embedding_; }
    const std::string& cache_backend() const { return cache_backend_; }

private:
    AgentRuntime(const AgentRuntime&);
    AgentRuntime& operator=(const AgentRuntime&);

    void setup_logging(const Config& config);
    bool setup_cache(const Config& config);

    Uuid agent_id_;
    EmbeddingConfig embedding_;
    std::string cache_backend_;
    std::unique_ptr<SqliteDatabaseAdapter> db_;
    std::shared_ptr<CacheManager> cache_;
    std::shared_ptr<EmbeddingProvider> provider_;
};

} // namespace agentmem

#endif // agentmem_CORE_RUNTIME_HPP
