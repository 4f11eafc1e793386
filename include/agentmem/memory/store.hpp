/*
 * agentmem C++ - SQLite Store
 *
 * SQLite-backed DatabaseAdapter with one sub-store per concern:
 *   AccountStore      - accounts, rooms, participants
 *   MemoryEntryStore  - memories (dedup, similarity search), logs
 *   KnowledgeStore    - knowledge items, hybrid vector + keyword search
 *   GoalStore         - goals and objectives
 *   RelationshipStore - symmetric user relationships
 *   CacheStore        - (key, agentId) cache table
 *   SqliteDatabaseAdapter - owns the sqlite3 handle, composes the above
 */
#ifndef agentmem_MEMORY_STORE_HPP
#define agentmem_MEMORY_STORE_HPP

#include "types.hpp"
#include "database.hpp"
#include "embedding.hpp"
#include <agentmem/cache/cache.hpp>
#include <memory>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace agentmem {

const int SCHEMA_VERSION = 1;

// Similarity (score) above which a new memory counts as a near-duplicate
const double DUPLICATE_SCORE_THRESHOLD = 0.95;

// ============================================================================
// AccountStore - Accounts, rooms and participants
//
// Manages the 'accounts', 'rooms' and 'participants' tables.
// ============================================================================
class AccountStore {
public:
    explicit AccountStore(sqlite3*& db);

    bool get_account_by_id(const Uuid& id, Account& out);
    bool create_account(const Account& account);
    std::vector<Actor> get_actor_details(const Uuid& room_id);

    bool get_room(const Uuid& room_id, Uuid& out);
    Uuid create_room(const Uuid& room_id);
    void remove_room(const Uuid& room_id);

    std::vector<Participant> get_participants_for_account(const Uuid& user_id);
    std::vector<Uuid> get_participants_for_room(const Uuid& room_id);
    std::vector<Uuid> get_rooms_for_participant(const Uuid& user_id);
    std::vector<Uuid> get_rooms_for_participants(const std::vector<Uuid>& user_ids);
    bool add_participant(const Uuid& user_id, const Uuid& room_id);
    bool remove_participant(const Uuid& user_id, const Uuid& room_id);

    // NONE when no participant row exists
    UserState get_participant_user_state(const Uuid& room_id, const Uuid& user_id);
    void set_participant_user_state(const Uuid& room_id, const Uuid& user_id, UserState state);

private:
    sqlite3*& db_;
};

// ============================================================================
// MemoryEntryStore - Memories and logs
//
// Manages the 'memories' and 'logs' tables. Every stored embedding has
// exactly `embedding.dimensions` floats.
// ============================================================================
class MemoryEntryStore {
public:
    MemoryEntryStore(sqlite3*& db, const EmbeddingConfig& embedding);

    void create_memory(const Memory& memory, const std::string& table_name);
    bool get_memory_by_id(const Uuid& id, Memory& out);
    std::vector<Memory> get_memories_by_room_ids(const Uuid& agent_id,
                                                 const std::vector<Uuid>& room_ids,
                                                 const std::string& table_name);
    std::vector<Memory> get_memories(const GetMemoriesParams& params);
    int count_memories(const Uuid& room_id, bool unique, const std::string& table_name);

    // Ascending L2 distance
    std::vector<MemoryDistanceHit> search_memories(const SearchMemoriesParams& params);
    // Descending 1/(1+distance)
    std::vector<MemorySearchHit> search_memories_by_embedding(const Embedding& embedding,
                                                              const EmbeddingSearchParams& params);
    std::vector<CachedEmbedding> get_cached_embeddings(const CachedEmbeddingQuery& query);

    void remove_memory(const Uuid& id, const std::string& table_name);
    void remove_all_memories(const Uuid& room_id, const std::string& table_name);

    void log(const LogEntry& entry);

private:
    sqlite3*& db_;
    const EmbeddingConfig& embedding_;

    void check_query_embedding(const Embedding& embedding) const;
};

// ============================================================================
// CacheStore - The 'cache' table
// ============================================================================
class CacheStore : public DatabaseCacheAdapter {
public:
    explicit CacheStore(sqlite3*& db);

    bool get_cache(const std::string& key, const Uuid& agent_id, std::string& out) override;
    bool set_cache(const std::string& key, const Uuid& agent_id, const std::string& value) override;
    bool delete_cache(const std::string& key, const Uuid& agent_id) override;

private:
    sqlite3*& db_;
};

// ============================================================================
// KnowledgeStore - Knowledge items and hybrid search
//
// Manages the 'knowledge' table. Search results are cached under
// "embedding_<agentId>_<searchText>"; mutations do not invalidate them.
// ============================================================================
class KnowledgeStore {
public:
    KnowledgeStore(sqlite3*& db, const EmbeddingConfig& embedding, CacheStore& cache_store);

    std::vector<KnowledgeItem> get_knowledge(const KnowledgeQuery& query);
    std::vector<KnowledgeItem> search_knowledge(const KnowledgeSearchParams& params);
    void create_knowledge(const KnowledgeItem& item);
    void remove_knowledge(const Uuid& id);
    void clear_knowledge(const Uuid& agent_id, bool shared);

    // Replaces the default cache (the 'cache' table scoped by agent id)
    void set_search_cache(std::shared_ptr<CacheManager> cache) { search_cache_ = cache; }

    static std::string search_cache_key(const Uuid& agent_id, const std::string& search_text);

private:
    sqlite3*& db_;
    const EmbeddingConfig& embedding_;
    CacheStore& cache_store_;
    std::shared_ptr<CacheManager> search_cache_;

    std::vector<KnowledgeItem> run_search(const KnowledgeSearchParams& params);
};

// ============================================================================
// GoalStore - The 'goals' table
// ============================================================================
class GoalStore {
public:
    explicit GoalStore(sqlite3*& db);

    std::vector<Goal> get_goals(const GoalQuery& query);
    void create_goal(const Goal& goal);
    void update_goal(const Goal& goal);
    void update_goal_status(const Uuid& goal_id, GoalStatus status);
    void remove_goal(const Uuid& goal_id);
    void remove_all_goals(const Uuid& room_id);

private:
    sqlite3*& db_;
};

// "Goal: <name>\nid: <id>\nObjectives:\n- [x] ..." per goal, newline separated
std::string format_goals_as_string(const std::vector<Goal>& goals);

// ============================================================================
// RelationshipStore - The 'relationships' table
// ============================================================================
class RelationshipStore {
public:
    explicit RelationshipStore(sqlite3*& db);

    bool create_relationship(const Uuid& user_a, const Uuid& user_b);
    // Matches (a, b) and (b, a)
    bool get_relationship(const Uuid& user_a, const Uuid& user_b, Relationship& out);
    std::vector<Relationship> get_relationships(const Uuid& user_id);

private:
    sqlite3*& db_;
};

// The endpoint of each relationship that is not `user_id`
std::vector<Uuid> format_relationships(const std::vector<Relationship>& relationships, const Uuid& user_id);

// ============================================================================
// SqliteDatabaseAdapter - Top-level store, owns the sqlite3 handle
// ============================================================================
class SqliteDatabaseAdapter : public DatabaseAdapter, public DatabaseCacheAdapter {
public:
    explicit SqliteDatabaseAdapter(const EmbeddingConfig& embedding = EmbeddingConfig());
    ~SqliteDatabaseAdapter();

    // Database lifecycle
    bool open(const std::string& db_path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    // Creates/upgrades tables and indexes; returns false on failure
    bool ensure_schema();
    int schema_version();
    int64_t count_rows(const std::string& table);

    const EmbeddingConfig& embedding_config() const { return embedding_; }

    // Sub-store access
    AccountStore& accounts() { return accounts_; }
    MemoryEntryStore& memories() { return memories_; }
    KnowledgeStore& knowledge() { return knowledge_; }
    GoalStore& goals() { return goals_; }
    RelationshipStore& relationships() { return relationships_; }
    CacheStore& cache_entries() { return cache_; }

    // ---- Accounts ----
    bool get_account_by_id(const Uuid& id, Account& out) override;
    bool create_account(const Account& account) override;
    std::vector<Actor> get_actor_details(const Uuid& room_id) override;

    // ---- Memories ----
    void create_memory(const Memory& memory, const std::string& table_name) override;
    bool get_memory_by_id(const Uuid& id, Memory& out) override;
    std::vector<Memory> get_memories_by_room_ids(const Uuid& agent_id,
                                                 const std::vector<Uuid>& room_ids,
                                                 const std::string& table_name) override;
    std::vector<Memory> get_memories(const GetMemoriesParams& params) override;
    int count_memories(const Uuid& room_id, bool unique, const std::string& table_name) override;
    std::vector<MemoryDistanceHit> search_memories(const SearchMemoriesParams& params) override;
    std::vector<MemorySearchHit> search_memories_by_embedding(const Embedding& embedding,
                                                              const EmbeddingSearchParams& params) override;
    std::vector<CachedEmbedding> get_cached_embeddings(const CachedEmbeddingQuery& query) override;
    void remove_memory(const Uuid& id, const std::string& table_name) override;
    void remove_all_memories(const Uuid& room_id, const std::string& table_name) override;
    void log(const LogEntry& entry) override;

    // ---- Knowledge ----
    std::vector<KnowledgeItem> get_knowledge(const KnowledgeQuery& query) override;
    std::vector<KnowledgeItem> search_knowledge(const KnowledgeSearchParams& params) override;
    void create_knowledge(const KnowledgeItem& item) override;
    void remove_knowledge(const Uuid& id) override;
    void clear_knowledge(const Uuid& agent_id, bool shared) override;

    // ---- Goals ----
    std::vector<Goal> get_goals(const GoalQuery& query) override;
    void create_goal(const Goal& goal) override;
    void update_goal(const Goal& goal) override;
    void update_goal_status(const Uuid& goal_id, GoalStatus status) override;
    void remove_goal(const Uuid& goal_id) override;
    void remove_all_goals(const Uuid& room_id) override;

    // ---- Rooms and participants ----
    bool get_room(const Uuid& room_id, Uuid& out) override;
    Uuid create_room(const Uuid& room_id = "") override;
    void remove_room(const Uuid& room_id) override;
    std::vector<Participant> get_participants_for_account(const Uuid& user_id) override;
    std::vector<Uuid> get_participants_for_room(const Uuid& room_id) override;
    std::vector<Uuid> get_rooms_for_participant(const Uuid& user_id) override;
    std::vector<Uuid> get_rooms_for_participants(const std::vector<Uuid>& user_ids) override;
    bool add_participant(const Uuid& user_id, const Uuid& room_id) override;
    bool remove_participant(const Uuid& user_id, const Uuid& room_id) override;
    UserState get_participant_user_state(const Uuid& room_id, const Uuid& user_id) override;
    void set_participant_user_state(const Uuid& room_id, const Uuid& user_id, UserState state) override;

    // ---- Relationships ----
    bool create_relationship(const Uuid& user_a, const Uuid& user_b) override;
    bool get_relationship(const Uuid& user_a, const Uuid& user_b, Relationship& out) override;
    std::vector<Relationship> get_relationships(const Uuid& user_id) override;

    // ---- Cache entries ----
    bool get_cache(const std::string& key, const Uuid& agent_id, std::string& out) override;
    bool set_cache(const std::string& key, const Uuid& agent_id, const std::string& value) override;
    bool delete_cache(const std::string& key, const Uuid& agent_id) override;

private:
    sqlite3* db_;
    EmbeddingConfig embedding_;

    AccountStore accounts_;
    MemoryEntryStore memories_;
    CacheStore cache_;
    KnowledgeStore knowledge_;
    GoalStore goals_;
    RelationshipStore relationships_;

    bool exec(const std::string& sql);
};

} // namespace agentmem

#endif // agentmem_MEMORY_STORE_HPP
