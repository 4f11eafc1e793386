/*
 * agentmem C++ - Database adapter interfaces
 *
 * DatabaseAdapter is the contract the agent runtime and its plugins use
 * for memories, knowledge, goals, relationships, rooms and participants.
 * DatabaseCacheAdapter is the (key, agentId) cache table contract used by
 * the database-backed cache.
 *
 * Errors: ValidationError for malformed requests, StoreError for engine
 * failures, DeserializationError for unreadable stored JSON. Methods that
 * return bool report insert/delete failures as false instead of throwing.
 */
#ifndef agentmem_MEMORY_DATABASE_HPP
#define agentmem_MEMORY_DATABASE_HPP

#include "types.hpp"
#include <string>
#include <vector>

namespace agentmem {

class DatabaseCacheAdapter {
public:
    virtual ~DatabaseCacheAdapter() {}

    // false when no entry exists for (key, agent_id)
    virtual bool get_cache(const std::string& key, const Uuid& agent_id, std::string& out) = 0;
    // insert-or-replace
    virtual bool set_cache(const std::string& key, const Uuid& agent_id, const std::string& value) = 0;
    virtual bool delete_cache(const std::string& key, const Uuid& agent_id) = 0;
};

class DatabaseAdapter {
public:
    virtual ~DatabaseAdapter() {}

    // ---- Accounts ----
    virtual bool get_account_by_id(const Uuid& id, Account& out) = 0;
    virtual bool create_account(const Account& account) = 0;
    virtual std::vector<Actor> get_actor_details(const Uuid& room_id) = 0;

    // ---- Memories ----
    virtual void create_memory(const Memory& memory, const std::string& table_name) = 0;
    virtual bool get_memory_by_id(const Uuid& id, Memory& out) = 0;
    virtual std::vector<Memory> get_memories_by_room_ids(const Uuid& agent_id,
                                                         const std::vector<Uuid>& room_ids,
                                                         const std::string& table_name) = 0;
    virtual std::vector<Memory> get_memories(const GetMemoriesParams& params) = 0;
    virtual int count_memories(const Uuid& room_id, bool unique, const std::string& table_name) = 0;
    virtual std::vector<MemoryDistanceHit> search_memories(const SearchMemoriesParams& params) = 0;
    virtual std::vector<MemorySearchHit> search_memories_by_embedding(const Embedding& embedding,
                                                                      const EmbeddingSearchParams& params) = 0;
    virtual std::vector<CachedEmbedding> get_cached_embeddings(const CachedEmbeddingQuery& query) = 0;
    virtual void remove_memory(const Uuid& id, const std::string& table_name) = 0;
    virtual void remove_all_memories(const Uuid& room_id, const std::string& table_name) = 0;
    virtual void log(const LogEntry& entry) = 0;

    // ---- Knowledge ----
    virtual std::vector<KnowledgeItem> get_knowledge(const KnowledgeQuery& query) = 0;
    virtual std::vector<KnowledgeItem> search_knowledge(const KnowledgeSearchParams& params) = 0;
    virtual void create_knowledge(const KnowledgeItem& item) = 0;
    virtual void remove_knowledge(const Uuid& id) = 0;
    virtual void clear_knowledge(const Uuid& agent_id, bool shared) = 0;

    // ---- Goals ----
    virtual std::vector<Goal> get_goals(const GoalQuery& query) = 0;
    virtual void create_goal(const Goal& goal) = 0;
    virtual void update_goal(const Goal& goal) = 0;
    virtual void update_goal_status(const Uuid& goal_id, GoalStatus status) = 0;
    virtual void remove_goal(const Uuid& goal_id) = 0;
    virtual void remove_all_goals(const Uuid& room_id) = 0;

    // ---- Rooms and participants ----
    virtual bool get_room(const Uuid& room_id, Uuid& out) = 0;
    virtual Uuid create_room(const Uuid& room_id = "") = 0;
    virtual void remove_room(const Uuid& room_id) = 0;
    virtual std::vector<Participant> get_participants_for_account(const Uuid& user_id) = 0;
    virtual std::vector<Uuid> get_participants_for_room(const Uuid& room_id) = 0;
    virtual std::vector<Uuid> get_rooms_for_participant(const Uuid& user_id) = 0;
    virtual std::vector<Uuid> get_rooms_for_participants(const std::vector<Uuid>& user_ids) = 0;
    virtual bool add_participant(const Uuid& user_id, const Uuid& room_id) = 0;
    virtual bool remove_participant(const Uuid& user_id, const Uuid& room_id) = 0;
    virtual UserState get_participant_user_state(const Uuid& room_id, const Uuid& user_id) = 0;
    virtual void set_participant_user_state(const Uuid& room_id, const Uuid& user_id, UserState state) = 0;

    // ---- Relationships ----
    virtual bool create_relationship(const Uuid& user_a, const Uuid& user_b) = 0;
    virtual bool get_relationship(const Uuid& user_a, const Uuid& user_b, Relationship& out) = 0;
    virtual std::vector<Relationship> get_relationships(const Uuid& user_id) = 0;
};

} // namespace agentmem

#endif // agentmem_MEMORY_DATABASE_HPP
