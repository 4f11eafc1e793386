/*
 * agentmem C++ - SQLite Store Implementation
 *
 * Connection lifecycle, schema creation and delegation to sub-stores.
 */
#include <agentmem/memory/store.hpp>
#include <agentmem/memory/statement.hpp>
#include <agentmem/core/errors.hpp>
#include <agentmem/core/logger.hpp>
#include <agentmem/core/utils.hpp>
#include <sqlite3.h>

namespace agentmem {

static const char* SCHEMA_SQL =
    "CREATE TABLE IF NOT EXISTS accounts ("
    "  id TEXT PRIMARY KEY,"
    "  name TEXT,"
    "  username TEXT,"
    "  email TEXT,"
    "  avatarUrl TEXT,"
    "  details TEXT DEFAULT '{}',"
    "  createdAt INTEGER"
    ");"
    "CREATE TABLE IF NOT EXISTS rooms ("
    "  id TEXT PRIMARY KEY,"
    "  createdAt INTEGER"
    ");"
    "CREATE TABLE IF NOT EXISTS participants ("
    "  id TEXT PRIMARY KEY,"
    "  userId TEXT,"
    "  roomId TEXT,"
    "  userState TEXT,"
    "  last_message_read TEXT,"
    "  createdAt INTEGER"
    ");"
    "CREATE TABLE IF NOT EXISTS memories ("
    "  id TEXT PRIMARY KEY,"
    "  type TEXT NOT NULL,"
    "  createdAt INTEGER NOT NULL,"
    "  content TEXT NOT NULL,"
    "  embedding BLOB NOT NULL,"
    "  userId TEXT,"
    "  roomId TEXT,"
    "  agentId TEXT,"
    "  \"unique\" INTEGER DEFAULT 1 NOT NULL"
    ");"
    "CREATE TABLE IF NOT EXISTS knowledge ("
    "  id TEXT PRIMARY KEY,"
    "  agentId TEXT,"
    "  content TEXT NOT NULL,"
    "  embedding BLOB,"
    "  createdAt INTEGER,"
    "  isMain INTEGER DEFAULT 0,"
    "  originalId TEXT,"
    "  chunkIndex INTEGER,"
    "  isShared INTEGER DEFAULT 0,"
    "  CHECK((isShared = 1 AND agentId IS NULL) OR (isShared = 0 AND agentId IS NOT NULL))"
    ");"
    "CREATE TABLE IF NOT EXISTS goals ("
    "  id TEXT PRIMARY KEY,"
    "  roomId TEXT,"
    "  userId TEXT,"
    "  name TEXT,"
    "  status TEXT,"
    "  objectives TEXT DEFAULT '[]' NOT NULL"
    ");"
    "CREATE TABLE IF NOT EXISTS relationships ("
    "  id TEXT PRIMARY KEY,"
    "  userA TEXT NOT NULL,"
    "  userB TEXT NOT NULL,"
    "  userId TEXT NOT NULL,"
    "  createdAt INTEGER"
    ");"
    "CREATE TABLE IF NOT EXISTS cache ("
    "  key TEXT NOT NULL,"
    "  agentId TEXT NOT NULL,"
    "  value TEXT DEFAULT '{}',"
    "  createdAt INTEGER,"
    "  PRIMARY KEY (key, agentId)"
    ");"
    "CREATE TABLE IF NOT EXISTS logs ("
    "  id TEXT PRIMARY KEY,"
    "  body TEXT NOT NULL,"
    "  userId TEXT,"
    "  roomId TEXT,"
    "  type TEXT NOT NULL,"
    "  createdAt INTEGER"
    ");"
    "CREATE INDEX IF NOT EXISTS idx_memories_type_room ON memories(type, roomId);"
    "CREATE INDEX IF NOT EXISTS idx_memories_agent ON memories(agentId);"
    "CREATE INDEX IF NOT EXISTS idx_knowledge_agent ON knowledge(agentId);"
    "CREATE INDEX IF NOT EXISTS idx_participants_room ON participants(roomId);"
    "CREATE INDEX IF NOT EXISTS idx_participants_user ON participants(userId);"
    "CREATE INDEX IF NOT EXISTS idx_goals_room ON goals(roomId);";

static const char* const KNOWN_TABLES[] = {
    "accounts", "rooms", "participants", "memories", "knowledge",
    "goals", "relationships", "cache", "logs"
};

// ============================================================================
// SqliteDatabaseAdapter Implementation
// ============================================================================

SqliteDatabaseAdapter::SqliteDatabaseAdapter(const EmbeddingConfig& embedding)
    : db_(nullptr)
    , embedding_(embedding)
    , accounts_(db_)
    , memories_(db_, embedding_)
    , cache_(db_)
    , knowledge_(db_, embedding_, cache_)
    , goals_(db_)
    , relationships_(db_)
{
}

SqliteDatabaseAdapter::~SqliteDatabaseAdapter() {
    close();
}

bool SqliteDatabaseAdapter::open(const std::string& db_path) {
    if (db_) {
        close();
    }

    if (db_path != ":memory:" && !create_directories(parent_path(db_path))) {
        LOG_ERROR("[MemoryStore] Failed to create parent directory for '%s'", db_path.c_str());
        return false;
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        LOG_ERROR("[MemoryStore] Failed to open database '%s': %s",
                  db_path.c_str(), db_ ? sqlite3_errmsg(db_) : "out of memory");
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    sqlite3_extended_result_codes(db_, 1);

    exec("PRAGMA journal_mode=WAL");
    exec("PRAGMA synchronous=NORMAL");
    exec("PRAGMA busy_timeout=5000");

    if (!register_vector_functions(db_)) {
        LOG_ERROR("[MemoryStore] Failed to register vector functions: %s", sqlite3_errmsg(db_));
        close();
        return false;
    }

    if (!ensure_schema()) {
        LOG_ERROR("[MemoryStore] Failed to initialize tables");
        close();
        return false;
    }

    LOG_INFO("[MemoryStore] Database opened: %s (embedding dimensions %d)",
             db_path.c_str(), embedding_.dimensions);
    return true;
}

void SqliteDatabaseAdapter::close() {
    if (db_) {
        if (sqlite3_close(db_) != SQLITE_OK) {
            LOG_WARN("[MemoryStore] Close reported: %s", sqlite3_errmsg(db_));
            sqlite3_close_v2(db_);
        }
        db_ = nullptr;
    }
}

bool SqliteDatabaseAdapter::exec(const std::string& sql) {
    if (!db_) return false;

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);

    if (rc != SQLITE_OK) {
        LOG_ERROR("[MemoryStore] SQL error: %s\n  Query: %s",
                  err_msg ? err_msg : "unknown", sql.c_str());
        if (err_msg) sqlite3_free(err_msg);
        return false;
    }

    return true;
}

int SqliteDatabaseAdapter::schema_version() {
    Statement stmt(db_, "PRAGMA user_version");
    return stmt.step() ? static_cast<int>(stmt.column_int64(0)) : 0;
}

bool SqliteDatabaseAdapter::ensure_schema() {
    if (!db_) return false;

    int version = 0;
    try {
        version = schema_version();
    } catch (const StoreError& e) {
        LOG_ERROR("[MemoryStore] Cannot read schema version: %s", e.what());
        return false;
    }

    if (version > SCHEMA_VERSION) {
        LOG_ERROR("[MemoryStore] Database schema version %d is newer than supported version %d",
                  version, SCHEMA_VERSION);
        return false;
    }

    if (!exec(SCHEMA_SQL)) {
        return false;
    }

    if (version < SCHEMA_VERSION) {
        if (!exec("PRAGMA user_version = " + std::to_string(SCHEMA_VERSION))) {
            return false;
        }
        LOG_DEBUG("[MemoryStore] Schema migrated from version %d to %d", version, SCHEMA_VERSION);
    }
    return true;
}

int64_t SqliteDatabaseAdapter::count_rows(const std::string& table) {
    bool known = false;
    for (const char* name : KNOWN_TABLES) {
        if (table == name) {
            known = true;
            break;
        }
    }
    if (!known) {
        throw ValidationError("unknown table: " + table);
    }

    Statement stmt(db_, "SELECT COUNT(*) FROM " + table);
    return stmt.step() ? stmt.column_int64(0) : 0;
}

// ============================================================================
// Delegated operations
// ============================================================================

bool SqliteDatabaseAdapter::get_account_by_id(const Uuid& id, Account& out) {
    return accounts_.get_account_by_id(id, out);
}

bool SqliteDatabaseAdapter::create_account(const Account& account) {
    return accounts_.create_account(account);
}

std::vector<Actor> SqliteDatabaseAdapter::get_actor_details(const Uuid& room_id) {
    return accounts_.get_actor_details(room_id);
}

void SqliteDatabaseAdapter::create_memory(const Memory& memory, const std::string& table_name) {
    memories_.create_memory(memory, table_name);
}

bool SqliteDatabaseAdapter::get_memory_by_id(const Uuid& id, Memory& out) {
    return memories_.get_memory_by_id(id, out);
}

std::vector<Memory> SqliteDatabaseAdapter::get_memories_by_room_ids(const Uuid& agent_id,
                                                                    const std::vector<Uuid>& room_ids,
                                                                    const std::string& table_name) {
    return memories_.get_memories_by_room_ids(agent_id, room_ids, table_name);
}

std::vector<Memory> SqliteDatabaseAdapter::get_memories(const GetMemoriesParams& params) {
    return memories_.get_memories(params);
}

int SqliteDatabaseAdapter::count_memories(const Uuid& room_id, bool unique, const std::string& table_name) {
    return memories_.count_memories(room_id, unique, table_name);
}

std::vector<MemoryDistanceHit> SqliteDatabaseAdapter::search_memories(const SearchMemoriesParams& params) {
    return memories_.search_memories(params);
}

std::vector<MemorySearchHit> SqliteDatabaseAdapter::search_memories_by_embedding(
    const Embedding& embedding, const EmbeddingSearchParams& params) {
    return memories_.search_memories_by_embedding(embedding, params);
}

std::vector<CachedEmbedding> SqliteDatabaseAdapter::get_cached_embeddings(const CachedEmbeddingQuery& query) {
    return memories_.get_cached_embeddings(query);
}

void SqliteDatabaseAdapter::remove_memory(const Uuid& id, const std::string& table_name) {
    memories_.remove_memory(id, table_name);
}

void SqliteDatabaseAdapter::remove_all_memories(const Uuid& room_id, const std::string& table_name) {
    memories_.remove_all_memories(room_id, table_name);
}

void SqliteDatabaseAdapter::log(const LogEntry& entry) {
    memories_.log(entry);
}

std::vector<KnowledgeItem> SqliteDatabaseAdapter::get_knowledge(const KnowledgeQuery& query) {
    return knowledge_.get_knowledge(query);
}

std::vector<KnowledgeItem> SqliteDatabaseAdapter::search_knowledge(const KnowledgeSearchParams& params) {
    return knowledge_.search_knowledge(params);
}

void SqliteDatabaseAdapter::create_knowledge(const KnowledgeItem& item) {
    knowledge_.create_knowledge(item);
}

void SqliteDatabaseAdapter::remove_knowledge(const Uuid& id) {
    knowledge_.remove_knowledge(id);
}

void SqliteDatabaseAdapter::clear_knowledge(const Uuid& agent_id, bool shared) {
    knowledge_.clear_knowledge(agent_id, shared);
}

std::vector<Goal> SqliteDatabaseAdapter::get_goals(const GoalQuery& query) {
    return goals_.get_goals(query);
}

void SqliteDatabaseAdapter::create_goal(const Goal& goal) {
    goals_.create_goal(goal);
}

void SqliteDatabaseAdapter::update_goal(const Goal& goal) {
    goals_.update_goal(goal);
}

void SqliteDatabaseAdapter::update_goal_status(const Uuid& goal_id, GoalStatus status) {
    goals_.update_goal_status(goal_id, status);
}

void SqliteDatabaseAdapter::remove_goal(const Uuid& goal_id) {
    goals_.remove_goal(goal_id);
}

void SqliteDatabaseAdapter::remove_all_goals(const Uuid& room_id) {
    goals_.remove_all_goals(room_id);
}

bool SqliteDatabaseAdapter::get_room(const Uuid& room_id, Uuid& out) {
    return accounts_.get_room(room_id, out);
}

Uuid SqliteDatabaseAdapter::create_room(const Uuid& room_id) {
    return accounts_.create_room(room_id);
}

void SqliteDatabaseAdapter::remove_room(const Uuid& room_id) {
    accounts_.remove_room(room_id);
}

std::vector<Participant> SqliteDatabaseAdapter::get_participants_for_account(const Uuid& user_id) {
    return accounts_.get_participants_for_account(user_id);
}

std::vector<Uuid> SqliteDatabaseAdapter::get_participants_for_room(const Uuid& room_id) {
    return accounts_.get_participants_for_room(room_id);
}

std::vector<Uuid> SqliteDatabaseAdapter::get_rooms_for_participant(const Uuid& user_id) {
    return accounts_.get_rooms_for_participant(user_id);
}

std::vector<Uuid> SqliteDatabaseAdapter::get_rooms_for_participants(const std::vector<Uuid>& user_ids) {
    return accounts_.get_rooms_for_participants(user_ids);
}

bool SqliteDatabaseAdapter::add_participant(const Uuid& user_id, const Uuid& room_id) {
    return accounts_.add_participant(user_id, room_id);
}

bool SqliteDatabaseAdapter::remove_participant(const Uuid& user_id, const Uuid& room_id) {
    return accounts_.remove_participant(user_id, room_id);
}

UserState SqliteDatabaseAdapter::get_participant_user_state(const Uuid& room_id, const Uuid& user_id) {
    return accounts_.get_participant_user_state(room_id, user_id);
}

void SqliteDatabaseAdapter::set_participant_user_state(const Uuid& room_id, const Uuid& user_id,
                                                       UserState state) {
    accounts_.set_participant_user_state(room_id, user_id, state);
}

bool SqliteDatabaseAdapter::create_relationship(const Uuid& user_a, const Uuid& user_b) {
    return relationships_.create_relationship(user_a, user_b);
}

bool SqliteDatabaseAdapter::get_relationship(const Uuid& user_a, const Uuid& user_b, Relationship& out) {
    return relationships_.get_relationship(user_a, user_b, out);
}

std::vector<Relationship> SqliteDatabaseAdapter::get_relationships(const Uuid& user_id) {
    return relationships_.get_relationships(user_id);
}

bool SqliteDatabaseAdapter::get_cache(const std::string& key, const Uuid& agent_id, std::string& out) {
    return cache_.get_cache(key, agent_id, out);
}

bool SqliteDatabaseAdapter::set_cache(const std::string& key, const Uuid& agent_id, const std::string& value) {
    return cache_.set_cache(key, agent_id, value);
}

bool SqliteDatabaseAdapter::delete_cache(const std::string& key, const Uuid& agent_id) {
    return cache_.delete_cache(key, agent_id);
}

} // namespace agentmem
