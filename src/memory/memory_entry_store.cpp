/*
 * agentmem C++ - Memory Entry Store
 *
 * Memories are namespaced by `type`. Embeddings are float32 blobs of the
 * configured dimensionality; distances come from vec_distance_l2().
 */
#include <agentmem/memory/store.hpp>
#include <agentmem/memory/statement.hpp>
#include <agentmem/core/errors.hpp>
#include <agentmem/core/logger.hpp>
#include <agentmem/core/utils.hpp>

namespace agentmem {

static const char* MEMORY_COLUMNS =
    "id, type, content, embedding, userId, roomId, agentId, \"unique\", createdAt";

// Reads MEMORY_COLUMNS starting at column 0
static Memory read_memory(const Statement& stmt) {
    Memory m;
    m.id = stmt.column_text(0);
    m.type = stmt.column_text(1);
    m.content = parse_stored_json(stmt.column_text(2), "memory content").get<Content>();
    m.embedding = stmt.column_embedding(3);
    m.user_id = stmt.column_text(4);
    m.room_id = stmt.column_text(5);
    m.agent_id = stmt.column_text(6);
    m.unique = stmt.column_int64(7) != 0;
    m.created_at = stmt.column_int64(8);
    return m;
}

// SQLite treats a negative LIMIT as "no limit"
static int64_t sql_limit(int count) {
    return count > 0 ? count : -1;
}

MemoryEntryStore::MemoryEntryStore(sqlite3*& db, const EmbeddingConfig& embedding)
    : db_(db), embedding_(embedding) {}

void MemoryEntryStore::check_query_embedding(const Embedding& embedding) const {
    if (static_cast<int>(embedding.size()) != embedding_.dimensions) {
        throw ValidationError("query embedding has " + std::to_string(embedding.size()) +
                              " dimensions, expected " + std::to_string(embedding_.dimensions));
    }
}

// ============================================================================
// Create
// ============================================================================

void MemoryEntryStore::create_memory(const Memory& memory, const std::string& table_name) {
    std::string type = table_name.empty() ? memory.type : table_name;
    if (type.empty()) {
        throw ValidationError("createMemory requires a table name");
    }
    require_open(db_, "MemoryStore");

    Embedding embedding = memory.embedding;
    bool unique = true;

    if (embedding.empty()) {
        embedding = zero_vector(embedding_);
    } else if (static_cast<int>(embedding.size()) != embedding_.dimensions) {
        LOG_WARN("[MemoryStore] Memory embedding has %zu dimensions, expected %d; storing zero vector",
                 embedding.size(), embedding_.dimensions);
        embedding = zero_vector(embedding_);
    } else {
        EmbeddingSearchParams dedup;
        dedup.agent_id = memory.agent_id;
        dedup.table_name = type;
        dedup.room_id = memory.room_id;
        dedup.count = 1;
        dedup.match_threshold = DUPLICATE_SCORE_THRESHOLD;
        unique = search_memories_by_embedding(embedding, dedup).empty();
    }

    Uuid id = memory.id.empty() ? generate_uuid() : memory.id;
    int64_t created_at = memory.created_at > 0 ? memory.created_at : current_timestamp_ms();
    Json content = memory.content;

    Statement stmt(db_,
        "INSERT OR REPLACE INTO memories "
        "(id, type, content, embedding, userId, roomId, agentId, \"unique\", createdAt) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
    stmt.bind_text(1, id);
    stmt.bind_text(2, type);
    stmt.bind_text(3, dump_stored_json(content, "memory content"));
    stmt.bind_embedding(4, embedding);
    stmt.bind_text_or_null(5, memory.user_id);
    stmt.bind_text_or_null(6, memory.room_id);
    stmt.bind_text_or_null(7, memory.agent_id);
    stmt.bind_int64(8, unique ? 1 : 0);
    stmt.bind_int64(9, created_at);
    stmt.execute();

    LOG_DEBUG("[MemoryStore] Stored %s memory %s (unique=%d)", type.c_str(), id.c_str(), unique ? 1 : 0);
}

// ============================================================================
// Reads
// ============================================================================

bool MemoryEntryStore::get_memory_by_id(const Uuid& id, Memory& out) {
    Statement stmt(db_, std::string("SELECT ") + MEMORY_COLUMNS + " FROM memories WHERE id = ?");
    stmt.bind_text(1, id);
    if (!stmt.step()) {
        return false;
    }
    out = read_memory(stmt);
    return true;
}

std::vector<Memory> MemoryEntryStore::get_memories_by_room_ids(const Uuid& agent_id,
                                                               const std::vector<Uuid>& room_ids,
                                                               const std::string& table_name) {
    std::vector<Memory> results;
    if (room_ids.empty()) {
        return results;
    }

    std::vector<std::string> placeholders(room_ids.size(), "?");
    std::string sql = std::string("SELECT ") + MEMORY_COLUMNS +
        " FROM memories WHERE type = ? AND roomId IN (" + join(placeholders, ", ") + ")";
    if (!agent_id.empty()) {
        sql += " AND agentId = ?";
    }

    Statement stmt(db_, sql);
    int idx = 1;
    stmt.bind_text(idx++, table_name.empty() ? "messages" : table_name);
    for (const auto& room_id : room_ids) {
        stmt.bind_text(idx++, room_id);
    }
    if (!agent_id.empty()) {
        stmt.bind_text(idx++, agent_id);
    }

    while (stmt.step()) {
        results.push_back(read_memory(stmt));
    }
    return results;
}

std::vector<Memory> MemoryEntryStore::get_memories(const GetMemoriesParams& params) {
    if (params.table_name.empty()) {
        throw ValidationError("getMemories requires a table name");
    }
    if (params.room_id.empty()) {
        throw ValidationError("getMemories requires a room id");
    }

    std::string sql = std::string("SELECT ") + MEMORY_COLUMNS +
        " FROM memories WHERE type = ? AND roomId = ?";
    if (!params.agent_id.empty()) sql += " AND agentId = ?";
    if (params.unique) sql += " AND \"unique\" = 1";
    if (params.start > 0) sql += " AND createdAt >= ?";
    if (params.end > 0) sql += " AND createdAt <= ?";
    sql += " ORDER BY createdAt DESC, rowid DESC LIMIT ?";

    Statement stmt(db_, sql);
    int idx = 1;
    stmt.bind_text(idx++, params.table_name);
    stmt.bind_text(idx++, params.room_id);
    if (!params.agent_id.empty()) stmt.bind_text(idx++, params.agent_id);
    if (params.start > 0) stmt.bind_int64(idx++, params.start);
    if (params.end > 0) stmt.bind_int64(idx++, params.end);
    stmt.bind_int64(idx++, sql_limit(params.count));

    std::vector<Memory> results;
    while (stmt.step()) {
        results.push_back(read_memory(stmt));
    }
    return results;
}

int MemoryEntryStore::count_memories(const Uuid& room_id, bool unique, const std::string& table_name) {
    if (table_name.empty()) {
        throw ValidationError("countMemories requires a table name");
    }

    std::string sql = "SELECT COUNT(*) FROM memories WHERE type = ? AND roomId = ?";
    if (unique) sql += " AND \"unique\" = 1";

    Statement stmt(db_, sql);
    stmt.bind_text(1, table_name);
    stmt.bind_text(2, room_id);
    return stmt.step() ? static_cast<int>(stmt.column_int64(0)) : 0;
}

// ============================================================================
// Similarity search
// ============================================================================

std::vector<MemoryDistanceHit> MemoryEntryStore::search_memories(const SearchMemoriesParams& params) {
    if (params.table_name.empty()) {
        throw ValidationError("searchMemories requires a table name");
    }
    if (params.room_id.empty()) {
        throw ValidationError("searchMemories requires a room id");
    }
    check_query_embedding(params.embedding);

    std::string sql = std::string("SELECT ") + MEMORY_COLUMNS +
        ", vec_distance_l2(embedding, ?) AS distance"
        " FROM memories WHERE type = ? AND roomId = ?";
    if (!params.agent_id.empty()) sql += " AND agentId = ?";
    if (params.unique) sql += " AND \"unique\" = 1";
    sql += " ORDER BY distance ASC, createdAt DESC LIMIT ?";

    Statement stmt(db_, sql);
    int idx = 1;
    stmt.bind_embedding(idx++, params.embedding);
    stmt.bind_text(idx++, params.table_name);
    stmt.bind_text(idx++, params.room_id);
    if (!params.agent_id.empty()) stmt.bind_text(idx++, params.agent_id);
    stmt.bind_int64(idx++, sql_limit(params.match_count));

    std::vector<MemoryDistanceHit> hits;
    while (stmt.step()) {
        MemoryDistanceHit hit;
        hit.memory = read_memory(stmt);
        hit.distance = stmt.column_double(9);
        hits.push_back(hit);
    }
    return hits;
}

std::vector<MemorySearchHit> MemoryEntryStore::search_memories_by_embedding(
    const Embedding& embedding, const EmbeddingSearchParams& params) {
    if (params.table_name.empty()) {
        throw ValidationError("searchMemoriesByEmbedding requires a table name");
    }
    check_query_embedding(embedding);

    // agentId IS ? so a NULL agent matches rows stored without one
    std::string inner = std::string("SELECT ") + MEMORY_COLUMNS +
        ", vec_distance_l2(embedding, ?) AS distance"
        " FROM memories WHERE type = ? AND agentId IS ?";
    if (!params.room_id.empty()) inner += " AND roomId = ?";
    if (params.unique) inner += " AND \"unique\" = 1";

    std::string sql = "SELECT * FROM (" + inner + ")"
        " WHERE ? <= 0 OR 1.0 / (1.0 + distance) >= ?"
        " ORDER BY distance ASC, createdAt DESC LIMIT ?";

    Statement stmt(db_, sql);
    int idx = 1;
    stmt.bind_embedding(idx++, embedding);
    stmt.bind_text(idx++, params.table_name);
    stmt.bind_text_or_null(idx++, params.agent_id);
    if (!params.room_id.empty()) stmt.bind_text(idx++, params.room_id);
    stmt.bind_double(idx++, params.match_threshold);
    stmt.bind_double(idx++, params.match_threshold);
    stmt.bind_int64(idx++, sql_limit(params.count));

    std::vector<MemorySearchHit> hits;
    while (stmt.step()) {
        MemorySearchHit hit;
        hit.memory = read_memory(stmt);
        hit.score = distance_to_score(stmt.column_double(9));
        hits.push_back(hit);
    }
    return hits;
}

std::vector<CachedEmbedding> MemoryEntryStore::get_cached_embeddings(const CachedEmbeddingQuery& query) {
    if (query.query_table_name.empty()) {
        throw ValidationError("getCachedEmbeddings requires a table name");
    }
    if (query.query_field_name.empty()) {
        throw ValidationError("getCachedEmbeddings requires a field name");
    }

    std::string path = "$." + query.query_field_name;
    if (!query.query_field_sub_name.empty()) {
        path += "." + query.query_field_sub_name;
    }

    Statement stmt(db_,
        "SELECT embedding, levenshtein(lower(?), lower(json_extract(content, ?))) AS score "
        "FROM memories "
        "WHERE type = ? AND json_type(content, ?) = 'text' "
        "ORDER BY score ASC LIMIT ?");
    stmt.bind_text(1, query.query_input);
    stmt.bind_text(2, path);
    stmt.bind_text(3, query.query_table_name);
    stmt.bind_text(4, path);
    stmt.bind_int64(5, sql_limit(query.query_match_count));

    std::vector<CachedEmbedding> results;
    while (stmt.step()) {
        CachedEmbedding row;
        row.embedding = stmt.column_embedding(0);
        row.levenshtein_score = stmt.column_double(1);
        results.push_back(row);
    }
    return results;
}

// ============================================================================
// Deletes and logs
// ============================================================================

void MemoryEntryStore::remove_memory(const Uuid& id, const std::string& table_name) {
    Statement stmt(db_, "DELETE FROM memories WHERE type = ? AND id = ?");
    stmt.bind_text(1, table_name);
    stmt.bind_text(2, id);
    stmt.execute();
}

void MemoryEntryStore::remove_all_memories(const Uuid& room_id, const std::string& table_name) {
    Statement stmt(db_, "DELETE FROM memories WHERE type = ? AND roomId = ?");
    stmt.bind_text(1, table_name);
    stmt.bind_text(2, room_id);
    int removed = stmt.execute();
    LOG_DEBUG("[MemoryStore] Removed %d %s memories from room %s",
              removed, table_name.c_str(), room_id.c_str());
}

void MemoryEntryStore::log(const LogEntry& entry) {
    Statement stmt(db_,
        "INSERT INTO logs (id, body, userId, roomId, type, createdAt) VALUES (?, ?, ?, ?, ?, ?)");
    stmt.bind_text(1, generate_uuid());
    stmt.bind_text(2, dump_stored_json(entry.body, "log body"));
    stmt.bind_text_or_null(3, entry.user_id);
    stmt.bind_text_or_null(4, entry.room_id);
    stmt.bind_text(5, entry.type);
    stmt.bind_int64(6, current_timestamp_ms());
    stmt.execute();
}

} // namespace agentmem
