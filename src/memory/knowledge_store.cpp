/*
 * agentmem C++ - Knowledge Store
 *
 * Knowledge rows are visible to their owning agent and, when shared
 * (agentId NULL, isShared 1), to every agent.
 *
 * searchKnowledge ranks by
 *   vector_score  = 1 / (1 + L2(embedding, query))
 *   keyword_score = (3.0 if text contains searchText else 1.0)
 *                   (an empty searchText is contained in every text)
 *                   * (1.5 chunk | 1.2 main | 1.0)
 *   combined      = vector_score * keyword_score
 * and keeps rows with vector_score >= threshold, or with a keyword hit
 * and vector_score >= 0.3.
 */
#include <agentmem/memory/store.hpp>
#include <agentmem/memory/statement.hpp>
#include <agentmem/core/errors.hpp>
#include <agentmem/core/logger.hpp>
#include <agentmem/core/utils.hpp>

namespace agentmem {

static const double KEYWORD_RESCUE_MIN_VECTOR_SCORE = 0.3;

static const char* KNOWLEDGE_COLUMNS = "id, agentId, content, embedding, createdAt";

static KnowledgeItem read_knowledge(const Statement& stmt) {
    KnowledgeItem item;
    item.id = stmt.column_text(0);
    item.agent_id = stmt.column_text(1);
    item.content = parse_stored_json(stmt.column_text(2), "knowledge content").get<KnowledgeContent>();
    item.embedding = stmt.column_embedding(3);
    item.created_at = stmt.column_int64(4);
    return item;
}

KnowledgeStore::KnowledgeStore(sqlite3*& db, const EmbeddingConfig& embedding, CacheStore& cache_store)
    : db_(db), embedding_(embedding), cache_store_(cache_store) {}

std::string KnowledgeStore::search_cache_key(const Uuid& agent_id, const std::string& search_text) {
    return "embedding_" + agent_id + "_" + search_text;
}

std::vector<KnowledgeItem> KnowledgeStore::get_knowledge(const KnowledgeQuery& query) {
    std::string sql = std::string("SELECT ") + KNOWLEDGE_COLUMNS +
        " FROM knowledge WHERE (agentId = ? OR isShared = 1)";
    if (!query.id.empty()) sql += " AND id = ?";
    sql += " LIMIT ?";

    Statement stmt(db_, sql);
    int idx = 1;
    stmt.bind_text(idx++, query.agent_id);
    if (!query.id.empty()) stmt.bind_text(idx++, query.id);
    stmt.bind_int64(idx++, query.limit > 0 ? query.limit : -1);

    std::vector<KnowledgeItem> results;
    while (stmt.step()) {
        results.push_back(read_knowledge(stmt));
    }
    return results;
}

// ============================================================================
// Hybrid search
// ============================================================================

std::vector<KnowledgeItem> KnowledgeStore::search_knowledge(const KnowledgeSearchParams& params) {
    if (static_cast<int>(params.embedding.size()) != embedding_.dimensions) {
        throw ValidationError("knowledge query embedding has " + std::to_string(params.embedding.size()) +
                              " dimensions, expected " + std::to_string(embedding_.dimensions));
    }

    std::shared_ptr<CacheManager> cache = search_cache_;
    if (!cache) {
        cache = std::make_shared<CacheManager>(std::make_shared<DbCacheAdapter>(cache_store_, params.agent_id));
    }

    std::string key = search_cache_key(params.agent_id, params.search_text);
    std::vector<KnowledgeItem> results;
    if (cache->get(key, results)) {
        LOG_DEBUG("[KnowledgeStore] Cache hit for '%s' (%zu items)", key.c_str(), results.size());
        return results;
    }

    results = run_search(params);

    try {
        cache->set(key, results);
    } catch (const Error& e) {
        LOG_WARN("[KnowledgeStore] Could not cache search results for '%s': %s", key.c_str(), e.what());
    }
    return results;
}

std::vector<KnowledgeItem> KnowledgeStore::run_search(const KnowledgeSearchParams& params) {
    Statement stmt(db_,
        "WITH visible AS ("
        "  SELECT * FROM knowledge"
        "  WHERE agentId = ? OR (agentId IS NULL AND isShared = 1)"
        "), scored AS ("
        "  SELECT id, agentId, content, embedding, createdAt,"
        "    1.0 / (1.0 + vec_distance_l2(embedding, ?)) AS vector_score,"
        "    (CASE WHEN json_extract(content, '$.text') IS NOT NULL"
        "           AND instr(lower(json_extract(content, '$.text')), ?3) > 0"
        "          THEN 3.0 ELSE 1.0 END)"
        "    * (CASE WHEN json_extract(content, '$.metadata.isChunk') = 1 THEN 1.5"
        "            WHEN json_extract(content, '$.metadata.isMain') = 1 THEN 1.2"
        "            ELSE 1.0 END) AS keyword_score"
        "  FROM visible WHERE embedding IS NOT NULL"
        ")"
        " SELECT id, agentId, content, embedding, createdAt, vector_score * keyword_score AS combined"
        " FROM scored"
        " WHERE vector_score >= ? OR (keyword_score > 1.0 AND vector_score >= ?)"
        " ORDER BY combined DESC, createdAt DESC"
        " LIMIT ?");
    stmt.bind_text(1, params.agent_id);
    stmt.bind_embedding(2, params.embedding);
    stmt.bind_text(3, to_lower(params.search_text));
    stmt.bind_double(4, params.match_threshold);
    stmt.bind_double(5, KEYWORD_RESCUE_MIN_VECTOR_SCORE);
    stmt.bind_int64(6, params.match_count > 0 ? params.match_count : -1);

    std::vector<KnowledgeItem> results;
    while (stmt.step()) {
        KnowledgeItem item = read_knowledge(stmt);
        item.similarity = stmt.column_double(5);
        results.push_back(item);
    }
    LOG_DEBUG("[KnowledgeStore] Search for agent %s matched %zu items",
              params.agent_id.c_str(), results.size());
    return results;
}

// ============================================================================
// Mutations
// ============================================================================

void KnowledgeStore::create_knowledge(const KnowledgeItem& item) {
    if (!item.embedding.empty() && static_cast<int>(item.embedding.size()) != embedding_.dimensions) {
        throw ValidationError("knowledge embedding has " + std::to_string(item.embedding.size()) +
                              " dimensions, expected " + std::to_string(embedding_.dimensions));
    }

    const KnowledgeMetadata& meta = item.content.metadata;
    bool shared = meta.is_shared;
    Json content = item.content;

    try {
        Transaction txn(db_);

        Statement stmt(db_,
            "INSERT INTO knowledge "
            "(id, agentId, content, embedding, createdAt, isMain, originalId, chunkIndex, isShared) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
        stmt.bind_text(1, item.id.empty() ? generate_uuid() : item.id);
        if (shared) {
            stmt.bind_null(2);
        } else {
            stmt.bind_text_or_null(2, item.agent_id);
        }
        stmt.bind_text(3, dump_stored_json(content, "knowledge content"));
        stmt.bind_embedding(4, item.embedding);
        stmt.bind_int64(5, item.created_at > 0 ? item.created_at : current_timestamp_ms());
        stmt.bind_int64(6, meta.is_main ? 1 : 0);
        stmt.bind_text_or_null(7, meta.original_id);
        if (meta.chunk_index >= 0) {
            stmt.bind_int64(8, meta.chunk_index);
        } else {
            stmt.bind_null(8);
        }
        stmt.bind_int64(9, shared ? 1 : 0);
        stmt.execute();

        txn.commit();
    } catch (const StoreError& e) {
        if (e.is_primary_key_conflict()) {
            if (shared) {
                LOG_INFO("[KnowledgeStore] Shared knowledge %s already exists, skipping", item.id.c_str());
            } else {
                LOG_DEBUG("[KnowledgeStore] Knowledge %s already exists, skipping", item.id.c_str());
            }
            return;
        }
        LOG_ERROR("[KnowledgeStore] Failed to create knowledge %s: %s", item.id.c_str(), e.what());
        throw;
    }
}

void KnowledgeStore::remove_knowledge(const Uuid& id) {
    Statement stmt(db_, "DELETE FROM knowledge WHERE id = ?");
    stmt.bind_text(1, id);
    stmt.execute();
}

void KnowledgeStore::clear_knowledge(const Uuid& agent_id, bool shared) {
    std::string sql = shared
        ? "DELETE FROM knowledge WHERE agentId = ? OR isShared = 1"
        : "DELETE FROM knowledge WHERE agentId = ?";
    Statement stmt(db_, sql);
    stmt.bind_text(1, agent_id);
    int removed = stmt.execute();
    LOG_DEBUG("[KnowledgeStore] Cleared %d knowledge rows for agent %s%s",
              removed, agent_id.c_str(), shared ? " (including shared)" : "");
}

} // namespace agentmem
