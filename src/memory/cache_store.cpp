/*
 * agentmem C++ - Cache Store
 *
 * Rows of the 'cache' table are keyed by (key, agentId). Values are
 * opaque strings; the CacheManager envelope lives above this layer.
 */
#include <agentmem/memory/store.hpp>
#include <agentmem/memory/statement.hpp>
#include <agentmem/core/errors.hpp>
#include <agentmem/core/logger.hpp>
#include <agentmem/core/utils.hpp>

namespace agentmem {

CacheStore::CacheStore(sqlite3*& db) : db_(db) {}

bool CacheStore::get_cache(const std::string& key, const Uuid& agent_id, std::string& out) {
    Statement stmt(db_, "SELECT value FROM cache WHERE key = ? AND agentId = ?");
    stmt.bind_text(1, key);
    stmt.bind_text(2, agent_id);
    if (!stmt.step()) {
        return false;
    }
    out = stmt.column_text(0);
    return true;
}

bool CacheStore::set_cache(const std::string& key, const Uuid& agent_id, const std::string& value) {
    try {
        Statement stmt(db_,
            "INSERT OR REPLACE INTO cache (key, agentId, value, createdAt) VALUES (?, ?, ?, ?)");
        stmt.bind_text(1, key);
        stmt.bind_text(2, agent_id);
        stmt.bind_text(3, value);
        stmt.bind_int64(4, current_timestamp_ms());
        stmt.execute();
        return true;
    } catch (const StoreError& e) {
        LOG_ERROR("[CacheStore] Error setting cache '%s': %s", key.c_str(), e.what());
        return false;
    }
}

bool CacheStore::delete_cache(const std::string& key, const Uuid& agent_id) {
    try {
        Statement stmt(db_, "DELETE FROM cache WHERE key = ? AND agentId = ?");
        stmt.bind_text(1, key);
        stmt.bind_text(2, agent_id);
        stmt.execute();
        return true;
    } catch (const StoreError& e) {
        LOG_ERROR("[CacheStore] Error removing cache '%s': %s", key.c_str(), e.what());
        return false;
    }
}

} // namespace agentmem
