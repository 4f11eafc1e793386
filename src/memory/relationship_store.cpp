/*
 * agentmem C++ - Relationship Store
 *
 * A relationship is stored once as (userA, userB); lookups match either
 * orientation.
 */
#include <agentmem/memory/store.hpp>
#include <agentmem/memory/statement.hpp>
#include <agentmem/core/errors.hpp>
#include <agentmem/core/logger.hpp>
#include <agentmem/core/utils.hpp>

namespace agentmem {

static Relationship read_relationship(const Statement& stmt) {
    Relationship r;
    r.id = stmt.column_text(0);
    r.user_a = stmt.column_text(1);
    r.user_b = stmt.column_text(2);
    r.user_id = stmt.column_text(3);
    return r;
}

RelationshipStore::RelationshipStore(sqlite3*& db) : db_(db) {}

bool RelationshipStore::create_relationship(const Uuid& user_a, const Uuid& user_b) {
    if (user_a.empty() || user_b.empty()) {
        throw ValidationError("createRelationship requires both userA and userB");
    }

    try {
        Statement stmt(db_,
            "INSERT INTO relationships (id, userA, userB, userId, createdAt) VALUES (?, ?, ?, ?, ?)");
        stmt.bind_text(1, generate_uuid());
        stmt.bind_text(2, user_a);
        stmt.bind_text(3, user_b);
        stmt.bind_text(4, user_a);
        stmt.bind_int64(5, current_timestamp_ms());
        stmt.execute();
        return true;
    } catch (const StoreError& e) {
        LOG_ERROR("[RelationshipStore] Error creating relationship %s <-> %s: %s",
                  user_a.c_str(), user_b.c_str(), e.what());
        return false;
    }
}

bool RelationshipStore::get_relationship(const Uuid& user_a, const Uuid& user_b, Relationship& out) {
    Statement stmt(db_,
        "SELECT id, userA, userB, userId FROM relationships "
        "WHERE (userA = ?1 AND userB = ?2) OR (userA = ?2 AND userB = ?1) "
        "LIMIT 1");
    stmt.bind_text(1, user_a);
    stmt.bind_text(2, user_b);
    if (!stmt.step()) {
        return false;
    }
    out = read_relationship(stmt);
    return true;
}

std::vector<Relationship> RelationshipStore::get_relationships(const Uuid& user_id) {
    Statement stmt(db_,
        "SELECT id, userA, userB, userId FROM relationships WHERE userA = ?1 OR userB = ?1");
    stmt.bind_text(1, user_id);

    std::vector<Relationship> relationships;
    while (stmt.step()) {
        relationships.push_back(read_relationship(stmt));
    }
    return relationships;
}

std::vector<Uuid> format_relationships(const std::vector<Relationship>& relationships, const Uuid& user_id) {
    std::vector<Uuid> others;
    for (const auto& r : relationships) {
        others.push_back(r.user_a == user_id ? r.user_b : r.user_a);
    }
    return others;
}

} // namespace agentmem
