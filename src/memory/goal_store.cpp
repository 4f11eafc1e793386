/*
 * agentmem C++ - Goal Store
 */
#include <agentmem/memory/store.hpp>
#include <agentmem/memory/statement.hpp>
#include <agentmem/core/errors.hpp>
#include <agentmem/core/logger.hpp>
#include <agentmem/core/utils.hpp>

namespace agentmem {

static std::vector<Objective> read_objectives(const std::string& text) {
    if (text.empty()) return std::vector<Objective>();
    Json parsed = parse_stored_json(text, "goal objectives");
    if (!parsed.is_array()) {
        throw DeserializationError("stored goal objectives are not a JSON array");
    }
    return parsed.get<std::vector<Objective>>();
}

GoalStore::GoalStore(sqlite3*& db) : db_(db) {}

std::vector<Goal> GoalStore::get_goals(const GoalQuery& query) {
    std::string sql = "SELECT id, roomId, userId, name, status, objectives FROM goals WHERE roomId = ?";
    if (!query.user_id.empty()) sql += " AND userId = ?";
    if (query.only_in_progress) sql += " AND status = 'IN_PROGRESS'";
    sql += " LIMIT ?";

    Statement stmt(db_, sql);
    int idx = 1;
    stmt.bind_text(idx++, query.room_id);
    if (!query.user_id.empty()) stmt.bind_text(idx++, query.user_id);
    stmt.bind_int64(idx++, query.count > 0 ? query.count : -1);

    std::vector<Goal> goals;
    while (stmt.step()) {
        Goal goal;
        goal.id = stmt.column_text(0);
        goal.room_id = stmt.column_text(1);
        goal.user_id = stmt.column_text(2);
        goal.name = stmt.column_text(3);
        goal.status = string_to_goal_status(stmt.column_text(4));
        goal.objectives = read_objectives(stmt.column_text(5));
        goals.push_back(goal);
    }
    return goals;
}

void GoalStore::create_goal(const Goal& goal) {
    Statement stmt(db_,
        "INSERT INTO goals (id, roomId, userId, name, status, objectives) VALUES (?, ?, ?, ?, ?, ?)");
    stmt.bind_text(1, goal.id.empty() ? generate_uuid() : goal.id);
    stmt.bind_text_or_null(2, goal.room_id);
    stmt.bind_text_or_null(3, goal.user_id);
    stmt.bind_text(4, goal.name);
    stmt.bind_text(5, goal_status_to_string(goal.status));
    stmt.bind_text(6, dump_stored_json(Json(goal.objectives), "goal objectives"));
    stmt.execute();
}

void GoalStore::update_goal(const Goal& goal) {
    Statement stmt(db_, "UPDATE goals SET name = ?, status = ?, objectives = ? WHERE id = ?");
    stmt.bind_text(1, goal.name);
    stmt.bind_text(2, goal_status_to_string(goal.status));
    stmt.bind_text(3, dump_stored_json(Json(goal.objectives), "goal objectives"));
    stmt.bind_text(4, goal.id);
    if (stmt.execute() == 0) {
        LOG_DEBUG("[GoalStore] update_goal: no goal with id %s", goal.id.c_str());
    }
}

void GoalStore::update_goal_status(const Uuid& goal_id, GoalStatus status) {
    Statement stmt(db_, "UPDATE goals SET status = ? WHERE id = ?");
    stmt.bind_text(1, goal_status_to_string(status));
    stmt.bind_text(2, goal_id);
    stmt.execute();
}

void GoalStore::remove_goal(const Uuid& goal_id) {
    Statement stmt(db_, "DELETE FROM goals WHERE id = ?");
    stmt.bind_text(1, goal_id);
    stmt.execute();
}

void GoalStore::remove_all_goals(const Uuid& room_id) {
    Statement stmt(db_, "DELETE FROM goals WHERE roomId = ?");
    stmt.bind_text(1, room_id);
    stmt.execute();
}

// ============================================================================
// Formatting
// ============================================================================

std::string format_goals_as_string(const std::vector<Goal>& goals) {
    std::vector<std::string> blocks;
    for (const auto& goal : goals) {
        std::string block = "Goal: " + goal.name + "\nid: " + goal.id + "\nObjectives:";
        for (const auto& objective : goal.objectives) {
            block += "\n- ";
            block += objective.completed ? "[x] " : "[ ] ";
            block += objective.description;
            block += objective.completed ? "  (DONE)" : "  (IN PROGRESS)";
        }
        blocks.push_back(block);
    }
    return join(blocks, "\n");
}

} // namespace agentmem
