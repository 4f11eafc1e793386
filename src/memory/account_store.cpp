/*
 * agentmem C++ - Account Store
 *
 * Accounts, rooms and the participants linking them. Nothing here
 * cascades: removing a room leaves its participants and memories.
 */
#include <agentmem/memory/store.hpp>
#include <agentmem/memory/statement.hpp>
#include <agentmem/core/errors.hpp>
#include <agentmem/core/logger.hpp>
#include <agentmem/core/utils.hpp>

namespace agentmem {

static Json read_details(const Statement& stmt, int col) {
    if (stmt.column_is_null(col)) return Json::object();
    std::string text = stmt.column_text(col);
    if (text.empty()) return Json::object();
    return parse_stored_json(text, "account details");
}

AccountStore::AccountStore(sqlite3*& db) : db_(db) {}

// ============================================================================
// Accounts
// ============================================================================

bool AccountStore::get_account_by_id(const Uuid& id, Account& out) {
    Statement stmt(db_,
        "SELECT id, name, username, email, avatarUrl, details FROM accounts WHERE id = ?");
    stmt.bind_text(1, id);
    if (!stmt.step()) {
        return false;
    }
    out.id = stmt.column_text(0);
    out.name = stmt.column_text(1);
    out.username = stmt.column_text(2);
    out.email = stmt.column_text(3);
    out.avatar_url = stmt.column_text(4);
    out.details = read_details(stmt, 5);
    return true;
}

bool AccountStore::create_account(const Account& account) {
    try {
        Statement stmt(db_,
            "INSERT INTO accounts (id, name, username, email, avatarUrl, details, createdAt) "
            "VALUES (?, ?, ?, ?, ?, ?, ?)");
        stmt.bind_text(1, account.id.empty() ? generate_uuid() : account.id);
        stmt.bind_text(2, account.name);
        stmt.bind_text(3, account.username);
        stmt.bind_text(4, account.email);
        stmt.bind_text(5, account.avatar_url);
        stmt.bind_text(6, account.details.is_null() ? "{}" : dump_stored_json(account.details, "account details"));
        stmt.bind_int64(7, current_timestamp_ms());
        stmt.execute();
        return true;
    } catch (const StoreError& e) {
        LOG_ERROR("[AccountStore] Error creating account %s: %s", account.id.c_str(), e.what());
        return false;
    }
}

std::vector<Actor> AccountStore::get_actor_details(const Uuid& room_id) {
    Statement stmt(db_,
        "SELECT a.id, a.name, a.username, a.details "
        "FROM participants p JOIN accounts a ON p.userId = a.id "
        "WHERE p.roomId = ?");
    stmt.bind_text(1, room_id);

    std::vector<Actor> actors;
    while (stmt.step()) {
        Actor actor;
        actor.id = stmt.column_text(0);
        actor.name = stmt.column_text(1);
        actor.username = stmt.column_text(2);
        actor.details = read_details(stmt, 3);
        actors.push_back(actor);
    }
    return actors;
}

// ============================================================================
// Rooms
// ============================================================================

bool AccountStore::get_room(const Uuid& room_id, Uuid& out) {
    Statement stmt(db_, "SELECT id FROM rooms WHERE id = ?");
    stmt.bind_text(1, room_id);
    if (!stmt.step()) {
        return false;
    }
    out = stmt.column_text(0);
    return true;
}

Uuid AccountStore::create_room(const Uuid& room_id) {
    Uuid id = room_id.empty() ? generate_uuid() : room_id;
    try {
        Statement stmt(db_, "INSERT INTO rooms (id, createdAt) VALUES (?, ?)");
        stmt.bind_text(1, id);
        stmt.bind_int64(2, current_timestamp_ms());
        stmt.execute();
    } catch (const StoreError& e) {
        LOG_ERROR("[AccountStore] Error creating room %s: %s", id.c_str(), e.what());
    }
    return id;
}

void AccountStore::remove_room(const Uuid& room_id) {
    Statement stmt(db_, "DELETE FROM rooms WHERE id = ?");
    stmt.bind_text(1, room_id);
    stmt.execute();
}

// ============================================================================
// Participants
// ============================================================================

std::vector<Participant> AccountStore::get_participants_for_account(const Uuid& user_id) {
    Statement stmt(db_,
        "SELECT id, userId, roomId, last_message_read FROM participants WHERE userId = ?");
    stmt.bind_text(1, user_id);

    std::vector<Participant> participants;
    while (stmt.step()) {
        Participant p;
        p.id = stmt.column_text(0);
        p.user_id = stmt.column_text(1);
        p.room_id = stmt.column_text(2);
        p.last_message_read = stmt.column_text(3);
        participants.push_back(p);
    }
    return participants;
}

std::vector<Uuid> AccountStore::get_participants_for_room(const Uuid& room_id) {
    Statement stmt(db_, "SELECT userId FROM participants WHERE roomId = ?");
    stmt.bind_text(1, room_id);

    std::vector<Uuid> users;
    while (stmt.step()) {
        users.push_back(stmt.column_text(0));
    }
    return users;
}

std::vector<Uuid> AccountStore::get_rooms_for_participant(const Uuid& user_id) {
    Statement stmt(db_, "SELECT roomId FROM participants WHERE userId = ?");
    stmt.bind_text(1, user_id);

    std::vector<Uuid> rooms;
    while (stmt.step()) {
        rooms.push_back(stmt.column_text(0));
    }
    return rooms;
}

std::vector<Uuid> AccountStore::get_rooms_for_participants(const std::vector<Uuid>& user_ids) {
    std::vector<Uuid> rooms;
    if (user_ids.empty()) {
        return rooms;
    }

    std::vector<std::string> placeholders(user_ids.size(), "?");
    Statement stmt(db_,
        "SELECT DISTINCT roomId FROM participants WHERE userId IN (" + join(placeholders, ", ") + ")");
    int idx = 1;
    for (const auto& user_id : user_ids) {
        stmt.bind_text(idx++, user_id);
    }

    while (stmt.step()) {
        rooms.push_back(stmt.column_text(0));
    }
    return rooms;
}

bool AccountStore::add_participant(const Uuid& user_id, const Uuid& room_id) {
    try {
        Statement stmt(db_,
            "INSERT INTO participants (id, userId, roomId, createdAt) VALUES (?, ?, ?, ?)");
        stmt.bind_text(1, generate_uuid());
        stmt.bind_text(2, user_id);
        stmt.bind_text(3, room_id);
        stmt.bind_int64(4, current_timestamp_ms());
        stmt.execute();
        return true;
    } catch (const StoreError& e) {
        LOG_ERROR("[AccountStore] Error adding participant %s to room %s: %s",
                  user_id.c_str(), room_id.c_str(), e.what());
        return false;
    }
}

bool AccountStore::remove_participant(const Uuid& user_id, const Uuid& room_id) {
    try {
        Statement stmt(db_, "DELETE FROM participants WHERE userId = ? AND roomId = ?");
        stmt.bind_text(1, user_id);
        stmt.bind_text(2, room_id);
        stmt.execute();
        return true;
    } catch (const StoreError& e) {
        LOG_ERROR("[AccountStore] Error removing participant %s from room %s: %s",
                  user_id.c_str(), room_id.c_str(), e.what());
        return false;
    }
}

UserState AccountStore::get_participant_user_state(const Uuid& room_id, const Uuid& user_id) {
    Statement stmt(db_, "SELECT userState FROM participants WHERE roomId = ? AND userId = ?");
    stmt.bind_text(1, room_id);
    stmt.bind_text(2, user_id);
    if (!stmt.step()) {
        return UserState::NONE;
    }
    return string_to_user_state(stmt.column_text(0));
}

void AccountStore::set_participant_user_state(const Uuid& room_id, const Uuid& user_id, UserState state) {
    Statement stmt(db_, "UPDATE participants SET userState = ? WHERE roomId = ? AND userId = ?");
    stmt.bind_text_or_null(1, user_state_to_string(state));
    stmt.bind_text(2, room_id);
    stmt.bind_text(3, user_id);
    stmt.execute();
}

} // namespace agentmem
