#include <agentmem/memory/types.hpp>
#include <agentmem/core/errors.hpp>

namespace agentmem {

// Accept both JSON booleans and 0/1 integers (SQLite's json_extract view)
static bool json_flag(const Json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) return false;
    if (it->is_boolean()) return it->get<bool>();
    if (it->is_number()) return it->get<double>() != 0;
    return false;
}

static std::string json_string(const Json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

// Everything in `j` except the keys a record models explicitly
static Json json_remainder(const Json& j, std::initializer_list<const char*> known) {
    Json rest = j;
    for (const char* key : known) {
        rest.erase(key);
    }
    return rest;
}

// ============================================================================
// Content
// ============================================================================

void to_json(Json& j, const Content& c) {
    j = c.extra.is_object() ? c.extra : Json::object();
    j["text"] = c.text;
}

void from_json(const Json& j, Content& c) {
    if (j.is_string()) {
        c.text = j.get<std::string>();
        c.extra = Json::object();
        return;
    }
    if (!j.is_object()) {
        throw DeserializationError("memory content is not a JSON object");
    }
    c.text = json_string(j, "text");
    c.extra = json_remainder(j, {"text"});
}

bool operator==(const Content& a, const Content& b) {
    Json ja = a;
    Json jb = b;
    return ja == jb;
}

void to_json(Json& j, const KnowledgeMetadata& m) {
    j = m.extra.is_object() ? m.extra : Json::object();
    j["isMain"] = m.is_main;
    j["isShared"] = m.is_shared;
    j["isChunk"] = m.is_chunk;
    if (!m.original_id.empty()) j["originalId"] = m.original_id;
    if (m.chunk_index >= 0) j["chunkIndex"] = m.chunk_index;
    if (!m.source.empty()) j["source"] = m.source;
}

void from_json(const Json& j, KnowledgeMetadata& m) {
    if (!j.is_object()) {
        m = KnowledgeMetadata();
        return;
    }
    m.is_main = json_flag(j, "isMain");
    m.is_shared = json_flag(j, "isShared");
    m.is_chunk = json_flag(j, "isChunk");
    m.original_id = json_string(j, "originalId");
    auto idx = j.find("chunkIndex");
    m.chunk_index = (idx != j.end() && idx->is_number()) ? idx->get<int>() : -1;
    m.source = json_string(j, "source");
    m.extra = json_remainder(j, {"isMain", "isShared", "isChunk", "originalId", "chunkIndex", "source"});
}

void to_json(Json& j, const KnowledgeContent& c) {
    j = c.extra.is_object() ? c.extra : Json::object();
    j["text"] = c.text;
    j["metadata"] = c.metadata;
}

void from_json(const Json& j, KnowledgeContent& c) {
    if (!j.is_object()) {
        throw DeserializationError("knowledge content is not a JSON object");
    }
    c.text = json_string(j, "text");
    auto meta = j.find("metadata");
    if (meta != j.end()) {
        c.metadata = meta->get<KnowledgeMetadata>();
    } else {
        c.metadata = KnowledgeMetadata();
    }
    c.extra = json_remainder(j, {"text", "metadata"});
}

void to_json(Json& j, const KnowledgeItem& k) {
    j = Json::object();
    j["id"] = k.id;
    j["agentId"] = k.agent_id.empty() ? Json() : Json(k.agent_id);
    j["content"] = k.content;
    j["embedding"] = k.embedding;
    j["createdAt"] = k.created_at;
    j["similarity"] = k.similarity;
}

void from_json(const Json& j, KnowledgeItem& k) {
    if (!j.is_object()) {
        throw DeserializationError("knowledge item is not a JSON object");
    }
    k.id = json_string(j, "id");
    k.agent_id = json_string(j, "agentId");
    k.content = j.at("content").get<KnowledgeContent>();
    auto emb = j.find("embedding");
    k.embedding = (emb != j.end() && emb->is_array()) ? emb->get<Embedding>() : Embedding();
    k.created_at = j.value("createdAt", static_cast<int64_t>(0));
    k.similarity = j.value("similarity", 0.0);
}

// ============================================================================
// Participants and goals
// ============================================================================

std::string user_state_to_string(UserState s) {
    switch (s) {
        case UserState::FOLLOWED: return "FOLLOWED";
        case UserState::MUTED: return "MUTED";
        case UserState::NONE: break;
    }
    return "";
}

UserState string_to_user_state(const std::string& s) {
    if (s == "FOLLOWED") return UserState::FOLLOWED;
    if (s == "MUTED") return UserState::MUTED;
    return UserState::NONE;
}

std::string goal_status_to_string(GoalStatus s) {
    switch (s) {
        case GoalStatus::DONE: return "DONE";
        case GoalStatus::FAILED: return "FAILED";
        case GoalStatus::IN_PROGRESS: break;
    }
    return "IN_PROGRESS";
}

GoalStatus string_to_goal_status(const std::string& s) {
    if (s == "DONE") return GoalStatus::DONE;
    if (s == "FAILED") return GoalStatus::FAILED;
    return GoalStatus::IN_PROGRESS;
}

void to_json(Json& j, const Objective& o) {
    j = Json::object();
    if (!o.id.empty()) j["id"] = o.id;
    j["description"] = o.description;
    j["completed"] = o.completed;
}

void from_json(const Json& j, Objective& o) {
    if (!j.is_object()) {
        throw DeserializationError("goal objective is not a JSON object");
    }
    o.id = json_string(j, "id");
    o.description = json_string(j, "description");
    o.completed = json_flag(j, "completed");
}

} // namespace agentmem
