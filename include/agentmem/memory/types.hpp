/*
 * agentmem C++ - Memory Types
 *
 * Records persisted by the store. Structured payloads (content, goal
 * objectives, account details) have explicit record types with
 * to_json/from_json so they round-trip losslessly through the TEXT
 * columns they are stored in.
 */
#ifndef agentmem_MEMORY_TYPES_HPP
#define agentmem_MEMORY_TYPES_HPP

#include <agentmem/core/config.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace agentmem {

typedef std::string Uuid;
typedef std::vector<float> Embedding;

// ============================================================================
// Content payloads
// ============================================================================

// Message/fact payload of a memory. `text` is the only field the store
// reads; every other key is carried verbatim in `extra`.
struct Content {
    std::string text;
    Json extra;

    Content() : extra(Json::object()) {}
    explicit Content(const std::string& t) : text(t), extra(Json::object()) {}
};

void to_json(Json& j, const Content& c);
void from_json(const Json& j, Content& c);
bool operator==(const Content& a, const Content& b);

struct KnowledgeMetadata {
    bool is_main;
    bool is_shared;
    bool is_chunk;
    std::string original_id;    // parent document of a chunk
    int chunk_index;            // -1 = not a chunk
    std::string source;
    Json extra;

    KnowledgeMetadata()
        : is_main(false), is_shared(false), is_chunk(false), chunk_index(-1),
          extra(Json::object()) {}
};

void to_json(Json& j, const KnowledgeMetadata& m);
void from_json(const Json& j, KnowledgeMetadata& m);

struct KnowledgeContent {
    std::string text;
    KnowledgeMetadata metadata;
    Json extra;

    KnowledgeContent() : extra(Json::object()) {}
};

void to_json(Json& j, const KnowledgeContent& c);
void from_json(const Json& j, KnowledgeContent& c);

// ============================================================================
// Memories and knowledge
// ============================================================================

struct Memory {
    Uuid id;                // empty = generate on insert
    std::string type;       // namespace ("messages", "facts", ...)
    Uuid user_id;
    Uuid agent_id;
    Uuid room_id;
    Content content;
    Embedding embedding;    // empty = no embedding
    bool unique;            // computed by the store on insert
    int64_t created_at;     // epoch ms, 0 = now

    Memory() : unique(true), created_at(0) {}
};

// searchMemories result: lower distance = closer
struct MemoryDistanceHit {
    Memory memory;
    double distance;

    MemoryDistanceHit() : distance(0) {}
};

// searchMemoriesByEmbedding result: higher score = closer, score in (0, 1]
struct MemorySearchHit {
    Memory memory;
    double score;

    MemorySearchHit() : score(0) {}
};

struct KnowledgeItem {
    Uuid id;
    Uuid agent_id;          // empty for shared items
    KnowledgeContent content;
    Embedding embedding;    // empty = stored as NULL
    int64_t created_at;
    double similarity;      // combined score, set by searchKnowledge

    KnowledgeItem() : created_at(0), similarity(0) {}
};

void to_json(Json& j, const KnowledgeItem& k);
void from_json(const Json& j, KnowledgeItem& k);

// ============================================================================
// Accounts, rooms, participants
// ============================================================================

struct Account {
    Uuid id;
    std::string name;
    std::string username;
    std::string email;
    std::string avatar_url;
    Json details;

    Account() : details(Json::object()) {}
};

struct Actor {
    Uuid id;
    std::string name;
    std::string username;
    Json details;

    Actor() : details(Json::object()) {}
};

struct Participant {
    Uuid id;
    Uuid user_id;
    Uuid room_id;
    std::string last_message_read;
};

enum class UserState {
    NONE,
    FOLLOWED,
    MUTED
};

std::string user_state_to_string(UserState s);   // NONE -> ""
UserState string_to_user_state(const std::string& s);

// ============================================================================
// Goals and relationships
// ============================================================================

enum class GoalStatus {
    IN_PROGRESS,
    DONE,
    FAILED
};

std::string goal_status_to_string(GoalStatus s);
GoalStatus string_to_goal_status(const std::string& s);

struct Objective {
    std::string id;
    std::string description;
    bool completed;

    Objective() : completed(false) {}
};

void to_json(Json& j, const Objective& o);
void from_json(const Json& j, Objective& o);

struct Goal {
    Uuid id;
    Uuid room_id;
    Uuid user_id;
    std::string name;
    GoalStatus status;
    std::vector<Objective> objectives;

    Goal() : status(GoalStatus::IN_PROGRESS) {}
};

struct Relationship {
    Uuid id;
    Uuid user_a;
    Uuid user_b;
    Uuid user_id;           // creator
};

// ============================================================================
// Query parameters
// ============================================================================

struct GetMemoriesParams {
    Uuid room_id;           // required
    Uuid agent_id;          // empty = any agent
    std::string table_name; // required
    int count;              // 0 = no cap
    bool unique;
    int64_t start;          // createdAt >= start, 0 = unbounded
    int64_t end;            // createdAt <= end, 0 = unbounded

    GetMemoriesParams() : count(0), unique(false), start(0), end(0) {}
};

struct SearchMemoriesParams {
    std::string table_name;
    Uuid room_id;
    Uuid agent_id;          // empty = any agent
    Embedding embedding;
    double match_threshold; // accepted, results are not filtered by it
    int match_count;
    bool unique;

    SearchMemoriesParams() : match_threshold(0), match_count(10), unique(false) {}
};

struct EmbeddingSearchParams {
    Uuid agent_id;
    std::string table_name;
    Uuid room_id;           // empty = any room
    bool unique;
    int count;              // 0 = no cap
    double match_threshold; // minimum score, 0 = no floor

    EmbeddingSearchParams() : unique(false), count(0), match_threshold(0) {}
};

struct CachedEmbeddingQuery {
    std::string query_table_name;
    double query_threshold;
    std::string query_input;
    std::string query_field_name;
    std::string query_field_sub_name;
    int query_match_count;

    CachedEmbeddingQuery() : query_threshold(0), query_match_count(10) {}
};

struct CachedEmbedding {
    Embedding embedding;
    double levenshtein_score;

    CachedEmbedding() : levenshtein_score(0) {}
};

struct KnowledgeQuery {
    Uuid id;                // empty = any
    Uuid agent_id;
    int limit;              // 0 = no cap
    std::string query;

    KnowledgeQuery() : limit(0) {}
};

struct KnowledgeSearchParams {
    Uuid agent_id;
    Embedding embedding;
    double match_threshold;
    int match_count;
    std::string search_text;

    KnowledgeSearchParams() : match_threshold(0), match_count(10) {}
};

struct GoalQuery {
    Uuid room_id;
    Uuid user_id;           // empty = any user
    bool only_in_progress;
    int count;              // 0 = no cap

    GoalQuery() : only_in_progress(false), count(0) {}
};

struct LogEntry {
    Json body;
    Uuid user_id;
    Uuid room_id;
    std::string type;

    LogEntry() : body(Json::object()) {}
};

} // namespace agentmem

#endif // agentmem_MEMORY_TYPES_HPP
