#include <agentmem/memory/statement.hpp>
#include <agentmem/memory/embedding.hpp>
#include <agentmem/core/errors.hpp>
#include <agentmem/core/logger.hpp>

namespace agentmem {

void throw_sqlite_error(sqlite3* db, const std::string& context) {
    int code = db ? sqlite3_extended_errcode(db) : SQLITE_MISUSE;
    const char* msg = db ? sqlite3_errmsg(db) : "database is not open";
    throw StoreError(context + ": " + msg, code);
}

void require_open(sqlite3* db, const char* component) {
    if (!db) {
        throw StoreError(std::string("[") + component + "] database is not open", SQLITE_MISUSE);
    }
}

Json parse_stored_json(const std::string& text, const char* what) {
    Json parsed = Json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        throw DeserializationError(std::string("stored ") + what + " is not valid JSON");
    }
    return parsed;
}

std::string dump_stored_json(const Json& value, const char* what) {
    try {
        return value.dump();
    } catch (const Json::type_error& e) {
        throw ValidationError(std::string(what) + " is not valid UTF-8: " + e.what());
    }
}

// ============================================================================
// Statement
// ============================================================================

Statement::Statement(sqlite3* db, const std::string& sql)
    : db_(db), stmt_(nullptr), sql_(sql)
{
    require_open(db_, "Statement");
    int rc = sqlite3_prepare_v2(db_, sql_.c_str(), -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        LOG_DEBUG("[Statement] prepare failed for: %s", sql_.c_str());
        stmt_ = nullptr;
        throw_sqlite_error(db_, "prepare failed");
    }
}

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

void Statement::check_bind(int rc, int index) {
    if (rc != SQLITE_OK) {
        throw_sqlite_error(db_, "bind failed at parameter " + std::to_string(index));
    }
}

void Statement::bind_text(int index, const std::string& value) {
    check_bind(sqlite3_bind_text(stmt_, index, value.c_str(),
                                 static_cast<int>(value.size()), SQLITE_TRANSIENT), index);
}

void Statement::bind_text_or_null(int index, const std::string& value) {
    if (value.empty()) {
        bind_null(index);
    } else {
        bind_text(index, value);
    }
}

void Statement::bind_int64(int index, int64_t value) {
    check_bind(sqlite3_bind_int64(stmt_, index, value), index);
}

void Statement::bind_double(int index, double value) {
    check_bind(sqlite3_bind_double(stmt_, index, value), index);
}

void Statement::bind_blob(int index, const std::string& bytes) {
    check_bind(sqlite3_bind_blob(stmt_, index, bytes.data(),
                                 static_cast<int>(bytes.size()), SQLITE_TRANSIENT), index);
}

void Statement::bind_embedding(int index, const Embedding& v) {
    if (v.empty()) {
        bind_null(index);
    } else {
        bind_blob(index, encode_embedding(v));
    }
}

void Statement::bind_null(int index) {
    check_bind(sqlite3_bind_null(stmt_, index), index);
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    LOG_DEBUG("[Statement] step failed for: %s", sql_.c_str());
    throw_sqlite_error(db_, "step failed");
}

int Statement::execute() {
    while (step()) {
    }
    return sqlite3_changes(db_);
}

std::string Statement::column_text(int col) const {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
    if (!text) return "";
    return std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
}

int64_t Statement::column_int64(int col) const {
    return sqlite3_column_int64(stmt_, col);
}

double Statement::column_double(int col) const {
    return sqlite3_column_double(stmt_, col);
}

bool Statement::column_is_null(int col) const {
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

Embedding Statement::column_embedding(int col) const {
    if (column_is_null(col)) return Embedding();
    const void* blob = sqlite3_column_blob(stmt_, col);
    int bytes = sqlite3_column_bytes(stmt_, col);
    return decode_embedding(blob, bytes);
}

// ============================================================================
// Transaction
// ============================================================================

Transaction::Transaction(sqlite3* db) : db_(db), done_(false) {
    require_open(db_, "Transaction");
    if (sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) != SQLITE_OK) {
        throw_sqlite_error(db_, "BEGIN failed");
    }
}

Transaction::~Transaction() {
    if (!done_) {
        if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
            LOG_WARN("[Transaction] ROLLBACK failed: %s", sqlite3_errmsg(db_));
        }
    }
}

void Transaction::commit() {
    if (sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
        throw_sqlite_error(db_, "COMMIT failed");
    }
    done_ = true;
}

} // namespace agentmem
