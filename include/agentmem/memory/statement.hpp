/*
 * agentmem C++ - SQLite statement helpers
 *
 * Statement owns a prepared sqlite3_stmt and finalizes it on scope exit,
 * so store methods can throw StoreError without leaking statements.
 * Bind indexes are 1-based, column indexes 0-based (as in the C API).
 */
#ifndef agentmem_MEMORY_STATEMENT_HPP
#define agentmem_MEMORY_STATEMENT_HPP

#include "types.hpp"
#include <sqlite3.h>
#include <string>

namespace agentmem {

// Throws StoreError("<context>: <sqlite message>") with the extended code
[[noreturn]] void throw_sqlite_error(sqlite3* db, const std::string& context);

// Throws StoreError if the handle is closed
void require_open(sqlite3* db, const char* component);

// Parses a JSON TEXT column; throws DeserializationError naming `what`
Json parse_stored_json(const std::string& text, const char* what);

// Serializes a value for a JSON TEXT column; throws ValidationError naming
// `what` when a string in it is not valid UTF-8
std::string dump_stored_json(const Json& value, const char* what);

class Statement {
public:
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    void bind_text(int index, const std::string& value);
    void bind_text_or_null(int index, const std::string& value);   // empty -> NULL
    void bind_int64(int index, int64_t value);
    void bind_double(int index, double value);
    void bind_blob(int index, const std::string& bytes);
    void bind_embedding(int index, const Embedding& v);
    void bind_null(int index);

    // true when a row is available, false when done; throws on error
    bool step();

    // Run a statement that returns no rows; returns sqlite3_changes()
    int execute();

    std::string column_text(int col) const;     // NULL -> ""
    int64_t column_int64(int col) const;
    double column_double(int col) const;
    bool column_is_null(int col) const;
    Embedding column_embedding(int col) const;  // NULL -> empty

private:
    Statement(const Statement&);
    Statement& operator=(const Statement&);

    void check_bind(int rc, int index);

    sqlite3* db_;
    sqlite3_stmt* stmt_;
    std::string sql_;
};

// BEGIN IMMEDIATE ... COMMIT, rolled back on scope exit unless committed
class Transaction {
public:
    explicit Transaction(sqlite3* db);
    ~Transaction();

    void commit();

private:
    Transaction(const Transaction&);
    Transaction& operator=(const Transaction&);

    sqlite3* db_;
    bool done_;
};

} // namespace agentmem

#endif // agentmem_MEMORY_STATEMENT_HPP
