#include <agentmem/core/errors.hpp>
#include <sqlite3.h>

namespace agentmem {

bool StoreError::is_constraint() const {
    return (code_ & 0xFF) == SQLITE_CONSTRAINT;
}

bool StoreError::is_primary_key_conflict() const {
    return code_ == SQLITE_CONSTRAINT_PRIMARYKEY;
}

} // namespace agentmem
