/*
 * agentmem C++ - Error types
 *
 *   ValidationError      - caller supplied a request the store cannot serve
 *   StoreError           - the SQLite engine (or a cache backend) failed
 *   DeserializationError - stored JSON could not be interpreted
 */
#ifndef agentmem_CORE_ERRORS_HPP
#define agentmem_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace agentmem {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message) : Error(message) {}
};

class DeserializationError : public Error {
public:
    explicit DeserializationError(const std::string& message) : Error(message) {}
};

class StoreError : public Error {
public:
    // code is the extended SQLite result code, 0 when not from SQLite
    explicit StoreError(const std::string& message, int code = 0)
        : Error(message), code_(code) {}

    int code() const { return code_; }

    bool is_constraint() const;
    bool is_primary_key_conflict() const;

private:
    int code_;
};

} // namespace agentmem

#endif // agentmem_CORE_ERRORS_HPP
