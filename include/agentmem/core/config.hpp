/*
 * agentmem C++ - Configuration
 *
 * JSON configuration document with dotted-path accessors:
 *
 *   {
 *     "log_level": "info",
 *     "agent_id": "...",
 *     "database": { "path": "data/agent.db" },
 *     "embedding": { "provider": "bge", "dimensions": 0 },
 *     "cache": { "backend": "database", "dir": "./cache" }
 *   }
 *
 *   cfg.get_string("database.path", ":memory:")
 */
#ifndef agentmem_CORE_CONFIG_HPP
#define agentmem_CORE_CONFIG_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <cstdint>

namespace agentmem {

typedef nlohmann::json Json;

class Config {
public:
    Config();

    // Replace the document. Returns false (and keeps the old one) on
    // unreadable files or malformed JSON.
    bool load_file(const std::string& path);
    bool load_string(const std::string& text);

    bool has(const std::string& path) const;

    std::string get_string(const std::string& path, const std::string& default_val = "") const;
    int64_t get_int(const std::string& path, int64_t default_val = 0) const;
    double get_double(const std::string& path, double default_val = 0.0) const;
    bool get_bool(const std::string& path, bool default_val = false) const;

    void set_string(const std::string& path, const std::string& value);
    void set_int(const std::string& path, int64_t value);
    void set_bool(const std::string& path, bool value);

    const Json& document() const { return root_; }

private:
    const Json* find(const std::string& path) const;
    Json& ensure(const std::string& path);

    Json root_;
};

} // namespace agentmem

#endif // agentmem_CORE_CONFIG_HPP
