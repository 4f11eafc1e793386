/*
 * agentmem C++ - Cache Layer
 *
 *   CacheAdapter        - raw string key/value backend
 *   MemoryCacheAdapter  - in-process map, lives as long as the process
 *   FsCacheAdapter      - one file per key under a directory
 *   DbCacheAdapter      - the cache table, scoped by agent id
 *   CacheManager        - JSON (de)serialization plus expiry on top
 *
 * Reads of missing entries return false. Writes that fail throw
 * StoreError.
 */
#ifndef agentmem_CACHE_CACHE_HPP
#define agentmem_CACHE_CACHE_HPP

#include <agentmem/core/config.hpp>
#include <agentmem/core/logger.hpp>
#include <agentmem/core/utils.hpp>
#include <agentmem/memory/database.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace agentmem {

class CacheAdapter {
public:
    virtual ~CacheAdapter() {}

    virtual bool get(const std::string& key, std::string& out) = 0;
    virtual void set(const std::string& key, const std::string& value) = 0;
    virtual void remove(const std::string& key) = 0;
};

class MemoryCacheAdapter : public CacheAdapter {
public:
    MemoryCacheAdapter() {}
    explicit MemoryCacheAdapter(const std::map<std::string, std::string>& initial) : data_(initial) {}

    bool get(const std::string& key, std::string& out) override;
    void set(const std::string& key, const std::string& value) override;
    void remove(const std::string& key) override;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> data_;
};

class FsCacheAdapter : public CacheAdapter {
public:
    explicit FsCacheAdapter(const std::string& data_dir) : data_dir_(data_dir) {}

    bool get(const std::string& key, std::string& out) override;
    void set(const std::string& key, const std::string& value) override;
    // Missing files are ignored
    void remove(const std::string& key) override;

private:
    // Keys may contain '/' (nested directories) but never "..".
    std::string path_for(const std::string& key) const;

    std::string data_dir_;
};

class DbCacheAdapter : public CacheAdapter {
public:
    DbCacheAdapter(DatabaseCacheAdapter& db, const Uuid& agent_id) : db_(db), agent_id_(agent_id) {}

    bool get(const std::string& key, std::string& out) override;
    void set(const std::string& key, const std::string& value) override;
    void remove(const std::string& key) override;

private:
    DatabaseCacheAdapter& db_;
    Uuid agent_id_;
};

struct CacheOptions {
    int64_t expires;    // absolute epoch ms, 0 = never

    CacheOptions() : expires(0) {}
    explicit CacheOptions(int64_t expires_at) : expires(expires_at) {}
};

// Stored envelope: {"value": <T as JSON>, "expires": <epoch ms or 0>}
class CacheManager {
public:
    explicit CacheManager(std::shared_ptr<CacheAdapter> adapter) : adapter_(adapter) {}

    // Raw JSON value. False if absent, corrupt or expired; expired entries
    // are removed on a best-effort basis.
    bool get_json(const std::string& key, Json& out);
    void set_json(const std::string& key, const Json& value, const CacheOptions& opts = CacheOptions());

    template<typename T>
    bool get(const std::string& key, T& out) {
        Json value;
        if (!get_json(key, value)) return false;
        try {
            out = value.get<T>();
            return true;
        } catch (const std::exception& e) {
            LOG_DEBUG("[CacheManager] Entry '%s' has unexpected shape: %s", key.c_str(), e.what());
            return false;
        }
    }

    template<typename T>
    void set(const std::string& key, const T& value, const CacheOptions& opts = CacheOptions()) {
        set_json(key, Json(value), opts);
    }

    void remove(const std::string& key);

    CacheAdapter& adapter() { return *adapter_; }

private:
    std::shared_ptr<CacheAdapter> adapter_;
};

} // namespace agentmem

#endif // agentmem_CACHE_CACHE_HPP
