/*
 * agentmem C++ - Cache Layer Implementation
 */
#include <agentmem/cache/cache.hpp>
#include <agentmem/core/errors.hpp>
#include <agentmem/memory/statement.hpp>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>

namespace agentmem {

// ============================================================================
// MemoryCacheAdapter
// ============================================================================

bool MemoryCacheAdapter::get(const std::string& key, std::string& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key);
    if (it == data_.end()) return false;
    out = it->second;
    return true;
}

void MemoryCacheAdapter::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_[key] = value;
}

void MemoryCacheAdapter::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.erase(key);
}

size_t MemoryCacheAdapter::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

// ============================================================================
// FsCacheAdapter
// ============================================================================

std::string FsCacheAdapter::path_for(const std::string& key) const {
    if (key.empty()) {
        throw ValidationError("cache key must not be empty");
    }
    for (const auto& part : split(key, '/')) {
        if (part == "..") {
            throw ValidationError("cache key must not leave the cache directory: " + key);
        }
    }
    return join_path(data_dir_, key[0] == '/' ? key.substr(1) : key);
}

bool FsCacheAdapter::get(const std::string& key, std::string& out) {
    std::string path;
    try {
        path = path_for(key);
    } catch (const ValidationError& e) {
        LOG_DEBUG("[FsCache] %s", e.what());
        return false;
    }

    std::ifstream in(path.c_str(), std::ios::in | std::ios::binary);
    if (!in) return false;

    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

void FsCacheAdapter::set(const std::string& key, const std::string& value) {
    std::string path = path_for(key);

    if (!create_directories(parent_path(path))) {
        throw StoreError("[FsCache] cannot create directory for " + path + ": " + strerror(errno));
    }

    std::ofstream out(path.c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) {
        throw StoreError("[FsCache] cannot open " + path + " for writing");
    }
    out << value;
    out.close();
    if (!out) {
        throw StoreError("[FsCache] write to " + path + " failed");
    }
}

void FsCacheAdapter::remove(const std::string& key) {
    std::string path;
    try {
        path = path_for(key);
    } catch (const ValidationError& e) {
        LOG_DEBUG("[FsCache] %s", e.what());
        return;
    }
    if (std::remove(path.c_str()) != 0 && errno != ENOENT) {
        LOG_DEBUG("[FsCache] Could not delete %s: %s", path.c_str(), strerror(errno));
    }
}

// ============================================================================
// DbCacheAdapter
// ============================================================================

bool DbCacheAdapter::get(const std::string& key, std::string& out) {
    return db_.get_cache(key, agent_id_, out);
}

void DbCacheAdapter::set(const std::string& key, const std::string& value) {
    if (!db_.set_cache(key, agent_id_, value)) {
        throw StoreError("[DbCache] failed to store cache entry '" + key + "'");
    }
}

void DbCacheAdapter::remove(const std::string& key) {
    if (!db_.delete_cache(key, agent_id_)) {
        LOG_DEBUG("[DbCache] Could not delete cache entry '%s'", key.c_str());
    }
}

// ============================================================================
// CacheManager
// ============================================================================

bool CacheManager::get_json(const std::string& key, Json& out) {
    std::string raw;
    if (!adapter_->get(key, raw) || raw.empty()) {
        return false;
    }

    Json envelope = Json::parse(raw, nullptr, false);
    if (envelope.is_discarded() || !envelope.is_object() || !envelope.contains("value")) {
        LOG_DEBUG("[CacheManager] Ignoring corrupt entry '%s'", key.c_str());
        return false;
    }

    int64_t expires = 0;
    auto exp = envelope.find("expires");
    if (exp != envelope.end() && exp->is_number()) {
        expires = exp->get<int64_t>();
    }

    if (expires != 0 && expires <= current_timestamp_ms()) {
        try {
            adapter_->remove(key);
        } catch (const std::exception& e) {
            LOG_DEBUG("[CacheManager] Could not evict expired entry '%s': %s", key.c_str(), e.what());
        }
        return false;
    }

    out = envelope["value"];
    return true;
}

void CacheManager::set_json(const std::string& key, const Json& value, const CacheOptions& opts) {
    Json envelope = Json::object();
    envelope["value"] = value;
    envelope["expires"] = opts.expires;
    adapter_->set(key, dump_stored_json(envelope, "cache value"));
}

void CacheManager::remove(const std::string& key) {
    adapter_->remove(key);
}

} // namespace agentmem
