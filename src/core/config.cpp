#include <agentmem/core/config.hpp>
#include <agentmem/core/logger.hpp>
#include <agentmem/core/utils.hpp>

#include <fstream>
#include <sstream>

namespace agentmem {

Config::Config() : root_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream in(path.c_str());
    if (!in) {
        LOG_ERROR("[Config] Cannot open %s", path.c_str());
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return load_string(ss.str());
}

bool Config::load_string(const std::string& text) {
    Json parsed = Json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        LOG_ERROR("[Config] Configuration is not a JSON object");
        return false;
    }
    root_ = parsed;
    return true;
}

const Json* Config::find(const std::string& path) const {
    const Json* node = &root_;
    for (const auto& part : split(path, '.')) {
        if (!node->is_object()) return nullptr;
        auto it = node->find(part);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

Json& Config::ensure(const std::string& path) {
    Json* node = &root_;
    for (const auto& part : split(path, '.')) {
        if (!node->is_object()) {
            *node = Json::object();
        }
        node = &(*node)[part];
    }
    return *node;
}

bool Config::has(const std::string& path) const {
    const Json* node = find(path);
    return node && !node->is_null();
}

std::string Config::get_string(const std::string& path, const std::string& default_val) const {
    const Json* node = find(path);
    if (!node) return default_val;
    if (node->is_string()) return node->get<std::string>();
    if (node->is_number() || node->is_boolean()) return node->dump();
    return default_val;
}

int64_t Config::get_int(const std::string& path, int64_t default_val) const {
    const Json* node = find(path);
    if (!node) return default_val;
    if (node->is_number()) return node->get<int64_t>();
    if (node->is_string()) {
        try {
            return std::stoll(node->get<std::string>());
        } catch (const std::exception&) {
            LOG_WARN("[Config] %s is not an integer, using %lld", path.c_str(),
                     static_cast<long long>(default_val));
        }
    }
    return default_val;
}

double Config::get_double(const std::string& path, double default_val) const {
    const Json* node = find(path);
    if (!node) return default_val;
    if (node->is_number()) return node->get<double>();
    if (node->is_string()) {
        try {
            return std::stod(node->get<std::string>());
        } catch (const std::exception&) {
            LOG_WARN("[Config] %s is not a number, using %g", path.c_str(), default_val);
        }
    }
    return default_val;
}

bool Config::get_bool(const std::string& path, bool default_val) const {
    const Json* node = find(path);
    if (!node) return default_val;
    if (node->is_boolean()) return node->get<bool>();
    if (node->is_number_integer()) return node->get<int64_t>() != 0;
    if (node->is_string()) {
        std::string s = to_lower(node->get<std::string>());
        if (s == "true" || s == "1" || s == "yes") return true;
        if (s == "false" || s == "0" || s == "no") return false;
    }
    return default_val;
}

void Config::set_string(const std::string& path, const std::string& value) {
    ensure(path) = value;
}

void Config::set_int(const std::string& path, int64_t value) {
    ensure(path) = value;
}

void Config::set_bool(const std::string& path, bool value) {
    ensure(path) = value;
}

} // namespace agentmem
