#include <chatgate/core/config.hpp>
#include <chatgate/core/logger.hpp>
#include <chatgate/core/utils.hpp>
#include <fstream>
#include <cstdlib>
#include <cerrno>

namespace chatgate {

Config::Config() : data_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream f(path.c_str());
    if (!f.is_open()) {
        last_error_ = "cannot open " + path;
        return false;
    }

    std::string content((std::istreambuf_iterator<char>(f)),
                        std::istreambuf_iterator<char>());
    return load_string(content);
}

bool Config::load_string(const std::string& json_str) {
    try {
        Json parsed = Json::parse(json_str);
        if (!parsed.is_object()) {
            last_error_ = "top-level value is not an object";
            return false;
        }
        data_ = parsed;
        last_error_.clear();
        return true;
    } catch (const JsonParseError& e) {
        last_error_ = e.what();
        return false;
    }
}

std::string Config::to_env_key(const std::string& key) {
    return "CHATGATE_" + to_upper(replace_all(key, ".", "_"));
}

bool Config::env_value(const std::string& key, std::string& out) {
    const char* v = std::getenv(to_env_key(key).c_str());
    if (!v || !v[0]) return false;
    out = v;
    return true;
}

const Json& Config::lookup(const std::string& key) const {
    std::vector<std::string> parts = split(key, '.');
    const Json* node = &data_;
    for (size_t i = 0; i < parts.size(); ++i) {
        node = &(*node)[parts[i]];
        if (node->is_null()) break;
    }
    return *node;
}

std::string Config::get_string(const std::string& key, const std::string& def) const {
    std::string env;
    if (env_value(key, env)) {
        LOG_DEBUG("config.env key=%s", key.c_str());
        return env;
    }
    const Json& v = lookup(key);
    return v.is_string() ? v.as_string() : def;
}

int64_t Config::get_int(const std::string& key, int64_t def) const {
    std::string env;
    if (env_value(key, env)) {
        errno = 0;
        char* end = NULL;
        long long parsed = std::strtoll(env.c_str(), &end, 10);
        if (errno == 0 && end && *end == '\0') {
            return static_cast<int64_t>(parsed);
        }
        LOG_WARN("config.env.invalid key=%s value=%s", key.c_str(), env.c_str());
    }
    const Json& v = lookup(key);
    return v.is_number() ? v.as_int() : def;
}

bool Config::get_bool(const std::string& key, bool def) const {
    std::string env;
    if (env_value(key, env)) {
        std::string lowered = to_lower(env);
        if (lowered == "1" || lowered == "true" || lowered == "yes") return true;
        if (lowered == "0" || lowered == "false" || lowered == "no") return false;
        LOG_WARN("config.env.invalid key=%s value=%s", key.c_str(), env.c_str());
    }
    const Json& v = lookup(key);
    return v.is_bool() ? v.as_bool() : def;
}

std::vector<std::string> Config::get_string_list(const std::string& key) const {
    std::vector<std::string> result;
    std::string joined;
    if (!env_value(key, joined)) {
        const Json& v = lookup(key);
        if (v.is_array()) {
            const Json::Array& items = v.as_array();
            for (size_t i = 0; i < items.size(); ++i) {
                std::string item = trim(items[i].as_string());
                if (!item.empty()) result.push_back(item);
            }
            return result;
        }
        joined = v.as_string();
    }
    std::vector<std::string> parts = split(joined, ',');
    for (size_t i = 0; i < parts.size(); ++i) {
        std::string item = trim(parts[i]);
        if (!item.empty()) result.push_back(item);
    }
    return result;
}

const Json& Config::get_section(const std::string& key) const {
    return lookup(key);
}

const Json& Config::data() const { return data_; }

} // namespace chatgate
