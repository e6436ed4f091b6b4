#ifndef CHATGATE_CORE_CONFIG_HPP
#define CHATGATE_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace chatgate {

// JSON-file configuration with dot-notation lookups ("webhook.max_attempts").
// Every scalar lookup first checks the environment: the key upper-cased with
// dots turned into underscores and prefixed with CHATGATE_, so
// "gateway.port" can be overridden by CHATGATE_GATEWAY_PORT.
class Config {
public:
    Config();

    bool load_file(const std::string& path);
    bool load_string(const std::string& json_str);

    std::string get_string(const std::string& key, const std::string& def = "") const;
    int64_t get_int(const std::string& key, int64_t def = 0) const;
    bool get_bool(const std::string& key, bool def = false) const;

    // Arrays of strings, or a comma separated string / env value
    std::vector<std::string> get_string_list(const std::string& key) const;

    const Json& get_section(const std::string& key) const;
    const Json& data() const;

    const std::string& last_error() const { return last_error_; }

    static std::string to_env_key(const std::string& key);

private:
    Json data_;
    std::string last_error_;

    const Json& lookup(const std::string& key) const;
    static bool env_value(const std::string& key, std::string& out);
};

} // namespace chatgate

#endif // CHATGATE_CORE_CONFIG_HPP
