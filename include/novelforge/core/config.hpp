/*
 * NovelForge C++ - Configuration
 *
 * JSON configuration file with dotted-key lookups:
 *   cfg.get_int("context.token_budget", 3000)
 * resolves either a literal "context.token_budget" key or the nested
 * path {"context": {"token_budget": ...}}.
 */
#ifndef novelforge_CORE_CONFIG_HPP
#define novelforge_CORE_CONFIG_HPP

#include <novelforge/core/json.hpp>
#include <string>
#include <cstdint>

namespace novelforge {

class Config {
public:
    Config();

    // Load from disk / from a JSON document. On failure the previous
    // contents are kept and last_error() explains why.
    bool load_file(const std::string& path);
    bool load_string(const std::string& text);

    std::string get_string(const std::string& key, const std::string& default_val = "") const;
    int64_t get_int(const std::string& key, int64_t default_val = 0) const;
    double get_double(const std::string& key, double default_val = 0.0) const;
    bool get_bool(const std::string& key, bool default_val = false) const;
    bool has(const std::string& key) const;

    void set_string(const std::string& key, const std::string& value);
    void set_int(const std::string& key, int64_t value);
    void set_bool(const std::string& key, bool value);

    const Json& data() const { return data_; }
    const std::string& source_path() const { return source_path_; }
    std::string last_error() const { return last_error_; }

private:
    Json data_;
    std::string source_path_;
    std::string last_error_;

    const Json* lookup(const std::string& key) const;
    void assign(const std::string& key, const Json& value);
};

} // namespace novelforge

#endif // novelforge_CORE_CONFIG_HPP
