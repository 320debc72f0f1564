#include <novelforge/core/config.hpp>
#include <novelforge/core/logger.hpp>
#include <novelforge/core/utils.hpp>

#include <fstream>
#include <sstream>
#include <vector>

namespace novelforge {

Config::Config() : data_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream in(path.c_str());
    if (!in) {
        last_error_ = "cannot open config file '" + path + "'";
        LOG_ERROR("[Config] %s", last_error_.c_str());
        return false;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    if (!load_string(buffer.str())) {
        LOG_ERROR("[Config] Failed to parse '%s': %s", path.c_str(), last_error_.c_str());
        return false;
    }

    source_path_ = path;
    LOG_INFO("[Config] Loaded %s", path.c_str());
    return true;
}

bool Config::load_string(const std::string& text) {
    Json parsed = Json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        last_error_ = "invalid JSON";
        return false;
    }
    if (!parsed.is_object()) {
        last_error_ = "top-level value must be an object";
        return false;
    }
    data_ = parsed;
    last_error_.clear();
    return true;
}

const Json* Config::lookup(const std::string& key) const {
    // Literal dotted key wins over the nested path
    Json::const_iterator it = data_.find(key);
    if (it != data_.end()) {
        return &(*it);
    }

    const Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) return nullptr;
        Json::const_iterator child = node->find(parts[i]);
        if (child == node->end()) return nullptr;
        node = &(*child);
    }
    return node;
}

std::string Config::get_string(const std::string& key, const std::string& default_val) const {
    const Json* v = lookup(key);
    if (!v || !v->is_string()) return default_val;
    return v->get<std::string>();
}

int64_t Config::get_int(const std::string& key, int64_t default_val) const {
    const Json* v = lookup(key);
    if (!v || !v->is_number()) return default_val;
    if (v->is_number_float()) {
        return static_cast<int64_t>(v->get<double>());
    }
    return v->get<int64_t>();
}

double Config::get_double(const std::string& key, double default_val) const {
    const Json* v = lookup(key);
    if (!v || !v->is_number()) return default_val;
    return v->get<double>();
}

bool Config::get_bool(const std::string& key, bool default_val) const {
    const Json* v = lookup(key);
    if (!v || !v->is_boolean()) return default_val;
    return v->get<bool>();
}

bool Config::has(const std::string& key) const {
    return lookup(key) != nullptr;
}

void Config::assign(const std::string& key, const Json& value) {
    if (key.empty()) return;
    if (data_.contains(key)) {
        data_[key] = value;
        return;
    }

    Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        Json& child = (*node)[parts[i]];
        if (!child.is_object()) {
            child = Json::object();
        }
        node = &child;
    }
    (*node)[parts.back()] = value;
}

void Config::set_string(const std::string& key, const std::string& value) {
    assign(key, Json(value));
}

void Config::set_int(const std::string& key, int64_t value) {
    assign(key, Json(value));
}

void Config::set_bool(const std::string& key, bool value) {
    assign(key, Json(value));
}

} // namespace novelforge
