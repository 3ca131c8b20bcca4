#include <convoflow/core/config.hpp>
#include <convoflow/core/logger.hpp>
#include <convoflow/core/utils.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace convoflow {

Config::Config() : data_(Json::object()) {}

Config::Config(const Json& data) : data_(data.is_object() ? data : Json::object()) {}

bool Config::load_file(const std::string& path, std::string* error) {
    std::ifstream in(path.c_str());
    if (!in) {
        if (error) *error = "cannot open config file: " + path;
        LOG_WARN("[Config] Cannot open config file '%s'", path.c_str());
        return false;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    if (!load_string(buffer.str(), error)) {
        LOG_ERROR("[Config] Failed to parse '%s'", path.c_str());
        return false;
    }
    source_path_ = path;
    LOG_INFO("[Config] Loaded configuration from %s", path.c_str());
    return true;
}

bool Config::load_string(const std::string& text, std::string* error) {
    Json parsed = Json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        if (error) *error = "invalid JSON";
        return false;
    }
    if (!parsed.is_object()) {
        if (error) *error = "configuration root must be an object";
        return false;
    }
    data_ = parsed;
    return true;
}

const Json* Config::lookup(const std::string& key) const {
    const Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) return nullptr;
        Json::const_iterator it = node->find(parts[i]);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

Json& Config::lookup_or_create(const std::string& key) {
    Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) {
            *node = Json::object();
        }
        node = &(*node)[parts[i]];
    }
    return *node;
}

bool Config::has(const std::string& key) const {
    return lookup(key) != nullptr;
}

std::string Config::get_string(const std::string& key, const std::string& def) const {
    const Json* v = lookup(key);
    if (!v) return def;
    if (v->is_string()) return v->get<std::string>();
    if (v->is_number() || v->is_boolean()) return v->dump();
    return def;
}

int64_t Config::get_int(const std::string& key, int64_t def) const {
    const Json* v = lookup(key);
    if (!v) return def;
    if (v->is_number_integer()) return v->get<int64_t>();
    if (v->is_number_float()) return static_cast<int64_t>(v->get<double>());
    if (v->is_string()) {
        const std::string s = v->get<std::string>();
        char* end = nullptr;
        long long parsed = strtoll(s.c_str(), &end, 10);
        if (end != s.c_str() && *end == '\0') return static_cast<int64_t>(parsed);
    }
    return def;
}

double Config::get_double(const std::string& key, double def) const {
    const Json* v = lookup(key);
    if (!v) return def;
    if (v->is_number()) return v->get<double>();
    if (v->is_string()) {
        const std::string s = v->get<std::string>();
        char* end = nullptr;
        double parsed = strtod(s.c_str(), &end);
        if (end != s.c_str() && *end == '\0') return parsed;
    }
    return def;
}

bool Config::get_bool(const std::string& key, bool def) const {
    const Json* v = lookup(key);
    if (!v) return def;
    if (v->is_boolean()) return v->get<bool>();
    if (v->is_number_integer()) return v->get<int64_t>() != 0;
    if (v->is_string()) {
        std::string s = to_lower(v->get<std::string>());
        if (s == "true" || s == "yes" || s == "1" || s == "on") return true;
        if (s == "false" || s == "no" || s == "0" || s == "off") return false;
    }
    return def;
}

void Config::set_string(const std::string& key, const std::string& value) {
    lookup_or_create(key) = value;
}

void Config::set_int(const std::string& key, int64_t value) {
    lookup_or_create(key) = value;
}

void Config::set_double(const std::string& key, double value) {
    lookup_or_create(key) = value;
}

void Config::set_bool(const std::string& key, bool value) {
    lookup_or_create(key) = value;
}

} // namespace convoflow
