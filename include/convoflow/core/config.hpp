/*
 * convoflow C++ - Configuration
 *
 * JSON-backed configuration with dotted-key access:
 *   cfg.get_string("llamacpp.url", "http://localhost:8080")
 *   cfg.get_double("compaction.threshold_ratio", 0.9)
 */
#ifndef convoflow_CORE_CONFIG_HPP
#define convoflow_CORE_CONFIG_HPP

#include <convoflow/core/json.hpp>
#include <string>
#include <cstdint>

namespace convoflow {

class Config {
public:
    Config();
    explicit Config(const Json& data);

    // Load from a JSON file. On failure the previous contents are kept.
    bool load_file(const std::string& path, std::string* error = nullptr);
    bool load_string(const std::string& text, std::string* error = nullptr);

    bool has(const std::string& key) const;

    std::string get_string(const std::string& key, const std::string& def = "") const;
    int64_t get_int(const std::string& key, int64_t def = 0) const;
    double get_double(const std::string& key, double def = 0.0) const;
    bool get_bool(const std::string& key, bool def = false) const;

    void set_string(const std::string& key, const std::string& value);
    void set_int(const std::string& key, int64_t value);
    void set_double(const std::string& key, double value);
    void set_bool(const std::string& key, bool value);

    const Json& raw() const { return data_; }
    const std::string& source_path() const { return source_path_; }

private:
    const Json* lookup(const std::string& key) const;
    Json& lookup_or_create(const std::string& key);

    Json data_;
    std::string source_path_;
};

} // namespace convoflow

#endif // convoflow_CORE_CONFIG_HPP
