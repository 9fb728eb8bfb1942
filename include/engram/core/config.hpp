#ifndef ENGRAM_CORE_CONFIG_HPP
#define ENGRAM_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <cstdint>

namespace engram {

class Config {
public:
    Config();

    // Load from JSON file
    bool load_file(const std::string& path);

    // Load from JSON string
    bool load_string(const std::string& json_str);

    // Keys use dot notation for nesting ("memory.search.threshold").
    // A missing string key falls back to $ENGRAM_MEMORY_SEARCH_THRESHOLD style
    // environment variables.
    std::string get_string(const std::string& key, const std::string& def = "") const;

    int64_t get_int(const std::string& key, int64_t def = 0) const;

    double get_double(const std::string& key, double def = 0.0) const;

    bool get_bool(const std::string& key, bool def = false) const;

    // Get nested object (null value when absent)
    const Json& get_section(const std::string& key) const;

    const Json& data() const;

    // Reason for the last failed load
    const std::string& last_error() const { return last_error_; }

    static std::string to_env_key(const std::string& key);

private:
    Json data_;
    std::string last_error_;

    const Json& lookup(const std::string& key) const;
};

} // namespace engram

#endif // ENGRAM_CORE_CONFIG_HPP
