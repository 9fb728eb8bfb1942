#include <engram/core/config.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>
#include <fstream>
#include <iterator>
#include <cstdlib>

namespace engram {

Config::Config() : data_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream f(path.c_str());
    if (!f.is_open()) {
        last_error_ = "cannot open " + path;
        return false;
    }

    std::string content((std::istreambuf_iterator<char>(f)),
                        std::istreambuf_iterator<char>());
    if (!load_string(content)) {
        last_error_ = path + ": " + last_error_;
        return false;
    }
    LOG_DEBUG("Config: loaded %s", path.c_str());
    return true;
}

bool Config::load_string(const std::string& json_str) {
    try {
        Json parsed = Json::parse(json_str);
        if (!parsed.is_object()) {
            last_error_ = "top-level value must be an object";
            return false;
        }
        data_ = parsed;
        last_error_.clear();
        return true;
    } catch (const std::exception& e) {
        last_error_ = e.what();
        return false;
    }
}

const Json& Config::lookup(const std::string& key) const {
    static const Json null_json;
    const Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->has(parts[i])) {
            return null_json;
        }
        node = &(*node)[parts[i]];
    }
    return *node;
}

std::string Config::get_string(const std::string& key, const std::string& def) const {
    const Json& v = lookup(key);
    if (v.is_string()) {
        LOG_DEBUG("Config: found key '%s'", key.c_str());
        return v.as_string();
    }

    const char* env = std::getenv(to_env_key(key).c_str());
    if (env && env[0]) {
        LOG_DEBUG("Config: key '%s' taken from environment", key.c_str());
        return std::string(env);
    }

    LOG_DEBUG("Config: key '%s' not found", key.c_str());
    return def;
}

int64_t Config::get_int(const std::string& key, int64_t def) const {
    const Json& v = lookup(key);
    if (v.is_number()) {
        return v.as_int();
    }
    return def;
}

double Config::get_double(const std::string& key, double def) const {
    const Json& v = lookup(key);
    if (v.is_number()) {
        return v.as_number();
    }
    return def;
}

bool Config::get_bool(const std::string& key, bool def) const {
    const Json& v = lookup(key);
    if (v.is_bool()) {
        return v.as_bool();
    }
    return def;
}

const Json& Config::get_section(const std::string& key) const {
    return lookup(key);
}

const Json& Config::data() const { return data_; }

std::string Config::to_env_key(const std::string& key) {
    std::string env = "ENGRAM_";
    for (size_t i = 0; i < key.size(); ++i) {
        char c = key[i];
        if (c == '.' || c == '-') {
            env += '_';
        } else {
            env += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    return env;
}

} // namespace engram
