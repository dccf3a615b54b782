/*
 * notevault C++17 - Configuration Implementation
 */
#include <notevault/core/config.hpp>
#include <notevault/core/logger.hpp>
#include <notevault/core/utils.hpp>

#include <fstream>
#include <sstream>

namespace notevault {

Config::Config() : data_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream in(path.c_str());
    if (!in) {
        LOG_ERROR("Cannot open config file: %s", path.c_str());
        return false;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    return load_string(buffer.str());
}

bool Config::load_string(const std::string& text) {
    Json parsed = Json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        LOG_ERROR("Config is not valid JSON");
        return false;
    }
    if (!parsed.is_object()) {
        LOG_ERROR("Config root must be a JSON object");
        return false;
    }

    data_ = std::move(parsed);
    return true;
}

const Json* Config::find(const std::string& key) const {
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

bool Config::has(const std::string& key) const {
    return find(key) != nullptr;
}

std::string Config::get_string(const std::string& key, const std::string& default_val) const {
    const Json* v = find(key);
    if (!v || !v->is_string()) return default_val;
    return v->get<std::string>();
}

int64_t Config::get_int(const std::string& key, int64_t default_val) const {
    const Json* v = find(key);
    if (!v || !v->is_number_integer()) return default_val;
    return v->get<int64_t>();
}

bool Config::get_bool(const std::string& key, bool default_val) const {
    const Json* v = find(key);
    if (!v || !v->is_boolean()) return default_val;
    return v->get<bool>();
}

void Config::set_string(const std::string& key, const std::string& value) {
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

} // namespace notevault
