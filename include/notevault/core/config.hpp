/*
 * notevault C++17 - Configuration
 *
 * JSON-backed key/value configuration. Keys are dotted paths into the
 * document ("server.name" reads {"server": {"name": ...}}). Getters never
 * throw: a missing key or a value of the wrong type yields the default.
 */
#ifndef notevault_CORE_CONFIG_HPP
#define notevault_CORE_CONFIG_HPP

#include <notevault/core/json.hpp>

#include <cstdint>
#include <string>

namespace notevault {

class Config {
public:
    Config();

    // Replace the current document. Both return false (and keep the old
    // document) when the input cannot be read or is not a JSON object.
    bool load_file(const std::string& path);
    bool load_string(const std::string& text);

    std::string get_string(const std::string& key, const std::string& default_val = "") const;
    int64_t get_int(const std::string& key, int64_t default_val = 0) const;
    bool get_bool(const std::string& key, bool default_val = false) const;

    bool has(const std::string& key) const;

    // Creates intermediate objects as needed.
    void set_string(const std::string& key, const std::string& value);

    const Json& data() const { return data_; }

private:
    const Json* find(const std::string& key) const;

    Json data_;
};

} // namespace notevault

#endif // notevault_CORE_CONFIG_HPP
