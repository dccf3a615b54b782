/*
 * notevault C++17 - JSON type
 *
 * Tool parameters, configuration and the JSON-RPC stream all use
 * nlohmann::json under this alias.
 */
#ifndef notevault_CORE_JSON_HPP
#define notevault_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace notevault {

typedef nlohmann::json Json;

// Serialize for the wire. File contents are not guaranteed to be valid
// UTF-8, so invalid sequences are replaced instead of throwing.
inline std::string dump_json(const Json& value) {
    return value.dump(-1, ' ', false, Json::error_handler_t::replace);
}

} // namespace notevault

#endif // notevault_CORE_JSON_HPP
