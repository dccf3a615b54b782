/*
 * notevault C++17 - Tool Provider Implementation
 */
#include <notevault/core/tool.hpp>

namespace notevault {

Json params_to_json_schema(const std::vector<ToolParamSchema>& params) {
    Json schema = Json::object();
    schema["type"] = "object";

    Json properties = Json::object();
    Json required = Json::array();
    for (size_t i = 0; i < params.size(); ++i) {
        const ToolParamSchema& p = params[i];

        Json prop = Json::object();
        prop["type"] = p.type;
        if (!p.description.empty()) {
            prop["description"] = p.description;
        }
        if (p.type == "array" && !p.item_type.empty()) {
            prop["items"] = Json{{"type", p.item_type}};
        }
        properties[p.name] = prop;

        if (p.required) {
            required.push_back(p.name);
        }
    }

    schema["properties"] = properties;
    if (!required.empty()) {
        schema["required"] = required;
    }
    return schema;
}

} // namespace notevault
