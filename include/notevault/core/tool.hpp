/*
 * notevault C++17 - Tool definitions
 *
 * A ToolProvider groups related actions and exposes each one as an
 * AgentTool: a name, a parameter schema and an executor. The MCP server
 * lists and calls tools only through this interface.
 */
#ifndef notevault_CORE_TOOL_HPP
#define notevault_CORE_TOOL_HPP

#include <notevault/core/json.hpp>

#include <functional>
#include <string>
#include <vector>

namespace notevault {

class Config;

// ============================================================================
// Tool Definition
// ============================================================================

// Schema for a tool parameter
struct ToolParamSchema {
    std::string name;
    std::string type;       // "string", "number", "boolean", "array", "object"
    std::string description;
    bool required;
    std::string item_type;  // element type when type == "array"

    ToolParamSchema() : required(false) {}
    ToolParamSchema(const std::string& n, const std::string& t, const std::string& d, bool r = false)
        : name(n), type(t), description(d), required(r) {}
    ToolParamSchema(const std::string& n, const std::string& t, const std::string& d, bool r,
                    const std::string& item)
        : name(n), type(t), description(d), required(r), item_type(item) {}
};

// Tool execution result
struct AgentToolResult {
    bool success;
    std::string output;     // Text shown to the caller
    std::string error;      // Error message if failed

    AgentToolResult() : success(false) {}

    static AgentToolResult ok(const std::string& output) {
        AgentToolResult r;
        r.success = true;
        r.output = output;
        return r;
    }

    static AgentToolResult fail(const std::string& err) {
        AgentToolResult r;
        r.success = false;
        r.error = err;
        return r;
    }
};

// Tool execution function type
typedef std::function<AgentToolResult(const Json& params)> ToolExecutor;

// Tool definition
struct AgentTool {
    std::string name;
    std::string description;
    std::vector<ToolParamSchema> params;
    ToolExecutor execute;

    AgentTool() {}
    AgentTool(const std::string& n, const std::string& d, ToolExecutor e)
        : name(n), description(d), execute(e) {}
};

// Render the parameter list as a JSON Schema object
// ({"type": "object", "properties": {...}, "required": [...]}).
Json params_to_json_schema(const std::vector<ToolParamSchema>& params);

// ============================================================================
// Tool Provider
// ============================================================================

class ToolProvider {
public:
    ToolProvider() : initialized_(false) {}
    virtual ~ToolProvider() {}

    virtual const char* name() const = 0;
    virtual const char* description() const = 0;
    virtual const char* version() const = 0;

    virtual bool init(const Config& cfg) = 0;
    virtual void shutdown() = 0;
    bool is_initialized() const { return initialized_; }

    // Run one action by tool name. Unknown names fail without throwing.
    virtual AgentToolResult execute(const std::string& action, const Json& params) = 0;

    // Describe every action as an AgentTool whose executor dispatches
    // through execute().
    virtual std::vector<AgentTool> get_agent_tools() const = 0;

protected:
    bool initialized_;

private:
    ToolProvider(const ToolProvider&);
    ToolProvider& operator=(const ToolProvider&);
};

} // namespace notevault

#endif // notevault_CORE_TOOL_HPP
