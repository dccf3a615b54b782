/*
 * notevault C++17 - MCP stdio server
 *
 * Newline-delimited JSON-RPC 2.0. One request per input line, one
 * response per output line, nothing for notifications.
 *
 * Supported methods:
 *   initialize, notifications/initialized, ping, tools/list, tools/call
 */
#ifndef notevault_MCP_SERVER_HPP
#define notevault_MCP_SERVER_HPP

#include <notevault/core/json.hpp>
#include <notevault/core/tool.hpp>

#include <atomic>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

namespace notevault {
namespace mcp {

namespace rpc_error {
    const int PARSE_ERROR = -32700;
    const int INVALID_REQUEST = -32600;
    const int METHOD_NOT_FOUND = -32601;
    const int INVALID_PARAMS = -32602;
}

extern const char* const kDefaultProtocolVersion;

class McpServer {
public:
    McpServer(const std::string& name, const std::string& version);

    // Adds every AgentTool of an initialized provider. A later tool with
    // the same name replaces the earlier one.
    void register_provider(const ToolProvider& provider);
    void register_tool(const AgentTool& tool);

    size_t tool_count() const { return tools_.size(); }

    // Handle one raw input line. Returns the serialized response, or an
    // empty string when nothing must be written back.
    std::string handle_message(const std::string& line);

    // Handle one parsed message. Returns null for notifications.
    Json handle_request(const Json& request);

    // Read lines from `in_fd` until EOF or stop(), writing responses to
    // `out`. The descriptor is polled with a short timeout, so stop() from
    // another thread or a signal handler ends the loop even while no input
    // arrives. Lines over the message cap are discarded as they stream in
    // and answered with an error.
    void serve(int in_fd, std::ostream& out);

    void stop() { running_ = false; }
    bool is_running() const { return running_.load(); }

private:
    McpServer(const McpServer&);
    McpServer& operator=(const McpServer&);

    Json handle_initialize(const Json& params, const Json& id);
    Json handle_tools_list(const Json& id);
    Json handle_tools_call(const Json& params, const Json& id);

    void dispatch_line(std::string& line, bool& oversize, std::ostream& out);

    static std::string too_large_response();
    static Json make_result(const Json& id, const Json& result);
    static Json make_error(const Json& id, int code, const std::string& message);

    std::string name_;
    std::string version_;
    std::atomic<bool> running_;

    std::vector<std::string> order_;            // tools/list order
    std::map<std::string, AgentTool> tools_;
};

} // namespace mcp
} // namespace notevault

#endif // notevault_MCP_SERVER_HPP
