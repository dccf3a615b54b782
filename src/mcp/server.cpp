/*
 * notevault C++17 - MCP stdio server implementation
 */
#include <notevault/mcp/server.hpp>
#include <notevault/core/limits.hpp>
#include <notevault/core/logger.hpp>

#include <cerrno>
#include <cstring>
#include <ostream>
#include <vector>
#include <poll.h>
#include <unistd.h>

namespace notevault {
namespace mcp {

const char* const kDefaultProtocolVersion = "2024-11-05";

namespace {

// Upper bound on how long stop() or a signal goes unnoticed while idle.
const int kPollIntervalMs = 200;
const size_t kReadChunkBytes = 64 * 1024;

// A maximal message plus the '\r' of a CRLF line ending.
const size_t kLineBufferCap = limits::kMaxMessageBytes + 1;

} // namespace

McpServer::McpServer(const std::string& name, const std::string& version)
    : name_(name)
    , version_(version)
    , running_(false) {}

void McpServer::register_provider(const ToolProvider& provider) {
    if (!provider.is_initialized()) {
        LOG_WARN("Skipping uninitialized tool provider: %s", provider.name());
        return;
    }

    std::vector<AgentTool> agent_tools = provider.get_agent_tools();
    for (size_t i = 0; i < agent_tools.size(); ++i) {
        register_tool(agent_tools[i]);
    }
}

void McpServer::register_tool(const AgentTool& tool) {
    if (tools_.find(tool.name) == tools_.end()) {
        order_.push_back(tool.name);
    }
    tools_[tool.name] = tool;
    LOG_DEBUG("Registered tool: %s", tool.name.c_str());
}

std::string McpServer::handle_message(const std::string& line) {
    if (line.size() > limits::kMaxMessageBytes) {
        LOG_WARN("Rejecting %zu byte message", line.size());
        return too_large_response();
    }

    Json request = Json::parse(line, nullptr, false);
    if (request.is_discarded()) {
        LOG_DEBUG("Unparseable message: %.80s", line.c_str());
        return dump_json(make_error(Json(), rpc_error::PARSE_ERROR, "Parse error"));
    }

    Json response = handle_request(request);
    if (response.is_null()) {
        return "";
    }
    return dump_json(response);
}

Json McpServer::handle_request(const Json& request) {
    if (!request.is_object()) {
        return make_error(Json(), rpc_error::INVALID_REQUEST, "Request must be a JSON object");
    }

    bool is_notification = !request.contains("id");
    Json id = request.value("id", Json());

    if (!request.contains("jsonrpc") || request["jsonrpc"] != "2.0") {
        if (is_notification) return Json();
        return make_error(id, rpc_error::INVALID_REQUEST, "Missing or invalid jsonrpc version");
    }
    if (!request.contains("method") || !request["method"].is_string()) {
        if (is_notification) return Json();
        return make_error(id, rpc_error::INVALID_REQUEST, "Missing or invalid method");
    }

    const std::string method = request["method"].get<std::string>();
    Json params = request.value("params", Json::object());

    if (is_notification) {
        LOG_DEBUG("Notification: %s", method.c_str());
        return Json();
    }

    if (method == "initialize") {
        return handle_initialize(params, id);
    } else if (method == "ping") {
        return make_result(id, Json::object());
    } else if (method == "tools/list") {
        return handle_tools_list(id);
    } else if (method == "tools/call") {
        return handle_tools_call(params, id);
    }

    return make_error(id, rpc_error::METHOD_NOT_FOUND, "Method not found: " + method);
}

Json McpServer::handle_initialize(const Json& params, const Json& id) {
    std::string protocol = kDefaultProtocolVersion;
    if (params.is_object() && params.contains("protocolVersion") &&
        params["protocolVersion"].is_string()) {
        protocol = params["protocolVersion"].get<std::string>();
    }

    if (params.is_object() && params.contains("clientInfo") && params["clientInfo"].is_object()) {
        LOG_INFO("Client connected: %s (protocol %s)",
                 params["clientInfo"].value("name", std::string("unknown")).c_str(),
                 protocol.c_str());
    }

    Json result = {
        {"protocolVersion", protocol},
        {"capabilities", {{"tools", Json::object()}}},
        {"serverInfo", {{"name", name_}, {"version", version_}}}
    };
    return make_result(id, result);
}

Json McpServer::handle_tools_list(const Json& id) {
    Json list = Json::array();
    for (size_t i = 0; i < order_.size(); ++i) {
        const AgentTool& tool = tools_[order_[i]];
        list.push_back({
            {"name", tool.name},
            {"description", tool.description},
            {"inputSchema", params_to_json_schema(tool.params)}
        });
    }
    return make_result(id, {{"tools", list}});
}

Json McpServer::handle_tools_call(const Json& params, const Json& id) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return make_error(id, rpc_error::INVALID_PARAMS, "Missing tool name");
    }

    const std::string name = params["name"].get<std::string>();
    std::map<std::string, AgentTool>::const_iterator it = tools_.find(name);
    if (it == tools_.end() || !it->second.execute) {
        return make_error(id, rpc_error::INVALID_PARAMS, "Unknown tool: " + name);
    }

    Json arguments = params.value("arguments", Json::object());
    if (arguments.is_null()) {
        arguments = Json::object();
    }
    if (!arguments.is_object()) {
        return make_error(id, rpc_error::INVALID_PARAMS, "Tool arguments must be an object");
    }

    LOG_DEBUG("Calling tool %s", name.c_str());

    AgentToolResult result;
    try {
        result = it->second.execute(arguments);
    } catch (const std::exception& e) {
        LOG_ERROR("Tool %s threw: %s", name.c_str(), e.what());
        result = AgentToolResult::fail("Tool execution failed.");
    }

    std::string text = result.success ? result.output : "Error: " + result.error;
    Json content = Json::array();
    content.push_back({{"type", "text"}, {"text", text}});

    return make_result(id, {{"content", content}, {"isError", !result.success}});
}

void McpServer::serve(int in_fd, std::ostream& out) {
    running_ = true;
    std::string line;
    bool oversize = false;
    std::vector<char> chunk(kReadChunkBytes);

    while (running_.load()) {
        struct pollfd pfd;
        pfd.fd = in_fd;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = poll(&pfd, 1, kPollIntervalMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("poll on input failed: %s", strerror(errno));
            break;
        }
        if (ready == 0) continue;

        ssize_t n = read(in_fd, chunk.data(), chunk.size());
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            LOG_ERROR("read on input failed: %s", strerror(errno));
            break;
        }
        if (n == 0) {
            // EOF: an unterminated last line still counts
            if (oversize || !line.empty()) {
                dispatch_line(line, oversize, out);
            }
            LOG_DEBUG("Input closed");
            break;
        }

        const char* begin = chunk.data();
        const char* end = begin + n;
        while (begin < end) {
            const char* nl = static_cast<const char*>(
                memchr(begin, '\n', static_cast<size_t>(end - begin)));
            size_t len = static_cast<size_t>((nl ? nl : end) - begin);

            if (!oversize) {
                if (line.size() + len > kLineBufferCap) {
                    // Drop what we have and skip ahead to the next newline
                    oversize = true;
                    std::string().swap(line);
                } else {
                    line.append(begin, len);
                }
            }

            if (!nl) break;
            dispatch_line(line, oversize, out);
            begin = nl + 1;
        }
    }

    running_ = false;
    LOG_DEBUG("Leaving serve loop");
}

void McpServer::dispatch_line(std::string& line, bool& oversize, std::ostream& out) {
    std::string response;
    if (oversize) {
        LOG_WARN("Discarded an input line over %zu bytes", limits::kMaxMessageBytes);
        response = too_large_response();
    } else {
        if (!line.empty() && line[line.size() - 1] == '\r') {
            line.erase(line.size() - 1);
        }
        if (!line.empty()) {
            response = handle_message(line);
        }
    }
    line.clear();
    oversize = false;

    if (response.empty()) return;
    out << response << "\n";
    out.flush();
    if (!out) {
        LOG_ERROR("Output stream failed, stopping");
        running_ = false;
    }
}

std::string McpServer::too_large_response() {
    return dump_json(make_error(Json(), rpc_error::INVALID_REQUEST, "Message too large"));
}

Json McpServer::make_result(const Json& id, const Json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

Json McpServer::make_error(const Json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

} // namespace mcp
} // namespace notevault
