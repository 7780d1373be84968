#pragma once

#include "ITransport.hpp"
#include <atomic>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace flux_mcp {

using json = nlohmann::json;

/**
 * @brief Metadata for an MCP tool
 */
struct ToolInfo {
    std::string name;
    std::string description;
    json input_schema;  // JSON Schema for tool arguments
};

/**
 * @brief Name and version reported in the initialize handshake
 */
struct ServerInfo {
    std::string name = "flux-server";
    std::string version = "0.1.0";
};

/**
 * @brief Function signature for tool execution
 * @param args JSON object with validated tool arguments (defaults applied)
 * @return MCP tool result: {"content": [...]}
 * @throws ToolError to report a failed invocation to the caller
 */
using ToolHandler = std::function<json(const json& args)>;

/**
 * @brief MCP Server implementing JSON-RPC 2.0 protocol
 *
 * Handles tool registration and request routing.
 * Supports methods: initialize, ping, tools/list, tools/call
 *
 * Every tools/call runs on its own worker thread so that a slow tool
 * never delays other requests. Responses are written under a mutex and
 * may arrive in any order.
 */
class MCPServer {
public:
    /**
     * @brief Construct MCP server with transport
     * @param transport Unique pointer to transport implementation
     * @param info Name and version announced to clients
     */
    explicit MCPServer(std::unique_ptr<ITransport> transport, ServerInfo info = {});

    ~MCPServer();

    /**
     * @brief Register a tool with handler
     * @param info Tool metadata with JSON schema
     * @param handler Function to execute when tool is called
     */
    void register_tool(const ToolInfo& info, ToolHandler handler);

    /**
     * @brief Set a callback run once when shutdown() begins
     *
     * Used to cancel work that in-flight tool calls are waiting on.
     */
    void set_shutdown_hook(std::function<void()> hook);

    /**
     * @brief Start server main loop
     *
     * Blocks until stop() is called or transport closes.
     * Waits for in-flight tool calls before returning.
     */
    void run();

    /**
     * @brief Signal server to stop gracefully
     */
    void stop();

    /**
     * @brief Stop the loop, run the shutdown hook, wait for in-flight
     * tool calls and close the transport
     *
     * Safe to call from another thread while run() is blocked.
     */
    void shutdown();

    /**
     * @brief Route one decoded message
     *
     * tools/call requests go to a worker thread; everything else is
     * answered inline. After shutdown() has begun, tools/call requests
     * are refused with an internal error instead of being started.
     */
    void process_message(json request);

    /**
     * @brief Number of tool calls still running
     */
    std::size_t in_flight() const;

private:
    /**
     * @brief Handle incoming JSON-RPC request
     * @param request JSON-RPC request message
     * @return JSON-RPC response message, or null for notifications
     */
    json handle_request(const json& request);

    /**
     * @brief Handle tools/list method
     * @return JSON array of available tools with schemas
     */
    json handle_tools_list();

    /**
     * @brief Handle tools/call method
     * @param params Request parameters with tool name and arguments
     * @return Tool result, with isError set if the tool failed
     */
    json handle_tools_call(const json& params);

    /**
     * @brief Handle initialize method (MCP handshake)
     * @param params Client capabilities and info
     * @return Server capabilities and info
     */
    json handle_initialize(const json& params);

    /**
     * @brief Run a tools/call request on a worker thread
     */
    void dispatch_async(json request);

    /**
     * @brief Drop futures of finished workers
     */
    void reap_workers();

    /**
     * @brief Block until all worker threads have finished
     */
    void wait_for_workers();

    /**
     * @brief Write a response under the write lock
     */
    void send(const json& message);

    /**
     * @brief Create JSON-RPC error response
     * @param id Request ID (or null)
     * @param code Error code
     * @param message Error message
     * @return JSON-RPC error response
     */
    static json create_error_response(const json& id, int code, const std::string& message);

    std::unique_ptr<ITransport> transport_;
    ServerInfo info_;
    std::map<std::string, ToolInfo> tools_;
    std::map<std::string, ToolHandler> handlers_;
    std::function<void()> shutdown_hook_;

    std::mutex write_mutex_;
    mutable std::mutex workers_mutex_;
    std::vector<std::future<void>> workers_;
    bool accepting_calls_ = true;  // Guarded by workers_mutex_

    std::atomic<bool> running_{false};
    std::atomic<bool> shutting_down_{false};
    std::atomic<bool> initialized_{false};
};

} // namespace flux_mcp
