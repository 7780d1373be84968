#include "MCPServer.hpp"
#include "ArgumentValidator.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <system_error>

namespace flux_mcp {

namespace {
    constexpr int kParseError = -32700;
    constexpr int kInvalidRequest = -32600;
    constexpr int kMethodNotFound = -32601;
    constexpr int kInvalidParams = -32602;
    constexpr int kInternalError = -32603;

    bool is_tool_call(const json& request) {
        return request.is_object()
            && request.contains("id")
            && request.value("method", json()) == "tools/call";
    }
}

MCPServer::MCPServer(std::unique_ptr<ITransport> transport, ServerInfo info)
    : transport_(std::move(transport)), info_(std::move(info)) {
    if (!transport_) {
        throw std::invalid_argument("Transport cannot be null");
    }
    spdlog::info("MCPServer initialized");
}

MCPServer::~MCPServer() {
    wait_for_workers();
}

void MCPServer::register_tool(const ToolInfo& info, ToolHandler handler) {
    if (info.name.empty()) {
        throw std::invalid_argument("Tool name cannot be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Tool handler cannot be null");
    }

    tools_[info.name] = info;
    handlers_[info.name] = std::move(handler);
    spdlog::info("Registered tool: {}", info.name);
}

void MCPServer::set_shutdown_hook(std::function<void()> hook) {
    shutdown_hook_ = std::move(hook);
}

void MCPServer::run() {
    running_ = true;
    spdlog::info("MCPServer starting main loop");

    while (running_ && transport_->is_open()) {
        try {
            json request = transport_->read_message();

            // Empty message indicates EOF or closed transport
            if (request.empty() || request.is_null()) {
                spdlog::info("Received empty message, stopping server");
                break;
            }

            if (!running_) {
                break;
            }

            process_message(std::move(request));

        } catch (const json::parse_error& e) {
            spdlog::error("Invalid JSON received: {}", e.what());
            send(create_error_response(json(), kParseError, std::string("Parse error: ") + e.what()));
        } catch (const std::exception& e) {
            spdlog::error("Error in main loop: {}", e.what());
            try {
                send(create_error_response(json(), kInternalError,
                    std::string("Internal error: ") + e.what()));
            } catch (const std::exception& send_error) {
                spdlog::error("Failed to send error response: {}", send_error.what());
            }
        }
    }

    running_ = false;
    wait_for_workers();
    spdlog::info("MCPServer stopped");
}

void MCPServer::stop() {
    spdlog::info("MCPServer stop requested");
    running_ = false;
}

void MCPServer::shutdown() {
    if (shutting_down_.exchange(true)) {
        return;
    }
    {
        // Once cleared, no worker can be added behind wait_for_workers()
        std::lock_guard<std::mutex> lock(workers_mutex_);
        accepting_calls_ = false;
    }
    stop();
    if (shutdown_hook_) {
        shutdown_hook_();
    }
    wait_for_workers();
    transport_->close();
}

void MCPServer::process_message(json request) {
    if (is_tool_call(request)) {
        dispatch_async(std::move(request));
        return;
    }

    json response = handle_request(request);

    // Only send response if it's not empty (notifications return empty)
    if (!response.empty() && !response.is_null()) {
        send(response);
    }
}

std::size_t MCPServer::in_flight() const {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    std::size_t count = 0;
    for (const auto& worker : workers_) {
        if (worker.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            ++count;
        }
    }
    return count;
}

json MCPServer::handle_request(const json& request) {
    // Validate JSON-RPC 2.0 format
    if (!request.is_object() || !request.contains("jsonrpc") || request["jsonrpc"] != "2.0") {
        json id = request.is_object() ? request.value("id", json()) : json();
        return create_error_response(id, kInvalidRequest, "Invalid Request: missing or invalid jsonrpc field");
    }

    const bool is_notification = !request.contains("id");
    json id = request.value("id", json());

    if (!request.contains("method") || !request["method"].is_string()) {
        return create_error_response(id, kInvalidRequest, "Invalid Request: missing method field");
    }

    std::string method = request["method"];
    json params = request.value("params", json::object());

    spdlog::debug("Handling request: method={}, id={}", method, id.dump());

    try {
        if (method == "initialize") {
            json result = handle_initialize(params);
            initialized_ = true;
            return {
                {"jsonrpc", "2.0"},
                {"id", id},
                {"result", result}
            };
        } else if (method == "notifications/initialized") {
            spdlog::info("Client sent initialized notification, server is ready");
            return json();
        } else if (is_notification) {
            // Other notifications (cancelled, progress, ...) need no answer
            spdlog::debug("Ignoring notification: {}", method);
            return json();
        } else if (method == "ping") {
            return {
                {"jsonrpc", "2.0"},
                {"id", id},
                {"result", json::object()}
            };
        } else if (method == "tools/list") {
            json result = handle_tools_list();
            return {
                {"jsonrpc", "2.0"},
                {"id", id},
                {"result", result}
            };
        } else if (method == "tools/call") {
            json result = handle_tools_call(params);
            return {
                {"jsonrpc", "2.0"},
                {"id", id},
                {"result", result}
            };
        } else {
            return create_error_response(id, kMethodNotFound, "Method not found: " + method);
        }
    } catch (const std::invalid_argument& e) {
        spdlog::warn("Invalid params for method {}: {}", method, e.what());
        return create_error_response(id, kInvalidParams, std::string("Invalid params: ") + e.what());
    } catch (const std::exception& e) {
        spdlog::error("Error handling method {}: {}", method, e.what());
        return create_error_response(id, kInternalError, std::string("Internal error: ") + e.what());
    }
}

json MCPServer::handle_tools_list() {
    json tools_array = json::array();

    for (const auto& [name, info] : tools_) {
        tools_array.push_back({
            {"name", info.name},
            {"description", info.description},
            {"inputSchema", info.input_schema}
        });
    }

    spdlog::debug("Returning {} tools", tools_array.size());
    return {{"tools", tools_array}};
}

json MCPServer::handle_tools_call(const json& params) {
    if (!params.contains("name") || !params["name"].is_string()) {
        throw std::invalid_argument("Missing required parameter: name");
    }

    std::string tool_name = params["name"];

    auto handler_it = handlers_.find(tool_name);
    if (handler_it == handlers_.end()) {
        throw std::invalid_argument("Unknown tool: " + tool_name);
    }

    json arguments = ArgumentValidator::apply(
        tools_.at(tool_name).input_schema,
        params.value("arguments", json::object()));

    spdlog::debug("Calling tool: {} with args: {}", tool_name, arguments.dump());

    try {
        json result = handler_it->second(arguments);

        // Plain JSON results are wrapped as a single text item
        if (!result.is_object() || !result.contains("content")) {
            return {
                {"content", json::array({
                    {
                        {"type", "text"},
                        {"text", result.dump(-1, ' ', false, json::error_handler_t::replace)}
                    }
                })}
            };
        }
        return result;

    } catch (const ToolError& e) {
        spdlog::error("Tool {} failed ({}): {}", tool_name, to_string(e.kind()), e.what());
        return {
            {"content", json::array({
                {
                    {"type", "text"},
                    {"text", std::string(to_string(e.kind())) + ": " + e.what()}
                }
            })},
            {"isError", true}
        };
    }
}

json MCPServer::handle_initialize(const json& params) {
    spdlog::info("Handling initialize request");

    // Extract client info if provided
    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        std::string client_name = params["clientInfo"].value("name", "unknown");
        std::string client_version = params["clientInfo"].value("version", "unknown");
        spdlog::info("Client: {} version {}", client_name, client_version);
    }

    return {
        {"protocolVersion", "2024-11-05"},
        {"capabilities", {
            {"tools", json::object()}
        }},
        {"serverInfo", {
            {"name", info_.name},
            {"version", info_.version}
        }}
    };
}

void MCPServer::dispatch_async(json request) {
    reap_workers();

    json id = request.value("id", json());
    std::string refusal;
    try {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        if (!accepting_calls_) {
            refusal = "Internal error: server is shutting down";
        } else {
            workers_.push_back(std::async(std::launch::async, [this, request = std::move(request)]() {
                json request_id = request.value("id", json());
                json response = handle_request(request);
                try {
                    send(response);
                } catch (const std::exception& e) {
                    spdlog::error("Failed to send tool response: {}", e.what());
                    try {
                        send(create_error_response(request_id, kInternalError,
                            std::string("Internal error: ") + e.what()));
                    } catch (const std::exception& fallback_error) {
                        spdlog::error("Failed to send error response: {}", fallback_error.what());
                    }
                }
            }));
        }
    } catch (const std::system_error& e) {
        spdlog::error("Cannot start worker thread: {}", e.what());
        refusal = std::string("Internal error: ") + e.what();
    }

    if (!refusal.empty()) {
        spdlog::warn("Rejected tools/call {}: {}", id.dump(), refusal);
        send(create_error_response(id, kInternalError, refusal));
    }
}

void MCPServer::reap_workers() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    auto finished = [](const std::future<void>& worker) {
        return worker.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    };
    workers_.erase(std::remove_if(workers_.begin(), workers_.end(), finished), workers_.end());
}

void MCPServer::wait_for_workers() {
    std::vector<std::future<void>> pending;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        pending.swap(workers_);
    }
    if (!pending.empty()) {
        spdlog::debug("Waiting for {} tool call(s) to finish", pending.size());
    }
    for (auto& worker : pending) {
        worker.wait();
    }
}

void MCPServer::send(const json& message) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    transport_->write_message(message);
}

json MCPServer::create_error_response(const json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

} // namespace flux_mcp
