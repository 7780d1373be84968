#pragma once

#include <nlohmann/json.hpp>

namespace flux_mcp {

using json = nlohmann::json;

/**
 * @brief Abstract interface for MCP transport mechanisms
 *
 * Implementations handle reading/writing JSON-RPC messages. Callers
 * serialize write_message(); read_message() is only called from the
 * server loop.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Read next JSON-RPC message from transport
     * @return JSON message or empty object on EOF/error
     * @throws json::parse_error if a message is not valid JSON
     */
    virtual json read_message() = 0;

    /**
     * @brief Write JSON-RPC message to transport
     * @param message JSON message to write
     */
    virtual void write_message(const json& message) = 0;

    /**
     * @brief Check if transport is still open
     * @return true if transport can read/write, false otherwise
     */
    virtual bool is_open() const = 0;

    /**
     * @brief Flush pending output and stop accepting messages
     */
    virtual void close() = 0;
};

} // namespace flux_mcp
