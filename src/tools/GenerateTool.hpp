#pragma once

#include "mcp/MCPServer.hpp"
#include "tools/FluxCommandRunner.hpp"
#include <memory>
#include <string>
#include <vector>

namespace flux_mcp {

/**
 * @brief MCP tool generating an image from a text prompt
 *
 * Runs "fluxcli.py generate". Width and height are ignored by the
 * program when an aspect ratio is given.
 */
class GenerateTool {
public:
    /**
     * @brief Construct tool with runner reference
     * @param runner Shared fluxcli runner
     */
    explicit GenerateTool(std::shared_ptr<FluxCommandRunner> runner);

    /**
     * @brief Get tool metadata and JSON schema
     * @return ToolInfo with name, description, and input schema
     */
    static ToolInfo get_info();

    /**
     * @brief Map validated arguments to fluxcli argv
     * @param args Arguments with defaults applied
     * @return "generate" followed by its flags
     */
    static std::vector<std::string> build_arguments(const json& args);

    /**
     * @brief Execute tool with arguments
     * @param args JSON object with "prompt" and optional parameters
     * @return MCP tool result with one content item
     * @throws ToolError if the command fails
     */
    json execute(const json& args);

private:
    std::shared_ptr<FluxCommandRunner> runner_;
};

} // namespace flux_mcp
