#pragma once

#include "mcp/MCPServer.hpp"
#include "tools/FluxCommandRunner.hpp"
#include <memory>
#include <string>
#include <vector>

namespace flux_mcp {

/**
 * @brief MCP tool for image inpainting
 *
 * The mask is generated by fluxcli from a shape and a position.
 */
class InpaintTool {
public:
    explicit InpaintTool(std::shared_ptr<FluxCommandRunner> runner);

    static ToolInfo get_info();

    static std::vector<std::string> build_arguments(const json& args);

    json execute(const json& args);

private:
    std::shared_ptr<FluxCommandRunner> runner_;
};

} // namespace flux_mcp
