#pragma once

#include "mcp/MCPServer.hpp"
#include "tools/FluxCommandRunner.hpp"
#include <memory>
#include <string>
#include <vector>

namespace flux_mcp {

/**
 * @brief MCP tool generating an image using another image as reference
 */
class Img2ImgTool {
public:
    explicit Img2ImgTool(std::shared_ptr<FluxCommandRunner> runner);

    static ToolInfo get_info();

    /**
     * @brief Map validated arguments to fluxcli argv
     * @return "img2img" followed by its flags
     */
    static std::vector<std::string> build_arguments(const json& args);

    json execute(const json& args);

private:
    std::shared_ptr<FluxCommandRunner> runner_;
};

} // namespace flux_mcp
