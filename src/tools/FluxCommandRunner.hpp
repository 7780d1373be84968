#pragma once

#include "core/FluxConfig.hpp"
#include "core/ProcessInvoker.hpp"
#include "core/ResultClassifier.hpp"
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace flux_mcp {

using json = nlohmann::json;

/**
 * @brief Runs fluxcli sub-commands and shapes their results for MCP
 *
 * Shared by all image tools. Each call resolves the interpreter, runs
 * "<interpreter> <entry> <args...>" in the flux directory, classifies
 * the outcome and turns it into one MCP content item.
 */
class FluxCommandRunner {
public:
    /**
     * @brief Construct runner
     * @param config Flux directory, entry script and timeout
     * @param invoker Process invoker (shared so shutdown can reach live children)
     */
    FluxCommandRunner(FluxConfig config, std::shared_ptr<ProcessInvoker> invoker);

    /**
     * @brief Run a sub-command and classify its output
     *
     * @param args Sub-command name followed by its flags
     * @return Classified result
     * @throws ToolError on any failure
     */
    ToolResult invoke(const std::vector<std::string>& args);

    /**
     * @brief Run a sub-command and return an MCP tool result
     *
     * @param args Sub-command name followed by its flags
     * @return {"content": [item]} with exactly one item
     * @throws ToolError on any failure
     */
    json execute(const std::vector<std::string>& args);

    /**
     * @brief Build the interpreter invocation for a sub-command
     */
    InvocationRequest make_request(const std::vector<std::string>& args) const;

    /**
     * @brief Convert a classified result to an MCP tool result
     *
     * Saved and RemoteUrl become text items; InlineData becomes an
     * image item with mimeType "image/<format>".
     */
    static json to_response(const ToolResult& result);

    /**
     * @brief Add output, return_format and to_webp to a schema's properties
     */
    static void add_output_properties(json& properties);

    /**
     * @brief Model names accepted by generate and img2img
     */
    static json model_choices();

    const FluxConfig& config() const { return config_; }

private:
    FluxConfig config_;
    std::shared_ptr<ProcessInvoker> invoker_;
};

} // namespace flux_mcp
