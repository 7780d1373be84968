#include "ControlTool.hpp"
#include "core/ArgumentBuilder.hpp"

namespace flux_mcp {

ControlTool::ControlTool(std::shared_ptr<FluxCommandRunner> runner)
    : runner_(std::move(runner)) {
    if (!runner_) {
        throw std::invalid_argument("Runner cannot be null");
    }
}

ToolInfo ControlTool::get_info() {
    json properties = {
        {"type", {
            {"type", "string"},
            {"enum", json::array({"canny", "depth", "pose"})},
            {"description", "Type of control to use"}
        }},
        {"image", {
            {"type", "string"},
            {"description", "Input control image path"}
        }},
        {"prompt", {
            {"type", "string"},
            {"description", "Text prompt for generation"}
        }},
        {"steps", {
            {"type", "integer"},
            {"default", 50},
            {"description", "Number of inference steps"}
        }},
        {"guidance", {
            {"type", "number"},
            {"description", "Guidance scale"}
        }}
    };
    FluxCommandRunner::add_output_properties(properties);

    return {
        "control",
        "ControlNet-like image generation",
        {
            {"type", "object"},
            {"properties", properties},
            {"required", json::array({"type", "image", "prompt"})}
        }
    };
}

std::vector<std::string> ControlTool::build_arguments(const json& args) {
    return ArgumentBuilder("control")
        .add_string(args, "type", "--type")
        .add_string(args, "image", "--image")
        .add_string(args, "prompt", "--prompt")
        .add_integer(args, "steps", "--steps")
        .add_number(args, "guidance", "--guidance")
        .add_output_options(args)
        .build();
}

json ControlTool::execute(const json& args) {
    return runner_->execute(build_arguments(args));
}

} // namespace flux_mcp
