#include "GenerateTool.hpp"
#include "core/ArgumentBuilder.hpp"

namespace flux_mcp {

GenerateTool::GenerateTool(std::shared_ptr<FluxCommandRunner> runner)
    : runner_(std::move(runner)) {
    if (!runner_) {
        throw std::invalid_argument("Runner cannot be null");
    }
}

ToolInfo GenerateTool::get_info() {
    json properties = {
        {"prompt", {
            {"type", "string"},
            {"description", "Text prompt for image generation"}
        }},
        {"model", {
            {"type", "string"},
            {"enum", FluxCommandRunner::model_choices()},
            {"default", "flux.1.1-pro"},
            {"description", "Model to use for generation"}
        }},
        {"aspect_ratio", {
            {"type", "string"},
            {"enum", json::array({"1:1", "4:3", "3:4", "16:9", "9:16"})},
            {"description", "Aspect ratio of the output image"}
        }},
        {"width", {
            {"type", "integer"},
            {"description", "Image width (ignored if aspect-ratio is set)"}
        }},
        {"height", {
            {"type", "integer"},
            {"description", "Image height (ignored if aspect-ratio is set)"}
        }}
    };
    FluxCommandRunner::add_output_properties(properties);

    return {
        "generate",
        "Generate an image from a text prompt",
        {
            {"type", "object"},
            {"properties", properties},
            {"required", json::array({"prompt"})}
        }
    };
}

std::vector<std::string> GenerateTool::build_arguments(const json& args) {
    return ArgumentBuilder("generate")
        .add_string(args, "prompt", "--prompt")
        .add_string(args, "model", "--model")
        .add_string(args, "aspect_ratio", "--aspect-ratio")
        .add_integer(args, "width", "--width")
        .add_integer(args, "height", "--height")
        .add_output_options(args)
        .build();
}

json GenerateTool::execute(const json& args) {
    return runner_->execute(build_arguments(args));
}

} // namespace flux_mcp
