#include "Img2ImgTool.hpp"
#include "core/ArgumentBuilder.hpp"

namespace flux_mcp {

Img2ImgTool::Img2ImgTool(std::shared_ptr<FluxCommandRunner> runner)
    : runner_(std::move(runner)) {
    if (!runner_) {
        throw std::invalid_argument("Runner cannot be null");
    }
}

ToolInfo Img2ImgTool::get_info() {
    json properties = {
        {"image", {
            {"type", "string"},
            {"description", "Input image path"}
        }},
        {"prompt", {
            {"type", "string"},
            {"description", "Text prompt for generation"}
        }},
        {"name", {
            {"type", "string"},
            {"description", "Name for the generation"}
        }},
        {"model", {
            {"type", "string"},
            {"enum", FluxCommandRunner::model_choices()},
            {"default", "flux.1.1-pro"},
            {"description", "Model to use for generation"}
        }},
        {"strength", {
            {"type", "number"},
            {"default", 0.85},
            {"description", "Generation strength"}
        }},
        {"width", {
            {"type", "integer"},
            {"description", "Output image width"}
        }},
        {"height", {
            {"type", "integer"},
            {"description", "Output image height"}
        }}
    };
    FluxCommandRunner::add_output_properties(properties);

    return {
        "img2img",
        "Generate an image using another image as reference",
        {
            {"type", "object"},
            {"properties", properties},
            {"required", json::array({"image", "prompt", "name"})}
        }
    };
}

std::vector<std::string> Img2ImgTool::build_arguments(const json& args) {
    return ArgumentBuilder("img2img")
        .add_string(args, "image", "--image")
        .add_string(args, "prompt", "--prompt")
        .add_string(args, "name", "--name")
        .add_string(args, "model", "--model")
        .add_number(args, "strength", "--strength")
        .add_integer(args, "width", "--width")
        .add_integer(args, "height", "--height")
        .add_output_options(args)
        .build();
}

json Img2ImgTool::execute(const json& args) {
    return runner_->execute(build_arguments(args));
}

} // namespace flux_mcp
