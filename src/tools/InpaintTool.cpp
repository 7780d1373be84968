#include "InpaintTool.hpp"
#include "core/ArgumentBuilder.hpp"

namespace flux_mcp {

InpaintTool::InpaintTool(std::shared_ptr<FluxCommandRunner> runner)
    : runner_(std::move(runner)) {
    if (!runner_) {
        throw std::invalid_argument("Runner cannot be null");
    }
}

ToolInfo InpaintTool::get_info() {
    json properties = {
        {"image", {
            {"type", "string"},
            {"description", "Input image path"}
        }},
        {"prompt", {
            {"type", "string"},
            {"description", "Text prompt for inpainting"}
        }},
        {"mask_shape", {
            {"type", "string"},
            {"enum", json::array({"circle", "rectangle"})},
            {"default", "circle"},
            {"description", "Shape of the mask"}
        }},
        {"position", {
            {"type", "string"},
            {"enum", json::array({"center", "ground"})},
            {"default", "center"},
            {"description", "Position of the mask"}
        }}
    };
    FluxCommandRunner::add_output_properties(properties);

    return {
        "inpaint",
        "Image inpainting",
        {
            {"type", "object"},
            {"properties", properties},
            {"required", json::array({"image", "prompt"})}
        }
    };
}

std::vector<std::string> InpaintTool::build_arguments(const json& args) {
    return ArgumentBuilder("inpaint")
        .add_string(args, "image", "--image")
        .add_string(args, "prompt", "--prompt")
        .add_string(args, "mask_shape", "--mask-shape")
        .add_string(args, "position", "--position")
        .add_output_options(args)
        .build();
}

json InpaintTool::execute(const json& args) {
    return runner_->execute(build_arguments(args));
}

} // namespace flux_mcp
