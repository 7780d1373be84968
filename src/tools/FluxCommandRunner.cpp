#include "FluxCommandRunner.hpp"
#include "core/ArgumentBuilder.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace flux_mcp {

namespace {

// Overloaded visitor for std::visit
template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

json text_item(const std::string& text) {
    return {{"type", "text"}, {"text", text}};
}

} // namespace

FluxCommandRunner::FluxCommandRunner(FluxConfig config, std::shared_ptr<ProcessInvoker> invoker)
    : config_(std::move(config)), invoker_(std::move(invoker)) {
    if (!invoker_) {
        throw std::invalid_argument("Process invoker cannot be null");
    }
}

InvocationRequest FluxCommandRunner::make_request(const std::vector<std::string>& args) const {
    InvocationRequest request;
    request.program = resolve_interpreter();
    request.args.reserve(args.size() + 1);
    request.args.push_back(config_.entry_script);
    request.args.insert(request.args.end(), args.begin(), args.end());
    request.working_directory = config_.flux_path;
    request.timeout = config_.timeout;
    return request;
}

ToolResult FluxCommandRunner::invoke(const std::vector<std::string>& args) {
    InvocationRequest request = make_request(args);
    spdlog::debug("Running {} {} {}", request.program, config_.entry_script, args.empty() ? "" : args.front());

    InvocationOutcome outcome = invoker_->run(request);
    return ResultClassifier::classify(outcome);
}

json FluxCommandRunner::execute(const std::vector<std::string>& args) {
    return to_response(invoke(args));
}

json FluxCommandRunner::to_response(const ToolResult& result) {
    json item = std::visit(Overloaded{
        [](const SavedResult& saved) {
            return text_item("Image saved to: " + saved.path);
        },
        [](const InlineDataResult& inline_data) {
            return json{
                {"type", "image"},
                {"mimeType", "image/" + inline_data.format},
                {"data", inline_data.data}
            };
        },
        [](const RemoteUrlResult& remote) {
            return text_item("Image URL: " + remote.url);
        }
    }, result);

    return {{"content", json::array({item})}};
}

void FluxCommandRunner::add_output_properties(json& properties) {
    properties[output_params::kOutput] = {
        {"type", "string"},
        {"description", "Absolute path to save the generated image file. Takes precedence over return_format."}
    };
    properties[output_params::kReturnFormat] = {
        {"type", "string"},
        {"enum", json::array({output_params::kFormatBase64, output_params::kFormatUrl})},
        {"default", output_params::kFormatBase64},
        {"description", "Return the image inline as base64 data or as a URL"}
    };
    properties[output_params::kToWebp] = {
        {"type", "boolean"},
        {"default", false},
        {"description", "Convert the final image to WebP format"}
    };
}

json FluxCommandRunner::model_choices() {
    return json::array({"flux.1.1-pro", "flux.1-pro", "flux.1-dev", "flux.1.1-ultra"});
}

} // namespace flux_mcp
