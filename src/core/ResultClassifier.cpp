#include "ResultClassifier.hpp"
#include "Errors.hpp"
#include <spdlog/spdlog.h>

namespace flux_mcp {

namespace {

constexpr std::size_t kStdoutExcerpt = 200;

bool has_string(const json& document, const char* key) {
    auto it = document.find(key);
    return it != document.end() && it->is_string();
}

bool has_status(const json& document, const char* status) {
    return has_string(document, "status") && document["status"] == status;
}

} // namespace

bool operator==(const SavedResult& a, const SavedResult& b) {
    return a.path == b.path;
}

bool operator==(const InlineDataResult& a, const InlineDataResult& b) {
    return a.format == b.format && a.data == b.data;
}

bool operator==(const RemoteUrlResult& a, const RemoteUrlResult& b) {
    return a.url == b.url;
}

ToolResult ResultClassifier::classify(const InvocationOutcome& outcome) {
    if (!outcome.succeeded()) {
        spdlog::error("Flux command failed with {}. stderr:\n{}",
            outcome.status_description(), outcome.stderr_data);
        std::string message = "Flux command failed with " + outcome.status_description();
        if (!outcome.stderr_data.empty()) {
            message += ": " + excerpt(outcome.stderr_data);
        }
        throw ToolError(ErrorKind::ExternalProgram, message, outcome.stderr_data);
    }

    json document = json::parse(outcome.stdout_data, nullptr, false);
    if (document.is_discarded()) {
        spdlog::error("Flux command output was not valid JSON. Output:\n{}", outcome.stdout_data);
        throw ToolError(ErrorKind::MalformedOutput,
            "Flux command returned non-JSON output: " + excerpt(outcome.stdout_data, kStdoutExcerpt),
            outcome.stdout_data);
    }

    auto result = decode(document);
    if (!result) {
        spdlog::error("Flux command returned JSON of unknown shape. Output:\n{}", outcome.stdout_data);
        throw ToolError(ErrorKind::UnexpectedStructure,
            "Flux command returned unexpected JSON: " + excerpt(outcome.stdout_data, kStdoutExcerpt),
            outcome.stdout_data);
    }
    return *result;
}

std::optional<ToolResult> ResultClassifier::decode(const json& document) {
    if (!document.is_object()) {
        return std::nullopt;
    }
    // "saved" must be checked first, "success" may carry either payload
    if (auto saved = try_saved(document)) {
        return ToolResult{*saved};
    }
    if (auto inline_data = try_inline_data(document)) {
        return ToolResult{*inline_data};
    }
    if (auto remote = try_remote_url(document)) {
        return ToolResult{*remote};
    }
    return std::nullopt;
}

std::optional<SavedResult> ResultClassifier::try_saved(const json& document) {
    if (!has_status(document, "saved") || !has_string(document, "path")) {
        return std::nullopt;
    }
    return SavedResult{document["path"].get<std::string>()};
}

std::optional<InlineDataResult> ResultClassifier::try_inline_data(const json& document) {
    if (!has_status(document, "success") || !has_string(document, "data") || !has_string(document, "format")) {
        return std::nullopt;
    }
    return InlineDataResult{
        document["format"].get<std::string>(),
        document["data"].get<std::string>()
    };
}

std::optional<RemoteUrlResult> ResultClassifier::try_remote_url(const json& document) {
    if (!has_status(document, "success") || !has_string(document, "url") || document.contains("data")) {
        return std::nullopt;
    }
    return RemoteUrlResult{document["url"].get<std::string>()};
}

} // namespace flux_mcp
