#pragma once

#include "core/ProcessInvoker.hpp"
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace flux_mcp {

using json = nlohmann::json;

/**
 * @brief The program wrote the image itself
 */
struct SavedResult {
    std::string path;
};

/**
 * @brief Base64 image data returned inline
 */
struct InlineDataResult {
    std::string format;  // e.g. "png", "jpeg", "webp"
    std::string data;
};

/**
 * @brief URL of the generated image
 */
struct RemoteUrlResult {
    std::string url;
};

using ToolResult = std::variant<SavedResult, InlineDataResult, RemoteUrlResult>;

bool operator==(const SavedResult& a, const SavedResult& b);
bool operator==(const InlineDataResult& a, const InlineDataResult& b);
bool operator==(const RemoteUrlResult& a, const RemoteUrlResult& b);

/**
 * @brief Converts a finished invocation into a ToolResult
 *
 * Expected stdout shapes, checked in this order:
 *   {"status": "saved", "path": ...}
 *   {"status": "success", "data": ..., "format": ...}
 *   {"status": "success", "url": ...}
 *
 * Stateless; the same outcome always yields the same result.
 */
class ResultClassifier {
public:
    /**
     * @brief Classify an invocation outcome
     *
     * @param outcome Exit status and captured streams of the child
     * @return Exactly one recognized result variant
     * @throws ToolError ExternalProgram if the child failed (stdout is not read),
     *         MalformedOutput if stdout is not JSON,
     *         UnexpectedStructure if the JSON matches no known shape
     */
    static ToolResult classify(const InvocationOutcome& outcome);

    /**
     * @brief Classify an already parsed stdout document
     *
     * @param document Parsed JSON
     * @return Recognized variant, or std::nullopt if no shape matches
     */
    static std::optional<ToolResult> decode(const json& document);

private:
    static std::optional<SavedResult> try_saved(const json& document);
    static std::optional<InlineDataResult> try_inline_data(const json& document);
    static std::optional<RemoteUrlResult> try_remote_url(const json& document);
};

} // namespace flux_mcp
