#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace flux_mcp {

using json = nlohmann::json;

/**
 * @brief Checks tool arguments against a tool's input schema
 *
 * Understands the subset of JSON Schema used by tool declarations:
 * "properties" with "type" (string, number, integer, boolean), "enum",
 * "default", and the top-level "required" list.
 */
class ArgumentValidator {
public:
    /**
     * @brief Validate arguments and fill in declared defaults
     *
     * @param schema Tool input schema (type: object)
     * @param args Arguments from tools/call (object or null)
     * @return Copy of args with defaults applied; unknown keys kept as-is
     * @throws std::invalid_argument naming the offending parameter
     */
    static json apply(const json& schema, const json& args);

private:
    static bool matches_type(const json& value, const std::string& type);
};

} // namespace flux_mcp
