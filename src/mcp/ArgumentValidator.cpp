#include "ArgumentValidator.hpp"
#include "core/ArgumentBuilder.hpp"
#include <algorithm>
#include <stdexcept>

namespace flux_mcp {

json ArgumentValidator::apply(const json& schema, const json& args) {
    json result = args.is_null() ? json::object() : args;
    if (!result.is_object()) {
        throw std::invalid_argument("Tool arguments must be an object");
    }

    const json properties = schema.value("properties", json::object());

    for (const auto& [name, property] : properties.items()) {
        bool missing = !result.contains(name) || result[name].is_null();
        if (missing) {
            if (property.contains("default")) {
                result[name] = property["default"];
            }
            continue;
        }

        const json& value = result[name];

        if (property.contains("type")) {
            const std::string type = property["type"];
            if (!matches_type(value, type)) {
                throw std::invalid_argument("Parameter '" + name + "' must be of type " + type);
            }
        }

        if (property.contains("enum")) {
            const json& choices = property["enum"];
            if (std::find(choices.begin(), choices.end(), value) == choices.end()) {
                throw std::invalid_argument("Parameter '" + name + "' must be one of " + choices.dump());
            }
        }
    }

    for (const auto& name : schema.value("required", json::array())) {
        const std::string key = name;
        if (!result.contains(key) || result[key].is_null()) {
            throw std::invalid_argument("Missing required parameter: " + key);
        }
    }

    return result;
}

bool ArgumentValidator::matches_type(const json& value, const std::string& type) {
    if (type == "string") {
        return value.is_string();
    }
    if (type == "number") {
        return value.is_number();
    }
    if (type == "integer") {
        return ArgumentBuilder::is_integer(value);
    }
    if (type == "boolean") {
        return value.is_boolean();
    }
    if (type == "object") {
        return value.is_object();
    }
    if (type == "array") {
        return value.is_array();
    }
    return true;
}

} // namespace flux_mcp
