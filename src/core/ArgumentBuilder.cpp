#include "ArgumentBuilder.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <cstdint>
#include <stdexcept>

namespace flux_mcp {

namespace {

// Whole floats at or above this print in exponent form
constexpr double kMaxWholeFloat = 1e15;

} // namespace

ArgumentBuilder::ArgumentBuilder(std::string subcommand) {
    if (subcommand.empty()) {
        throw std::invalid_argument("Sub-command cannot be empty");
    }
    args_.push_back(std::move(subcommand));
}

ArgumentBuilder& ArgumentBuilder::add(const std::string& flag, const std::string& value) {
    args_.push_back(flag);
    args_.push_back(value);
    return *this;
}

ArgumentBuilder& ArgumentBuilder::add_string(const json& args, const std::string& key, const std::string& flag) {
    if (!present(args, key)) {
        return *this;
    }
    const json& value = args[key];
    if (!value.is_string()) {
        throw std::invalid_argument("Parameter '" + key + "' must be a string");
    }
    return add(flag, value.get<std::string>());
}

ArgumentBuilder& ArgumentBuilder::add_integer(const json& args, const std::string& key, const std::string& flag) {
    if (!present(args, key)) {
        return *this;
    }
    const json& value = args[key];
    if (!is_integer(value)) {
        throw std::invalid_argument("Parameter '" + key + "' must be an integer");
    }
    return add(flag, format_number(value));
}

ArgumentBuilder& ArgumentBuilder::add_number(const json& args, const std::string& key, const std::string& flag) {
    if (!present(args, key)) {
        return *this;
    }
    const json& value = args[key];
    if (!value.is_number()) {
        throw std::invalid_argument("Parameter '" + key + "' must be a number");
    }
    return add(flag, format_number(value));
}

ArgumentBuilder& ArgumentBuilder::add_switch(const json& args, const std::string& key, const std::string& flag) {
    if (present(args, key) && args[key].is_boolean() && args[key].get<bool>()) {
        args_.push_back(flag);
    }
    return *this;
}

ArgumentBuilder& ArgumentBuilder::add_output_options(const json& args) {
    using namespace output_params;

    bool has_output = present(args, kOutput)
        && args[kOutput].is_string()
        && !args[kOutput].get<std::string>().empty();

    if (has_output) {
        add("--output", args[kOutput].get<std::string>());
    } else if (!present(args, kReturnFormat) || args[kReturnFormat] == kFormatBase64) {
        args_.push_back("--fetch-base64");
    }

    return add_switch(args, kToWebp, "--to-webp");
}

bool ArgumentBuilder::is_integer(const json& value) {
    if (value.is_number_integer()) {
        return true;
    }
    if (!value.is_number_float()) {
        return false;
    }
    double number = value.get<double>();
    return std::isfinite(number) && std::trunc(number) == number && std::fabs(number) < kMaxWholeFloat;
}

std::string ArgumentBuilder::format_number(const json& value) {
    if (value.is_number_unsigned()) {
        return std::to_string(value.get<std::uint64_t>());
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<std::int64_t>());
    }
    double number = value.get<double>();
    if (!std::isfinite(number)) {
        throw std::invalid_argument("Number must be finite");
    }
    if (std::trunc(number) == number && std::fabs(number) < kMaxWholeFloat) {
        return std::to_string(static_cast<std::int64_t>(number));
    }
    // fmt never consults the global locale for "{}"
    return fmt::format("{}", number);
}

bool ArgumentBuilder::present(const json& args, const std::string& key) {
    return args.is_object() && args.contains(key) && !args[key].is_null();
}

} // namespace flux_mcp
