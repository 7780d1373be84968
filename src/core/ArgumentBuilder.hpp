#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace flux_mcp {

using json = nlohmann::json;

/**
 * @brief Builds the argv of one fluxcli sub-command
 *
 * Reads values from a decoded argument object (defaults already applied)
 * and appends "--flag value" pairs for every value that is present.
 * Each token stays a separate argv element; nothing is ever joined into
 * a shell string.
 *
 * Example:
 * @code
 * auto argv = ArgumentBuilder("generate")
 *     .add_string(args, "prompt", "--prompt")
 *     .add_integer(args, "width", "--width")
 *     .add_output_options(args)
 *     .build();
 * @endcode
 */
class ArgumentBuilder {
public:
    /**
     * @brief Start an argument list with the sub-command name
     */
    explicit ArgumentBuilder(std::string subcommand);

    /**
     * @brief Append a flag with an explicit value
     */
    ArgumentBuilder& add(const std::string& flag, const std::string& value);

    /**
     * @brief Append flag and string value if args[key] is present
     * @throws std::invalid_argument if the value is not a string
     */
    ArgumentBuilder& add_string(const json& args, const std::string& key, const std::string& flag);

    /**
     * @brief Append flag and integer value if args[key] is present
     * @throws std::invalid_argument if the value is not an integral number
     *         small enough to print without an exponent
     */
    ArgumentBuilder& add_integer(const json& args, const std::string& key, const std::string& flag);

    /**
     * @brief Append flag and decimal value if args[key] is present
     * @throws std::invalid_argument if the value is not a number
     */
    ArgumentBuilder& add_number(const json& args, const std::string& key, const std::string& flag);

    /**
     * @brief Append a bare flag if args[key] is true
     */
    ArgumentBuilder& add_switch(const json& args, const std::string& key, const std::string& flag);

    /**
     * @brief Append output destination and post-processing flags
     *
     * A non-empty "output" path emits --output and suppresses the return
     * format. Otherwise "return_format" == "base64" emits --fetch-base64,
     * "url" emits nothing. "to_webp" emits --to-webp in either case.
     */
    ArgumentBuilder& add_output_options(const json& args);

    /**
     * @brief Get the finished argument list (sub-command first)
     */
    std::vector<std::string> build() const { return args_; }

    /**
     * @brief Render a number as locale-independent decimal text
     *
     * Integral values print without a fractional part ("50"), others in
     * shortest round-trip form ("0.85").
     */
    static std::string format_number(const json& value);

    /**
     * @brief True for integers and for whole floats below 1e15 in magnitude
     */
    static bool is_integer(const json& value);

private:
    static bool present(const json& args, const std::string& key);

    std::vector<std::string> args_;
};

/// Output parameter names shared by all image tools
namespace output_params {
    inline constexpr const char* kOutput = "output";
    inline constexpr const char* kReturnFormat = "return_format";
    inline constexpr const char* kToWebp = "to_webp";

    inline constexpr const char* kFormatBase64 = "base64";
    inline constexpr const char* kFormatUrl = "url";
}

} // namespace flux_mcp
