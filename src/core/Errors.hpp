#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace flux_mcp {

/**
 * @brief Pipeline stage that produced a ToolError
 */
enum class ErrorKind {
    Infrastructure,       // Program could not be started
    ExternalProgram,      // Program ran and reported failure
    MalformedOutput,      // Stdout was not JSON
    UnexpectedStructure   // Stdout was JSON of an unknown shape
};

/**
 * @brief Failure of a single tool invocation
 *
 * what() is the caller-facing message and stays short. detail() keeps
 * the full diagnostic text (stderr, raw stdout) for the local log.
 */
class ToolError : public std::runtime_error {
public:
    ToolError(ErrorKind kind, const std::string& message, std::string detail = {});

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& detail() const noexcept { return detail_; }

private:
    ErrorKind kind_;
    std::string detail_;
};

/**
 * @brief Required startup configuration is missing or invalid
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Convert ErrorKind to its error name, e.g. "ExternalProgramError"
 */
std::string_view to_string(ErrorKind kind);

/**
 * @brief Cut text to at most max_length characters, marking the cut
 *
 * @param text Text to shorten
 * @param max_length Maximum number of characters kept from text
 * @return text unchanged if short enough, otherwise a prefix followed by "..."
 *
 * The cut moves back to the start of a UTF-8 sequence, so the prefix
 * may be a few bytes shorter than max_length.
 */
std::string excerpt(std::string_view text, std::size_t max_length = 500);

} // namespace flux_mcp
