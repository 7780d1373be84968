#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace flux_mcp {

/**
 * @brief Startup configuration for the fluxcli bridge
 *
 * Loaded once from the environment and command-line overrides.
 * BFL_API_KEY is only checked for presence: the child inherits it
 * through the environment.
 */
struct FluxConfig {
    std::filesystem::path flux_path;          // Directory containing the entry script
    std::string entry_script = "fluxcli.py";
    std::chrono::milliseconds timeout{0};     // 0 = no timeout

    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    /**
     * @brief Build configuration from environment variables
     *
     * @param flux_path_override Used instead of FLUX_PATH when non-empty
     * @param env Environment lookup (defaults to std::getenv)
     * @return Validated configuration
     * @throws ConfigError if FLUX_PATH or BFL_API_KEY is missing,
     *         or the flux path is not a directory
     */
    static FluxConfig from_environment(const std::string& flux_path_override = {},
                                       const EnvLookup& env = {});

    /**
     * @brief Full path of the entry script
     */
    std::filesystem::path entry_path() const { return flux_path / entry_script; }

    /**
     * @brief Warn if the entry script does not exist (not fatal)
     * @return true if the entry script is a regular file
     */
    bool check_entry_script() const;
};

/**
 * @brief Read an environment variable, treating empty values as unset
 */
std::optional<std::string> get_env(const std::string& name);

} // namespace flux_mcp
