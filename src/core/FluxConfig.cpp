#include "FluxConfig.hpp"
#include "Errors.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>

namespace flux_mcp {

std::optional<std::string> get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

FluxConfig FluxConfig::from_environment(const std::string& flux_path_override, const EnvLookup& env) {
    const EnvLookup lookup = env ? env : EnvLookup(get_env);

    FluxConfig config;

    if (!flux_path_override.empty()) {
        config.flux_path = flux_path_override;
    } else if (auto path = lookup("FLUX_PATH")) {
        config.flux_path = *path;
    } else {
        throw ConfigError("FLUX_PATH environment variable must be set to the directory containing fluxcli.py");
    }

    if (!lookup("BFL_API_KEY")) {
        throw ConfigError("BFL_API_KEY environment variable must be set for the Flux API");
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(config.flux_path, ec)) {
        throw ConfigError("Flux path is not a directory: " + config.flux_path.string());
    }

    return config;
}

bool FluxConfig::check_entry_script() const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(entry_path(), ec)) {
        spdlog::warn("Entry script not found: {}", entry_path().string());
        return false;
    }
    return true;
}

} // namespace flux_mcp
