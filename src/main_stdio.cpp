#include "core/Errors.hpp"
#include "core/FluxConfig.hpp"
#include "core/ProcessInvoker.hpp"
#include "core/SignalWatcher.hpp"
#include "mcp/MCPServer.hpp"
#include "mcp/StdioTransport.hpp"
#include "tools/ControlTool.hpp"
#include "tools/FluxCommandRunner.hpp"
#include "tools/GenerateTool.hpp"
#include "tools/Img2ImgTool.hpp"
#include "tools/InpaintTool.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stderr_color_sinks.h>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>

namespace {
    constexpr const char* kVersion = "0.1.0";

    template <typename Tool>
    void register_tool(flux_mcp::MCPServer& server, std::shared_ptr<flux_mcp::FluxCommandRunner> runner) {
        auto tool = std::make_shared<Tool>(std::move(runner));
        server.register_tool(
            Tool::get_info(),
            [tool](const nlohmann::json& args) {
                return tool->execute(args);
            }
        );
    }
}

int main(int argc, char** argv) {
    // Parse command-line arguments
    CLI::App app{"Flux MCP Server - image generation through fluxcli"};

    std::string log_level = "info";
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error, critical)")
        ->default_val("info");

    std::string flux_path;
    app.add_option("--flux-path", flux_path, "Directory containing fluxcli.py (overrides FLUX_PATH)");

    std::string entry_script = "fluxcli.py";
    app.add_option("--entry", entry_script, "Entry script inside the flux directory")
        ->default_val("fluxcli.py");

    long timeout_ms = 0;
    app.add_option("--timeout-ms", timeout_ms, "Kill a flux command after this many milliseconds (0 = never)")
        ->default_val(0)
        ->check(CLI::NonNegativeNumber);

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << "flux-mcp version " << kVersion << std::endl;
        return 0;
    }

    // stdout carries the protocol, so all logging goes to stderr
    spdlog::set_default_logger(spdlog::stderr_color_mt("flux-mcp"));

    auto level = spdlog::level::from_str(log_level);
    if (level == spdlog::level::off && log_level != "off") {
        std::cerr << "Invalid log level: " << log_level << std::endl;
        return 1;
    }
    spdlog::set_level(level);

    spdlog::info("Starting Flux MCP Server...");
    spdlog::info("Log level: {}", log_level);

    try {
        auto config = flux_mcp::FluxConfig::from_environment(flux_path);
        config.entry_script = entry_script;
        config.timeout = std::chrono::milliseconds(timeout_ms);
        config.check_entry_script();

        spdlog::info("Flux path: {}", config.flux_path.string());
        if (config.timeout.count() > 0) {
            spdlog::info("Command timeout: {} ms", config.timeout.count());
        }

        auto invoker = std::make_shared<flux_mcp::ProcessInvoker>();
        auto runner = std::make_shared<flux_mcp::FluxCommandRunner>(config, invoker);
        auto transport = std::make_unique<flux_mcp::StdioTransport>();
        auto server = std::make_unique<flux_mcp::MCPServer>(
            std::move(transport), flux_mcp::ServerInfo{"flux-server", kVersion});

        server->set_shutdown_hook([invoker]() {
            std::size_t count = invoker->terminate_all();
            if (count > 0) {
                spdlog::info("Terminated {} running flux command(s)", count);
            }
        });

        // Must exist before any worker thread so every thread inherits the mask
        flux_mcp::MCPServer* server_ptr = server.get();
        flux_mcp::SignalWatcher signals({SIGINT, SIGTERM}, [server_ptr](int) {
            server_ptr->shutdown();
            spdlog::info("Server stopped cleanly");
            spdlog::shutdown();
            // The main thread may still be blocked reading stdin
            std::_Exit(0);
        });

        register_tool<flux_mcp::GenerateTool>(*server, runner);
        register_tool<flux_mcp::Img2ImgTool>(*server, runner);
        register_tool<flux_mcp::InpaintTool>(*server, runner);
        register_tool<flux_mcp::ControlTool>(*server, runner);

        spdlog::info("Flux MCP Server connected via stdio");

        // Run server (blocks until stdin closes)
        server->run();
        server->shutdown();

        spdlog::info("Server stopped cleanly");
        return 0;

    } catch (const flux_mcp::ConfigError& e) {
        spdlog::critical("Failed to start Flux MCP server: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
