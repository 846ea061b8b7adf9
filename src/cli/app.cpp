#include "delguard/cli/app.hpp"
#include "delguard/core/logger.hpp"

#include <iostream>

// Version string; typically injected by CMake via -DDELGUARD_VERSION_STRING=...
#ifndef DELGUARD_VERSION_STRING
#define DELGUARD_VERSION_STRING "0.1.0-dev"
#endif

namespace delguard::cli {

App::App()
    : cli_("delguard", "Deletion guard for agent-issued shell commands")
{
    cli_.set_version_flag("--version", DELGUARD_VERSION_STRING,
                          "Display version information");

    // Global option: config file path.
    cli_.add_option("-c,--config", options_.config_path,
                    "Path to configuration file (JSON)")
        ->envname("DELGUARD_CONFIG");

    // Global option: log level override.
    cli_.add_option("--log-level", options_.log_level,
                    "Log level (trace, debug, info, warn, error, critical, off)")
        ->envname("DELGUARD_LOG_LEVEL");

    // Require a subcommand.
    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    Logger::init("delguard", "warn");

    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    } catch (const std::exception& e) {
        // Fail open.
        LOG_ERROR("Unhandled error: {}", e.what());
        std::cerr << "[delguard] unhandled error (failing open): " << e.what() << "\n";
        Logger::flush();
        return 0;
    }

    // The selected subcommand's callback has already been invoked by
    // CLI11's parse() and recorded its exit code.
    Logger::flush();
    return options_.exit_code;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::options() const -> const GlobalOptions& {
    return options_;
}

void App::setup_commands() {
    register_check_command(cli_, options_);
    register_explain_command(cli_, options_);
}

} // namespace delguard::cli
