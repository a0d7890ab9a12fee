#include <onyx/cli/onyx_cli.h>
#include <onyx/version.hpp>

#include <spdlog/spdlog.h>

#include <iostream>

namespace onyx::cli {

OnyxCLI::OnyxCLI() {
    // Conservative default; each command adjusts the level after parsing its flags
    spdlog::set_level(spdlog::level::warn);

    app_ = std::make_unique<CLI::App>("Onyx - resumable parallel HTTP downloader", "onyx");
    app_->set_version_flag("--version", ONYX_VERSION_LONG_STRING);

    // Global options
    app_->add_option("--config", globals_.configPath,
                     "Config file (default: $ONYX_CONFIG or ~/.config/onyx/config.toml)");
    app_->add_flag("-v,--verbose", globals_.verbose, "Enable verbose output");
    app_->add_flag("-q,--quiet", globals_.quiet, "Only print errors");

    registerDownloadCommand(*app_, globals_, exitCode_);
    app_->require_subcommand(1);
}

OnyxCLI::~OnyxCLI() = default;

int OnyxCLI::run(int argc, char* argv[]) {
    try {
        exitCode_ = 0;
        app_->parse(argc, argv);
        return exitCode_;
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    } catch (const std::exception& e) {
        // Always provide a user-facing error even if logging is off
        std::cerr << "[FAIL] Unexpected error: " << e.what() << "\n";
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
}

} // namespace onyx::cli
