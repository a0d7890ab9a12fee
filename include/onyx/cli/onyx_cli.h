#pragma once

#include <onyx/cli/download_command.h>

#include <memory>
#include <CLI/CLI.hpp>

namespace onyx::cli {

/**
 * Main CLI application class
 */
class OnyxCLI {
public:
    OnyxCLI();
    ~OnyxCLI();

    /**
     * Run the CLI with given arguments
     */
    int run(int argc, char* argv[]);

    /**
     * Get the root CLI11 app (exposed for tests)
     */
    CLI::App* getApp() const { return app_.get(); }

private:
    std::unique_ptr<CLI::App> app_;
    GlobalOptions globals_;
    int exitCode_{0};
};

} // namespace onyx::cli
