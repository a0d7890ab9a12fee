#include <spdlog/spdlog.h>
#include <onyx/cli/onyx_cli.h>

int main(int argc, char* argv[]) {
    try {
        // Set up logging with conservative default; commands adjust it based on flags
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        onyx::cli::OnyxCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
