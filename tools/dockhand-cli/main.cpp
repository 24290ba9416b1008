#include <exception>

#include <spdlog/spdlog.h>
#include <dockhand/cli/dockhand_cli.h>

int main(int argc, char* argv[]) {
    try {
        // DockhandCLI::run() adjusts the level from --log-level
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        dockhand::cli::DockhandCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
