#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <CLI/CLI.hpp>
#include <spdlog/common.h>

#include <dockhand/cli/command.h>
#include <dockhand/config/config_helpers.h>
#include <dockhand/config/harness_config.h>
#include <dockhand/harness/harness_context.h>

namespace dockhand::cli {

// Builds the harness context a command runs against. Defaults to Docker.
using ContextFactory = std::function<Result<std::unique_ptr<harness::HarnessContext>>(
    config::HarnessConfig, config::EnvLookup)>;

std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view value);

class DockhandCLI {
public:
    explicit DockhandCLI(config::EnvLookup env = config::processEnvironment());
    ~DockhandCLI();

    // Parses argv, runs the selected command, returns the process exit code
    int run(int argc, char* argv[]);
    int run(std::vector<std::string> args);

    void registerCommand(std::unique_ptr<ICommand> command);
    void setPendingCommand(ICommand* command) { pendingCommand_ = command; }

    void setContextFactory(ContextFactory factory) { contextFactory_ = std::move(factory); }
    const ContextFactory& contextFactory() const { return contextFactory_; }

    // Text written by the last command (also printed to stdout)
    const std::string& lastOutput() const { return lastOutput_; }
    void emit(const std::string& text);

    const config::EnvLookup& env() const { return env_; }
    bool jsonOutput() const { return jsonOutput_; }
    const std::string& configPath() const { return configPath_; }

private:
    void registerBuiltinCommands();
    void applyLogLevel();
    int execute();

    config::EnvLookup env_;
    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pendingCommand_{nullptr};
    ContextFactory contextFactory_;
    std::string lastOutput_;

    bool jsonOutput_{false};
    std::string logLevel_;
    std::string configPath_;
};

} // namespace dockhand::cli
