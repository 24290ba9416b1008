#include <dockhand/cli/dockhand_cli.h>
#include <dockhand/cli/launch_command.h>
#include <dockhand/version.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <iostream>

namespace dockhand::cli {

std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view value) {
    std::string v;
    v.reserve(value.size());
    for (char c : value)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

DockhandCLI::DockhandCLI(config::EnvLookup env) : env_(std::move(env)) {
    contextFactory_ = [](config::HarnessConfig cfg, config::EnvLookup lookup) {
        return harness::HarnessContext::create(std::move(cfg), std::move(lookup));
    };

    app_ = std::make_unique<CLI::App>("Launch and exercise text-generation containers",
                                      "dockhand");
    app_->set_version_flag("--version", std::string(DOCKHAND_VERSION_STRING));
    app_->require_subcommand(1);

    app_->add_flag("--json", jsonOutput_, "Output in JSON format");
    app_->add_option("--log-level", logLevel_,
                     "Log level (trace, debug, info, warn, error, off)");
    app_->add_option("--config", configPath_, "Config file (default: DOCKHAND_CONFIG or "
                                              "$XDG_CONFIG_HOME/dockhand/config.toml)");

    registerBuiltinCommands();
}

DockhandCLI::~DockhandCLI() = default;

void DockhandCLI::registerBuiltinCommands() {
    registerCommand(createLaunchCommand());
}

void DockhandCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

void DockhandCLI::applyLogLevel() {
    std::optional<spdlog::level::level_enum> level;
    if (!logLevel_.empty()) {
        level = parseLogLevel(logLevel_);
        if (!level) {
            spdlog::warn("Unknown log level '{}', using info", logLevel_);
        }
    } else if (env_) {
        if (auto envLevel = env_("DOCKHAND_LOG_LEVEL")) {
            level = parseLogLevel(*envLevel);
        }
    }
    spdlog::set_level(level.value_or(spdlog::level::info));
}

void DockhandCLI::emit(const std::string& text) {
    lastOutput_ = text;
    std::cout << text << std::endl;
}

int DockhandCLI::run(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return run(std::move(args));
}

int DockhandCLI::run(std::vector<std::string> args) {
    pendingCommand_ = nullptr;
    try {
        // CLI11 consumes the vector from the back
        std::reverse(args.begin(), args.end());
        app_->parse(args);
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    }

    applyLogLevel();
    try {
        return execute();
    } catch (const std::exception& e) {
        std::cerr << "[FAIL] Unexpected error: " << e.what() << "\n";
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
}

int DockhandCLI::execute() {
    if (!pendingCommand_) {
        std::cerr << app_->help() << "\n";
        return 1;
    }
    auto result = pendingCommand_->execute();
    if (!result) {
        std::cerr << "[FAIL] " << result.error().message << " ("
                  << errorToString(result.error().code) << ")\n";
        return 1;
    }
    return 0;
}

} // namespace dockhand::cli
