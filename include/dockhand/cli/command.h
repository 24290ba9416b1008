#pragma once

#include <string>

#include <CLI/CLI.hpp>
#include <dockhand/core/types.h>

namespace dockhand::cli {

class DockhandCLI;

/**
 * Base interface for CLI subcommands
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    virtual std::string getName() const = 0;
    virtual std::string getDescription() const = 0;

    /**
     * Register this command with the CLI11 app
     */
    virtual void registerCommand(CLI::App& app, DockhandCLI* cli) = 0;

    virtual Result<void> execute() = 0;
};

} // namespace dockhand::cli
