#pragma once

#include <ranklab/core/types.h>

#include <CLI/CLI.hpp>
#include <memory>
#include <string>

namespace ranklab::cli {

// Forward declarations
class RankLabCLI;

/**
 * Base interface for CLI commands
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * Get the command name (e.g., "search", "eval")
     */
    virtual std::string getName() const = 0;

    /**
     * Get the command description for help text
     */
    virtual std::string getDescription() const = 0;

    /**
     * Register this command with the CLI11 app
     */
    virtual void registerCommand(CLI::App& app, RankLabCLI* cli) = 0;

    /**
     * Execute the command
     */
    virtual Result<void> execute() = 0;
};

} // namespace ranklab::cli
