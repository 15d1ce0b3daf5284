#pragma once

#include <ranklab/cli/command.h>

#include <memory>

namespace ranklab::cli {

// Forward declaration
class RankLabCLI;

/**
 * Registry of all available CLI commands
 */
class CommandRegistry {
public:
    /**
     * Register all built-in commands with the CLI
     */
    static void registerAllCommands(RankLabCLI* cli);

    /**
     * Create search command
     */
    static std::unique_ptr<ICommand> createSearchCommand();

    /**
     * Create eval command
     */
    static std::unique_ptr<ICommand> createEvalCommand();
};

} // namespace ranklab::cli
