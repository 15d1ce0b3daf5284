#include <ranklab/cli/command_registry.h>
#include <ranklab/cli/ranklab_cli.h>

namespace ranklab::cli {

// External factory functions from command implementations (in this namespace)
std::unique_ptr<ICommand> createSearchCommand();
std::unique_ptr<ICommand> createEvalCommand();

void CommandRegistry::registerAllCommands(RankLabCLI* cli) {
    cli->registerCommand(CommandRegistry::createSearchCommand());
    cli->registerCommand(CommandRegistry::createEvalCommand());
}

std::unique_ptr<ICommand> CommandRegistry::createSearchCommand() {
    return ::ranklab::cli::createSearchCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createEvalCommand() {
    return ::ranklab::cli::createEvalCommand();
}

} // namespace ranklab::cli
