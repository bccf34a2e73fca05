#include <chunkwise/cli/chunkwise_cli.h>
#include <chunkwise/cli/command_registry.h>

namespace chunkwise::cli {

// External factory functions from command implementations (in this namespace)
std::unique_ptr<ICommand> createChunkCommand();
std::unique_ptr<ICommand> createStatsCommand();
std::unique_ptr<ICommand> createStrategiesCommand();

void CommandRegistry::registerAllCommands(ChunkwiseCLI* cli) {
    cli->registerCommand(CommandRegistry::createChunkCommand());
    cli->registerCommand(CommandRegistry::createStatsCommand());
    cli->registerCommand(CommandRegistry::createStrategiesCommand());
}

std::unique_ptr<ICommand> CommandRegistry::createChunkCommand() {
    return ::chunkwise::cli::createChunkCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createStatsCommand() {
    return ::chunkwise::cli::createStatsCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createStrategiesCommand() {
    return ::chunkwise::cli::createStrategiesCommand();
}

} // namespace chunkwise::cli
