#pragma once

#include <chunkwise/cli/command.h>

#include <memory>

namespace chunkwise::cli {

class ChunkwiseCLI;

/**
 * Registry of all available CLI commands
 */
class CommandRegistry {
public:
    static void registerAllCommands(ChunkwiseCLI* cli);

    static std::unique_ptr<ICommand> createChunkCommand();
    static std::unique_ptr<ICommand> createStatsCommand();
    static std::unique_ptr<ICommand> createStrategiesCommand();
};

} // namespace chunkwise::cli
