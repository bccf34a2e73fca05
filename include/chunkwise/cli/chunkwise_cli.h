#pragma once

#include <chunkwise/chunking/chunk_types.h>
#include <chunkwise/cli/command.h>
#include <chunkwise/core/types.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

namespace chunkwise::cli {

/**
 * Command-line front end: owns the CLI11 app, global flags and registered commands
 */
class ChunkwiseCLI {
public:
    ChunkwiseCLI();
    ~ChunkwiseCLI();

    /**
     * Run the CLI with given arguments; returns the process exit status
     */
    int run(int argc, char* argv[]);

    void registerCommand(std::unique_ptr<ICommand> command);

    // Called from a subcommand callback; the command runs after all flags are applied
    void setPendingCommand(ICommand* cmd);

    /**
     * Chunking configuration from the config file and environment
     */
    Result<chunking::ChunkConfig> loadChunkConfig() const;

    /**
     * Read a whole input file as bytes
     */
    static Result<std::string> readInputFile(const std::filesystem::path& path);

    bool isVerbose() const { return verbose_; }

private:
    void applyLogLevel();

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pendingCommand_ = nullptr;

    bool verbose_ = false;
    std::string configPath_;
};

} // namespace chunkwise::cli
