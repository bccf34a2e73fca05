#include <chunkwise/chunking/chunk_statistics.h>
#include <chunkwise/chunking/chunking_engine.h>
#include <chunkwise/cli/chunk_options.h>
#include <chunkwise/cli/chunkwise_cli.h>
#include <chunkwise/cli/command.h>

#include <iostream>

namespace chunkwise::cli {

class StatsCommand : public ICommand {
public:
    std::string getName() const override { return "stats"; }

    std::string getDescription() const override {
        return "Chunk a text file and print size statistics";
    }

    void registerCommand(CLI::App& app, ChunkwiseCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("stats", getDescription());
        cmd->add_option("file", input_, "Plain text file to chunk")->required();
        options_.addTo(cmd);

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto base = cli_->loadChunkConfig();
        if (!base) {
            return base.error();
        }
        auto config = options_.resolve(base.value());
        if (!config) {
            return config.error();
        }

        auto text = ChunkwiseCLI::readInputFile(input_);
        if (!text) {
            return text.error();
        }

        chunking::ChunkingEngine engine;
        auto result = engine.chunk(text.value(), config.value());
        if (!result) {
            return result.error();
        }

        auto stats = chunking::computeStatistics(result.value(), text.value().size());
        std::cout << chunking::formatStatistics(result.value(), stats);
        return {};
    }

private:
    ChunkwiseCLI* cli_ = nullptr;
    ChunkOptions options_;
    std::string input_;
};

std::unique_ptr<ICommand> createStatsCommand() {
    return std::make_unique<StatsCommand>();
}

} // namespace chunkwise::cli
