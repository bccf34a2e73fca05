#include <chunkwise/chunking/chunk_types.h>
#include <chunkwise/cli/chunkwise_cli.h>
#include <chunkwise/cli/command.h>

#include <iomanip>
#include <iostream>

namespace chunkwise::cli {

class StrategiesCommand : public ICommand {
public:
    std::string getName() const override { return "strategies"; }

    std::string getDescription() const override { return "List available chunking strategies"; }

    void registerCommand(CLI::App& app, ChunkwiseCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("strategies", getDescription());
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        for (auto strategy : chunking::kAllStrategies) {
            std::cout << "  " << std::left << std::setw(10) << chunking::strategyName(strategy)
                      << chunking::strategyDescription(strategy) << "\n";
        }
        return {};
    }

private:
    ChunkwiseCLI* cli_ = nullptr;
};

std::unique_ptr<ICommand> createStrategiesCommand() {
    return std::make_unique<StrategiesCommand>();
}

} // namespace chunkwise::cli
