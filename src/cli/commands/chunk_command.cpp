#include <chunkwise/chunking/chunk_search.h>
#include <chunkwise/chunking/chunking_engine.h>
#include <chunkwise/cli/chunk_options.h>
#include <chunkwise/cli/chunkwise_cli.h>
#include <chunkwise/cli/command.h>
#include <chunkwise/export/result_exporter.h>
#include <chunkwise/profiling.h>

#include <spdlog/spdlog.h>

#include <iostream>

namespace chunkwise::cli {

namespace {

// First line of a chunk, shortened for one-line listings
std::string preview(const std::string& content, size_t max_len) {
    std::string line = content.substr(0, content.find('\n'));
    if (line.size() > max_len) {
        line = line.substr(0, max_len - 3) + "...";
    }
    return line;
}

} // namespace

class ChunkCommand : public ICommand {
public:
    std::string getName() const override { return "chunk"; }

    std::string getDescription() const override {
        return "Split a text file into chunks and list or export them";
    }

    void registerCommand(CLI::App& app, ChunkwiseCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("chunk", getDescription());
        cmd->add_option("file", input_, "Plain text file to chunk")->required();
        options_.addTo(cmd);
        cmd->add_flag("--json", json_, "Print the export document to stdout");
        cmd->add_option("-o,--output", output_,
                        "Write the export document to PATH (a directory gets a generated name)")
            ->type_name("PATH");
        cmd->add_option("--search", search_, "Only list chunks containing TERM")
            ->type_name("TERM");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        CHUNKWISE_ZONE_SCOPED_N("ChunkCommand::execute");

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
        const auto& chunked = result.value();

        if (!output_.empty()) {
            std::filesystem::path target = output_;
            if (std::filesystem::is_directory(target)) {
                target /= exporting::defaultExportFileName(chunked.strategy,
                                                           exporting::Clock::now());
            }
            if (auto exported = exporting::exportToFile(chunked, target); !exported) {
                return exported;
            }
            std::cerr << "Exported " << chunked.totalChunks << " chunks to " << target.string()
                      << "\n";
        }

        if (json_) {
            std::cout << exporting::toJson(chunked, exporting::Clock::now())
                             .dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
                      << "\n";
            return {};
        }

        auto listed = chunking::findChunks(chunked, search_);
        if (!search_.empty()) {
            spdlog::debug("{} of {} chunks match '{}'", listed.size(), chunked.totalChunks,
                          search_);
        }

        for (const auto& chunk : listed) {
            std::cout << chunk.id << "  [" << chunk.startIndex << "-" << chunk.endIndex << "]  "
                      << chunk.characterCount << " chars, " << chunk.wordCount << " words  "
                      << preview(chunk.content, 60) << "\n";
        }
        std::cout << listed.size() << (listed.size() == 1 ? " chunk" : " chunks")
                  << " (avg " << chunked.averageChunkSize << " chars, "
                  << chunked.processingTimeMs.count() << " ms)\n";
        return {};
    }

private:
    ChunkwiseCLI* cli_ = nullptr;
    ChunkOptions options_;
    std::string input_;
    std::string output_;
    std::string search_;
    bool json_ = false;
};

// Factory function
std::unique_ptr<ICommand> createChunkCommand() {
    return std::make_unique<ChunkCommand>();
}

} // namespace chunkwise::cli
