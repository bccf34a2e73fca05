#include <chunkwise/cli/chunkwise_cli.h>
#include <chunkwise/cli/command_registry.h>
#include <chunkwise/config/config_helpers.h>
#include <chunkwise/version.hpp>

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>

namespace chunkwise::cli {

namespace fs = std::filesystem;

ChunkwiseCLI::ChunkwiseCLI() {
    app_ = std::make_unique<CLI::App>("Split extracted document text into indexable chunks",
                                      "chunkwise");
    app_->require_subcommand(1);
    app_->set_version_flag("--version", CHUNKWISE_VERSION_LONG_STRING);

    app_->add_flag("-v,--verbose", verbose_, "Enable verbose output");
    app_->add_option("--config", configPath_, "Configuration file (TOML)")
        ->type_name("PATH")
        ->envname("CHUNKWISE_CONFIG");

    CommandRegistry::registerAllCommands(this);
}

ChunkwiseCLI::~ChunkwiseCLI() = default;

void ChunkwiseCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

void ChunkwiseCLI::setPendingCommand(ICommand* cmd) {
    pendingCommand_ = cmd;
}

Result<chunking::ChunkConfig> ChunkwiseCLI::loadChunkConfig() const {
    return config::load_chunk_config(config::get_config_path(configPath_));
}

Result<std::string> ChunkwiseCLI::readInputFile(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Error{ErrorCode::FileNotFound, "Input file not found: " + path.string()};
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IOError, "Cannot open input file: " + path.string()};
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return Error{ErrorCode::IOError, "Failed reading input file: " + path.string()};
    }
    return buffer.str();
}

void ChunkwiseCLI::applyLogLevel() {
    // Precedence: env CHUNKWISE_LOG_LEVEL > --verbose > warn
    auto parseLevel = [](const std::string& s) -> std::optional<spdlog::level::level_enum> {
        std::string v;
        v.reserve(s.size());
        for (char c : s)
            v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        if (v == "trace")
            return spdlog::level::trace;
        if (v == "debug")
            return spdlog::level::debug;
        if (v == "info")
            return spdlog::level::info;
        if (v == "warn" || v == "warning")
            return spdlog::level::warn;
        if (v == "error" || v == "err")
            return spdlog::level::err;
        if (v == "critical" || v == "crit")
            return spdlog::level::critical;
        if (v == "off" || v == "none" || v == "silent")
            return spdlog::level::off;
        return std::nullopt;
    };

    if (const char* envLvl = std::getenv("CHUNKWISE_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto lvl = parseLevel(envLvl)) {
            spdlog::set_level(*lvl);
            return;
        }
        spdlog::warn("Ignoring unknown CHUNKWISE_LOG_LEVEL '{}'", envLvl);
    }

    spdlog::set_level(verbose_ ? spdlog::level::debug : spdlog::level::warn);
}

int ChunkwiseCLI::run(int argc, char* argv[]) {
    try {
        app_->parse(argc, argv);

        applyLogLevel();

        if (pendingCommand_) {
            auto result = pendingCommand_->execute();
            if (!result) {
                std::cerr << "[FAIL] " << errorToString(result.error().code) << ": "
                          << result.error().message << "\n";
                return 1;
            }
        }

        return 0;
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    } catch (const std::exception& e) {
        // Always provide a user-facing error even if logging is off
        std::cerr << "[FAIL] Unexpected error: " << e.what() << "\n";
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
}

} // namespace chunkwise::cli
