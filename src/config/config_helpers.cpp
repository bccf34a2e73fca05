#include <chunkwise/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdlib>
#include <fstream>

namespace chunkwise::config {

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        if (!in_target_section) {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments outside quoted values
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        } else if (v.size() >= 2) {
            size_t close = v.find(v.front(), 1);
            if (close != std::string::npos) {
                v = v.substr(0, close + 1);
            }
        }

        if (k == key) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return std::filesystem::path(override_path);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv && *homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "chunkwise" / "config.toml";
    }

    return configHome / "chunkwise" / "config.toml";
}

Result<size_t> parse_size(const std::string& raw, const std::string& what) {
    std::string value = raw;
    trim(value);

    size_t parsed = 0;
    const char* first = value.data();
    const char* last = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (value.empty() || ec != std::errc{} || ptr != last) {
        return Error{ErrorCode::ParseError,
                     "Invalid value for " + what + ": '" + raw + "' (expected a non-negative integer)"};
    }
    return parsed;
}

Result<chunking::ChunkConfig> load_chunk_config(const std::filesystem::path& config_path) {
    chunking::ChunkConfig config;

    auto lookup = [&](const char* env_name, const std::string& key) -> std::string {
        if (const char* env = std::getenv(env_name); env && *env) {
            return env;
        }
        if (config_path.empty()) {
            return "";
        }
        return parse_config_value(config_path, "chunking", key);
    };

    if (!config_path.empty() && !std::filesystem::exists(config_path)) {
        spdlog::debug("Config file {} not found, using defaults", config_path.string());
    }

    if (auto raw = lookup("CHUNKWISE_CHUNK_SIZE", "chunk_size"); !raw.empty()) {
        auto parsed = parse_size(raw, "chunk_size");
        if (!parsed) {
            return parsed.error();
        }
        config.chunkSize = parsed.value();
    }

    if (auto raw = lookup("CHUNKWISE_OVERLAP", "overlap"); !raw.empty()) {
        auto parsed = parse_size(raw, "overlap");
        if (!parsed) {
            return parsed.error();
        }
        config.overlap = parsed.value();
    } else {
        config.overlap = chunking::defaultOverlapFor(config.chunkSize);
    }

    if (auto raw = lookup("CHUNKWISE_STRATEGY", "strategy"); !raw.empty()) {
        auto parsed = chunking::parseStrategy(raw);
        if (!parsed) {
            return parsed.error();
        }
        config.strategy = parsed.value();
    }

    if (auto valid = chunking::validateConfig(config); !valid) {
        return valid.error();
    }

    return config;
}

} // namespace chunkwise::config
