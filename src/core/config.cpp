#include "mcptools/core/config.hpp"
#include "mcptools/core/logger.hpp"

#include <cstdlib>
#include <fstream>

namespace mcptools {

namespace {

/// API keys may be written as "${BRAVE_API_KEY}" in the file.
void resolve_key_refs(Config& config) {
    config.tools.search.api_key = resolve_env_refs(config.tools.search.api_key);
    config.tools.scrape.api_key = resolve_env_refs(config.tools.scrape.api_key);
    config.tools.aider.api_key = resolve_env_refs(config.tools.aider.api_key);
}

auto parse_size(const char* val, std::size_t fallback) -> std::size_t {
    try {
        auto parsed = std::stoul(val);
        return parsed > 0 ? parsed : fallback;
    } catch (const std::exception& e) {
        LOG_WARN("Ignoring invalid numeric value '{}': {}", val, e.what());
        return fallback;
    }
}

} // anonymous namespace

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        auto config = j.get<Config>();

        if (config.tasks.worker_threads == 0) {
            LOG_WARN("Config: tasks.worker_threads must be positive, using 1");
            config.tasks.worker_threads = 1;
        }

        resolve_key_refs(config);
        return config;
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

auto load_config_from_env() -> Config {
    Config config;
    apply_env_overrides(config);
    return config;
}

void apply_env_overrides(Config& config) {
    if (auto* val = std::getenv("MCPTOOLS_LOG_LEVEL")) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("MCPTOOLS_WORKER_THREADS")) {
        config.tasks.worker_threads = parse_size(val, config.tasks.worker_threads);
    }
    if (auto* val = std::getenv("BRAVE_API_KEY"); val && config.tools.search.api_key.empty()) {
        config.tools.search.api_key = val;
    }
    if (auto* val = std::getenv("SCRAPINGBEE_API_KEY"); val && config.tools.scrape.api_key.empty()) {
        config.tools.scrape.api_key = val;
    }
    if (auto* val = std::getenv("AIDER_API_KEY"); val && config.tools.aider.api_key.empty()) {
        config.tools.aider.api_key = val;
    }
    if (auto* val = std::getenv("AIDER_MODEL"); val && config.tools.aider.model.empty()) {
        config.tools.aider.model = val;
    }
}

auto default_config() -> Config {
    return Config{};
}

auto resolve_env_refs(std::string_view input) -> std::string {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '$') {
            // $${VAR} -> literal ${VAR}
            result += '$';
            i += 2;
            continue;
        }

        if (i + 2 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            auto close = input.find('}', i + 2);
            if (close != std::string_view::npos) {
                std::string var_name(input.substr(i + 2, close - i - 2));

                if (auto* val = std::getenv(var_name.c_str())) {
                    result += val;
                } else {
                    // Unset variables resolve to nothing so the tool is
                    // treated as unconfigured.
                    LOG_DEBUG("Config: unresolved env ref ${{{}}}", var_name);
                }
                i = close + 1;
                continue;
            }
        }

        result += input[i];
        ++i;
    }

    return result;
}

} // namespace mcptools
