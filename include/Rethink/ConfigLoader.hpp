// =================================================================
// include/Rethink/ConfigLoader.hpp
// =================================================================
// Loads the .rethink/config.yml configuration file.

#pragma once

#include "Rethink/AdaptiveRefinementEngine.hpp"
#include "Rethink/CircuitBreaker.hpp"
#include "Rethink/ParallelThinkingScheduler.hpp"
#include "Rethink/StoppingStrategy.hpp"
#include <string>
#include <vector>
#include <chrono>

namespace YAML {
class Node;
}

namespace Rethink {

/**
 * @brief One upstream endpoint
 */
struct EndpointConfig {
    std::string id;                               ///< Breaker key, unique
    std::string type = "ollama";                  ///< Provider type
    std::string server_url = "http://localhost:11434";
    std::string model = "llama3:latest";
};

/**
 * @brief Cache storage modes
 */
enum class CacheMode {
    MEMORY,
    DISK,
    LAYERED
};

std::string cacheModeToString(CacheMode mode);
CacheMode cacheModeFromString(const std::string& name);

/**
 * @brief Cache section
 */
struct CacheSettings {
    CacheMode mode = CacheMode::MEMORY;
    std::string directory = ".rethink/cache";     ///< Disk backend directory
    size_t max_entries = 1000;                    ///< Memory entry budget
    size_t max_bytes = 64 * 1024 * 1024;          ///< Memory byte budget
    size_t disk_max_entries = 0;                  ///< Disk entry budget, 0 = unlimited
    std::chrono::milliseconds ttl{3600000};
};

/**
 * @brief Complete configuration of the command-line front end
 */
struct RethinkConfig {
    ThinkConfig think;                            ///< engine, retry, hedge and scheduler policy
    StoppingRule stopping_rule = StoppingRule::ADAPTIVE;
    size_t budget_max_calls = 0;                  ///< BUDGET_CONSTRAINED only
    size_t budget_max_tokens = 0;                 ///< BUDGET_CONSTRAINED only
    CircuitBreakerConfig circuit_breaker;
    CacheSettings cache;
    SchedulerConfig scheduler;
    std::vector<EndpointConfig> endpoints;
    std::string log_dir = ".rethink/logs";
};

class ConfigLoader {
public:
    /**
     * @brief Load and validate a configuration file
     * @throws std::runtime_error if the file cannot be read or parsed
     * @throws std::invalid_argument if a value is out of range
     */
    static RethinkConfig loadFile(const std::string& config_path);

    /**
     * @brief Load and validate configuration from YAML text
     */
    static RethinkConfig loadString(const std::string& yaml_text);

    /**
     * @brief Reject nonsensical values
     * @throws std::invalid_argument
     */
    static void validate(const RethinkConfig& config);

    /**
     * @brief Commented default configuration written by `rethink init`
     */
    static std::string defaultConfigText();

    /**
     * @brief Write the default configuration, creating parent directories
     * @throws std::runtime_error if the file cannot be written
     */
    static void writeDefaultConfig(const std::string& config_path);

private:
    static RethinkConfig parse(const YAML::Node& root);
};

} // namespace Rethink
