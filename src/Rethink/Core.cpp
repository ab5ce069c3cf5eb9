// =================================================================
// src/Rethink/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "Rethink/Core.hpp"
#include "Rethink/ConfigLoader.hpp"
#include "Rethink/AdaptiveRefinementEngine.hpp"
#include "Rethink/CacheCoordinator.hpp"
#include "Rethink/CallExecutor.hpp"
#include "Rethink/DefaultCollaborators.hpp"
#include "Rethink/OllamaProvider.hpp"
#include "Rethink/Logger.hpp"
#include <iostream>
#include <iomanip>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace Rethink {

Core::Core(const Commands& commands)
    : m_commands(commands) {}

Core::~Core() = default;

int Core::run() {
    if (m_commands.active_command == "init") {
        return handleInit();
    } else if (m_commands.active_command == "think") {
        return handleThink();
    } else if (m_commands.active_command.empty()) {
        return 0;
    }

    std::cerr << "Error: Unknown command '" << m_commands.active_command << "'." << std::endl;
    return 1;
}

int Core::handleInit() {
    std::cout << "Initializing Rethink configuration..." << std::endl;

    const std::string& configFile = m_commands.config_path;
    if (fs::exists(configFile) && !m_commands.force) {
        std::cout << "Configuration file '" << configFile << "' already exists. Skipping." << std::endl;
        return 0;
    }

    try {
        ConfigLoader::writeDefaultConfig(configFile);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Created default configuration file: " << configFile << std::endl;
    std::cout << "\nIMPORTANT: Please edit " << configFile << " to point `endpoints` at your Ollama servers." << std::endl;
    return 0;
}

int Core::handleThink() {
    auto start_time = std::chrono::steady_clock::now();

    Logger& logger = Logger::getInstance();
    logger.setConsoleLogLevel(m_commands.verbose ? LogLevel::DEBUG : LogLevel::WARNING);

    RethinkConfig config;
    try {
        config = ConfigLoader::loadFile(m_commands.config_path);
        applyOverrides(config);
        ConfigLoader::validate(config);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "Please run 'rethink init' and edit the configuration file." << std::endl;
        return 1;
    }

    if (config.endpoints.empty()) {
        std::cerr << "Error: no endpoints configured in " << m_commands.config_path << std::endl;
        return 1;
    }

    logger.initialize(config.log_dir);
    logger.logSessionStart("think", m_commands.query);

    int exit_code = 0;
    try {
        CircuitBreakerRegistry registry(config.circuit_breaker);
        CallExecutor executor(registry);
        CacheCoordinator cache(createCacheBackend(config), config.cache.ttl);

        std::vector<std::shared_ptr<GenerationProvider>> providers;
        for (const auto& endpoint : config.endpoints) {
            providers.push_back(std::make_shared<OllamaProvider>(endpoint.id, endpoint.server_url, endpoint.model));
        }

        ParallelThinkingScheduler scheduler(providers, executor, cache,
                                            std::make_shared<HeuristicQualityEvaluator>(), config.scheduler);
        AdaptiveRefinementEngine engine(scheduler, registry,
                                        std::make_shared<TokenBudgetContextManager>(),
                                        std::make_shared<InMemoryConversationStore>(),
                                        makeStoppingStrategy(config.stopping_rule,
                                                             config.budget_max_calls,
                                                             config.budget_max_tokens));

        FinalAnswer answer = engine.think(m_commands.query, m_commands.conversation_id, config.think);
        printAnswer(answer);

        CacheStatistics cache_stats = cache.getStatistics();
        logger.info("Core", "Cache statistics",
            "Hits: " + std::to_string(cache_stats.hits) + ", Misses: " + std::to_string(cache_stats.misses) +
            ", Joins: " + std::to_string(cache_stats.joins) +
            ", Backend errors: " + std::to_string(cache_stats.backend_errors));
    } catch (const AllCandidatesFailedError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code = 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code = 1;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    logger.logSessionEnd("think", exit_code, duration.count());
    return exit_code;
}

std::unique_ptr<CacheBackend> Core::createCacheBackend(const RethinkConfig& config) {
    MemoryCacheConfig memory_config;
    memory_config.max_entries = config.cache.max_entries;
    memory_config.max_bytes = config.cache.max_bytes;

    switch (config.cache.mode) {
        case CacheMode::DISK:
            return std::make_unique<DiskCacheBackend>(config.cache.directory, config.cache.disk_max_entries);
        case CacheMode::LAYERED:
            return std::make_unique<LayeredCacheBackend>(
                std::make_unique<MemoryCacheBackend>(memory_config),
                std::make_unique<DiskCacheBackend>(config.cache.directory, config.cache.disk_max_entries));
        case CacheMode::MEMORY:
            break;
    }
    return std::make_unique<MemoryCacheBackend>(memory_config);
}

void Core::applyOverrides(RethinkConfig& config) const {
    if (m_commands.max_rounds > 0) {
        config.think.max_rounds = m_commands.max_rounds;
    }
    if (m_commands.fanout > 0) {
        config.think.fanout = m_commands.fanout;
    }
    if (m_commands.epsilon >= 0.0) {
        config.think.convergence_epsilon = m_commands.epsilon;
    }
}

void Core::printAnswer(const FinalAnswer& answer) const {
    std::cout << answer.text << std::endl << std::endl;

    std::cout << "--- Provenance ---" << std::endl;
    std::cout << "Rounds used:  " << answer.rounds_used << std::endl;
    std::cout << "Best round:   " << answer.best_round_index
              << " (score " << std::fixed << std::setprecision(2) << answer.best_score << ")" << std::endl;
    std::cout << "Stop reason:  " << stopReasonToString(answer.stop_reason) << std::endl;
    std::cout << "Cost:         " << answer.total_cost.calls << " calls, ~"
              << answer.total_cost.tokens << " tokens" << std::endl;
    if (answer.recursion_failed) {
        std::cout << "Warning:      refinement ended early: " << answer.failure_message << std::endl;
    }
    for (const auto& entry : answer.breaker_states) {
        std::cout << "Breaker:      " << entry.first << " = " << breakerStateToString(entry.second) << std::endl;
    }
}

} // namespace Rethink
