// =================================================================
// include/Rethink/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "Rethink/CliParser.hpp"
#include <memory>
#include <string>

namespace Rethink {

struct RethinkConfig;
struct FinalAnswer;
class CacheBackend;

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    ~Core();

    /**
     * @brief Runs the main application logic based on parsed commands.
     * @return An integer exit code (0 for success).
     */
    int run();

    /**
     * @brief Build the cache backend selected by the configuration
     */
    static std::unique_ptr<CacheBackend> createCacheBackend(const RethinkConfig& config);

private:
    // Command Handlers
    int handleInit();
    int handleThink();

    void applyOverrides(RethinkConfig& config) const;
    void printAnswer(const FinalAnswer& answer) const;

    const Commands& m_commands;
};

} // namespace Rethink
