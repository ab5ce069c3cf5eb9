// =================================================================
// include/Rethink/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>

namespace Rethink {

// A simple struct to hold parsed command information.
struct Commands {
    std::string active_command; // Name of the subcommand triggered

    std::string config_path = ".rethink/config.yml";
    bool verbose = false;

    // Options for 'think'
    std::string query;
    std::string conversation_id = "default";
    size_t max_rounds = 0;      // 0 = use the configuration file
    size_t fanout = 0;          // 0 = use the configuration file
    double epsilon = -1.0;      // negative = use the configuration file

    // Options for 'init'
    bool force = false;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI commands, options, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupInitCommand(CLI::App& app);
    void setupThinkCommand(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Rethink
