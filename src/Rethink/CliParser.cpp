// =================================================================
// src/Rethink/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Rethink/CliParser.hpp"

namespace Rethink {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Rethink: resilient multi-round answer refinement over unreliable LLM endpoints.");
    m_app->require_subcommand(0, 1);

    m_app->add_option("--config", m_commands.config_path, "Path to the configuration file (default: .rethink/config.yml)");
    m_app->add_flag("-v,--verbose", m_commands.verbose, "Show debug output on the console");

    // Set command callback to store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    setupInitCommand(*m_app);
    setupThinkCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupInitCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("init", "Writes a default Rethink configuration file.");
    sub->add_flag("--force", m_commands.force, "Overwrite an existing configuration file");
}

void CliParser::setupThinkCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("think", "Refines an answer to a question over several rounds.");
    sub->add_option("query", m_commands.query, "The question to answer.")->required();
    sub->add_option("-c,--conversation", m_commands.conversation_id, "Conversation id (default: default)");
    sub->add_option("--max-rounds", m_commands.max_rounds, "Maximum number of refinement rounds")->check(CLI::PositiveNumber);
    sub->add_option("--fanout", m_commands.fanout, "Candidates generated per round")->check(CLI::PositiveNumber);
    sub->add_option("--epsilon", m_commands.epsilon, "Convergence epsilon")->check(CLI::NonNegativeNumber);
}

} // namespace Rethink
