// =================================================================
// include/Rethink/OllamaProvider.hpp
// =================================================================
// Generation provider backed by an Ollama server.

#pragma once

#include "Rethink/GenerationProvider.hpp"
#include "Rethink/ResilienceErrors.hpp"
#include <string>

namespace Rethink {

class OllamaProvider : public GenerationProvider {
public:
    /**
     * @brief Constructs the Ollama client.
     * @param endpoint_id Breaker key of this endpoint
     * @param server_url The base URL of the Ollama server (e.g., http://localhost:11434).
     * @param model_name The name of the model to use (e.g., llama3:latest).
     */
    OllamaProvider(const std::string& endpoint_id, const std::string& server_url, const std::string& model_name);

    /**
     * @brief Run one non-streaming generation
     * @throws GenerationError classified from the HTTP outcome
     */
    std::string generate(const std::string& prompt,
                         const GenerationParams& params,
                         const CancellationToken& token) override;

    std::string getEndpointId() const override { return m_endpoint_id; }

    const std::string& getServerUrl() const { return m_server_url; }
    const std::string& getModelName() const { return m_model_name; }

    /**
     * @brief Map an HTTP status to an error kind
     *
     * 429 is RATE_LIMITED, 401 and 403 are UNAUTHORIZED, other 4xx are
     * INVALID_REQUEST, everything else is TRANSIENT.
     */
    static ErrorKind classifyStatus(int status);

private:
    std::string m_endpoint_id;
    std::string m_server_url;
    std::string m_model_name;
};

} // namespace Rethink
