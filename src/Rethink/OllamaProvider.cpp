// =================================================================
// src/Rethink/OllamaProvider.cpp
// =================================================================
// Implementation of the Ollama generation provider.

#include "Rethink/OllamaProvider.hpp"
#include "Rethink/Logger.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"
#include <algorithm>

namespace Rethink {

namespace {

// Trim surrounding whitespace from the model output
void trimWhitespace(std::string& s) {
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(), s.end());
}

} // namespace

OllamaProvider::OllamaProvider(const std::string& endpoint_id, const std::string& server_url,
                               const std::string& model_name)
    : m_endpoint_id(endpoint_id), m_server_url(server_url), m_model_name(model_name) {
    Logger::getInstance().info("OllamaProvider", "Configured endpoint " + endpoint_id,
        "Server: " + server_url + ", Model: " + model_name);
}

std::string OllamaProvider::generate(const std::string& prompt,
                                     const GenerationParams& params,
                                     const CancellationToken& token) {
    token.throwIfCancelled();

    // The httplib constructor handles URL parsing automatically.
    httplib::Client client(m_server_url.c_str());
    long long timeout_ms = params.timeout.count();
    client.set_read_timeout(static_cast<time_t>(timeout_ms / 1000), static_cast<time_t>((timeout_ms % 1000) * 1000));
    client.set_connection_timeout(10, 0);

    nlohmann::json options = {
        {"num_predict", params.max_tokens},
        {"temperature", params.temperature},
        {"seed", params.seed}
    };
    for (const auto& option : params.extra) {
        options[option.first] = option.second;
    }

    nlohmann::json request_body = {
        {"model", m_model_name},
        {"prompt", prompt},
        {"stream", false},
        {"options", options}
    };

    httplib::Headers headers = {{"Content-Type", "application/json"}};
    auto res = client.Post("/api/generate", headers, request_body.dump(), "application/json");

    if (!res) {
        bool timed_out = res.error() == httplib::Error::Read;
        throw GenerationError(ErrorKind::TRANSIENT,
            "Failed to reach Ollama server at " + m_server_url + ": " + httplib::to_string(res.error()),
            timed_out);
    }

    if (res->status != 200) {
        ErrorKind kind = classifyStatus(res->status);
        Logger::getInstance().debug("OllamaProvider", "Request failed on " + m_endpoint_id,
            "Status: " + std::to_string(res->status) + ", Kind: " + errorKindToString(kind));
        throw GenerationError(kind, "Ollama server returned error status: " +
                              std::to_string(res->status) + " - " + res->body);
    }

    // The caller may have given up while the request was running
    token.throwIfCancelled();

    std::string text;
    try {
        auto json_response = nlohmann::json::parse(res->body);
        text = json_response.value("response", std::string());
    } catch (const nlohmann::json::exception& e) {
        throw GenerationError(ErrorKind::TRANSIENT, "Malformed Ollama response: " + std::string(e.what()));
    }

    trimWhitespace(text);
    return text;
}

ErrorKind OllamaProvider::classifyStatus(int status) {
    if (status == 429) {
        return ErrorKind::RATE_LIMITED;
    }
    if (status == 401 || status == 403) {
        return ErrorKind::UNAUTHORIZED;
    }
    if (status == 408) {
        return ErrorKind::TRANSIENT;
    }
    if (status >= 400 && status < 500) {
        return ErrorKind::INVALID_REQUEST;
    }
    return ErrorKind::TRANSIENT;
}

} // namespace Rethink
