// =================================================================
// src/Rethink/ConfigLoader.cpp
// =================================================================
// Implementation of the YAML configuration loader.

#include "Rethink/ConfigLoader.hpp"
#include "Rethink/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <set>
#include <stdexcept>

namespace fs = std::filesystem;

namespace Rethink {

namespace {

size_t readCount(const YAML::Node& section, const std::string& key, size_t fallback) {
    if (!section[key]) {
        return fallback;
    }
    long long value = section[key].as<long long>();
    if (value < 0) {
        throw std::invalid_argument("'" + key + "' must not be negative");
    }
    return static_cast<size_t>(value);
}

double readDouble(const YAML::Node& section, const std::string& key, double fallback) {
    return section[key] ? section[key].as<double>() : fallback;
}

std::chrono::milliseconds readMillis(const YAML::Node& section, const std::string& key,
                                     std::chrono::milliseconds fallback) {
    if (!section[key]) {
        return fallback;
    }
    long long value = section[key].as<long long>();
    if (value < 0) {
        throw std::invalid_argument("'" + key + "' must not be negative");
    }
    return std::chrono::milliseconds(value);
}

std::string readString(const YAML::Node& section, const std::string& key, const std::string& fallback) {
    return section[key] ? section[key].as<std::string>() : fallback;
}

} // namespace

std::string cacheModeToString(CacheMode mode) {
    switch (mode) {
        case CacheMode::MEMORY: return "memory";
        case CacheMode::DISK: return "disk";
        case CacheMode::LAYERED: return "layered";
    }
    return "unknown";
}

CacheMode cacheModeFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    if (lower == "memory") return CacheMode::MEMORY;
    if (lower == "disk") return CacheMode::DISK;
    if (lower == "layered") return CacheMode::LAYERED;

    throw std::invalid_argument("Unknown cache mode: " + name);
}

RethinkConfig ConfigLoader::loadFile(const std::string& config_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(config_path);
    } catch (const YAML::BadFile&) {
        throw std::runtime_error("Cannot read configuration file: " + config_path);
    } catch (const YAML::ParserException& e) {
        throw std::runtime_error("Malformed configuration file " + config_path + ": " + e.what());
    }

    RethinkConfig config = parse(root);
    Logger::getInstance().info("ConfigLoader", "Loaded configuration from " + config_path,
        "Endpoints: " + std::to_string(config.endpoints.size()) +
        ", Cache: " + cacheModeToString(config.cache.mode));
    return config;
}

RethinkConfig ConfigLoader::loadString(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::ParserException& e) {
        throw std::runtime_error("Malformed configuration: " + std::string(e.what()));
    }
    return parse(root);
}

RethinkConfig ConfigLoader::parse(const YAML::Node& root) {
    RethinkConfig config;

    try {
        if (root["engine"]) {
            YAML::Node engine = root["engine"];
            ThinkConfig& think = config.think;
            think.max_rounds = readCount(engine, "max_rounds", think.max_rounds);
            think.fanout = readCount(engine, "fanout", think.fanout);
            think.convergence_epsilon = readDouble(engine, "convergence_epsilon", think.convergence_epsilon);
            think.token_budget = readCount(engine, "token_budget", think.token_budget);
            think.generation_params.max_tokens = static_cast<int>(
                readCount(engine, "max_tokens", static_cast<size_t>(think.generation_params.max_tokens)));
            think.generation_params.temperature = readDouble(engine, "temperature",
                                                             think.generation_params.temperature);

            if (engine["stopping_rule"]) {
                config.stopping_rule = stoppingRuleFromString(engine["stopping_rule"].as<std::string>());
            }
            if (engine["budget"]) {
                YAML::Node budget = engine["budget"];
                config.budget_max_calls = readCount(budget, "max_calls", config.budget_max_calls);
                config.budget_max_tokens = readCount(budget, "max_tokens", config.budget_max_tokens);
            }
        }

        if (root["retry"]) {
            YAML::Node retry = root["retry"];
            RetryPolicy& policy = config.think.retry_policy;
            policy.max_attempts = readCount(retry, "max_attempts", policy.max_attempts);
            policy.base_delay = readMillis(retry, "base_delay_ms", policy.base_delay);
            policy.multiplier = readDouble(retry, "multiplier", policy.multiplier);
            policy.jitter_fraction = readDouble(retry, "jitter_fraction", policy.jitter_fraction);
            policy.max_delay = readMillis(retry, "max_delay_ms", policy.max_delay);
            policy.rate_limit_multiplier = readDouble(retry, "rate_limit_multiplier", policy.rate_limit_multiplier);
        }

        if (root["hedge"]) {
            YAML::Node hedge = root["hedge"];
            config.think.enable_hedging = hedge["enabled"] ? hedge["enabled"].as<bool>() : config.think.enable_hedging;
            config.think.hedge_config.hedge_delay = readMillis(hedge, "delay_ms", config.think.hedge_config.hedge_delay);
            config.think.hedge_config.max_hedges = readCount(hedge, "max_hedges", config.think.hedge_config.max_hedges);
        }

        if (root["circuit_breaker"]) {
            YAML::Node breaker = root["circuit_breaker"];
            CircuitBreakerConfig& cb = config.circuit_breaker;
            cb.failure_threshold = readCount(breaker, "failure_threshold", cb.failure_threshold);
            cb.open_duration = readMillis(breaker, "open_duration_ms", cb.open_duration);
            cb.half_open_trial_budget = readCount(breaker, "half_open_trial_budget", cb.half_open_trial_budget);
            cb.half_open_success_threshold = readCount(breaker, "half_open_success_threshold",
                                                       cb.half_open_success_threshold);
        }

        if (root["cache"]) {
            YAML::Node cache = root["cache"];
            CacheSettings& settings = config.cache;
            if (cache["mode"]) {
                settings.mode = cacheModeFromString(cache["mode"].as<std::string>());
            }
            settings.directory = readString(cache, "directory", settings.directory);
            settings.max_entries = readCount(cache, "max_entries", settings.max_entries);
            settings.max_bytes = readCount(cache, "max_bytes", settings.max_bytes);
            settings.disk_max_entries = readCount(cache, "disk_max_entries", settings.disk_max_entries);
            if (cache["ttl_seconds"]) {
                settings.ttl = std::chrono::seconds(readCount(cache, "ttl_seconds", 0));
            }
            config.think.cache_ttl = settings.ttl;
        }

        if (root["scheduler"]) {
            YAML::Node scheduler = root["scheduler"];
            config.scheduler.max_fanout = readCount(scheduler, "max_fanout", config.scheduler.max_fanout);
            config.think.failure_policy.round_retry_limit = readCount(scheduler, "round_retry_limit",
                config.think.failure_policy.round_retry_limit);
            config.think.failure_policy.quorum = readCount(scheduler, "quorum", config.think.failure_policy.quorum);
            config.think.call_deadline = readMillis(scheduler, "call_deadline_ms", config.think.call_deadline);
        }

        if (root["logging"]) {
            config.log_dir = readString(root["logging"], "directory", config.log_dir);
        }

        if (root["endpoints"]) {
            for (const auto& node : root["endpoints"]) {
                EndpointConfig endpoint;
                endpoint.id = readString(node, "id", "");
                endpoint.type = readString(node, "type", endpoint.type);
                endpoint.server_url = readString(node, "server_url", endpoint.server_url);
                endpoint.model = readString(node, "model", endpoint.model);
                config.endpoints.push_back(endpoint);
            }
        }
    } catch (const YAML::Exception& e) {
        throw std::invalid_argument("Invalid configuration value: " + std::string(e.what()));
    }

    validate(config);
    return config;
}

void ConfigLoader::validate(const RethinkConfig& config) {
    config.think.validate();

    if (config.think.fanout > config.scheduler.max_fanout) {
        throw std::invalid_argument("engine.fanout exceeds scheduler.max_fanout");
    }
    if (config.scheduler.max_fanout == 0) {
        throw std::invalid_argument("scheduler.max_fanout must be at least 1");
    }
    if (config.circuit_breaker.failure_threshold == 0) {
        throw std::invalid_argument("circuit_breaker.failure_threshold must be at least 1");
    }
    if (config.circuit_breaker.half_open_trial_budget == 0) {
        throw std::invalid_argument("circuit_breaker.half_open_trial_budget must be at least 1");
    }
    if (config.circuit_breaker.half_open_success_threshold == 0) {
        throw std::invalid_argument("circuit_breaker.half_open_success_threshold must be at least 1");
    }
    if (config.cache.mode != CacheMode::MEMORY && config.cache.directory.empty()) {
        throw std::invalid_argument("cache.directory is required for disk and layered caches");
    }

    std::set<std::string> ids;
    for (const auto& endpoint : config.endpoints) {
        if (endpoint.id.empty()) {
            throw std::invalid_argument("Every endpoint needs an id");
        }
        if (!ids.insert(endpoint.id).second) {
            throw std::invalid_argument("Duplicate endpoint id: " + endpoint.id);
        }
        if (endpoint.type != "ollama") {
            throw std::invalid_argument("Unsupported endpoint type '" + endpoint.type + "' for " + endpoint.id);
        }
    }
}

std::string ConfigLoader::defaultConfigText() {
    return R"(# Rethink configuration

engine:
  max_rounds: 3               # hard upper bound of refinement rounds
  fanout: 3                   # candidates generated per round
  convergence_epsilon: 0.05   # stop when a round improves the score by less
  token_budget: 4096          # history budget for the context manager
  max_tokens: 2048
  temperature: 0.7
  stopping_rule: adaptive     # adaptive | fixed_depth | budget_constrained
  budget:
    max_calls: 0              # budget_constrained only, 0 = unlimited
    max_tokens: 0

retry:
  max_attempts: 3
  base_delay_ms: 200
  multiplier: 2.0
  jitter_fraction: 0.2
  max_delay_ms: 5000
  rate_limit_multiplier: 3.0

hedge:
  enabled: true
  delay_ms: 2000
  max_hedges: 1

circuit_breaker:
  failure_threshold: 5
  open_duration_ms: 30000
  half_open_trial_budget: 1
  half_open_success_threshold: 1

cache:
  mode: memory                # memory | disk | layered
  directory: .rethink/cache
  max_entries: 1000
  max_bytes: 67108864
  disk_max_entries: 0
  ttl_seconds: 3600

scheduler:
  max_fanout: 8
  round_retry_limit: 1
  quorum: 1
  call_deadline_ms: 60000

logging:
  directory: .rethink/logs

endpoints:
  - id: local-llama
    type: ollama
    server_url: http://localhost:11434
    model: llama3:latest
)";
}

void ConfigLoader::writeDefaultConfig(const std::string& config_path) {
    fs::path path(config_path);
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Cannot create directory " + path.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream file(config_path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write configuration file: " + config_path);
    }
    file << defaultConfigText();

    RETHINK_LOG_INFO("ConfigLoader", "Wrote default configuration to " + config_path);
}

} // namespace Rethink
