// =================================================================
// src/Zeke/ConfigLoader.cpp
// =================================================================

#include "Zeke/ConfigLoader.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>

namespace Zeke {

namespace {

[[noreturn]] void configError(const std::string& message) {
    throw OrchestratorError(ErrorCode::CONFIGURATION_ERROR, message);
}

template<typename T>
T readValue(const YAML::Node& node, const std::string& key, const T& fallback) {
    if (!node[key]) {
        return fallback;
    }
    try {
        return node[key].as<T>();
    } catch (const YAML::Exception& e) {
        configError("Invalid value for '" + key + "': " + e.what());
    }
}

std::chrono::seconds readSeconds(const YAML::Node& node, const std::string& key,
                                 std::chrono::seconds fallback) {
    long long value = readValue<long long>(node, key, fallback.count());
    if (value < 0) {
        configError("'" + key + "' must not be negative");
    }
    return std::chrono::seconds(value);
}

LogLevel readLevel(const YAML::Node& node, const std::string& key, LogLevel fallback) {
    if (!node[key]) {
        return fallback;
    }
    std::string name = readValue<std::string>(node, key, "");
    try {
        return Logger::parseLevel(name);
    } catch (const std::invalid_argument&) {
        configError("Invalid log level for '" + key + "': " + name);
    }
}

} // namespace

ZekeConfig ConfigLoader::loadFromFile(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        configError("Failed to load configuration " + path + ": " + e.what());
    }

    ZekeConfig config = parse(root);
    ZEKE_LOG_INFO("ConfigLoader", "Loaded configuration from " + path);
    return config;
}

ZekeConfig ConfigLoader::loadFromString(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        configError("Failed to parse configuration: " + std::string(e.what()));
    }
    return parse(root);
}

ZekeConfig ConfigLoader::parse(const YAML::Node& root) {
    ZekeConfig config;
    config.providers = ProviderManager::defaultConfigs();

    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        configError("Configuration root must be a mapping");
    }

    if (root["orchestrator"]) {
        parseOrchestrator(root["orchestrator"], config.orchestrator);
    }
    if (root["cache"]) {
        parseCache(root["cache"], config.cache);
    }
    if (root["providers"]) {
        parseProviders(root["providers"], config.providers);
    }
    if (root["logging"]) {
        parseLogging(root["logging"], config.logging);
    }
    return config;
}

void ConfigLoader::parseOrchestrator(const YAML::Node& node, OrchestratorConfig& config) {
    if (node["executor"]) {
        std::string name = readValue<std::string>(node, "executor", "");
        try {
            config.executor_type = stringToExecutorType(name);
        } catch (const std::invalid_argument&) {
            configError("Unknown executor type: " + name);
        }
    }

    long long workers = readValue<long long>(node, "worker_threads",
                                             static_cast<long long>(config.worker_threads));
    if (workers < 0) {
        configError("'worker_threads' must not be negative");
    }
    config.worker_threads = static_cast<size_t>(workers);

    config.enforce_timeouts = readValue<bool>(node, "enforce_timeouts", config.enforce_timeouts);
    config.cleanup_threshold = readSeconds(node, "cleanup_threshold_seconds", config.cleanup_threshold);
    config.auto_cleanup = readValue<bool>(node, "auto_cleanup", config.auto_cleanup);
    config.cleanup_interval = readSeconds(node, "cleanup_interval_seconds", config.cleanup_interval);

    if (config.auto_cleanup && config.cleanup_interval.count() == 0) {
        configError("'cleanup_interval_seconds' must be positive when auto_cleanup is enabled");
    }
}

void ConfigLoader::parseCache(const YAML::Node& node, CacheConfig& config) {
    config.enabled = readValue<bool>(node, "enabled", config.enabled);
    config.db_path = readValue<std::string>(node, "db_path", config.db_path);
    config.ttl = readSeconds(node, "ttl_seconds", config.ttl);

    long long max_entries = readValue<long long>(node, "max_entries",
                                                 static_cast<long long>(config.max_entries));
    if (max_entries <= 0) {
        configError("'max_entries' must be positive");
    }
    config.max_entries = static_cast<size_t>(max_entries);

    config.temperature = readValue<double>(node, "temperature", config.temperature);
    config.top_p = readValue<double>(node, "top_p", config.top_p);
    if (config.top_p < 0.0 || config.top_p > 1.0) {
        configError("'top_p' must be between 0 and 1");
    }
}

void ConfigLoader::parseProviders(const YAML::Node& node, std::vector<ProviderConfig>& providers) {
    if (!node.IsMap()) {
        configError("'providers' must be a mapping of provider name to settings");
    }

    for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
        std::string name = it->first.as<std::string>();
        ProviderId id = ProviderId::CLAUDE;
        try {
            id = stringToProvider(name);
        } catch (const std::invalid_argument&) {
            configError("Unknown provider: " + name);
        }

        auto existing = std::find_if(providers.begin(), providers.end(),
                                     [id](const ProviderConfig& c) { return c.provider == id; });
        if (existing == providers.end()) {
            ProviderConfig fresh;
            fresh.provider = id;
            providers.push_back(fresh);
            existing = providers.end() - 1;
        }
        ProviderConfig& config = *existing;
        const YAML::Node settings = it->second;

        int priority = readValue<int>(settings, "priority", config.priority);
        if (priority < 1 || priority > 10) {
            configError("Priority for " + name + " must be between 1 and 10");
        }
        config.priority = static_cast<uint8_t>(priority);

        if (settings["capabilities"]) {
            auto names = readValue<std::vector<std::string>>(settings, "capabilities", {});
            config.capabilities.clear();
            for (const auto& capability : names) {
                try {
                    config.capabilities.push_back(stringToCapability(capability));
                } catch (const std::invalid_argument&) {
                    configError("Unknown capability for " + name + ": " + capability);
                }
            }
        }

        config.max_requests_per_minute = readValue<uint32_t>(settings, "max_requests_per_minute",
                                                             config.max_requests_per_minute);

        long long timeout_ms = readValue<long long>(settings, "timeout_ms", config.timeout.count());
        if (timeout_ms < 0) {
            configError("'timeout_ms' for " + name + " must not be negative");
        }
        config.timeout = std::chrono::milliseconds(timeout_ms);

        if (settings["fallback"]) {
            auto names = readValue<std::vector<std::string>>(settings, "fallback", {});
            config.fallback_providers.clear();
            for (const auto& fallback : names) {
                try {
                    config.fallback_providers.push_back(stringToProvider(fallback));
                } catch (const std::invalid_argument&) {
                    configError("Unknown fallback provider for " + name + ": " + fallback);
                }
            }
        }
    }
}

void ConfigLoader::parseLogging(const YAML::Node& node, LoggingConfig& config) {
    config.directory = readValue<std::string>(node, "directory", config.directory);
    config.console_level = readLevel(node, "console_level", config.console_level);
    config.file_level = readLevel(node, "file_level", config.file_level);
    config.console = readValue<bool>(node, "console", config.console);
    config.max_file_size_mb = readValue<size_t>(node, "max_file_size_mb", config.max_file_size_mb);
    config.max_files = readValue<size_t>(node, "max_files", config.max_files);
}

void ConfigLoader::applyLogging(const LoggingConfig& config) {
    auto& logger = Logger::getInstance();
    logger.initialize(config.directory, config.max_file_size_mb * 1024 * 1024, config.max_files);
    logger.setConsoleLogLevel(config.console_level);
    logger.setFileLogLevel(config.file_level);
    logger.setConsoleLogging(config.console);
}

void ConfigLoader::applyProviders(const ZekeConfig& config, ProviderManager& manager) {
    for (const auto& provider : config.providers) {
        manager.setProviderConfig(provider);
    }
}

} // namespace Zeke
