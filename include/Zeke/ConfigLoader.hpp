// =================================================================
// include/Zeke/ConfigLoader.hpp
// =================================================================
// YAML configuration of the orchestrator, cache, providers and logging.

#pragma once

#include "Zeke/Logger.hpp"
#include "Zeke/ProviderManager.hpp"
#include "Zeke/RequestOrchestrator.hpp"
#include "Zeke/ResponseCache.hpp"
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace Zeke {

/**
 * @brief Logging section
 */
struct LoggingConfig {
    std::string directory = ".zeke/logs";
    LogLevel console_level = LogLevel::INFO;
    LogLevel file_level = LogLevel::DEBUG;
    bool console = true;
    size_t max_file_size_mb = 10;
    size_t max_files = 5;
};

/**
 * @brief Complete library configuration
 */
struct ZekeConfig {
    OrchestratorConfig orchestrator;
    CacheConfig cache;
    std::vector<ProviderConfig> providers;      ///< Defaults overlaid with the providers section
    LoggingConfig logging;
};

/**
 * @brief Loads ZekeConfig from YAML
 *
 * Missing sections and keys keep their defaults. Malformed values raise
 * OrchestratorError(CONFIGURATION_ERROR).
 */
class ConfigLoader {
public:
    /**
     * @brief Parse a configuration file
     * @param path YAML file
     * @throws OrchestratorError(CONFIGURATION_ERROR) if the file cannot be read or parsed
     */
    static ZekeConfig loadFromFile(const std::string& path);

    /**
     * @brief Parse configuration held in memory
     */
    static ZekeConfig loadFromString(const std::string& yaml);

    /**
     * @brief Configure the Logger singleton
     */
    static void applyLogging(const LoggingConfig& config);

    /**
     * @brief Install provider configurations into a manager
     */
    static void applyProviders(const ZekeConfig& config, ProviderManager& manager);

private:
    static ZekeConfig parse(const YAML::Node& root);
    static void parseOrchestrator(const YAML::Node& node, OrchestratorConfig& config);
    static void parseCache(const YAML::Node& node, CacheConfig& config);
    static void parseProviders(const YAML::Node& node, std::vector<ProviderConfig>& providers);
    static void parseLogging(const YAML::Node& node, LoggingConfig& config);
};

} // namespace Zeke
