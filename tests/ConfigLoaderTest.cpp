// =================================================================
// tests/ConfigLoaderTest.cpp
// =================================================================
// Unit tests for YAML configuration loading.

#include "Zeke/ConfigLoader.hpp"
#include "Zeke/Logger.hpp"
#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ConfigLoaderTest {
private:
    fs::path m_test_dir = fs::temp_directory_path() / "zeke_config_test";

    static bool rejects(const std::string& yaml) {
        try {
            Zeke::ConfigLoader::loadFromString(yaml);
        } catch (const Zeke::OrchestratorError& e) {
            return e.code() == Zeke::ErrorCode::CONFIGURATION_ERROR;
        }
        return false;
    }

    static const Zeke::ProviderConfig& findProvider(const Zeke::ZekeConfig& config, Zeke::ProviderId id) {
        for (const auto& provider : config.providers) {
            if (provider.provider == id) {
                return provider;
            }
        }
        throw std::runtime_error("provider missing from config: " + Zeke::providerToString(id));
    }

public:
    ConfigLoaderTest() {
        Zeke::Logger::getInstance().setConsoleLogLevel(Zeke::LogLevel::ERROR);
        fs::remove_all(m_test_dir);
        fs::create_directories(m_test_dir);
    }

    ~ConfigLoaderTest() {
        fs::remove_all(m_test_dir);
    }

    void testDefaults() {
        std::cout << "Testing default configuration..." << std::endl;

        auto config = Zeke::ConfigLoader::loadFromString("");
        assert(config.orchestrator.executor_type == Zeke::ExecutorType::THREAD_POOL && "Default executor");
        assert(config.orchestrator.enforce_timeouts && "Timeouts enforced by default");
        assert(config.orchestrator.cleanup_threshold == std::chrono::seconds(300) && "Default threshold");
        assert(config.cache.enabled && config.cache.max_entries == 1000 && "Default cache");
        assert(config.cache.ttl == std::chrono::seconds(3600) && "Default TTL");
        assert(config.providers.size() == 5 && "Built-in providers present");
        assert(config.logging.console_level == Zeke::LogLevel::INFO && "Default console level");

        std::cout << "✓ Default configuration test passed" << std::endl;
    }

    void testFullDocument() {
        std::cout << "Testing full configuration document..." << std::endl;

        const std::string yaml = R"(
orchestrator:
  executor: async
  worker_threads: 6
  enforce_timeouts: false
  cleanup_threshold_seconds: 120
  auto_cleanup: true
  cleanup_interval_seconds: 30
cache:
  enabled: true
  db_path: /tmp/zeke/cache.db
  ttl_seconds: 600
  max_entries: 250
  temperature: 0.2
  top_p: 0.5
providers:
  claude:
    priority: 10
    timeout_ms: 20000
    fallback: [ollama]
  xai:
    priority: 6
    capabilities: [chat_completion, streaming]
    max_requests_per_minute: 30
logging:
  directory: /tmp/zeke/logs
  console_level: warn
  file_level: info
  console: false
  max_file_size_mb: 2
  max_files: 3
)";

        auto config = Zeke::ConfigLoader::loadFromString(yaml);

        assert(config.orchestrator.executor_type == Zeke::ExecutorType::ASYNC && "Executor parsed");
        assert(config.orchestrator.worker_threads == 6 && "Worker count parsed");
        assert(!config.orchestrator.enforce_timeouts && "Timeout enforcement parsed");
        assert(config.orchestrator.cleanup_threshold == std::chrono::seconds(120) && "Threshold parsed");
        assert(config.orchestrator.auto_cleanup && "Auto cleanup parsed");
        assert(config.orchestrator.cleanup_interval == std::chrono::seconds(30) && "Interval parsed");

        assert(config.cache.db_path == "/tmp/zeke/cache.db" && "Cache path parsed");
        assert(config.cache.ttl == std::chrono::seconds(600) && "TTL parsed");
        assert(config.cache.max_entries == 250 && "Capacity parsed");
        assert(config.cache.temperature == 0.2 && config.cache.top_p == 0.5 && "Sampling parsed");

        assert(config.providers.size() == 6 && "New provider appended to defaults");
        const auto& claude = findProvider(config, Zeke::ProviderId::CLAUDE);
        assert(claude.priority == 10 && "Priority overridden");
        assert(claude.timeout == std::chrono::milliseconds(20000) && "Timeout overridden");
        assert(claude.fallback_providers.size() == 1 &&
               claude.fallback_providers[0] == Zeke::ProviderId::OLLAMA && "Fallbacks replaced");
        assert(claude.hasCapability(Zeke::ProviderCapability::CODE_ANALYSIS) && "Unset keys keep defaults");

        const auto& xai = findProvider(config, Zeke::ProviderId::XAI);
        assert(xai.priority == 6 && xai.max_requests_per_minute == 30 && "New provider parsed");
        assert(xai.hasCapability(Zeke::ProviderCapability::STREAMING) && "Capabilities parsed");

        assert(config.logging.directory == "/tmp/zeke/logs" && "Log directory parsed");
        assert(config.logging.console_level == Zeke::LogLevel::WARNING && "Console level parsed");
        assert(config.logging.file_level == Zeke::LogLevel::INFO && "File level parsed");
        assert(!config.logging.console && "Console flag parsed");
        assert(config.logging.max_file_size_mb == 2 && config.logging.max_files == 3 && "Rotation parsed");

        Zeke::ProviderManager manager(false);
        Zeke::ConfigLoader::applyProviders(config, manager);
        assert(manager.getConfiguredProviders().size() == 6 && "Providers installed into the manager");
        assert(manager.selectBestProvider(Zeke::ProviderCapability::CHAT_COMPLETION) ==
               Zeke::ProviderId::CLAUDE && "Ties go to the provider ordered first");

        std::cout << "✓ Full document test passed" << std::endl;
    }

    void testInvalidValues() {
        std::cout << "Testing invalid configuration values..." << std::endl;

        assert(rejects("- just\n- a list\n") && "Root must be a mapping");
        assert(rejects("orchestrator:\n  executor: fibers\n") && "Unknown executor");
        assert(rejects("orchestrator:\n  worker_threads: -1\n") && "Negative workers");
        assert(rejects("orchestrator:\n  cleanup_threshold_seconds: -5\n") && "Negative threshold");
        assert(rejects("orchestrator:\n  auto_cleanup: true\n  cleanup_interval_seconds: 0\n") &&
               "Zero interval with auto cleanup");
        assert(rejects("orchestrator:\n  enforce_timeouts: maybe\n") && "Non-boolean flag");
        assert(rejects("cache:\n  max_entries: 0\n") && "Zero capacity");
        assert(rejects("cache:\n  top_p: 1.5\n") && "top_p out of range");
        assert(rejects("cache:\n  ttl_seconds: soon\n") && "Non-numeric TTL");
        assert(rejects("providers:\n  - claude\n") && "Providers must be a mapping");
        assert(rejects("providers:\n  skynet:\n    priority: 5\n") && "Unknown provider");
        assert(rejects("providers:\n  claude:\n    priority: 11\n") && "Priority out of range");
        assert(rejects("providers:\n  claude:\n    capabilities: [telepathy]\n") && "Unknown capability");
        assert(rejects("providers:\n  claude:\n    fallback: [skynet]\n") && "Unknown fallback");
        assert(rejects("logging:\n  console_level: loud\n") && "Unknown log level");
        assert(rejects("orchestrator: [unclosed\n") && "Malformed YAML");

        std::cout << "✓ Invalid values test passed" << std::endl;
    }

    void testLoadFromFile() {
        std::cout << "Testing configuration file loading..." << std::endl;

        fs::path path = m_test_dir / "zeke.yaml";
        {
            std::ofstream file(path);
            file << "cache:\n  enabled: false\norchestrator:\n  executor: inline\n";
        }

        auto config = Zeke::ConfigLoader::loadFromFile(path.string());
        assert(!config.cache.enabled && "Cache flag read from file");
        assert(config.orchestrator.executor_type == Zeke::ExecutorType::INLINE && "Executor read from file");

        bool missing = false;
        try {
            Zeke::ConfigLoader::loadFromFile((m_test_dir / "absent.yaml").string());
        } catch (const Zeke::OrchestratorError& e) {
            missing = e.code() == Zeke::ErrorCode::CONFIGURATION_ERROR;
        }
        assert(missing && "Missing file raises CONFIGURATION_ERROR");

        std::cout << "✓ File loading test passed" << std::endl;
    }

    void testApplyLogging() {
        std::cout << "Testing logging configuration..." << std::endl;

        Zeke::LoggingConfig logging;
        logging.directory = (m_test_dir / "logs").string();
        logging.console_level = Zeke::LogLevel::ERROR;
        logging.console = false;
        Zeke::ConfigLoader::applyLogging(logging);

        Zeke::Logger::getInstance().warning("ConfigLoaderTest", "written to the configured directory");
        Zeke::Logger::getInstance().flush();

        bool found = false;
        for (const auto& entry : fs::directory_iterator(logging.directory)) {
            found = found || entry.path().extension() == ".log";
        }
        assert(found && "Logger writes into the configured directory");

        std::cout << "✓ Logging configuration test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "=== ConfigLoader Tests ===" << std::endl;

        testDefaults();
        testFullDocument();
        testInvalidValues();
        testLoadFromFile();
        testApplyLogging();

        std::cout << "All ConfigLoader tests passed!" << std::endl;
    }
};

int main() {
    try {
        ConfigLoaderTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All ConfigLoader component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
