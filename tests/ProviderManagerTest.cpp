// =================================================================
// tests/ProviderManagerTest.cpp
// =================================================================
// Unit tests for ProviderManager selection and health tracking, and for
// ConcurrentAssistant built on top of it.

#include "Zeke/ProviderManager.hpp"
#include "Zeke/ConcurrentAssistant.hpp"
#include "Zeke/Logger.hpp"
#include "TestProviders.hpp"
#include <iostream>
#include <cassert>
#include <algorithm>
#include <cmath>
#include <thread>
#include <chrono>

using namespace std::chrono_literals;
using ZekeTest::MockProvider;
using ZekeTest::userMessage;

class ProviderManagerTest {
private:
    template<typename Predicate>
    static bool eventually(Predicate predicate, std::chrono::milliseconds limit = 2000ms) {
        auto deadline = std::chrono::steady_clock::now() + limit;
        while (std::chrono::steady_clock::now() < deadline) {
            if (predicate()) {
                return true;
            }
            std::this_thread::sleep_for(5ms);
        }
        return predicate();
    }

    static std::shared_ptr<Zeke::RequestOrchestrator> makeOrchestrator() {
        Zeke::OrchestratorConfig config;
        config.worker_threads = 8;
        return std::make_shared<Zeke::RequestOrchestrator>(config);
    }

public:
    ProviderManagerTest() {
        Zeke::Logger::getInstance().setConsoleLogLevel(Zeke::LogLevel::ERROR);
    }

    void testDefaultConfigs() {
        std::cout << "Testing default provider configurations..." << std::endl;

        Zeke::ProviderManager manager;
        assert(manager.getConfiguredProviders().size() == 5 && "Five built-in providers");

        auto claude = manager.getProviderConfig(Zeke::ProviderId::CLAUDE);
        assert(claude && claude->priority == 9 && "Claude priority");
        assert(claude->hasCapability(Zeke::ProviderCapability::CODE_ANALYSIS) && "Claude analyses code");
        assert(claude->timeout == 45000ms && "Claude timeout");

        auto copilot = manager.getProviderConfig(Zeke::ProviderId::COPILOT);
        assert(!copilot->hasCapability(Zeke::ProviderCapability::CHAT_COMPLETION) && "Copilot has no chat");

        auto ollama = manager.getProviderConfig(Zeke::ProviderId::OLLAMA);
        assert(ollama->fallback_providers.empty() && "Ollama has no fallbacks");
        assert(ollama->max_requests_per_minute == 1000 && "Ollama rate limit");

        assert(!manager.getProviderConfig(Zeke::ProviderId::XAI) && "Unconfigured provider is absent");

        Zeke::ProviderManager empty(false);
        assert(empty.getConfiguredProviders().empty() && "Defaults can be skipped");

        std::cout << "✓ Default configuration test passed" << std::endl;
    }

    void testSelection() {
        std::cout << "Testing provider selection..." << std::endl;

        Zeke::ProviderManager manager;
        assert(manager.selectBestProvider(Zeke::ProviderCapability::CHAT_COMPLETION) ==
               Zeke::ProviderId::GHOSTLLM && "Highest priority wins without health data");
        assert(manager.selectBestProvider(Zeke::ProviderCapability::SECURITY_SCANNING) ==
               Zeke::ProviderId::GHOSTLLM && "Only ghostllm scans for security");

        auto chain = manager.selectProvidersWithFallback(Zeke::ProviderCapability::CHAT_COMPLETION);
        assert(chain.size() == 3 && "Best plus two fallbacks");
        assert(chain[0] == Zeke::ProviderId::GHOSTLLM && chain[1] == Zeke::ProviderId::CLAUDE &&
               chain[2] == Zeke::ProviderId::OPENAI && "Fallback order follows the config");

        // 10 * 0.1 * (1000 / 1000) * 0.9 falls below claude's 9
        manager.updateHealth(Zeke::ProviderId::GHOSTLLM, false, 1000);
        assert(manager.selectBestProvider(Zeke::ProviderCapability::CHAT_COMPLETION) ==
               Zeke::ProviderId::CLAUDE && "Unhealthy provider loses");

        chain = manager.selectProvidersWithFallback(Zeke::ProviderCapability::CHAT_COMPLETION);
        assert(chain[0] == Zeke::ProviderId::CLAUDE && chain[1] == Zeke::ProviderId::OPENAI &&
               chain[2] == Zeke::ProviderId::OLLAMA && "Claude's fallbacks follow");

        // Claude's fallbacks lack code analysis
        auto analysis = manager.selectProvidersWithFallback(Zeke::ProviderCapability::CODE_ANALYSIS);
        assert(analysis.size() == 1 && analysis[0] == Zeke::ProviderId::CLAUDE &&
               "Fallbacks without the capability are skipped");

        Zeke::ProviderManager empty(false);
        assert(!empty.selectBestProvider(Zeke::ProviderCapability::CHAT_COMPLETION) && "Nothing to select");
        assert(empty.selectProvidersWithFallback(Zeke::ProviderCapability::CHAT_COMPLETION).empty() &&
               "Empty fallback chain");

        std::cout << "✓ Provider selection test passed" << std::endl;
    }

    void testHealthTracking() {
        std::cout << "Testing health tracking..." << std::endl;

        Zeke::ProviderManager manager;
        assert(!manager.getProviderHealth(Zeke::ProviderId::OPENAI) && "No health data initially");

        manager.updateHealth(Zeke::ProviderId::OPENAI, false, 200);
        auto health = manager.getProviderHealth(Zeke::ProviderId::OPENAI);
        assert(health && !health->is_healthy && "Failure marks unhealthy");
        assert(std::fabs(health->error_rate - 0.1f) < 1e-5f && "Error rate moves 10% toward 1");

        manager.updateHealth(Zeke::ProviderId::OPENAI, true, 100);
        health = manager.getProviderHealth(Zeke::ProviderId::OPENAI);
        assert(health->is_healthy && "Success marks healthy");
        assert(std::fabs(health->error_rate - 0.09f) < 1e-5f && "Error rate decays on success");
        assert(health->response_time_ms == 100 && "Latest latency recorded");
        assert(!health->isStale() && "Fresh health data");

        manager.updateHealth(Zeke::ProviderId::CLAUDE, false, 100);
        auto healthy = manager.listHealthyProviders(Zeke::ProviderCapability::CHAT_COMPLETION);
        assert(std::find(healthy.begin(), healthy.end(), Zeke::ProviderId::CLAUDE) == healthy.end() &&
               "Unhealthy provider excluded");
        assert(std::find(healthy.begin(), healthy.end(), Zeke::ProviderId::OLLAMA) != healthy.end() &&
               "Unchecked provider included");

        auto report = manager.getHealthReport();
        assert(report.is_array() && report.size() == 2 && "Report lists checked providers");

        std::cout << "✓ Health tracking test passed" << std::endl;
    }

    void testClientHealthChecks() {
        std::cout << "Testing client health checks..." << std::endl;

        Zeke::ProviderManager manager;
        assert(!manager.healthCheck(Zeke::ProviderId::CLAUDE) && "No client means unhealthy");
        assert(!manager.getProviderHealth(Zeke::ProviderId::CLAUDE) && "No client records nothing");

        manager.registerClient(Zeke::ProviderId::CLAUDE, std::make_shared<MockProvider>("ok"));
        manager.registerClient(Zeke::ProviderId::OPENAI, std::make_shared<MockProvider>("down", 0ms, true));

        manager.performHealthChecks();
        assert(manager.getProviderHealth(Zeke::ProviderId::CLAUDE)->is_healthy && "Claude healthy");
        assert(!manager.getProviderHealth(Zeke::ProviderId::OPENAI)->is_healthy && "OpenAI unhealthy");
        assert(!manager.getProviderHealth(Zeke::ProviderId::OLLAMA) && "Providers without clients skipped");

        std::cout << "✓ Client health check test passed" << std::endl;
    }

    void testParallelChat() {
        std::cout << "Testing ConcurrentAssistant parallel chat..." << std::endl;

        Zeke::ProviderManager manager;
        auto claude = std::make_shared<MockProvider>("from claude", 30ms);
        auto openai = std::make_shared<MockProvider>("from openai", 0ms, true);
        manager.registerClient(Zeke::ProviderId::CLAUDE, claude);
        manager.registerClient(Zeke::ProviderId::OPENAI, openai);

        Zeke::ConcurrentAssistant assistant(manager, makeOrchestrator());

        auto response = assistant.parallelChat(userMessage("hello"), "m", {
            Zeke::ProviderId::OPENAI, Zeke::ProviderId::CLAUDE, Zeke::ProviderId::COPILOT});
        assert(response.content == "from claude" && "Only successful provider wins");

        assert(eventually([&]() {
            auto health = manager.getProviderHealth(Zeke::ProviderId::OPENAI);
            return health && !health->is_healthy;
        }) && "Failed call reported to health tracking");
        assert(eventually([&]() {
            auto health = manager.getProviderHealth(Zeke::ProviderId::CLAUDE);
            return health && health->is_healthy;
        }) && "Successful call reported to health tracking");

        auto all = assistant.broadcastChat(userMessage("hello"), "m",
                                           {Zeke::ProviderId::CLAUDE, Zeke::ProviderId::OPENAI});
        assert(all.size() == 1 && all[0].content == "from claude" && "Broadcast keeps successes");

        assert(assistant.getStats().total_submitted == 4 && "Stats come from the orchestrator");

        bool no_providers = false;
        try {
            assistant.parallelChat(userMessage("hello"), "m", {Zeke::ProviderId::XAI});
        } catch (const Zeke::OrchestratorError& e) {
            no_providers = e.code() == Zeke::ErrorCode::NO_PROVIDERS;
        }
        assert(no_providers && "Providers without clients leave nothing to race");

        std::cout << "✓ Parallel chat test passed" << std::endl;
    }

    void testChatWithBestProviders() {
        std::cout << "Testing best-provider chat..." << std::endl;

        Zeke::ProviderManager manager;
        manager.registerClient(Zeke::ProviderId::GHOSTLLM, std::make_shared<MockProvider>("ghost", 5ms));
        manager.registerClient(Zeke::ProviderId::OLLAMA, std::make_shared<MockProvider>("local", 5ms));

        Zeke::ConcurrentAssistant assistant(manager, makeOrchestrator());
        auto response = assistant.chatWithBestProviders(userMessage("hi"), "m");
        assert(response.content == "ghost" && "Best provider with a client answers");

        Zeke::ProviderManager empty(false);
        Zeke::ConcurrentAssistant bare(empty, makeOrchestrator());
        bool no_candidates = false;
        try {
            bare.chatWithBestProviders(userMessage("hi"), "m");
        } catch (const Zeke::OrchestratorError& e) {
            no_candidates = e.code() == Zeke::ErrorCode::NO_CANDIDATE_MODELS;
        }
        assert(no_candidates && "No chat provider raises NO_CANDIDATE_MODELS");

        bool missing_orchestrator = false;
        try {
            Zeke::ConcurrentAssistant broken(manager, nullptr);
        } catch (const Zeke::OrchestratorError& e) {
            missing_orchestrator = e.code() == Zeke::ErrorCode::CONFIGURATION_ERROR;
        }
        assert(missing_orchestrator && "Assistant requires an orchestrator");

        std::cout << "✓ Best-provider chat test passed" << std::endl;
    }

    void testParallelAnalysis() {
        std::cout << "Testing ConcurrentAssistant parallel analysis..." << std::endl;

        Zeke::ProviderManager manager;
        manager.registerClient(Zeke::ProviderId::CLAUDE, std::make_shared<MockProvider>("slow", 150ms));
        manager.registerClient(Zeke::ProviderId::GHOSTLLM, std::make_shared<MockProvider>("fast", 10ms));

        Zeke::ConcurrentAssistant assistant(manager, makeOrchestrator());
        Zeke::ProjectContext context;
        context.framework = "cmake";

        auto analysis = assistant.parallelAnalysis("int main() {}", Zeke::AnalysisType::STYLE, context,
                                                   {Zeke::ProviderId::CLAUDE, Zeke::ProviderId::GHOSTLLM});
        assert(analysis.analysis == "fast: style review of 13 bytes" && "Fastest analysis wins");

        // Losing contender was cancelled and must not count against its health
        std::this_thread::sleep_for(200ms);
        auto claude = manager.getProviderHealth(Zeke::ProviderId::CLAUDE);
        assert(!claude && "Cancelled contender is not reported");

        assert(assistant.cleanup() == 0 && "Fresh tasks are not purged");

        std::cout << "✓ Parallel analysis test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "=== ProviderManager Tests ===" << std::endl;

        testDefaultConfigs();
        testSelection();
        testHealthTracking();
        testClientHealthChecks();
        testParallelChat();
        testChatWithBestProviders();
        testParallelAnalysis();

        std::cout << "All ProviderManager tests passed!" << std::endl;
    }
};

int main() {
    try {
        ProviderManagerTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All ProviderManager component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
