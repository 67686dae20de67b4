// =================================================================
// tests/TestProviders.hpp
// =================================================================
// Mock provider clients shared by the unit tests.

#pragma once

#include "Zeke/ProviderClient.hpp"
#include <atomic>
#include <chrono>
#include <string>
#include <thread>

namespace ZekeTest {

/**
 * @brief Configurable provider that sleeps, then answers or throws
 *
 * Tracks how many calls are in flight at once so tests can check
 * concurrency bounds.
 */
class MockProvider : public Zeke::ProviderClient {
public:
    MockProvider(std::string content,
                 std::chrono::milliseconds delay = std::chrono::milliseconds(0),
                 bool fail = false,
                 Zeke::ErrorCode error_code = Zeke::ErrorCode::PROVIDER_ERROR)
        : m_content(std::move(content)), m_delay(delay), m_fail(fail), m_error_code(error_code) {}

    Zeke::ChatResponse chatCompletion(const std::vector<Zeke::ChatMessage>& /*messages*/,
                                      const std::string& model) override {
        enter();
        if (m_fail) {
            leave();
            throw Zeke::ProviderError("mock failure from " + m_content, m_error_code);
        }
        leave();

        Zeke::ChatResponse response;
        response.content = m_content;
        response.model = model;
        Zeke::Usage usage;
        usage.prompt_tokens = 10;
        usage.completion_tokens = 5;
        usage.total_tokens = 15;
        response.usage = usage;
        return response;
    }

    Zeke::AnalysisResponse codeAnalysis(const std::string& code, Zeke::AnalysisType analysis_type,
                                        const Zeke::ProjectContext& /*project_context*/) override {
        enter();
        if (m_fail) {
            leave();
            throw Zeke::ProviderError("mock analysis failure from " + m_content, m_error_code);
        }
        leave();

        Zeke::AnalysisResponse response;
        response.analysis = m_content + ": " + Zeke::analysisTypeToString(analysis_type) +
                            " review of " + std::to_string(code.size()) + " bytes";
        response.suggestions = {"extract function"};
        response.confidence = 0.8f;
        return response;
    }

    bool healthCheck() override {
        return !m_fail;
    }

    int getCallCount() const { return m_calls.load(); }
    int getMaxConcurrent() const { return m_max_in_flight.load(); }

private:
    std::string m_content;
    std::chrono::milliseconds m_delay;
    bool m_fail;
    Zeke::ErrorCode m_error_code;

    std::atomic<int> m_calls{0};
    std::atomic<int> m_in_flight{0};
    std::atomic<int> m_max_in_flight{0};

    void enter() {
        m_calls++;
        int now = ++m_in_flight;
        int seen = m_max_in_flight.load();
        while (now > seen && !m_max_in_flight.compare_exchange_weak(seen, now)) {
        }
        if (m_delay.count() > 0) {
            std::this_thread::sleep_for(m_delay);
        }
    }

    void leave() {
        --m_in_flight;
    }
};

/**
 * @brief Echo provider whose in-flight counters are shared across clients
 */
class SharedGaugeProvider : public Zeke::ProviderClient {
public:
    SharedGaugeProvider(std::atomic<int>& in_flight, std::atomic<int>& high_water,
                        std::chrono::milliseconds delay, bool fail = false)
        : m_in_flight(in_flight), m_high_water(high_water), m_delay(delay), m_fail(fail) {}

    Zeke::ChatResponse chatCompletion(const std::vector<Zeke::ChatMessage>& messages,
                                      const std::string& model) override {
        int now = ++m_in_flight;
        int seen = m_high_water.load();
        while (now > seen && !m_high_water.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(m_delay);
        --m_in_flight;

        if (m_fail) {
            throw Zeke::ProviderError("gauge failure");
        }

        Zeke::ChatResponse response;
        response.content = messages.empty() ? "" : messages.back().content;
        response.model = model;
        return response;
    }

private:
    std::atomic<int>& m_in_flight;
    std::atomic<int>& m_high_water;
    std::chrono::milliseconds m_delay;
    bool m_fail;
};

inline std::vector<Zeke::ChatMessage> userMessage(const std::string& text) {
    return {Zeke::ChatMessage{"user", text}};
}

} // namespace ZekeTest
