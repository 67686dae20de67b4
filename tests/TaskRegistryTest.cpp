// =================================================================
// tests/TaskRegistryTest.cpp
// =================================================================
// Unit tests for TaskRegistry component.

#include "Zeke/TaskRegistry.hpp"
#include "Zeke/Logger.hpp"
#include <iostream>
#include <cassert>
#include <thread>
#include <chrono>
#include <set>
#include <mutex>

class TaskRegistryTest {
public:
    TaskRegistryTest() {
        Zeke::Logger::getInstance().setConsoleLogLevel(Zeke::LogLevel::ERROR);
    }

    void testIdsUniqueAndIncreasing() {
        std::cout << "Testing id uniqueness and monotonicity..." << std::endl;

        Zeke::TaskRegistry registry;

        // Ids handed out from one thread strictly increase
        Zeke::TaskId previous = 0;
        for (int i = 0; i < 50; ++i) {
            auto task = registry.create(Zeke::TaskKind::CHAT_COMPLETION, Zeke::ProviderId::CLAUDE, {});
            assert(task.id > previous && "Ids should strictly increase");
            previous = task.id;
        }

        // Concurrent creation never produces duplicates
        std::mutex ids_mutex;
        std::set<Zeke::TaskId> ids;
        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&]() {
                for (int i = 0; i < 100; ++i) {
                    auto task = registry.create(Zeke::TaskKind::CHAT_COMPLETION,
                                                Zeke::ProviderId::OPENAI, {});
                    std::lock_guard<std::mutex> lock(ids_mutex);
                    ids.insert(task.id);
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        assert(ids.size() == 800 && "Concurrently created ids should be unique");
        assert(*ids.begin() > previous && "Ids should never be reused");
        assert(registry.stats().total_submitted == 850 && "Every creation should be counted");

        std::cout << "✓ Id uniqueness test passed" << std::endl;
    }

    void testFirstIdIsOne() {
        std::cout << "Testing first id..." << std::endl;

        Zeke::TaskRegistry registry;
        auto task = registry.create(Zeke::TaskKind::HEALTH_CHECK, Zeke::ProviderId::OLLAMA, {});
        assert(task.id == 1 && "Ids should start at 1");
        assert(task.status == Zeke::TaskStatus::PENDING && "New task should be pending");
        assert(!task.result && !task.error_info && "New task should carry no outcome");
        assert(!task.completion_time && "New task should have no completion time");

        std::cout << "✓ First id test passed" << std::endl;
    }

    void testTerminalClosure() {
        std::cout << "Testing terminal state closure..." << std::endl;

        Zeke::TaskRegistry registry;

        auto completed = registry.create(Zeke::TaskKind::CHAT_COMPLETION, Zeke::ProviderId::CLAUDE, {});
        assert(registry.markInProgress(completed.id) && "PENDING -> IN_PROGRESS should apply");
        assert(!registry.markInProgress(completed.id) && "IN_PROGRESS -> IN_PROGRESS should be rejected");

        Zeke::ChatResponse response{"hello", "model-a", std::nullopt};
        auto committed = registry.complete(completed.id, response);
        assert(committed && "Completion should apply");
        assert(committed->status == Zeke::TaskStatus::COMPLETED && "Task should be completed");
        assert(committed->completion_time && "Completion time should be set");

        assert(!registry.fail(completed.id, "late", Zeke::ErrorCode::PROVIDER_ERROR) &&
               "Completed task should reject failure");
        assert(!registry.cancel(completed.id) && "Completed task should reject cancellation");
        assert(!registry.complete(completed.id, response) && "Completed task should reject completion");

        auto snapshot = registry.get(completed.id);
        assert(snapshot->status == Zeke::TaskStatus::COMPLETED && "Status should be unchanged");
        assert(snapshot->chatResponse() && snapshot->chatResponse()->content == "hello" &&
               "Result should be unchanged");
        assert(!snapshot->error_info && "Result and error should be exclusive");

        auto cancelled = registry.create(Zeke::TaskKind::CHAT_COMPLETION, Zeke::ProviderId::CLAUDE, {});
        assert(registry.cancel(cancelled.id) && "Pending task should be cancellable");
        assert(!registry.markInProgress(cancelled.id) && "Cancelled task should not start");
        assert(!registry.complete(cancelled.id, response) && "Cancelled task should not complete");

        auto failed = registry.create(Zeke::TaskKind::CODE_ANALYSIS, Zeke::ProviderId::CLAUDE, {});
        auto failure = registry.fail(failed.id, "boom", Zeke::ErrorCode::RATE_LIMIT_EXCEEDED);
        assert(failure && failure->error_code == Zeke::ErrorCode::RATE_LIMIT_EXCEEDED &&
               "Failure should record its code");
        assert(!failure->result && "Failed task should carry no result");
        assert(!registry.cancel(failed.id) && "Failed task should reject cancellation");

        std::cout << "✓ Terminal closure test passed" << std::endl;
    }

    void testWaitForTerminal() {
        std::cout << "Testing wait for terminal..." << std::endl;

        Zeke::TaskRegistry registry;
        auto task = registry.create(Zeke::TaskKind::CHAT_COMPLETION, Zeke::ProviderId::CLAUDE, {});

        std::thread worker([&registry, id = task.id]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            registry.markInProgress(id);
            registry.complete(id, Zeke::ChatResponse{"done", "m", std::nullopt});
        });

        auto start = std::chrono::steady_clock::now();
        auto finished = registry.waitForTerminal(task.id);
        auto waited = std::chrono::steady_clock::now() - start;
        worker.join();

        assert(finished.status == Zeke::TaskStatus::COMPLETED && "Wait should return the terminal task");
        assert(waited >= std::chrono::milliseconds(40) && "Wait should block until completion");

        bool thrown = false;
        try {
            registry.waitForTerminal(9999);
        } catch (const Zeke::OrchestratorError& e) {
            thrown = e.code() == Zeke::ErrorCode::REQUEST_NOT_FOUND;
        }
        assert(thrown && "Unknown id should raise REQUEST_NOT_FOUND");

        // Removal wakes a waiter
        auto orphan = registry.create(Zeke::TaskKind::CHAT_COMPLETION, Zeke::ProviderId::CLAUDE, {});
        std::thread remover([&registry, id = orphan.id]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
            registry.remove(id);
        });
        bool removed_error = false;
        try {
            registry.waitForTerminal(orphan.id);
        } catch (const Zeke::OrchestratorError& e) {
            removed_error = e.code() == Zeke::ErrorCode::REQUEST_NOT_FOUND;
        }
        remover.join();
        assert(removed_error && "Waiting on a removed task should raise REQUEST_NOT_FOUND");

        std::cout << "✓ Wait for terminal test passed" << std::endl;
    }

    void testWaitForAnyTerminal() {
        std::cout << "Testing wait for any terminal..." << std::endl;

        Zeke::TaskRegistry registry;
        auto a = registry.create(Zeke::TaskKind::CHAT_COMPLETION, Zeke::ProviderId::CLAUDE, {});
        auto b = registry.create(Zeke::TaskKind::CHAT_COMPLETION, Zeke::ProviderId::OPENAI, {});

        std::thread worker([&registry, id = b.id]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
            registry.fail(id, "nope", Zeke::ErrorCode::PROVIDER_ERROR);
        });

        auto first = registry.waitForAnyTerminal({a.id, b.id});
        worker.join();
        assert(first && first->id == b.id && "Should return the task that finished");

        // Scan order decides among several terminal tasks
        registry.cancel(a.id);
        auto ordered = registry.waitForAnyTerminal({a.id, b.id});
        assert(ordered && ordered->id == a.id && "First terminal id in order should win");

        auto none = registry.waitForAnyTerminal({4242, 4343});
        assert(!none && "Untracked ids should yield nullopt");

        std::cout << "✓ Wait for any terminal test passed" << std::endl;
    }

    void testPurgeAndStats() {
        std::cout << "Testing purge and statistics..." << std::endl;

        Zeke::TaskRegistry registry;
        auto done = registry.create(Zeke::TaskKind::CHAT_COMPLETION, Zeke::ProviderId::CLAUDE, {});
        auto failed = registry.create(Zeke::TaskKind::CHAT_COMPLETION, Zeke::ProviderId::CLAUDE, {});
        auto cancelled = registry.create(Zeke::TaskKind::CHAT_COMPLETION, Zeke::ProviderId::CLAUDE, {});
        auto pending = registry.create(Zeke::TaskKind::CHAT_COMPLETION, Zeke::ProviderId::CLAUDE, {});
        auto running = registry.create(Zeke::TaskKind::CHAT_COMPLETION, Zeke::ProviderId::CLAUDE, {});

        registry.markInProgress(done.id);
        registry.complete(done.id, Zeke::ChatResponse{"ok", "m", std::nullopt});
        registry.fail(failed.id, "err", Zeke::ErrorCode::PROVIDER_ERROR);
        registry.cancel(cancelled.id);
        registry.markInProgress(running.id);

        auto stats = registry.stats();
        assert(stats.total_submitted == 5 && "Five tasks submitted");
        assert(stats.active == 2 && "Pending and in-progress count as active");
        assert(stats.completed == 1 && stats.failed == 1 && stats.cancelled == 1 && "Terminal counts");
        assert(registry.activeCount() == 2 && "Active count should match stats");

        size_t removed = registry.purgeCompletedBefore(std::chrono::system_clock::now() +
                                                       std::chrono::seconds(1));
        assert(removed == 3 && "Only terminal tasks should be purged");
        assert(registry.size() == 2 && "Active tasks should survive purge");
        assert(registry.get(pending.id) && registry.get(running.id) && "Active tasks still tracked");
        assert(registry.stats().total_submitted == 5 && "Submitted count should survive purge");

        assert(registry.remove(pending.id) && "Remove should report existing task");
        assert(!registry.remove(pending.id) && "Second remove should report absence");

        std::cout << "✓ Purge and statistics test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "=== TaskRegistry Tests ===" << std::endl;

        testFirstIdIsOne();
        testIdsUniqueAndIncreasing();
        testTerminalClosure();
        testWaitForTerminal();
        testWaitForAnyTerminal();
        testPurgeAndStats();

        std::cout << "All TaskRegistry tests passed!" << std::endl;
    }
};

int main() {
    try {
        TaskRegistryTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All TaskRegistry component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
