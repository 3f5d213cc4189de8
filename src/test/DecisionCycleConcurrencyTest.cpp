#undef NDEBUG
#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <thread>
#include <vector>
#include "application/AsyncTaskManager.hpp"
#include "application/DecisionCycleService.hpp"
#include "application/TemplateNarrativeService.hpp"
#include "infrastructure/DecisionLogStore.hpp"
#include "infrastructure/JsonCodec.hpp"
#include "infrastructure/JsonHistoryRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

using namespace equilibra;
using namespace equilibra::domain;

int main() {
    std::cout << "[Test] Starting Decision Cycle Concurrency Test..." << std::endl;

    // Use a test-specific root to avoid touching real user data
    const std::string testRoot = "test_cycle_root";
    std::filesystem::remove_all(testRoot);
    std::filesystem::create_directories(testRoot);

    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    auto repository = std::make_shared<infrastructure::JsonHistoryRepository>(testRoot + "/data", persistence, 50);
    auto logStore = std::make_shared<infrastructure::DecisionLogStore>(testRoot + "/logs", persistence);
    auto narrative = std::make_shared<application::TemplateNarrativeService>();
    application::DecisionCycleService service(repository, narrative, logStore);

    const int NUM_CYCLES = 40;
    std::vector<std::thread> threads;
    std::atomic<int> completed{0};

    std::cout << "[Test] Spawning " << NUM_CYCLES << " threads running decision cycles..." << std::endl;
    for (int i = 0; i < NUM_CYCLES; ++i) {
        threads.emplace_back([&service, i, &completed]() {
            StateSnapshot s;
            s.sleepHours = 4.0 + (i % 5);
            s.energyLevel = 1 + (i % 10);
            s.stressLevel = i % 3 == 0 ? StressLevel::High : StressLevel::Medium;
            s.timeAvailableHours = 0.25 * (i % 8);
            auto result = service.RunCycle(s, SamplePlannedTasks(), i % 2 == 0);
            assert(result.narrative.has_value() == (i % 2 == 0));
            service.AdjustPlan(result.decision, SamplePlannedTasks());
            completed++;
        });
        if (i % 5 == 0) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }
    assert(completed == NUM_CYCLES);

    // Bounded, append-only and time-ordered.
    auto history = service.Repository().getHistory();
    std::cout << "[Test] History size: " << history.size() << std::endl;
    assert(history.size() == 40);
    std::set<std::string> ids;
    for (size_t i = 0; i < history.size(); ++i) {
        ids.insert(history[i].id);
        if (i > 0) assert(history[i - 1].timestamp <= history[i].timestamp);
    }
    assert(ids.size() == history.size());
    assert(logStore->sessionDecisionCount() == NUM_CYCLES);

    auto stats = service.Statistics();
    assert(stats.totalDecisions == 40);
    assert(stats.topConstraints.size() <= 5);

    std::cout << "[Test] Background jobs through the task manager..." << std::endl;
    {
        application::AsyncTaskManager tasks;
        std::atomic<int> ran{0};
        for (int i = 0; i < 10; ++i) {
            tasks.SubmitTask(application::TaskType::DecisionCycle, "cycle " + std::to_string(i),
                             [&service, &ran](std::shared_ptr<application::TaskStatus>) {
                                 service.RunCycle(StateSnapshot{}, SamplePlannedTasks(), false);
                                 ran++;
                             });
        }
        assert(tasks.WaitForIdle(std::chrono::seconds(30)));
        assert(ran == 10);
        assert(!tasks.IsBusy(application::TaskType::DecisionCycle));
    }
    assert(service.Repository().getHistory().size() == 50);

    // Everything reaches disk.
    assert(persistence->waitUntilIdle(std::chrono::seconds(30)));
    assert(persistence->failedWrites() == 0);
    const auto sample = service.Repository().getHistory().front().id;
    assert(logStore->loadDecision(sample).has_value());

    {
        infrastructure::JsonHistoryRepository reloaded(testRoot + "/data", persistence, 50);
        assert(reloaded.getHistory().size() == 50);
    }

    // The session export carries every decision logged in this run.
    {
        const auto exportPath = logStore->exportSession();
        assert(persistence->waitUntilIdle(std::chrono::seconds(30)));
        std::ifstream f(exportPath);
        assert(f.good());
        infrastructure::json exported;
        f >> exported;
        assert(exported["decision_count"].get<size_t>() == logStore->sessionDecisionCount());
        assert(exported["decisions"].size() == logStore->sessionDecisionCount());
        assert(exported["adaptations"].is_array());
    }

    persistence->stop();
    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] Decision Cycle Concurrency Test Passed" << std::endl;
    return 0;
}
