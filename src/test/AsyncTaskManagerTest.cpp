#undef NDEBUG
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include "application/AsyncTaskManager.hpp"

using namespace equilibra::application;

int main() {
    std::cout << "[Test] Starting Async Task Manager Test..." << std::endl;

    std::cout << "[Test] Failing jobs are recorded..." << std::endl;
    {
        AsyncTaskManager tasks;
        auto plain = tasks.SubmitTask(TaskType::Narrative, "throws runtime_error",
            [](std::shared_ptr<TaskStatus>) { throw std::runtime_error("model offline"); });
        auto odd = tasks.SubmitTask(TaskType::Simulation, "throws an int",
            [](std::shared_ptr<TaskStatus>) { throw 42; });
        auto fine = tasks.SubmitTask(TaskType::DecisionCycle, "succeeds",
            [](std::shared_ptr<TaskStatus> status) { status->progress = 0.5f; });

        assert(tasks.WaitForIdle(std::chrono::seconds(10)));
        assert(plain->isCompleted && plain->failed);
        assert(plain->errorMessage == "model offline");
        assert(odd->isCompleted && odd->failed);
        assert(!odd->errorMessage.empty());
        assert(fine->isCompleted && !fine->failed);
        assert(fine->progress == 1.0f);

        // The running count went back to zero, so nothing looks busy.
        assert(!tasks.IsBusy(TaskType::Simulation));
        assert(!tasks.IsBusy(TaskType::Narrative));
        assert(tasks.GetActiveTasks().empty());
    }

    std::cout << "[Test] Shutdown waits for slow jobs..." << std::endl;
    {
        auto finished = std::make_shared<std::atomic<bool>>(false);
        {
            AsyncTaskManager tasks;
            tasks.SubmitTask(TaskType::Narrative, "slow narrative",
                [finished](std::shared_ptr<TaskStatus>) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(300));
                    *finished = true;
                });
            assert(tasks.IsBusy(TaskType::Narrative));
        }
        assert(*finished);
    }

    std::cout << "[PASS] Async Task Manager Test Passed" << std::endl;
    return 0;
}
