/**
 * @file AsyncTaskManager.hpp
 * @brief Background jobs for the dashboard (decision cycles, simulations, narratives).
 */

#pragma once

#include <string>
#include <vector>
#include <functional>
#include <future>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <memory>
#include <algorithm>
#include <chrono>
#include <thread>
#include <iostream>

namespace equilibra::application {

/**
 * @enum TaskType
 * @brief Categories of background work.
 */
enum class TaskType {
    DecisionCycle,
    Simulation,
    Narrative
};

inline const char* TaskTypeToString(TaskType type) {
    switch (type) {
        case TaskType::DecisionCycle: return "decision";
        case TaskType::Simulation: return "simulation";
        case TaskType::Narrative: return "narrative";
    }
    return "task";
}

/**
 * @struct TaskStatus
 * @brief Information about a running or completed task.
 */
struct TaskStatus {
    int id;
    TaskType type;
    std::string description;
    std::atomic<float> progress{0.0f};
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::string errorMessage;   ///< Written before isCompleted is set.
};

/**
 * @class AsyncTaskManager
 * @brief Runs jobs on detached threads and tracks them until they finish.
 *
 * The job receives its TaskStatus as first argument and may update
 * progress. Anything a job throws marks the task failed. Destruction
 * blocks until every job has returned.
 */
class AsyncTaskManager {
public:
    AsyncTaskManager() = default;
    ~AsyncTaskManager() {
        // Detached jobs capture `this`; they must finish before we go away.
        if (!WaitForIdle(std::chrono::seconds(5))) {
            std::cerr << "[AsyncTaskManager] Waiting for running jobs before shutdown" << std::endl;
            WaitForIdle();
        }
    }

    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    /** @brief Submits a new task to be executed in the background. */
    template<typename F, typename... Args>
    std::shared_ptr<TaskStatus> SubmitTask(TaskType type, const std::string& description, F&& f, Args&&... args) {
        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->type = type;
        status->description = description;

        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            m_activeTasks.push_back(status);
            ++m_running;
        }

        std::thread([this, status](auto userFunc, auto... userArgs) {
            try {
                userFunc(status, std::move(userArgs)...);
                status->progress = 1.0f;
            } catch (const std::exception& e) {
                status->failed = true;
                status->errorMessage = e.what();
            } catch (...) {
                status->failed = true;
                status->errorMessage = "Unknown error during task execution.";
            }
            if (status->failed) {
                std::cerr << "[AsyncTaskManager] Task '" << status->description << "' failed: "
                          << status->errorMessage << std::endl;
            }
            status->isCompleted = true;
            CleanupCompletedTasks();
        }, std::forward<F>(f), std::forward<Args>(args)...).detach();

        return status;
    }

    /** @brief Returns snapshots of all active tasks. */
    std::vector<std::shared_ptr<TaskStatus>> GetActiveTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_activeTasks;
    }

    bool IsBusy(TaskType type) {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return std::any_of(m_activeTasks.begin(), m_activeTasks.end(),
                           [type](const auto& s) { return s->type == type && !s->isCompleted.load(); });
    }

    /**
     * @brief Blocks until every submitted task has finished.
     * @return False if the timeout expired first.
     */
    bool WaitForIdle(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_tasksMutex);
        return m_idleCv.wait_for(lock, timeout, [this] { return m_running == 0; });
    }

    /** @brief Blocks with no timeout. */
    void WaitForIdle() {
        std::unique_lock<std::mutex> lock(m_tasksMutex);
        m_idleCv.wait(lock, [this] { return m_running == 0; });
    }

private:
    void CleanupCompletedTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        m_activeTasks.erase(
            std::remove_if(m_activeTasks.begin(), m_activeTasks.end(),
                [](const auto& s) { return s->isCompleted.load(); }),
            m_activeTasks.end()
        );
        if (m_running > 0) --m_running;
        if (m_running == 0) m_idleCv.notify_all();
    }

    std::atomic<int> m_nextId{0};
    std::vector<std::shared_ptr<TaskStatus>> m_activeTasks;
    size_t m_running = 0;
    std::mutex m_tasksMutex;
    std::condition_variable m_idleCv;
};

} // namespace equilibra::application
