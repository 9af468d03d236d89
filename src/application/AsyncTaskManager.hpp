/**
 * @file AsyncTaskManager.hpp
 * @brief Centralized management for background tasks.
 */

#pragma once

#include <string>
#include <vector>
#include <functional>
#include <thread>
#include <mutex>
#include <atomic>
#include <memory>
#include <algorithm>
#include <cstddef>
#include <iterator>
#include <utility>

namespace imagescout::application {

/**
 * @enum TaskType
 * @brief Categories of background work.
 */
enum class TaskType {
    Reconciliation
};

/**
 * @struct TaskStatus
 * @brief Information about a running or completed task.
 *
 * errorMessage is written before isCompleted is raised and must only be
 * read once isCompleted is observed.
 */
struct TaskStatus {
    int id;
    TaskType type;
    std::string description;
    std::atomic<float> progress{0.0f};
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::atomic<bool> cancelRequested{false};
    std::string errorMessage;
};

/**
 * @class AsyncTaskManager
 * @brief Manages background execution and provides unified status tracking.
 *
 * Workers are joined on WaitAll() and on destruction, so submitted work never
 * outlives the manager. Finished workers are also reaped on every submit.
 */
class AsyncTaskManager {
public:
    AsyncTaskManager() = default;
    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    ~AsyncTaskManager() {
        for (auto& status : GetActiveTasks()) {
            status->cancelRequested = true;
        }
        WaitAll();
    }

    /** @brief Submits a new task; f receives the task's status as its first argument. */
    template<typename F, typename... Args>
    std::shared_ptr<TaskStatus> SubmitTask(TaskType type, const std::string& description, F&& f, Args&&... args) {
        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->type = type;
        status->description = description;

        ReapFinishedWorkers();

        std::lock_guard<std::mutex> lock(m_tasksMutex);
        m_activeTasks.push_back(status);

        m_workers.emplace_back(status, std::thread([this, status](auto userFunc, auto... userArgs) {
            try {
                userFunc(status, std::move(userArgs)...);
                status->progress = 1.0f;
            } catch (const std::exception& e) {
                status->errorMessage = e.what();
                status->failed = true;
            }
            status->isCompleted = true;
            CleanupCompletedTasks();
        }, std::forward<F>(f), std::forward<Args>(args)...));

        return status;
    }

    /** @brief Returns snapshots of all active tasks. */
    std::vector<std::shared_ptr<TaskStatus>> GetActiveTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_activeTasks;
    }

    /** @brief Blocks until every submitted task has finished. */
    void WaitAll() {
        std::vector<Worker> workers;
        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            workers.swap(m_workers);
        }
        for (auto& worker : workers) {
            if (worker.second.joinable()) worker.second.join();
        }
    }

    /** @brief Number of worker threads not yet joined. */
    std::size_t GetWorkerCount() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_workers.size();
    }

private:
    using Worker = std::pair<std::shared_ptr<TaskStatus>, std::thread>;

    // Joins outside the lock: a finishing worker still takes it in CleanupCompletedTasks.
    void ReapFinishedWorkers() {
        std::vector<Worker> finished;
        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            auto split = std::stable_partition(m_workers.begin(), m_workers.end(),
                [](const Worker& w) { return !w.first->isCompleted.load(); });
            std::move(split, m_workers.end(), std::back_inserter(finished));
            m_workers.erase(split, m_workers.end());
        }
        for (auto& worker : finished) {
            if (worker.second.joinable()) worker.second.join();
        }
    }

    void CleanupCompletedTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        m_activeTasks.erase(
            std::remove_if(m_activeTasks.begin(), m_activeTasks.end(),
                [](const auto& s) { return s->isCompleted.load(); }),
            m_activeTasks.end()
        );
    }

    std::atomic<int> m_nextId{0};
    std::vector<std::shared_ptr<TaskStatus>> m_activeTasks;
    std::vector<Worker> m_workers;
    std::mutex m_tasksMutex;
};

} // namespace imagescout::application
