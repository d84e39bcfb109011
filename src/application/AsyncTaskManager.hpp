/**
 * @file AsyncTaskManager.hpp
 * @brief Background execution of layout passes and summary requests.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace regionwalker::application {

/**
 * @enum TaskType
 * @brief What a background task is doing.
 */
enum class TaskType {
    Layout,  ///< A full Arrange pass.
    Summary  ///< A standalone summarizer call.
};

/**
 * @struct TaskStatus
 * @brief Shared view of one task; the worker writes, callers poll.
 */
struct TaskStatus {
    int id = 0;
    TaskType type = TaskType::Layout;
    std::string description;
    std::atomic<float> progress{0.0f};
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::string errorMessage; ///< Written before isCompleted is set.
};

/**
 * @class AsyncTaskManager
 * @brief Runs each task on its own detached thread and tracks the ones still in flight.
 *
 * Destruction waits for every submitted task, so a task body may capture the
 * service that submitted it as long as that service outlives the manager's owner.
 */
class AsyncTaskManager {
public:
    AsyncTaskManager() = default;
    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    ~AsyncTaskManager() {
        WaitForIdle();
    }

    /**
     * @brief Starts f(status, args...) in the background.
     *
     * Arguments are moved into the worker. An exception escaping f marks the
     * task failed and keeps its message; progress is set to 1 on success.
     */
    template<typename F, typename... Args>
    std::shared_ptr<TaskStatus> SubmitTask(TaskType type, const std::string& description, F&& f, Args&&... args) {
        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId.fetch_add(1);
        status->type = type;
        status->description = description;
        Register(status);

        std::thread([this, status](auto body, auto... bodyArgs) {
            Completion done(*this, *status);
            try {
                body(status, std::move(bodyArgs)...);
                status->progress = 1.0f;
            } catch (const std::exception& e) {
                done.Fail(e.what());
            } catch (...) {
                done.Fail("Task threw a non-standard exception.");
            }
        }, std::forward<F>(f), std::forward<Args>(args)...).detach();

        return status;
    }

    /** @brief Tasks submitted and not yet finished. */
    std::vector<std::shared_ptr<TaskStatus>> GetActiveTasks() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_inFlight;
    }

    /** @brief Blocks until every submitted task has finished. */
    void WaitForIdle() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_idle.wait(lock, [this]() { return m_inFlight.empty(); });
    }

private:
    // Marks the task completed and retires it when the worker leaves scope.
    class Completion {
    public:
        Completion(AsyncTaskManager& owner, TaskStatus& status) : m_owner(owner), m_status(status) {}
        ~Completion() {
            m_status.isCompleted = true;
            m_owner.Retire(m_status.id);
        }
        void Fail(const std::string& message) {
            m_status.errorMessage = message;
            m_status.failed = true;
        }

    private:
        AsyncTaskManager& m_owner;
        TaskStatus& m_status;
    };

    void Register(const std::shared_ptr<TaskStatus>& status) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_inFlight.push_back(status);
    }

    void Retire(int id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_inFlight.erase(std::remove_if(m_inFlight.begin(), m_inFlight.end(),
                                        [id](const auto& s) { return s->id == id; }),
                         m_inFlight.end());
        if (m_inFlight.empty()) m_idle.notify_all();
    }

    std::atomic<int> m_nextId{0};
    std::vector<std::shared_ptr<TaskStatus>> m_inFlight;
    std::mutex m_mutex;
    std::condition_variable m_idle;
};

} // namespace regionwalker::application
