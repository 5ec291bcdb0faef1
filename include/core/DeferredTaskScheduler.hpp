/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DEFERRED_TASK_SCHEDULER_HPP
#define DEFERRED_TASK_SCHEDULER_HPP

/**
 * @file DeferredTaskScheduler.hpp
 * @brief Cancellable, clock-driven task queue keyed by unit id
 *
 * Combat effects that land some time after they were triggered (hit
 * resolution, stun removal, end of an attack swing) are queued here instead
 * of being fired from free-running timers. Every task lists the unit ids it
 * touches so that removing a unit can cancel all of its pending work.
 *
 * Tasks only run from runDueTasks(), which UnitManager calls at the start of
 * every update. Single-threaded: no locking.
 */

#include <boost/container/flat_map.hpp>
#include <boost/container/small_vector.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <unordered_map>
#include <utility>
#include <vector>

namespace Warband {

/**
 * @brief Time source for the scheduler (seconds, monotonic)
 */
class TaskClock {
public:
    virtual ~TaskClock() = default;
    [[nodiscard]] virtual double now() const = 0;
};

/**
 * @brief Wall clock backed by SDL_GetTicksNS()
 */
class SdlTaskClock : public TaskClock {
public:
    [[nodiscard]] double now() const override;
};

/**
 * @brief Manually advanced clock for tests and fixed-step simulation
 */
class ManualTaskClock : public TaskClock {
public:
    explicit ManualTaskClock(double start = 0.0) : m_now(start) {}

    [[nodiscard]] double now() const override { return m_now; }
    void advance(double seconds) { m_now += seconds; }
    void set(double seconds) { m_now = seconds; }

private:
    double m_now;
};

using TaskHandle = uint64_t;
constexpr TaskHandle INVALID_TASK_HANDLE = 0;

class DeferredTaskScheduler {
public:
    using Task = std::function<void()>;
    using TaskKey = uint64_t;

    /**
     * @param clock Time source; nullptr selects the SDL wall clock
     */
    explicit DeferredTaskScheduler(std::shared_ptr<TaskClock> clock = nullptr);
    ~DeferredTaskScheduler() = default;

    DeferredTaskScheduler(const DeferredTaskScheduler&) = delete;
    DeferredTaskScheduler& operator=(const DeferredTaskScheduler&) = delete;

    /**
     * @brief Queue a task to run once delaySeconds have elapsed on the clock
     * @param delaySeconds Delay from now (negative values are treated as 0)
     * @param keys Unit ids the task touches; cancelForKey() on any of them drops it
     * @param task Work to run
     * @return Handle for cancel(), INVALID_TASK_HANDLE if task is empty
     */
    TaskHandle schedule(double delaySeconds, std::initializer_list<TaskKey> keys, Task task);

    /**
     * @brief Drop a pending task
     * @return true if the task was still pending
     */
    bool cancel(TaskHandle handle);

    /**
     * @brief Drop every pending task that lists the key
     * @return Number of tasks cancelled
     */
    size_t cancelForKey(TaskKey key);

    /**
     * @brief Run every task whose due time has been reached
     *
     * Tasks run in due-time order (ties in scheduling order). Tasks queued
     * while this runs wait for the next call, tasks cancelled while this
     * runs are skipped.
     *
     * @return Number of tasks executed
     */
    size_t runDueTasks();

    void clear();

    [[nodiscard]] size_t pendingCount() const { return m_tasks.size(); }
    [[nodiscard]] size_t pendingCountForKey(TaskKey key) const;
    [[nodiscard]] bool isPending(TaskHandle handle) const { return m_tasks.contains(handle); }
    [[nodiscard]] double now() const { return mp_clock->now(); }
    [[nodiscard]] const TaskClock& getClock() const { return *mp_clock; }

private:
    struct PendingTask {
        double dueTime{0.0};
        boost::container::small_vector<TaskKey, 2> keys;
        Task task;
    };

    void unindex(TaskHandle handle, const PendingTask& pending);

    std::shared_ptr<TaskClock> mp_clock;
    boost::container::flat_map<TaskHandle, PendingTask> m_tasks;
    std::unordered_map<TaskKey, boost::container::small_vector<TaskHandle, 4>> m_tasksByKey;
    TaskHandle m_nextHandle{1};
    bool m_running{false};

    // Reused between runDueTasks() calls
    std::vector<std::pair<double, TaskHandle>> m_dueScratch;
};

} // namespace Warband

#endif // DEFERRED_TASK_SCHEDULER_HPP
