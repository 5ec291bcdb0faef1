/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/DeferredTaskScheduler.hpp"
#include "core/Logger.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <exception>
#include <format>

namespace Warband {

double SdlTaskClock::now() const {
    return static_cast<double>(SDL_GetTicksNS()) / 1'000'000'000.0;
}

DeferredTaskScheduler::DeferredTaskScheduler(std::shared_ptr<TaskClock> clock)
    : mp_clock(clock ? std::move(clock) : std::make_shared<SdlTaskClock>()) {
    m_dueScratch.reserve(32);
}

TaskHandle DeferredTaskScheduler::schedule(double delaySeconds,
                                           std::initializer_list<TaskKey> keys,
                                           Task task) {
    if (!task) {
        SCHEDULER_WARN("Ignoring empty task");
        return INVALID_TASK_HANDLE;
    }

    const TaskHandle handle = m_nextHandle++;

    PendingTask pending;
    pending.dueTime = mp_clock->now() + std::max(0.0, delaySeconds);
    pending.keys.assign(keys.begin(), keys.end());
    pending.task = std::move(task);

    for (TaskKey key : pending.keys) {
        m_tasksByKey[key].push_back(handle);
    }
    m_tasks.emplace(handle, std::move(pending));

    return handle;
}

bool DeferredTaskScheduler::cancel(TaskHandle handle) {
    auto it = m_tasks.find(handle);
    if (it == m_tasks.end()) {
        return false;
    }
    unindex(handle, it->second);
    m_tasks.erase(it);
    return true;
}

size_t DeferredTaskScheduler::cancelForKey(TaskKey key) {
    auto keyIt = m_tasksByKey.find(key);
    if (keyIt == m_tasksByKey.end()) {
        return 0;
    }

    // Copy: cancel() edits the index we are iterating
    const auto handles = keyIt->second;
    size_t cancelled = 0;
    for (TaskHandle handle : handles) {
        if (cancel(handle)) {
            ++cancelled;
        }
    }
    m_tasksByKey.erase(key);

    if (cancelled > 0) {
        SCHEDULER_DEBUG(std::format("Cancelled {} pending task(s) for unit {}", cancelled, key));
    }
    return cancelled;
}

size_t DeferredTaskScheduler::runDueTasks() {
    if (m_running) {
        SCHEDULER_WARN("runDueTasks() called re-entrantly - ignoring nested call");
        return 0;
    }

    const double now = mp_clock->now();

    // Snapshot the due set first so tasks queued by running tasks wait a pump
    m_dueScratch.clear();
    for (const auto& [handle, pending] : m_tasks) {
        if (pending.dueTime <= now) {
            m_dueScratch.emplace_back(pending.dueTime, handle);
        }
    }
    if (m_dueScratch.empty()) {
        return 0;
    }
    std::sort(m_dueScratch.begin(), m_dueScratch.end());

    // Cleared on every exit, including a task throwing a non-std exception
    struct RunningGuard {
        bool& flag;
        explicit RunningGuard(bool& f) : flag(f) { flag = true; }
        ~RunningGuard() { flag = false; }
    } guard(m_running);

    size_t executed = 0;
    for (const auto& due : m_dueScratch) {
        const TaskHandle handle = due.second;
        auto it = m_tasks.find(handle);
        if (it == m_tasks.end()) {
            continue; // cancelled by an earlier task
        }

        Task task = std::move(it->second.task);
        unindex(handle, it->second);
        m_tasks.erase(it);

        try {
            task();
        } catch (const std::exception& e) {
            SCHEDULER_ERROR(std::format("Task {} threw: {}", handle, e.what()));
        }
        ++executed;
    }

    return executed;
}

void DeferredTaskScheduler::clear() {
    if (!m_tasks.empty()) {
        SCHEDULER_DEBUG(std::format("Clearing {} pending task(s)", m_tasks.size()));
    }
    m_tasks.clear();
    m_tasksByKey.clear();
    m_dueScratch.clear();
}

size_t DeferredTaskScheduler::pendingCountForKey(TaskKey key) const {
    auto it = m_tasksByKey.find(key);
    return it != m_tasksByKey.end() ? it->second.size() : 0;
}

void DeferredTaskScheduler::unindex(TaskHandle handle, const PendingTask& pending) {
    for (TaskKey key : pending.keys) {
        auto keyIt = m_tasksByKey.find(key);
        if (keyIt == m_tasksByKey.end()) {
            continue;
        }
        auto& handles = keyIt->second;
        handles.erase(std::remove(handles.begin(), handles.end(), handle), handles.end());
        if (handles.empty()) {
            m_tasksByKey.erase(keyIt);
        }
    }
}

} // namespace Warband
