#include "task_scheduler.h"
#include "logger.h"
#include <algorithm>
#include <string>

const char* task_category_to_string(TaskCategory category) {
    switch (category) {
        case TaskCategory::SCAN: return "SCAN";
        case TaskCategory::DISCOVERY: return "DISCOVERY";
        case TaskCategory::SERVICE_STATE_RELAY: return "SERVICE_STATE_RELAY";
        case TaskCategory::MESSAGE_RELAY: return "MESSAGE_RELAY";
    }
    return "UNKNOWN";
}

// ----------------------------------------------------------------------------
// ScheduledTask
// ----------------------------------------------------------------------------

ScheduledTask::ScheduledTask(TaskCategory category,
                             std::chrono::steady_clock::time_point due_time,
                             std::function<void()> action)
    : m_category(category), m_due_time(due_time), m_action(std::move(action)) {}

void ScheduledTask::cancel() {
    m_cancelled = true;
}

void ScheduledTask::run() {
    if (m_cancelled.load() || m_completed.exchange(true)) {
        return;
    }
    if (m_action) {
        m_action();
    }
}

// ----------------------------------------------------------------------------
// TaskScheduler
// ----------------------------------------------------------------------------

TaskScheduler::TaskScheduler(EventLoop& loop) : m_loop(loop) {
    m_timerThread = std::thread(&TaskScheduler::timerLoop, this);
}

TaskScheduler::~TaskScheduler() {
    shutdown();
}

std::shared_ptr<ScheduledTask> TaskScheduler::schedule(TaskCategory category,
                                                       std::chrono::milliseconds delay,
                                                       std::function<void()> action) {
    auto task = std::make_shared<ScheduledTask>(
        category, std::chrono::steady_clock::now() + delay, std::move(action));
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping) {
            LOG_WARN(std::string("Scheduler: dropping ") + task_category_to_string(category) + " task after shutdown");
            task->cancel();
            return task;
        }
        replaceLocked(category, task);
        m_pending_timers.push_back(task);
    }
    m_cv.notify_all();
    LOG_DEBUG(std::string("Scheduler: ") + task_category_to_string(category) +
              " task due in " + std::to_string(delay.count()) + "ms");
    return task;
}

void TaskScheduler::add(TaskCategory category, std::shared_ptr<Cancellable> handle) {
    if (!handle) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    replaceLocked(category, std::move(handle));
}

void TaskScheduler::replaceLocked(TaskCategory category, std::shared_ptr<Cancellable> handle) {
    auto it = m_tasks.find(category);
    if (it != m_tasks.end()) {
        it->second->cancel();
        it->second = std::move(handle);
        return;
    }
    m_tasks.emplace(category, std::move(handle));
}

void TaskScheduler::remove(TaskCategory category) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_tasks.find(category);
    if (it == m_tasks.end()) {
        return;
    }
    it->second->cancel();
    m_tasks.erase(it);
}

void TaskScheduler::cancelAll() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& entry : m_tasks) {
            entry.second->cancel();
        }
        m_tasks.clear();
        m_pending_timers.clear();
    }
    m_cv.notify_all();
    LOG_DEBUG("Scheduler: all tasks cancelled");
}

bool TaskScheduler::has(TaskCategory category) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_tasks.find(category);
    return it != m_tasks.end() && it->second->isActive();
}

size_t TaskScheduler::liveCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<size_t>(std::count_if(m_tasks.begin(), m_tasks.end(),
        [](const std::pair<const TaskCategory, std::shared_ptr<Cancellable>>& entry) {
            return entry.second->isActive();
        }));
}

void TaskScheduler::shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping) {
            return;
        }
        m_stopping = true;
    }
    m_cv.notify_all();
    if (m_timerThread.joinable()) {
        m_timerThread.join();
    }
    cancelAll();
}

void TaskScheduler::timerLoop() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_stopping) {
        // Drop timers cancelled while waiting
        m_pending_timers.erase(
            std::remove_if(m_pending_timers.begin(), m_pending_timers.end(),
                           [](const std::shared_ptr<ScheduledTask>& t) { return t->isCancelled(); }),
            m_pending_timers.end());

        if (m_pending_timers.empty()) {
            m_cv.wait(lock);
            continue;
        }

        auto next = std::min_element(m_pending_timers.begin(), m_pending_timers.end(),
            [](const std::shared_ptr<ScheduledTask>& a, const std::shared_ptr<ScheduledTask>& b) {
                return a->dueTime() < b->dueTime();
            });
        const auto due = (*next)->dueTime();
        if (std::chrono::steady_clock::now() < due) {
            m_cv.wait_until(lock, due);
            continue;
        }

        std::shared_ptr<ScheduledTask> fired = *next;
        m_pending_timers.erase(next);

        // The record stays in m_tasks until replaced, so cancelAll() still
        // reaches a task that fired but has not run on the loop yet.
        if (!m_loop.post([fired]() { fired->run(); })) {
            LOG_DEBUG(std::string("Scheduler: event loop stopped, ") +
                      task_category_to_string(fired->category()) + " task not run");
        }
    }
}
