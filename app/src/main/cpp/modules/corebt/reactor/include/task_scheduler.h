#ifndef TASK_SCHEDULER_H
#define TASK_SCHEDULER_H

#include "cancellable.h"
#include "event_loop.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

// Fixed set of slots; each holds at most one live task.
enum class TaskCategory {
    SCAN,                 // scan window timeout
    DISCOVERY,            // discoverability window timeout
    SERVICE_STATE_RELAY,  // session-state subscription
    MESSAGE_RELAY         // inbound-message subscription
};

const char* task_category_to_string(TaskCategory category);

/**
 * A delayed action. Fired by the scheduler's timer thread, run on the
 * scheduler's EventLoop. Cancelling before it runs (even after it fired)
 * prevents the action.
 */
class ScheduledTask : public Cancellable {
public:
    ScheduledTask(TaskCategory category,
                  std::chrono::steady_clock::time_point due_time,
                  std::function<void()> action);

    void cancel() override;
    bool isCancelled() const override { return m_cancelled.load(); }
    bool isActive() const override { return !m_cancelled.load() && !m_completed.load(); }

    bool hasCompleted() const { return m_completed.load(); }
    TaskCategory category() const { return m_category; }
    std::chrono::steady_clock::time_point dueTime() const { return m_due_time; }

    // Runs the action unless cancelled; called on the event loop
    void run();

private:
    TaskCategory m_category;
    std::chrono::steady_clock::time_point m_due_time;
    std::function<void()> m_action;
    std::atomic<bool> m_cancelled{false};
    std::atomic<bool> m_completed{false};
};

/**
 * @brief TaskScheduler - category-keyed delayed actions.
 *
 * Registering under a category cancels and replaces whatever that category
 * held before. One timer thread tracks due times and posts fired tasks to
 * the EventLoop, so actions never run on the timer thread.
 */
class TaskScheduler {
public:
    explicit TaskScheduler(EventLoop& loop);
    ~TaskScheduler();

    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    std::shared_ptr<ScheduledTask> schedule(TaskCategory category,
                                            std::chrono::milliseconds delay,
                                            std::function<void()> action);

    // Records any cancellable (e.g. a bus subscription) with replace semantics
    void add(TaskCategory category, std::shared_ptr<Cancellable> handle);
    void remove(TaskCategory category);
    void cancelAll();

    bool has(TaskCategory category) const;
    size_t liveCount() const;

    void shutdown();

private:
    void timerLoop();
    void replaceLocked(TaskCategory category, std::shared_ptr<Cancellable> handle);

    EventLoop& m_loop;

    std::map<TaskCategory, std::shared_ptr<Cancellable>> m_tasks;
    std::vector<std::shared_ptr<ScheduledTask>> m_pending_timers;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;

    std::thread m_timerThread;
    bool m_stopping{false};
};

#endif // TASK_SCHEDULER_H
