#ifndef EVENT_LOOP_H
#define EVENT_LOOP_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

/**
 * @brief EventLoop - the single consumer context.
 *
 * One thread drains a FIFO of posted tasks. Every observer-facing
 * notification and every fired timer runs here, so observers never see two
 * callbacks concurrently and see them in posting order regardless of which
 * background thread produced them.
 *
 * Tasks posted before start() are kept and run once the loop starts.
 * A task that throws std::exception is logged and the loop keeps going.
 */
class EventLoop {
public:
    using Task = std::function<void()>;

    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void start();
    // Pending tasks are dropped. May be called from a task, but the loop
    // itself must not be destroyed from one.
    void stop();

    // Returns false once the loop is stopping
    bool post(Task task);

    bool isRunning() const { return m_running.load(std::memory_order_acquire); }
    bool isLoopThread() const;
    size_t pending() const;

    // Blocks until the queue is empty and no task is executing
    bool waitIdle(std::chrono::milliseconds timeout);

private:
    void processQueue();

    std::deque<Task> m_queue;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    bool m_busy{false};

    std::thread m_thread;
    std::thread::id m_loopThreadId;
    std::mutex m_lifecycleMutex;

    std::atomic<bool> m_running{false};
    std::atomic<bool> m_stopping{false};
};

#endif // EVENT_LOOP_H
