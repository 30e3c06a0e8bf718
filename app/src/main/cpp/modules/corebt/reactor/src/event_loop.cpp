#include "event_loop.h"
#include "logger.h"
#include <exception>
#include <string>

EventLoop::EventLoop() = default;

EventLoop::~EventLoop() {
    stop();
}

void EventLoop::start() {
    std::lock_guard<std::mutex> lifecycle_lock(m_lifecycleMutex);
    if (m_running.load(std::memory_order_acquire)) {
        LOG_WARN("EventLoop: start called while already running - ignoring");
        return;
    }
    if (m_thread.joinable()) {
        m_thread.join();
    }

    m_stopping = false;
    m_running = true;
    m_thread = std::thread([this]() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_loopThreadId = std::this_thread::get_id();
        }
        processQueue();
    });
    LOG_DEBUG("EventLoop: consumer thread started");
}

void EventLoop::stop() {
    std::lock_guard<std::mutex> lifecycle_lock(m_lifecycleMutex);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = true;
        m_queue.clear();
    }
    m_cv.notify_all();
    m_idleCv.notify_all();

    if (m_thread.joinable()) {
        if (m_thread.get_id() == std::this_thread::get_id()) {
            // Stopped from inside a task; the thread unwinds on its own.
            m_thread.detach();
        } else {
            m_thread.join();
        }
    }
    m_running = false;
}

bool EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping) {
            return false;
        }
        m_queue.push_back(std::move(task));
    }
    m_cv.notify_one();
    return true;
}

bool EventLoop::isLoopThread() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_loopThreadId == std::this_thread::get_id();
}

size_t EventLoop::pending() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

bool EventLoop::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_idleCv.wait_for(lock, timeout, [this] {
        return (m_queue.empty() && !m_busy) || m_stopping;
    });
}

void EventLoop::processQueue() {
    int task_count = 0;
    while (true) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this] { return !m_queue.empty() || m_stopping; });
        if (m_stopping) {
            break;
        }

        Task task = std::move(m_queue.front());
        m_queue.pop_front();
        m_busy = true;
        // Unlock before running so producers never wait on the consumer
        lock.unlock();

        try {
            task();
        } catch (const std::exception& e) {
            LOG_WARN("EventLoop: task threw: " + std::string(e.what()));
        }
        ++task_count;

        lock.lock();
        m_busy = false;
        if (m_queue.empty()) {
            m_idleCv.notify_all();
        }
    }
    LOG_DEBUG("EventLoop: consumer thread stopped after " + std::to_string(task_count) + " tasks");
}
