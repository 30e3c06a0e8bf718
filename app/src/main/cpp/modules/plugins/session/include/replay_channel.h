#ifndef REPLAY_CHANNEL_H
#define REPLAY_CHANNEL_H

#include "cancellable.h"
#include "constants.h"
#include "event_loop.h"
#include "logger.h"
#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief ReplayChannel - one category of session events.
 *
 * Producers publish from any thread. The single subscriber receives the
 * values on its EventLoop in publication order. A subscriber that arrives
 * late first gets the buffered history (the last `capacity` values, so at
 * least the latest one) and then live values.
 */
template <typename T>
class ReplayChannel {
public:
    using Handler = std::function<void(const T&)>;

    class Subscription : public Cancellable {
    public:
        Subscription(EventLoop& loop, Handler handler)
            : m_loop(loop), m_handler(std::move(handler)) {}

        void cancel() override { m_cancelled = true; }
        bool isCancelled() const override { return m_cancelled.load(); }

        EventLoop& loop() { return m_loop; }

        // Runs on the loop; values still queued after cancel() are dropped
        void deliver(const T& value) {
            if (!m_cancelled.load() && m_handler) {
                m_handler(value);
            }
        }

    private:
        EventLoop& m_loop;
        Handler m_handler;
        std::atomic<bool> m_cancelled{false};
    };

    explicit ReplayChannel(std::string name, size_t capacity = DEFAULT_REPLAY_CAPACITY)
        : m_name(std::move(name)), m_capacity(capacity == 0 ? 1 : capacity) {}

    ReplayChannel(const ReplayChannel&) = delete;
    ReplayChannel& operator=(const ReplayChannel&) = delete;

    void publish(const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_buffer.push_back(value);
        while (m_buffer.size() > m_capacity) {
            m_buffer.pop_front();
        }
        // Posting under m_mutex keeps loop order == publication order
        if (m_subscriber && !m_subscriber->isCancelled()) {
            std::shared_ptr<Subscription> sub = m_subscriber;
            sub->loop().post([sub, value]() { sub->deliver(value); });
        }
    }

    // nullptr when a live subscription already exists
    std::shared_ptr<Subscription> subscribe(EventLoop& loop, Handler handler) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_subscriber && !m_subscriber->isCancelled()) {
            LOG_WARN("EventBus: " + m_name + " already has a subscriber, refusing another");
            return nullptr;
        }
        auto sub = std::make_shared<Subscription>(loop, std::move(handler));
        for (const T& value : m_buffer) {
            loop.post([sub, value]() { sub->deliver(value); });
        }
        m_subscriber = sub;
        LOG_DEBUG("EventBus: " + m_name + " subscribed, replaying " + std::to_string(m_buffer.size()) + " value(s)");
        return sub;
    }

    bool hasSubscriber() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_subscriber && !m_subscriber->isCancelled();
    }

    std::vector<T> history() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return std::vector<T>(m_buffer.begin(), m_buffer.end());
    }

    size_t capacity() const { return m_capacity; }

private:
    const std::string m_name;
    const size_t m_capacity;
    std::deque<T> m_buffer;
    std::shared_ptr<Subscription> m_subscriber;
    mutable std::mutex m_mutex;
};

#endif // REPLAY_CHANNEL_H
