#ifndef SESSION_WORKERS_H
#define SESSION_WORKERS_H

#include "cancellable.h"
#include "radio_adapter.h"
#include "service_config.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

class SessionEventBus;
class AcceptLoop;
class ConnectTask;
class ConnectedLoop;

/**
 * Callbacks from workers to the session, made on the worker's own thread.
 * The session decides under its lock whether the worker is still current;
 * a stale worker's channel is closed and nothing else happens.
 */
class WorkerListener {
public:
    virtual ~WorkerListener() = default;

    // Returns true when the accept loop should stop (promoted or stale)
    virtual bool onInboundChannel(AcceptLoop* source, std::unique_ptr<Channel> channel) = 0;
    virtual void onConnectSucceeded(ConnectTask* source, std::unique_ptr<Channel> channel) = 0;
    virtual void onConnectFailed(ConnectTask* source) = 0;
    virtual void onConnectionLost(ConnectedLoop* source) = 0;
};

/**
 * A background role with its own thread. Cancelling closes the resource the
 * thread blocks on; the thread then sees isCancelled() and exits quietly.
 * The running thread keeps the worker alive, so the owner may drop its
 * reference at any time.
 */
class SessionWorker : public Cancellable, public std::enable_shared_from_this<SessionWorker> {
public:
    explicit SessionWorker(const char* role);
    ~SessionWorker() override;

    SessionWorker(const SessionWorker&) = delete;
    SessionWorker& operator=(const SessionWorker&) = delete;

    void start();
    void cancel() override;
    bool isCancelled() const override { return m_cancelled.load(); }
    bool isActive() const override { return !m_cancelled.load() && !m_finished.load(); }
    bool hasFinished() const { return m_finished.load(); }

    // No-op when called from the worker's own thread
    void join();

    const char* role() const { return m_role; }

protected:
    virtual void run() = 0;
    virtual void onCancel() = 0;

private:
    const char* m_role;
    std::thread m_thread;
    std::atomic<bool> m_cancelled{false};
    std::atomic<bool> m_finished{false};
};

// Waits for inbound peers on the service's listening channel.
class AcceptLoop : public SessionWorker {
public:
    AcceptLoop(RadioAdapter& radio, const ServiceConfig& config, WorkerListener& listener);

    // Registers the service; must succeed before start()
    bool open();

protected:
    void run() override;
    void onCancel() override;

private:
    RadioAdapter& m_radio;
    ServiceConfig m_config;
    WorkerListener& m_listener;
    std::unique_ptr<ListeningChannel> m_server;
};

// One outbound attempt to a single peer.
class ConnectTask : public SessionWorker {
public:
    ConnectTask(RadioAdapter& radio, PeerIdentity peer, const ServiceConfig& config, WorkerListener& listener);

    const PeerIdentity& peer() const { return m_peer; }

protected:
    void run() override;
    void onCancel() override;

private:
    RadioAdapter& m_radio;
    PeerIdentity m_peer;
    ServiceConfig m_config;
    WorkerListener& m_listener;
    std::mutex m_mutex;
    Channel* m_inflight{nullptr};   // guarded by m_mutex
};

/**
 * Owns the connected channel. Reads fixed-size chunks and publishes each one
 * as a message; writes are serialized by m_writeMutex.
 */
class ConnectedLoop : public SessionWorker {
public:
    ConnectedLoop(std::unique_ptr<Channel> channel, SessionEventBus& bus,
                  size_t read_buffer_size, WorkerListener& listener);

    bool write(const std::string& data);
    PeerIdentity remotePeer() const { return m_channel->remotePeer(); }

protected:
    void run() override;
    void onCancel() override;

private:
    std::unique_ptr<Channel> m_channel;
    SessionEventBus& m_bus;
    size_t m_read_buffer_size;
    WorkerListener& m_listener;
    std::mutex m_writeMutex;
};

#endif // SESSION_WORKERS_H
