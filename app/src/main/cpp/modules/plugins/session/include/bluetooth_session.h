#ifndef BLUETOOTH_SESSION_H
#define BLUETOOTH_SESSION_H

#include "radio_adapter.h"
#include "service_config.h"
#include "session_event_bus.h"
#include "session_state.h"
#include "session_workers.h"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief BluetoothSession - single-peer RFCOMM session state machine.
 *
 *   start()        -> LISTENING   (accept loop, connect task/loop cancelled)
 *   connect(peer)  -> CONNECTING  (previous attempt and connected loop cancelled)
 *   promotion      -> CONNECTED   (accept loop and connect task cancelled)
 *   stop()         -> NONE        (everything cancelled)
 *
 * A failed connect and a lost connection both fall back to start().
 * Every transition and handle swap happens under m_mutex, and each state
 * change is published on the bus while it is held.
 */
class BluetoothSession : private WorkerListener {
public:
    BluetoothSession(ServiceConfig config, RadioAdapter& radio, SessionEventBus& bus);
    ~BluetoothSession() override;

    BluetoothSession(const BluetoothSession&) = delete;
    BluetoothSession& operator=(const BluetoothSession&) = delete;

    void start();
    void connect(const PeerIdentity& peer);
    void stop();

    // No-op (false) unless CONNECTED; write errors are logged only
    bool write(const std::string& data);

    SessionState state() const;

    bool hasAcceptLoop() const;
    bool hasConnectTask() const;
    bool hasConnectedLoop() const;
    PeerIdentity connectedPeer() const;

private:
    bool onInboundChannel(AcceptLoop* source, std::unique_ptr<Channel> channel) override;
    void onConnectSucceeded(ConnectTask* source, std::unique_ptr<Channel> channel) override;
    void onConnectFailed(ConnectTask* source) override;
    void onConnectionLost(ConnectedLoop* source) override;

    void startLocked();
    void promoteLocked(std::unique_ptr<Channel> channel);
    void setStateLocked(SessionState state);

    // Cancels the worker and parks it until it can be joined outside the lock
    template <typename Worker>
    void retireLocked(std::shared_ptr<Worker>& slot);
    void reapLocked();
    void joinRetired(std::vector<std::shared_ptr<SessionWorker>> retired);

    ServiceConfig m_config;
    RadioAdapter& m_radio;
    SessionEventBus& m_bus;

    mutable std::mutex m_mutex;
    SessionState m_state{SessionState::NONE};
    std::shared_ptr<AcceptLoop> m_acceptLoop;
    std::shared_ptr<ConnectTask> m_connectTask;
    std::shared_ptr<ConnectedLoop> m_connectedLoop;
    std::vector<std::shared_ptr<SessionWorker>> m_retired;
};

#endif // BLUETOOTH_SESSION_H
