#include "bluetooth_session.h"
#include "logger.h"
#include <algorithm>

template <typename Worker>
void BluetoothSession::retireLocked(std::shared_ptr<Worker>& slot) {
    if (!slot) {
        return;
    }
    slot->cancel();
    m_retired.push_back(slot);
    slot.reset();
}

BluetoothSession::BluetoothSession(ServiceConfig config, RadioAdapter& radio, SessionEventBus& bus)
    : m_config(std::move(config)), m_radio(radio), m_bus(bus) {}

BluetoothSession::~BluetoothSession() {
    stop();
    std::vector<std::shared_ptr<SessionWorker>> retired;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        retired.swap(m_retired);
    }
    joinRetired(std::move(retired));
}

// ----------------------------------------------------------------------------
// Transitions
// ----------------------------------------------------------------------------

void BluetoothSession::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    startLocked();
}

void BluetoothSession::startLocked() {
    reapLocked();
    retireLocked(m_connectTask);
    retireLocked(m_connectedLoop);

    if (!m_acceptLoop || !m_acceptLoop->isActive()) {
        retireLocked(m_acceptLoop);
        WorkerListener& listener = *this;
        auto loop = std::make_shared<AcceptLoop>(m_radio, m_config, listener);
        if (loop->open()) {
            m_acceptLoop = loop;
            m_acceptLoop->start();
        } else {
            LOG_WARN("Session: listening without an accept loop");
        }
    }
    setStateLocked(SessionState::LISTENING);
}

void BluetoothSession::connect(const PeerIdentity& peer) {
    std::lock_guard<std::mutex> lock(m_mutex);
    reapLocked();
    if (m_connectTask && m_state == SessionState::CONNECTING) {
        LOG_INFO("Session: dropping attempt to " + m_connectTask->peer().address + " for " + peer.address);
    }
    retireLocked(m_connectTask);
    retireLocked(m_connectedLoop);

    WorkerListener& listener = *this;
    m_connectTask = std::make_shared<ConnectTask>(m_radio, peer, m_config, listener);
    m_connectTask->start();
    setStateLocked(SessionState::CONNECTING);
}

void BluetoothSession::promoteLocked(std::unique_ptr<Channel> channel) {
    retireLocked(m_connectTask);
    retireLocked(m_connectedLoop);
    retireLocked(m_acceptLoop);

    LOG_INFO("Session: connected to " + channel->remotePeer().toString());
    WorkerListener& listener = *this;
    m_connectedLoop = std::make_shared<ConnectedLoop>(std::move(channel), m_bus,
                                                      m_config.read_buffer_size, listener);
    // CONNECTED goes out before the reader can publish its first message
    setStateLocked(SessionState::CONNECTED);
    m_connectedLoop->start();
}

void BluetoothSession::stop() {
    std::vector<std::shared_ptr<SessionWorker>> retired;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        retireLocked(m_acceptLoop);
        retireLocked(m_connectTask);
        retireLocked(m_connectedLoop);
        setStateLocked(SessionState::NONE);
        retired.swap(m_retired);
    }
    joinRetired(std::move(retired));
}

bool BluetoothSession::write(const std::string& data) {
    std::shared_ptr<ConnectedLoop> loop;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state != SessionState::CONNECTED || !m_connectedLoop) {
            return false;
        }
        loop = m_connectedLoop;
    }
    return loop->write(data);
}

void BluetoothSession::setStateLocked(SessionState state) {
    if (state == m_state) {
        return;
    }
    LOG_INFO(std::string("Session: ") + session_state_to_string(m_state) + " -> " +
             session_state_to_string(state));
    m_state = state;
    m_bus.publishState(state);
}

// ----------------------------------------------------------------------------
// Worker callbacks (worker threads)
// ----------------------------------------------------------------------------

bool BluetoothSession::onInboundChannel(AcceptLoop* source, std::unique_ptr<Channel> channel) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (source != m_acceptLoop.get()) {
        channel->close();
        return true;
    }
    if (m_state == SessionState::LISTENING || m_state == SessionState::CONNECTING) {
        promoteLocked(std::move(channel));
        return true;
    }
    // NONE or already serving a peer
    LOG_INFO("Session: rejecting " + channel->remotePeer().address + " in state " +
             session_state_to_string(m_state));
    channel->close();
    return false;
}

void BluetoothSession::onConnectSucceeded(ConnectTask* source, std::unique_ptr<Channel> channel) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (source != m_connectTask.get() || m_state != SessionState::CONNECTING) {
        LOG_DEBUG("Session: discarding channel from stale connect task");
        channel->close();
        return;
    }
    promoteLocked(std::move(channel));
}

void BluetoothSession::onConnectFailed(ConnectTask* source) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (source != m_connectTask.get()) {
        return;
    }
    startLocked();
}

void BluetoothSession::onConnectionLost(ConnectedLoop* source) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (source != m_connectedLoop.get()) {
        return;
    }
    startLocked();
}

// ----------------------------------------------------------------------------
// Worker bookkeeping
// ----------------------------------------------------------------------------

void BluetoothSession::reapLocked() {
    m_retired.erase(std::remove_if(m_retired.begin(), m_retired.end(),
                                   [](const std::shared_ptr<SessionWorker>& worker) {
                                       return worker->hasFinished();
                                   }),
                    m_retired.end());
}

void BluetoothSession::joinRetired(std::vector<std::shared_ptr<SessionWorker>> retired) {
    for (auto& worker : retired) {
        worker->join();
    }
}

// ----------------------------------------------------------------------------
// Queries
// ----------------------------------------------------------------------------

SessionState BluetoothSession::state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

bool BluetoothSession::hasAcceptLoop() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_acceptLoop && m_acceptLoop->isActive();
}

bool BluetoothSession::hasConnectTask() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_connectTask && m_connectTask->isActive();
}

bool BluetoothSession::hasConnectedLoop() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_connectedLoop && m_connectedLoop->isActive();
}

PeerIdentity BluetoothSession::connectedPeer() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_connectedLoop) {
        return PeerIdentity();
    }
    return m_connectedLoop->remotePeer();
}
