#include "session_workers.h"
#include "session_event_bus.h"
#include "logger.h"
#include <exception>
#include <vector>

// ============================================================================
// SessionWorker
// ============================================================================

SessionWorker::SessionWorker(const char* role) : m_role(role) {}

SessionWorker::~SessionWorker() {
    if (m_thread.joinable()) {
        // The thread held the last reference and is unwinding itself
        if (m_thread.get_id() == std::this_thread::get_id()) {
            m_thread.detach();
        } else {
            m_thread.join();
        }
    }
}

void SessionWorker::start() {
    std::shared_ptr<SessionWorker> self = shared_from_this();
    m_thread = std::thread([self]() {
        try {
            self->run();
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("Session: ") + self->m_role + " worker threw: " + e.what());
        }
        self->m_finished = true;
    });
}

void SessionWorker::cancel() {
    if (m_cancelled.exchange(true)) {
        return;
    }
    LOG_DEBUG(std::string("Session: cancelling ") + m_role);
    onCancel();
}

void SessionWorker::join() {
    if (m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id()) {
        m_thread.join();
    }
}

// ============================================================================
// AcceptLoop
// ============================================================================

AcceptLoop::AcceptLoop(RadioAdapter& radio, const ServiceConfig& config, WorkerListener& listener)
    : SessionWorker("accept loop"), m_radio(radio), m_config(config), m_listener(listener) {}

bool AcceptLoop::open() {
    m_server = m_radio.listen(m_config.service_name, m_config.service_uuid);
    if (!m_server) {
        LOG_WARN("Session: could not open listening channel for " + m_config.service_name);
        return false;
    }
    return true;
}

void AcceptLoop::run() {
    if (!m_server) {
        return;
    }
    while (!isCancelled()) {
        std::unique_ptr<Channel> channel = m_server->accept();
        if (!channel) {
            if (!isCancelled()) {
                LOG_WARN("Session: accept failed, accept loop ends");
            }
            break;
        }
        LOG_INFO("Session: inbound connection from " + channel->remotePeer().address);
        if (m_listener.onInboundChannel(this, std::move(channel))) {
            break;
        }
    }
    LOG_DEBUG("Session: accept loop finished");
}

void AcceptLoop::onCancel() {
    if (m_server) {
        m_server->close();
    }
}

// ============================================================================
// ConnectTask
// ============================================================================

ConnectTask::ConnectTask(RadioAdapter& radio, PeerIdentity peer, const ServiceConfig& config,
                         WorkerListener& listener)
    : SessionWorker("connect task"), m_radio(radio), m_peer(std::move(peer)),
      m_config(config), m_listener(listener) {}

void ConnectTask::run() {
    // An inquiry in progress slows the connection down considerably
    m_radio.cancelDiscovery();

    std::unique_ptr<Channel> channel = m_radio.createChannel(m_peer, m_config.service_uuid);
    if (!channel) {
        LOG_WARN("Session: no channel to " + m_peer.address);
        if (!isCancelled()) {
            m_listener.onConnectFailed(this);
        }
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_inflight = channel.get();
        if (isCancelled()) {
            m_inflight = nullptr;
            channel->close();
            return;
        }
    }

    LOG_INFO("Session: connecting to " + m_peer.toString());
    const bool connected = channel->connect();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_inflight = nullptr;
    }

    if (isCancelled()) {
        channel->close();
        return;
    }
    if (!connected) {
        LOG_INFO("Session: connection to " + m_peer.address + " failed");
        channel->close();
        m_listener.onConnectFailed(this);
        return;
    }
    m_listener.onConnectSucceeded(this, std::move(channel));
}

void ConnectTask::onCancel() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_inflight) {
        m_inflight->close();
    }
}

// ============================================================================
// ConnectedLoop
// ============================================================================

ConnectedLoop::ConnectedLoop(std::unique_ptr<Channel> channel, SessionEventBus& bus,
                             size_t read_buffer_size, WorkerListener& listener)
    : SessionWorker("connected loop"), m_channel(std::move(channel)), m_bus(bus),
      m_read_buffer_size(read_buffer_size == 0 ? 1 : read_buffer_size), m_listener(listener) {}

void ConnectedLoop::run() {
    std::vector<char> buffer(m_read_buffer_size);
    while (true) {
        int n = -1;
        try {
            n = m_channel->read(buffer.data(), buffer.size());
        } catch (const std::exception& e) {
            if (!isCancelled()) {
                LOG_WARN("Session: read from " + m_channel->remotePeer().address + " threw: " + e.what());
            }
            n = -1;
        }

        if (isCancelled()) {
            break;
        }
        if (n <= 0) {
            LOG_INFO("Session: connection to " + m_channel->remotePeer().address + " lost");
            m_listener.onConnectionLost(this);
            break;
        }
        // Chunks are not reassembled: one read == one message
        m_bus.publishMessage(std::string(buffer.data(), static_cast<size_t>(n)));
    }
    LOG_DEBUG("Session: connected loop finished");
}

bool ConnectedLoop::write(const std::string& data) {
    std::lock_guard<std::mutex> lock(m_writeMutex);
    if (isCancelled()) {
        return false;
    }
    if (!m_channel->write(data)) {
        // The reader notices a dead link; writes only log
        LOG_WARN("Session: write of " + std::to_string(data.size()) + " bytes to " +
                 m_channel->remotePeer().address + " failed");
        return false;
    }
    return true;
}

void ConnectedLoop::onCancel() {
    m_channel->close();
}
