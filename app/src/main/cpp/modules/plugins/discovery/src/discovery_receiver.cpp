#include "discovery_receiver.h"
#include "logger.h"

DiscoveryReceiver::DiscoveryReceiver(RadioAdapter& radio, EventLoop& loop)
    : m_radio(radio), m_loop(loop) {}

DiscoveryReceiver::~DiscoveryReceiver() {
    unregisterReceiver();
}

void DiscoveryReceiver::setHandlers(PeerFoundHandler on_found, FinishedHandler on_finished) {
    m_on_found = std::move(on_found);
    m_on_finished = std::move(on_finished);
}

bool DiscoveryReceiver::registerReceiver() {
    if (m_registered.exchange(true)) {
        return false;
    }
    m_radio.setDiscoveryListener(this);
    LOG_DEBUG("Discovery: receiver registered");
    return true;
}

bool DiscoveryReceiver::unregisterReceiver() {
    if (!m_registered.exchange(false)) {
        return false;
    }
    m_radio.setDiscoveryListener(nullptr);
    LOG_DEBUG("Discovery: receiver unregistered");
    return true;
}

void DiscoveryReceiver::onPeerFound(const PeerIdentity& peer) {
    m_loop.post([this, peer]() {
        // Results still queued when the receiver went away are dropped
        if (m_registered && m_on_found) {
            m_on_found(peer);
        }
    });
}

void DiscoveryReceiver::onDiscoveryFinished() {
    m_loop.post([this]() {
        if (m_registered && m_on_finished) {
            m_on_finished();
        }
    });
}
