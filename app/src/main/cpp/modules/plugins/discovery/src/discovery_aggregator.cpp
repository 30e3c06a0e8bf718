#include "discovery_aggregator.h"
#include "logger.h"
#include <algorithm>

DiscoveryAggregator::DiscoveryAggregator(RadioAdapter& radio, TaskScheduler& scheduler,
                                         DiscoveryReceiver& receiver, DiscoverySink& sink,
                                         std::chrono::milliseconds scan_time, bool loop_scan)
    : m_radio(radio), m_scheduler(scheduler), m_receiver(receiver), m_sink(sink),
      m_scan_time(scan_time), m_loop_scan(loop_scan) {
    m_receiver.setHandlers(
        [this](const PeerIdentity& peer) { onPeerDiscovered(peer); },
        [this]() { onDiscoveryFinished(); });
}

void DiscoveryAggregator::prepare() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_devices.clear();
    m_scan_ready = true;
}

void DiscoveryAggregator::setScanReady(bool ready) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_scan_ready = ready;
}

bool DiscoveryAggregator::scanReady() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_scan_ready;
}

bool DiscoveryAggregator::beginScan() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_scan_ready) {
            LOG_WARN("Discovery: scan requested before setup finished");
            return false;
        }
        m_devices.clear();
    }

    m_receiver.registerReceiver();
    if (!m_radio.startDiscovery()) {
        LOG_WARN("Discovery: radio refused to start discovery");
        return false;
    }

    m_sink.onScanVisibility(true);

    RadioAdapter& radio = m_radio;
    m_scheduler.schedule(TaskCategory::SCAN, m_scan_time, [&radio]() {
        LOG_INFO("Discovery: scan window elapsed");
        radio.cancelDiscovery();
    });
    LOG_INFO("Discovery: scanning for " + std::to_string(m_scan_time.count() / 1000) + "s" +
             (m_loop_scan ? " (looping)" : ""));
    return true;
}

void DiscoveryAggregator::stopScan() {
    if (!m_radio.cancelDiscovery()) {
        LOG_DEBUG("Discovery: stopScan with no scan running");
    }
}

void DiscoveryAggregator::onPeerDiscovered(const PeerIdentity& peer) {
    std::vector<PeerIdentity> devices;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = std::find(m_devices.begin(), m_devices.end(), peer);
        if (it == m_devices.end()) {
            m_devices.push_back(peer);
            LOG_INFO("Discovery: found " + peer.toString());
        }
        devices = m_devices;
    }
    // Sink runs unlocked; it may read snapshot() back
    m_sink.onDevicesFound(devices);
}

void DiscoveryAggregator::onDiscoveryFinished() {
    size_t found = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        found = m_devices.size();
    }
    LOG_INFO("Discovery: scan finished with " + std::to_string(found) + " device(s)");
    m_sink.onScanFinished();
    m_sink.onScanVisibility(false);
    if (m_loop_scan) {
        beginScan();
    }
}

std::vector<PeerIdentity> DiscoveryAggregator::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_devices;
}
