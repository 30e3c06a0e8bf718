#include "bluetooth_manager.h"
#include "logger.h"

BluetoothManager::BluetoothManager(const ManagerConfig& config, ServiceConfig service_config,
                                   RadioAdapter& radio, BluetoothManagerObserver& observer)
    : m_config(config.clamped()),
      m_radio(radio),
      m_observer(observer),
      m_available(radio.isAvailable()),
      m_scheduler(m_loop),
      m_bus(m_config.replay_capacity),
      m_session(std::move(service_config), radio, m_bus),
      m_receiver(radio, m_loop),
      m_aggregator(radio, m_scheduler, m_receiver, *this, m_config.scan_time, m_config.loop_scan) {
    m_loop.start();
}

BluetoothManager::~BluetoothManager() {
    onStop();
    m_loop.stop();
    m_scheduler.shutdown();
}

void BluetoothManager::start() {
    if (!m_available) {
        LOG_WARN("Manager: no radio on this device");
        m_loop.post([this]() { m_observer.onRadioUnavailable(); });
        return;
    }
    m_stopped = false;

    checkRadioEnablement();
    m_aggregator.prepare();
    m_aggregator.setScanReady(m_radio.isEnabled());
    m_session.start();
    subscribeRelays();
    LOG_INFO("Manager: started");
}

void BluetoothManager::checkRadioEnablement() {
    if (m_radio.isEnabled()) {
        m_loop.post([this]() { m_observer.onRadioAvailable(); });
        return;
    }
    LOG_INFO("Manager: radio is off, requesting enable");
    if (!m_radio.requestEnable()) {
        LOG_WARN("Manager: enable request was refused");
    }
}

void BluetoothManager::subscribeRelays() {
    if (!m_scheduler.has(TaskCategory::SERVICE_STATE_RELAY)) {
        auto sub = m_bus.states().subscribe(m_loop, [this](const SessionState& state) {
            m_observer.onSessionStateChanged(state);
        });
        m_scheduler.add(TaskCategory::SERVICE_STATE_RELAY, sub);
    }
    if (!m_scheduler.has(TaskCategory::MESSAGE_RELAY)) {
        auto sub = m_bus.messages().subscribe(m_loop, [this](const std::string& text) {
            m_observer.onMessageReceived(text);
        });
        m_scheduler.add(TaskCategory::MESSAGE_RELAY, sub);
    }
}

void BluetoothManager::scanDevices() {
    if (!m_available) {
        return;
    }
    m_loop.post([this]() { m_aggregator.beginScan(); });
}

void BluetoothManager::stopScan() {
    if (!m_available) {
        return;
    }
    m_aggregator.stopScan();
}

void BluetoothManager::makeDiscoverable() {
    if (!m_available) {
        return;
    }
    m_loop.post([this]() { requestDiscoverable(); });
}

void BluetoothManager::requestDiscoverable() {
    const int seconds = static_cast<int>(
        std::chrono::duration_cast<std::chrono::seconds>(m_config.discoverable_time).count());
    if (!m_radio.setDiscoverable(seconds)) {
        LOG_WARN("Manager: radio refused discoverability");
    }
    m_scheduler.schedule(TaskCategory::DISCOVERY, m_config.discoverable_time, [this]() {
        if (m_config.loop_discovery && !m_stopped) {
            requestDiscoverable();
        }
    });
}

std::vector<PeerIdentity> BluetoothManager::pairedDevices() const {
    if (!m_available) {
        return {};
    }
    return m_radio.pairedPeers();
}

std::vector<PeerIdentity> BluetoothManager::discoveredDevices() const {
    return m_aggregator.snapshot();
}

void BluetoothManager::connectDevice(const PeerIdentity& peer) {
    if (!m_available) {
        return;
    }
    LOG_INFO("Manager: connect to " + peer.toString());
    m_session.connect(peer);
}

bool BluetoothManager::sendMessage(const std::string& message) {
    if (!m_available) {
        return false;
    }
    return m_session.write(message);
}

void BluetoothManager::requestRadioEnabling() {
    if (!m_available) {
        return;
    }
    if (m_radio.isEnabled()) {
        m_aggregator.setScanReady(true);
        m_loop.post([this]() { m_observer.onRadioAvailable(); });
        return;
    }
    if (!m_radio.requestEnable()) {
        LOG_WARN("Manager: enable request was refused");
    }
}

bool BluetoothManager::isRadioEnabled() const {
    return m_available && m_radio.isEnabled();
}

void BluetoothManager::onStop() {
    if (!m_available) {
        return;
    }
    m_stopped = true;
    m_radio.cancelDiscovery();
    m_session.stop();
    m_scheduler.cancelAll();
    m_receiver.unregisterReceiver();
    LOG_INFO("Manager: stopped");
}

// ----------------------------------------------------------------------------
// DiscoverySink (event loop)
// ----------------------------------------------------------------------------

void BluetoothManager::onDevicesFound(const std::vector<PeerIdentity>& devices) {
    m_observer.onDevicesFound(devices);
}

void BluetoothManager::onScanVisibility(bool scanning) {
    m_observer.onScanVisibility(scanning);
}

void BluetoothManager::onScanFinished() {
    m_observer.onScanFinished();
}
