#ifndef BLUETOOTH_MANAGER_H
#define BLUETOOTH_MANAGER_H

#include "bluetooth_session.h"
#include "discovery_aggregator.h"
#include "discovery_receiver.h"
#include "event_loop.h"
#include "manager_config.h"
#include "manager_observer.h"
#include "radio_adapter.h"
#include "service_config.h"
#include "session_event_bus.h"
#include "task_scheduler.h"
#include <atomic>
#include <string>
#include <vector>

/**
 * @brief BluetoothManager - facade over session, discovery and timers.
 *
 * Owns the event loop every observer notification runs on. Scan and
 * discoverability requests are executed on that loop as well, so the
 * aggregator and the observer never run concurrently.
 *
 * Without a radio (isAvailable() false) start() reports
 * onRadioUnavailable() and every other operation does nothing.
 */
class BluetoothManager : private DiscoverySink {
public:
    BluetoothManager(const ManagerConfig& config, ServiceConfig service_config,
                     RadioAdapter& radio, BluetoothManagerObserver& observer);
    ~BluetoothManager() override;

    BluetoothManager(const BluetoothManager&) = delete;
    BluetoothManager& operator=(const BluetoothManager&) = delete;

    // Checks the radio, opens the service and subscribes the relays
    void start();

    void scanDevices();
    void stopScan();
    void makeDiscoverable();

    std::vector<PeerIdentity> pairedDevices() const;
    std::vector<PeerIdentity> discoveredDevices() const;

    void connectDevice(const PeerIdentity& peer);
    bool sendMessage(const std::string& message);

    void requestRadioEnabling();
    bool isRadioEnabled() const;
    bool isRadioAvailable() const { return m_available; }

    // Call on teardown: releases sockets and cancels every task
    void onStop();

    SessionState sessionState() const { return m_session.state(); }
    const ManagerConfig& config() const { return m_config; }

    // Diagnostics
    BluetoothSession& session() { return m_session; }
    TaskScheduler& scheduler() { return m_scheduler; }
    EventLoop& eventLoop() { return m_loop; }

private:
    void onDevicesFound(const std::vector<PeerIdentity>& devices) override;
    void onScanVisibility(bool scanning) override;
    void onScanFinished() override;

    void checkRadioEnablement();
    void subscribeRelays();
    void requestDiscoverable();

    const ManagerConfig m_config;
    RadioAdapter& m_radio;
    BluetoothManagerObserver& m_observer;
    const bool m_available;

    EventLoop m_loop;
    TaskScheduler m_scheduler;
    SessionEventBus m_bus;
    BluetoothSession m_session;
    DiscoveryReceiver m_receiver;
    DiscoveryAggregator m_aggregator;

    std::atomic<bool> m_stopped{false};
};

#endif // BLUETOOTH_MANAGER_H
