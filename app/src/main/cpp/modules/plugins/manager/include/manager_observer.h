#ifndef MANAGER_OBSERVER_H
#define MANAGER_OBSERVER_H

#include "peer_identity.h"
#include "session_state.h"
#include <string>
#include <vector>

/**
 * Everything BluetoothManager reports. All calls arrive on the manager's
 * event loop thread, one at a time, in the order they were produced.
 * Handlers may call back into the manager, e.g. discoveredDevices().
 */
class BluetoothManagerObserver {
public:
    virtual ~BluetoothManagerObserver() = default;

    // Full list of the current scan cycle, not a delta
    virtual void onDevicesFound(const std::vector<PeerIdentity>& devices) = 0;
    virtual void onRadioAvailable() = 0;
    virtual void onRadioUnavailable() = 0;
    virtual void onScanVisibility(bool scanning) = 0;
    virtual void onScanFinished() = 0;
    virtual void onSessionStateChanged(SessionState state) = 0;
    virtual void onMessageReceived(const std::string& text) = 0;
};

// Ignores every notification; override the ones of interest.
class BluetoothManagerObserverAdapter : public BluetoothManagerObserver {
public:
    void onDevicesFound(const std::vector<PeerIdentity>&) override {}
    void onRadioAvailable() override {}
    void onRadioUnavailable() override {}
    void onScanVisibility(bool) override {}
    void onScanFinished() override {}
    void onSessionStateChanged(SessionState) override {}
    void onMessageReceived(const std::string&) override {}
};

#endif // MANAGER_OBSERVER_H
