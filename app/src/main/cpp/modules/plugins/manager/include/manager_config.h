#ifndef MANAGER_CONFIG_H
#define MANAGER_CONFIG_H

#include "constants.h"
#include <chrono>
#include <cstddef>

/**
 * Scan and discoverability windows for BluetoothManager.
 * The manager clamps the windows to MAX_SCAN_TIME_SEC and
 * MAX_DISCOVERABLE_TIME_SEC when it is constructed.
 */
struct ManagerConfig {
    std::chrono::milliseconds scan_time{std::chrono::seconds(DEFAULT_SCAN_TIME_SEC)};
    bool loop_scan = false;
    std::chrono::milliseconds discoverable_time{std::chrono::seconds(DEFAULT_DISCOVERABLE_TIME_SEC)};
    bool loop_discovery = false;
    size_t replay_capacity = DEFAULT_REPLAY_CAPACITY;

    // Copy with windows clamped to [0, max] and capacity at least 1
    ManagerConfig clamped() const;

    static ManagerConfig fromConfigManager();
};

#endif // MANAGER_CONFIG_H
