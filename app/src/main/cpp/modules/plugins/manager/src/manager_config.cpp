#include "manager_config.h"
#include "config_manager.h"
#include "logger.h"
#include <algorithm>

ManagerConfig ManagerConfig::clamped() const {
    const std::chrono::milliseconds zero(0);
    const std::chrono::milliseconds max_scan = std::chrono::seconds(MAX_SCAN_TIME_SEC);
    const std::chrono::milliseconds max_discoverable = std::chrono::seconds(MAX_DISCOVERABLE_TIME_SEC);

    ManagerConfig result = *this;
    if (scan_time > max_scan) {
        LOG_WARN("Config: scan time " + std::to_string(scan_time.count()) + "ms capped to " +
                 std::to_string(MAX_SCAN_TIME_SEC) + "s");
    }
    if (discoverable_time > max_discoverable) {
        LOG_WARN("Config: discoverable time " + std::to_string(discoverable_time.count()) + "ms capped to " +
                 std::to_string(MAX_DISCOVERABLE_TIME_SEC) + "s");
    }
    result.scan_time = std::min(std::max(scan_time, zero), max_scan);
    result.discoverable_time = std::min(std::max(discoverable_time, zero), max_discoverable);
    result.replay_capacity = std::max<size_t>(replay_capacity, 1);
    return result;
}

ManagerConfig ManagerConfig::fromConfigManager() {
    ConfigManager& cfg = ConfigManager::getInstance();
    ManagerConfig config;
    config.scan_time = std::chrono::seconds(cfg.getScanTimeSec());
    config.loop_scan = cfg.isLoopScan();
    config.discoverable_time = std::chrono::seconds(cfg.getDiscoverableTimeSec());
    config.loop_discovery = cfg.isLoopDiscovery();
    config.replay_capacity = static_cast<size_t>(std::max(1, cfg.getReplayCapacity()));
    return config.clamped();
}
