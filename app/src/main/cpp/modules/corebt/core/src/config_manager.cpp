#include "config_manager.h"
#include "constants.h"
#include "logger.h"
#include <fstream>

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadConfig(const std::string& config_path) {
    std::ifstream config_file(config_path);
    if (!config_file.is_open()) {
        LOG_ERROR("Config: failed to open config file: " + config_path);
        return false;
    }
    try {
        json parsed = json::parse(config_file);
        if (!parsed.is_object()) {
            LOG_ERROR("Config: top level of " + config_path + " is not an object");
            return false;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = std::move(parsed);
    } catch (const json::exception& e) {
        LOG_ERROR("Config: loading " + config_path + " failed: " + std::string(e.what()));
        return false;
    }
    LOG_INFO("Config: loaded from " + config_path);
    return true;
}

bool ConfigManager::loadFromString(const std::string& text) {
    try {
        json parsed = json::parse(text);
        if (!parsed.is_object()) {
            LOG_ERROR("Config: top level is not an object");
            return false;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = std::move(parsed);
        return true;
    } catch (const json::exception& e) {
        LOG_ERROR("Config: parse failed: " + std::string(e.what()));
        return false;
    }
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = json::object();
}

bool ConfigManager::setValueAtPath(const std::vector<std::string>& path, const json& value) {
    if (path.empty()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    json* node = &m_config;
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        json& child = (*node)[path[i]];
        if (!child.is_object()) {
            child = json::object();
        }
        node = &child;
    }
    (*node)[path.back()] = value;
    return true;
}

std::string ConfigManager::getServiceName() const {
    return valueAt<std::string>("service", "name", DEFAULT_SERVICE_NAME);
}

std::string ConfigManager::getServiceUuid() const {
    return valueAt<std::string>("service", "uuid", DEFAULT_SERVICE_UUID);
}

int ConfigManager::getReadBufferSize() const {
    return valueAt<int>("service", "read_buffer_size", static_cast<int>(READ_BUFFER_SIZE));
}

int ConfigManager::getScanTimeSec() const {
    return valueAt<int>("scan", "time_sec", DEFAULT_SCAN_TIME_SEC);
}

bool ConfigManager::isLoopScan() const {
    return valueAt<bool>("scan", "loop", false);
}

int ConfigManager::getDiscoverableTimeSec() const {
    return valueAt<int>("discoverable", "time_sec", DEFAULT_DISCOVERABLE_TIME_SEC);
}

bool ConfigManager::isLoopDiscovery() const {
    return valueAt<bool>("discoverable", "loop", false);
}

int ConfigManager::getReplayCapacity() const {
    return valueAt<int>("event_bus", "replay_capacity", static_cast<int>(DEFAULT_REPLAY_CAPACITY));
}

std::string ConfigManager::getLocalName() const {
    return valueAt<std::string>("socket_radio", "local_name", "litebt-node");
}

std::string ConfigManager::getBindAddress() const {
    return valueAt<std::string>("socket_radio", "bind_address", "0.0.0.0");
}

int ConfigManager::getRfcommPort() const {
    return valueAt<int>("socket_radio", "rfcomm_port", DEFAULT_RFCOMM_PORT);
}

int ConfigManager::getDiscoveryPort() const {
    return valueAt<int>("socket_radio", "discovery_port", DEFAULT_DISCOVERY_PORT);
}

int ConfigManager::getInquiryWindowMs() const {
    return valueAt<int>("socket_radio", "inquiry_window_ms", DEFAULT_INQUIRY_WINDOW_MS);
}

int ConfigManager::getInquiryIntervalMs() const {
    return valueAt<int>("socket_radio", "inquiry_interval_ms", DEFAULT_INQUIRY_INTERVAL_MS);
}

std::vector<std::pair<std::string, std::string>> ConfigManager::getPairedPeers() const {
    std::vector<std::pair<std::string, std::string>> peers;
    json paired;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto section = m_config.find("socket_radio");
        if (section == m_config.end() || !section->is_object()) {
            return peers;
        }
        auto it = section->find("paired_peers");
        if (it == section->end() || !it->is_array()) {
            return peers;
        }
        paired = *it;
    }
    for (const auto& entry : paired) {
        if (!entry.is_object() || !entry.contains("address") || !entry["address"].is_string()) {
            LOG_WARN("Config: skipping paired peer entry without an address");
            continue;
        }
        std::string name;
        if (entry.contains("name") && entry["name"].is_string()) {
            name = entry["name"].get<std::string>();
        }
        peers.emplace_back(entry["address"].get<std::string>(), name);
    }
    return peers;
}

std::vector<std::string> ConfigManager::getInquiryTargets() const {
    std::vector<std::string> targets;
    std::lock_guard<std::mutex> lock(m_mutex);
    auto section = m_config.find("socket_radio");
    if (section == m_config.end() || !section->is_object()) {
        return targets;
    }
    auto it = section->find("inquiry_targets");
    if (it == section->end() || !it->is_array()) {
        return targets;
    }
    for (const auto& entry : *it) {
        if (entry.is_string()) {
            targets.push_back(entry.get<std::string>());
        }
    }
    return targets;
}

std::string ConfigManager::getLogLevel() const {
    return valueAt<std::string>("logging", "level", "info");
}

bool ConfigManager::isAsyncLogging() const {
    return valueAt<bool>("logging", "async", false);
}
