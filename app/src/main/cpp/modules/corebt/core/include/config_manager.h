#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <utility>
#include <mutex>

using json = nlohmann::json;

/**
 * @brief Process-wide configuration loaded from config.json.
 *
 * Every getter falls back to the compiled default from constants.h when the
 * key is missing or has the wrong type, so an empty configuration is valid.
 * Components never read this at run time: they receive immutable config
 * structs built from it once (ServiceConfig, ManagerConfig, SocketRadioConfig).
 */
class ConfigManager {
public:
    static ConfigManager& getInstance();

    bool loadConfig(const std::string& config_path);
    bool loadFromString(const std::string& text);
    void reset();

    // Tests tweak single values without a file
    bool setValueAtPath(const std::vector<std::string>& path, const json& value);

    // Service record
    std::string getServiceName() const;
    std::string getServiceUuid() const;
    int getReadBufferSize() const;

    // Scan / discoverability
    int getScanTimeSec() const;
    bool isLoopScan() const;
    int getDiscoverableTimeSec() const;
    bool isLoopDiscovery() const;

    // Event bus
    int getReplayCapacity() const;

    // Socket radio
    std::string getLocalName() const;
    std::string getBindAddress() const;
    int getRfcommPort() const;
    int getDiscoveryPort() const;
    int getInquiryWindowMs() const;
    int getInquiryIntervalMs() const;
    // (address, name) pairs
    std::vector<std::pair<std::string, std::string>> getPairedPeers() const;
    std::vector<std::string> getInquiryTargets() const;

    // Logging
    std::string getLogLevel() const;
    bool isAsyncLogging() const;

private:
    ConfigManager() = default;

    template <typename T>
    T valueAt(const char* section, const char* key, const T& fallback) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        try {
            auto it = m_config.find(section);
            if (it == m_config.end() || !it->is_object()) {
                return fallback;
            }
            return it->value(key, fallback);
        } catch (const json::exception&) {
            return fallback;
        }
    }

    json m_config = json::object();
    mutable std::mutex m_mutex;
};
