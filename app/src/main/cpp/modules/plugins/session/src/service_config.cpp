#include "service_config.h"
#include "config_manager.h"
#include "logger.h"

ServiceConfig ServiceConfig::fromConfigManager() {
    ConfigManager& cfg = ConfigManager::getInstance();
    ServiceConfig config;
    config.service_name = cfg.getServiceName();
    config.service_uuid = cfg.getServiceUuid();

    int buffer_size = cfg.getReadBufferSize();
    if (buffer_size <= 0) {
        LOG_WARN("Config: read_buffer_size " + std::to_string(buffer_size) + " is invalid, using " +
                 std::to_string(READ_BUFFER_SIZE));
        buffer_size = static_cast<int>(READ_BUFFER_SIZE);
    }
    config.read_buffer_size = static_cast<size_t>(buffer_size);
    return config;
}
