/**
 * CoreBT Implementation
 */

#include "corebt.h"

namespace litebt {

bool CoreBT::initialize(const std::string& config_path) {
    ConfigManager& config = ConfigManager::getInstance();
    bool loaded = true;
    if (!config_path.empty()) {
        loaded = config.loadConfig(config_path);
    }

    set_log_level(parse_log_level(config.getLogLevel()));
    if (config.isAsyncLogging()) {
        enable_async_logging();
    }
    LOG_DEBUG(std::string(NAME) + " " + VERSION + " initialized");
    return loaded;
}

void CoreBT::shutdown() {
    if (is_async_logging_enabled()) {
        disable_async_logging();
    }
}

} // namespace litebt
