/**
 * CoreBT - Aggregated Bluetooth session core
 *
 * Single include for the layers every LiteBT build links:
 *   1. Foundation (core: config, logging, constants)
 *   2. Infrastructure (reactor: event loop, task scheduler)
 *   3. Radio (transport: adapter contract, socket radio)
 */

#ifndef COREBT_H
#define COREBT_H

// ============================================================================
// Layer 1: Foundation (No Dependencies)
// ============================================================================

#include "config_manager.h"
#include "logger.h"
#include "constants.h"

// ============================================================================
// Layer 2: Infrastructure (Depends on Foundation)
// ============================================================================

#include "cancellable.h"
#include "event_loop.h"
#include "task_scheduler.h"

// ============================================================================
// Layer 3: Radio (Depends on Infrastructure)
// ============================================================================

#include "peer_identity.h"
#include "radio_adapter.h"
#include "socket_channel.h"
#include "socket_radio_adapter.h"

namespace litebt {

class CoreBT {
public:
    static constexpr const char* VERSION = "1.0.0";
    static constexpr const char* NAME = "CoreBT - LiteBT Foundation";

    /**
     * Loads the configuration file (when a path is given) and applies its
     * logging section. Returns false when the file could not be loaded;
     * compiled defaults stay in effect in that case.
     */
    static bool initialize(const std::string& config_path = std::string());

    // Flushes and stops the async log writer
    static void shutdown();
};

} // namespace litebt

#endif // COREBT_H
