#ifndef SERVICE_CONFIG_H
#define SERVICE_CONFIG_H

#include "constants.h"
#include <cstddef>
#include <string>

// Service record and I/O sizing shared by every session worker.
struct ServiceConfig {
    std::string service_name = DEFAULT_SERVICE_NAME;
    std::string service_uuid = DEFAULT_SERVICE_UUID;
    size_t read_buffer_size = READ_BUFFER_SIZE;

    static ServiceConfig fromConfigManager();
};

#endif // SERVICE_CONFIG_H
