#ifndef CONSTANTS_H
#define CONSTANTS_H

#include <cstddef>

// Service record (SDP name + UUID the peers agree on)
constexpr const char* DEFAULT_SERVICE_NAME = "LiteBTChat";
constexpr const char* DEFAULT_SERVICE_UUID = "fa87c0d0-afac-11de-8a39-0800200c9a66";

// Connected I/O
constexpr size_t READ_BUFFER_SIZE = 1024;   // One read chunk == one message event

// Scan / discoverability windows (seconds)
constexpr int DEFAULT_SCAN_TIME_SEC = 120;
constexpr int MAX_SCAN_TIME_SEC = 300;
constexpr int DEFAULT_DISCOVERABLE_TIME_SEC = 120;
constexpr int MAX_DISCOVERABLE_TIME_SEC = 120;

// Event bus
constexpr size_t DEFAULT_REPLAY_CAPACITY = 128;

// Socket radio (desktop emulation of RFCOMM + inquiry)
constexpr int DEFAULT_RFCOMM_PORT = 30101;
constexpr int DEFAULT_DISCOVERY_PORT = 30100;
constexpr int DEFAULT_LISTEN_BACKLOG = 5;
constexpr int DEFAULT_INQUIRY_WINDOW_MS = 12000;
constexpr int DEFAULT_INQUIRY_INTERVAL_MS = 2000;
constexpr int CONNECT_TIMEOUT_MS = 10000;
constexpr int CONNECT_POLL_INTERVAL_MS = 100;
constexpr int ACCEPT_POLL_INTERVAL_MS = 200;
constexpr int DISCOVERY_POLL_INTERVAL_MS = 200;
constexpr size_t DISCOVERY_MSG_MAX = 512;

constexpr const char* INQUIRY_MESSAGE_PREFIX = "LITEBT_INQUIRY";
constexpr const char* RESPONSE_MESSAGE_PREFIX = "LITEBT_RESPONSE";

#endif // CONSTANTS_H
