#include "socket_radio_adapter.h"
#include "socket_channel.h"
#include "config_manager.h"
#include "constants.h"
#include "logger.h"
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <random>
#include <sstream>
#include <stdexcept>

namespace {
    std::vector<sockaddr_in> get_ipv4_broadcast_targets(uint16_t port) {
        std::vector<sockaddr_in> targets;

        auto add_target = [&](in_addr addr) {
            const uint32_t host = ntohl(addr.s_addr);
            if (host == 0) return;
            for (const auto& existing : targets) {
                if (existing.sin_addr.s_addr == addr.s_addr) {
                    return;
                }
            }
            sockaddr_in dst{};
            dst.sin_family = AF_INET;
            dst.sin_port = htons(port);
            dst.sin_addr = addr;
            targets.push_back(dst);
        };

        struct ifaddrs* ifaddr = nullptr;
        if (getifaddrs(&ifaddr) == 0 && ifaddr) {
            for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
                if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) {
                    continue;
                }
                if ((ifa->ifa_flags & IFF_UP) == 0 || (ifa->ifa_flags & IFF_LOOPBACK) != 0 ||
                    (ifa->ifa_flags & IFF_BROADCAST) == 0) {
                    continue;
                }
                if (ifa->ifa_broadaddr && ifa->ifa_broadaddr->sa_family == AF_INET) {
                    add_target(reinterpret_cast<sockaddr_in*>(ifa->ifa_broadaddr)->sin_addr);
                    continue;
                }
                // No kernel broadcast address: (ip & mask) | ~mask
                if (ifa->ifa_netmask && ifa->ifa_netmask->sa_family == AF_INET) {
                    const uint32_t ip_h = ntohl(reinterpret_cast<sockaddr_in*>(ifa->ifa_addr)->sin_addr.s_addr);
                    const uint32_t mask_h = ntohl(reinterpret_cast<sockaddr_in*>(ifa->ifa_netmask)->sin_addr.s_addr);
                    in_addr bcast{};
                    bcast.s_addr = htonl((ip_h & mask_h) | (~mask_h));
                    add_target(bcast);
                }
            }
            freeifaddrs(ifaddr);
        }

        in_addr limited{};
        limited.s_addr = htonl(INADDR_BROADCAST);
        add_target(limited);
        return targets;
    }

    std::vector<std::string> split_fields(const std::string& message, size_t max_fields) {
        std::vector<std::string> fields;
        size_t start = 0;
        while (fields.size() + 1 < max_fields) {
            size_t pos = message.find('|', start);
            if (pos == std::string::npos) {
                break;
            }
            fields.push_back(message.substr(start, pos - start));
            start = pos + 1;
        }
        fields.push_back(message.substr(start));
        return fields;
    }

    std::string make_node_id() {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        std::ostringstream out;
        out << std::hex << gen();
        return out.str();
    }
}

SocketRadioConfig SocketRadioConfig::fromConfigManager() {
    ConfigManager& cfg = ConfigManager::getInstance();
    SocketRadioConfig config;
    config.local_name = cfg.getLocalName();
    config.bind_address = cfg.getBindAddress();
    config.service_uuid = cfg.getServiceUuid();
    config.rfcomm_port = cfg.getRfcommPort();
    config.discovery_port = cfg.getDiscoveryPort();
    config.inquiry_window = std::chrono::milliseconds(std::max(0, cfg.getInquiryWindowMs()));
    config.inquiry_interval = std::chrono::milliseconds(std::max(1, cfg.getInquiryIntervalMs()));
    for (const auto& entry : cfg.getPairedPeers()) {
        config.paired_peers.emplace_back(entry.first, entry.second);
    }
    config.inquiry_targets = cfg.getInquiryTargets();
    return config;
}

SocketRadioAdapter::SocketRadioAdapter(SocketRadioConfig config)
    : m_config(std::move(config)), m_node_id(make_node_id()) {
    LOG_INFO("Radio: socket radio '" + m_config.local_name + "' rfcomm port " +
             std::to_string(m_config.rfcomm_port) + ", discovery port " +
             std::to_string(m_config.discovery_port));
}

SocketRadioAdapter::~SocketRadioAdapter() {
    stopThreads();
}

void SocketRadioAdapter::stopThreads() {
    m_running = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_inquiryCancelled = true;
    }
    if (m_inquiryThread.joinable()) {
        m_inquiryThread.join();
    }
    if (m_responderThread.joinable()) {
        m_responderThread.join();
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_responder_sock >= 0) {
        close(m_responder_sock);
        m_responder_sock = -1;
    }
}

bool SocketRadioAdapter::requestEnable() {
    // Sockets need no power-on
    return true;
}

std::vector<PeerIdentity> SocketRadioAdapter::pairedPeers() const {
    return m_config.paired_peers;
}

void SocketRadioAdapter::setDiscoveryListener(DiscoveryListener* listener) {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    m_listener = listener;
}

void SocketRadioAdapter::notifyPeerFound(const PeerIdentity& peer) {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    if (m_listener) {
        m_listener->onPeerFound(peer);
    }
}

void SocketRadioAdapter::notifyDiscoveryFinished() {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    if (m_listener) {
        m_listener->onDiscoveryFinished();
    }
}

// ----------------------------------------------------------------------------
// Inquiry
// ----------------------------------------------------------------------------

bool SocketRadioAdapter::startDiscovery() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_running) {
        return false;
    }
    if (m_discovering) {
        LOG_DEBUG("Radio: inquiry already running");
        return true;
    }
    if (m_inquiryThread.joinable()) {
        // Previous inquiry already cleared m_discovering, so it is past its
        // last use of m_mutex.
        if (m_inquiryThread.get_id() == std::this_thread::get_id()) {
            m_inquiryThread.detach();
        } else {
            m_inquiryThread.join();
        }
    }

    int sock = socket(AF_INET, SOCK_DGRAM, 0);
    if (sock < 0) {
        LOG_ERROR("Radio: failed to create inquiry socket: " + std::string(strerror(errno)));
        return false;
    }
    int broadcast = 1;
    if (setsockopt(sock, SOL_SOCKET, SO_BROADCAST, &broadcast, sizeof(broadcast)) < 0) {
        LOG_WARN("Radio: SO_BROADCAST failed: " + std::string(strerror(errno)));
    }
    sockaddr_in bind_addr{};
    bind_addr.sin_family = AF_INET;
    bind_addr.sin_addr.s_addr = INADDR_ANY;
    bind_addr.sin_port = 0;
    if (bind(sock, (sockaddr*)&bind_addr, sizeof(bind_addr)) < 0) {
        LOG_ERROR("Radio: failed to bind inquiry socket: " + std::string(strerror(errno)));
        close(sock);
        return false;
    }

    m_inquiryCancelled = false;
    m_discovering = true;
    m_inquiryThread = std::thread(&SocketRadioAdapter::inquiryLoop, this, sock);
    LOG_INFO("Radio: inquiry started for " + std::to_string(m_config.inquiry_window.count()) + "ms");
    return true;
}

bool SocketRadioAdapter::cancelDiscovery() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_discovering) {
        return false;
    }
    m_inquiryCancelled = true;
    LOG_DEBUG("Radio: inquiry cancel requested");
    return true;
}

void SocketRadioAdapter::inquiryLoop(int sock) {
    const std::string inquiry = std::string(INQUIRY_MESSAGE_PREFIX) + "|" + m_config.service_uuid + "|" + m_node_id;
    const auto deadline = std::chrono::steady_clock::now() + m_config.inquiry_window;
    auto next_send = std::chrono::steady_clock::now();
    std::set<std::string> reported;
    char buf[DISCOVERY_MSG_MAX];

    while (true) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_inquiryCancelled || !m_running) {
                break;
            }
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }

        if (now >= next_send) {
            auto targets = get_ipv4_broadcast_targets(static_cast<uint16_t>(m_config.discovery_port));
            for (const auto& ip : m_config.inquiry_targets) {
                sockaddr_in dst{};
                dst.sin_family = AF_INET;
                dst.sin_port = htons(static_cast<uint16_t>(m_config.discovery_port));
                if (inet_pton(AF_INET, ip.c_str(), &dst.sin_addr) == 1) {
                    targets.push_back(dst);
                } else {
                    LOG_WARN("Radio: ignoring invalid inquiry target " + ip);
                }
            }
            bool any_sent = false;
            for (const auto& dst : targets) {
                if (sendto(sock, inquiry.c_str(), inquiry.length(), 0,
                           reinterpret_cast<const sockaddr*>(&dst), sizeof(dst)) >= 0) {
                    any_sent = true;
                }
            }
            if (!any_sent) {
                LOG_WARN("Radio: inquiry could not be sent on any interface");
            }
            next_send = now + m_config.inquiry_interval;
        }

        pollfd pfd{};
        pfd.fd = sock;
        pfd.events = POLLIN;
        int ready = poll(&pfd, 1, DISCOVERY_POLL_INTERVAL_MS);
        if (ready <= 0) {
            if (ready < 0 && errno != EINTR) {
                LOG_WARN("Radio: inquiry poll failed: " + std::string(strerror(errno)));
                break;
            }
            continue;
        }

        sockaddr_in from_addr{};
        socklen_t from_len = sizeof(from_addr);
        ssize_t n = recvfrom(sock, buf, sizeof(buf) - 1, 0, (sockaddr*)&from_addr, &from_len);
        if (n <= 0) {
            continue;
        }
        buf[n] = 0;
        char sender_ip[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &from_addr.sin_addr, sender_ip, sizeof(sender_ip));
        handleResponse(std::string(buf, static_cast<size_t>(n)), sender_ip, reported);
    }

    close(sock);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_discovering = false;
    }
    LOG_INFO("Radio: inquiry finished, " + std::to_string(reported.size()) + " peer(s) answered");
    notifyDiscoveryFinished();
}

void SocketRadioAdapter::handleResponse(const std::string& message, const char* sender_ip,
                                        std::set<std::string>& reported) {
    // LITEBT_RESPONSE|uuid|port|name
    auto fields = split_fields(message, 4);
    if (fields.size() < 3 || fields[0] != RESPONSE_MESSAGE_PREFIX) {
        return;
    }
    if (fields[1] != m_config.service_uuid) {
        LOG_DEBUG("Radio: ignoring response for service " + fields[1]);
        return;
    }
    int port = 0;
    try {
        port = std::stoi(fields[2]);
    } catch (const std::exception&) {
        LOG_WARN("Radio: malformed port in inquiry response from " + std::string(sender_ip));
        return;
    }
    std::string address = std::string(sender_ip) + ":" + std::to_string(port);
    if (!reported.insert(address).second) {
        return;
    }
    std::string name = fields.size() > 3 ? fields[3] : std::string();
    LOG_DEBUG("Radio: inquiry response from " + name + " at " + address);
    notifyPeerFound(PeerIdentity(address, name));
}

// ----------------------------------------------------------------------------
// Discoverability
// ----------------------------------------------------------------------------

bool SocketRadioAdapter::openResponderSocket() {
    int sock = socket(AF_INET, SOCK_DGRAM, 0);
    if (sock < 0) {
        LOG_ERROR("Radio: failed to create responder socket: " + std::string(strerror(errno)));
        return false;
    }
    int reuse = 1;
    int broadcast = 1;
    setsockopt(sock, SOL_SOCKET, SO_BROADCAST, &broadcast, sizeof(broadcast));
    setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
#ifdef SO_REUSEPORT
    setsockopt(sock, SOL_SOCKET, SO_REUSEPORT, &reuse, sizeof(reuse));
#endif

    sockaddr_in bind_addr{};
    bind_addr.sin_family = AF_INET;
    bind_addr.sin_addr.s_addr = INADDR_ANY;
    bind_addr.sin_port = htons(static_cast<uint16_t>(m_config.discovery_port));
    if (bind(sock, (sockaddr*)&bind_addr, sizeof(bind_addr)) < 0) {
        LOG_ERROR("Radio: failed to bind discovery port " + std::to_string(m_config.discovery_port) +
                  ": " + std::string(strerror(errno)));
        close(sock);
        return false;
    }
    m_responder_sock = sock;
    return true;
}

bool SocketRadioAdapter::setDiscoverable(int seconds) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_running) {
        return false;
    }
    if (m_responder_sock < 0) {
        if (!openResponderSocket()) {
            return false;
        }
        m_responderThread = std::thread(&SocketRadioAdapter::responderLoop, this);
    }
    m_discoverable_until = std::chrono::steady_clock::now() + std::chrono::seconds(std::max(0, seconds));
    LOG_INFO("Radio: discoverable for " + std::to_string(seconds) + "s");
    return true;
}

bool SocketRadioAdapter::isDiscoverable() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_responder_sock >= 0 && std::chrono::steady_clock::now() < m_discoverable_until;
}

void SocketRadioAdapter::responderLoop() {
    int sock = -1;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        sock = m_responder_sock;
    }
    const std::string response = std::string(RESPONSE_MESSAGE_PREFIX) + "|" + m_config.service_uuid + "|" +
                                 std::to_string(m_config.rfcomm_port) + "|" + m_config.local_name;
    char buf[DISCOVERY_MSG_MAX];

    while (m_running) {
        pollfd pfd{};
        pfd.fd = sock;
        pfd.events = POLLIN;
        int ready = poll(&pfd, 1, DISCOVERY_POLL_INTERVAL_MS);
        if (ready <= 0) {
            if (ready < 0 && errno != EINTR) {
                LOG_WARN("Radio: responder poll failed: " + std::string(strerror(errno)));
                return;
            }
            continue;
        }

        sockaddr_in from_addr{};
        socklen_t from_len = sizeof(from_addr);
        ssize_t n = recvfrom(sock, buf, sizeof(buf) - 1, 0, (sockaddr*)&from_addr, &from_len);
        if (n <= 0) {
            continue;
        }
        auto fields = split_fields(std::string(buf, static_cast<size_t>(n)), 3);
        if (fields.size() < 3 || fields[0] != INQUIRY_MESSAGE_PREFIX) {
            continue;
        }
        if (fields[2] == m_node_id || fields[1] != m_config.service_uuid) {
            continue;
        }
        if (!isDiscoverable()) {
            continue;
        }
        if (sendto(sock, response.c_str(), response.length(), 0, (sockaddr*)&from_addr, from_len) < 0) {
            LOG_WARN("Radio: failed to answer inquiry: " + std::string(strerror(errno)));
        }
    }
}

// ----------------------------------------------------------------------------
// Channels
// ----------------------------------------------------------------------------

std::unique_ptr<ListeningChannel> SocketRadioAdapter::listen(const std::string& service_name,
                                                             const std::string& service_uuid) {
    if (service_uuid != m_config.service_uuid) {
        LOG_WARN("Radio: listening for " + service_uuid + " but inquiries advertise " + m_config.service_uuid);
    }

    int sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0) {
        LOG_ERROR("Radio: failed to create server socket: " + std::string(strerror(errno)));
        return nullptr;
    }

#ifdef __APPLE__
    int nosigpipe = 1;
    setsockopt(sock, SOL_SOCKET, SO_NOSIGPIPE, &nosigpipe, sizeof(nosigpipe));
#endif

    int opt = 1;
    if (setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt))) {
        LOG_ERROR("Radio: setsockopt(SO_REUSEADDR) failed: " + std::string(strerror(errno)));
        close(sock);
        return nullptr;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(m_config.rfcomm_port));
    if (inet_pton(AF_INET, m_config.bind_address.c_str(), &addr.sin_addr) != 1) {
        LOG_WARN("Radio: invalid bind address " + m_config.bind_address + ", using any");
        addr.sin_addr.s_addr = INADDR_ANY;
    }
    if (bind(sock, (sockaddr*)&addr, sizeof(addr)) < 0) {
        LOG_ERROR("Radio: failed to bind rfcomm port " + std::to_string(m_config.rfcomm_port) +
                  ": " + std::string(strerror(errno)));
        close(sock);
        return nullptr;
    }
    if (::listen(sock, DEFAULT_LISTEN_BACKLOG) < 0) {
        LOG_ERROR("Radio: failed to listen: " + std::string(strerror(errno)));
        close(sock);
        return nullptr;
    }
    // accept() polls first; a vanished connection must not block it
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);

    LOG_INFO("Radio: service '" + service_name + "' listening on port " + std::to_string(m_config.rfcomm_port));
    return std::unique_ptr<ListeningChannel>(new SocketListeningChannel(sock));
}

std::unique_ptr<Channel> SocketRadioAdapter::createChannel(const PeerIdentity& peer,
                                                           const std::string& service_uuid) {
    LOG_DEBUG("Radio: channel to " + peer.address + " for service " + service_uuid);
    return std::unique_ptr<Channel>(new SocketChannel(peer));
}
