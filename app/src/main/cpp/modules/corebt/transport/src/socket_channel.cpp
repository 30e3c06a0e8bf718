#include "socket_channel.h"
#include "constants.h"
#include "logger.h"
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <stdexcept>

#ifdef MSG_NOSIGNAL
static constexpr int SEND_FLAGS = MSG_NOSIGNAL;
#else
static constexpr int SEND_FLAGS = 0;
#endif

namespace {
    void configure_stream_socket(int sock) {
#ifdef __APPLE__
        int nosigpipe = 1;
        setsockopt(sock, SOL_SOCKET, SO_NOSIGPIPE, &nosigpipe, sizeof(nosigpipe));
#endif
        // Chat-sized writes; do not wait for Nagle
        int nodelay_flag = 1;
        if (setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, (char*)&nodelay_flag, sizeof(int)) < 0) {
            LOG_DEBUG("Channel: failed to set TCP_NODELAY: " + std::string(strerror(errno)));
        }
    }

    bool set_blocking(int sock, bool blocking) {
        int flags = fcntl(sock, F_GETFL, 0);
        if (flags < 0) {
            return false;
        }
        flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
        return fcntl(sock, F_SETFL, flags) == 0;
    }
}

bool parse_channel_address(const std::string& address, std::string& ip, int& port) {
    size_t colon_pos = address.rfind(':');
    if (colon_pos == std::string::npos || colon_pos == 0 || colon_pos + 1 >= address.size()) {
        return false;
    }
    ip = address.substr(0, colon_pos);
    try {
        size_t consumed = 0;
        port = std::stoi(address.substr(colon_pos + 1), &consumed);
        if (consumed != address.size() - colon_pos - 1) {
            return false;
        }
    } catch (const std::exception&) {
        return false;
    }
    return port > 0 && port <= 65535;
}

// ============================================================================
// SocketChannel
// ============================================================================

SocketChannel::SocketChannel(PeerIdentity remote, int connected_fd)
    : m_remote(std::move(remote)), m_sock(connected_fd), m_connected(connected_fd >= 0) {
    if (m_sock >= 0) {
        configure_stream_socket(m_sock);
        // BSD accept() inherits O_NONBLOCK from the listener
        set_blocking(m_sock, true);
    }
}

SocketChannel::~SocketChannel() {
    close();
    if (m_sock >= 0) {
        ::close(m_sock);
        m_sock = -1;
    }
}

bool SocketChannel::connect() {
    std::string ip;
    int port = 0;
    if (!parse_channel_address(m_remote.address, ip, port)) {
        LOG_WARN("Channel: invalid peer address " + m_remote.address);
        return false;
    }

    sockaddr_in dest_addr{};
    dest_addr.sin_family = AF_INET;
    dest_addr.sin_port = htons(static_cast<uint16_t>(port));
    if (inet_pton(AF_INET, ip.c_str(), &dest_addr.sin_addr) != 1) {
        LOG_WARN("Channel: invalid peer ip " + ip);
        return false;
    }

    int sock = -1;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed || m_connected || m_sock >= 0) {
            return m_connected && !m_closed;
        }
        sock = socket(AF_INET, SOCK_STREAM, 0);
        if (sock < 0) {
            LOG_ERROR("Channel: failed to create socket: " + std::string(strerror(errno)));
            return false;
        }
        m_sock = sock;
    }
    configure_stream_socket(sock);
    set_blocking(sock, false);

    int result = ::connect(sock, (sockaddr*)&dest_addr, sizeof(dest_addr));
    if (result < 0 && errno != EINPROGRESS) {
        LOG_INFO("Channel: connect to " + m_remote.address + " failed: " + std::string(strerror(errno)));
        return false;
    }

    if (result < 0) {
        // Poll in short slices so close() can abort the attempt
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(CONNECT_TIMEOUT_MS);
        while (true) {
            if (m_closed) {
                LOG_DEBUG("Channel: connect to " + m_remote.address + " aborted by close");
                return false;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                LOG_INFO("Channel: connect to " + m_remote.address + " timed out");
                return false;
            }
            pollfd pfd{};
            pfd.fd = sock;
            pfd.events = POLLOUT;
            int ready = poll(&pfd, 1, CONNECT_POLL_INTERVAL_MS);
            if (ready < 0) {
                if (errno == EINTR) {
                    continue;
                }
                LOG_INFO("Channel: poll failed while connecting: " + std::string(strerror(errno)));
                return false;
            }
            if (ready > 0) {
                break;
            }
        }

        int error = 0;
        socklen_t len = sizeof(error);
        if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &error, &len) < 0 || error != 0) {
            LOG_INFO("Channel: connect to " + m_remote.address + " failed: " +
                     (error ? std::string(strerror(error)) : std::string("unknown error")));
            return false;
        }
    }

    set_blocking(sock, true);

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closed) {
        return false;
    }
    m_connected = true;
    LOG_DEBUG("Channel: connected to " + m_remote.address);
    return true;
}

int SocketChannel::read(char* buffer, size_t length) {
    if (m_sock < 0 || !m_connected) {
        return -1;
    }
    while (true) {
        ssize_t n = ::recv(m_sock, buffer, length, 0);
        if (n < 0 && errno == EINTR && !m_closed) {
            continue;
        }
        if (n < 0 && !m_closed) {
            LOG_DEBUG("Channel: read from " + m_remote.address + " failed: " + std::string(strerror(errno)));
        }
        return static_cast<int>(n);
    }
}

bool SocketChannel::write(const std::string& data) {
    if (m_sock < 0 || !m_connected || m_closed) {
        return false;
    }
    size_t total_sent = 0;
    while (total_sent < data.size()) {
        ssize_t sent = ::send(m_sock, data.data() + total_sent, data.size() - total_sent, SEND_FLAGS);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_WARN("Channel: write to " + m_remote.address + " failed: " + std::string(strerror(errno)));
            return false;
        }
        total_sent += static_cast<size_t>(sent);
    }
    return true;
}

void SocketChannel::close() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closed.exchange(true)) {
        return;
    }
    // The descriptor itself is released by the destructor so a blocked
    // reader never sees it reused.
    if (m_sock >= 0) {
        shutdown(m_sock, SHUT_RDWR);
    }
}

// ============================================================================
// SocketListeningChannel
// ============================================================================

SocketListeningChannel::SocketListeningChannel(int listen_fd) : m_sock(listen_fd) {}

SocketListeningChannel::~SocketListeningChannel() {
    close();
    if (m_sock >= 0) {
        ::close(m_sock);
        m_sock = -1;
    }
}

std::unique_ptr<Channel> SocketListeningChannel::accept() {
    while (!m_closed) {
        pollfd pfd{};
        pfd.fd = m_sock;
        pfd.events = POLLIN;
        int ready = poll(&pfd, 1, ACCEPT_POLL_INTERVAL_MS);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (!m_closed) {
                LOG_ERROR("Listener: poll failed: " + std::string(strerror(errno)));
            }
            return nullptr;
        }
        if (ready == 0 || m_closed) {
            continue;
        }

        sockaddr_in client_addr{};
        socklen_t client_len = sizeof(client_addr);
        int client_sock = ::accept(m_sock, (sockaddr*)&client_addr, &client_len);
        if (client_sock < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK || errno == ECONNABORTED) {
                continue;
            }
            if (!m_closed) {
                LOG_ERROR("Listener: accept failed: " + std::string(strerror(errno)));
            }
            return nullptr;
        }

        // Source port is ephemeral; the address is not dialable
        char client_ip[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &client_addr.sin_addr, client_ip, sizeof(client_ip));
        std::string address = std::string(client_ip) + ":" + std::to_string(ntohs(client_addr.sin_port));
        LOG_DEBUG("Listener: accepted connection from " + address);
        return std::unique_ptr<Channel>(new SocketChannel(PeerIdentity(address), client_sock));
    }
    return nullptr;
}

void SocketListeningChannel::close() {
    if (m_closed.exchange(true)) {
        return;
    }
    if (m_sock >= 0) {
        shutdown(m_sock, SHUT_RDWR);
    }
}
