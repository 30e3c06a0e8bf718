#ifndef SOCKET_CHANNEL_H
#define SOCKET_CHANNEL_H

#include "radio_adapter.h"
#include <atomic>
#include <mutex>
#include <string>

// Splits "ip:port"; false when the port is missing or out of range
bool parse_channel_address(const std::string& address, std::string& ip, int& port);

/**
 * TCP stream standing in for an RFCOMM socket.
 * Built either unconnected (outbound, connect() dials remotePeer().address)
 * or around an already accepted descriptor.
 *
 * An accepted channel's remotePeer() is "ip:<source port>". The source port
 * is ephemeral, so only the IP part identifies the device and the address
 * cannot be dialed back. A peer's dialable address comes from discovery or
 * the paired list.
 */
class SocketChannel : public Channel {
public:
    explicit SocketChannel(PeerIdentity remote, int connected_fd = -1);
    ~SocketChannel() override;

    SocketChannel(const SocketChannel&) = delete;
    SocketChannel& operator=(const SocketChannel&) = delete;

    bool connect() override;
    int read(char* buffer, size_t length) override;
    bool write(const std::string& data) override;
    void close() override;
    const PeerIdentity& remotePeer() const override { return m_remote; }

private:
    PeerIdentity m_remote;
    int m_sock;
    bool m_connected;
    std::atomic<bool> m_closed{false};
    std::mutex m_mutex;   // guards m_sock against close() from another thread
};

// TCP listener standing in for an RFCOMM server socket.
class SocketListeningChannel : public ListeningChannel {
public:
    // Takes ownership of a bound, listening descriptor
    explicit SocketListeningChannel(int listen_fd);
    ~SocketListeningChannel() override;

    SocketListeningChannel(const SocketListeningChannel&) = delete;
    SocketListeningChannel& operator=(const SocketListeningChannel&) = delete;

    std::unique_ptr<Channel> accept() override;
    void close() override;

private:
    int m_sock;
    std::atomic<bool> m_closed{false};
};

#endif // SOCKET_CHANNEL_H
