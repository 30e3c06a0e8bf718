#ifndef SOCKET_RADIO_ADAPTER_H
#define SOCKET_RADIO_ADAPTER_H

#include "radio_adapter.h"
#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

struct SocketRadioConfig {
    std::string local_name;
    std::string bind_address;
    std::string service_uuid;
    int rfcomm_port;
    int discovery_port;
    std::chrono::milliseconds inquiry_window;
    std::chrono::milliseconds inquiry_interval;
    std::vector<PeerIdentity> paired_peers;
    // Unicast addresses probed in addition to the interface broadcasts
    std::vector<std::string> inquiry_targets;

    static SocketRadioConfig fromConfigManager();
};

/**
 * Desktop radio: TCP streams for RFCOMM channels and a UDP inquiry for
 * classic discovery.
 *
 * Inquiry: every inquiry_interval an "LITEBT_INQUIRY|uuid|node" datagram
 * goes to discovery_port on each broadcast address. Nodes that are
 * discoverable answer "LITEBT_RESPONSE|uuid|rfcomm_port|name" to the
 * sender, which reports "ip:rfcomm_port" as a found peer.
 */
class SocketRadioAdapter : public RadioAdapter {
public:
    explicit SocketRadioAdapter(SocketRadioConfig config);
    ~SocketRadioAdapter() override;

    SocketRadioAdapter(const SocketRadioAdapter&) = delete;
    SocketRadioAdapter& operator=(const SocketRadioAdapter&) = delete;

    bool isAvailable() const override { return true; }
    bool isEnabled() const override { return true; }
    bool requestEnable() override;

    std::vector<PeerIdentity> pairedPeers() const override;

    bool startDiscovery() override;
    bool cancelDiscovery() override;
    bool isDiscovering() const override { return m_discovering.load(); }
    bool setDiscoverable(int seconds) override;
    bool isDiscoverable() const;

    void setDiscoveryListener(DiscoveryListener* listener) override;

    std::unique_ptr<ListeningChannel> listen(const std::string& service_name,
                                             const std::string& service_uuid) override;
    std::unique_ptr<Channel> createChannel(const PeerIdentity& peer,
                                           const std::string& service_uuid) override;

    const SocketRadioConfig& config() const { return m_config; }

private:
    void inquiryLoop(int sock);
    void responderLoop();
    void handleResponse(const std::string& message, const char* sender_ip,
                        std::set<std::string>& reported);
    void notifyPeerFound(const PeerIdentity& peer);
    void notifyDiscoveryFinished();
    bool openResponderSocket();
    void stopThreads();

    SocketRadioConfig m_config;
    std::string m_node_id;

    mutable std::mutex m_mutex;
    std::thread m_inquiryThread;
    std::atomic<bool> m_discovering{false};
    bool m_inquiryCancelled{false};

    std::thread m_responderThread;
    int m_responder_sock{-1};
    std::chrono::steady_clock::time_point m_discoverable_until;
    std::atomic<bool> m_running{true};

    std::mutex m_listenerMutex;
    DiscoveryListener* m_listener{nullptr};
};

#endif // SOCKET_RADIO_ADAPTER_H
