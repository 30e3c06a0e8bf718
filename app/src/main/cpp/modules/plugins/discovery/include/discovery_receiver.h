#ifndef DISCOVERY_RECEIVER_H
#define DISCOVERY_RECEIVER_H

#include "event_loop.h"
#include "radio_adapter.h"
#include <atomic>
#include <functional>

/**
 * The discovery filter: while registered it takes the radio's inquiry
 * callbacks (radio threads) and replays them on the EventLoop.
 */
class DiscoveryReceiver : public DiscoveryListener {
public:
    using PeerFoundHandler = std::function<void(const PeerIdentity&)>;
    using FinishedHandler = std::function<void()>;

    DiscoveryReceiver(RadioAdapter& radio, EventLoop& loop);
    ~DiscoveryReceiver() override;

    DiscoveryReceiver(const DiscoveryReceiver&) = delete;
    DiscoveryReceiver& operator=(const DiscoveryReceiver&) = delete;

    // Set before registering; handlers run on the loop
    void setHandlers(PeerFoundHandler on_found, FinishedHandler on_finished);

    // Both return whether the registration changed
    bool registerReceiver();
    bool unregisterReceiver();
    bool isRegistered() const { return m_registered.load(); }

    void onPeerFound(const PeerIdentity& peer) override;
    void onDiscoveryFinished() override;

private:
    RadioAdapter& m_radio;
    EventLoop& m_loop;
    PeerFoundHandler m_on_found;
    FinishedHandler m_on_finished;
    std::atomic<bool> m_registered{false};
};

#endif // DISCOVERY_RECEIVER_H
