#ifndef RADIO_ADAPTER_H
#define RADIO_ADAPTER_H

#include "peer_identity.h"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

/**
 * An open bidirectional byte stream to one peer (an RFCOMM socket).
 *
 * read() and write() block and are called from the owning worker only.
 * close() may be called from any thread and must unblock a pending
 * connect() or read().
 */
class Channel {
public:
    virtual ~Channel() = default;

    // Blocks until connected; false on failure or when closed meanwhile
    virtual bool connect() = 0;

    // > 0: bytes read, <= 0: error or end of stream
    virtual int read(char* buffer, size_t length) = 0;
    virtual bool write(const std::string& data) = 0;

    virtual void close() = 0;
    virtual const PeerIdentity& remotePeer() const = 0;
};

/**
 * A server channel registered under a service name/uuid.
 * accept() blocks until a peer connects; nullptr once closed or on error.
 */
class ListeningChannel {
public:
    virtual ~ListeningChannel() = default;
    virtual std::unique_ptr<Channel> accept() = 0;
    virtual void close() = 0;
};

// Receives inquiry results; called on a radio thread.
class DiscoveryListener {
public:
    virtual ~DiscoveryListener() = default;
    virtual void onPeerFound(const PeerIdentity& peer) = 0;
    virtual void onDiscoveryFinished() = 0;
};

/**
 * The platform radio: availability, paired list, inquiry and channels.
 * Implementations must be callable from any thread.
 */
class RadioAdapter {
public:
    virtual ~RadioAdapter() = default;

    // No radio hardware at all
    virtual bool isAvailable() const = 0;
    virtual bool isEnabled() const = 0;
    // Asks the platform (or the user) to switch the radio on
    virtual bool requestEnable() = 0;

    virtual std::vector<PeerIdentity> pairedPeers() const = 0;

    virtual bool startDiscovery() = 0;
    // Ends a running inquiry; the listener then gets onDiscoveryFinished()
    virtual bool cancelDiscovery() = 0;
    virtual bool isDiscovering() const = 0;
    virtual bool setDiscoverable(int seconds) = 0;

    // Only one listener at a time; pass nullptr to clear
    virtual void setDiscoveryListener(DiscoveryListener* listener) = 0;

    virtual std::unique_ptr<ListeningChannel> listen(const std::string& service_name,
                                                     const std::string& service_uuid) = 0;
    // Returned channel is not connected yet
    virtual std::unique_ptr<Channel> createChannel(const PeerIdentity& peer,
                                                   const std::string& service_uuid) = 0;
};

#endif // RADIO_ADAPTER_H
