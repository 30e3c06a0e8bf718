#ifndef PEER_IDENTITY_H
#define PEER_IDENTITY_H

#include <string>
#include <utility>

// A remote device as the radio reports it. Two identities are the same
// device when their addresses match; the name is informational only.
struct PeerIdentity {
    std::string address;
    std::string name;

    PeerIdentity() = default;
    PeerIdentity(std::string addr, std::string display_name = std::string())
        : address(std::move(addr)), name(std::move(display_name)) {}

    bool operator==(const PeerIdentity& other) const { return address == other.address; }
    bool operator!=(const PeerIdentity& other) const { return address != other.address; }

    std::string toString() const {
        return name.empty() ? address : name + " (" + address + ")";
    }
};

#endif // PEER_IDENTITY_H
