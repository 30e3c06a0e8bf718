#ifndef SESSION_STATE_H
#define SESSION_STATE_H

// Authoritative session state, owned by BluetoothSession.
enum class SessionState {
    NONE,         // Stopped, nothing open
    LISTENING,    // Accept loop waiting for an inbound peer
    CONNECTING,   // Outbound attempt in flight
    CONNECTED     // One peer, connected I/O loop running
};

const char* session_state_to_string(SessionState state);

#endif // SESSION_STATE_H
