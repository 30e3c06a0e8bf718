#ifndef SESSION_EVENT_BUS_H
#define SESSION_EVENT_BUS_H

#include "replay_channel.h"
#include "session_state.h"
#include <string>

// State changes and inbound messages, each on its own replay channel.
class SessionEventBus {
public:
    explicit SessionEventBus(size_t replay_capacity = DEFAULT_REPLAY_CAPACITY);

    void publishState(SessionState state);
    void publishMessage(const std::string& text);

    ReplayChannel<SessionState>& states() { return m_states; }
    ReplayChannel<std::string>& messages() { return m_messages; }

private:
    ReplayChannel<SessionState> m_states;
    ReplayChannel<std::string> m_messages;
};

#endif // SESSION_EVENT_BUS_H
