#include "session_event_bus.h"

SessionEventBus::SessionEventBus(size_t replay_capacity)
    : m_states("state", replay_capacity), m_messages("message", replay_capacity) {}

void SessionEventBus::publishState(SessionState state) {
    LOG_DEBUG(std::string("EventBus: state -> ") + session_state_to_string(state));
    m_states.publish(state);
}

void SessionEventBus::publishMessage(const std::string& text) {
    LOG_DEBUG("EventBus: message (" + std::to_string(text.size()) + " bytes)");
    m_messages.publish(text);
}
