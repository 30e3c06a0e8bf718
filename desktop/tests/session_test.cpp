#include "bluetooth_session.h"
#include "event_loop.h"
#include "fake_radio_adapter.h"
#include "session_event_bus.h"
#include "test_support.h"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

// Session plus a loop that records everything the bus delivers
struct SessionHarness {
    FakeRadioAdapter radio;
    SessionEventBus bus;
    EventLoop loop;
    EventRecorder events;
    std::shared_ptr<ReplayChannel<SessionState>::Subscription> state_sub;
    std::shared_ptr<ReplayChannel<std::string>::Subscription> message_sub;
    std::unique_ptr<BluetoothSession> session;

    SessionHarness() {
        loop.start();
        state_sub = bus.states().subscribe(loop, [this](const SessionState& s) {
            events.add(std::string("state:") + session_state_to_string(s));
        });
        message_sub = bus.messages().subscribe(loop, [this](const std::string& text) {
            events.add("message:" + text);
        });
        session.reset(new BluetoothSession(ServiceConfig(), radio, bus));
    }

    ~SessionHarness() {
        session.reset();
        loop.stop();
    }

    bool waitState(SessionState expected) {
        return wait_until([&] { return session->state() == expected; });
    }

    bool settle() { return loop.waitIdle(std::chrono::milliseconds(2000)); }
};

FakeChannelScript blocking_connect() {
    FakeChannelScript script;
    script.block_connect = true;
    return script;
}

} // namespace

bool test_start_is_idempotent() {
    std::cout << "Testing start() idempotence..." << std::endl;
    SessionHarness h;

    h.session->start();
    h.session->start();
    h.session->start();

    TEST_ASSERT(h.session->state() == SessionState::LISTENING, "State should be LISTENING");
    TEST_ASSERT(h.session->hasAcceptLoop(), "Accept loop should be running");
    TEST_ASSERT(h.radio.counters->listen_calls == 1, "Exactly one listening channel should be opened");
    TEST_ASSERT(!h.session->hasConnectTask(), "No connect task expected");
    TEST_ASSERT(!h.session->hasConnectedLoop(), "No connected loop expected");

    TEST_ASSERT(h.settle(), "Loop should drain");
    TEST_ASSERT(h.events.count("state:LISTENING") == 1, "LISTENING should be published once");

    std::cout << "start() Idempotence Test Passed!" << std::endl;
    return true;
}

bool test_listen_failure_still_listening() {
    std::cout << "Testing start() when the listener cannot open..." << std::endl;
    SessionHarness h;
    h.radio.listen_fails = true;

    h.session->start();

    TEST_ASSERT(h.session->state() == SessionState::LISTENING, "State should still be LISTENING");
    TEST_ASSERT(!h.session->hasAcceptLoop(), "No accept loop without a listener");

    // A later start() retries the listener
    h.radio.listen_fails = false;
    h.session->start();
    TEST_ASSERT(h.session->hasAcceptLoop(), "Second start() should open the listener");
    TEST_ASSERT(h.radio.counters->listen_calls == 2, "Listener should be requested twice");

    std::cout << "Listen Failure Test Passed!" << std::endl;
    return true;
}

bool test_connect_replaces_inflight_attempt() {
    std::cout << "Testing connect() replacing an in-flight attempt..." << std::endl;
    SessionHarness h;
    h.radio.setNextScript(blocking_connect());
    h.session->start();

    h.session->connect(PeerIdentity("AA:AA:AA:AA:AA:01", "first"));
    TEST_ASSERT(wait_until([&] { return h.radio.counters->connect_attempts == 1; }),
                "First attempt should start connecting");
    TEST_ASSERT(h.session->state() == SessionState::CONNECTING, "State should be CONNECTING");

    h.session->connect(PeerIdentity("AA:AA:AA:AA:AA:02", "second"));
    TEST_ASSERT(wait_until([&] { return h.radio.counters->connect_attempts == 2; }),
                "Second attempt should start connecting");

    auto first = h.radio.outbound(0);
    auto second = h.radio.outbound(1);
    TEST_ASSERT(first && second, "Two outbound channels expected");
    TEST_ASSERT(wait_until([&] { return first->isClosed(); }), "First attempt's channel should be closed");
    TEST_ASSERT(!second->isClosed(), "Second attempt should still be pending");
    TEST_ASSERT(h.session->hasConnectTask(), "A connect task should be live");
    TEST_ASSERT(h.session->state() == SessionState::CONNECTING, "State should stay CONNECTING");
    TEST_ASSERT(h.session->hasAcceptLoop(), "Connecting does not stop listening");

    // The cancelled attempt must not push the session back to LISTENING
    TEST_ASSERT(h.settle(), "Loop should drain");
    TEST_ASSERT(h.events.last() == "state:CONNECTING", "Last published state should be CONNECTING");

    std::cout << "Connect Replacement Test Passed!" << std::endl;
    return true;
}

bool test_outbound_promotion_cancels_listening() {
    std::cout << "Testing outbound promotion to CONNECTED..." << std::endl;
    SessionHarness h;
    h.session->start();

    h.session->connect(PeerIdentity("AA:AA:AA:AA:AA:10", "remote"));
    TEST_ASSERT(h.waitState(SessionState::CONNECTED), "Session should reach CONNECTED");

    TEST_ASSERT(h.radio.counters->listener_closes == 1, "Listening channel should be closed");
    TEST_ASSERT(!h.session->hasAcceptLoop(), "Accept loop should be gone");
    TEST_ASSERT(!h.session->hasConnectTask(), "Connect task should be gone");
    TEST_ASSERT(h.session->hasConnectedLoop(), "Connected loop should be running");
    TEST_ASSERT(h.session->connectedPeer().address == "AA:AA:AA:AA:AA:10", "Connected peer mismatch");
    TEST_ASSERT(h.radio.counters->discovery_cancels >= 1, "Connecting should cancel discovery first");

    TEST_ASSERT(h.settle(), "Loop should drain");
    std::vector<std::string> expected = {"state:LISTENING", "state:CONNECTING", "state:CONNECTED"};
    TEST_ASSERT(h.events.events() == expected, "State sequence should be LISTENING, CONNECTING, CONNECTED");

    std::cout << "Outbound Promotion Test Passed!" << std::endl;
    return true;
}

bool test_inbound_promotion_cancels_pending_connect() {
    std::cout << "Testing inbound promotion while connecting..." << std::endl;
    SessionHarness h;
    h.radio.setNextScript(blocking_connect());
    h.session->start();

    h.session->connect(PeerIdentity("AA:AA:AA:AA:AA:20"));
    TEST_ASSERT(wait_until([&] { return h.radio.counters->connect_attempts == 1; }),
                "Outbound attempt should be connecting");

    FakeChannelScript inbound;
    inbound.reads = {"hi there"};
    h.radio.pushInbound(PeerIdentity("BB:BB:BB:BB:BB:01", "caller"), inbound);

    TEST_ASSERT(h.waitState(SessionState::CONNECTED), "Inbound peer should be promoted");
    auto outbound = h.radio.outbound(0);
    TEST_ASSERT(wait_until([&] { return outbound->isClosed(); }), "Pending outbound attempt should be closed");
    TEST_ASSERT(h.radio.counters->listener_closes == 1, "Listening channel should be closed");
    TEST_ASSERT(!h.session->hasAcceptLoop(), "Accept loop should be gone");
    TEST_ASSERT(!h.session->hasConnectTask(), "Connect task should be gone");
    TEST_ASSERT(h.session->connectedPeer().address == "BB:BB:BB:BB:BB:01", "Connected peer should be the caller");

    TEST_ASSERT(wait_until([&] { return h.events.contains("message:hi there"); }),
                "Inbound data should be published");

    std::cout << "Inbound Promotion Test Passed!" << std::endl;
    return true;
}

bool test_write_requires_connection() {
    std::cout << "Testing write() outside CONNECTED..." << std::endl;
    SessionHarness h;

    TEST_ASSERT(!h.session->write("early"), "write() in NONE should fail");

    h.session->start();
    TEST_ASSERT(!h.session->write("listening"), "write() in LISTENING should fail");

    h.radio.setNextScript(blocking_connect());
    h.session->connect(PeerIdentity("AA:AA:AA:AA:AA:30"));
    TEST_ASSERT(wait_until([&] { return h.radio.counters->connect_attempts == 1; }), "Attempt should start");
    TEST_ASSERT(!h.session->write("connecting"), "write() in CONNECTING should fail");
    TEST_ASSERT(h.radio.outbound(0)->written().empty(), "Nothing should reach the channel");

    std::cout << "Write Guard Test Passed!" << std::endl;
    return true;
}

bool test_write_when_connected() {
    std::cout << "Testing write() when CONNECTED..." << std::endl;
    SessionHarness h;
    h.session->start();
    h.session->connect(PeerIdentity("AA:AA:AA:AA:AA:31"));
    TEST_ASSERT(h.waitState(SessionState::CONNECTED), "Session should connect");

    TEST_ASSERT(h.session->write("ping"), "write() should succeed");
    TEST_ASSERT(h.session->write("pong"), "second write() should succeed");
    std::vector<std::string> expected = {"ping", "pong"};
    TEST_ASSERT(h.radio.outbound(0)->written() == expected, "Writes should reach the channel in order");

    std::cout << "Connected Write Test Passed!" << std::endl;
    return true;
}

bool test_connect_failure_returns_to_listening() {
    std::cout << "Testing connect failure fallback..." << std::endl;
    SessionHarness h;
    FakeChannelScript refused;
    refused.connect_ok = false;
    h.radio.setNextScript(refused);

    // From NONE: the fallback has to open the listener itself
    h.session->connect(PeerIdentity("AA:AA:AA:AA:AA:40"));
    TEST_ASSERT(wait_until([&] {
        return h.session->state() == SessionState::LISTENING && h.session->hasAcceptLoop();
    }), "Failed connect should fall back to LISTENING with an accept loop");
    TEST_ASSERT(!h.session->hasConnectTask(), "Connect task should be gone");
    TEST_ASSERT(h.radio.outbound(0)->isClosed(), "Failed channel should be closed");

    // From LISTENING: the existing accept loop is kept
    h.session->connect(PeerIdentity("AA:AA:AA:AA:AA:41"));
    TEST_ASSERT(wait_until([&] { return h.radio.counters->connect_attempts == 2; }), "Second attempt");
    TEST_ASSERT(wait_until([&] {
        return h.session->state() == SessionState::LISTENING && !h.session->hasConnectTask();
    }), "Second failure should return to LISTENING");
    TEST_ASSERT(h.radio.counters->listen_calls == 1, "Accept loop should not be reopened");

    TEST_ASSERT(h.settle(), "Loop should drain");
    std::vector<std::string> expected = {"state:CONNECTING", "state:LISTENING",
                                         "state:CONNECTING", "state:LISTENING"};
    TEST_ASSERT(h.events.events() == expected, "Unexpected state sequence after failures");

    std::cout << "Connect Failure Test Passed!" << std::endl;
    return true;
}

bool test_read_failure_after_message() {
    std::cout << "Testing read failure after a delivered message..." << std::endl;
    SessionHarness h;
    FakeChannelScript script;
    script.reads = {"hello"};
    script.after = AfterReads::THROW;
    h.radio.setNextScript(script);

    h.session->start();
    h.session->connect(PeerIdentity("AA:AA:AA:AA:AA:50"));

    TEST_ASSERT(wait_until([&] {
        return h.events.indexOf("state:CONNECTED") >= 0 && h.events.last() == "state:LISTENING";
    }), "Session should fall back to LISTENING after the stream fails");
    TEST_ASSERT(h.session->hasAcceptLoop(), "Accept loop should be active again");
    TEST_ASSERT(!h.session->hasConnectedLoop(), "Connected loop should be gone");
    TEST_ASSERT(h.radio.counters->listen_calls == 2, "Listener should be reopened");

    TEST_ASSERT(h.settle(), "Loop should drain");
    TEST_ASSERT(h.events.count("message:hello") == 1, "hello should be delivered exactly once");
    const int connected = h.events.indexOf("state:CONNECTED");
    const int message = h.events.indexOf("message:hello");
    TEST_ASSERT(connected < message, "Message should follow CONNECTED");
    TEST_ASSERT(message < static_cast<int>(h.events.events().size()) - 1, "Message should precede the fallback");

    std::cout << "Read Failure Test Passed!" << std::endl;
    return true;
}

bool test_end_of_stream_is_lost_connection() {
    std::cout << "Testing end of stream..." << std::endl;
    SessionHarness h;
    h.session->start();

    FakeChannelScript inbound;
    inbound.reads = {"one", "two"};
    inbound.after = AfterReads::FAIL;
    h.radio.pushInbound(PeerIdentity("BB:BB:BB:BB:BB:02"), inbound);

    TEST_ASSERT(wait_until([&] { return h.events.count("state:LISTENING") == 2; }),
                "Session should return to LISTENING once the stream ends");
    TEST_ASSERT(h.settle(), "Loop should drain");
    std::vector<std::string> expected = {"state:LISTENING", "state:CONNECTED", "message:one",
                                         "message:two", "state:LISTENING"};
    TEST_ASSERT(h.events.events() == expected, "Unexpected event order for a finished stream");

    std::cout << "End Of Stream Test Passed!" << std::endl;
    return true;
}

bool test_stop_is_idempotent() {
    std::cout << "Testing stop() idempotence..." << std::endl;
    SessionHarness h;
    h.session->start();
    h.session->connect(PeerIdentity("AA:AA:AA:AA:AA:60"));
    TEST_ASSERT(h.waitState(SessionState::CONNECTED), "Session should connect");

    h.session->stop();
    h.session->stop();

    TEST_ASSERT(h.session->state() == SessionState::NONE, "State should be NONE");
    TEST_ASSERT(!h.session->hasAcceptLoop(), "No accept loop after stop");
    TEST_ASSERT(!h.session->hasConnectTask(), "No connect task after stop");
    TEST_ASSERT(!h.session->hasConnectedLoop(), "No connected loop after stop");
    TEST_ASSERT(h.radio.outbound(0)->isClosed(), "Connected channel should be closed");
    TEST_ASSERT(!h.session->write("late"), "write() after stop should fail");

    TEST_ASSERT(h.settle(), "Loop should drain");
    TEST_ASSERT(h.events.count("state:NONE") == 1, "NONE should be published once");
    TEST_ASSERT(h.events.last() == "state:NONE", "NONE should be the last state");

    // A stopped session can be started again
    h.session->start();
    TEST_ASSERT(h.session->state() == SessionState::LISTENING, "Restart should listen");
    TEST_ASSERT(h.session->hasAcceptLoop(), "Restart should open a new accept loop");

    std::cout << "stop() Idempotence Test Passed!" << std::endl;
    return true;
}

bool test_stop_while_connecting() {
    std::cout << "Testing stop() during a pending connect..." << std::endl;
    SessionHarness h;
    h.radio.setNextScript(blocking_connect());
    h.session->connect(PeerIdentity("AA:AA:AA:AA:AA:70"));
    TEST_ASSERT(wait_until([&] { return h.radio.counters->connect_attempts == 1; }), "Attempt should start");

    h.session->stop();
    TEST_ASSERT(h.session->state() == SessionState::NONE, "State should be NONE");
    TEST_ASSERT(h.radio.outbound(0)->isClosed(), "Pending channel should be closed");

    // The aborted attempt must not restart listening
    TEST_ASSERT(h.settle(), "Loop should drain");
    TEST_ASSERT(h.session->state() == SessionState::NONE, "State should stay NONE");
    TEST_ASSERT(h.radio.counters->listen_calls == 0, "No listener should be opened");

    std::cout << "Stop While Connecting Test Passed!" << std::endl;
    return true;
}

int main() {
    configure_unit_test_runtime();
    std::cout << "Running BluetoothSession Tests..." << std::endl;

    test_start_is_idempotent();
    test_listen_failure_still_listening();
    test_connect_replaces_inflight_attempt();
    test_outbound_promotion_cancels_listening();
    test_inbound_promotion_cancels_pending_connect();
    test_write_requires_connection();
    test_write_when_connected();
    test_connect_failure_returns_to_listening();
    test_read_failure_after_message();
    test_end_of_stream_is_lost_connection();
    test_stop_is_idempotent();
    test_stop_while_connecting();

    if (tests_failed == 0) {
        std::cout << "ALL SESSION TESTS PASSED" << std::endl;
        return 0;
    } else {
        std::cerr << tests_failed << " TESTS FAILED" << std::endl;
        return 1;
    }
}
