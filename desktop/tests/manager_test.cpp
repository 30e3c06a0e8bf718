#include "bluetooth_manager.h"
#include "fake_radio_adapter.h"
#include "manager_config.h"
#include "test_support.h"
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace std::chrono_literals;

namespace {

class RecordingObserver : public BluetoothManagerObserver {
public:
    EventRecorder events;

    void onDevicesFound(const std::vector<PeerIdentity>& devices) override {
        std::string list;
        for (const auto& d : devices) {
            if (!list.empty()) list += ",";
            list += d.address;
        }
        events.add("devices:" + list);
    }
    void onRadioAvailable() override { events.add("radio:available"); }
    void onRadioUnavailable() override { events.add("radio:unavailable"); }
    void onScanVisibility(bool scanning) override { events.add(scanning ? "visible:1" : "visible:0"); }
    void onScanFinished() override { events.add("scan:finished"); }
    void onSessionStateChanged(SessionState state) override {
        events.add(std::string("state:") + session_state_to_string(state));
    }
    void onMessageReceived(const std::string& text) override { events.add("message:" + text); }
};

// Reads the device list back from inside the discovery notifications
class SnapshotReadingObserver : public BluetoothManagerObserverAdapter {
public:
    BluetoothManager* manager{nullptr};
    EventRecorder events;

    void onDevicesFound(const std::vector<PeerIdentity>& devices) override {
        const size_t seen = manager ? manager->discoveredDevices().size() : 0;
        events.add("devices:" + std::to_string(devices.size()) + "/" + std::to_string(seen));
    }
    void onScanFinished() override {
        const size_t seen = manager ? manager->discoveredDevices().size() : 0;
        events.add("finished:" + std::to_string(seen));
    }
};

ManagerConfig fast_config() {
    ManagerConfig config;
    config.scan_time = 10s;
    config.discoverable_time = 10s;
    return config;
}

} // namespace

bool test_missing_radio() {
    std::cout << "Testing a device without a radio..." << std::endl;
    FakeRadioAdapter radio;
    radio.available = false;
    RecordingObserver observer;
    BluetoothManager manager(fast_config(), ServiceConfig(), radio, observer);

    manager.start();
    TEST_ASSERT(wait_until([&] { return observer.events.contains("radio:unavailable"); }),
                "Observer should hear onRadioUnavailable");

    manager.scanDevices();
    manager.makeDiscoverable();
    manager.connectDevice(PeerIdentity("AA:00:00:00:00:01"));
    TEST_ASSERT(!manager.sendMessage("hello"), "sendMessage should fail");
    TEST_ASSERT(manager.pairedDevices().empty(), "No paired devices without a radio");
    manager.requestRadioEnabling();
    manager.onStop();

    TEST_ASSERT(manager.eventLoop().waitIdle(2000ms), "Loop should drain");
    TEST_ASSERT(radio.counters->listen_calls == 0, "No listener should be opened");
    TEST_ASSERT(radio.counters->discovery_starts == 0, "No inquiry should start");
    TEST_ASSERT(radio.counters->discoverable_requests == 0, "No discoverability request");
    TEST_ASSERT(radio.counters->channels_created == 0, "No channel should be created");
    TEST_ASSERT(radio.counters->enable_requests == 0, "No enable request");
    TEST_ASSERT(manager.sessionState() == SessionState::NONE, "Session stays NONE");
    TEST_ASSERT(!manager.isRadioAvailable() && !manager.isRadioEnabled(), "Radio reported missing");

    std::cout << "Missing Radio Test Passed!" << std::endl;
    return true;
}

bool test_start_relays_state() {
    std::cout << "Testing start() with an enabled radio..." << std::endl;
    FakeRadioAdapter radio;
    RecordingObserver observer;
    BluetoothManager manager(fast_config(), ServiceConfig(), radio, observer);

    manager.start();
    TEST_ASSERT(wait_until([&] { return observer.events.contains("state:LISTENING"); }),
                "LISTENING should be relayed");
    TEST_ASSERT(observer.events.contains("radio:available"), "Observer should hear onRadioAvailable");
    TEST_ASSERT(manager.sessionState() == SessionState::LISTENING, "Session should listen");
    TEST_ASSERT(manager.scheduler().has(TaskCategory::SERVICE_STATE_RELAY), "State relay registered");
    TEST_ASSERT(manager.scheduler().has(TaskCategory::MESSAGE_RELAY), "Message relay registered");

    // A second start() neither reopens the listener nor duplicates relays
    manager.start();
    TEST_ASSERT(manager.eventLoop().waitIdle(2000ms), "Loop should drain");
    TEST_ASSERT(radio.counters->listen_calls == 1, "Listener opened once");
    TEST_ASSERT(observer.events.count("state:LISTENING") == 1, "LISTENING relayed once");

    std::cout << "Start Relay Test Passed!" << std::endl;
    return true;
}

bool test_disabled_radio_requests_enable() {
    std::cout << "Testing start() with the radio off..." << std::endl;
    FakeRadioAdapter radio;
    radio.enabled = false;
    RecordingObserver observer;
    BluetoothManager manager(fast_config(), ServiceConfig(), radio, observer);

    manager.start();
    TEST_ASSERT(radio.counters->enable_requests == 1, "Radio enable should be requested");

    manager.scanDevices();
    TEST_ASSERT(manager.eventLoop().waitIdle(2000ms), "Loop should drain");
    TEST_ASSERT(!observer.events.contains("radio:available"), "Radio is not available yet");
    TEST_ASSERT(radio.counters->discovery_starts == 0, "Scan is gated until the radio is on");

    // The user switched the radio on
    radio.enabled = true;
    manager.requestRadioEnabling();
    TEST_ASSERT(wait_until([&] { return observer.events.contains("radio:available"); }),
                "Observer should hear onRadioAvailable");
    manager.scanDevices();
    TEST_ASSERT(wait_until([&] { return radio.counters->discovery_starts == 1; }), "Scan should now start");

    std::cout << "Disabled Radio Test Passed!" << std::endl;
    return true;
}

bool test_scan_reports_devices() {
    std::cout << "Testing scan relay..." << std::endl;
    FakeRadioAdapter radio;
    RecordingObserver observer;
    ManagerConfig config = fast_config();
    config.scan_time = 200ms;
    BluetoothManager manager(config, ServiceConfig(), radio, observer);

    manager.start();
    manager.scanDevices();
    TEST_ASSERT(wait_until([&] { return observer.events.contains("visible:1"); }), "Scan should begin");

    radio.emitPeerFound(PeerIdentity("AA:00:00:00:00:07", "tablet"));
    TEST_ASSERT(wait_until([&] { return observer.events.contains("devices:AA:00:00:00:00:07"); }),
                "Found device should be relayed");
    TEST_ASSERT(manager.discoveredDevices().size() == 1, "Snapshot should hold the device");

    TEST_ASSERT(wait_until([&] { return observer.events.contains("visible:0"); }),
                "Scan window should elapse");
    TEST_ASSERT(observer.events.indexOf("scan:finished") < observer.events.indexOf("visible:0"),
                "Finished comes with the indicator going away");

    std::cout << "Scan Relay Test Passed!" << std::endl;
    return true;
}

bool test_observer_reads_devices_during_scan() {
    std::cout << "Testing discoveredDevices() from scan notifications..." << std::endl;
    FakeRadioAdapter radio;
    SnapshotReadingObserver observer;
    BluetoothManager manager(fast_config(), ServiceConfig(), radio, observer);
    observer.manager = &manager;

    manager.start();
    manager.scanDevices();
    TEST_ASSERT(wait_until([&] { return radio.isDiscovering(); }), "Scan should begin");

    radio.emitPeerFound(PeerIdentity("AA:00:00:00:00:11", "phone"));
    radio.emitPeerFound(PeerIdentity("AA:00:00:00:00:12", "speaker"));
    TEST_ASSERT(wait_until([&] { return observer.events.contains("devices:2/2"); }),
                "Observer should read the list while handling onDevicesFound");
    TEST_ASSERT(observer.events.contains("devices:1/1"), "First notification sees one device");

    radio.finishDiscovery();
    TEST_ASSERT(wait_until([&] { return observer.events.contains("finished:2"); }),
                "Observer should read the list while handling onScanFinished");

    // The loop must still be serving events afterwards
    TEST_ASSERT(manager.eventLoop().waitIdle(2000ms), "Loop should stay responsive");
    manager.scanDevices();
    TEST_ASSERT(wait_until([&] { return radio.counters->discovery_starts == 2; }),
                "A second scan should start");

    manager.onStop();
    std::cout << "Snapshot From Callback Test Passed!" << std::endl;
    return true;
}

bool test_connect_and_messages() {
    std::cout << "Testing connect, receive and send..." << std::endl;
    FakeRadioAdapter radio;
    RecordingObserver observer;
    FakeChannelScript script;
    script.reads = {"hi"};
    radio.setNextScript(script);
    BluetoothManager manager(fast_config(), ServiceConfig(), radio, observer);

    manager.start();
    manager.connectDevice(PeerIdentity("AA:00:00:00:00:08", "watch"));

    TEST_ASSERT(wait_until([&] { return observer.events.contains("message:hi"); }),
                "Inbound message should be relayed");
    TEST_ASSERT(observer.events.indexOf("state:CONNECTED") < observer.events.indexOf("message:hi"),
                "CONNECTED precedes the first message");
    TEST_ASSERT(manager.sessionState() == SessionState::CONNECTED, "Session should be CONNECTED");

    TEST_ASSERT(manager.sendMessage("yo"), "sendMessage should succeed");
    auto channel = radio.outbound(0);
    TEST_ASSERT(channel && channel->written() == std::vector<std::string>{"yo"}, "Message should be written");

    std::cout << "Connect And Messages Test Passed!" << std::endl;
    return true;
}

bool test_discoverable_loop() {
    std::cout << "Testing discoverability requests..." << std::endl;
    FakeRadioAdapter radio;
    RecordingObserver observer;
    ManagerConfig config = fast_config();
    config.discoverable_time = 100ms;
    config.loop_discovery = true;
    BluetoothManager manager(config, ServiceConfig(), radio, observer);

    manager.start();
    manager.makeDiscoverable();
    TEST_ASSERT(wait_until([&] { return radio.counters->discoverable_requests >= 1; }),
                "Radio should be asked for discoverability");
    TEST_ASSERT(radio.last_discoverable_seconds == 0, "Sub-second window rounds down");
    TEST_ASSERT(wait_until([&] { return radio.counters->discoverable_requests >= 3; }),
                "Loop mode should keep renewing");

    manager.onStop();
    TEST_ASSERT(manager.eventLoop().waitIdle(2000ms), "Loop should drain");
    const int after_stop = radio.counters->discoverable_requests;
    std::this_thread::sleep_for(300ms);
    TEST_ASSERT(radio.counters->discoverable_requests == after_stop, "No renewals after onStop");

    std::cout << "Discoverable Loop Test Passed!" << std::endl;
    return true;
}

bool test_on_stop_releases_everything() {
    std::cout << "Testing onStop()..." << std::endl;
    FakeRadioAdapter radio;
    RecordingObserver observer;
    BluetoothManager manager(fast_config(), ServiceConfig(), radio, observer);

    manager.start();
    manager.scanDevices();
    manager.makeDiscoverable();
    TEST_ASSERT(wait_until([&] {
        return radio.isDiscovering() && manager.scheduler().has(TaskCategory::DISCOVERY);
    }), "Scan and discoverability should be running");

    manager.onStop();
    TEST_ASSERT(!radio.isDiscovering(), "Inquiry should be cancelled");
    TEST_ASSERT(radio.counters->listener_closes == 1, "Listener should be closed");
    TEST_ASSERT(manager.sessionState() == SessionState::NONE, "Session should be NONE");
    TEST_ASSERT(manager.scheduler().liveCount() == 0, "No live tasks");
    TEST_ASSERT(!radio.hasDiscoveryListener(), "Receiver should be unregistered");

    manager.onStop();
    TEST_ASSERT(manager.sessionState() == SessionState::NONE, "Second onStop is harmless");

    std::cout << "onStop Test Passed!" << std::endl;
    return true;
}

bool test_paired_devices() {
    std::cout << "Testing paired devices..." << std::endl;
    FakeRadioAdapter radio;
    radio.paired = {PeerIdentity("AA:00:00:00:00:0A", "headset"), PeerIdentity("AA:00:00:00:00:0B", "car")};
    BluetoothManagerObserverAdapter observer;
    BluetoothManager manager(fast_config(), ServiceConfig(), radio, observer);

    auto paired = manager.pairedDevices();
    TEST_ASSERT(paired.size() == 2, "Two paired devices expected");
    TEST_ASSERT(paired[1].name == "car", "Names should be kept");

    std::cout << "Paired Devices Test Passed!" << std::endl;
    return true;
}

bool test_config_clamping() {
    std::cout << "Testing window clamping..." << std::endl;
    ManagerConfig config;
    config.scan_time = std::chrono::seconds(1000);
    config.discoverable_time = std::chrono::seconds(500);
    config.replay_capacity = 0;

    ManagerConfig clamped = config.clamped();
    TEST_ASSERT(clamped.scan_time == std::chrono::seconds(MAX_SCAN_TIME_SEC), "Scan window capped");
    TEST_ASSERT(clamped.discoverable_time == std::chrono::seconds(MAX_DISCOVERABLE_TIME_SEC),
                "Discoverable window capped");
    TEST_ASSERT(clamped.replay_capacity == 1, "Replay capacity raised to 1");

    config.scan_time = std::chrono::milliseconds(-5);
    TEST_ASSERT(config.clamped().scan_time == std::chrono::milliseconds(0), "Negative window floored");

    FakeRadioAdapter radio;
    BluetoothManagerObserverAdapter observer;
    BluetoothManager manager(config, ServiceConfig(), radio, observer);
    TEST_ASSERT(manager.config().discoverable_time == std::chrono::seconds(MAX_DISCOVERABLE_TIME_SEC),
                "Manager keeps the clamped config");

    std::cout << "Clamping Test Passed!" << std::endl;
    return true;
}

int main() {
    configure_unit_test_runtime();
    std::cout << "Running BluetoothManager Tests..." << std::endl;

    test_missing_radio();
    test_start_relays_state();
    test_disabled_radio_requests_enable();
    test_scan_reports_devices();
    test_observer_reads_devices_during_scan();
    test_connect_and_messages();
    test_discoverable_loop();
    test_on_stop_releases_everything();
    test_paired_devices();
    test_config_clamping();

    if (tests_failed == 0) {
        std::cout << "ALL MANAGER TESTS PASSED" << std::endl;
        return 0;
    } else {
        std::cerr << tests_failed << " TESTS FAILED" << std::endl;
        return 1;
    }
}
