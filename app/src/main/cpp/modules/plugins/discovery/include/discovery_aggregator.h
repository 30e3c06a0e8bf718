#ifndef DISCOVERY_AGGREGATOR_H
#define DISCOVERY_AGGREGATOR_H

#include "discovery_receiver.h"
#include "radio_adapter.h"
#include "task_scheduler.h"
#include <chrono>
#include <mutex>
#include <vector>

// Where scan results go. Called without the aggregator lock, on the thread
// that delivered the discovery event (the manager's event loop).
class DiscoverySink {
public:
    virtual ~DiscoverySink() = default;
    // Always the complete list found in the current scan cycle
    virtual void onDevicesFound(const std::vector<PeerIdentity>& devices) = 0;
    virtual void onScanVisibility(bool scanning) = 0;
    virtual void onScanFinished() = 0;
};

/**
 * @brief DiscoveryAggregator - one scan cycle at a time.
 *
 * beginScan() clears the set, registers the receiver, starts the inquiry and
 * arms a SCAN timeout that cancels it. Found peers are kept unique by
 * address in arrival order and every new one republishes the full list.
 * When the inquiry ends the sink hears onScanVisibility(false), and in loop
 * mode the next cycle starts right away.
 */
class DiscoveryAggregator {
public:
    DiscoveryAggregator(RadioAdapter& radio, TaskScheduler& scheduler, DiscoveryReceiver& receiver,
                        DiscoverySink& sink, std::chrono::milliseconds scan_time, bool loop_scan);

    DiscoveryAggregator(const DiscoveryAggregator&) = delete;
    DiscoveryAggregator& operator=(const DiscoveryAggregator&) = delete;

    // Clears the set and allows scanning (radio enabled and set up)
    void prepare();
    void setScanReady(bool ready);
    bool scanReady() const;

    bool beginScan();
    void stopScan();

    void onPeerDiscovered(const PeerIdentity& peer);
    void onDiscoveryFinished();

    std::vector<PeerIdentity> snapshot() const;

private:
    RadioAdapter& m_radio;
    TaskScheduler& m_scheduler;
    DiscoveryReceiver& m_receiver;
    DiscoverySink& m_sink;
    const std::chrono::milliseconds m_scan_time;
    const bool m_loop_scan;

    mutable std::mutex m_mutex;
    std::vector<PeerIdentity> m_devices;
    bool m_scan_ready{false};
};

#endif // DISCOVERY_AGGREGATOR_H
