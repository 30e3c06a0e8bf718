/**
 * terminal_cli.h - Line-oriented chat console
 *
 * Reads commands from stdin and prints every manager notification as it
 * arrives. In daemon mode stdin is not read and the process only listens,
 * printing inbound messages until it is signalled.
 */

#ifndef TERMINAL_CLI_H
#define TERMINAL_CLI_H

#include "manager_observer.h"
#include "peer_identity.h"
#include <atomic>
#include <mutex>
#include <string>
#include <vector>

class BluetoothManager;

// Byte-wise ASCII lowercase; other bytes (UTF-8 included) pass through
std::string to_lower_copy(const std::string& s);

enum class CLILogLevel {
    NONE = 0,
    ERROR = 1,
    WARNING = 2,
    INFO = 3,
    DEBUG = 4
};

class TerminalCLI : public BluetoothManagerObserver {
public:
    explicit TerminalCLI(bool daemon_mode = false);
    ~TerminalCLI() override;

    // Blocks until quit, end of input or stop()
    void run(BluetoothManager& manager);
    void stop();

    // Called by the logger callback
    void capture_log_line(const std::string& line);

    // BluetoothManagerObserver (event loop thread)
    void onDevicesFound(const std::vector<PeerIdentity>& devices) override;
    void onRadioAvailable() override;
    void onRadioUnavailable() override;
    void onScanVisibility(bool scanning) override;
    void onScanFinished() override;
    void onSessionStateChanged(SessionState state) override;
    void onMessageReceived(const std::string& text) override;

private:
    bool daemon_mode_;
    std::atomic<bool> running;
    BluetoothManager* manager_{nullptr};

    std::atomic<CLILogLevel> log_filter_level;
    std::mutex output_mutex;

    // Last list shown; `connect <n>` indexes into it
    std::vector<PeerIdentity> device_list;
    std::mutex devices_mutex;

    void run_plain();
    void run_daemon();

    void print_line(const std::string& line);
    void show_devices(const std::string& title, const std::vector<PeerIdentity>& devices);

    void process_command(const std::string& input);

    void cmd_help();
    void cmd_quit();
    void cmd_scan();
    void cmd_stop_scan();
    void cmd_visible();
    void cmd_paired();
    void cmd_devices();
    void cmd_connect(const std::string& target);
    void cmd_send(const std::string& message);
    void cmd_status();
    void cmd_log_filter(const std::string& level);
};

#endif // TERMINAL_CLI_H
