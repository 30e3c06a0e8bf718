/**
 * terminal_cli.cpp - Line-oriented chat console
 */

#include "terminal_cli.h"
#include "bluetooth_manager.h"
#include "logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>
#include <unistd.h>

// ═══════════════════════════════════════════════════════════════════════════
// ANSI ESCAPE CODES
// ═══════════════════════════════════════════════════════════════════════════

#define C_RESET      "\033[0m"
#define C_DIM        "\033[2m"
#define C_RED        "\033[31m"
#define C_GREEN      "\033[32m"
#define C_YELLOW     "\033[33m"
#define C_CYAN       "\033[36m"
#define C_BGREEN     "\033[92m"
#define C_BYELLOW    "\033[93m"
#define C_BCYAN      "\033[96m"

// ═══════════════════════════════════════════════════════════════════════════
// HELPERS
// ═══════════════════════════════════════════════════════════════════════════

static std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm;
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << tm.tm_hour << ":"
        << std::setw(2) << tm.tm_min << ":" << std::setw(2) << tm.tm_sec;
    return oss.str();
}

static std::string trim_copy(const std::string& s) {
    size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) b++;
    size_t e = s.size();
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
    return s.substr(b, e - b);
}

std::string to_lower_copy(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

static const char* state_color(SessionState state) {
    switch (state) {
        case SessionState::CONNECTED: return C_BGREEN;
        case SessionState::CONNECTING: return C_BYELLOW;
        case SessionState::LISTENING: return C_CYAN;
        case SessionState::NONE: break;
    }
    return C_DIM;
}

// ═══════════════════════════════════════════════════════════════════════════
// LIFECYCLE
// ═══════════════════════════════════════════════════════════════════════════

TerminalCLI::TerminalCLI(bool daemon_mode)
    : daemon_mode_(daemon_mode), running(false), log_filter_level(CLILogLevel::INFO) {
    setLogCallback([this](const std::string& line) { capture_log_line(line); });
}

TerminalCLI::~TerminalCLI() {
    setLogCallback(nullptr);
}

void TerminalCLI::run(BluetoothManager& manager) {
    manager_ = &manager;
    running = true;
    if (daemon_mode_) {
        run_daemon();
    } else {
        run_plain();
    }
    running = false;
}

void TerminalCLI::run_plain() {
    print_line("LiteBT chat. Type 'help' for commands. Ctrl-D to exit.");

    std::string line;
    while (running) {
        {
            std::lock_guard<std::mutex> lock(output_mutex);
            std::cout << "litebt> " << std::flush;
        }
        if (!std::getline(std::cin, line)) {
            break;
        }
        if (trim_copy(line).empty()) {
            continue;
        }
        process_command(line);
    }

    print_line("Goodbye!");
}

void TerminalCLI::run_daemon() {
    print_line("LiteBT daemon mode started. Use 'kill -TERM " + std::to_string(getpid()) + "' to stop.");
    while (running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    print_line("Goodbye!");
}

void TerminalCLI::stop() {
    running = false;
}

// ═══════════════════════════════════════════════════════════════════════════
// OUTPUT
// ═══════════════════════════════════════════════════════════════════════════

void TerminalCLI::print_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << "\r" << line << C_RESET << std::endl;
}

void TerminalCLI::capture_log_line(const std::string& line) {
    if (log_filter_level == CLILogLevel::NONE) return;
    if (line.find("ERROR") != std::string::npos) {
        if (log_filter_level < CLILogLevel::ERROR) return;
    } else if (line.find("WARN") != std::string::npos) {
        if (log_filter_level < CLILogLevel::WARNING) return;
    } else if (line.find("INFO") != std::string::npos) {
        if (log_filter_level < CLILogLevel::INFO) return;
    } else {
        if (log_filter_level < CLILogLevel::DEBUG) return;
    }
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << C_DIM << line << C_RESET << std::endl;
}

void TerminalCLI::show_devices(const std::string& title, const std::vector<PeerIdentity>& devices) {
    {
        std::lock_guard<std::mutex> lock(devices_mutex);
        device_list = devices;
    }
    print_line(C_CYAN "── " + title + " (" + std::to_string(devices.size()) + ") ──");
    for (size_t i = 0; i < devices.size(); ++i) {
        print_line("  [" + std::to_string(i) + "] " + devices[i].toString());
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// MANAGER NOTIFICATIONS
// ═══════════════════════════════════════════════════════════════════════════

void TerminalCLI::onDevicesFound(const std::vector<PeerIdentity>& devices) {
    show_devices("Discovered", devices);
}

void TerminalCLI::onRadioAvailable() {
    print_line(C_GREEN "Radio ready");
}

void TerminalCLI::onRadioUnavailable() {
    print_line(C_RED "This device has no Bluetooth radio");
}

void TerminalCLI::onScanVisibility(bool scanning) {
    print_line(scanning ? C_YELLOW "Scanning..." : C_DIM "Scan stopped");
}

void TerminalCLI::onScanFinished() {
    print_line(C_DIM "Scan finished");
}

void TerminalCLI::onSessionStateChanged(SessionState state) {
    print_line(std::string(state_color(state)) + "[" + get_timestamp() + "] session " +
               session_state_to_string(state));
}

void TerminalCLI::onMessageReceived(const std::string& text) {
    print_line(C_BCYAN "[" + get_timestamp() + "] << " C_RESET + text);
}

// ═══════════════════════════════════════════════════════════════════════════
// COMMANDS
// ═══════════════════════════════════════════════════════════════════════════

void TerminalCLI::process_command(const std::string& input) {
    std::istringstream iss(input);
    std::string cmd;
    iss >> cmd;
    cmd = to_lower_copy(cmd);

    if (cmd == "help" || cmd == "h" || cmd == "?") {
        cmd_help();
    } else if (cmd == "quit" || cmd == "exit" || cmd == "q") {
        cmd_quit();
    } else if (cmd == "scan") {
        cmd_scan();
    } else if (cmd == "stopscan" || cmd == "ss") {
        cmd_stop_scan();
    } else if (cmd == "visible" || cmd == "v") {
        cmd_visible();
    } else if (cmd == "paired") {
        cmd_paired();
    } else if (cmd == "devices" || cmd == "ls") {
        cmd_devices();
    } else if (cmd == "connect" || cmd == "c") {
        std::string target;
        iss >> target;
        cmd_connect(target);
    } else if (cmd == "send" || cmd == "m") {
        std::string message;
        std::getline(iss, message);
        if (!message.empty() && message[0] == ' ') message = message.substr(1);
        cmd_send(message);
    } else if (cmd == "status" || cmd == "s") {
        cmd_status();
    } else if (cmd == "logfilter" || cmd == "lf") {
        std::string level;
        iss >> level;
        cmd_log_filter(level);
    } else if (!cmd.empty()) {
        print_line(C_YELLOW "Unknown: " + cmd + " (type 'help')");
    }
}

void TerminalCLI::cmd_help() {
    print_line(C_CYAN "═══════════ COMMANDS ═══════════");
    print_line(C_GREEN "scan" C_RESET "          Scan for nearby devices");
    print_line(C_GREEN "stopscan" C_RESET "      Stop the running scan");
    print_line(C_GREEN "visible" C_RESET "       Make this device discoverable");
    print_line(C_GREEN "paired" C_RESET "        List paired devices");
    print_line(C_GREEN "devices" C_RESET "       List devices found by the last scan");
    print_line(C_GREEN "connect" C_RESET " n|addr Connect to list entry n or an address");
    print_line(C_GREEN "send" C_RESET " text     Send text to the connected device");
    print_line(C_GREEN "status" C_RESET "        Show radio and session state");
    print_line(C_YELLOW "logfilter" C_RESET " l   error/warn/info/debug/none");
    print_line(C_RED "quit" C_RESET "          Exit");
}

void TerminalCLI::cmd_quit() {
    running = false;
}

void TerminalCLI::cmd_scan() {
    if (!manager_->isRadioEnabled()) {
        print_line(C_YELLOW "Radio is off; requesting enable");
        manager_->requestRadioEnabling();
        return;
    }
    manager_->scanDevices();
}

void TerminalCLI::cmd_stop_scan() {
    manager_->stopScan();
}

void TerminalCLI::cmd_visible() {
    manager_->makeDiscoverable();
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        manager_->config().discoverable_time).count();
    print_line(C_GREEN "Discoverable for " + std::to_string(seconds) + "s");
}

void TerminalCLI::cmd_paired() {
    show_devices("Paired", manager_->pairedDevices());
}

void TerminalCLI::cmd_devices() {
    show_devices("Discovered", manager_->discoveredDevices());
}

void TerminalCLI::cmd_connect(const std::string& target) {
    if (target.empty()) {
        print_line(C_YELLOW "Usage: connect <index|address>");
        return;
    }

    PeerIdentity peer(target);
    const bool numeric = target.size() < 6 &&
                         std::all_of(target.begin(), target.end(),
                                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
    if (numeric) {
        std::lock_guard<std::mutex> lock(devices_mutex);
        const size_t index = static_cast<size_t>(std::stoul(target));
        if (index >= device_list.size()) {
            print_line(C_YELLOW "No device " + target + " in the last list");
            return;
        }
        peer = device_list[index];
    }

    print_line(C_DIM "Connecting to " + peer.toString() + "...");
    manager_->connectDevice(peer);
}

void TerminalCLI::cmd_send(const std::string& message) {
    if (message.empty()) {
        print_line(C_YELLOW "Usage: send <text>");
        return;
    }
    if (!manager_->sendMessage(message)) {
        print_line(C_YELLOW "Not sent: no connected device");
        return;
    }
    print_line(C_DIM "[" + get_timestamp() + "] >> " + message);
}

void TerminalCLI::cmd_status() {
    const SessionState state = manager_->sessionState();
    print_line(C_CYAN "═══════════ STATUS ═══════════");
    print_line(std::string("Radio:    ") +
               (!manager_->isRadioAvailable() ? "missing" : manager_->isRadioEnabled() ? "on" : "off"));
    print_line(std::string("Session:  ") + state_color(state) + session_state_to_string(state));
    if (state == SessionState::CONNECTED) {
        print_line("Peer:     " + manager_->session().connectedPeer().toString());
    }
    print_line("Found:    " + std::to_string(manager_->discoveredDevices().size()) + " device(s)");
}

void TerminalCLI::cmd_log_filter(const std::string& level) {
    const std::string l = to_lower_copy(level);
    if (l == "none") {
        log_filter_level = CLILogLevel::NONE;
    } else if (l == "error") {
        log_filter_level = CLILogLevel::ERROR;
    } else if (l == "warn" || l == "warning") {
        log_filter_level = CLILogLevel::WARNING;
    } else if (l == "info") {
        log_filter_level = CLILogLevel::INFO;
    } else if (l == "debug") {
        log_filter_level = CLILogLevel::DEBUG;
        set_log_level(LogLevel::DEBUG);
    } else {
        print_line(C_YELLOW "Usage: logfilter error|warn|info|debug|none");
        return;
    }
    print_line(C_DIM "Log filter: " + l);
}
