#include "bluetooth_manager.h"
#include "config_manager.h"
#include "corebt.h"
#include "logger.h"
#include "manager_config.h"
#include "service_config.h"
#include "socket_radio_adapter.h"
#include "terminal_cli.h"
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include <signal.h>

static TerminalCLI* g_cli = nullptr;

static void handle_termination(int) {
    if (g_cli) {
        g_cli->stop();
    }
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config FILE          Path to configuration file (default: config.json)\n"
              << "  --name NAME            Name answered to inquiries (socket_radio.local_name)\n"
              << "  --port PORT            RFCOMM stream port (socket_radio.rfcomm_port)\n"
              << "  --discovery-port PORT  Inquiry port (socket_radio.discovery_port)\n"
              << "  --log-level LVL        Log level: debug|info|warning|error|none\n"
              << "  --daemon               Listen only, no stdin (suitable for background/testing)\n"
              << "  --help                 Show this help message\n"
              << "\nInteractive CLI (after startup):\n"
              << "  Type 'help' to see commands. A typical session:\n"
              << "    visible           (on the other machine)\n"
              << "    scan\n"
              << "    connect 0\n"
              << "    send hello\n"
              << std::endl;
}

static bool parse_port(const std::string& value, int& port) {
    try {
        int p = std::stoi(value);
        if (p < 1 || p > 65535) {
            std::cerr << "Error: Port must be between 1 and 65535" << std::endl;
            return false;
        }
        port = p;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error: Invalid port number: " << e.what() << std::endl;
        return false;
    }
}

int main(int argc, char* argv[]) {
    // Ignore SIGPIPE to prevent process termination on socket write errors
    signal(SIGPIPE, SIG_IGN);

    // Quiet until the configuration decides
    set_log_level(LogLevel::NONE);

    std::string config_path = "config.json";
    std::string local_name;
    std::string requested_log_level;
    int rfcomm_port = 0;
    int discovery_port = 0;
    bool daemon_mode = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--daemon") {
            daemon_mode = true;
        } else if (arg == "--config" || arg == "--name" || arg == "--port" ||
                   arg == "--discovery-port" || arg == "--log-level") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires an argument" << std::endl;
                return 1;
            }
            std::string value = argv[++i];
            if (arg == "--config") {
                config_path = value;
            } else if (arg == "--name") {
                local_name = value;
            } else if (arg == "--port") {
                if (!parse_port(value, rfcomm_port)) return 1;
            } else if (arg == "--discovery-port") {
                if (!parse_port(value, discovery_port)) return 1;
            } else {
                requested_log_level = value;
            }
        } else {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    // Load configuration with fallbacks (useful when running from build/bin)
    std::vector<std::string> candidates;
    candidates.push_back(config_path);
    candidates.push_back("../config.json");
    candidates.push_back("../../config.json");
    std::error_code ec;
    std::filesystem::path exe_dir = std::filesystem::absolute(argv[0], ec).parent_path();
    if (!ec) {
        candidates.push_back((exe_dir / "config.json").string());
        candidates.push_back((exe_dir / "../config.json").lexically_normal().string());
    }

    std::string chosen_config;
    for (const auto& c : candidates) {
        if (std::filesystem::exists(c, ec) && ConfigManager::getInstance().loadConfig(c)) {
            chosen_config = c;
            break;
        }
    }
    if (chosen_config.empty()) {
        std::cerr << "Warning: no configuration file found, using built-in defaults" << std::endl;
    }

    // Command line wins over the file
    ConfigManager& config = ConfigManager::getInstance();
    if (!local_name.empty()) {
        config.setValueAtPath({"socket_radio", "local_name"}, local_name);
    }
    if (rfcomm_port > 0) {
        config.setValueAtPath({"socket_radio", "rfcomm_port"}, rfcomm_port);
    }
    if (discovery_port > 0) {
        config.setValueAtPath({"socket_radio", "discovery_port"}, discovery_port);
    }
    if (!requested_log_level.empty()) {
        config.setValueAtPath({"logging", "level"}, requested_log_level);
    }

    // CLI first so its log callback sees the startup lines
    TerminalCLI cli(daemon_mode);
    g_cli = &cli;
    signal(SIGINT, handle_termination);
    signal(SIGTERM, handle_termination);

    litebt::CoreBT::initialize();
    setLogTag(config.getLocalName());

    SocketRadioAdapter radio(SocketRadioConfig::fromConfigManager());
    BluetoothManager manager(ManagerConfig::fromConfigManager(), ServiceConfig::fromConfigManager(),
                             radio, cli);
    manager.start();

    cli.run(manager);

    manager.onStop();
    g_cli = nullptr;
    litebt::CoreBT::shutdown();
    return 0;
}
