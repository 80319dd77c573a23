#include "companion_node.h"
#include "config_manager.h"
#include "logger.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {
    std::atomic<bool> g_stop_requested{false};

    void handle_signal(int) {
        g_stop_requested = true;
    }
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config FILE      Path to configuration file (default: config.json)\n"
              << "  --port PORT        TCP listen port (overrides transport.tcp.listen_port)\n"
              << "  --connect HOST:PORT  Connect to a peer after startup (repeatable)\n"
              << "  --log-level LVL    Log level: debug|info|warning|error|none\n"
              << "  --help             Show this help message\n"
              << "\nRuns until interrupted (Ctrl-C).\n"
              << std::endl;
}

int main(int argc, char* argv[]) {
    signal(SIGPIPE, SIG_IGN);
    signal(SIGINT, handle_signal);
    signal(SIGTERM, handle_signal);

    std::string config_path = "config.json";
    std::string requested_log_level;
    int port = -1;
    std::vector<std::string> targets;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            if (i + 1 < argc) {
                config_path = argv[++i];
            } else {
                std::cerr << "Error: --config requires an argument" << std::endl;
                return 1;
            }
        } else if (arg == "--port") {
            if (i + 1 < argc) {
                try {
                    int p = std::stoi(argv[++i]);
                    if (p < 0 || p > 65535) {
                        std::cerr << "Error: Port must be between 0 and 65535" << std::endl;
                        return 1;
                    }
                    port = p;
                } catch (const std::exception& e) {
                    std::cerr << "Error: Invalid port number: " << e.what() << std::endl;
                    return 1;
                }
            } else {
                std::cerr << "Error: --port requires an argument" << std::endl;
                return 1;
            }
        } else if (arg == "--connect") {
            if (i + 1 < argc) {
                targets.push_back(argv[++i]);
            } else {
                std::cerr << "Error: --connect requires an argument" << std::endl;
                return 1;
            }
        } else if (arg == "--log-level") {
            if (i + 1 < argc) {
                requested_log_level = argv[++i];
            } else {
                std::cerr << "Error: --log-level requires an argument" << std::endl;
                return 1;
            }
        } else {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    // Quiet until the configured level is known.
    set_log_level(LogLevel::ERROR);

    ConfigManager& config = ConfigManager::getInstance();
    std::vector<std::string> candidates{config_path, "../config.json", "../../config.json"};
    std::error_code ec;
    const std::filesystem::path exe_dir = std::filesystem::absolute(argv[0], ec).parent_path();
    if (!ec) {
        candidates.push_back((exe_dir / "config.json").string());
        candidates.push_back((exe_dir / "../config.json").lexically_normal().string());
    }

    std::string chosen_config;
    for (const auto& candidate : candidates) {
        if (std::filesystem::exists(candidate, ec) && config.loadConfig(candidate)) {
            chosen_config = candidate;
            break;
        }
    }
    if (chosen_config.empty()) {
        std::cerr << "Warning: no configuration file found, using built-in defaults" << std::endl;
    }

    if (port >= 0 && !config.setValueAtPath({"transport", "tcp", "listen_port"}, port)) {
        std::cerr << "Error: cannot override transport.tcp.listen_port" << std::endl;
        return 1;
    }

    set_log_level(log_level_from_string(requested_log_level.empty() ? config.getLogLevel() : requested_log_level));
    setLogTag(config.getDeviceName());
    if (config.isAsyncLoggingEnabled()) {
        enable_async_logging();
    }

    int exit_code = 0;
    {
        CompanionNode node;
        if (!node.start()) {
            std::cerr << "Error: Failed to start LightLink node" << std::endl;
            exit_code = 1;
        } else {
            for (const auto& target : targets) {
                node.connectToPeer(target);
            }
            while (!g_stop_requested) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
            std::cout << "Shutting down..." << std::endl;
            for (const auto& line : node.describePeers()) {
                std::cout << "  " << line << std::endl;
            }
            node.stop();
        }
    }

    disable_async_logging();
    return exit_code;
}
