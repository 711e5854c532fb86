#include "vitalmon/log.hpp"
#include "vitalmon/system_monitor.hpp"
#include <csignal>
#include <iostream>
#include <memory>

namespace {

// Global pointer for signal handler
vitalmon::SystemMonitor* g_monitor = nullptr;

void signal_handler(int signal) {
    if (!g_monitor) {
        return;
    }
    if (signal == SIGINT || signal == SIGTERM) {
        g_monitor->stop();
    } else if (signal == SIGUSR1) {
        g_monitor->request_reset();
    }
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [config_file]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  config_file    Path to YAML configuration file (default: config/default_config.yaml)\n";
    std::cout << "  -h, --help     Show this help message\n";
    std::cout << "\n";
    std::cout << "Signals:\n";
    std::cout << "  SIGINT, SIGTERM    Stop monitoring\n";
    std::cout << "  SIGUSR1            Reset history graphs\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << "\n";
    std::cout << "  " << program_name << " custom_config.yaml\n";
    std::cout << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    // Parse command-line arguments
    std::string config_path = "config/default_config.yaml";

    if (argc > 1) {
        std::string arg = argv[1];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        config_path = arg;
    }

    auto monitor = std::make_unique<vitalmon::SystemMonitor>(config_path);
    if (!monitor->initialize()) {
        vitalmon::Log::error("Failed to initialize vitalmon");
        return 1;
    }

    // Setup signal handlers
    g_monitor = monitor.get();
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGUSR1, signal_handler);

    // Run monitoring loop
    monitor->run();

    g_monitor = nullptr;
    vitalmon::Log::info("vitalmon stopped");
    return 0;
}
