#pragma once

#include "vitalmon/alert_notifier.hpp"
#include "vitalmon/config_manager.hpp"
#include "vitalmon/display.hpp"
#include "vitalmon/engine.hpp"
#include "vitalmon/metrics_provider.hpp"
#include <atomic>
#include <memory>
#include <string>

namespace vitalmon {

// Terminal front-end: owns the configuration, the provider, the engine and
// its consumers, and polls for stop, reset and config changes
class SystemMonitor {
public:
    explicit SystemMonitor(const std::string& config_path);
    ~SystemMonitor();

    // Load and validate config, build components
    bool initialize();

    // Blocks until stop() is requested
    void run();

    // Safe to call from a signal handler
    void stop() { stop_requested_ = true; }
    void request_reset() { reset_requested_ = true; }

private:
    void apply_reloaded_config();

    std::string config_path_;
    ConfigManager config_manager_;
    std::unique_ptr<MetricsProvider> provider_;
    std::unique_ptr<MetricsEngine> engine_;
    std::shared_ptr<TerminalDisplay> display_;
    std::shared_ptr<AlertNotifier> notifier_;

    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> reset_requested_{false};
};

} // namespace vitalmon
