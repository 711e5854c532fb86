#include "vitalmon/system_monitor.hpp"
#include "vitalmon/log.hpp"
#include <chrono>
#include <thread>

namespace vitalmon {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(200);

} // namespace

SystemMonitor::SystemMonitor(const std::string& config_path)
    : config_path_(config_path)
    , config_manager_(config_path)
{
}

SystemMonitor::~SystemMonitor() {
    if (engine_) {
        engine_->stop();
    }
}

bool SystemMonitor::initialize() {
    // Load configuration
    if (!config_manager_.load()) {
        Log::error("Failed to load configuration from ", config_path_);
        return false;
    }

    // Validate configuration
    std::string validation_error;
    if (!config_manager_.validate_config(validation_error)) {
        Log::error("Configuration validation failed: ", validation_error);
        return false;
    }

    const auto& config = config_manager_.get_config();
    Log::set_debug(config.logging.debug);

    // Initialize components
    try {
        provider_ = create_metrics_provider();
    } catch (const ProviderError& e) {
        Log::error("Failed to create metrics provider: ", e.what());
        return false;
    }

    engine_ = std::make_unique<MetricsEngine>(*provider_, EngineOptions::from_config(config));
    display_ = std::make_shared<TerminalDisplay>(config.display);
    notifier_ = std::make_shared<AlertNotifier>(config.alerts, config.notifications_enabled);
    engine_->register_consumer(display_);
    engine_->register_consumer(notifier_);

    return true;
}

void SystemMonitor::run() {
    if (!engine_) {
        Log::error("System monitor not initialized. Call initialize() first.");
        return;
    }

    Log::info("vitalmon started with config ", config_path_,
              ", interval ", engine_->interval_seconds(), "s");
    engine_->start();

    while (!stop_requested_) {
        std::this_thread::sleep_for(kPollInterval);

        if (reset_requested_.exchange(false)) {
            engine_->reset_history();
        }

        // Hot-reload configuration if changed
        if (config_manager_.check_and_reload()) {
            apply_reloaded_config();
        }

        if (!engine_->running()) {
            Log::error("Sampling loop exited unexpectedly");
            break;
        }
    }

    engine_->stop();
    engine_->dispatcher().flush(std::chrono::milliseconds(500));
}

void SystemMonitor::apply_reloaded_config() {
    const auto& config = config_manager_.get_config();
    Log::set_debug(config.logging.debug);
    engine_->apply_config(config);
    display_->update_config(config.display);
    notifier_->update_config(config.alerts, config.notifications_enabled);
}

} // namespace vitalmon
