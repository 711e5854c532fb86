#pragma once

#include "vitalmon/config_manager.hpp"
#include "vitalmon/dispatcher.hpp"
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>

namespace vitalmon {

// Writes alert transitions to the alert log and rings the terminal bell on
// raised alerts when configured
class AlertNotifier : public TickConsumer {
public:
    AlertNotifier(const AlertConfig& config, bool enabled, std::ostream& bell = std::cout);
    ~AlertNotifier() override;

    std::string name() const override { return "alert-notifier"; }
    void on_tick(const TickResult& tick) override;

    void update_config(const AlertConfig& config, bool enabled);

    static std::string format_timestamp(const TimePoint& tp);

    // "[2024-05-01 12:00:00] RAISED - cpu_mean: cpu_mean at 95.0% exceeded 90.0%"
    static std::string format_entry(const AlertEvent& event);

private:
    void open_log_locked();
    void log_event_locked(const AlertEvent& event);
    void beep_locked();

    std::mutex mutex_;
    AlertConfig config_;
    bool enabled_;
    std::ostream& bell_;
    std::ofstream log_file_;
};

} // namespace vitalmon
