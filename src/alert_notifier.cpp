#include "vitalmon/alert_notifier.hpp"
#include "vitalmon/alert_engine.hpp"
#include "vitalmon/log.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace vitalmon {

AlertNotifier::AlertNotifier(const AlertConfig& config, bool enabled, std::ostream& bell)
    : config_(config)
    , enabled_(enabled)
    , bell_(bell)
{
    std::lock_guard<std::mutex> lock(mutex_);
    open_log_locked();
}

AlertNotifier::~AlertNotifier() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void AlertNotifier::update_config(const AlertConfig& config, bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool reopen = config.log_path != config_.log_path
        || config.log_to_file != config_.log_to_file
        || enabled != enabled_;
    config_ = config;
    enabled_ = enabled;

    if (reopen) {
        if (log_file_.is_open()) {
            log_file_.close();
        }
        open_log_locked();
    }
}

void AlertNotifier::open_log_locked() {
    if (!enabled_ || !config_.log_to_file) {
        return;
    }
    log_file_.open(config_.log_path, std::ios::app);
    if (!log_file_.is_open()) {
        Log::warn("Failed to open alert log file: ", config_.log_path);
    }
}

std::string AlertNotifier::format_timestamp(const TimePoint& tp) {
    auto time_t = Clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

std::string AlertNotifier::format_entry(const AlertEvent& event) {
    std::ostringstream oss;
    oss << "[" << format_timestamp(event.timestamp) << "] "
        << (event.kind == AlertEventKind::Raised ? "RAISED" : "CLEARED")
        << " - " << event.quantity << ": " << event.message();
    return oss.str();
}

void AlertNotifier::on_tick(const TickResult& tick) {
    if (tick.alert_events.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!enabled_) {
        return;
    }

    bool raised = false;
    for (const auto& event : tick.alert_events) {
        log_event_locked(event);
        raised = raised || event.kind == AlertEventKind::Raised;
    }
    if (raised) {
        beep_locked();
    }
}

void AlertNotifier::log_event_locked(const AlertEvent& event) {
    if (!config_.log_to_file || !log_file_.is_open()) {
        return;
    }
    log_file_ << format_entry(event) << "\n";
    log_file_.flush();
}

void AlertNotifier::beep_locked() {
    if (!config_.beep_on_alert) {
        return;
    }
    // Unix terminal bell
    bell_ << "\a" << std::flush;
}

} // namespace vitalmon
