#pragma once

#include "vitalmon/config_manager.hpp"
#include "vitalmon/sample.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace vitalmon {

enum class AlertState {
    Normal,
    Alerted
};

enum class AlertEventKind {
    Raised,
    Cleared
};

struct AlertEvent {
    AlertEventKind kind = AlertEventKind::Raised;
    std::string quantity;        // "cpu_mean", "memory_percent", "disk_percent:/home"
    double value = 0.0;
    ThresholdConfig thresholds;
    TimePoint timestamp;

    // "cpu_mean at 95.0% exceeded 90.0%"
    std::string message() const;
};

struct AlertStatus {
    std::string quantity;
    AlertState state = AlertState::Normal;
    ThresholdConfig thresholds;
    double last_value = 0.0;     // NaN until a value has been seen
};

// Hysteresis transition: Normal -> Alerted above `enter`, Alerted -> Normal
// below `clear`, unchanged in between. NaN never transitions.
AlertState next_state(AlertState current, double value, const ThresholdConfig& thresholds);

class AlertEngine {
public:
    explicit AlertEngine(const std::map<std::string, ThresholdConfig>& thresholds =
                             AlertConfig{}.threshold_map());

    // One evaluation of one quantity. Quantities without thresholds are not
    // tracked and never emit.
    std::optional<AlertEvent> evaluate(const std::string& quantity, double value, TimePoint timestamp);

    // cpu_mean, memory_percent and disk_percent:<mount> for one Sample.
    // Unknown categories are skipped.
    std::vector<AlertEvent> evaluate_sample(const Sample& sample);

    // Replace the policy; quantities that keep thresholds keep their state
    void update_thresholds(const std::map<std::string, ThresholdConfig>& thresholds);

    // Every quantity back to Normal
    void reset();

    AlertState state(const std::string& quantity) const;
    std::vector<AlertStatus> statuses() const;

    // Exact match first; "disk_percent:<mount>" falls back to "disk_percent"
    std::optional<ThresholdConfig> thresholds_for(const std::string& quantity) const;

private:
    struct Tracker {
        AlertState state = AlertState::Normal;
        ThresholdConfig thresholds;
        double last_value = 0.0;
    };

    std::map<std::string, ThresholdConfig> thresholds_;
    std::map<std::string, Tracker> trackers_;
};

std::string to_string(AlertState state);
std::string to_string(AlertEventKind kind);

} // namespace vitalmon
