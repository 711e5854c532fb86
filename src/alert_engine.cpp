#include "vitalmon/alert_engine.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace vitalmon {

std::string to_string(AlertState state) {
    switch (state) {
        case AlertState::Normal:  return "Normal";
        case AlertState::Alerted: return "Alerted";
    }
    return "Unknown";
}

std::string to_string(AlertEventKind kind) {
    switch (kind) {
        case AlertEventKind::Raised:  return "AlertRaised";
        case AlertEventKind::Cleared: return "AlertCleared";
    }
    return "Unknown";
}

std::string AlertEvent::message() const {
    std::ostringstream oss;
    oss << quantity << " at " << std::fixed << std::setprecision(1) << value << "%";
    if (kind == AlertEventKind::Raised) {
        oss << " exceeded " << thresholds.enter << "%";
    } else {
        oss << " back below " << thresholds.clear << "%";
    }
    return oss.str();
}

AlertState next_state(AlertState current, double value, const ThresholdConfig& thresholds) {
    if (std::isnan(value)) {
        return current;
    }
    if (current == AlertState::Normal && value > thresholds.enter) {
        return AlertState::Alerted;
    }
    if (current == AlertState::Alerted && value < thresholds.clear) {
        return AlertState::Normal;
    }
    return current;
}

AlertEngine::AlertEngine(const std::map<std::string, ThresholdConfig>& thresholds)
    : thresholds_(thresholds)
{
}

std::optional<ThresholdConfig> AlertEngine::thresholds_for(const std::string& quantity) const {
    auto it = thresholds_.find(quantity);
    if (it != thresholds_.end()) {
        return it->second;
    }

    const std::string disk_prefix = std::string(alert_quantity::kDiskPercent) + ":";
    if (quantity.compare(0, disk_prefix.size(), disk_prefix) == 0) {
        auto generic = thresholds_.find(alert_quantity::kDiskPercent);
        if (generic != thresholds_.end()) {
            return generic->second;
        }
    }
    return std::nullopt;
}

std::optional<AlertEvent> AlertEngine::evaluate(const std::string& quantity, double value, TimePoint timestamp) {
    auto thresholds = thresholds_for(quantity);
    if (!thresholds) {
        return std::nullopt;
    }

    auto it = trackers_.find(quantity);
    if (it == trackers_.end()) {
        Tracker tracker;
        tracker.last_value = std::numeric_limits<double>::quiet_NaN();
        it = trackers_.emplace(quantity, tracker).first;
    }
    Tracker& tracker = it->second;
    tracker.thresholds = *thresholds;
    if (!std::isnan(value)) {
        tracker.last_value = value;
    }

    AlertState next = next_state(tracker.state, value, *thresholds);
    if (next == tracker.state) {
        return std::nullopt;
    }
    tracker.state = next;

    AlertEvent event;
    event.kind = next == AlertState::Alerted ? AlertEventKind::Raised : AlertEventKind::Cleared;
    event.quantity = quantity;
    event.value = value;
    event.thresholds = *thresholds;
    event.timestamp = timestamp;
    return event;
}

std::vector<AlertEvent> AlertEngine::evaluate_sample(const Sample& sample) {
    std::vector<AlertEvent> events;
    auto emit = [&](const std::string& quantity, double value) {
        if (auto event = evaluate(quantity, value, sample.timestamp)) {
            events.push_back(*event);
        }
    };

    if (auto mean = sample.cpu_mean()) {
        emit(alert_quantity::kCpuMean, *mean);
    }
    if (sample.memory) {
        emit(alert_quantity::kMemoryPercent, sample.memory->percent);
    }
    if (sample.disks) {
        for (const auto& disk : *sample.disks) {
            emit(std::string(alert_quantity::kDiskPercent) + ":" + disk.mount_path, disk.percent);
        }
    }
    return events;
}

void AlertEngine::update_thresholds(const std::map<std::string, ThresholdConfig>& thresholds) {
    thresholds_ = thresholds;

    // Drop state for quantities that lost their thresholds
    for (auto it = trackers_.begin(); it != trackers_.end();) {
        if (auto updated = thresholds_for(it->first)) {
            it->second.thresholds = *updated;
            ++it;
        } else {
            it = trackers_.erase(it);
        }
    }
}

void AlertEngine::reset() {
    trackers_.clear();
}

AlertState AlertEngine::state(const std::string& quantity) const {
    auto it = trackers_.find(quantity);
    return it == trackers_.end() ? AlertState::Normal : it->second.state;
}

std::vector<AlertStatus> AlertEngine::statuses() const {
    std::vector<AlertStatus> out;

    // Configured quantities that have not been evaluated yet are Normal
    for (const auto& entry : thresholds_) {
        if (entry.first == alert_quantity::kDiskPercent || trackers_.count(entry.first) > 0) {
            continue;
        }
        AlertStatus status;
        status.quantity = entry.first;
        status.thresholds = entry.second;
        status.last_value = std::numeric_limits<double>::quiet_NaN();
        out.push_back(status);
    }

    for (const auto& entry : trackers_) {
        AlertStatus status;
        status.quantity = entry.first;
        status.state = entry.second.state;
        status.thresholds = entry.second.thresholds;
        status.last_value = entry.second.last_value;
        out.push_back(status);
    }

    std::sort(out.begin(), out.end(),
              [](const AlertStatus& a, const AlertStatus& b) { return a.quantity < b.quantity; });
    return out;
}

} // namespace vitalmon
