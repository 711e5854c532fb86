#pragma once

#include <typiconf/typiconf.hpp>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace vitalmon {

// Hysteresis pair: alert when value > enter, clear when value < clear
struct ThresholdConfig {
    double enter = 90.0;
    double clear = 70.0;

    bool validate() const {
        return clear >= 0.0 && enter <= 100.0 && clear < enter;
    }

    TYPICONF_DEFINE_FIELDS(ThresholdConfig,
        TYPICONF_FIELD(enter),
        TYPICONF_FIELD(clear)
    )
};

// Quantity names understood by the engine
namespace alert_quantity {
    extern const char* const kCpuMean;          // mean of all cores
    extern const char* const kMemoryPercent;
    extern const char* const kDiskPercent;      // applied per mount as "disk_percent:<mount>"
}

struct QuantityThresholdConfig {
    std::string quantity;
    ThresholdConfig thresholds;

    TYPICONF_DEFINE_FIELDS(QuantityThresholdConfig,
        TYPICONF_FIELD(quantity),
        TYPICONF_FIELD(thresholds)
    )
};

struct AlertConfig {
    // cpu_mean 90/70 and memory_percent 85/75 unless overridden
    std::vector<QuantityThresholdConfig> thresholds = default_thresholds();
    bool beep_on_alert = false;
    bool log_to_file = true;
    std::string log_path = "./vitalmon-alerts.log";

    static std::vector<QuantityThresholdConfig> default_thresholds();
    std::map<std::string, ThresholdConfig> threshold_map() const;

    TYPICONF_DEFINE_FIELDS(AlertConfig,
        TYPICONF_FIELD(thresholds),
        TYPICONF_FIELD(beep_on_alert),
        TYPICONF_FIELD(log_to_file),
        TYPICONF_FIELD(log_path)
    )
};

struct DispatcherConfig {
    int max_consecutive_failures = 5;    // 0 keeps failing consumers forever
    int backlog_warning = 32;

    TYPICONF_DEFINE_FIELDS(DispatcherConfig,
        TYPICONF_FIELD(max_consecutive_failures),
        TYPICONF_FIELD(backlog_warning)
    )
};

struct DisplayConfig {
    bool enabled = true;
    std::string color_scheme = "default";
    bool show_graphs = true;
    bool show_per_core = true;
    int graph_width = 40;

    TYPICONF_DEFINE_FIELDS(DisplayConfig,
        TYPICONF_FIELD(enabled),
        TYPICONF_FIELD(color_scheme),
        TYPICONF_FIELD(show_graphs),
        TYPICONF_FIELD(show_per_core),
        TYPICONF_FIELD(graph_width)
    )
};

struct LoggingConfig {
    bool debug = false;

    TYPICONF_DEFINE_FIELDS(LoggingConfig,
        TYPICONF_FIELD(debug)
    )
};

struct VitalmonConfig {
    std::string version = "1.0";
    double interval_seconds = 1.0;
    int history_capacity = 60;
    double provider_timeout_seconds = 0.5;
    bool notifications_enabled = true;
    AlertConfig alerts;
    DispatcherConfig dispatcher;
    DisplayConfig display;
    LoggingConfig logging;

    bool validate(std::string& error_msg) const;

    TYPICONF_DEFINE_FIELDS(VitalmonConfig,
        TYPICONF_FIELD(version),
        TYPICONF_FIELD(interval_seconds),
        TYPICONF_FIELD(history_capacity),
        TYPICONF_FIELD(provider_timeout_seconds),
        TYPICONF_FIELD(notifications_enabled),
        TYPICONF_FIELD(alerts),
        TYPICONF_FIELD(dispatcher),
        TYPICONF_FIELD(display),
        TYPICONF_FIELD(logging)
    )
};

class ConfigManager {
public:
    explicit ConfigManager(const std::string& config_path);

    // Load configuration
    bool load();

    // Reload if file changed (hot-reload). A changed file that fails to
    // parse or validate is rejected and the current configuration is kept.
    bool check_and_reload();

    // Access configuration
    const VitalmonConfig& get_config() const { return config_; }
    const std::string& last_error() const { return last_error_; }

    // Validation
    bool validate_config(std::string& error_msg) const;

private:
    bool parse(VitalmonConfig& out, std::string& error_msg) const;

    std::string config_path_;
    VitalmonConfig config_;
    std::string last_error_;
    std::filesystem::file_time_type last_modified_;
};

} // namespace vitalmon
