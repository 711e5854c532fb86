#include "vitalmon/config_manager.hpp"
#include "vitalmon/log.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>

// Minimal YAML reader for the vitalmon layout: top-level scalars, one level of
// sections, and the alerts.thresholds list. Field names follow the typiconf
// definitions in config_manager.hpp.
namespace vitalmon {

namespace alert_quantity {

const char* const kCpuMean = "cpu_mean";
const char* const kMemoryPercent = "memory_percent";
const char* const kDiskPercent = "disk_percent";

} // namespace alert_quantity

std::vector<QuantityThresholdConfig> AlertConfig::default_thresholds() {
    return {
        {alert_quantity::kCpuMean, {90.0, 70.0}},
        {alert_quantity::kMemoryPercent, {85.0, 75.0}},
    };
}

std::map<std::string, ThresholdConfig> AlertConfig::threshold_map() const {
    std::map<std::string, ThresholdConfig> out;
    for (const auto& entry : thresholds) {
        out[entry.quantity] = entry.thresholds;
    }
    return out;
}

static bool is_known_quantity(const std::string& name) {
    const std::string disk_prefix = std::string(alert_quantity::kDiskPercent) + ":";
    return name == alert_quantity::kCpuMean ||
           name == alert_quantity::kMemoryPercent ||
           name == alert_quantity::kDiskPercent ||
           (name.size() > disk_prefix.size() && name.compare(0, disk_prefix.size(), disk_prefix) == 0);
}

bool VitalmonConfig::validate(std::string& error_msg) const {
    if (!(interval_seconds >= 0.1)) {
        error_msg = "interval_seconds must be at least 0.1";
        return false;
    }
    if (history_capacity < 1) {
        error_msg = "history_capacity must be at least 1";
        return false;
    }
    if (!(provider_timeout_seconds > 0.0)) {
        error_msg = "provider_timeout_seconds must be positive";
        return false;
    }
    if (dispatcher.max_consecutive_failures < 0) {
        error_msg = "dispatcher.max_consecutive_failures must not be negative";
        return false;
    }
    if (dispatcher.backlog_warning < 1) {
        error_msg = "dispatcher.backlog_warning must be at least 1";
        return false;
    }
    if (display.graph_width < 1) {
        error_msg = "display.graph_width must be at least 1";
        return false;
    }
    if (display.color_scheme != "default" && display.color_scheme != "mono") {
        error_msg = "display.color_scheme must be 'default' or 'mono'";
        return false;
    }

    std::set<std::string> seen;
    for (const auto& entry : alerts.thresholds) {
        if (!is_known_quantity(entry.quantity)) {
            error_msg = "Unknown alert quantity '" + entry.quantity + "'";
            return false;
        }
        if (!seen.insert(entry.quantity).second) {
            error_msg = "Duplicate thresholds for '" + entry.quantity + "'";
            return false;
        }
        if (!entry.thresholds.validate()) {
            error_msg = "Thresholds for '" + entry.quantity +
                        "' invalid: need 0 <= clear < enter <= 100";
            return false;
        }
    }
    return true;
}

ConfigManager::ConfigManager(const std::string& config_path)
    : config_path_(config_path)
    , last_modified_{}
{
}

// Helper function to trim whitespace
static std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\n\r");
    return str.substr(first, last - first + 1);
}

// Remove quotes, or a trailing comment from an unquoted value
static std::string scalar_value(const std::string& raw) {
    std::string value = trim(raw);
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
        return value.substr(1, value.length() - 2);
    }
    size_t comment = value.find(" #");
    if (comment != std::string::npos) {
        value = trim(value.substr(0, comment));
    }
    return value;
}

static bool parse_double(const std::string& value, double& out) {
    try {
        size_t consumed = 0;
        double parsed = std::stod(value, &consumed);
        if (consumed != value.size()) return false;
        out = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

static bool parse_int(const std::string& value, int& out) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) return false;
        out = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

static bool parse_bool(const std::string& value, bool& out) {
    std::string lower = value;
    for (char& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "true" || lower == "yes" || lower == "1") {
        out = true;
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "0") {
        out = false;
        return true;
    }
    return false;
}

bool ConfigManager::parse(VitalmonConfig& config, std::string& error_msg) const {
    std::ifstream file(config_path_);
    if (!file.is_open()) {
        error_msg = "Failed to open config file: " + config_path_;
        return false;
    }

    config = VitalmonConfig{};

    std::string raw;
    std::string current_section;
    std::string current_subsection;
    std::vector<QuantityThresholdConfig> listed;
    QuantityThresholdConfig current_item;
    bool in_item = false;
    int line_no = 0;

    auto fail = [&](const std::string& msg) {
        error_msg = config_path_ + ":" + std::to_string(line_no) + ": " + msg;
        return false;
    };
    auto bad_value = [&](const std::string& key, const std::string& value) {
        return fail("invalid value '" + value + "' for '" + key + "'");
    };
    auto unknown_key = [&](const std::string& key) {
        Log::warn(config_path_, ":", line_no, ": ignoring unknown key '", key, "'");
    };
    auto flush_item = [&]() {
        if (!in_item) return true;
        if (current_item.quantity.empty()) {
            return fail("threshold entry without a quantity");
        }
        for (const auto& entry : listed) {
            if (entry.quantity == current_item.quantity) {
                return fail("duplicate thresholds for '" + current_item.quantity + "'");
            }
        }
        listed.push_back(current_item);
        current_item = QuantityThresholdConfig{};
        in_item = false;
        return true;
    };

    while (std::getline(file, raw)) {
        ++line_no;

        size_t indent = raw.find_first_not_of(' ');
        std::string line = trim(raw);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        bool list_item = false;
        if (line[0] == '-') {
            list_item = true;
            line = trim(line.substr(1));
        }

        size_t colon_pos = line.find(':');
        if (colon_pos == std::string::npos) {
            return fail("expected 'key: value'");
        }
        std::string key = trim(line.substr(0, colon_pos));
        std::string value = scalar_value(line.substr(colon_pos + 1));

        // Top-level keys and section headers
        if (indent == 0) {
            if (!flush_item()) return false;
            current_section.clear();
            current_subsection.clear();

            if (value.empty()) {
                current_section = key;
            } else if (key == "version") {
                config.version = value;
            } else if (key == "interval_seconds") {
                if (!parse_double(value, config.interval_seconds)) return bad_value(key, value);
            } else if (key == "history_capacity") {
                if (!parse_int(value, config.history_capacity)) return bad_value(key, value);
            } else if (key == "provider_timeout_seconds") {
                if (!parse_double(value, config.provider_timeout_seconds)) return bad_value(key, value);
            } else if (key == "notifications_enabled") {
                if (!parse_bool(value, config.notifications_enabled)) return bad_value(key, value);
            } else {
                unknown_key(key);
            }
            continue;
        }

        // Section-specific keys (2 spaces)
        if (indent == 2 && !list_item) {
            if (!flush_item()) return false;
            current_subsection.clear();

            if (current_section == "alerts") {
                if (key == "thresholds" && value.empty()) {
                    current_subsection = key;
                } else if (key == "beep_on_alert") {
                    if (!parse_bool(value, config.alerts.beep_on_alert)) return bad_value(key, value);
                } else if (key == "log_to_file") {
                    if (!parse_bool(value, config.alerts.log_to_file)) return bad_value(key, value);
                } else if (key == "log_path") {
                    config.alerts.log_path = value;
                } else {
                    unknown_key(key);
                }
            } else if (current_section == "dispatcher") {
                if (key == "max_consecutive_failures") {
                    if (!parse_int(value, config.dispatcher.max_consecutive_failures)) return bad_value(key, value);
                } else if (key == "backlog_warning") {
                    if (!parse_int(value, config.dispatcher.backlog_warning)) return bad_value(key, value);
                } else {
                    unknown_key(key);
                }
            } else if (current_section == "display") {
                if (key == "enabled") {
                    if (!parse_bool(value, config.display.enabled)) return bad_value(key, value);
                } else if (key == "color_scheme") {
                    config.display.color_scheme = value;
                } else if (key == "show_graphs") {
                    if (!parse_bool(value, config.display.show_graphs)) return bad_value(key, value);
                } else if (key == "show_per_core") {
                    if (!parse_bool(value, config.display.show_per_core)) return bad_value(key, value);
                } else if (key == "graph_width") {
                    if (!parse_int(value, config.display.graph_width)) return bad_value(key, value);
                } else {
                    unknown_key(key);
                }
            } else if (current_section == "logging") {
                if (key == "debug") {
                    if (!parse_bool(value, config.logging.debug)) return bad_value(key, value);
                } else {
                    unknown_key(key);
                }
            } else {
                unknown_key(current_section + "." + key);
            }
            continue;
        }

        // Handle alerts.thresholds array items
        if (current_section != "alerts" || current_subsection != "thresholds") {
            return fail("unexpected nested key '" + key + "'");
        }
        if (list_item) {
            if (!flush_item()) return false;
            in_item = true;
        }
        if (!in_item) {
            return fail("expected '- quantity: ...' list item");
        }

        if (key == "quantity") {
            current_item.quantity = value;
        } else if (key == "enter") {
            if (!parse_double(value, current_item.thresholds.enter)) return bad_value(key, value);
        } else if (key == "clear") {
            if (!parse_double(value, current_item.thresholds.clear)) return bad_value(key, value);
        } else {
            unknown_key(key);
        }
    }

    // Save last list item if exists
    if (!flush_item()) return false;

    // Listed thresholds override the defaults for the same quantity
    for (const auto& entry : listed) {
        auto& thresholds = config.alerts.thresholds;
        auto it = std::find_if(thresholds.begin(), thresholds.end(),
                               [&](const QuantityThresholdConfig& t) { return t.quantity == entry.quantity; });
        if (it != thresholds.end()) {
            it->thresholds = entry.thresholds;
        } else {
            thresholds.push_back(entry);
        }
    }

    return true;
}

bool ConfigManager::load() {
    std::error_code ec;
    auto modified = std::filesystem::last_write_time(config_path_, ec);
    if (ec) {
        last_error_ = "Failed to get file modification time for " + config_path_ + ": " + ec.message();
        Log::error(last_error_);
        return false;
    }

    VitalmonConfig parsed;
    std::string error;
    if (!parse(parsed, error)) {
        last_error_ = error;
        Log::error(last_error_);
        return false;
    }

    config_ = std::move(parsed);
    last_modified_ = modified;
    last_error_.clear();
    return true;
}

bool ConfigManager::check_and_reload() {
    std::error_code ec;
    auto current_time = std::filesystem::last_write_time(config_path_, ec);
    if (ec) {
        Log::debug("Error checking file modification: ", ec.message());
        return false;
    }
    if (current_time == last_modified_) {
        return false;
    }
    // Remember the time even if the new content is rejected
    last_modified_ = current_time;

    VitalmonConfig parsed;
    std::string error;
    if (!parse(parsed, error) || !parsed.validate(error)) {
        last_error_ = error;
        Log::error("Configuration reload rejected, keeping current settings: ", error);
        return false;
    }

    config_ = std::move(parsed);
    last_error_.clear();
    Log::info("Configuration reloaded from ", config_path_);
    return true;
}

bool ConfigManager::validate_config(std::string& error_msg) const {
    return config_.validate(error_msg);
}

} // namespace vitalmon
