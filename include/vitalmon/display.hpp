#pragma once

#include "vitalmon/config_manager.hpp"
#include "vitalmon/dispatcher.hpp"
#include <chrono>
#include <cstdint>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vitalmon {

// Color band of a value relative to its hysteresis pair
enum class Severity {
    Normal,
    Elevated,    // at or above clear
    Critical     // above enter
};

// Full-screen terminal dashboard fed by the dispatcher
class TerminalDisplay : public TickConsumer {
public:
    explicit TerminalDisplay(const DisplayConfig& config, std::ostream& out = std::cout);

    std::string name() const override { return "terminal-display"; }
    void on_tick(const TickResult& tick) override;

    // Update configuration (for hot-reload)
    void update_config(const DisplayConfig& config);

private:
    void render_header(std::ostream& os, const TickResult& tick);
    void render_cpu(std::ostream& os, const TickResult& tick);
    void render_memory(std::ostream& os, const TickResult& tick);
    void render_disks(std::ostream& os, const TickResult& tick);
    void render_network(std::ostream& os, const TickResult& tick);
    void render_alerts(std::ostream& os, const TickResult& tick);
    void render_history(std::ostream& os, const TickResult& tick);
    void render_footer(std::ostream& os);

    // Helper rendering functions
    std::string create_progress_bar(double percentage, int width, Severity severity) const;
    std::string create_graph(const std::vector<double>& data) const;

    // Color helpers (ANSI escape codes)
    std::string colorize(const std::string& text, Severity severity) const;
    std::string color_code(Severity severity) const;
    std::string reset_color() const;

    std::ostream& out_;
    std::mutex config_mutex_;
    DisplayConfig config_;
    DisplayConfig frame_config_;    // copy used while rendering one frame
    std::vector<AlertEvent> recent_events_;
};

Severity severity_of(double value, const std::optional<ThresholdConfig>& thresholds);

// Helper functions for formatting
std::string format_bytes(uint64_t bytes);
std::string format_rate(double bytes_per_sec);
std::string format_duration(std::chrono::seconds duration);

// Per-index mean across cores, skipping unknown points
std::vector<double> mean_series(const std::map<size_t, std::vector<double>>& cpu_series);

} // namespace vitalmon
