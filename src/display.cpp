#include "vitalmon/display.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace vitalmon {

namespace {

constexpr size_t kRecentEvents = 5;
constexpr size_t kMaxPerCoreRows = 32;

const AlertStatus* find_status(const TickResult& tick, const std::string& quantity) {
    for (const auto& status : tick.alert_states) {
        if (status.quantity == quantity) {
            return &status;
        }
    }
    return nullptr;
}

std::optional<ThresholdConfig> thresholds_of(const TickResult& tick, const std::string& quantity) {
    if (const AlertStatus* status = find_status(tick, quantity)) {
        return status->thresholds;
    }
    return std::nullopt;
}

std::string unavailable() {
    return "unavailable";
}

} // namespace

TerminalDisplay::TerminalDisplay(const DisplayConfig& config, std::ostream& out)
    : out_(out)
    , config_(config)
    , frame_config_(config)
{
}

void TerminalDisplay::update_config(const DisplayConfig& config) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_ = config;
}

Severity severity_of(double value, const std::optional<ThresholdConfig>& thresholds) {
    if (!thresholds || std::isnan(value)) {
        return Severity::Normal;
    }
    if (value > thresholds->enter) {
        return Severity::Critical;
    }
    if (value >= thresholds->clear) {
        return Severity::Elevated;
    }
    return Severity::Normal;
}

std::string TerminalDisplay::color_code(Severity severity) const {
    if (frame_config_.color_scheme == "mono") {
        return "";
    }

    switch (severity) {
        case Severity::Normal:   return "\033[32m";  // Green
        case Severity::Elevated: return "\033[33m";  // Yellow
        case Severity::Critical: return "\033[31m";  // Red
    }
    return "\033[0m";
}

std::string TerminalDisplay::reset_color() const {
    if (frame_config_.color_scheme == "mono") {
        return "";
    }
    return "\033[0m";
}

std::string TerminalDisplay::colorize(const std::string& text, Severity severity) const {
    return color_code(severity) + text + reset_color();
}

std::string format_bytes(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_index < 4) {
        size /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << units[unit_index];
    return oss.str();
}

std::string format_rate(double bytes_per_sec) {
    if (std::isnan(bytes_per_sec) || bytes_per_sec < 0.0) {
        return unavailable();
    }
    return format_bytes(static_cast<uint64_t>(bytes_per_sec)) + "/s";
}

std::string format_duration(std::chrono::seconds duration) {
    long long total = std::max<long long>(0, duration.count());
    long long days = total / 86400;
    long long hours = (total % 86400) / 3600;
    long long minutes = (total % 3600) / 60;
    long long seconds = total % 60;

    std::ostringstream oss;
    if (days > 0) {
        oss << days << "d ";
    }
    oss << std::setfill('0') << std::setw(2) << hours << ":"
        << std::setw(2) << minutes << ":" << std::setw(2) << seconds;
    return oss.str();
}

std::vector<double> mean_series(const std::map<size_t, std::vector<double>>& cpu_series) {
    size_t length = 0;
    for (const auto& entry : cpu_series) {
        length = std::max(length, entry.second.size());
    }

    std::vector<double> out(length, std::nan(""));
    for (size_t i = 0; i < length; ++i) {
        double sum = 0.0;
        size_t count = 0;
        for (const auto& entry : cpu_series) {
            if (i < entry.second.size() && !std::isnan(entry.second[i])) {
                sum += entry.second[i];
                ++count;
            }
        }
        if (count > 0) {
            out[i] = sum / static_cast<double>(count);
        }
    }
    return out;
}

std::string TerminalDisplay::create_progress_bar(double percentage, int width, Severity severity) const {
    double clamped = std::min(100.0, std::max(0.0, percentage));
    int filled = static_cast<int>(clamped / 100.0 * width);
    std::string bar;
    for (int i = 0; i < width; ++i) {
        bar += i < filled ? "█" : "░";
    }
    return colorize(bar, severity);
}

std::string TerminalDisplay::create_graph(const std::vector<double>& data) const {
    size_t width = static_cast<size_t>(frame_config_.graph_width);
    if (data.empty()) {
        std::string empty;
        for (size_t i = 0; i < width; ++i) empty += "▁";
        return empty;
    }

    // Newest points only
    size_t start = data.size() > width ? data.size() - width : 0;

    // Find max value for scaling
    double max_val = 0.0;
    for (size_t i = start; i < data.size(); ++i) {
        if (!std::isnan(data[i])) max_val = std::max(max_val, data[i]);
    }
    if (max_val == 0.0) max_val = 1.0;

    // Unicode block characters for different heights
    const char* blocks[] = {"▁", "▁", "▂", "▃", "▄", "▅", "▆", "▇", "█"};

    std::string graph;
    for (size_t i = start; i < data.size(); ++i) {
        if (std::isnan(data[i])) {
            graph += " ";
            continue;
        }
        int block_index = static_cast<int>((data[i] / max_val) * 8);
        block_index = std::min(8, std::max(0, block_index));
        graph += blocks[block_index];
    }
    return graph;
}

void TerminalDisplay::render_header(std::ostream& os, const TickResult& tick) {
    const int box_width = 60;
    const std::string title = "VITALMON";
    const int padding = (box_width - static_cast<int>(title.length())) / 2;

    os << "╔";
    for (int i = 0; i < box_width; ++i) os << "═";
    os << "╗\n";

    os << "║";
    for (int i = 0; i < padding; ++i) os << " ";
    os << title;
    for (int i = 0; i < box_width - padding - static_cast<int>(title.length()); ++i) os << " ";
    os << "║\n";

    os << "╚";
    for (int i = 0; i < box_width; ++i) os << "═";
    os << "╝\n";

    std::time_t now = Clock::to_time_t(tick.sample.timestamp);
    std::tm tm{};
    localtime_r(&now, &tm);
    os << "Tick " << tick.sequence << "  " << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (tick.boot_time) {
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(tick.sample.timestamp - *tick.boot_time);
        os << "  Uptime " << format_duration(uptime);
    }
    os << "\n\n";
}

void TerminalDisplay::render_cpu(std::ostream& os, const TickResult& tick) {
    os << "[CPU]  ";
    auto mean = tick.sample.cpu_mean();
    if (!mean) {
        os << unavailable() << "\n\n";
        return;
    }

    auto thresholds = thresholds_of(tick, alert_quantity::kCpuMean);
    Severity severity = severity_of(*mean, thresholds);
    os << create_progress_bar(*mean, 20, severity);
    os << "  " << colorize(std::to_string(static_cast<int>(*mean)) + "%", severity);
    os << "  (" << tick.sample.cpu_per_core->size() << " cores)\n";

    // Per-core display (only if enabled and reasonable number of cores)
    const auto& cores = *tick.sample.cpu_per_core;
    if (frame_config_.show_per_core && cores.size() <= kMaxPerCoreRows) {
        for (size_t i = 0; i < cores.size(); ++i) {
            Severity core_severity = severity_of(cores[i], thresholds);
            os << "  Core " << std::setw(2) << i << ": ";
            os << create_progress_bar(cores[i], 20, core_severity);
            os << "  " << std::setw(3) << static_cast<int>(cores[i]) << "%\n";
        }
    }
    os << "\n";
}

void TerminalDisplay::render_memory(std::ostream& os, const TickResult& tick) {
    os << "[Memory]  ";
    if (!tick.sample.memory) {
        os << unavailable() << "\n\n";
        return;
    }

    const auto& memory = *tick.sample.memory;
    Severity severity = severity_of(memory.percent, thresholds_of(tick, alert_quantity::kMemoryPercent));
    os << create_progress_bar(memory.percent, 20, severity);
    os << "  " << colorize(std::to_string(static_cast<int>(memory.percent)) + "%", severity);
    os << " (" << format_bytes(memory.used_bytes) << " / " << format_bytes(memory.total_bytes) << ")";
    os << "  available " << format_bytes(memory.available_bytes) << "\n\n";
}

void TerminalDisplay::render_disks(std::ostream& os, const TickResult& tick) {
    os << "[Disk]\n";
    if (!tick.sample.disks) {
        os << "  " << unavailable() << "\n\n";
        return;
    }

    for (const auto& disk : *tick.sample.disks) {
        std::string quantity = std::string(alert_quantity::kDiskPercent) + ":" + disk.mount_path;
        Severity severity = severity_of(disk.percent, thresholds_of(tick, quantity));

        os << "  " << std::setw(20) << std::left << disk.mount_path << std::right;
        os << create_progress_bar(disk.percent, 20, severity);
        os << "  " << std::setw(3) << static_cast<int>(disk.percent) << "%";
        os << " (" << format_bytes(disk.used_bytes) << " / " << format_bytes(disk.total_bytes) << ")";
        os << "  " << disk.fstype << " " << disk.device << "\n";
    }
    os << "\n";
}

void TerminalDisplay::render_network(std::ostream& os, const TickResult& tick) {
    os << "[Network]\n";
    if (!tick.rates || !tick.sample.network_counters) {
        os << "  " << unavailable() << "\n\n";
        return;
    }

    const auto& rates = *tick.rates;
    const auto& counters = *tick.sample.network_counters;
    os << "  ↑ " << std::setw(14) << format_rate(rates.bytes_sent_per_sec)
       << "  " << std::fixed << std::setprecision(1) << rates.packets_sent_per_sec << " pkt/s"
       << "  (TX: " << format_bytes(counters.bytes_sent) << ")\n";
    os << "  ↓ " << std::setw(14) << format_rate(rates.bytes_recv_per_sec)
       << "  " << std::fixed << std::setprecision(1) << rates.packets_recv_per_sec << " pkt/s"
       << "  (RX: " << format_bytes(counters.bytes_recv) << ")\n";
    if (tick.rate_diagnostics.any_reset()) {
        os << "  (counter reset detected, rate clamped)\n";
    }
    os << "\n";
}

void TerminalDisplay::render_alerts(std::ostream& os, const TickResult& tick) {
    os << "[Alerts]\n";

    bool any_active = false;
    for (const auto& status : tick.alert_states) {
        if (status.state == AlertState::Alerted) {
            any_active = true;
            std::ostringstream line;
            line << status.quantity << " " << std::fixed << std::setprecision(1) << status.last_value
                 << "% (clears below " << status.thresholds.clear << "%)";
            os << "  " << colorize(line.str(), Severity::Critical) << "\n";
        }
    }
    if (!any_active) {
        os << "  " << colorize("No active alerts", Severity::Normal) << "\n";
    }

    // Show last few transitions
    for (const auto& event : recent_events_) {
        std::time_t time = Clock::to_time_t(event.timestamp);
        std::tm tm{};
        localtime_r(&time, &tm);
        Severity severity = event.kind == AlertEventKind::Raised ? Severity::Critical : Severity::Normal;
        os << "  " << std::put_time(&tm, "%H:%M:%S") << " | "
           << colorize(to_string(event.kind) + ": " + event.message(), severity) << "\n";
    }
    os << "\n";
}

void TerminalDisplay::render_history(std::ostream& os, const TickResult& tick) {
    const auto& history = tick.history;
    if (!frame_config_.show_graphs || history.timestamps.empty()) {
        return;
    }

    auto span = std::chrono::duration_cast<std::chrono::seconds>(
        history.timestamps.back() - history.timestamps.front());
    os << "[History - Last " << span.count() << "s]\n";
    os << "CPU:  " << create_graph(mean_series(history.cpu_series)) << "\n";
    os << "MEM:  " << create_graph(history.memory_series) << "\n";
    os << "TX:   " << create_graph(history.network_series.sent) << "\n";
    os << "RX:   " << create_graph(history.network_series.received) << "\n";
    os << "\n";
}

void TerminalDisplay::render_footer(std::ostream& os) {
    os << "Press Ctrl+C to quit, SIGUSR1 resets history, config hot-reload enabled\n";
}

void TerminalDisplay::on_tick(const TickResult& tick) {
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        frame_config_ = config_;
    }

    for (const auto& event : tick.alert_events) {
        recent_events_.push_back(event);
    }
    if (recent_events_.size() > kRecentEvents) {
        recent_events_.erase(recent_events_.begin(),
                             recent_events_.end() - static_cast<std::ptrdiff_t>(kRecentEvents));
    }

    if (!frame_config_.enabled) {
        return;
    }

    // Build the frame first so the terminal never shows half of it
    std::ostringstream frame;
    frame << "\033[2J\033[H";
    render_header(frame, tick);
    render_cpu(frame, tick);
    render_memory(frame, tick);
    render_disks(frame, tick);
    render_network(frame, tick);
    render_alerts(frame, tick);
    render_history(frame, tick);
    render_footer(frame);

    out_ << frame.str() << std::flush;
}

} // namespace vitalmon
