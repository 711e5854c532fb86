#include <catch2/catch_test_macros.hpp>
#include "vitalmon/display.hpp"
#include "fake_provider.hpp"
#include <cmath>
#include <limits>
#include <sstream>

using vitalmon::testing::test_time;

namespace {

vitalmon::TickResult make_tick() {
    vitalmon::TickResult tick;
    tick.sequence = 7;
    tick.sample.timestamp = test_time(100);
    tick.sample.cpu_per_core = std::vector<double>{95.0, 97.0};
    tick.sample.memory = vitalmon::MemoryReading{1024 * 1024, 512 * 1024, 512 * 1024, 256 * 1024, 50.0};
    tick.sample.disks = std::vector<vitalmon::DiskReading>{
        {"/dev/sda1", "/", "ext4", 2048, 1024, 1024, 50.0},
    };
    tick.sample.network_counters = vitalmon::NetworkCounters{4096, 8192, 4, 8};
    tick.rates = vitalmon::DerivedRates{2048.0, 1024.0, 2.0, 1.0};
    tick.boot_time = test_time(100) - std::chrono::seconds(3661);

    vitalmon::AlertStatus cpu;
    cpu.quantity = "cpu_mean";
    cpu.state = vitalmon::AlertState::Alerted;
    cpu.thresholds = {90.0, 70.0};
    cpu.last_value = 96.0;
    tick.alert_states.push_back(cpu);

    vitalmon::AlertEvent raised;
    raised.kind = vitalmon::AlertEventKind::Raised;
    raised.quantity = "cpu_mean";
    raised.value = 96.0;
    raised.thresholds = {90.0, 70.0};
    raised.timestamp = tick.sample.timestamp;
    tick.alert_events.push_back(raised);

    tick.history.timestamps = {test_time(98), test_time(99), test_time(100)};
    tick.history.cpu_series[0] = {10.0, 50.0, 95.0};
    tick.history.cpu_series[1] = {20.0, 60.0, 97.0};
    tick.history.memory_series = {50.0, 50.0, 50.0};
    tick.history.network_series.sent = {0.0, 1024.0, 2048.0};
    tick.history.network_series.received = {0.0, 512.0, 1024.0};
    return tick;
}

vitalmon::DisplayConfig mono_config() {
    vitalmon::DisplayConfig config;
    config.color_scheme = "mono";
    config.graph_width = 10;
    return config;
}

} // namespace

TEST_CASE("format helpers", "[display]") {
    REQUIRE(vitalmon::format_bytes(512) == "512.00 B");
    REQUIRE(vitalmon::format_bytes(1536) == "1.50 KB");
    REQUIRE(vitalmon::format_bytes(1024ULL * 1024 * 1024) == "1.00 GB");
    REQUIRE(vitalmon::format_rate(2048.0) == "2.00 KB/s");
    REQUIRE(vitalmon::format_rate(std::numeric_limits<double>::quiet_NaN()) == "unavailable");
    REQUIRE(vitalmon::format_duration(std::chrono::seconds(3661)) == "01:01:01");
    REQUIRE(vitalmon::format_duration(std::chrono::seconds(90061)) == "1d 01:01:01");
}

TEST_CASE("severity_of follows the hysteresis pair", "[display]") {
    vitalmon::ThresholdConfig thresholds{90.0, 70.0};
    REQUIRE(vitalmon::severity_of(50.0, thresholds) == vitalmon::Severity::Normal);
    REQUIRE(vitalmon::severity_of(75.0, thresholds) == vitalmon::Severity::Elevated);
    REQUIRE(vitalmon::severity_of(95.0, thresholds) == vitalmon::Severity::Critical);
    REQUIRE(vitalmon::severity_of(95.0, std::nullopt) == vitalmon::Severity::Normal);
}

TEST_CASE("mean_series averages cores and skips unknown points", "[display]") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    std::map<size_t, std::vector<double>> cores{
        {0, {10.0, nan, nan}},
        {1, {30.0, 40.0, nan}},
    };

    auto mean = vitalmon::mean_series(cores);
    REQUIRE(mean.size() == 3);
    REQUIRE(mean[0] == 20.0);
    REQUIRE(mean[1] == 40.0);
    REQUIRE(std::isnan(mean[2]));
}

TEST_CASE("TerminalDisplay renders every section", "[display]") {
    std::ostringstream out;
    vitalmon::TerminalDisplay display(mono_config(), out);
    REQUIRE(display.name() == "terminal-display");

    display.on_tick(make_tick());
    std::string frame = out.str();

    REQUIRE(frame.find("VITALMON") != std::string::npos);
    REQUIRE(frame.find("Tick 7") != std::string::npos);
    REQUIRE(frame.find("Uptime 01:01:01") != std::string::npos);
    REQUIRE(frame.find("[CPU]") != std::string::npos);
    REQUIRE(frame.find("96%") != std::string::npos);
    REQUIRE(frame.find("Core  1") != std::string::npos);
    REQUIRE(frame.find("[Memory]") != std::string::npos);
    REQUIRE(frame.find("512.00 KB / 1.00 MB") != std::string::npos);
    REQUIRE(frame.find("ext4 /dev/sda1") != std::string::npos);
    REQUIRE(frame.find("2.00 KB/s") != std::string::npos);
    REQUIRE(frame.find("cpu_mean 96.0% (clears below 70") != std::string::npos);
    REQUIRE(frame.find("AlertRaised: cpu_mean at 96.0% exceeded 90.0%") != std::string::npos);
    REQUIRE(frame.find("[History - Last 2s]") != std::string::npos);

    // mono scheme: only the clear-screen sequence
    REQUIRE(frame.find("\033[31m") == std::string::npos);
}

TEST_CASE("TerminalDisplay marks unknown categories", "[display]") {
    std::ostringstream out;
    vitalmon::TerminalDisplay display(mono_config(), out);

    vitalmon::TickResult tick = make_tick();
    tick.sample.cpu_per_core.reset();
    tick.sample.memory.reset();
    tick.sample.disks.reset();
    tick.sample.network_counters.reset();
    tick.rates.reset();
    display.on_tick(tick);

    std::string frame = out.str();
    REQUIRE(frame.find("[CPU]  unavailable") != std::string::npos);
    REQUIRE(frame.find("[Memory]  unavailable") != std::string::npos);
    REQUIRE(frame.find("[Network]\n  unavailable") != std::string::npos);
}

TEST_CASE("TerminalDisplay colors critical values", "[display]") {
    std::ostringstream out;
    vitalmon::DisplayConfig config;
    vitalmon::TerminalDisplay display(config, out);

    display.on_tick(make_tick());
    REQUIRE(out.str().find("\033[31m") != std::string::npos);
}

TEST_CASE("TerminalDisplay honours a reloaded config", "[display]") {
    std::ostringstream out;
    vitalmon::TerminalDisplay display(mono_config(), out);

    auto config = mono_config();
    config.enabled = false;
    display.update_config(config);
    display.on_tick(make_tick());
    REQUIRE(out.str().empty());

    config.enabled = true;
    config.show_graphs = false;
    display.update_config(config);
    display.on_tick(make_tick());
    REQUIRE_FALSE(out.str().empty());
    REQUIRE(out.str().find("[History") == std::string::npos);
}
