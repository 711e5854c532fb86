#pragma once

#include "vitalmon/alert_engine.hpp"
#include "vitalmon/rate_deriver.hpp"
#include "vitalmon/sample.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace vitalmon {

// Shape handed to CSV/JSON/image exporters. Every sequence is oldest first and
// index-aligned with `timestamps`; unknown points are quiet NaN.
struct SeriesSnapshot {
    struct NetworkSeries {
        std::vector<double> sent;        // bytes/sec
        std::vector<double> received;    // bytes/sec
    };

    std::vector<TimePoint> timestamps;
    std::map<size_t, std::vector<double>> cpu_series;
    std::vector<double> memory_series;
    NetworkSeries network_series;
};

// Everything a consumer receives for one completed tick. Immutable once built.
struct TickResult {
    uint64_t sequence = 0;
    Sample sample;
    std::optional<DerivedRates> rates;   // empty when network counters are unknown
    RateDiagnostics rate_diagnostics;
    SeriesSnapshot history;
    std::vector<AlertStatus> alert_states;
    std::vector<AlertEvent> alert_events;
    std::optional<TimePoint> boot_time;
};

} // namespace vitalmon
