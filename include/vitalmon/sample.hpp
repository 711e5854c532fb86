#pragma once

#include "vitalmon/metrics_provider.hpp"
#include <optional>
#include <vector>

namespace vitalmon {

// One point-in-time reading. A category that could not be read this tick is
// left empty ("unknown") rather than filled with stale values.
struct Sample {
    TimePoint timestamp;
    std::optional<std::vector<double>> cpu_per_core;
    std::optional<MemoryReading> memory;
    std::optional<std::vector<DiskReading>> disks;   // sorted by mount path
    std::optional<NetworkCounters> network_counters;

    // Mean of all cores, empty when the CPU category is unknown
    std::optional<double> cpu_mean() const;
};

} // namespace vitalmon
