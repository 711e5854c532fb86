#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace vitalmon {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

struct MemoryReading {
    uint64_t total_bytes = 0;
    uint64_t available_bytes = 0;
    uint64_t used_bytes = 0;
    uint64_t free_bytes = 0;
    double percent = 0.0;                    // 0-100%
};

struct DiskReading {
    std::string device;
    std::string mount_path;
    std::string fstype;
    uint64_t total_bytes = 0;
    uint64_t used_bytes = 0;
    uint64_t free_bytes = 0;
    double percent = 0.0;
};

// Cumulative since boot; may drop back on interface restart or wraparound
struct NetworkCounters {
    uint64_t bytes_sent = 0;
    uint64_t bytes_recv = 0;
    uint64_t packets_sent = 0;
    uint64_t packets_recv = 0;
};

// Base of every failure a provider call can report
class ProviderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// One metric category could not be read (permission denied, syscall failure)
class ProviderUnavailable : public ProviderError {
public:
    using ProviderError::ProviderError;
};

// A provider call exceeded its time bound
class ProviderTimeout : public ProviderError {
public:
    using ProviderError::ProviderError;
};

class MetricsProvider {
public:
    virtual ~MetricsProvider() = default;

    // All sample_* calls may throw ProviderUnavailable. Different categories
    // may be called concurrently from different threads; calls for the same
    // category never overlap.
    virtual std::vector<double> sample_cpu_per_core() = 0;
    virtual MemoryReading sample_memory() = 0;
    virtual std::vector<DiskReading> sample_disks() = 0;
    virtual NetworkCounters sample_network_counters() = 0;
    virtual TimePoint boot_time() = 0;
};

// Factory function
std::unique_ptr<MetricsProvider> create_metrics_provider();

} // namespace vitalmon
