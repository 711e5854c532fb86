#pragma once

#include "vitalmon/bounded_series.hpp"
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace vitalmon {

// Series ids used by the engine
namespace series {
    std::string cpu_core(size_t index);     // "cpu.<index>"
    extern const char* const kMemoryPercent;
    extern const char* const kNetSent;
    extern const char* const kNetRecv;
}

// Named bounded histories, one per metric. Every operation is atomic with
// respect to the others.
class HistoryBuffer {
public:
    explicit HistoryBuffer(size_t capacity = kDefaultHistoryCapacity);

    // Creates the series on first push
    void push(const std::string& series_id, double value);

    // Oldest first; empty for an unknown id
    std::vector<double> snapshot(const std::string& series_id) const;

    // Every series becomes empty
    void reset_all();

    // Applies to all series; shrinking drops the oldest points
    void set_capacity(size_t capacity);
    size_t capacity() const;

    size_t size(const std::string& series_id) const;
    std::vector<std::string> series_ids() const;

private:
    mutable std::mutex mutex_;
    size_t capacity_;
    std::map<std::string, BoundedSeries<double>> series_;
};

} // namespace vitalmon
