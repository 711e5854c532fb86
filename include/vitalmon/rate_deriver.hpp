#pragma once

#include "vitalmon/metrics_provider.hpp"
#include <optional>

namespace vitalmon {

struct DerivedRates {
    double bytes_sent_per_sec = 0.0;
    double bytes_recv_per_sec = 0.0;
    double packets_sent_per_sec = 0.0;
    double packets_recv_per_sec = 0.0;
};

// How a tick's rates came about. A clamped counter reports 0 because the
// counter went backwards, which is not the same as an idle link.
struct RateDiagnostics {
    bool first_tick = false;
    bool clock_anomaly = false;          // elapsed <= 0, previous rates reused
    bool bytes_sent_reset = false;
    bool bytes_recv_reset = false;
    bool packets_sent_reset = false;
    bool packets_recv_reset = false;

    bool any_reset() const {
        return bytes_sent_reset || bytes_recv_reset || packets_sent_reset || packets_recv_reset;
    }
};

struct RateDerivation {
    DerivedRates rates;
    RateDiagnostics diagnostics;
};

// rate = max(0, curr - prev) / elapsed for each counter. With elapsed <= 0 the
// computation is skipped and `previous_rates` is returned unchanged.
RateDerivation derive(const NetworkCounters& prev,
                      const NetworkCounters& curr,
                      double elapsed_seconds,
                      const DerivedRates& previous_rates = {});

// Stateful wrapper that remembers the last known counters between ticks
class RateDeriver {
public:
    // Returns empty when `counters` is unknown this tick. The last known
    // counters are kept so the next good tick is measured across the gap.
    std::optional<DerivedRates> update(const std::optional<NetworkCounters>& counters,
                                       TimePoint timestamp);

    const RateDiagnostics& last_diagnostics() const { return diagnostics_; }
    const DerivedRates& last_rates() const { return last_rates_; }

    void reset();

private:
    std::optional<NetworkCounters> last_counters_;
    TimePoint last_timestamp_{};
    DerivedRates last_rates_;
    RateDiagnostics diagnostics_;
};

} // namespace vitalmon
