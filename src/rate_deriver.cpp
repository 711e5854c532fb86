#include "vitalmon/rate_deriver.hpp"
#include "vitalmon/log.hpp"

namespace vitalmon {

namespace {

double counter_rate(uint64_t prev, uint64_t curr, double elapsed_seconds, bool& reset) {
    if (curr < prev) {
        reset = true;
        return 0.0;
    }
    return static_cast<double>(curr - prev) / elapsed_seconds;
}

} // namespace

RateDerivation derive(const NetworkCounters& prev,
                      const NetworkCounters& curr,
                      double elapsed_seconds,
                      const DerivedRates& previous_rates)
{
    RateDerivation result;

    // NaN fails this test as well
    if (!(elapsed_seconds > 0.0)) {
        result.rates = previous_rates;
        result.diagnostics.clock_anomaly = true;
        return result;
    }

    auto& d = result.diagnostics;
    result.rates.bytes_sent_per_sec = counter_rate(prev.bytes_sent, curr.bytes_sent, elapsed_seconds, d.bytes_sent_reset);
    result.rates.bytes_recv_per_sec = counter_rate(prev.bytes_recv, curr.bytes_recv, elapsed_seconds, d.bytes_recv_reset);
    result.rates.packets_sent_per_sec = counter_rate(prev.packets_sent, curr.packets_sent, elapsed_seconds, d.packets_sent_reset);
    result.rates.packets_recv_per_sec = counter_rate(prev.packets_recv, curr.packets_recv, elapsed_seconds, d.packets_recv_reset);
    return result;
}

std::optional<DerivedRates> RateDeriver::update(const std::optional<NetworkCounters>& counters,
                                                TimePoint timestamp)
{
    diagnostics_ = RateDiagnostics{};

    if (!counters) {
        return std::nullopt;
    }

    if (!last_counters_) {
        // Nothing to compare against yet
        diagnostics_.first_tick = true;
        last_rates_ = DerivedRates{};
    } else {
        double elapsed = std::chrono::duration<double>(timestamp - last_timestamp_).count();
        RateDerivation derivation = derive(*last_counters_, *counters, elapsed, last_rates_);
        last_rates_ = derivation.rates;
        diagnostics_ = derivation.diagnostics;

        if (diagnostics_.clock_anomaly) {
            Log::warn("Clock did not advance between samples (elapsed ", elapsed,
                      "s); reusing previous network rates");
        } else if (diagnostics_.any_reset()) {
            Log::debug("Network counter decreased (reset or wraparound); rate clamped to 0",
                       diagnostics_.bytes_sent_reset ? " [bytes_sent]" : "",
                       diagnostics_.bytes_recv_reset ? " [bytes_recv]" : "",
                       diagnostics_.packets_sent_reset ? " [packets_sent]" : "",
                       diagnostics_.packets_recv_reset ? " [packets_recv]" : "");
        }
    }

    // Rebase on the newest reading, including after a clock anomaly
    last_counters_ = counters;
    last_timestamp_ = timestamp;
    return last_rates_;
}

void RateDeriver::reset() {
    last_counters_.reset();
    last_timestamp_ = TimePoint{};
    last_rates_ = DerivedRates{};
    diagnostics_ = RateDiagnostics{};
}

} // namespace vitalmon
