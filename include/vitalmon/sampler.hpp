#pragma once

#include "vitalmon/bounded_call.hpp"
#include "vitalmon/metrics_provider.hpp"
#include "vitalmon/sample.hpp"
#include "vitalmon/stop_signal.hpp"
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace vitalmon {

constexpr double kMinIntervalSeconds = 0.1;

struct SamplerOptions {
    double interval_seconds = 1.0;
    double provider_timeout_seconds = 0.5;
};

class Sampler {
public:
    // `previous` is null on the first tick
    using SampleHandler = std::function<void(const Sample& current, const Sample* previous)>;

    Sampler(MetricsProvider& provider, const SamplerOptions& options);

    // Collect one Sample now. Categories are read in parallel, each on its own
    // worker, all bounded by the same deadline. A failed or timed-out category
    // is left unknown; the others are unaffected. A category whose previous
    // call is still stuck stays unknown until that call returns.
    Sample acquire(TimePoint now);

    // Polling loop: one acquire per interval until `stop` is raised. The wait
    // between ticks wakes immediately on stop.
    void run(const StopSignal& stop, const SampleHandler& handler);

    // Takes effect from the next wait; clamped to kMinIntervalSeconds
    void set_interval(double seconds);
    void set_provider_timeout(double seconds);
    double interval_seconds() const;

    // Cached after the first successful read
    std::optional<TimePoint> boot_time() const;

private:
    template<typename Fn>
    auto launch(const char* category, BoundedCaller& caller, Fn fn)
        -> std::future<decltype(fn())>;

    template<typename Result>
    std::optional<Result> finish(const char* category, std::future<Result>& pending,
                                 BoundedCaller::Deadline deadline);

    void mark_degraded(const char* category, const std::string& reason);
    void mark_recovered(const char* category);

    MetricsProvider& provider_;

    // One worker per category so a stall in one never blocks the others
    BoundedCaller boot_caller_;
    BoundedCaller cpu_caller_;
    BoundedCaller memory_caller_;
    BoundedCaller disk_caller_;
    BoundedCaller network_caller_;

    mutable std::mutex options_mutex_;
    SamplerOptions options_;

    std::optional<Sample> previous_;
    std::optional<TimePoint> boot_time_;
    std::set<std::string> degraded_;
};

} // namespace vitalmon
