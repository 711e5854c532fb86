#include "vitalmon/sampler.hpp"
#include "vitalmon/log.hpp"
#include <algorithm>

namespace vitalmon {

Sampler::Sampler(MetricsProvider& provider, const SamplerOptions& options)
    : provider_(provider)
    , options_(options)
{
    options_.interval_seconds = std::max(options_.interval_seconds, kMinIntervalSeconds);
}

void Sampler::set_interval(double seconds) {
    std::lock_guard<std::mutex> lock(options_mutex_);
    options_.interval_seconds = std::max(seconds, kMinIntervalSeconds);
}

void Sampler::set_provider_timeout(double seconds) {
    std::lock_guard<std::mutex> lock(options_mutex_);
    options_.provider_timeout_seconds = seconds;
}

double Sampler::interval_seconds() const {
    std::lock_guard<std::mutex> lock(options_mutex_);
    return options_.interval_seconds;
}

std::optional<TimePoint> Sampler::boot_time() const {
    return boot_time_;
}

void Sampler::mark_degraded(const char* category, const std::string& reason) {
    // Warn on the transition only; repeats go to debug
    if (degraded_.insert(category).second) {
        Log::warn("Metric category '", category, "' unavailable: ", reason);
    } else {
        Log::debug("Metric category '", category, "' still unavailable: ", reason);
    }
}

void Sampler::mark_recovered(const char* category) {
    if (degraded_.erase(category) > 0) {
        Log::info("Metric category '", category, "' recovered");
    }
}

template<typename Fn>
auto Sampler::launch(const char* category, BoundedCaller& caller, Fn fn)
    -> std::future<decltype(fn())>
{
    try {
        return caller.start(std::move(fn));
    } catch (const ProviderError& e) {
        mark_degraded(category, e.what());
    }
    // Invalid future: nothing to wait for this tick
    return {};
}

template<typename Result>
std::optional<Result> Sampler::finish(const char* category, std::future<Result>& pending,
                                      BoundedCaller::Deadline deadline)
{
    if (!pending.valid()) {
        return std::nullopt;
    }
    try {
        auto value = BoundedCaller::await(pending, deadline);
        mark_recovered(category);
        return value;
    } catch (const ProviderError& e) {
        mark_degraded(category, e.what());
    } catch (const std::exception& e) {
        // Parse errors and the like inside a provider count as unavailable
        mark_degraded(category, e.what());
    }
    return std::nullopt;
}

Sample Sampler::acquire(TimePoint now) {
    double timeout_seconds;
    {
        std::lock_guard<std::mutex> lock(options_mutex_);
        timeout_seconds = std::min(options_.provider_timeout_seconds, options_.interval_seconds);
    }
    auto deadline = std::chrono::steady_clock::now() +
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(timeout_seconds));

    // Jobs capture the provider, not this: an abandoned worker may outlive the sampler
    MetricsProvider& provider = provider_;
    std::future<TimePoint> boot;
    if (!boot_time_) {
        boot = launch("boot_time", boot_caller_, [&provider] { return provider.boot_time(); });
    }
    auto cpu = launch("cpu", cpu_caller_, [&provider] { return provider.sample_cpu_per_core(); });
    auto memory = launch("memory", memory_caller_, [&provider] { return provider.sample_memory(); });
    auto disks = launch("disk", disk_caller_, [&provider] { return provider.sample_disks(); });
    auto network = launch("network", network_caller_, [&provider] { return provider.sample_network_counters(); });

    Sample sample;
    sample.timestamp = now;

    if (!boot_time_) {
        boot_time_ = finish("boot_time", boot, deadline);
    }
    sample.cpu_per_core = finish("cpu", cpu, deadline);
    sample.memory = finish("memory", memory, deadline);
    sample.disks = finish("disk", disks, deadline);
    sample.network_counters = finish("network", network, deadline);

    if (sample.disks) {
        std::sort(sample.disks->begin(), sample.disks->end(),
                  [](const DiskReading& a, const DiskReading& b) { return a.mount_path < b.mount_path; });
    }

    return sample;
}

void Sampler::run(const StopSignal& stop, const SampleHandler& handler) {
    while (!stop.is_raised()) {
        auto tick_start = std::chrono::steady_clock::now();

        Sample current = acquire(Clock::now());
        handler(current, previous_ ? &*previous_ : nullptr);
        previous_ = std::move(current);

        // Sleep until next tick
        auto interval = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(interval_seconds()));
        auto remaining = interval - (std::chrono::steady_clock::now() - tick_start);
        if (remaining.count() > 0 && stop.wait_for(remaining)) {
            break;
        }
    }
    previous_.reset();
}

} // namespace vitalmon
