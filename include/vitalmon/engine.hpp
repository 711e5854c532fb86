#pragma once

#include "vitalmon/alert_engine.hpp"
#include "vitalmon/bounded_series.hpp"
#include "vitalmon/config_manager.hpp"
#include "vitalmon/dispatcher.hpp"
#include "vitalmon/history_buffer.hpp"
#include "vitalmon/metrics_provider.hpp"
#include "vitalmon/rate_deriver.hpp"
#include "vitalmon/sampler.hpp"
#include "vitalmon/stop_signal.hpp"
#include "vitalmon/tick.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace vitalmon {

struct EngineOptions {
    SamplerOptions sampler;
    size_t history_capacity = kDefaultHistoryCapacity;
    std::map<std::string, ThresholdConfig> thresholds = AlertConfig{}.threshold_map();
    DispatcherOptions dispatcher;

    static EngineOptions from_config(const VitalmonConfig& config);
};

// Provider -> Sampler -> Rate Deriver -> History Buffer -> Alerting -> Dispatcher.
// The sampling thread is the only writer of history and alert state; readers
// take consistent snapshots under the same lock.
class MetricsEngine {
public:
    MetricsEngine(MetricsProvider& provider, const EngineOptions& options = {});
    ~MetricsEngine();

    MetricsEngine(const MetricsEngine&) = delete;
    MetricsEngine& operator=(const MetricsEngine&) = delete;

    // Spawn the sampling thread; false if already running
    bool start();

    // Returns once the sampling thread has exited (at most one interval plus
    // the provider timeout)
    void stop();

    bool running() const { return running_; }

    // Collect and process one tick on the calling thread. Not available while
    // the sampling thread runs.
    TickPtr tick_once(TimePoint now);

    // Fold an already collected Sample through the pipeline and dispatch it.
    // Returns null while the sampling thread runs, like tick_once.
    TickPtr process(const Sample& sample);

    void register_consumer(std::shared_ptr<TickConsumer> consumer);
    bool unregister_consumer(const std::shared_ptr<TickConsumer>& consumer);

    // "Reset graphs": every series becomes empty; alert state is kept
    void reset_history();

    SeriesSnapshot snapshot() const;
    std::vector<AlertStatus> alert_statuses() const;

    // Run-time reconfiguration
    void set_interval(double seconds);
    void set_history_capacity(size_t capacity);
    void set_thresholds(const std::map<std::string, ThresholdConfig>& thresholds);
    void apply_config(const VitalmonConfig& config);

    Dispatcher& dispatcher() { return dispatcher_; }
    double interval_seconds() const { return sampler_.interval_seconds(); }

private:
    void loop();
    void on_sample(const Sample& current, const Sample* previous);
    TickPtr publish(const Sample& sample);
    SeriesSnapshot snapshot_locked() const;

    Sampler sampler_;
    Dispatcher dispatcher_;

    mutable std::mutex state_mutex_;
    RateDeriver rate_deriver_;
    HistoryBuffer history_;
    BoundedSeries<TimePoint> timestamps_;
    AlertEngine alerts_;
    size_t core_count_ = 0;
    uint64_t sequence_ = 0;

    StopSignal stop_;
    std::thread thread_;
    std::atomic<bool> running_{false};
};

} // namespace vitalmon
