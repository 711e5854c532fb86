#include "vitalmon/engine.hpp"
#include "vitalmon/log.hpp"
#include <algorithm>
#include <limits>

namespace vitalmon {

namespace {

constexpr double kUnknown = std::numeric_limits<double>::quiet_NaN();

} // namespace

EngineOptions EngineOptions::from_config(const VitalmonConfig& config) {
    EngineOptions options;
    options.sampler.interval_seconds = config.interval_seconds;
    options.sampler.provider_timeout_seconds = config.provider_timeout_seconds;
    options.history_capacity = static_cast<size_t>(config.history_capacity);
    options.thresholds = config.alerts.threshold_map();
    options.dispatcher.max_consecutive_failures = config.dispatcher.max_consecutive_failures;
    options.dispatcher.backlog_warning = static_cast<size_t>(config.dispatcher.backlog_warning);
    return options;
}

MetricsEngine::MetricsEngine(MetricsProvider& provider, const EngineOptions& options)
    : sampler_(provider, options.sampler)
    , dispatcher_(options.dispatcher)
    , history_(options.history_capacity)
    , timestamps_(options.history_capacity)
    , alerts_(options.thresholds)
{
}

MetricsEngine::~MetricsEngine() {
    stop();
}

bool MetricsEngine::start() {
    if (running_.exchange(true)) {
        return false;
    }
    if (thread_.joinable()) {
        // Previous loop ended on its own
        thread_.join();
    }
    stop_.clear();
    thread_ = std::thread(&MetricsEngine::loop, this);
    return true;
}

void MetricsEngine::stop() {
    stop_.raise();
    if (thread_.joinable()) {
        thread_.join();
    }
    running_ = false;
}

void MetricsEngine::loop() {
    Log::debug("Sampling loop started, interval ", sampler_.interval_seconds(), "s");
    try {
        sampler_.run(stop_, [this](const Sample& current, const Sample* previous) {
            on_sample(current, previous);
        });
    } catch (const std::exception& e) {
        Log::error("Sampling loop terminated: ", e.what());
    }
    running_ = false;
    Log::debug("Sampling loop stopped");
}

void MetricsEngine::on_sample(const Sample& current, const Sample* previous) {
    if (!previous) {
        // First tick of this run; rates restart from zero
        std::lock_guard<std::mutex> lock(state_mutex_);
        rate_deriver_.reset();
    }
    publish(current);
}

TickPtr MetricsEngine::tick_once(TimePoint now) {
    if (running_) {
        Log::warn("tick_once ignored while the sampling thread is running");
        return nullptr;
    }
    return publish(sampler_.acquire(now));
}

TickPtr MetricsEngine::process(const Sample& sample) {
    if (running_) {
        Log::warn("process ignored while the sampling thread is running");
        return nullptr;
    }
    return publish(sample);
}

// Called from one thread at a time (the sampling loop, or the owner while it
// is stopped), so dispatch order matches sequence order
TickPtr MetricsEngine::publish(const Sample& sample) {
    auto result = std::make_shared<TickResult>();
    result->sample = sample;
    result->boot_time = sampler_.boot_time();

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        result->sequence = ++sequence_;

        result->rates = rate_deriver_.update(sample.network_counters, sample.timestamp);
        result->rate_diagnostics = rate_deriver_.last_diagnostics();

        // One point per series per tick keeps every series aligned with timestamps
        timestamps_.push(sample.timestamp);
        size_t cores = sample.cpu_per_core ? sample.cpu_per_core->size() : 0;
        core_count_ = std::max(core_count_, cores);
        for (size_t i = 0; i < core_count_; ++i) {
            history_.push(series::cpu_core(i), i < cores ? (*sample.cpu_per_core)[i] : kUnknown);
        }
        history_.push(series::kMemoryPercent, sample.memory ? sample.memory->percent : kUnknown);
        history_.push(series::kNetSent, result->rates ? result->rates->bytes_sent_per_sec : kUnknown);
        history_.push(series::kNetRecv, result->rates ? result->rates->bytes_recv_per_sec : kUnknown);

        result->alert_events = alerts_.evaluate_sample(sample);
        result->alert_states = alerts_.statuses();
        result->history = snapshot_locked();
    }

    for (const auto& event : result->alert_events) {
        if (event.kind == AlertEventKind::Raised) {
            Log::warn("Alert raised: ", event.message());
        } else {
            Log::info("Alert cleared: ", event.message());
        }
    }

    TickPtr tick = result;
    dispatcher_.dispatch(tick);
    return tick;
}

void MetricsEngine::register_consumer(std::shared_ptr<TickConsumer> consumer) {
    dispatcher_.register_consumer(std::move(consumer));
}

bool MetricsEngine::unregister_consumer(const std::shared_ptr<TickConsumer>& consumer) {
    return dispatcher_.unregister_consumer(consumer);
}

void MetricsEngine::reset_history() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    history_.reset_all();
    timestamps_.clear();
    Log::info("History reset");
}

SeriesSnapshot MetricsEngine::snapshot_locked() const {
    SeriesSnapshot snapshot;
    snapshot.timestamps = timestamps_.snapshot();
    for (size_t i = 0; i < core_count_; ++i) {
        snapshot.cpu_series[i] = history_.snapshot(series::cpu_core(i));
    }
    snapshot.memory_series = history_.snapshot(series::kMemoryPercent);
    snapshot.network_series.sent = history_.snapshot(series::kNetSent);
    snapshot.network_series.received = history_.snapshot(series::kNetRecv);
    return snapshot;
}

SeriesSnapshot MetricsEngine::snapshot() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return snapshot_locked();
}

std::vector<AlertStatus> MetricsEngine::alert_statuses() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return alerts_.statuses();
}

void MetricsEngine::set_interval(double seconds) {
    sampler_.set_interval(seconds);
}

void MetricsEngine::set_history_capacity(size_t capacity) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    history_.set_capacity(capacity);
    timestamps_.set_capacity(capacity);
}

void MetricsEngine::set_thresholds(const std::map<std::string, ThresholdConfig>& thresholds) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    alerts_.update_thresholds(thresholds);
}

void MetricsEngine::apply_config(const VitalmonConfig& config) {
    EngineOptions options = EngineOptions::from_config(config);
    sampler_.set_interval(options.sampler.interval_seconds);
    sampler_.set_provider_timeout(options.sampler.provider_timeout_seconds);
    set_history_capacity(options.history_capacity);
    set_thresholds(options.thresholds);
    dispatcher_.set_options(options.dispatcher);
}

} // namespace vitalmon
