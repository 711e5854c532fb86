#pragma once

#include "vitalmon/tick.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace vitalmon {

using TickPtr = std::shared_ptr<const TickResult>;

// Anything that renders, exports or forwards completed ticks
class TickConsumer {
public:
    virtual ~TickConsumer() = default;

    virtual std::string name() const = 0;

    // Called once per tick, in tick order, never concurrently with itself.
    // Exceptions are caught and logged by the dispatcher.
    virtual void on_tick(const TickResult& tick) = 0;
};

struct DispatcherOptions {
    int max_consecutive_failures = 5;    // 0 = never unregister
    size_t backlog_warning = 32;
};

// Delivers every tick to every registered consumer. Each consumer has its own
// FIFO and delivery thread, so a slow or throwing consumer delays nobody but
// itself. Ticks are neither reordered nor coalesced.
class Dispatcher {
public:
    explicit Dispatcher(const DispatcherOptions& options = {});
    // Pending ticks are discarded; in-flight on_tick calls are waited for
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    void register_consumer(std::shared_ptr<TickConsumer> consumer);

    // Safe to call from the consumer's own on_tick
    bool unregister_consumer(const std::shared_ptr<TickConsumer>& consumer);

    // Never blocks on consumer processing, including a consumer that removed
    // itself and is still inside on_tick
    void dispatch(TickPtr tick);

    // Wait until every consumer has processed everything queued so far
    bool flush(std::chrono::milliseconds timeout);

    // Consumers still receiving ticks (excludes ones dropped for failing)
    size_t consumer_count() const;

    void set_options(const DispatcherOptions& options);

private:
    class Channel;

    // Moves failed channels to retired_ and hands back the retired ones whose
    // thread has already exited, for joining without the lock
    std::vector<std::shared_ptr<Channel>> reap_locked();

    mutable std::mutex mutex_;
    DispatcherOptions options_;
    std::vector<std::shared_ptr<Channel>> channels_;
    std::vector<std::shared_ptr<Channel>> retired_;
};

} // namespace vitalmon
