#include "vitalmon/dispatcher.hpp"
#include "vitalmon/log.hpp"
#include <algorithm>
#include <condition_variable>
#include <deque>
#include <thread>

namespace vitalmon {

class Dispatcher::Channel {
public:
    Channel(std::shared_ptr<TickConsumer> consumer, const DispatcherOptions& options)
        : consumer_(std::move(consumer))
        , name_(consumer_->name())
        , options_(options)
    {
        thread_ = std::thread(&Channel::run, this);
    }

    ~Channel() {
        request_stop();
        join();
    }

    void enqueue(TickPtr tick) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_ || failed_) {
                return;
            }
            queue_.push_back(std::move(tick));
            if (queue_.size() >= options_.backlog_warning && !backlog_warned_) {
                backlog_warned_ = true;
                Log::warn("Consumer '", name_, "' is ", queue_.size(), " ticks behind");
            }
        }
        cv_.notify_one();
    }

    void request_stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
            queue_.clear();
        }
        cv_.notify_all();
        idle_cv_.notify_all();
    }

    void join() {
        if (!thread_.joinable()) {
            return;
        }
        if (thread_.get_id() == std::this_thread::get_id()) {
            thread_.detach();
        } else {
            thread_.join();
        }
    }

    bool wait_idle(std::chrono::steady_clock::time_point deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        return idle_cv_.wait_until(lock, deadline, [this] {
            return (queue_.empty() && !delivering_) || failed_ || stopping_;
        });
    }

    void set_options(const DispatcherOptions& options) {
        std::lock_guard<std::mutex> lock(mutex_);
        options_ = options;
    }

    bool failed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return failed_;
    }

    bool on_own_thread() const {
        return thread_.get_id() == std::this_thread::get_id();
    }

    const std::shared_ptr<TickConsumer>& consumer() const { return consumer_; }

    // The delivery thread has left run(); joining it will not block
    bool exited() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return exited_;
    }

private:
    void run() {
        deliver_loop();
        std::lock_guard<std::mutex> lock(mutex_);
        exited_ = true;
    }

    void deliver_loop() {
        while (true) {
            TickPtr tick;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
                if (stopping_) {
                    return;
                }
                tick = std::move(queue_.front());
                queue_.pop_front();
                delivering_ = true;
                if (queue_.empty()) {
                    backlog_warned_ = false;
                }
            }

            bool delivered = deliver(*tick);

            bool give_up = false;
            int failures = 0;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                delivering_ = false;
                consecutive_failures_ = delivered ? 0 : consecutive_failures_ + 1;
                failures = consecutive_failures_;
                if (options_.max_consecutive_failures > 0 &&
                    consecutive_failures_ >= options_.max_consecutive_failures) {
                    failed_ = true;
                    give_up = true;
                    queue_.clear();
                }
            }
            idle_cv_.notify_all();

            if (give_up) {
                Log::error("Consumer '", name_, "' failed ", failures,
                           " consecutive ticks; unregistering it");
                return;
            }
        }
    }

    bool deliver(const TickResult& tick) {
        try {
            consumer_->on_tick(tick);
            return true;
        } catch (const std::exception& e) {
            Log::error("Consumer '", name_, "' failed on tick ", tick.sequence, ": ", e.what());
        } catch (...) {
            Log::error("Consumer '", name_, "' failed on tick ", tick.sequence, ": unknown exception");
        }
        return false;
    }

    std::shared_ptr<TickConsumer> consumer_;
    std::string name_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<TickPtr> queue_;
    DispatcherOptions options_;
    bool stopping_ = false;
    bool delivering_ = false;
    bool failed_ = false;
    bool exited_ = false;
    bool backlog_warned_ = false;
    int consecutive_failures_ = 0;

    std::thread thread_;
};

Dispatcher::Dispatcher(const DispatcherOptions& options)
    : options_(options)
{
}

Dispatcher::~Dispatcher() {
    std::vector<std::shared_ptr<Channel>> channels;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channels = std::move(channels_);
        for (auto& channel : retired_) {
            channels.push_back(std::move(channel));
        }
        channels_.clear();
        retired_.clear();
    }
    // Channel destructors stop and join
    channels.clear();
}

void Dispatcher::register_consumer(std::shared_ptr<TickConsumer> consumer) {
    if (!consumer) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    Log::debug("Registering consumer '", consumer->name(), "'");
    channels_.push_back(std::make_shared<Channel>(std::move(consumer), options_));
}

bool Dispatcher::unregister_consumer(const std::shared_ptr<TickConsumer>& consumer) {
    std::shared_ptr<Channel> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(channels_.begin(), channels_.end(),
                               [&](const std::shared_ptr<Channel>& c) { return c->consumer() == consumer; });
        if (it == channels_.end()) {
            return false;
        }
        removed = std::move(*it);
        channels_.erase(it);
        removed->request_stop();

        // A consumer removing itself cannot join its own thread
        if (removed->on_own_thread()) {
            retired_.push_back(std::move(removed));
            return true;
        }
    }
    // Join outside the lock; the consumer may be calling into us
    removed.reset();
    return true;
}

std::vector<std::shared_ptr<Dispatcher::Channel>> Dispatcher::reap_locked() {
    std::vector<std::shared_ptr<Channel>> finished;
    for (auto it = channels_.begin(); it != channels_.end();) {
        if ((*it)->failed()) {
            retired_.push_back(std::move(*it));
            it = channels_.erase(it);
        } else {
            ++it;
        }
    }
    // Only channels whose thread already left; a consumer that removed itself
    // may still be inside on_tick
    for (auto it = retired_.begin(); it != retired_.end();) {
        if ((*it)->exited()) {
            finished.push_back(std::move(*it));
            it = retired_.erase(it);
        } else {
            ++it;
        }
    }
    return finished;
}

void Dispatcher::dispatch(TickPtr tick) {
    std::vector<std::shared_ptr<Channel>> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished = reap_locked();
        for (auto& channel : channels_) {
            channel->enqueue(tick);
        }
    }
    // Joined here, outside the lock
}

bool Dispatcher::flush(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::vector<std::shared_ptr<Channel>> channels;
    std::vector<std::shared_ptr<Channel>> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished = reap_locked();
        channels = channels_;
    }
    bool idle = true;
    for (const auto& channel : channels) {
        idle = channel->wait_idle(deadline) && idle;
    }
    return idle;
}

size_t Dispatcher::consumer_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(channels_.begin(), channels_.end(),
                                             [](const std::shared_ptr<Channel>& c) { return !c->failed(); }));
}

void Dispatcher::set_options(const DispatcherOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);
    options_ = options;
    for (auto& channel : channels_) {
        channel->set_options(options);
    }
}

} // namespace vitalmon
