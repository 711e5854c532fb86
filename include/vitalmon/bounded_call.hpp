#pragma once

#include "vitalmon/metrics_provider.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>

namespace vitalmon {

// Runs provider calls on a dedicated worker thread so the caller can give up
// on a call that stalls. At most one call is in flight; while a timed-out call
// is still running, new calls fail immediately with ProviderTimeout.
class BoundedCaller {
public:
    using Deadline = std::chrono::steady_clock::time_point;

    BoundedCaller();
    // Joins an idle worker. A worker still stuck in a call is abandoned and
    // exits on its own once the call returns.
    ~BoundedCaller();

    BoundedCaller(const BoundedCaller&) = delete;
    BoundedCaller& operator=(const BoundedCaller&) = delete;

    // Hand fn to the worker without waiting. Throws ProviderTimeout while a
    // previous call is still running.
    template<typename Fn>
    auto start(Fn fn) -> std::future<decltype(fn())> {
        using Result = decltype(fn());
        auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
        std::future<Result> result = task->get_future();

        if (!submit([task] { (*task)(); })) {
            throw ProviderTimeout("previous provider call is still running");
        }
        return result;
    }

    // Wait for a started call until deadline. Exceptions thrown by the call
    // are rethrown here.
    template<typename Result>
    static Result await(std::future<Result>& result, Deadline deadline) {
        if (result.wait_until(deadline) != std::future_status::ready) {
            throw ProviderTimeout("provider call exceeded its time bound");
        }
        return result.get();
    }

    template<typename Fn>
    auto call(Fn fn, Deadline deadline) -> decltype(fn()) {
        auto result = start(std::move(fn));
        return await(result, deadline);
    }

    bool busy() const;

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        std::function<void()> pending;
        bool busy = false;
        bool stopping = false;
    };

    bool submit(std::function<void()> job);
    static void worker_loop(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
    std::thread worker_;
};

} // namespace vitalmon
