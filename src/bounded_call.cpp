#include "vitalmon/bounded_call.hpp"

namespace vitalmon {

BoundedCaller::BoundedCaller()
    : state_(std::make_shared<State>())
    , worker_(&BoundedCaller::worker_loop, state_)
{
}

BoundedCaller::~BoundedCaller() {
    bool stuck;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->stopping = true;
        stuck = state_->busy;
    }
    state_->cv.notify_all();
    if (!worker_.joinable()) {
        return;
    }
    // The worker holds its own reference to the state
    if (stuck) {
        worker_.detach();
    } else {
        worker_.join();
    }
}

bool BoundedCaller::busy() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->busy;
}

bool BoundedCaller::submit(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->busy || state_->stopping) {
            return false;
        }
        state_->pending = std::move(job);
        state_->busy = true;
    }
    state_->cv.notify_one();
    return true;
}

void BoundedCaller::worker_loop(std::shared_ptr<State> state) {
    std::unique_lock<std::mutex> lock(state->mutex);
    while (true) {
        state->cv.wait(lock, [&state] { return state->stopping || state->pending; });
        if (!state->pending) {
            return;
        }

        std::function<void()> job = std::move(state->pending);
        state->pending = nullptr;
        lock.unlock();
        // packaged_task stores any exception in its future
        job();
        job = nullptr;
        lock.lock();
        state->busy = false;
        if (state->stopping) {
            return;
        }
    }
}

} // namespace vitalmon
