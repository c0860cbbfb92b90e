#include "lifecycle/LifecycleScheduler.h"

#include <boost/asio/error.hpp>

#include <utility>

namespace signalrelay::lifecycle {

LifecycleScheduler::LifecycleScheduler(boost::asio::any_io_executor executor, Callback callback)
    : state_(std::make_shared<State>(std::move(executor))) {
    state_->callback = std::move(callback);
}

LifecycleScheduler::~LifecycleScheduler() {
    std::lock_guard<std::mutex> lk(state_->mu);
    state_->callback = nullptr;
    state_->deadline.reset();
    ++state_->generation;
    state_->timer.cancel();
}

void LifecycleScheduler::set_callback(Callback callback) {
    std::lock_guard<std::mutex> lk(state_->mu);
    state_->callback = std::move(callback);
}

void LifecycleScheduler::reschedule(Clock::time_point deadline) {
    std::lock_guard<std::mutex> lk(state_->mu);
    arm_locked_(state_, deadline);
}

void LifecycleScheduler::tighten(Clock::time_point deadline) {
    std::lock_guard<std::mutex> lk(state_->mu);
    if (state_->deadline && *state_->deadline <= deadline) return;
    arm_locked_(state_, deadline);
}

void LifecycleScheduler::cancel() {
    std::lock_guard<std::mutex> lk(state_->mu);
    state_->deadline.reset();
    ++state_->generation;
    state_->timer.cancel();
}

std::optional<LifecycleScheduler::Clock::time_point> LifecycleScheduler::deadline() const {
    std::lock_guard<std::mutex> lk(state_->mu);
    return state_->deadline;
}

void LifecycleScheduler::arm_locked_(const std::shared_ptr<State>& state, Clock::time_point deadline) {
    const std::uint64_t generation = ++state->generation;
    state->deadline = deadline;

    // expires_at() cancels the previous wait; its handler sees a stale generation.
    state->timer.expires_at(deadline);
    state->timer.async_wait([state, generation](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) return;
        fire_(state, generation);
    });
}

void LifecycleScheduler::fire_(const std::shared_ptr<State>& state, std::uint64_t generation) {
    Callback callback;
    {
        std::lock_guard<std::mutex> lk(state->mu);
        if (generation != state->generation || !state->deadline) return;
        state->deadline.reset();
        callback = state->callback;
    }
    if (callback) callback();
}

} // namespace signalrelay::lifecycle
