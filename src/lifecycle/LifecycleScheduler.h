#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace signalrelay::lifecycle {

// One pending one-shot wake-up. Arming again replaces the pending deadline;
// a replaced or cancelled wake-up never reaches the callback.
//
// Safe to call from any thread. The callback runs on the executor, without
// any scheduler lock held, so it may re-arm or destroy the scheduler.
class LifecycleScheduler {
public:
    using Clock = std::chrono::steady_clock;
    using Callback = std::function<void()>;

    explicit LifecycleScheduler(boost::asio::any_io_executor executor, Callback callback = {});
    ~LifecycleScheduler();

    LifecycleScheduler(const LifecycleScheduler&) = delete;
    LifecycleScheduler& operator=(const LifecycleScheduler&) = delete;

    void set_callback(Callback callback);

    // Overwrite whatever is pending with `deadline`.
    void reschedule(Clock::time_point deadline);

    // Arm for `deadline` unless an earlier wake-up is already pending.
    void tighten(Clock::time_point deadline);

    void cancel();

    std::optional<Clock::time_point> deadline() const;
    bool pending() const { return deadline().has_value(); }

private:
    struct State {
        explicit State(boost::asio::any_io_executor ex) : timer(std::move(ex)) {}

        mutable std::mutex mu;
        boost::asio::steady_timer timer;
        Callback callback;
        std::optional<Clock::time_point> deadline;
        std::uint64_t generation = 0;
    };

    static void arm_locked_(const std::shared_ptr<State>& state, Clock::time_point deadline);
    static void fire_(const std::shared_ptr<State>& state, std::uint64_t generation);

    std::shared_ptr<State> state_;
};

} // namespace signalrelay::lifecycle
