#pragma once

#include <chrono>
#include <type_traits>
#include <utility>

namespace strmatch {

using Duration = std::chrono::nanoseconds;

class Timer {
private:
    std::chrono::steady_clock::time_point start_time_;
    Duration elapsed_ = Duration::zero();
    bool running_ = false;

public:
    void start() {
        start_time_ = std::chrono::steady_clock::now();
        running_ = true;
    }

    void stop() {
        if (!running_) return;
        elapsed_ = std::chrono::duration_cast<Duration>(
            std::chrono::steady_clock::now() - start_time_);
        running_ = false;
    }

    // Time since start() while running, otherwise the last measured interval.
    Duration get_elapsed() const {
        if (running_) {
            return std::chrono::duration_cast<Duration>(
                std::chrono::steady_clock::now() - start_time_);
        }
        return elapsed_;
    }

    double elapsed_seconds() const {
        return std::chrono::duration<double>(get_elapsed()).count();
    }

    bool is_running() const { return running_; }
};

// Starts the timer on construction, stops it on destruction.
class ScopedTimer {
private:
    Timer& timer_;

public:
    explicit ScopedTimer(Timer& timer) : timer_(timer) {
        timer_.start();
    }

    ~ScopedTimer() {
        timer_.stop();
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;
};

template<typename T>
struct Timed {
    T value;
    double elapsed_seconds;
};

/**
 * Run fn() under a ScopedTimer and return its value with the wall time it took.
 * Every trace step is measured through this helper, which keeps the clock
 * out of the matching loops themselves.
 */
template<typename Fn>
auto time_call(Fn&& fn) -> Timed<std::invoke_result_t<Fn>> {
    Timer timer;
    std::invoke_result_t<Fn> value = [&] {
        ScopedTimer scope(timer);
        return std::forward<Fn>(fn)();
    }();
    return {std::move(value), timer.elapsed_seconds()};
}

} // namespace strmatch
