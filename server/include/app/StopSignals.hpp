#pragma once
#include <signal.h>

#include <atomic>
#include <functional>
#include <thread>

// SIGINT/SIGTERM handling for the process. The constructor blocks both in
// the calling thread, so it must run before any other thread starts; a
// waiter thread then takes them with sigwait. Construct and destroy on the
// same thread.
class StopSignals {
public:
    StopSignals();
    ~StopSignals();

    StopSignals(const StopSignals&) = delete;
    StopSignals& operator=(const StopSignals&) = delete;

    // Starts the waiter. onSignal runs on it at most once.
    void watch(std::function<void(int)> onSignal);

    // Wakes and joins the waiter whether or not a signal came. Idempotent.
    void release();

    // 0 until a real stop signal arrived
    int received() const { return received_.load(); }

private:
    sigset_t stopSet_;
    sigset_t previousMask_;
    std::thread waiter_;
    std::atomic<bool> released_{false};
    std::atomic<int> received_{0};
};
