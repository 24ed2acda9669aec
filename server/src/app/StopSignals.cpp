#include "app/StopSignals.hpp"

#include <pthread.h>

#include <system_error>
#include <utility>

StopSignals::StopSignals() {
    sigemptyset(&stopSet_);
    sigaddset(&stopSet_, SIGINT);
    sigaddset(&stopSet_, SIGTERM);

    int rc = pthread_sigmask(SIG_BLOCK, &stopSet_, &previousMask_);
    if (rc != 0) {
        throw std::system_error(rc, std::generic_category(), "pthread_sigmask");
    }
}

StopSignals::~StopSignals() {
    release();
    pthread_sigmask(SIG_SETMASK, &previousMask_, nullptr);
}

void StopSignals::watch(std::function<void(int)> onSignal) {
    if (waiter_.joinable() || released_) return;

    waiter_ = std::thread([this, onSignal = std::move(onSignal)]() {
        int sig = 0;
        if (sigwait(&stopSet_, &sig) != 0) return;
        // our own wake-up from release()
        if (released_) return;

        received_ = sig;
        if (onSignal) onSignal(sig);
    });
}

void StopSignals::release() {
    if (released_.exchange(true)) return;
    if (!waiter_.joinable()) return;

    // SIGTERM stays blocked everywhere, so this only wakes the sigwait
    pthread_kill(waiter_.native_handle(), SIGTERM);
    waiter_.join();
}
