#pragma once
#include <atomic>
#include <utility>

#include "core/Request.hpp"

// Nginx convention for "client went away before the response was finished".
constexpr int kStatusClientClosed = 499;

// Per-request mutable state next to the immutable Request.
class RequestContext {
public:
    explicit RequestContext(Request request) : req(std::move(request)) {}

    RequestContext(const RequestContext&) = delete;
    RequestContext& operator=(const RequestContext&) = delete;

    const Request& request() const { return req; }

    // true for exactly one caller
    bool markCompleted() { return !completedFlag.exchange(true, std::memory_order_acq_rel); }
    bool completed() const { return completedFlag.load(std::memory_order_acquire); }

    void markClientClosed() { closedFlag.store(true, std::memory_order_release); }
    bool clientClosed() const { return closedFlag.load(std::memory_order_acquire); }

private:
    const Request req;
    std::atomic<bool> completedFlag{false};
    std::atomic<bool> closedFlag{false};
};
