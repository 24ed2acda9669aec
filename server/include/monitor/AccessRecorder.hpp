#pragma once

class Logger;
class RequestContext;

// Access log: one "request" record per completed request on the access
// channel, at debug level.
class AccessRecorder {
public:
    explicit AccessRecorder(const Logger& logger);

    // Runs before the router; reserved for pre-dispatch instrumentation.
    void onBeforeDispatch(const RequestContext& ctx);

    // Emits the record on the first call for ctx; later calls return false.
    bool onComplete(RequestContext& ctx, int status);

private:
    const Logger& accessLog;
};
