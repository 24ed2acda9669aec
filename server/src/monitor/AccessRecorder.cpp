#include "monitor/AccessRecorder.hpp"

#include "core/RequestContext.hpp"
#include "monitor/Logger.hpp"

AccessRecorder::AccessRecorder(const Logger& logger) : accessLog(logger) {}

void AccessRecorder::onBeforeDispatch(const RequestContext& /*ctx*/) {}

bool AccessRecorder::onComplete(RequestContext& ctx, int status) {
    if (!ctx.markCompleted()) {
        return false;
    }

    const Request& req = ctx.request();
    accessLog.debug("request")
        .add("id", req.id.str())
        .add("method", req.method)
        .add("address", req.remoteAddress)
        .add("path", req.path)
        .add("status", status)
        .add("dur", req.elapsedMs());
    return true;
}
