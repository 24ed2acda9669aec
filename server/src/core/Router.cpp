#include "core/Router.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "core/RequestContext.hpp"
#include "core/Response.hpp"
#include "core/ResponseWriter.hpp"

std::string Router::routePath(const std::string& path) {
    std::string p = path.substr(0, path.find('?'));
    if (!p.empty() && p.front() == '/') p.erase(p.begin());
    return p;
}

bool HandlerRegistration::matchesPath(const std::string& path) const {
    return std::regex_search(path, regex);
}

void Router::add(const std::string& pattern, std::set<std::string> methods, int priority,
                 Handler handler, std::string description) {
    if (!handler) {
        throw std::invalid_argument("Router: empty handler for " + pattern + ", use addNotFound()");
    }
    if (methods.empty()) {
        throw std::invalid_argument("Router: no methods for " + pattern);
    }

    HandlerRegistration reg;
    reg.pattern = pattern;
    reg.regex = std::regex(pattern, std::regex::ECMAScript | std::regex::optimize);
    reg.methods = std::move(methods);
    reg.priority = priority;
    reg.handler = std::move(handler);
    reg.description = std::move(description);
    insert(std::move(reg));
}

void Router::addNotFound(const std::string& pattern, std::set<std::string> methods, int priority,
                         std::string description) {
    if (methods.empty()) {
        throw std::invalid_argument("Router: no methods for " + pattern);
    }

    HandlerRegistration reg;
    reg.pattern = pattern;
    reg.regex = std::regex(pattern, std::regex::ECMAScript | std::regex::optimize);
    reg.methods = std::move(methods);
    reg.priority = priority;
    reg.description = std::move(description);
    insert(std::move(reg));
}

void Router::insert(HandlerRegistration reg) {
    reg.order = nextOrder++;

    // after every entry with priority <= reg.priority: ties keep registration order
    auto pos = std::upper_bound(entries.begin(), entries.end(), reg.priority,
                                [](int priority, const HandlerRegistration& e) {
                                    return priority < e.priority;
                                });
    entries.insert(pos, std::move(reg));
}

const HandlerRegistration* Router::match(const std::string& method, const std::string& path) const {
    const std::string stripped = routePath(path);

    for (const auto& e : entries) {
        if (e.allows(method) && e.matchesPath(stripped)) {
            return &e;
        }
    }
    return nullptr;
}

bool Router::dispatch(RequestContext& ctx, ResponseWriter& writer) const {
    const Request& req = ctx.request();
    const HandlerRegistration* reg = match(req.method, req.path);
    if (!reg) return false;

    if (reg->notFound()) {
        writer.send(Response(404, "Not Found"));
        return true;
    }

    reg->handler(ctx, writer);
    return true;
}
