#pragma once
#include <cstddef>
#include <functional>
#include <regex>
#include <set>
#include <string>
#include <vector>

class RequestContext;
class ResponseWriter;

using Handler = std::function<void(RequestContext&, ResponseWriter&)>;

struct HandlerRegistration {
    std::string pattern;
    std::regex regex;
    std::set<std::string> methods;
    int priority = 0;
    std::size_t order = 0;   // registration sequence, breaks priority ties
    Handler handler;         // empty: answer 404 without running anything
    std::string description;

    bool allows(const std::string& method) const { return methods.count(method) != 0; }
    bool matchesPath(const std::string& path) const;
    bool notFound() const { return !handler; }
};

// Ordered handler table. Lowest priority value is tried first, equal
// priorities in registration order; the first registration whose method set
// and path pattern both match wins. Patterns are ECMAScript regexes searched
// in the path without its leading slash and query string.
class Router {
public:
    // throws std::regex_error for a bad pattern, std::invalid_argument for
    // an empty handler or method set
    void add(const std::string& pattern, std::set<std::string> methods, int priority,
             Handler handler, std::string description = "");

    // well-known path that always answers 404
    void addNotFound(const std::string& pattern, std::set<std::string> methods, int priority,
                     std::string description = "");

    const HandlerRegistration* match(const std::string& method, const std::string& path) const;

    // false on a routing miss; handler exceptions propagate
    bool dispatch(RequestContext& ctx, ResponseWriter& writer) const;

    // "/a/b?x=1" -> "a/b"
    static std::string routePath(const std::string& path);

    std::size_t size() const { return entries.size(); }
    const std::vector<HandlerRegistration>& registrations() const { return entries; }

private:
    void insert(HandlerRegistration reg);

    std::vector<HandlerRegistration> entries;
    std::size_t nextOrder = 0;
};
