#pragma once
#include <chrono>
#include <string>
#include <unordered_map>
#include <utility>

// Process-unique request identifier: "<process prefix>-<counter>", base 36.
class RequestId {
public:
    RequestId() = default;

    static RequestId next();

    const std::string& str() const { return value; }
    bool empty() const { return value.empty(); }

private:
    explicit RequestId(std::string v) : value(std::move(v)) {}

    std::string value;
};

class Request {
public:
    std::string method;
    std::string path;
    std::string version;

    std::unordered_map<std::string, std::string> headers;
    std::string body;

    std::string remoteAddress;
    RequestId id;
    std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();

    Request() = default;

    // header lookup ignoring case, empty when absent
    std::string header(const std::string& name) const;

    long long elapsedMs() const;
};
