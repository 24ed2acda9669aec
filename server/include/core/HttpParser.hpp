#pragma once
#include <string>

#include "core/Request.hpp"

class HttpParser {
public:
    // Fills method, path, version, headers and body. Never throws; check
    // valid() before routing.
    static Request parse(const std::string& raw);

    // request line present, path absolute, version HTTP/1.x
    static bool valid(const Request& req);
};
