#pragma once
#include <string>
#include <unordered_map>

class Response {
public:
    int statusCode = 200;
    std::string statusText = "OK";

    std::unordered_map<std::string, std::string> headers;
    std::string body;

    Response() = default;
    Response(int status, std::string text);

    // Content-Length comes from the body unless a header already sets it
    // (HEAD relays the upstream length without a body).
    std::string build(bool includeBody = true) const;

    static const char* reasonPhrase(int status);
};
