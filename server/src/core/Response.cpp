#include "core/Response.hpp"

#include <utility>

Response::Response(int status, std::string text)
    : statusCode(status), statusText(reasonPhrase(status)), body(std::move(text)) {
    headers["Content-Type"] = "text/plain";
}

std::string Response::build(bool includeBody) const {
    std::string res;

    res += "HTTP/1.1 " + std::to_string(statusCode) + " " + statusText + "\r\n";

    if (headers.find("Content-Length") == headers.end()) {
        res += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    }

    for (const auto& h : headers) {
        res += h.first + ": " + h.second + "\r\n";
    }

    res += "\r\n";
    if (includeBody) res += body;

    return res;
}

const char* Response::reasonPhrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 206: return "Partial Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 410: return "Gone";
        case 413: return "Payload Too Large";
        case 431: return "Request Header Fields Too Large";
        case 499: return "Client Closed Request";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default:  return status < 400 ? "OK" : "Error";
    }
}
