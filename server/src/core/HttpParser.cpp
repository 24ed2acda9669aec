#include "core/HttpParser.hpp"
#include <algorithm>
#include <iterator>
#include <sstream>

static inline void trimCRLF(std::string& s) {
    while (!s.empty() && (s.back() == '\r' || s.back() == '\n')) {
        s.pop_back();
    }
}

static inline void trimSpaces(std::string& s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
        s.erase(s.begin());
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
        s.pop_back();
}

Request HttpParser::parse(const std::string& raw) {
    Request req;
    std::istringstream stream(raw);
    std::string line;

    // -------- Request line --------
    if (std::getline(stream, line)) {
        trimCRLF(line);

        std::istringstream firstLine(line);
        std::string extra;
        firstLine >> req.method >> req.path >> req.version;
        if (firstLine >> extra) {
            // more than three tokens: leave it to valid() to reject
            req.version.clear();
        }
    }

    // -------- Headers --------
    while (std::getline(stream, line)) {
        trimCRLF(line);

        if (line.empty()) break;

        auto colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string key = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        trimSpaces(key);
        trimSpaces(value);
        if (key.empty()) continue;

        // repeated fields fold into one comma separated value
        auto it = req.headers.find(key);
        if (it == req.headers.end()) {
            req.headers.emplace(std::move(key), std::move(value));
        } else {
            it->second += ", " + value;
        }
    }

    // -------- Body (whatever arrived with the head) --------
    req.body.assign(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());

    return req;
}

bool HttpParser::valid(const Request& req) {
    if (req.method.empty() || req.path.empty() || req.path.front() != '/') {
        return false;
    }
    for (char c : req.method) {
        if (c < 'A' || c > 'Z') return false;
    }
    return req.version == "HTTP/1.1" || req.version == "HTTP/1.0";
}
