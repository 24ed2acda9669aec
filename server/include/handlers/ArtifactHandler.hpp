#pragma once
#include <string>
#include <vector>

class FetchClient;
class Logger;
class RequestContext;
class ResponseWriter;

// GET/HEAD on an artifact path: asks each origin in turn and streams the
// first successful answer back. 404 from every origin gives 404; any other
// upstream failure gives 502 (504 on timeouts).
class ArtifactHandler {
public:
    ArtifactHandler(FetchClient& client, std::vector<std::string> origins, const Logger& downloadLog);

    void operator()(RequestContext& ctx, ResponseWriter& writer) const;

    // rejects empty paths and "." / ".." segments
    static bool safePath(const std::string& path);

    static std::string originUrl(const std::string& origin, const std::string& path);

private:
    // true when the request was answered (or the client is gone)
    bool tryOrigin(const std::string& origin, const std::string& path,
                   RequestContext& ctx, ResponseWriter& writer, int& failureStatus) const;

    FetchClient& client_;
    std::vector<std::string> origins_;
    const Logger& log_;
};
