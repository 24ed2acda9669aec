#include "handlers/ArtifactHandler.hpp"

#include <sstream>
#include <unordered_map>
#include <utility>

#include "core/RequestContext.hpp"
#include "core/Response.hpp"
#include "core/ResponseWriter.hpp"
#include "core/Router.hpp"
#include "fetch/FetchClient.hpp"
#include "monitor/Logger.hpp"

// upstream (lower-case) -> client header names worth passing on
static const std::pair<const char*, const char*> kRelayed[] = {
    {"content-type", "Content-Type"},
    {"last-modified", "Last-Modified"},
    {"etag", "ETag"},
};

static std::unordered_map<std::string, std::string> relayHeaders(const FetchHeaders& upstream) {
    std::unordered_map<std::string, std::string> out;
    for (const auto& r : kRelayed) {
        auto it = upstream.find(r.first);
        if (it != upstream.end()) out[r.second] = it->second;
    }
    if (out.find("Content-Type") == out.end()) {
        out["Content-Type"] = "application/octet-stream";
    }
    return out;
}

ArtifactHandler::ArtifactHandler(FetchClient& client, std::vector<std::string> origins,
                                 const Logger& downloadLog)
    : client_(client), origins_(std::move(origins)), log_(downloadLog) {}

bool ArtifactHandler::safePath(const std::string& path) {
    if (path.empty()) return false;

    std::istringstream in(path);
    std::string segment;
    while (std::getline(in, segment, '/')) {
        if (segment == "." || segment == "..") return false;
    }
    return path.find('\\') == std::string::npos;
}

std::string ArtifactHandler::originUrl(const std::string& origin, const std::string& path) {
    std::string base = origin;
    while (!base.empty() && base.back() == '/') base.pop_back();

    std::string rel = path;
    while (!rel.empty() && rel.front() == '/') rel.erase(rel.begin());

    return base + "/" + rel;
}

void ArtifactHandler::operator()(RequestContext& ctx, ResponseWriter& writer) const {
    const std::string path = Router::routePath(ctx.request().path);
    if (!safePath(path)) {
        writer.send(Response(400, "Bad artifact path"));
        return;
    }

    int failureStatus = 404;
    for (const auto& origin : origins_) {
        if (tryOrigin(origin, path, ctx, writer, failureStatus)) return;
    }

    writer.send(Response(failureStatus, "Not Found"));
}

bool ArtifactHandler::tryOrigin(const std::string& origin, const std::string& path,
                                RequestContext& ctx, ResponseWriter& writer, int& failureStatus) const {
    const Request& req = ctx.request();
    const std::string url = originUrl(origin, path);
    const bool head = req.method == "HEAD";
    bool streamOk = false;

    FetchRequest fr;
    fr.url = url;
    fr.headOnly = head;
    fr.cancelled = [&writer]() { return !writer.connected(); };
    if (!head) {
        fr.onHeaders = [&writer, &streamOk](long status, const FetchHeaders& headers) {
            streamOk = writer.beginStream(static_cast<int>(status), relayHeaders(headers));
        };
    }

    try {
        FetchResponse res = client_.fetch(fr, [&writer, &streamOk](const char* data, std::size_t size) {
            return streamOk && writer.writeChunk(data, size);
        });

        bool delivered = true;
        if (head && res.contentLength >= 0) {
            Response out(static_cast<int>(res.status), "");
            for (const auto& h : relayHeaders(res.headers)) out.headers[h.first] = h.second;
            out.headers["Content-Length"] = std::to_string(res.contentLength);
            delivered = writer.send(out);
        } else if (head) {
            // length unknown upstream: a head with no Content-Length at all
            delivered = writer.beginStream(static_cast<int>(res.status), relayHeaders(res.headers)) &&
                        writer.endStream();
        } else {
            delivered = streamOk && writer.endStream();
        }

        log_.info(delivered ? "fetched" : "client gone")
            .add("id", req.id.str())
            .add("url", url)
            .add("status", res.status)
            .add("bytes", res.bytes);
        return true;

    } catch (const FetchError& e) {
        if (ctx.clientClosed()) {
            log_.debug("client gone")
                .add("id", req.id.str())
                .add("url", url)
                .add("kind", FetchError::kindName(e.kind()));
            return true;
        }

        if (e.kind() == FetchError::Kind::BadStatus && (e.status() == 404 || e.status() == 410)) {
            log_.debug("miss").add("id", req.id.str()).add("url", url).add("status", e.status());
            failureStatus = 404;
            return false;
        }

        log_.warn("fetch failed")
            .add("id", req.id.str())
            .add("url", url)
            .add("kind", FetchError::kindName(e.kind()))
            .add("status", e.status())
            .add("detail", e.what());

        bool timedOut = e.kind() == FetchError::Kind::Timeout || e.kind() == FetchError::Kind::PoolTimeout;
        failureStatus = timedOut ? 504 : 502;
        if (!writer.committed()) {
            writer.send(Response(failureStatus, timedOut ? "Upstream timed out" : "Upstream failure"));
        }
        return true;
    }
}
