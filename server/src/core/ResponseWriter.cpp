#include "core/ResponseWriter.hpp"

#include <cstdio>

#include "core/Connection.hpp"
#include "core/RequestContext.hpp"

ConnectionResponseWriter::ConnectionResponseWriter(Connection& conn, RequestContext& ctx)
    : conn(conn), ctx(ctx), headOnly(ctx.request().method == "HEAD") {}

bool ConnectionResponseWriter::emit(const char* data, std::size_t len) {
    if (ctx.clientClosed()) return false;
    if (!conn.writeAll(data, len)) {
        ctx.markClientClosed();
        return false;
    }
    return true;
}

bool ConnectionResponseWriter::emit(const std::string& data) {
    return emit(data.data(), data.size());
}

bool ConnectionResponseWriter::connected() {
    if (ctx.clientClosed()) return false;
    if (!conn.peerAlive()) {
        ctx.markClientClosed();
        return false;
    }
    return true;
}

bool ConnectionResponseWriter::send(const Response& res) {
    if (committed()) return false;
    sentStatus = res.statusCode;

    Response out = res;
    out.headers["Connection"] = "close";
    return emit(out.build(!headOnly));
}

bool ConnectionResponseWriter::beginStream(int status,
                                           const std::unordered_map<std::string, std::string>& headers) {
    if (committed()) return false;
    sentStatus = status;
    streaming = true;

    std::string head = "HTTP/1.1 " + std::to_string(status) + " " + Response::reasonPhrase(status) + "\r\n";
    for (const auto& h : headers) {
        if (h.first == "Content-Length" || h.first == "Transfer-Encoding" || h.first == "Connection")
            continue;
        head += h.first + ": " + h.second + "\r\n";
    }
    if (!headOnly) head += "Transfer-Encoding: chunked\r\n";
    head += "Connection: close\r\n\r\n";

    return emit(head);
}

bool ConnectionResponseWriter::writeChunk(const char* data, std::size_t len) {
    if (!streaming) return false;
    if (headOnly || len == 0) return !ctx.clientClosed();

    char size[32];
    int n = std::snprintf(size, sizeof(size), "%zx\r\n", len);
    return emit(size, static_cast<std::size_t>(n)) && emit(data, len) && emit("\r\n", 2);
}

bool ConnectionResponseWriter::endStream() {
    if (!streaming) return false;
    streaming = false;
    if (headOnly) return !ctx.clientClosed();
    return emit("0\r\n\r\n", 5);
}
