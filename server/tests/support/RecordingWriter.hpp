#pragma once
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/RequestContext.hpp"
#include "core/ResponseWriter.hpp"

// ResponseWriter that keeps what a handler produced. With failAfterChunks
// set it behaves like a client that disconnects after that many chunks.
class RecordingWriter : public ResponseWriter {
public:
    explicit RecordingWriter(RequestContext* ctx = nullptr, int failAfterChunks = -1)
        : ctx_(ctx), failAfterChunks_(failAfterChunks) {}

    bool send(const Response& res) override {
        if (status_ != 0) return false;
        status_ = res.statusCode;
        headers = res.headers;
        body = res.body;
        sends++;
        return true;
    }

    bool beginStream(int status, const std::unordered_map<std::string, std::string>& h) override {
        if (status_ != 0) return false;
        status_ = status;
        headers = h;
        streamed = true;
        return true;
    }

    bool writeChunk(const char* data, std::size_t len) override {
        if (failAfterChunks_ >= 0 && static_cast<int>(chunks.size()) >= failAfterChunks_) {
            if (ctx_) ctx_->markClientClosed();
            return false;
        }
        chunks.emplace_back(data, len);
        body.append(data, len);
        return true;
    }

    bool endStream() override {
        ended = true;
        return true;
    }

    bool committed() const override { return status_ != 0; }
    int status() const override { return status_; }

    bool connected() override {
        polls++;
        if (ctx_ && ctx_->clientClosed()) return false;
        if (disconnectAfterPolls_ >= 0 && polls > disconnectAfterPolls_) {
            if (ctx_) ctx_->markClientClosed();
            return false;
        }
        return true;
    }

    // the client leaves without the handler writing anything
    void disconnectAfterPolls(int n) { disconnectAfterPolls_ = n; }

    std::unordered_map<std::string, std::string> headers;
    std::string body;
    std::vector<std::string> chunks;
    int sends = 0;
    int polls = 0;
    bool streamed = false;
    bool ended = false;

private:
    RequestContext* ctx_;
    int failAfterChunks_;
    int disconnectAfterPolls_ = -1;
    int status_ = 0;
};
