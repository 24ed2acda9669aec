#pragma once
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <curl/curl.h>

#include "fetch/BufferPool.hpp"
#include "fetch/FetchError.hpp"

struct FetchClientOptions {
    std::string userAgent = "TinyMavenProxy 1.0";
    bool followRedirects = true;
    long maxRedirects = 10;
    std::size_t maxChunkSize = 16384;

    // pool slots: transfers allowed in flight at once
    int threadCount = 24;

    long connectTimeoutMs = 10000;
    long requestTimeoutMs = 0;    // 0 = no overall limit
    long acquireTimeoutMs = 30000; // 0 = wait for a slot forever
    std::size_t maxBodySize = 0;   // 0 = unlimited

    bool pooledBuffers = true;
    bool acceptEncoding = true;
};

using FetchHeaders = std::unordered_map<std::string, std::string>;

struct FetchRequest {
    std::string url;
    bool headOnly = false;

    // polled during the transfer, returning true aborts it
    std::function<bool()> cancelled;

    // called once with the final response status and headers, before the
    // first body chunk
    std::function<void(long status, const FetchHeaders& headers)> onHeaders;
};

struct FetchResponse {
    long status = 0;
    FetchHeaders headers;        // lower-case names, final response only
    long long contentLength = -1;
    std::size_t bytes = 0;
    std::string effectiveUrl;
};

// Receives body chunks of at most maxChunkSize bytes; return false to stop.
using ChunkCallback = std::function<bool(const char* data, std::size_t size)>;

// Process-wide pooled HTTP client. Safe to call fetch() from many threads.
class FetchClient {
public:
    explicit FetchClient(FetchClientOptions options);
    ~FetchClient();

    FetchClient(const FetchClient&) = delete;
    FetchClient& operator=(const FetchClient&) = delete;

    // Blocks until a pool slot is free, then performs one transfer.
    // Throws FetchError on any failure, including non-2xx responses.
    FetchResponse fetch(const FetchRequest& request, const ChunkCallback& onChunk);

    // Refuses new fetches and waits for in-flight ones. Idempotent.
    void close();

    std::size_t inFlight() const;
    std::size_t capacity() const { return static_cast<std::size_t>(options_.threadCount); }
    const FetchClientOptions& options() const { return options_; }
    const BufferPool& buffers() const { return buffers_; }

private:
    class Lease;

    CURL* acquireHandle(const std::string& url);
    void releaseHandle(CURL* handle);
    void configure(CURL* handle, const FetchRequest& request) const;

    static void lockShared(CURL* handle, curl_lock_data data, curl_lock_access access, void* userp);
    static void unlockShared(CURL* handle, curl_lock_data data, void* userp);

    FetchClientOptions options_;
    BufferPool buffers_;

    CURLSH* share_;
    std::unique_ptr<std::mutex[]> shareLocks_;

    mutable std::mutex mtx_;
    std::condition_variable slotFreed_;
    std::condition_variable drained_;
    std::vector<CURL*> idle_;
    std::size_t inFlight_ = 0;
    bool closed_ = false;
};
