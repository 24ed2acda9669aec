#include "fetch/FetchClient.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <exception>
#include <stdexcept>
#include <utility>

namespace {

std::once_flag curlInitOnce;

constexpr long kMinCurlBuffer = 1024;
constexpr long kMaxCurlBuffer = 512 * 1024;

// Per-call state shared with the libcurl callbacks.
struct Transfer {
    CURL* handle = nullptr;
    const FetchRequest* request = nullptr;
    const ChunkCallback* onChunk = nullptr;
    BufferPool::Buffer buffer;
    std::size_t maxBody = 0;

    FetchHeaders headers;
    std::size_t bytes = 0;
    long badStatus = 0;
    bool overflow = false;
    bool stopped = false;
    bool headersSent = false;
    std::exception_ptr callbackError;

    long responseCode() const {
        long code = 0;
        curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &code);
        return code;
    }

    void deliverHeaders(long status) {
        if (headersSent) return;
        headersSent = true;
        if (request->onHeaders) request->onHeaders(status, headers);
    }

    bool emit() {
        if (buffer.empty()) return true;
        bool keep = !*onChunk || (*onChunk)(buffer.data(), buffer.size());
        buffer.clear();
        if (!keep) stopped = true;
        return keep;
    }
};

inline void trimCRLF(std::string& s) {
    while (!s.empty() && (s.back() == '\r' || s.back() == '\n' || s.back() == ' ')) {
        s.pop_back();
    }
}

size_t onHeaderLine(char* data, size_t size, size_t nitems, void* userp) {
    auto* t = static_cast<Transfer*>(userp);
    size_t n = size * nitems;

    std::string line(data, n);
    trimCRLF(line);

    // every status line starts a new response (redirects, 100-continue)
    if (line.rfind("HTTP/", 0) == 0) {
        t->headers.clear();
        return n;
    }

    auto colon = line.find(':');
    if (colon == std::string::npos) return n;

    std::string key = line.substr(0, colon);
    std::string value = line.substr(colon + 1);
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t'))
        value.erase(value.begin());

    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    t->headers[key] = value;
    return n;
}

size_t onBody(char* data, size_t size, size_t nmemb, void* userp) {
    auto* t = static_cast<Transfer*>(userp);
    size_t n = size * nmemb;

    long code = t->responseCode();
    if (code < 200 || code >= 300) {
        t->badStatus = code;
        return 0;
    }

    if (t->maxBody > 0 && t->bytes + n > t->maxBody) {
        t->overflow = true;
        return 0;
    }
    t->bytes += n;

    try {
        t->deliverHeaders(code);

        // coalesce into the pooled buffer, hand out full buffers only
        size_t offset = 0;
        while (offset < n) {
            offset += t->buffer.append(data + offset, n - offset);
            if (t->buffer.full() && !t->emit()) return 0;
        }
    } catch (...) {
        t->callbackError = std::current_exception();
        return 0;
    }
    return n;
}

int onProgress(void* userp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* t = static_cast<Transfer*>(userp);
    if (!t->request->cancelled) return 0;
    try {
        return t->request->cancelled() ? 1 : 0;
    } catch (...) {
        t->callbackError = std::current_exception();
        return 1;
    }
}

std::string curlMessage(CURLcode rc, const char* errbuf) {
    if (errbuf && errbuf[0] != '\0') return errbuf;
    return curl_easy_strerror(rc);
}

}  // namespace

// RAII pool slot: one easy handle checked out of the client.
class FetchClient::Lease {
public:
    Lease(FetchClient& client, const std::string& url)
        : client_(client), handle_(client.acquireHandle(url)) {}

    ~Lease() { client_.releaseHandle(handle_); }

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    CURL* get() const { return handle_; }

private:
    FetchClient& client_;
    CURL* handle_;
};

FetchClient::FetchClient(FetchClientOptions options)
    : options_(std::move(options)),
      buffers_(options_.maxChunkSize > 0 ? options_.maxChunkSize : 1,
               static_cast<std::size_t>(std::max(options_.threadCount, 1)),
               options_.pooledBuffers),
      share_(nullptr),
      shareLocks_(new std::mutex[CURL_LOCK_DATA_LAST]) {
    if (options_.threadCount <= 0) {
        throw std::invalid_argument("FetchClient requires at least one pool slot");
    }
    if (options_.maxChunkSize == 0) {
        throw std::invalid_argument("FetchClient max chunk size must be > 0");
    }

    std::call_once(curlInitOnce, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });

    share_ = curl_share_init();
    if (!share_) {
        throw std::runtime_error("curl_share_init failed");
    }
    curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, &FetchClient::lockShared);
    curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, &FetchClient::unlockShared);
    curl_share_setopt(share_, CURLSHOPT_USERDATA, this);
    curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
}

FetchClient::~FetchClient() {
    close();
    curl_share_cleanup(share_);
}

void FetchClient::lockShared(CURL*, curl_lock_data data, curl_lock_access, void* userp) {
    static_cast<FetchClient*>(userp)->shareLocks_[data].lock();
}

void FetchClient::unlockShared(CURL*, curl_lock_data data, void* userp) {
    static_cast<FetchClient*>(userp)->shareLocks_[data].unlock();
}

CURL* FetchClient::acquireHandle(const std::string& url) {
    CURL* handle = nullptr;
    {
        std::unique_lock<std::mutex> lock(mtx_);
        auto ready = [this]() { return closed_ || inFlight_ < capacity(); };

        if (options_.acquireTimeoutMs > 0) {
            if (!slotFreed_.wait_for(lock, std::chrono::milliseconds(options_.acquireTimeoutMs), ready)) {
                throw FetchError(FetchError::Kind::PoolTimeout, url,
                                 "no fetch slot free after " +
                                     std::to_string(options_.acquireTimeoutMs) + "ms");
            }
        } else {
            slotFreed_.wait(lock, ready);
        }

        if (closed_) {
            throw FetchError(FetchError::Kind::Closed, url, "fetch client is closed");
        }

        inFlight_++;
        if (!idle_.empty()) {
            handle = idle_.back();
            idle_.pop_back();
        }
    }

    if (!handle) {
        handle = curl_easy_init();
        if (!handle) {
            releaseHandle(nullptr);
            throw FetchError(FetchError::Kind::Transport, url, "curl_easy_init failed");
        }
    }
    return handle;
}

void FetchClient::releaseHandle(CURL* handle) {
    bool discard = false;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        inFlight_--;
        if (handle) {
            if (closed_) {
                discard = true;
            } else {
                idle_.push_back(handle);
            }
        }
        if (inFlight_ == 0) drained_.notify_all();
    }
    slotFreed_.notify_one();

    if (discard) curl_easy_cleanup(handle);
}

void FetchClient::configure(CURL* h, const FetchRequest& request) const {
    curl_easy_reset(h);

    curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(h, CURLOPT_USERAGENT, options_.userAgent.c_str());
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_SHARE, share_);
    curl_easy_setopt(h, CURLOPT_TCP_KEEPALIVE, 1L);

    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, options_.followRedirects ? 1L : 0L);
    curl_easy_setopt(h, CURLOPT_MAXREDIRS, options_.maxRedirects);

    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, options_.connectTimeoutMs);
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, options_.requestTimeoutMs);

    long bufferSize = std::clamp(static_cast<long>(options_.maxChunkSize), kMinCurlBuffer, kMaxCurlBuffer);
    curl_easy_setopt(h, CURLOPT_BUFFERSIZE, bufferSize);

    // HEAD asks for identity so Content-Length is the size GET delivers
    if (options_.acceptEncoding && !request.headOnly) {
        // empty string = every encoding this libcurl build can decode
        curl_easy_setopt(h, CURLOPT_ACCEPT_ENCODING, "");
    }
    if (options_.maxBodySize > 0) {
        curl_easy_setopt(h, CURLOPT_MAXFILESIZE_LARGE, static_cast<curl_off_t>(options_.maxBodySize));
    }
    if (request.headOnly) {
        curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
    }
}

FetchResponse FetchClient::fetch(const FetchRequest& request, const ChunkCallback& onChunk) {
    Lease lease(*this, request.url);
    CURL* h = lease.get();

    Transfer t;
    t.handle = h;
    t.request = &request;
    t.onChunk = &onChunk;
    t.buffer = buffers_.acquire();
    t.maxBody = options_.maxBodySize;

    char errbuf[CURL_ERROR_SIZE];
    errbuf[0] = '\0';

    configure(h, request);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, onHeaderLine);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &t);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, onBody);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &t);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, onProgress);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &t);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);

    CURLcode rc = curl_easy_perform(h);
    long code = t.responseCode();

    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, nullptr);

    if (t.callbackError) {
        std::rethrow_exception(t.callbackError);
    }

    const std::string& url = request.url;

    if (rc == CURLE_OK) {
        if (code < 200 || code >= 300) {
            throw FetchError(FetchError::Kind::BadStatus, url,
                             "upstream answered " + std::to_string(code), code);
        }

        // empty bodies never reach onBody
        t.deliverHeaders(code);
        if (!t.emit()) {
            throw FetchError(FetchError::Kind::Aborted, url, "consumer stopped the transfer", code);
        }

        FetchResponse res;
        res.status = code;
        res.headers = std::move(t.headers);
        res.bytes = t.bytes;

        curl_off_t length = -1;
        if (curl_easy_getinfo(h, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) == CURLE_OK) {
            res.contentLength = static_cast<long long>(length);
        }
        char* effective = nullptr;
        if (curl_easy_getinfo(h, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective) {
            res.effectiveUrl = effective;
        }
        return res;
    }

    if (t.badStatus != 0) {
        throw FetchError(FetchError::Kind::BadStatus, url,
                         "upstream answered " + std::to_string(t.badStatus), t.badStatus);
    }
    if (t.overflow) {
        throw FetchError(FetchError::Kind::BodyTooLarge, url,
                         "body exceeds " + std::to_string(options_.maxBodySize) + " bytes", code);
    }
    if (t.stopped) {
        throw FetchError(FetchError::Kind::Aborted, url, "consumer stopped the transfer", code);
    }

    switch (rc) {
        case CURLE_ABORTED_BY_CALLBACK:
            throw FetchError(FetchError::Kind::Aborted, url, "transfer cancelled", code);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
            throw FetchError(FetchError::Kind::ConnectFailed, url, curlMessage(rc, errbuf));
        case CURLE_OPERATION_TIMEDOUT:
            throw FetchError(FetchError::Kind::Timeout, url, curlMessage(rc, errbuf), code);
        case CURLE_TOO_MANY_REDIRECTS:
            throw FetchError(FetchError::Kind::TooManyRedirects, url, curlMessage(rc, errbuf), code);
        case CURLE_FILESIZE_EXCEEDED:
            throw FetchError(FetchError::Kind::BodyTooLarge, url, curlMessage(rc, errbuf), code);
        default:
            throw FetchError(FetchError::Kind::Transport, url, curlMessage(rc, errbuf), code);
    }
}

void FetchClient::close() {
    std::vector<CURL*> handles;
    {
        std::unique_lock<std::mutex> lock(mtx_);
        closed_ = true;
        slotFreed_.notify_all();
        drained_.wait(lock, [this]() { return inFlight_ == 0; });
        handles.swap(idle_);
    }
    for (CURL* h : handles) {
        curl_easy_cleanup(h);
    }
}

std::size_t FetchClient::inFlight() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return inFlight_;
}
