#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Canned answer for one path.
struct OriginResponse {
    int status = 200;
    std::string body;
    std::map<std::string, std::string> headers;

    std::chrono::milliseconds delay{0};      // before the status line
    std::size_t pieces = 1;                  // body written in this many parts
    std::chrono::milliseconds pieceDelay{0}; // pause between parts
    bool sendLength = true;                  // false: body runs to EOF
};

// Loopback HTTP/1.1 origin for tests. One thread per connection, one
// request per connection. Unknown paths answer 404.
class TestOrigin {
public:
    TestOrigin();
    ~TestOrigin();

    TestOrigin(const TestOrigin&) = delete;
    TestOrigin& operator=(const TestOrigin&) = delete;

    void on(const std::string& path, OriginResponse response);

    int port() const { return port_; }
    std::string url() const;

    int requests() const { return requests_.load(); }
    int maxConcurrent() const { return maxActive_.load(); }
    std::string lastMethod() const;
    std::string lastHeader(const std::string& lowerName) const;

private:
    void acceptLoop();
    void serve(int fd);

    int listenFd_ = -1;
    int port_ = 0;
    std::atomic<bool> stop_{false};
    std::thread acceptor_;

    mutable std::mutex mtx_;
    std::map<std::string, OriginResponse> routes_;
    std::vector<std::thread> workers_;
    std::string lastMethod_;
    std::map<std::string, std::string> lastHeaders_;

    std::atomic<int> requests_{0};
    std::atomic<int> active_{0};
    std::atomic<int> maxActive_{0};
};

// Minimal blocking HTTP client for driving the proxy in tests.
struct RawResponse {
    int status = 0;
    std::map<std::string, std::string> headers;  // lower-case names
    std::string body;                            // de-chunked
};

RawResponse httpRequest(int port, const std::string& method, const std::string& path,
                        const std::string& extraHeaders = "");

// Connected loopback socket with 15s timeouts; the caller closes it.
int connectClient(int port);

// Sends raw bytes and returns whatever comes back until the server closes.
std::string rawExchange(int port, const std::string& bytes);
