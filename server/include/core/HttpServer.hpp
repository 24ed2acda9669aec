#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

class AccessRecorder;
class Connection;
class ErrorReporter;
class Logger;
class Router;
class Socket;
class ThreadPool;
class TlsContext;

struct ServerOptions {
    int port = 5956;
    int workerThreads = 40;

    // both set: HTTPS
    std::string tlsCert;
    std::string tlsKey;

    int ioTimeoutSec = 5;
    std::size_t maxHeadBytes = 65536;
};

// Accept loop + worker pool. Each connection carries one request: read,
// route, answer, record, close.
class HttpServer {
public:
    HttpServer(ServerOptions options, const Router& router, ErrorReporter& errors,
               AccessRecorder& access, const Logger& log);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // bind + listen + workers; false (and logged) on failure
    bool start();

    // Accepts until stop(), then drains the workers. Call after start().
    void run();

    // Safe from any thread.
    void stop();

    bool running() const { return isRunning.load(); }

    // bound port, useful when started on port 0
    int port() const { return boundPort; }

private:
    std::string readRequestBlocking(Connection& conn);
    void handleClient(int clientFd, const std::string& remote,
                      std::chrono::steady_clock::time_point accepted);

    ServerOptions options;
    const Router& router;
    ErrorReporter& errors;
    AccessRecorder& access;
    const Logger& log;

    std::atomic<bool> isRunning{false};
    std::atomic<std::size_t> nextTaskId{0};
    int boundPort = -1;

    std::mutex socketMtx;
    std::unique_ptr<Socket>     serverSocket;
    std::unique_ptr<TlsContext> tls;
    std::unique_ptr<ThreadPool> threadPool;
};
