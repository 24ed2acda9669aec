#pragma once

#include <memory>

#include "core/Router.hpp"
#include "error/ErrorReporter.hpp"
#include "monitor/AccessRecorder.hpp"
#include "monitor/Logger.hpp"
#include "utils/Config.hpp"

class FetchClient;
class HttpServer;
class LogSink;

constexpr const char* kApplicationName = "tiny-maven-proxy";

constexpr const char* kDownloadChannel = "download";
constexpr const char* kAccessChannel   = "access";
constexpr const char* kErrorChannel    = "error";
constexpr const char* kServerChannel   = "server";

// Builds the pipeline in dependency order (loggers, fetch client,
// reporter/recorder, router, server) and owns all of it. The fetch client
// lives until the server has drained.
class ProxyApplication {
public:
    // sink: where every channel writes; null = derived from config
    explicit ProxyApplication(const Config& config, std::shared_ptr<LogSink> sink = nullptr);
    ~ProxyApplication();

    ProxyApplication(const ProxyApplication&) = delete;
    ProxyApplication& operator=(const ProxyApplication&) = delete;

    bool start();

    // Blocks until shutdown(), then drains requests and in-flight fetches.
    void await();

    // Safe from any thread (signal waiter).
    void shutdown();

    int port() const;

    FetchClient& fetchClient() { return *client_; }
    const Router& router() const { return router_; }

    static std::shared_ptr<LogSink> makeSink(const Config& config);

private:
    void registerRoutes();

    Config config_;
    std::shared_ptr<LogSink> sink_;

    Logger serverLog_;
    Logger downloadLog_;
    Logger accessLog_;
    Logger errorLog_;

    std::unique_ptr<FetchClient> client_;
    ErrorReporter errors_;
    AccessRecorder access_;
    Router router_;
    std::unique_ptr<HttpServer> server_;
};
