#include "app/ProxyApplication.hpp"

#include <iostream>
#include <limits>
#include <utility>

#include "core/HttpServer.hpp"
#include "fetch/FetchClient.hpp"
#include "handlers/ArtifactHandler.hpp"
#include "monitor/LogSink.hpp"

static FetchClientOptions fetchOptions(const Config& config) {
    FetchClientOptions o;
    o.userAgent        = config.userAgent;
    o.followRedirects  = true;
    o.maxRedirects     = config.maxRedirects;
    o.maxChunkSize     = config.maxChunk;
    o.threadCount      = config.downloadThreads;
    o.connectTimeoutMs = config.connectTimeoutMs;
    o.requestTimeoutMs = config.fetchTimeoutMs;
    o.acquireTimeoutMs = config.acquireTimeoutMs;
    o.maxBodySize      = config.maxBody;
    o.pooledBuffers    = config.pooledAllocator();
    o.acceptEncoding   = config.httpCompression;
    return o;
}

std::shared_ptr<LogSink> ProxyApplication::makeSink(const Config& config) {
    std::shared_ptr<LogSink> sink;
    if (config.logFile.empty()) {
        sink = std::make_shared<StreamSink>(std::cout);
    } else {
        sink = std::make_shared<FileSink>(config.logFile);
    }
    if (config.logAsync) {
        sink = std::make_shared<AsyncSink>(std::move(sink));
    }
    return sink;
}

ProxyApplication::ProxyApplication(const Config& config, std::shared_ptr<LogSink> sink)
    : config_(config),
      sink_(sink ? std::move(sink) : makeSink(config)),
      serverLog_(kApplicationName, kServerChannel, parseLogLevel(config.logLevel, LogLevel::Info), sink_),
      downloadLog_(kApplicationName, kDownloadChannel, serverLog_.level(), sink_),
      accessLog_(kApplicationName, kAccessChannel, serverLog_.level(), sink_),
      errorLog_(kApplicationName, kErrorChannel, serverLog_.level(), sink_),
      client_(std::make_unique<FetchClient>(fetchOptions(config))),
      errors_(errorLog_),
      access_(accessLog_) {
    registerRoutes();

    ServerOptions options;
    options.port = config_.port;
    options.workerThreads = config_.backgroundThreads;
    options.tlsCert = config_.tlsCert;
    options.tlsKey = config_.tlsKey;

    server_ = std::make_unique<HttpServer>(options, router_, errors_, access_, serverLog_);
}

ProxyApplication::~ProxyApplication() {
    // requests first, then the fetches they started
    server_.reset();
    client_->close();
    sink_->flush();
}

void ProxyApplication::registerRoutes() {
    router_.addNotFound("^favicon.ico$", {"GET", "HEAD"}, std::numeric_limits<int>::min(),
                        "Sends 404 for /favicon.ico");

    router_.add(".+", {"GET", "HEAD"}, 0,
                ArtifactHandler(*client_, config_.origins, downloadLog_),
                "Fetches artifacts from the configured origins");
}

bool ProxyApplication::start() {
    if (!server_->start()) {
        return false;
    }

    auto record = serverLog_.info("started");
    record.add("port", server_->port())
          .add("download.threads", config_.downloadThreads)
          .add("background.threads", config_.backgroundThreads)
          .add("compression", config_.httpCompression)
          .add("allocator", config_.allocator)
          .add("origins", config_.origins);
    return true;
}

void ProxyApplication::await() {
    server_->run();
    client_->close();
    serverLog_.info("shutdown complete");
    sink_->flush();
}

void ProxyApplication::shutdown() {
    serverLog_.info("shutting down");
    server_->stop();
}

int ProxyApplication::port() const {
    return server_->port();
}
