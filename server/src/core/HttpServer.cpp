#include "core/HttpServer.hpp"

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <exception>
#include <thread>
#include <utility>

#include "core/Connection.hpp"
#include "core/HttpParser.hpp"
#include "core/RequestContext.hpp"
#include "core/Response.hpp"
#include "core/ResponseWriter.hpp"
#include "core/Router.hpp"
#include "core/Socket.hpp"
#include "error/ErrorReporter.hpp"
#include "monitor/AccessRecorder.hpp"
#include "monitor/Logger.hpp"
#include "threadpool/ThreadPool.hpp"

static constexpr std::chrono::milliseconds kAcceptBackoff{100};

HttpServer::HttpServer(ServerOptions options, const Router& router, ErrorReporter& errors,
                       AccessRecorder& access, const Logger& log)
    : options(std::move(options)),
      router(router),
      errors(errors),
      access(access),
      log(log) {}

HttpServer::~HttpServer() {
    stop();
    if (threadPool) {
        threadPool->shutdown();
    }
}

bool HttpServer::start() {
    if (!options.tlsCert.empty() && !options.tlsKey.empty()) {
        std::string error;
        tls = TlsContext::load(options.tlsCert, options.tlsKey, error);
        if (!tls) {
            log.error("tls setup failed").add("detail", error);
            return false;
        }
    }

    {
        std::lock_guard<std::mutex> lock(socketMtx);
        serverSocket = std::make_unique<Socket>();

        if (!serverSocket->bind(options.port)) {
            log.error("bind failed").add("port", options.port).add("errno", errno);
            return false;
        }
        if (!serverSocket->listen()) {
            log.error("listen failed").add("port", options.port).add("errno", errno);
            return false;
        }
        boundPort = serverSocket->localPort();
    }

    threadPool = std::make_unique<ThreadPool>(options.workerThreads);
    isRunning = true;

    log.info("listening")
        .add("port", boundPort)
        .add("tls", tls != nullptr)
        .add("workers", options.workerThreads);
    return true;
}

void HttpServer::run() {
    if (!threadPool) return;

    // accept only; TLS handshake, reading and routing happen on the workers
    while (isRunning) {
        std::string remote;
        int clientFd = serverSocket->acceptClient(&remote);

        if (clientFd < 0) {
            int err = errno;
            if (!isRunning) break;
            if (err == EINTR || err == ECONNABORTED) continue;

            log.warn("accept failed").add("errno", err);
            if (err == EINVAL || err == EBADF) break;
            if (err == EMFILE || err == ENFILE || err == ENOBUFS || err == ENOMEM) {
                // the connection stays queued; retrying at once only spins
                std::this_thread::sleep_for(kAcceptBackoff);
            }
            continue;
        }

        auto accepted = std::chrono::steady_clock::now();

        int flag = 1;
        setsockopt(clientFd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
        timeval tv{};
        tv.tv_sec = options.ioTimeoutSec;
        tv.tv_usec = 0;
        setsockopt(clientFd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        setsockopt(clientFd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        std::size_t taskId = nextTaskId++;
        bool queued = threadPool->submit(Task(taskId, [this, clientFd, remote, accepted]() {
            try {
                handleClient(clientFd, remote, accepted);
            } catch (...) {
                errors.onError(std::current_exception());
            }
        }));
        if (!queued) {
            ::close(clientFd);
        }
    }

    isRunning = false;
    threadPool->shutdown();
    {
        std::lock_guard<std::mutex> lock(socketMtx);
        serverSocket->closeSocket();
    }
    log.info("stopped").add("port", boundPort);
}

void HttpServer::stop() {
    isRunning = false;
    std::lock_guard<std::mutex> lock(socketMtx);
    if (serverSocket) {
        serverSocket->shutdown();
    }
}

// Raw request head: up to "\r\n\r\n", the size limit, EOF or timeout.
std::string HttpServer::readRequestBlocking(Connection& conn) {
    std::string data;
    char buffer[4096];

    while (true) {
        long n = conn.read(buffer, sizeof(buffer));
        if (n <= 0) break;

        data.append(buffer, static_cast<std::size_t>(n));

        if (data.find("\r\n\r\n") != std::string::npos) break;
        if (data.size() > options.maxHeadBytes) break;
    }
    return data;
}

void HttpServer::handleClient(int clientFd, const std::string& remote,
                              std::chrono::steady_clock::time_point accepted) {
    std::unique_ptr<Connection> conn;
    if (tls) {
        std::string error;
        conn = tls->accept(clientFd, error);
        if (!conn) {
            log.debug("tls handshake failed").add("address", remote).add("detail", error);
            ::close(clientFd);
            return;
        }
    } else {
        conn = std::make_unique<Connection>(clientFd);
    }

    std::string raw = readRequestBlocking(*conn);
    if (raw.empty()) {
        // connected and left without sending anything: no request to record
        return;
    }

    Request req = HttpParser::parse(raw);
    req.remoteAddress = remote;
    req.id = RequestId::next();
    req.start = accepted;

    const bool headComplete = raw.find("\r\n\r\n") != std::string::npos;

    RequestContext ctx(std::move(req));
    ConnectionResponseWriter writer(*conn, ctx);

    access.onBeforeDispatch(ctx);

    if (!headComplete) {
        writer.send(Response(raw.size() > options.maxHeadBytes ? 431 : 400, "Bad Request"));
    } else if (!HttpParser::valid(ctx.request())) {
        writer.send(Response(400, "Bad Request"));
    } else {
        try {
            if (!router.dispatch(ctx, writer)) {
                writer.send(Response(404, "Not Found"));
            } else if (!writer.committed() && !ctx.clientClosed()) {
                writer.send(Response(500, "Handler sent no response"));
            }
        } catch (...) {
            errors.onError(std::current_exception());
            if (!writer.committed()) {
                writer.send(Response(500, "Internal Server Error"));
            }
        }
    }

    int status = writer.status();
    if (ctx.clientClosed()) {
        status = kStatusClientClosed;
    }
    access.onComplete(ctx, status);

    conn->close();
}
