#include "core/HttpServer.hpp"

#include <arpa/inet.h>
#include <gtest/gtest.h>
#include <netinet/in.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <limits>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "core/RequestContext.hpp"
#include "core/Response.hpp"
#include "core/ResponseWriter.hpp"
#include "core/Router.hpp"
#include "error/ErrorReporter.hpp"
#include "monitor/AccessRecorder.hpp"
#include "monitor/Logger.hpp"
#include "support/MemorySink.hpp"
#include "support/TestOrigin.hpp"

class HttpServerTest : public ::testing::Test {
protected:
    std::shared_ptr<MemorySink> sink = std::make_shared<MemorySink>();
    Logger serverLog{"test", "server", LogLevel::Debug, sink};
    Logger accessLog{"test", "access", LogLevel::Debug, sink};
    Logger errorLog{"test", "error", LogLevel::Debug, sink};
    ErrorReporter errors{errorLog};
    AccessRecorder access{accessLog};
    Router router;
    std::atomic<int> handlerCalls{0};

    std::unique_ptr<HttpServer> server;
    std::thread runner;

    void SetUp() override {
        router.addNotFound("^favicon.ico$", {"GET", "HEAD"}, std::numeric_limits<int>::min());
        router.add("^boom$", {"GET"}, 0, [](RequestContext&, ResponseWriter&) {
            throw std::runtime_error("handler exploded");
        });
        router.add("^silent$", {"GET"}, 0, [](RequestContext&, ResponseWriter&) {});
        router.add("^slow$", {"GET"}, 0, [](RequestContext&, ResponseWriter& w) {
            std::this_thread::sleep_for(std::chrono::milliseconds(80));
            w.send(Response(200, "slow"));
        });
        router.add("^stream$", {"GET", "HEAD"}, 0, [](RequestContext&, ResponseWriter& w) {
            w.beginStream(200, {{"Content-Type", "application/octet-stream"}});
            w.writeChunk("hello ", 6);
            w.writeChunk("streaming ", 10);
            w.writeChunk("world", 5);
            w.endStream();
        });
        router.add(".+", {"GET", "HEAD"}, 10, [this](RequestContext& ctx, ResponseWriter& w) {
            handlerCalls++;
            w.send(Response(200, "echo " + ctx.request().path));
        });

        ServerOptions options;
        options.port = 0;
        options.workerThreads = 4;
        options.ioTimeoutSec = 2;
        options.maxHeadBytes = 1024;

        server = std::make_unique<HttpServer>(options, router, errors, access, serverLog);
        ASSERT_TRUE(server->start());
        ASSERT_GT(server->port(), 0);
        runner = std::thread([this]() { server->run(); });
    }

    void TearDown() override {
        server->stop();
        if (runner.joinable()) runner.join();
    }
};

TEST_F(HttpServerTest, ServesHandlerResponse) {
    RawResponse res = httpRequest(server->port(), "GET", "/org/a.pom");

    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.body, "echo /org/a.pom");
    EXPECT_EQ(res.headers["connection"], "close");
    EXPECT_EQ(handlerCalls.load(), 1);

    auto records = sink->records("access", "request");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0]["status"], 200);
    EXPECT_EQ(records[0]["method"], "GET");
    EXPECT_EQ(records[0]["path"], "/org/a.pom");
    EXPECT_EQ(records[0]["address"].get<std::string>().rfind("127.0.0.1:", 0), 0u);
}

TEST_F(HttpServerTest, FaviconIs404WithoutHandler) {
    RawResponse res = httpRequest(server->port(), "GET", "/favicon.ico");

    EXPECT_EQ(res.status, 404);
    EXPECT_EQ(handlerCalls.load(), 0);

    auto records = sink->records("access", "request");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0]["status"], 404);
}

TEST_F(HttpServerTest, UnroutedMethodIs404) {
    RawResponse res = httpRequest(server->port(), "POST", "/org/a.pom", "Content-Length: 0\r\n");

    EXPECT_EQ(res.status, 404);
    EXPECT_EQ(handlerCalls.load(), 0);
    EXPECT_EQ(sink->records("access", "request").size(), 1u);
}

TEST_F(HttpServerTest, HandlerFailureIs500AndReportedOnce) {
    RawResponse res = httpRequest(server->port(), "GET", "/boom");

    EXPECT_EQ(res.status, 500);

    auto errorsLogged = sink->records("error");
    ASSERT_EQ(errorsLogged.size(), 1u);
    EXPECT_EQ(errorsLogged[0]["msg"], "std::runtime_error");
    EXPECT_EQ(errorsLogged[0]["detail"], "handler exploded");

    auto records = sink->records("access", "request");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0]["status"], 500);
}

TEST_F(HttpServerTest, HandlerThatAnswersNothingIs500) {
    RawResponse res = httpRequest(server->port(), "GET", "/silent");
    EXPECT_EQ(res.status, 500);
}

TEST_F(HttpServerTest, RecordedDurationIncludesHandlerTime) {
    RawResponse res = httpRequest(server->port(), "GET", "/slow");
    EXPECT_EQ(res.status, 200);

    auto records = sink->records("access", "request");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_GE(records[0]["dur"].get<long long>(), 80);
}

TEST_F(HttpServerTest, StreamsChunkedBody) {
    RawResponse res = httpRequest(server->port(), "GET", "/stream");

    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.headers["transfer-encoding"], "chunked");
    EXPECT_EQ(res.body, "hello streaming world");
}

TEST_F(HttpServerTest, HeadOmitsBody) {
    RawResponse res = httpRequest(server->port(), "HEAD", "/org/a.pom");

    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.headers["content-length"], "15");
    EXPECT_TRUE(res.body.empty());

    RawResponse streamed = httpRequest(server->port(), "HEAD", "/stream");
    EXPECT_EQ(streamed.status, 200);
    EXPECT_TRUE(streamed.body.empty());
    EXPECT_EQ(streamed.headers.count("transfer-encoding"), 0u);
}

TEST_F(HttpServerTest, MalformedRequestIs400) {
    std::string raw = rawExchange(server->port(), "NOT-HTTP\r\n\r\n");
    EXPECT_EQ(raw.rfind("HTTP/1.1 400 ", 0), 0u);

    auto records = sink->records("access", "request");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0]["status"], 400);
}

TEST_F(HttpServerTest, TruncatedHeadIs400) {
    std::string raw = rawExchange(server->port(), "GET /org/a.pom HTTP/1.1\r\nHost: x");
    EXPECT_EQ(raw.rfind("HTTP/1.1 400 ", 0), 0u);
}

TEST_F(HttpServerTest, OversizedHeadIs431) {
    // no terminator, so the whole head is consumed before the limit trips
    std::string big = "GET /a HTTP/1.1\r\nX-Filler: " + std::string(2000, 'f');
    std::string raw = rawExchange(server->port(), big);
    EXPECT_EQ(raw.rfind("HTTP/1.1 431 ", 0), 0u);
}

TEST_F(HttpServerTest, SilentConnectionLeavesNoRecord) {
    std::string raw = rawExchange(server->port(), "");
    EXPECT_TRUE(raw.empty());

    // a real request afterwards proves the worker finished the empty one
    httpRequest(server->port(), "GET", "/after");
    auto records = sink->records("access", "request");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0]["path"], "/after");
}

TEST_F(HttpServerTest, OneRecordPerConcurrentRequest) {
    constexpr int kClients = 24;
    std::atomic<int> ok{0};

    std::vector<std::thread> clients;
    for (int i = 0; i < kClients; ++i) {
        clients.emplace_back([this, i, &ok]() {
            RawResponse res = httpRequest(server->port(), "GET", "/item/" + std::to_string(i));
            if (res.status == 200) ok++;
        });
    }
    for (auto& t : clients) t.join();

    EXPECT_EQ(ok.load(), kClients);

    auto records = sink->records("access", "request");
    ASSERT_EQ(records.size(), static_cast<std::size_t>(kClients));

    std::set<std::string> ids;
    for (const auto& r : records) ids.insert(r["id"].get<std::string>());
    EXPECT_EQ(ids.size(), static_cast<std::size_t>(kClients));
}

namespace {

// Lowers the soft descriptor limit so the next new descriptor fails.
class DescriptorLimit {
public:
    explicit DescriptorLimit(rlim_t soft) {
        getrlimit(RLIMIT_NOFILE, &saved);
        rlimit low = saved;
        low.rlim_cur = soft;
        applied = setrlimit(RLIMIT_NOFILE, &low) == 0;
    }
    ~DescriptorLimit() { restore(); }

    void restore() {
        if (applied) setrlimit(RLIMIT_NOFILE, &saved);
        applied = false;
    }

    bool applied = false;

private:
    rlimit saved{};
};

}  // namespace

TEST_F(HttpServerTest, DescriptorExhaustionBacksOffAndRecovers) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);

    // lowest free descriptor: with the limit there, accept gets EMFILE
    int lowestFree = ::dup(fd);
    ASSERT_GE(lowestFree, 0);
    ::close(lowestFree);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(server->port()));
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    std::size_t failures = 0;
    {
        DescriptorLimit limit(static_cast<rlim_t>(lowestFree));
        ASSERT_TRUE(limit.applied);
        ASSERT_EQ(::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);

        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        failures = sink->records("server", "accept failed").size();
    }

    EXPECT_GE(failures, 1u);
    EXPECT_LE(failures, 10u);

    // queued connection is served once descriptors are back
    timeval tv{};
    tv.tv_sec = 5;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    std::string req = "GET /after HTTP/1.1\r\nHost: localhost\r\n\r\n";
    ASSERT_EQ(::send(fd, req.data(), req.size(), MSG_NOSIGNAL), static_cast<ssize_t>(req.size()));

    std::string raw;
    char buf[1024];
    ssize_t n;
    while ((n = ::recv(fd, buf, sizeof(buf), 0)) > 0) raw.append(buf, static_cast<std::size_t>(n));
    ::close(fd);

    EXPECT_EQ(raw.rfind("HTTP/1.1 200", 0), 0u);
    EXPECT_NE(raw.find("echo /after"), std::string::npos);
}

TEST_F(HttpServerTest, StopEndsTheAcceptLoop) {
    server->stop();
    runner.join();

    EXPECT_FALSE(server->running());
    EXPECT_EQ(sink->records("server", "stopped").size(), 1u);
}

TEST(HttpServerStartTest, BusyPortFailsToStart) {
    auto sink = std::make_shared<MemorySink>();
    Logger log{"test", "server", LogLevel::Info, sink};
    ErrorReporter errors{log};
    AccessRecorder access{log};
    Router router;

    ServerOptions options;
    options.port = 0;
    options.workerThreads = 1;
    HttpServer first(options, router, errors, access, log);
    ASSERT_TRUE(first.start());

    options.port = first.port();
    HttpServer second(options, router, errors, access, log);
    EXPECT_FALSE(second.start());
    EXPECT_EQ(sink->records("server", "bind failed").size(), 1u);
}

TEST(HttpServerStartTest, UnreadableCertificateFailsToStart) {
    auto sink = std::make_shared<MemorySink>();
    Logger log{"test", "server", LogLevel::Info, sink};
    ErrorReporter errors{log};
    AccessRecorder access{log};
    Router router;

    ServerOptions options;
    options.port = 0;
    options.tlsCert = "/nonexistent/cert.pem";
    options.tlsKey = "/nonexistent/key.pem";
    HttpServer server(options, router, errors, access, log);

    EXPECT_FALSE(server.start());
    EXPECT_EQ(sink->records("server", "tls setup failed").size(), 1u);
}
