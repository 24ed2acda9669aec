#include "monitor/Logger.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

#include "monitor/LogSink.hpp"
#include "support/MemorySink.hpp"

TEST(LoggerTest, WritesBunyanStyleRecord) {
    auto sink = std::make_shared<MemorySink>();
    Logger logger("tiny-maven-proxy", "download", LogLevel::Info, sink);

    logger.info("fetched").add("url", "http://origin/a.jar").add("bytes", 1234);

    auto records = sink->records();
    ASSERT_EQ(records.size(), 1u);
    const auto& r = records[0];
    EXPECT_EQ(r["v"], 0);
    EXPECT_EQ(r["name"], "tiny-maven-proxy");
    EXPECT_EQ(r["channel"], "download");
    EXPECT_EQ(r["level"], 30);
    EXPECT_EQ(r["msg"], "fetched");
    EXPECT_EQ(r["pid"], static_cast<long>(getpid()));
    EXPECT_TRUE(r.contains("hostname"));
    EXPECT_EQ(r["url"], "http://origin/a.jar");
    EXPECT_EQ(r["bytes"], 1234);

    const std::string time = r["time"];
    EXPECT_EQ(time.size(), 24u);   // 2026-01-02T03:04:05.678Z
    EXPECT_EQ(time.back(), 'Z');
}

TEST(LoggerTest, LevelBelowThresholdIsDropped) {
    auto sink = std::make_shared<MemorySink>();
    Logger logger("app", "access", LogLevel::Info, sink);

    logger.debug("request").add("status", 200);
    logger.trace("noise");
    EXPECT_EQ(sink->size(), 0u);

    EXPECT_FALSE(logger.enabled(LogLevel::Debug));
    EXPECT_TRUE(logger.enabled(LogLevel::Warn));
}

TEST(LoggerTest, RecordIsWrittenOnceOnExplicitClose) {
    auto sink = std::make_shared<MemorySink>();
    Logger logger("app", "error", LogLevel::Trace, sink);

    {
        auto rec = logger.error("boom");
        rec.add("detail", "x");
        rec.close();
        EXPECT_EQ(sink->size(), 1u);
        rec.add("late", true);
    }
    EXPECT_EQ(sink->size(), 1u);
    EXPECT_FALSE(sink->records()[0].contains("late"));
}

TEST(LoggerTest, InvalidUtf8IsReplacedNotThrown) {
    auto sink = std::make_shared<MemorySink>();
    Logger logger("app", "access", LogLevel::Trace, sink);

    EXPECT_NO_THROW(logger.info("request").add("path", std::string("/bad\xff\xfe")));
    EXPECT_EQ(sink->size(), 1u);
}

TEST(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(parseLogLevel("DEBUG", LogLevel::Info), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("warning", LogLevel::Info), LogLevel::Warn);
    EXPECT_EQ(parseLogLevel("nonsense", LogLevel::Error), LogLevel::Error);
    EXPECT_STREQ(logLevelName(LogLevel::Fatal), "fatal");
}

TEST(LoggerTest, RequiresSink) {
    EXPECT_THROW(Logger("app", "x", LogLevel::Info, nullptr), std::invalid_argument);
}

TEST(LogSinkTest, StreamSinkWritesOneLinePerRecord) {
    std::ostringstream out;
    auto sink = std::make_shared<StreamSink>(out);
    Logger logger("app", "server", LogLevel::Info, sink);

    logger.info("one");
    logger.info("two");

    std::istringstream in(out.str());
    std::string line;
    int lines = 0;
    while (std::getline(in, line)) {
        EXPECT_NO_THROW(nlohmann::json::parse(line));
        lines++;
    }
    EXPECT_EQ(lines, 2);
}

TEST(LogSinkTest, AsyncSinkDeliversEverythingBeforeFlushReturns) {
    auto memory = std::make_shared<MemorySink>();
    {
        auto async = std::make_shared<AsyncSink>(memory);
        Logger logger("app", "access", LogLevel::Info, async);
        for (int i = 0; i < 500; ++i) {
            logger.info("request").add("n", i);
        }
        async->flush();
        EXPECT_EQ(memory->size(), 500u);

        logger.info("after flush");
    }
    // destruction drains the queue too
    EXPECT_EQ(memory->size(), 501u);
}

TEST(LogSinkTest, FileSinkAppends) {
    std::string path = ::testing::TempDir() + "proxy_log_test_" + std::to_string(getpid()) + ".log";
    std::remove(path.c_str());

    {
        auto sink = std::make_shared<FileSink>(path);
        Logger logger("app", "server", LogLevel::Info, sink);
        logger.info("first");
    }
    {
        auto sink = std::make_shared<FileSink>(path);
        Logger logger("app", "server", LogLevel::Info, sink);
        logger.info("second");
    }

    std::ifstream in(path);
    std::string line;
    int lines = 0;
    while (std::getline(in, line)) lines++;
    EXPECT_EQ(lines, 2);
    std::remove(path.c_str());
}

TEST(LogSinkTest, FileSinkRejectsUnwritablePath) {
    EXPECT_THROW(FileSink("/nonexistent-dir/for/sure/log.txt"), std::runtime_error);
}
