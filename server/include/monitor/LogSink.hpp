#pragma once
#include <condition_variable>
#include <deque>
#include <fstream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>

// Destination for formatted log lines. One call = one record.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const std::string& line) = 0;
    virtual void flush() {}
};

class StreamSink : public LogSink {
public:
    explicit StreamSink(std::ostream& out);

    void write(const std::string& line) override;
    void flush() override;

private:
    std::ostream& out;
    std::mutex mtx;
};

// Append-only file, flushed every 50 records and on destruction.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& filePath);
    ~FileSink() override;

    void write(const std::string& line) override;
    void flush() override;

private:
    std::ofstream file;
    std::mutex mtx;
    int counter = 0;
};

// Hands lines to a background thread which writes them to the wrapped sink.
class AsyncSink : public LogSink {
public:
    explicit AsyncSink(std::shared_ptr<LogSink> inner);
    ~AsyncSink() override;

    AsyncSink(const AsyncSink&) = delete;
    AsyncSink& operator=(const AsyncSink&) = delete;

    void write(const std::string& line) override;

    // Blocks until every queued line reached the wrapped sink.
    void flush() override;

private:
    void writerLoop();

    std::shared_ptr<LogSink> wrapped;
    std::deque<std::string> pending;
    std::mutex mtx;
    std::condition_variable cv;
    std::condition_variable idleCv;
    bool stopping = false;
    bool writing = false;
    std::thread writerThread;
};
