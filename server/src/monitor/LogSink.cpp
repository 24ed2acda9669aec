#include "monitor/LogSink.hpp"

#include <stdexcept>
#include <utility>

StreamSink::StreamSink(std::ostream& out) : out(out) {}

void StreamSink::write(const std::string& line) {
    std::lock_guard<std::mutex> lock(mtx);
    out << line << '\n';
}

void StreamSink::flush() {
    std::lock_guard<std::mutex> lock(mtx);
    out.flush();
}

FileSink::FileSink(const std::string& filePath) {
    file.open(filePath, std::ios::out | std::ios::app);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open log file: " + filePath);
    }
}

FileSink::~FileSink() {
    flush();
    file.close();
}

void FileSink::write(const std::string& line) {
    std::lock_guard<std::mutex> lock(mtx);

    file << line << '\n';

    counter++;
    if (counter % 50 == 0)
        file.flush();
}

void FileSink::flush() {
    std::lock_guard<std::mutex> lock(mtx);
    file.flush();
}

AsyncSink::AsyncSink(std::shared_ptr<LogSink> inner)
    : wrapped(std::move(inner)) {
    if (!wrapped) {
        throw std::invalid_argument("AsyncSink requires a non-null sink");
    }
    writerThread = std::thread([this]() { writerLoop(); });
}

AsyncSink::~AsyncSink() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        stopping = true;
    }
    cv.notify_all();
    if (writerThread.joinable()) {
        writerThread.join();
    }
    wrapped->flush();
}

void AsyncSink::write(const std::string& line) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        pending.push_back(line);
    }
    cv.notify_one();
}

void AsyncSink::flush() {
    {
        std::unique_lock<std::mutex> lock(mtx);
        idleCv.wait(lock, [this]() { return pending.empty() && !writing; });
    }
    wrapped->flush();
}

void AsyncSink::writerLoop() {
    std::unique_lock<std::mutex> lock(mtx);
    while (true) {
        cv.wait(lock, [this]() { return stopping || !pending.empty(); });

        if (pending.empty()) {
            // stopping is set and everything has been written
            return;
        }

        std::deque<std::string> batch;
        batch.swap(pending);
        writing = true;
        lock.unlock();

        for (const auto& line : batch) {
            wrapped->write(line);
        }

        lock.lock();
        writing = false;
        idleCv.notify_all();
    }
}
