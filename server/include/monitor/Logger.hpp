#pragma once
#include <memory>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "monitor/LogSink.hpp"

// Bunyan level numbers.
enum class LogLevel {
    Trace = 10,
    Debug = 20,
    Info  = 30,
    Warn  = 40,
    Error = 50,
    Fatal = 60,
};

LogLevel parseLogLevel(const std::string& name, LogLevel fallback);
const char* logLevelName(LogLevel level);

class Logger;

// Scoped record builder: fields are collected with add() and the record is
// written once, when close() is called or the builder is destroyed.
class LogRecord {
public:
    LogRecord(const Logger* logger, LogLevel level, std::string msg);
    LogRecord(LogRecord&& other) noexcept;
    ~LogRecord();

    LogRecord(const LogRecord&) = delete;
    LogRecord& operator=(const LogRecord&) = delete;
    LogRecord& operator=(LogRecord&&) = delete;

    template <typename T>
    LogRecord& add(const std::string& key, T&& value) {
        if (owner) {
            fields[key] = std::forward<T>(value);
        }
        return *this;
    }

    // false when the level is disabled; add() is then a no-op
    bool active() const { return owner != nullptr; }

    void close();

private:
    const Logger* owner;
    LogLevel recLevel;
    std::string message;
    nlohmann::ordered_json fields;
};

// One named channel ("access", "error", ...) writing JSON lines to a sink.
class Logger {
public:
    Logger(std::string application, std::string channel, LogLevel level,
           std::shared_ptr<LogSink> sink);

    LogRecord log(LogLevel level, std::string msg) const;

    LogRecord trace(std::string msg) const { return log(LogLevel::Trace, std::move(msg)); }
    LogRecord debug(std::string msg) const { return log(LogLevel::Debug, std::move(msg)); }
    LogRecord info(std::string msg) const  { return log(LogLevel::Info, std::move(msg)); }
    LogRecord warn(std::string msg) const  { return log(LogLevel::Warn, std::move(msg)); }
    LogRecord error(std::string msg) const { return log(LogLevel::Error, std::move(msg)); }
    LogRecord fatal(std::string msg) const { return log(LogLevel::Fatal, std::move(msg)); }

    bool enabled(LogLevel level) const;

    const std::string& channel() const { return channelName; }
    LogLevel level() const { return threshold; }

    void flush();

private:
    friend class LogRecord;

    void write(LogLevel level, const std::string& msg,
               const nlohmann::ordered_json& fields) const;

    std::string appName;
    std::string channelName;
    LogLevel threshold;
    std::shared_ptr<LogSink> output;
    std::string hostname;
    long pid;
};
