#include "monitor/Logger.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

// ISO8601, UTC, millisecond precision
static std::string nowIso8601() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << ms << 'Z';
    return oss.str();
}

static std::string hostName() {
    char buf[256] = {0};
    if (gethostname(buf, sizeof(buf) - 1) != 0) {
        return "localhost";
    }
    return buf;
}

LogLevel parseLogLevel(const std::string& name, LogLevel fallback) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (n == "trace") return LogLevel::Trace;
    if (n == "debug") return LogLevel::Debug;
    if (n == "info")  return LogLevel::Info;
    if (n == "warn" || n == "warning") return LogLevel::Warn;
    if (n == "error") return LogLevel::Error;
    if (n == "fatal") return LogLevel::Fatal;
    return fallback;
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Fatal: return "fatal";
    }
    return "info";
}

// =======================
//  LogRecord
// =======================
LogRecord::LogRecord(const Logger* logger, LogLevel level, std::string msg)
    : owner(logger),
      recLevel(level),
      message(std::move(msg)),
      fields(nlohmann::ordered_json::object()) {}

LogRecord::LogRecord(LogRecord&& other) noexcept
    : owner(other.owner),
      recLevel(other.recLevel),
      message(std::move(other.message)),
      fields(std::move(other.fields)) {
    other.owner = nullptr;
}

LogRecord::~LogRecord() {
    close();
}

void LogRecord::close() {
    if (!owner) return;
    const Logger* logger = owner;
    owner = nullptr;
    logger->write(recLevel, message, fields);
}

// =======================
//  Logger
// =======================
Logger::Logger(std::string application, std::string channel, LogLevel level,
               std::shared_ptr<LogSink> sink)
    : appName(std::move(application)),
      channelName(std::move(channel)),
      threshold(level),
      output(std::move(sink)),
      hostname(hostName()),
      pid(static_cast<long>(getpid())) {
    if (!output) {
        throw std::invalid_argument("Logger '" + channelName + "' requires a sink");
    }
}

bool Logger::enabled(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(threshold);
}

LogRecord Logger::log(LogLevel level, std::string msg) const {
    return LogRecord(enabled(level) ? this : nullptr, level, std::move(msg));
}

void Logger::flush() {
    output->flush();
}

void Logger::write(LogLevel level, const std::string& msg,
                   const nlohmann::ordered_json& fields) const {
    nlohmann::ordered_json rec;
    rec["v"]        = 0;
    rec["name"]     = appName;
    rec["channel"]  = channelName;
    rec["hostname"] = hostname;
    rec["pid"]      = pid;
    rec["level"]    = static_cast<int>(level);
    rec["msg"]      = msg;
    rec["time"]     = nowIso8601();

    for (auto it = fields.begin(); it != fields.end(); ++it) {
        rec[it.key()] = it.value();
    }

    // replace invalid UTF-8 (paths, upstream messages) instead of throwing
    output->write(rec.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace));
}
