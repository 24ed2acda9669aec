#pragma once
#include <exception>
#include <mutex>
#include <string>

class Logger;

// Receives unhandled failures from the request pipeline. A failure reported
// again right after itself (same exception object) is dropped; everything
// else goes to the error channel.
class ErrorReporter {
public:
    explicit ErrorReporter(const Logger& logger);

    ErrorReporter(const ErrorReporter&) = delete;
    ErrorReporter& operator=(const ErrorReporter&) = delete;

    // true if a record was written
    bool onError(std::exception_ptr err);

    // demangled dynamic type of the exception, "unknown" for non std::exception
    static std::string categoryOf(const std::exception_ptr& err);

private:
    const Logger& logger_;

    std::mutex mtx_;
    std::exception_ptr last_;
};
