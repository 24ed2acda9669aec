#include "error/ErrorReporter.hpp"

#include <cxxabi.h>

#include <cstdlib>
#include <memory>
#include <typeinfo>

#include "fetch/FetchError.hpp"
#include "monitor/Logger.hpp"

static std::string demangle(const char* name) {
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> out(
        abi::__cxa_demangle(name, nullptr, nullptr, &status), std::free);
    if (status == 0 && out) return out.get();
    return name;
}

ErrorReporter::ErrorReporter(const Logger& logger) : logger_(logger) {}

std::string ErrorReporter::categoryOf(const std::exception_ptr& err) {
    if (!err) return "unknown";
    try {
        std::rethrow_exception(err);
    } catch (...) {
        const std::type_info* type = abi::__cxa_current_exception_type();
        return type ? demangle(type->name()) : "unknown";
    }
}

bool ErrorReporter::onError(std::exception_ptr err) {
    if (!err) return false;

    {
        std::lock_guard<std::mutex> lock(mtx_);
        // identity, not content: exception_ptr equality means same object
        if (last_ == err) {
            return false;
        }
        last_ = err;
    }

    auto record = logger_.error(categoryOf(err));
    try {
        std::rethrow_exception(err);
    } catch (const FetchError& e) {
        record.add("type", "fetch")
              .add("kind", FetchError::kindName(e.kind()))
              .add("url", e.url())
              .add("status", e.status())
              .add("detail", e.what());
    } catch (const std::exception& e) {
        record.add("type", "exception").add("detail", e.what());
    } catch (...) {
        record.add("type", "unknown").add("detail", "non-standard exception");
    }
    bool written = record.active();
    record.close();
    return written;
}
