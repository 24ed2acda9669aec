#pragma once
#include <stdexcept>
#include <string>

// Typed failure surfaced by FetchClient::fetch().
class FetchError : public std::runtime_error {
public:
    enum class Kind {
        ConnectFailed,
        Timeout,
        BadStatus,
        TooManyRedirects,
        BodyTooLarge,
        Aborted,
        PoolTimeout,
        Closed,
        Transport,
    };

    FetchError(Kind kind, std::string url, const std::string& message, long status = 0);

    Kind kind() const noexcept { return kind_; }
    const std::string& url() const noexcept { return url_; }

    // upstream HTTP status, 0 when no response was received
    long status() const noexcept { return status_; }

    static const char* kindName(Kind kind) noexcept;

private:
    Kind kind_;
    std::string url_;
    long status_;
};
