#include "fetch/FetchError.hpp"

#include <utility>

FetchError::FetchError(Kind kind, std::string url, const std::string& message, long status)
    : std::runtime_error(message),
      kind_(kind),
      url_(std::move(url)),
      status_(status) {}

const char* FetchError::kindName(Kind kind) noexcept {
    switch (kind) {
        case Kind::ConnectFailed:    return "connect_failed";
        case Kind::Timeout:          return "timeout";
        case Kind::BadStatus:        return "bad_status";
        case Kind::TooManyRedirects: return "too_many_redirects";
        case Kind::BodyTooLarge:     return "body_too_large";
        case Kind::Aborted:          return "aborted";
        case Kind::PoolTimeout:      return "pool_timeout";
        case Kind::Closed:           return "closed";
        case Kind::Transport:        return "transport";
    }
    return "transport";
}
