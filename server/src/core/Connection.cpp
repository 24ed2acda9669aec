#include "core/Connection.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <thread>

// OpenSSL
#include <openssl/err.h>
#include <openssl/ssl.h>

static std::string lastSslError() {
    unsigned long code = ERR_get_error();
    if (code == 0) return "unknown TLS error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}

// =======================
//  Plain TCP
// =======================
Connection::Connection(int fd) : sockFd(fd) {}

Connection::~Connection() {
    Connection::close();
}

long Connection::read(char* buf, std::size_t len) {
    while (true) {
        ssize_t n = ::recv(sockFd, buf, len, 0);
        if (n < 0 && errno == EINTR) continue;
        return n < 0 ? -1 : static_cast<long>(n);
    }
}

bool Connection::writeAll(const char* data, std::size_t len) {
    std::size_t total = 0;
    while (total < len) {
        ssize_t sent = ::send(sockFd, data + total, len - total, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        total += static_cast<std::size_t>(sent);
    }
    return true;
}

bool Connection::peerAlive() {
    if (sockFd < 0) return false;
    char c;
    while (true) {
        ssize_t n = ::recv(sockFd, &c, 1, MSG_PEEK | MSG_DONTWAIT);
        if (n > 0) return true;
        if (n == 0) return false;
        if (errno == EINTR) continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

void Connection::close() {
    if (sockFd >= 0) {
        ::close(sockFd);
        sockFd = -1;
    }
}

// =======================
//  TLS
// =======================
TlsConnection::TlsConnection(int fd, SSL* ssl) : Connection(fd), session(ssl) {}

TlsConnection::~TlsConnection() {
    TlsConnection::close();
}

long TlsConnection::read(char* buf, std::size_t len) {
    while (true) {
        int n = SSL_read(session, buf, static_cast<int>(len));
        if (n > 0) return n;

        int err = SSL_get_error(session, n);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
            continue;
        }
        if (err == SSL_ERROR_ZERO_RETURN) return 0;
        ERR_clear_error();
        return -1;
    }
}

bool TlsConnection::writeAll(const char* data, std::size_t len) {
    std::size_t total = 0;
    int retries = 0;

    while (total < len) {
        int sent = SSL_write(session, data + total, static_cast<int>(len - total));
        if (sent <= 0) {
            int err = SSL_get_error(session, sent);
            if ((err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ) && retries++ < 1000) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                continue;
            }
            ERR_clear_error();
            return false;
        }
        retries = 0;
        total += static_cast<std::size_t>(sent);
    }
    return true;
}

bool TlsConnection::peerAlive() {
    if (!session) return false;
    // close_notify already read
    if (SSL_get_shutdown(session) & SSL_RECEIVED_SHUTDOWN) return false;
    return Connection::peerAlive();
}

void TlsConnection::close() {
    if (session) {
        SSL_shutdown(session);
        SSL_free(session);
        session = nullptr;
    }
    Connection::close();
}

std::unique_ptr<TlsContext> TlsContext::load(const std::string& certFile,
                                             const std::string& keyFile,
                                             std::string& error) {
    OPENSSL_init_ssl(0, nullptr);

    SSL_CTX* ctx = SSL_CTX_new(TLS_server_method());
    if (!ctx) {
        error = "SSL_CTX_new failed: " + lastSslError();
        return nullptr;
    }

    if (SSL_CTX_use_certificate_chain_file(ctx, certFile.c_str()) <= 0 ||
        SSL_CTX_use_PrivateKey_file(ctx, keyFile.c_str(), SSL_FILETYPE_PEM) <= 0 ||
        SSL_CTX_check_private_key(ctx) != 1) {
        error = "cannot load certificate/key (" + certFile + ", " + keyFile + "): " + lastSslError();
        SSL_CTX_free(ctx);
        return nullptr;
    }

    return std::unique_ptr<TlsContext>(new TlsContext(ctx));
}

TlsContext::~TlsContext() {
    if (sslCtx) {
        SSL_CTX_free(sslCtx);
        sslCtx = nullptr;
    }
}

std::unique_ptr<Connection> TlsContext::accept(int fd, std::string& error) {
    SSL* ssl = SSL_new(sslCtx);
    if (!ssl) {
        error = "SSL_new failed: " + lastSslError();
        return nullptr;
    }
    SSL_set_fd(ssl, fd);

    if (SSL_accept(ssl) <= 0) {
        error = "SSL_accept failed: " + lastSslError();
        SSL_free(ssl);
        return nullptr;
    }
    return std::unique_ptr<Connection>(new TlsConnection(fd, ssl));
}
