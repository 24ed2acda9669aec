#pragma once
#include <cstddef>
#include <memory>
#include <string>

// Forward declarations for OpenSSL
typedef struct ssl_st SSL;
typedef struct ssl_ctx_st SSL_CTX;

// One accepted client socket. Plain TCP here, TLS in TlsConnection.
class Connection {
public:
    explicit Connection(int fd);
    virtual ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // bytes read, 0 when the peer closed, -1 on error or timeout
    virtual long read(char* buf, std::size_t len);

    // false as soon as the peer is gone
    virtual bool writeAll(const char* data, std::size_t len);

    // Non-blocking check: false once the peer closed or reset the socket.
    // Unread request bytes count as alive.
    virtual bool peerAlive();

    virtual void close();

    int fd() const { return sockFd; }

protected:
    int sockFd;
};

class TlsConnection : public Connection {
public:
    TlsConnection(int fd, SSL* ssl);
    ~TlsConnection() override;

    long read(char* buf, std::size_t len) override;
    bool writeAll(const char* data, std::size_t len) override;
    bool peerAlive() override;
    void close() override;

private:
    SSL* session;
};

// Server side SSL_CTX loaded from a PEM certificate and key.
class TlsContext {
public:
    // nullptr on failure, error describes why
    static std::unique_ptr<TlsContext> load(const std::string& certFile,
                                            const std::string& keyFile,
                                            std::string& error);
    ~TlsContext();

    TlsContext(const TlsContext&) = delete;
    TlsContext& operator=(const TlsContext&) = delete;

    // Runs the handshake on fd. On failure returns nullptr and leaves fd open.
    std::unique_ptr<Connection> accept(int fd, std::string& error);

private:
    explicit TlsContext(SSL_CTX* ctx) : sslCtx(ctx) {}

    SSL_CTX* sslCtx;
};
