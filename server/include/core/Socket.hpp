#pragma once
#include <string>

// Listening TCP socket (IPv4, all interfaces).
class Socket {
public:
    Socket();
    ~Socket();

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    bool valid() const { return serverFd >= 0; }

    // port 0 picks an ephemeral port, see localPort()
    bool bind(int port);
    bool listen();

    // -1 on failure (errno set); remote receives "ip:port"
    int acceptClient(std::string* remote = nullptr);

    int localPort() const;

    // wakes a thread blocked in acceptClient()
    void shutdown();
    void closeSocket();

private:
    int serverFd;
};
