#include "core/Socket.hpp"
#include <sys/socket.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <iostream>
#include <netinet/tcp.h>   // TCP_NODELAY

Socket::Socket() {
    serverFd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (serverFd < 0) {
        std::cerr << "[ERROR] Cannot create socket\n";
        return;
    }

    int opt = 1;

    if (setsockopt(serverFd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        std::cerr << "[WARN] setsockopt SO_REUSEADDR failed\n";
    }

    if (setsockopt(serverFd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt)) < 0) {
        std::cerr << "[WARN] setsockopt TCP_NODELAY failed\n";
    }
}

Socket::~Socket() {
    closeSocket();
}

bool Socket::bind(int port) {
    if (serverFd < 0) return false;

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port   = htons(static_cast<uint16_t>(port));
    addr.sin_addr.s_addr = INADDR_ANY;

    return ::bind(serverFd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) >= 0;
}

bool Socket::listen() {
    return serverFd >= 0 && ::listen(serverFd, 1024) >= 0;
}

int Socket::acceptClient(std::string* remote) {
    sockaddr_in peer{};
    socklen_t len = sizeof(peer);
    int fd = ::accept4(serverFd, reinterpret_cast<sockaddr*>(&peer), &len, SOCK_CLOEXEC);
    if (fd >= 0 && remote) {
        char ip[INET_ADDRSTRLEN] = {0};
        if (inet_ntop(AF_INET, &peer.sin_addr, ip, sizeof(ip))) {
            *remote = std::string(ip) + ":" + std::to_string(ntohs(peer.sin_port));
        } else {
            *remote = "unknown";
        }
    }
    return fd;
}

int Socket::localPort() const {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (serverFd < 0 || getsockname(serverFd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return -1;
    }
    return ntohs(addr.sin_port);
}

void Socket::shutdown() {
    if (serverFd >= 0) {
        ::shutdown(serverFd, SHUT_RDWR);
    }
}

void Socket::closeSocket() {
    if (serverFd >= 0) {
        ::close(serverFd);
        serverFd = -1;
    }
}
