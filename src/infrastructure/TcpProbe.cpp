/**
 * @file TcpProbe.cpp
 * @brief Non-blocking connect + poll implementation of TcpProbe.
 */

#include "infrastructure/TcpProbe.hpp"
#include <cerrno>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace missioncontrol::infrastructure {

namespace {

using Clock = std::chrono::steady_clock;

class AddrInfoList {
public:
    ~AddrInfoList() {
        if (m_head) freeaddrinfo(m_head);
    }
    addrinfo** out() { return &m_head; }
    addrinfo* head() const { return m_head; }

private:
    addrinfo* m_head = nullptr;
};

class SocketHandle {
public:
    explicit SocketHandle(int fd) : m_fd(fd) {}
    ~SocketHandle() {
        if (m_fd >= 0) ::close(m_fd);
    }
    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;
    int fd() const { return m_fd; }

private:
    int m_fd;
};

bool ConnectWithin(const addrinfo* addr, Clock::time_point deadline) {
    SocketHandle sock(::socket(addr->ai_family, addr->ai_socktype | SOCK_CLOEXEC, addr->ai_protocol));
    if (sock.fd() < 0) return false;

    int flags = ::fcntl(sock.fd(), F_GETFL, 0);
    if (flags < 0 || ::fcntl(sock.fd(), F_SETFL, flags | O_NONBLOCK) < 0) return false;

    if (::connect(sock.fd(), addr->ai_addr, addr->ai_addrlen) == 0) return true;
    if (errno != EINPROGRESS) return false;

    pollfd pfd{};
    pfd.fd = sock.fd();
    pfd.events = POLLOUT;

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0) return false;

        int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (ready == 0) return false;
        break;
    }

    int soError = 0;
    socklen_t len = sizeof(soError);
    if (::getsockopt(sock.fd(), SOL_SOCKET, SO_ERROR, &soError, &len) < 0) return false;
    return soError == 0;
}

} // namespace

ProbeResult TcpProbe::probe(const std::string& host, int port, std::chrono::milliseconds timeout) {
    if (port <= 0 || port > 65535 || timeout.count() <= 0) {
        return ProbeResult::Unreachable;
    }

    const auto deadline = Clock::now() + timeout;

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    AddrInfoList addrs;
    const std::string service = std::to_string(port);
    if (::getaddrinfo(host.c_str(), service.c_str(), &hints, addrs.out()) != 0) {
        return ProbeResult::Unreachable;
    }

    for (const addrinfo* ai = addrs.head(); ai != nullptr; ai = ai->ai_next) {
        if (Clock::now() >= deadline) break;
        if (ConnectWithin(ai, deadline)) {
            return ProbeResult::Reachable;
        }
    }
    return ProbeResult::Unreachable;
}

} // namespace missioncontrol::infrastructure
