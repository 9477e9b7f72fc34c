#include <cassert>
#include <chrono>
#include <iostream>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "infrastructure/TcpProbe.hpp"

using namespace missioncontrol::infrastructure;
using namespace std::chrono;

namespace {

// Loopback listener on an ephemeral port. Returns the fd; port written to `port`.
int OpenListener(int& port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    assert(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    assert(::listen(fd, 4) == 0);

    socklen_t len = sizeof(addr);
    assert(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    port = ntohs(addr.sin_port);
    return fd;
}

} // namespace

int main() {
    std::cout << "[Test] Starting TcpProbe Test..." << std::endl;

    int port = 0;
    int listener = OpenListener(port);
    assert(TcpProbe::probe("127.0.0.1", port, milliseconds(1000)) == ProbeResult::Reachable);
    assert(TcpProbe::isReachable("localhost", port, milliseconds(1000)));
    std::cout << "[PASS] Listening port is reachable." << std::endl;

    // Closing the listener leaves a port nobody listens on.
    ::close(listener);
    const auto timeout = milliseconds(500);
    auto start = steady_clock::now();
    assert(TcpProbe::probe("127.0.0.1", port, timeout) == ProbeResult::Unreachable);
    auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start);
    assert(elapsed < timeout + milliseconds(250));
    std::cout << "[PASS] Closed port is unreachable in " << elapsed.count() << "ms." << std::endl;

    // Invalid input never throws.
    assert(TcpProbe::probe("127.0.0.1", 0, timeout) == ProbeResult::Unreachable);
    assert(TcpProbe::probe("127.0.0.1", 70000, timeout) == ProbeResult::Unreachable);
    assert(TcpProbe::probe("127.0.0.1", port, milliseconds(0)) == ProbeResult::Unreachable);
    assert(TcpProbe::probe("", port, timeout) == ProbeResult::Unreachable);
    std::cout << "[PASS] Invalid arguments collapse to Unreachable." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
