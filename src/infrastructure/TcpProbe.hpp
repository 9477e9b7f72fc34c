/**
 * @file TcpProbe.hpp
 * @brief Bounded-time TCP reachability check.
 */

#pragma once
#include <chrono>
#include <string>

namespace missioncontrol::infrastructure {

enum class ProbeResult {
    Reachable,
    Unreachable
};

/**
 * @class TcpProbe
 * @brief Opens (and immediately closes) a TCP connection to test reachability.
 *
 * Refusal, timeout, name resolution failure and any other socket error all
 * collapse to Unreachable. The call never blocks longer than the budget
 * (plus name resolution of a non-numeric host).
 */
class TcpProbe {
public:
    static ProbeResult probe(const std::string& host, int port, std::chrono::milliseconds timeout);

    static bool isReachable(const std::string& host, int port, std::chrono::milliseconds timeout) {
        return probe(host, port, timeout) == ProbeResult::Reachable;
    }
};

} // namespace missioncontrol::infrastructure
