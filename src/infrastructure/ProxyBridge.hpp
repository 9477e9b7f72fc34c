/**
 * @file ProxyBridge.hpp
 * @brief Forwards a reserved path namespace to one subordinate REST API.
 */

#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/ProxyTarget.hpp"

namespace missioncontrol::infrastructure {

/**
 * @struct ProxyResult
 * @brief What the router sends back: the upstream JSON or an ErrorEnvelope.
 *
 * Upstream failures are data and travel with status 200. Only an inbound path
 * that no rule covers yields 404.
 */
struct ProxyResult {
    int status = 200;
    nlohmann::json body;
    bool ok = true;  ///< False when `body` is an ErrorEnvelope.

    static ProxyResult Failure(const domain::ErrorEnvelope& envelope, int status = 200) {
        return ProxyResult{status, envelope.toJson(), false};
    }
};

/** @brief Outcome of matching an inbound request against the rule list. */
struct UpstreamCall {
    std::string path;              ///< Upstream path including its query.
    domain::CallClass callClass = domain::CallClass::Standard;
};

/**
 * @class ProxyBridge
 * @brief Stateless forwarder; one httplib::Client per call, no retries.
 */
class ProxyBridge {
public:
    ProxyBridge(domain::ProxyTarget target, domain::TimeoutBudgets budgets);

    /** @brief First matching rule in declaration order, or std::nullopt. */
    std::optional<UpstreamCall> rewrite(const std::string& method, const std::string& pathWithQuery) const;

    /**
     * @brief Rewrites and sends.
     * @param pathWithQuery Inbound request target, query string verbatim.
     * @param body JSON text sent on POST; empty means `{}`.
     */
    ProxyResult forward(const std::string& method, const std::string& pathWithQuery, const std::string& body) const;

    /** @brief Sends to an already-known upstream path. */
    ProxyResult send(const std::string& method, const std::string& upstreamPath, const std::string& body,
                     domain::CallClass callClass) const;

    const domain::ProxyTarget& target() const { return m_target; }

private:
    domain::ProxyTarget m_target;
    domain::TimeoutBudgets m_budgets;
};

} // namespace missioncontrol::infrastructure
