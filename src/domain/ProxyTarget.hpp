/**
 * @file ProxyTarget.hpp
 * @brief Declarative description of one bridged subordinate REST API.
 */

#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace missioncontrol::domain {

/**
 * @enum CallClass
 * @brief Selects the timeout budget of a forwarded call.
 */
enum class CallClass {
    Health,     ///< Cheap liveness checks.
    Standard,   ///< Reads.
    Action,     ///< State-changing commands (approve, kill, ...).
    Dispatch    ///< Task execution that may run substantial downstream work.
};

/** @brief Budgets per call class. */
struct TimeoutBudgets {
    std::chrono::milliseconds health{3000};
    std::chrono::milliseconds standard{10000};
    std::chrono::milliseconds action{30000};
    std::chrono::milliseconds dispatch{300000};

    std::chrono::milliseconds forClass(CallClass callClass) const {
        switch (callClass) {
            case CallClass::Health: return health;
            case CallClass::Standard: return standard;
            case CallClass::Action: return action;
            case CallClass::Dispatch: return dispatch;
        }
        return standard;
    }
};

enum class MatchKind {
    Exact,
    Prefix
};

/**
 * @struct RewriteRule
 * @brief Maps an inbound path under the bridge namespace onto the upstream namespace.
 *
 * Prefix rules replace `inbound` by `upstream` and keep the remainder, query included.
 * When `singleResourceUpstream` is set, `<inbound>/<id>` without a query is mapped
 * onto it instead (collection vs. single-resource GET live under different roots).
 * A non-empty `suffix` further restricts a prefix rule to paths ending with it.
 */
struct RewriteRule {
    std::string method;
    MatchKind match = MatchKind::Exact;
    std::string inbound;
    std::string upstream;
    std::string suffix;
    std::string singleResourceUpstream;
    CallClass callClass = CallClass::Standard;
};

struct ProxyTarget {
    std::string name;
    std::string host = "127.0.0.1";
    int port = 0;
    std::string bearerToken;
    std::vector<RewriteRule> rules;
};

/**
 * @struct ErrorEnvelope
 * @brief Uniform failure shape for every bridged call.
 */
struct ErrorEnvelope {
    static constexpr size_t kMaxDetailLength = 500;

    std::string error;
    std::optional<std::string> detail;

    nlohmann::json toJson() const {
        nlohmann::json j = {{"error", error}};
        if (detail) j["detail"] = *detail;
        return j;
    }
};

} // namespace missioncontrol::domain
