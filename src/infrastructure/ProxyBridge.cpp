#include "infrastructure/ProxyBridge.hpp"
#include <algorithm>
#include <httplib.h>
#include <iostream>
#include <utility>
#include "domain/TextUtils.hpp"

namespace missioncontrol::infrastructure {

using json = nlohmann::json;

namespace {

bool EndsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// "/a/b" matches "/a/b" and "/a/b/...", never "/a/bc".
bool HasPathPrefix(const std::string& path, const std::string& prefix) {
    if (path.compare(0, prefix.size(), prefix) != 0) return false;
    return path.size() == prefix.size() || path[prefix.size()] == '/';
}

} // namespace

ProxyBridge::ProxyBridge(domain::ProxyTarget target, domain::TimeoutBudgets budgets)
    : m_target(std::move(target)), m_budgets(budgets) {}

std::optional<UpstreamCall> ProxyBridge::rewrite(const std::string& method, const std::string& pathWithQuery) const {
    const auto queryPos = pathWithQuery.find('?');
    const std::string path = pathWithQuery.substr(0, queryPos);
    const std::string query = queryPos == std::string::npos ? "" : pathWithQuery.substr(queryPos + 1);

    for (const auto& rule : m_target.rules) {
        if (rule.method != method) continue;

        if (rule.match == domain::MatchKind::Exact) {
            if (path != rule.inbound) continue;
            std::string upstream = rule.upstream;
            if (!query.empty() && upstream.find('?') == std::string::npos) {
                upstream += "?" + query;
            }
            return UpstreamCall{upstream, rule.callClass};
        }

        if (!HasPathPrefix(path, rule.inbound)) continue;
        if (!rule.suffix.empty() && !EndsWith(path, rule.suffix)) continue;

        const std::string remainder = path.substr(rule.inbound.size());
        if (!rule.singleResourceUpstream.empty() && queryPos == std::string::npos && remainder.size() > 1) {
            return UpstreamCall{rule.singleResourceUpstream + remainder, rule.callClass};
        }

        std::string upstream = rule.upstream + remainder;
        if (queryPos != std::string::npos) {
            upstream += "?" + query;
        }
        return UpstreamCall{upstream, rule.callClass};
    }
    return std::nullopt;
}

ProxyResult ProxyBridge::forward(const std::string& method, const std::string& pathWithQuery,
                                 const std::string& body) const {
    auto call = rewrite(method, pathWithQuery);
    if (!call) {
        return ProxyResult::Failure(domain::ErrorEnvelope{"Not found", std::nullopt}, 404);
    }
    return send(method, call->path, body, call->callClass);
}

ProxyResult ProxyBridge::send(const std::string& method, const std::string& upstreamPath, const std::string& body,
                              domain::CallClass callClass) const {
    const auto budget = m_budgets.forClass(callClass);
    const auto connectBudget = std::min(budget, m_budgets.health);

    httplib::Client cli(m_target.host, m_target.port);
    cli.set_connection_timeout(connectBudget);
    cli.set_read_timeout(budget);
    cli.set_write_timeout(budget);

    httplib::Headers headers{{"Accept", "application/json"}};
    if (!m_target.bearerToken.empty()) {
        headers.emplace("Authorization", "Bearer " + m_target.bearerToken);
    }

    httplib::Result res = method == "POST"
        ? cli.Post(upstreamPath, headers, body.empty() ? std::string("{}") : body, "application/json")
        : cli.Get(upstreamPath, headers);

    if (!res) {
        const std::string message = httplib::to_string(res.error());
        std::cerr << "[ProxyBridge] " << m_target.name << " " << method << " " << upstreamPath
                  << " failed: " << message << std::endl;
        return ProxyResult::Failure(domain::ErrorEnvelope{message, std::nullopt});
    }

    if (res->status < 200 || res->status >= 300) {
        std::cerr << "[ProxyBridge] " << m_target.name << " " << method << " " << upstreamPath
                  << " HTTP Error " << res->status << std::endl;
        return ProxyResult::Failure(domain::ErrorEnvelope{
            "HTTP " + std::to_string(res->status),
            domain::TruncateUtf8(res->body, domain::ErrorEnvelope::kMaxDetailLength)});
    }

    try {
        return ProxyResult{200, json::parse(res->body), true};
    } catch (const json::parse_error& e) {
        std::cerr << "[ProxyBridge] JSON Parse Error from " << m_target.name << upstreamPath << ": " << e.what()
                  << std::endl;
        return ProxyResult::Failure(domain::ErrorEnvelope{e.what(), std::nullopt});
    }
}

} // namespace missioncontrol::infrastructure
