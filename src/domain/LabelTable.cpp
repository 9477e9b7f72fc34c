#include "domain/LabelTable.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

namespace missioncontrol::domain {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

std::string NormalizeProjectIdentity(const std::string& projectPath) {
    std::string path = projectPath;
    std::replace(path.begin(), path.end(), '\\', '/');
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    size_t slash = path.find_last_of('/');
    std::string segment = (slash == std::string::npos) ? path : path.substr(slash + 1);
    if (segment.empty()) return "unknown";
    return ToLower(segment);
}

std::string TitleCaseIdentity(const std::string& identity) {
    if (identity.empty()) return "Unknown";
    std::string out;
    out.reserve(identity.size());
    bool previousIsLetter = false;
    for (char ch : identity) {
        unsigned char c = static_cast<unsigned char>(ch == '-' || ch == '_' ? ' ' : ch);
        if (std::isalpha(c)) {
            out.push_back(static_cast<char>(previousIsLetter ? std::tolower(c) : std::toupper(c)));
            previousIsLetter = true;
        } else {
            out.push_back(static_cast<char>(c));
            previousIsLetter = false;
        }
    }
    return out;
}

LabelTable::LabelTable(std::vector<LabelRule> rules, std::vector<MessageLabelRule> messageRules)
    : m_rules(std::move(rules)), m_messageRules(std::move(messageRules)) {
    for (auto& rule : m_rules) {
        rule.match = ToLower(rule.match);
    }
    for (auto& rule : m_messageRules) {
        for (auto& keyword : rule.keywords) {
            keyword = ToLower(keyword);
        }
    }
}

LabelTable LabelTable::Defaults() {
    return LabelTable(
        {
            {"profit-desk", "Multi-Agent Trading System"},
            {"exo", "Scratchpad Learning System"},
            {"project-hub", "Mission Control Dashboard"},
            {"openclaw", "OpenClaw Agent Setup"},
            {"master-trade-bot", "Master Trade Bot"},
            {"tax-prep-system", "Tax Prep System"},
            {"harmony-medspa", "Harmony Medspa App"},
            {"jumpquest", "Jump Quest Game"},
            {"frontier-bastion", "Crown & Conquest RTS"},
            {"solana-bot", "Solana Token Sniper"},
            {"polymarket-sniper", "Polymarket Sniper"},
            {"polymarketbtc15massistant", "Polymarket BTC 15m Assistant"},
            {"e2ee-messenger", "E2EE P2P Messenger"},
            {"trading-shared", "Trading Shared Foundation"},
            {"lancewfisher-splash", "Lance Fisher Splash Page"},
            {"market-dashboard", "Market Dashboard"},
            {"auton", "Auton Background Worker"}
        },
        {
            {{"security", "harden"}, "Security Hardening"}
        });
}

std::string LabelTable::resolve(const std::string& identity, const std::string& firstMessage) const {
    const std::string slug = ToLower(identity);
    if (!slug.empty()) {
        for (const auto& rule : m_rules) {
            if (!rule.match.empty() && slug.find(rule.match) != std::string::npos) {
                return rule.label;
            }
        }
    }

    if (!firstMessage.empty()) {
        const std::string message = ToLower(firstMessage);
        for (const auto& rule : m_messageRules) {
            for (const auto& keyword : rule.keywords) {
                if (!keyword.empty() && message.find(keyword) != std::string::npos) {
                    return rule.label;
                }
            }
        }
    }

    return TitleCaseIdentity(slug);
}

} // namespace missioncontrol::domain
