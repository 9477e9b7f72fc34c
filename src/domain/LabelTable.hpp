/**
 * @file LabelTable.hpp
 * @brief Operator-maintained mapping from project identity to a human label.
 */

#pragma once
#include <string>
#include <vector>

namespace missioncontrol::domain {

/** @brief First rule whose `match` is a substring of the identity wins. */
struct LabelRule {
    std::string match;
    std::string label;
};

/** @brief Secondary rule: any keyword found in the session's first message. */
struct MessageLabelRule {
    std::vector<std::string> keywords;
    std::string label;
};

/**
 * @brief Reduces a project path to its identity: final path segment, lower-cased,
 *        trailing separators stripped. Windows separators are accepted.
 * @return "unknown" for an empty path.
 */
std::string NormalizeProjectIdentity(const std::string& projectPath);

/** @brief "my-cool_app" -> "My Cool App". */
std::string TitleCaseIdentity(const std::string& identity);

/**
 * @class LabelTable
 * @brief Ordered rule list evaluated in priority order.
 */
class LabelTable {
public:
    LabelTable() = default;
    LabelTable(std::vector<LabelRule> rules, std::vector<MessageLabelRule> messageRules);

    /** @brief The built-in table used when the configuration does not provide one. */
    static LabelTable Defaults();

    /**
     * @brief Resolves the label for an identity.
     * @param identity Normalized project identity.
     * @param firstMessage Only consulted by message rules; empty disables them.
     */
    std::string resolve(const std::string& identity, const std::string& firstMessage = "") const;

    const std::vector<LabelRule>& rules() const { return m_rules; }
    const std::vector<MessageLabelRule>& messageRules() const { return m_messageRules; }

private:
    std::vector<LabelRule> m_rules;
    std::vector<MessageLabelRule> m_messageRules;
};

} // namespace missioncontrol::domain
