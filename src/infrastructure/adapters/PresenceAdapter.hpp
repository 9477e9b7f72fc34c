/**
 * @file PresenceAdapter.hpp
 * @brief Adapter for installed-but-not-networked systems.
 */

#pragma once
#include "domain/SystemAdapter.hpp"
#include "infrastructure/HubConfig.hpp"

namespace missioncontrol::infrastructure::adapters {

/**
 * @class PresenceAdapter
 * @brief `installed` when the install directory exists, else `missing`.
 *
 * The detail is built from a counted artifact: the non-blank lines of a journal
 * file, or the files with a given extension in a directory. `{count}` in the
 * detail template is replaced by the count.
 */
class PresenceAdapter : public domain::SystemAdapter {
public:
    explicit PresenceAdapter(const AdapterSpec& spec);

    domain::SystemStatus describe() const override;
    domain::SystemStatus unresponsive() const override;

private:
    std::string staticDetail() const;

    AdapterSpec m_spec;
};

} // namespace missioncontrol::infrastructure::adapters
