/**
 * @file ProjectRecord.hpp
 * @brief Read model of one entry in the on-disk project registry.
 */

#pragma once
#include <string>

namespace missioncontrol::domain {

/**
 * @class ProjectRecord
 * @brief Fields the service reads from the registry. The registry owner writes it.
 */
class ProjectRecord {
public:
    std::string name;
    std::string path;
    std::string status;
    std::string description;
    std::string lastActive;        ///< Raw `last_active` text, parsed lazily.
    bool pinned = false;
};

} // namespace missioncontrol::domain
