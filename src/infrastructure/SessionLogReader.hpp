/**
 * @file SessionLogReader.hpp
 * @brief Reads the append-only, newline-delimited JSON session log.
 */

#pragma once
#include <filesystem>
#include <istream>
#include <vector>
#include "domain/SessionRecord.hpp"

namespace missioncontrol::infrastructure {

/**
 * @class SessionLogReader
 * @brief Parses one SessionEntry per line; malformed lines are skipped individually.
 *
 * The log is never written. A missing file yields no entries.
 */
class SessionLogReader {
public:
    static constexpr size_t kPreviewLength = 200;

    explicit SessionLogReader(std::filesystem::path logFile);

    std::vector<domain::SessionEntry> readAll() const;

    /** @brief Parses a stream; exposed for callers that already hold the content. */
    static std::vector<domain::SessionEntry> parse(std::istream& in, size_t* skippedLines = nullptr);

private:
    std::filesystem::path m_logFile;
};

} // namespace missioncontrol::infrastructure
