/**
 * @file FileSystemArtifactCounter.hpp
 * @brief Counts on-disk artifacts (journal lines, memory files) for presence adapters.
 */

#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace missioncontrol::infrastructure {

/**
 * @class FileSystemArtifactCounter
 * @brief Infrastructure helper that never throws; absence is reported as std::nullopt.
 */
class FileSystemArtifactCounter {
public:
    /** @brief Number of non-blank lines in a text file. */
    static std::optional<std::size_t> countNonBlankLines(const std::filesystem::path& file);

    /**
     * @brief Number of regular files directly inside a directory.
     * @param extension Case-insensitive filter such as ".md"; empty counts every file.
     */
    static std::optional<std::size_t> countFiles(const std::filesystem::path& directory,
                                                 const std::string& extension);
};

} // namespace missioncontrol::infrastructure
