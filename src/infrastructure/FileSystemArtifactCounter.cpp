/**
 * @file FileSystemArtifactCounter.cpp
 * @brief Implementation of the FileSystemArtifactCounter.
 */

#include "infrastructure/FileSystemArtifactCounter.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>

namespace fs = std::filesystem;

namespace missioncontrol::infrastructure {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

std::optional<std::size_t> FileSystemArtifactCounter::countNonBlankLines(const fs::path& file) {
    std::error_code ec;
    if (file.empty() || !fs::is_regular_file(file, ec)) {
        return std::nullopt;
    }

    std::ifstream in(file);
    if (!in.is_open()) {
        return std::nullopt;
    }

    std::size_t count = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r\n") != std::string::npos) {
            ++count;
        }
    }
    return count;
}

std::optional<std::size_t> FileSystemArtifactCounter::countFiles(const fs::path& directory,
                                                                 const std::string& extension) {
    std::error_code ec;
    if (directory.empty() || !fs::is_directory(directory, ec)) {
        return std::nullopt;
    }

    const std::string wanted = ToLower(extension);
    std::size_t count = 0;
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        // Convert extension to lowercase for robust check
        if (!wanted.empty() && ToLower(it->path().extension().string()) != wanted) continue;
        ++count;
    }
    if (ec) {
        return std::nullopt;
    }
    return count;
}

} // namespace missioncontrol::infrastructure
