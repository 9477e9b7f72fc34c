#include "infrastructure/SessionLogReader.hpp"
#include <chrono>
#include <cmath>
#include <fstream>
#include <iostream>
#include <optional>
#include <nlohmann/json.hpp>
#include "domain/TextUtils.hpp"

namespace missioncontrol::infrastructure {

using json = nlohmann::json;

namespace {

// Widest epoch offset, in milliseconds, that a TimePoint can hold.
const long long kMaxEpochMillis =
    std::chrono::duration_cast<std::chrono::milliseconds>(domain::TimePoint::duration::max()).count();

std::optional<long long> ReadEpochMillis(const json& ts) {
    if (ts.is_number_unsigned()) {
        const auto value = ts.get<unsigned long long>();
        if (value > static_cast<unsigned long long>(kMaxEpochMillis)) return std::nullopt;
        return static_cast<long long>(value);
    }
    if (ts.is_number_integer()) {
        const auto value = ts.get<long long>();
        if (value > kMaxEpochMillis || value < -kMaxEpochMillis) return std::nullopt;
        return value;
    }
    const double value = ts.get<double>();
    if (!std::isfinite(value) || std::fabs(value) > static_cast<double>(kMaxEpochMillis)) return std::nullopt;
    return static_cast<long long>(value);
}

std::optional<domain::SessionEntry> ParseLine(const std::string& line) {
    try {
        json j = json::parse(line);
        if (!j.is_object()) return std::nullopt;

        domain::SessionEntry entry;
        entry.sessionId = j.value("sessionId", std::string("unknown"));
        entry.project = j.value("project", std::string("unknown"));
        entry.preview = domain::TruncateUtf8(j.value("display", std::string()), SessionLogReader::kPreviewLength);

        long long millis = 0;
        if (j.contains("timestamp") && !j["timestamp"].is_null()) {
            const json& ts = j["timestamp"];
            if (!ts.is_number()) return std::nullopt;
            auto parsed = ReadEpochMillis(ts);
            if (!parsed) return std::nullopt;
            millis = *parsed;
        }
        entry.timestamp = domain::FromEpochMillis(millis);
        return entry;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

} // namespace

SessionLogReader::SessionLogReader(std::filesystem::path logFile)
    : m_logFile(std::move(logFile)) {}

std::vector<domain::SessionEntry> SessionLogReader::readAll() const {
    std::error_code ec;
    if (!std::filesystem::exists(m_logFile, ec)) {
        return {};
    }

    std::ifstream f(m_logFile);
    if (!f.is_open()) {
        std::cerr << "[SessionLogReader] Could not open " << m_logFile.string() << std::endl;
        return {};
    }

    size_t skipped = 0;
    auto entries = parse(f, &skipped);
    if (skipped > 0) {
        std::cerr << "[SessionLogReader] Skipped " << skipped << " malformed line(s) in "
                  << m_logFile.string() << std::endl;
    }
    return entries;
}

std::vector<domain::SessionEntry> SessionLogReader::parse(std::istream& in, size_t* skippedLines) {
    std::vector<domain::SessionEntry> entries;
    size_t skipped = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r\n") == std::string::npos) continue;
        if (auto entry = ParseLine(line)) {
            entries.push_back(std::move(*entry));
        } else {
            ++skipped;
        }
    }
    if (skippedLines) *skippedLines = skipped;
    return entries;
}

} // namespace missioncontrol::infrastructure
