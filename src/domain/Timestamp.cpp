#include "domain/Timestamp.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace missioncontrol::domain {

namespace {

std::time_t ToUtcTimeT(std::tm& tm) {
#if defined(_WIN32)
    return _mkgmtime(&tm);
#else
    return timegm(&tm);
#endif
}

std::tm ToUtcTm(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    return tm;
}

bool ReadNumber(const std::string& text, size_t pos, size_t width, int& out) {
    if (pos + width > text.size()) return false;
    int value = 0;
    for (size_t i = pos; i < pos + width; ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (!std::isdigit(c)) return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

std::string Trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

} // namespace

TimePoint FromEpochMillis(long long millis) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(millis)));
}

std::optional<TimePoint> ParseIsoTimestamp(const std::string& raw) {
    const std::string text = Trim(raw);

    int year = 0, month = 0, day = 0;
    if (text.size() < 10 || text[4] != '-' || text[7] != '-') return std::nullopt;
    if (!ReadNumber(text, 0, 4, year) || !ReadNumber(text, 5, 2, month) || !ReadNumber(text, 8, 2, day)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) return std::nullopt;

    int hour = 23, minute = 59, second = 59;
    long long micros = 0;
    int offsetSeconds = 0;

    if (text.size() > 10) {
        char sep = text[10];
        if (sep != 'T' && sep != 't' && sep != ' ') return std::nullopt;
        if (!ReadNumber(text, 11, 2, hour) || text.size() < 16 || text[13] != ':' ||
            !ReadNumber(text, 14, 2, minute)) {
            return std::nullopt;
        }
        second = 0;
        size_t pos = 16;
        if (pos < text.size() && text[pos] == ':') {
            if (!ReadNumber(text, pos + 1, 2, second)) return std::nullopt;
            pos += 3;
            if (pos < text.size() && (text[pos] == '.' || text[pos] == ',')) {
                ++pos;
                size_t digits = 0;
                while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                    if (digits < 6) micros = micros * 10 + (text[pos] - '0');
                    ++digits;
                    ++pos;
                }
                if (digits == 0) return std::nullopt;
                for (size_t i = digits; i < 6; ++i) micros *= 10;
            }
        }

        if (pos < text.size()) {
            char zone = text[pos];
            if ((zone == 'Z' || zone == 'z') && pos + 1 == text.size()) {
                offsetSeconds = 0;
            } else if (zone == '+' || zone == '-') {
                int offHour = 0, offMinute = 0;
                if (!ReadNumber(text, pos + 1, 2, offHour)) return std::nullopt;
                size_t minutePos = pos + 3;
                if (minutePos < text.size() && text[minutePos] == ':') ++minutePos;
                if (!ReadNumber(text, minutePos, 2, offMinute) || minutePos + 2 != text.size()) {
                    return std::nullopt;
                }
                offsetSeconds = (offHour * 3600 + offMinute * 60) * (zone == '-' ? -1 : 1);
            } else {
                return std::nullopt;
            }
        }
        if (hour > 23 || minute > 59 || second > 60) return std::nullopt;
    }

    std::tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    std::time_t utc = ToUtcTimeT(tm);
    if (utc == static_cast<std::time_t>(-1)) return std::nullopt;

    TimePoint tp = std::chrono::system_clock::from_time_t(utc - offsetSeconds);
    return tp + std::chrono::duration_cast<TimePoint::duration>(std::chrono::microseconds(micros));
}

std::string ToIsoString(TimePoint tp) {
    auto sinceEpoch = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch());
    long long totalMillis = sinceEpoch.count();
    long long seconds = totalMillis / 1000;
    long long millis = totalMillis % 1000;
    if (millis < 0) {
        millis += 1000;
        seconds -= 1;
    }

    std::tm tm = ToUtcTm(static_cast<std::time_t>(seconds));
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
       << std::setw(3) << std::setfill('0') << millis << 'Z';
    return ss.str();
}

std::string ToShortDate(TimePoint tp) {
    std::tm tm = ToUtcTm(std::chrono::system_clock::to_time_t(tp));
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M");
    return ss.str();
}

} // namespace missioncontrol::domain
