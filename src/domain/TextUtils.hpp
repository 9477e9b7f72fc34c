#pragma once
#include <string>

namespace missioncontrol::domain {

/** @brief Cuts after `maxChars` UTF-8 code points, never inside a multi-byte sequence. */
inline std::string TruncateUtf8(const std::string& text, size_t maxChars) {
    size_t chars = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if ((c & 0xC0) != 0x80) {
            if (chars == maxChars) return text.substr(0, i);
            ++chars;
        }
    }
    return text;
}

} // namespace missioncontrol::domain
