#include "utils/utf8_sanitize.hpp"

#include <cstddef>
#include <utility>

namespace utf8_sanitize {

namespace {

const char kReplacementUtf8[] = "\xEF\xBF\xBD"; // U+FFFD

// Length of the well-formed sequence starting at position, or 0.
// Ranges follow the "Well-Formed UTF-8 Byte Sequences" table of Unicode.
size_t sequence_length(const unsigned char *position, const unsigned char *end) {
    unsigned char lead = position[0];
    size_t available = static_cast<size_t>(end - position);

    if (lead < 0x80u) {
        return 1;
    }

    size_t length = 0;
    unsigned char second_low = 0x80u;
    unsigned char second_high = 0xBFu;

    if (lead >= 0xC2u && lead <= 0xDFu) {
        length = 2;
    } else if (lead == 0xE0u) {
        length = 3;
        second_low = 0xA0u;
    } else if (lead == 0xEDu) {
        length = 3;
        second_high = 0x9Fu;
    } else if (lead >= 0xE1u && lead <= 0xEFu) {
        length = 3;
    } else if (lead == 0xF0u) {
        length = 4;
        second_low = 0x90u;
    } else if (lead == 0xF4u) {
        length = 4;
        second_high = 0x8Fu;
    } else if (lead >= 0xF1u && lead <= 0xF3u) {
        length = 4;
    } else {
        return 0;
    }

    if (available < length) {
        return 0;
    }
    if (position[1] < second_low || position[1] > second_high) {
        return 0;
    }
    for (size_t index = 2; index < length; ++index) {
        if ((position[index] & 0xC0u) != 0x80u) {
            return 0;
        }
    }
    return length;
}

} // namespace

void sanitize(std::string &text) {
    std::string result;
    result.reserve(text.size());

    const unsigned char *pointer = reinterpret_cast<const unsigned char *>(text.data());
    const unsigned char *end = pointer + text.size();

    while (pointer < end) {
        size_t length = sequence_length(pointer, end);
        if (length == 0) {
            result.append(kReplacementUtf8, sizeof(kReplacementUtf8) - 1);
            ++pointer;
            continue;
        }
        result.append(reinterpret_cast<const char *>(pointer), length);
        pointer += length;
    }

    text = std::move(result);
}

std::string clean_line(const std::string &raw_line) {
    std::string line = raw_line;
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    sanitize(line);
    return line;
}

} // namespace utf8_sanitize
