#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace ragloop::text {

// Length of the well-formed UTF-8 sequence starting at data[i], or 0 when it is malformed.
// Overlong forms, UTF-16 surrogates and code points above U+10FFFF are malformed (RFC 3629).
inline size_t utf8SequenceLength(const unsigned char* data, size_t i, size_t n) {
    auto inRange = [&](size_t idx, unsigned char lo, unsigned char hi) {
        return idx < n && data[idx] >= lo && data[idx] <= hi;
    };
    const unsigned char c = data[i];
    if (c < 0x80) {
        return 1;
    }
    if (c >= 0xC2 && c <= 0xDF) {
        return inRange(i + 1, 0x80, 0xBF) ? 2 : 0;
    }
    if (c >= 0xE0 && c <= 0xEF) {
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (c == 0xE0) {
            lo = 0xA0;
        } else if (c == 0xED) {
            hi = 0x9F;
        }
        return inRange(i + 1, lo, hi) && inRange(i + 2, 0x80, 0xBF) ? 3 : 0;
    }
    if (c >= 0xF0 && c <= 0xF4) {
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (c == 0xF0) {
            lo = 0x90;
        } else if (c == 0xF4) {
            hi = 0x8F;
        }
        return inRange(i + 1, lo, hi) && inRange(i + 2, 0x80, 0xBF) && inRange(i + 3, 0x80, 0xBF)
                   ? 4
                   : 0;
    }
    return 0;
}

inline bool isValidUtf8(std::string_view input) {
    const auto* data = reinterpret_cast<const unsigned char*>(input.data());
    const size_t n = input.size();
    for (size_t i = 0; i < n;) {
        const size_t width = utf8SequenceLength(data, i, n);
        if (width == 0) {
            return false;
        }
        i += width;
    }
    return true;
}

// Replace invalid UTF-8 byte sequences with '?' so text can be embedded in JSON payloads.
inline std::string sanitizeUtf8(std::string_view input) {
    std::string out;
    out.reserve(input.size());

    const auto* data = reinterpret_cast<const unsigned char*>(input.data());
    const size_t n = input.size();
    size_t i = 0;
    while (i < n) {
        const size_t width = utf8SequenceLength(data, i, n);
        if (width == 0) {
            out.push_back('?');
            ++i;
        } else {
            out.append(input.substr(i, width));
            i += width;
        }
    }
    return out;
}

// At most maxBytes bytes of text, never splitting a multi-byte character.
inline std::string truncateUtf8(std::string_view input, size_t maxBytes) {
    if (input.size() <= maxBytes) {
        return std::string(input);
    }
    size_t cut = maxBytes;
    while (cut > 0 && (static_cast<unsigned char>(input[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return std::string(input.substr(0, cut));
}

inline std::string toLower(std::string_view input) {
    std::string out(input);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

inline std::string trimCopy(std::string_view input) {
    size_t b = 0;
    size_t e = input.size();
    while (b < e && std::isspace(static_cast<unsigned char>(input[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(input[e - 1])))
        --e;
    return std::string(input.substr(b, e - b));
}

inline bool isBlank(std::string_view input) {
    return std::all_of(input.begin(), input.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace ragloop::text
