#ifndef PIIREDACTOR_UTIL_UTF8_HPP
#define PIIREDACTOR_UTIL_UTF8_HPP

#include <string>
#include <vector>
#include <cstddef>
#include "core/errors.hpp"

/**
 * @file utf8.hpp
 * @brief UTF-8 <-> code point conversion and whitespace helpers.
 *
 * Span offsets are code point indices (that is what the detectors emit), so every
 * text unit is decoded once into a std::u32string and sliced there. Decoding is
 * strict: a malformed sequence throws TextEncodingError rather than being replaced,
 * because a replacement character would break the exact round trip.
 */

namespace piiredactor {
namespace util {
namespace utf8 {

inline std::u32string decode(const std::string &text)
{
    std::u32string out;
    out.reserve(text.size());

    const unsigned char *data = reinterpret_cast<const unsigned char *>(text.data());
    const size_t length = text.size();
    size_t i = 0;
    while (i < length) {
        unsigned char byte = data[i];
        size_t extra = 0;
        char32_t cp = 0;
        if (byte < 0x80) {
            out.push_back(static_cast<char32_t>(byte));
            ++i;
            continue;
        } else if ((byte >> 5) == 0x6) {
            extra = 1;
            cp = byte & 0x1F;
        } else if ((byte >> 4) == 0xE) {
            extra = 2;
            cp = byte & 0x0F;
        } else if ((byte >> 3) == 0x1E) {
            extra = 3;
            cp = byte & 0x07;
        } else {
            throw TextEncodingError("invalid UTF-8 lead byte at offset " + std::to_string(i));
        }

        if (i + extra >= length) {
            throw TextEncodingError("truncated UTF-8 sequence at offset " + std::to_string(i));
        }
        for (size_t k = 1; k <= extra; ++k) {
            unsigned char cont = data[i + k];
            if ((cont >> 6) != 0x2) {
                throw TextEncodingError("invalid UTF-8 continuation byte at offset " +
                                        std::to_string(i + k));
            }
            cp = (cp << 6) | (cont & 0x3F);
        }
        static const char32_t minimum[] = {0, 0x80, 0x800, 0x10000};
        if (cp < minimum[extra] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            throw TextEncodingError("invalid UTF-8 code point at offset " + std::to_string(i));
        }
        out.push_back(cp);
        i += extra + 1;
    }
    return out;
}

inline void appendCodePoint(char32_t cp, std::string &out)
{
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

inline std::string encode(const std::u32string &text)
{
    std::string out;
    out.reserve(text.size() * 2);
    for (char32_t cp : text) {
        appendCodePoint(cp, out);
    }
    return out;
}

inline std::string encode(const std::u32string &text, size_t start, size_t end)
{
    return encode(text.substr(start, end - start));
}

/**
 * @brief Unicode White_Space property (the set str.split() honours).
 */
inline bool isSpace(char32_t c)
{
    switch (c) {
    case U' ': case U'\t': case U'\n': case U'\v': case U'\f': case U'\r':
    case 0x1C: case 0x1D: case 0x1E: case 0x1F:
    case 0x85: case 0xA0: case 0x1680:
    case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
        return true;
    default:
        return c >= 0x2000 && c <= 0x200A;
    }
}

inline bool isBlank(const std::u32string &text)
{
    for (char32_t c : text) {
        if (!isSpace(c)) {
            return false;
        }
    }
    return true;
}

inline std::vector<std::u32string> splitWhitespace(const std::u32string &text)
{
    std::vector<std::u32string> tokens;
    std::u32string current;
    for (char32_t c : text) {
        if (isSpace(c)) {
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }
    return tokens;
}

} // namespace utf8
} // namespace util
} // namespace piiredactor

#endif // PIIREDACTOR_UTIL_UTF8_HPP
