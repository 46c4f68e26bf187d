#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace freqcard {

// =============================================================================
// UTF-8 Decoding
// =============================================================================

inline std::uint32_t decodeUtf8Codepoint(std::string_view content, std::size_t pos, std::uint32_t& byteLen) {
    const std::size_t n = content.size();
    if (pos >= n) {
        byteLen = 0;
        return 0;
    }

    const unsigned char c0 = static_cast<unsigned char>(content[pos]);
    if ((c0 & 0x80) == 0) {
        byteLen = 1;
        return c0;
    }

    if ((c0 & 0xE0) == 0xC0 && pos + 1 < n) {
        const unsigned char c1 = static_cast<unsigned char>(content[pos + 1]);
        if ((c1 & 0xC0) != 0x80) {
            byteLen = 1;
            return 0xFFFD;
        }
        byteLen = 2;
        return ((c0 & 0x1F) << 6) | (c1 & 0x3F);
    }

    if ((c0 & 0xF0) == 0xE0 && pos + 2 < n) {
        const unsigned char c1 = static_cast<unsigned char>(content[pos + 1]);
        const unsigned char c2 = static_cast<unsigned char>(content[pos + 2]);
        if ((c1 & 0xC0) != 0x80 || (c2 & 0xC0) != 0x80) {
            byteLen = 1;
            return 0xFFFD;
        }
        byteLen = 3;
        return ((c0 & 0x0F) << 12) | ((c1 & 0x3F) << 6) | (c2 & 0x3F);
    }

    if ((c0 & 0xF8) == 0xF0 && pos + 3 < n) {
        const unsigned char c1 = static_cast<unsigned char>(content[pos + 1]);
        const unsigned char c2 = static_cast<unsigned char>(content[pos + 2]);
        const unsigned char c3 = static_cast<unsigned char>(content[pos + 3]);
        if ((c1 & 0xC0) != 0x80 || (c2 & 0xC0) != 0x80 || (c3 & 0xC0) != 0x80) {
            byteLen = 1;
            return 0xFFFD;
        }
        byteLen = 4;
        return ((c0 & 0x07) << 18) | ((c1 & 0x3F) << 12) | ((c2 & 0x3F) << 6) | (c3 & 0x3F);
    }

    byteLen = 1;
    return 0xFFFD;
}

/**
 * Decode a UTF-8 string into codepoints. Malformed sequences decode to U+FFFD.
 */
inline std::vector<std::uint32_t> decodeUtf8(std::string_view content) {
    std::vector<std::uint32_t> out;
    out.reserve(content.size());
    std::size_t pos = 0;
    while (pos < content.size()) {
        std::uint32_t byteLen = 0;
        const std::uint32_t cp = decodeUtf8Codepoint(content, pos, byteLen);
        if (byteLen == 0) break;
        out.push_back(cp);
        pos += byteLen;
    }
    return out;
}

/**
 * Number of codepoints (not bytes) in a UTF-8 string.
 */
inline std::size_t codepointCount(std::string_view content) {
    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < content.size()) {
        std::uint32_t byteLen = 0;
        decodeUtf8Codepoint(content, pos, byteLen);
        if (byteLen == 0) break;
        pos += byteLen;
        ++count;
    }
    return count;
}

/**
 * Byte offset of the first byte of the codepoint at logical position `index`.
 * Returns content.size() when index is past the end.
 */
inline std::size_t codepointToByteOffset(std::string_view content, std::size_t index) {
    std::size_t pos = 0;
    std::size_t count = 0;
    while (pos < content.size() && count < index) {
        std::uint32_t byteLen = 0;
        decodeUtf8Codepoint(content, pos, byteLen);
        if (byteLen == 0) break;
        pos += byteLen;
        ++count;
    }
    return pos;
}

/**
 * Remove the last `count` codepoints. Removing more than the string holds yields "".
 */
inline std::string dropLastCodepoints(std::string_view content, std::size_t count) {
    const std::size_t total = codepointCount(content);
    if (count >= total) {
        return std::string();
    }
    return std::string(content.substr(0, codepointToByteOffset(content, total - count)));
}

// =============================================================================
// Words
// =============================================================================

inline bool isAsciiSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

/**
 * Split on runs of whitespace. Leading/trailing whitespace produces no empty tokens.
 */
inline std::vector<std::string> splitWords(std::string_view text) {
    std::vector<std::string> words;
    std::size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && isAsciiSpace(text[i])) ++i;
        const std::size_t start = i;
        while (i < text.size() && !isAsciiSpace(text[i])) ++i;
        if (i > start) {
            words.emplace_back(text.substr(start, i - start));
        }
    }
    return words;
}

inline std::string joinWords(const std::vector<std::string>& words, std::size_t count) {
    std::string out;
    for (std::size_t i = 0; i < count && i < words.size(); ++i) {
        if (i > 0) out += ' ';
        out += words[i];
    }
    return out;
}

inline std::string joinWords(const std::vector<std::string>& words) {
    return joinWords(words, words.size());
}

inline std::string toLowerAscii(std::string_view text) {
    std::string out(text);
    for (char& c : out) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return out;
}

} // namespace freqcard
