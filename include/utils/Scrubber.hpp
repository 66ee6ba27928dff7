#pragma once
#include <string>
#include <vector>

namespace code_sanitizer {

// Normalizes model output before classification. UTF-8 text is kept intact;
// only bytes that break line splitting or trimming are rewritten.
inline std::string scrub_code_text(const std::string& str) {
    std::string out;
    out.reserve(str.size());

    size_t i = 0;
    // 1. Drop a UTF-8 byte order mark
    if (str.compare(0, 3, "\xEF\xBB\xBF") == 0) i = 3;

    for (; i < str.size(); ++i) {
        unsigned char c = (unsigned char)str[i];

        // 2. CRLF and lone CR become LF
        if (c == 0x0D) {
            out += '\n';
            if (i + 1 < str.size() && str[i + 1] == '\n') ++i;
            continue;
        }
        if (c == 0x0A || c == 0x09) {
            out += (char)c;
            continue;
        }
        // 3. Other control bytes become a space
        if (c < 0x20 || c == 0x7F) {
            out += ' ';
            continue;
        }
        // 4. Zero-width characters (U+200B..U+200D, U+2060, U+FEFF) vanish,
        //    NBSP (U+00A0) becomes a plain space
        if (c == 0xE2 && i + 2 < str.size() && (unsigned char)str[i + 1] == 0x80 &&
            ((unsigned char)str[i + 2] >= 0x8B && (unsigned char)str[i + 2] <= 0x8D)) {
            i += 2;
            continue;
        }
        if (c == 0xE2 && i + 2 < str.size() && (unsigned char)str[i + 1] == 0x81 &&
            (unsigned char)str[i + 2] == 0xA0) {
            i += 2;
            continue;
        }
        if (c == 0xEF && i + 2 < str.size() && (unsigned char)str[i + 1] == 0xBB &&
            (unsigned char)str[i + 2] == 0xBF) {
            i += 2;
            continue;
        }
        if (c == 0xC2 && i + 1 < str.size() && (unsigned char)str[i + 1] == 0xA0) {
            out += ' ';
            ++i;
            continue;
        }
        out += (char)c;
    }
    return out;
}

// For each line of scrub_code_text(str), the '\n'-delimited line of str it
// came from. A lone CR splits a raw line in two.
inline std::vector<int> scrubbed_line_origins(const std::string& str) {
    std::vector<int> origins{0};
    int raw_line = 0;
    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '\n') {
            origins.push_back(++raw_line);
        } else if (str[i] == '\r' && (i + 1 >= str.size() || str[i + 1] != '\n')) {
            origins.push_back(raw_line);
        }
    }
    return origins;
}

}
