#include "lv/core/util/TextUtils.hpp"

#include <algorithm>
#include <cctype>

namespace lv::text {

namespace {

bool isUnicodeSpace(uint32_t cp)
{
    switch (cp) {
        case 0x09: case 0x0A: case 0x0B: case 0x0C: case 0x0D: case 0x20:
        case 0x85: case 0xA0: case 0x1680:
        case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
            return true;
        default:
            return cp >= 0x2000 && cp <= 0x200A;
    }
}

// Code point starting at s[pos]; s must be valid UTF-8
uint32_t decodeAt(const std::string& s, std::size_t pos, std::size_t& len)
{
    auto b0 = static_cast<uint8_t>(s[pos]);
    if (b0 < 0x80) { len = 1; return b0; }
    uint32_t cp;
    if ((b0 & 0xE0) == 0xC0) { len = 2; cp = b0 & 0x1F; }
    else if ((b0 & 0xF0) == 0xE0) { len = 3; cp = b0 & 0x0F; }
    else { len = 4; cp = b0 & 0x07; }
    for (std::size_t k = 1; k < len && pos + k < s.size(); ++k) {
        cp = (cp << 6) | (static_cast<uint8_t>(s[pos + k]) & 0x3F);
    }
    return cp;
}

bool isContinuation(char c)
{
    return (static_cast<uint8_t>(c) & 0xC0) == 0x80;
}

}  // namespace

bool isValidUtf8(const uint8_t* data, std::size_t len)
{
    std::size_t i = 0;
    while (i < len) {
        uint8_t b0 = data[i];
        if (b0 < 0x80) {
            ++i;
            continue;
        }

        std::size_t need;
        uint32_t cp;
        uint32_t minCp;
        if ((b0 & 0xE0) == 0xC0) { need = 1; cp = b0 & 0x1F; minCp = 0x80; }
        else if ((b0 & 0xF0) == 0xE0) { need = 2; cp = b0 & 0x0F; minCp = 0x800; }
        else if ((b0 & 0xF8) == 0xF0) { need = 3; cp = b0 & 0x07; minCp = 0x10000; }
        else return false;

        if (len - i - 1 < need) return false;
        for (std::size_t k = 1; k <= need; ++k) {
            uint8_t b = data[i + k];
            if ((b & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (b & 0x3F);
        }
        if (cp < minCp || cp > 0x10FFFF) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;
        i += need + 1;
    }
    return true;
}

std::string truncateChars(const std::string& utf8, std::size_t maxChars)
{
    std::size_t chars = 0;
    for (std::size_t i = 0; i < utf8.size(); ++i) {
        if (isContinuation(utf8[i])) continue;
        if (chars == maxChars) return utf8.substr(0, i);
        ++chars;
    }
    return utf8;
}

std::string hexEncode(const std::vector<uint8_t>& data, std::size_t maxBytes)
{
    static constexpr char kDigits[] = "0123456789abcdef";
    const std::size_t n = std::min(maxBytes, data.size());
    std::string out;
    out.reserve(n * 2);
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(kDigits[data[i] >> 4]);
        out.push_back(kDigits[data[i] & 0x0F]);
    }
    return out;
}

std::string toLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& utf8)
{
    std::size_t begin = 0;
    while (begin < utf8.size()) {
        std::size_t len = 1;
        if (!isUnicodeSpace(decodeAt(utf8, begin, len))) break;
        begin += len;
    }

    std::size_t end = utf8.size();
    while (end > begin) {
        std::size_t start = end - 1;
        while (start > begin && isContinuation(utf8[start])) --start;
        std::size_t len = 1;
        if (!isUnicodeSpace(decodeAt(utf8, start, len))) break;
        end = start;
    }
    return utf8.substr(begin, end - begin);
}

std::string sanitizeFilename(const std::string& name)
{
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        // one '-' per multi-byte character
        if (isContinuation(c)) continue;
        out.push_back(std::isalnum(static_cast<unsigned char>(c)) && static_cast<unsigned char>(c) < 0x80 ? c : '-');
    }
    return out;
}

}  // namespace lv::text
