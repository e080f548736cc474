#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lv::text {

/// Strict UTF-8 check (no overlongs, surrogates or code points past U+10FFFF)
bool isValidUtf8(const uint8_t* data, std::size_t len);
inline bool isValidUtf8(const std::vector<uint8_t>& data) { return isValidUtf8(data.data(), data.size()); }

/// First @p maxChars code points of valid UTF-8 text
std::string truncateChars(const std::string& utf8, std::size_t maxChars);

/// Lowercase hex of the first @p maxBytes bytes
std::string hexEncode(const std::vector<uint8_t>& data, std::size_t maxBytes);

std::string toLower(std::string s);

/// Strip Unicode whitespace (ASCII whitespace plus U+0085, U+00A0, U+1680,
/// U+2000..U+200A, U+2028, U+2029, U+202F, U+205F, U+3000) from both ends
std::string trim(const std::string& utf8);

/// Every character that is not an ASCII letter or digit becomes '-'
std::string sanitizeFilename(const std::string& name);

}  // namespace lv::text
