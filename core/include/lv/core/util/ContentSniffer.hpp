#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lv {

/**
 * @brief Audio signatures checked before anything else
 *
 * RIFF....WAVE -> wav, ID3 or an MPEG frame sync -> mp3, fLaC -> flac
 */
std::optional<std::string> detectMagicExtension(const std::vector<uint8_t>& data);

/**
 * @brief Generic byte-signature lookup (images, video, audio, documents,
 * archives, fonts, executables)
 */
std::optional<std::string> inferExtension(const std::vector<uint8_t>& data);

/**
 * @brief File extension for field bytes
 *
 * Precedence:
 *  1. token "bytes"/"bin": magic signature, else "bin"
 *  2. "name:subtype" -> subtype (trimmed, leading dots dropped)
 *  3. "name.ext" -> text after the last dot
 *  4. keyword table, then wav/mp3/flac substrings
 *  5. magic signature, non-blank UTF-8 -> "txt", generic signature
 */
std::optional<std::string> guessExtension(const std::optional<std::string>& formatToken,
                                          const std::vector<uint8_t>& data);

}  // namespace lv
