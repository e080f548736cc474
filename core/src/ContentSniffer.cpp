#include "lv/core/util/ContentSniffer.hpp"

#include <array>
#include <cstring>
#include <string_view>
#include <utility>

#include "lv/core/util/TextUtils.hpp"

namespace lv {

namespace {

bool matchAt(const std::vector<uint8_t>& data, std::size_t offset, std::string_view sig)
{
    return data.size() >= offset + sig.size() &&
           std::memcmp(data.data() + offset, sig.data(), sig.size()) == 0;
}

struct Signature {
    std::size_t offset;
    std::string_view bytes;
    const char* ext;
};

using namespace std::string_view_literals;

// Checked in order; the first match wins
constexpr std::array kSignatures = {
    // images
    Signature{0, "\xFF\xD8\xFF"sv, "jpg"},
    Signature{0, "\x89PNG\r\n\x1A\n"sv, "png"},
    Signature{0, "GIF87a"sv, "gif"},
    Signature{0, "GIF89a"sv, "gif"},
    Signature{0, "II*\0"sv, "tif"},
    Signature{0, "MM\0*"sv, "tif"},
    Signature{0, "BM"sv, "bmp"},
    Signature{0, "8BPS"sv, "psd"},
    Signature{0, "\0\0\1\0"sv, "ico"},
    Signature{0, "\xFF\x0A"sv, "jxl"},
    Signature{0, "\0\0\0\x0CJXL \x0D\x0A\x87\x0A"sv, "jxl"},
    // video / containers
    Signature{0, "\x1A\x45\xDF\xA3"sv, "mkv"},
    Signature{0, "FLV"sv, "flv"},
    Signature{0, "\0\0\1\xBA"sv, "mpg"},
    Signature{0, "\0\0\1\xB3"sv, "mpg"},
    // audio
    Signature{0, "MThd"sv, "mid"},
    Signature{0, "OggS"sv, "ogg"},
    Signature{0, "#!AMR"sv, "amr"},
    // documents
    Signature{0, "%PDF"sv, "pdf"},
    Signature{0, "{\\rtf"sv, "rtf"},
    Signature{0, "SQLite format 3\0"sv, "sqlite"},
    // archives / compression
    Signature{0, "PK\3\4"sv, "zip"},
    Signature{0, "PK\5\6"sv, "zip"},
    Signature{257, "ustar"sv, "tar"},
    Signature{0, "Rar!\x1A\x07"sv, "rar"},
    Signature{0, "\x1F\x8B"sv, "gz"},
    Signature{0, "BZh"sv, "bz2"},
    Signature{0, "7z\xBC\xAF\x27\x1C"sv, "7z"},
    Signature{0, "\xFD" "7zXZ\0"sv, "xz"},
    Signature{0, "\x28\xB5\x2F\xFD"sv, "zst"},
    Signature{0, "\x04\x22\x4D\x18"sv, "lz4"},
    Signature{0, "\x93NUMPY"sv, "npy"},
    // fonts
    Signature{0, "wOFF"sv, "woff"},
    Signature{0, "wOF2"sv, "woff2"},
    Signature{0, "\0\1\0\0\0"sv, "ttf"},
    Signature{0, "OTTO"sv, "otf"},
    // executables
    Signature{0, "\0asm"sv, "wasm"},
    Signature{0, "\x7F" "ELF"sv, "elf"},
    Signature{0, "MZ"sv, "exe"},
    Signature{0, "\xCA\xFE\xBA\xBE"sv, "class"},
    Signature{0, "dex\n"sv, "dex"},
};

// ISO base media: "ftyp" box at 4, major brand at 8
std::optional<std::string> isoBrandExtension(const std::vector<uint8_t>& data)
{
    if (!matchAt(data, 4, "ftyp") || data.size() < 12) return std::nullopt;
    std::string brand(reinterpret_cast<const char*>(data.data() + 8), 4);
    if (brand == "avif" || brand == "avis") return "avif";
    if (brand == "heic" || brand == "heix" || brand == "mif1" || brand == "msf1") return "heic";
    if (brand == "M4A " || brand == "M4B ") return "m4a";
    if (brand == "M4V " || brand == "M4VH" || brand == "M4VP") return "m4v";
    if (brand == "qt  ") return "mov";
    if (brand.compare(0, 2, "3g") == 0) return "3gp";
    return "mp4";
}

std::optional<std::string> riffExtension(const std::vector<uint8_t>& data)
{
    if (!matchAt(data, 0, "RIFF")) return std::nullopt;
    if (matchAt(data, 8, "WEBP")) return "webp";
    if (matchAt(data, 8, "AVI ")) return "avi";
    if (matchAt(data, 8, "WAVE")) return "wav";
    return std::nullopt;
}

std::optional<std::string> keywordExtension(const std::string& lower)
{
    static constexpr std::array<std::pair<std::string_view, const char*>, 12> kKeywords = {{
        {"jpeg", "jpg"},
        {"jpg", "jpg"},
        {"pil", "png"},
        {"png", "png"},
        {"tiff", "tiff"},
        {"str", "txt"},
        {"string", "txt"},
        {"int", "txt"},
        {"float", "txt"},
        {"bool", "txt"},
        {"bytes", "bin"},
        {"audio", "wav"},
    }};
    for (const auto& [key, ext] : kKeywords) {
        if (lower == key) return std::string(ext);
    }
    if (lower.find("wav") != std::string::npos) return "wav";
    if (lower.find("mp3") != std::string::npos) return "mp3";
    if (lower.find("flac") != std::string::npos) return "flac";
    return std::nullopt;
}

// Steps 2-4 of the precedence: what the declared token says on its own
std::optional<std::string> declaredExtension(const std::string& token)
{
    if (auto colon = token.find(':'); colon != std::string::npos) {
        auto subtype = token.substr(colon + 1);
        if (!subtype.empty()) {
            auto trimmed = text::trim(subtype);
            auto first = trimmed.find_first_not_of('.');
            return first == std::string::npos ? std::string() : trimmed.substr(first);
        }
    }
    if (auto dot = token.rfind('.'); dot != std::string::npos && dot + 1 < token.size()) {
        return token.substr(dot + 1);
    }
    return keywordExtension(text::toLower(token));
}

}  // namespace

std::optional<std::string> detectMagicExtension(const std::vector<uint8_t>& data)
{
    if (data.size() >= 12 && matchAt(data, 0, "RIFF") && matchAt(data, 8, "WAVE")) {
        return "wav";
    }
    if (matchAt(data, 0, "ID3")) {
        return "mp3";
    }
    if (data.size() >= 2 && data[0] == 0xFF && (data[1] & 0xE0) == 0xE0) {
        return "mp3";
    }
    if (matchAt(data, 0, "fLaC")) {
        return "flac";
    }
    return std::nullopt;
}

std::optional<std::string> inferExtension(const std::vector<uint8_t>& data)
{
    if (auto riff = riffExtension(data)) return riff;
    if (auto iso = isoBrandExtension(data)) return iso;
    for (const auto& sig : kSignatures) {
        if (matchAt(data, sig.offset, sig.bytes)) {
            return std::string(sig.ext);
        }
    }
    if (auto audio = detectMagicExtension(data)) return audio;
    return std::nullopt;
}

std::optional<std::string> guessExtension(const std::optional<std::string>& formatToken,
                                          const std::vector<uint8_t>& data)
{
    if (formatToken) {
        const auto lower = text::toLower(*formatToken);
        if (lower == "bytes" || lower == "bin") {
            if (auto magic = detectMagicExtension(data)) return magic;
            return "bin";
        }
        if (auto declared = declaredExtension(*formatToken)) return declared;
    }

    if (auto magic = detectMagicExtension(data)) return magic;
    if (text::isValidUtf8(data)) {
        std::string s(data.begin(), data.end());
        if (!text::trim(s).empty()) return "txt";
    }
    return inferExtension(data);
}

}  // namespace lv
