// Index and config documents: loading plus field access helpers
#pragma once

#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>

namespace lv::json {

/**
 * Read a JSON document, transparently decompressing it when the file
 * extension (lowercased) contains "zst".
 * @throws lv::Error Io when the file cannot be read, Invalid when it cannot
 *         be decompressed or parsed
 */
nlohmann::json load_json_file(const std::filesystem::path& path);

/// Text of a (possibly zstd-compressed) document, without parsing it.
std::string read_text_file(const std::filesystem::path& path);

bool is_zstd_path(const std::filesystem::path& path);

/// Serialize for output; byte sequences that are not UTF-8 (file names taken
/// from disk) become U+FFFD instead of failing. indent < 0 is compact.
std::string dump_json(const nlohmann::json& doc, int indent = -1);

/**
 * Check that @p json is an object carrying every name in @p fields.
 * @throws lv::Error Invalid naming the first missing field
 */
void require_fields(
    const nlohmann::json& json,
    std::initializer_list<const char*> fields,
    const std::string& context);

// Loose accessors for optional config members; a missing or mistyped value
// yields def. number_or also accepts numeric strings.
double number_or(const nlohmann::json* m, const char* key, double def);

std::string string_or(const nlohmann::json* m, const char* key, const std::string& def);

bool bool_or(const nlohmann::json* m, const char* key, bool def);

// Typed optional members: absent or null -> nullopt, wrong type -> Invalid.
std::optional<std::string> optional_string(const nlohmann::json& m, const char* key, const std::string& context);
std::optional<uint32_t> optional_u32(const nlohmann::json& m, const char* key, const std::string& context);
std::optional<uint64_t> optional_u64(const nlohmann::json& m, const char* key, const std::string& context);

} // namespace lv::json
