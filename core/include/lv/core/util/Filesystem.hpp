#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace lv {

namespace fs = std::filesystem;

/// Fresh uniquely named directory under the system temp directory, Io on failure
fs::path create_temp_directory(const std::string& prefix = "tmp");

/**
 * @brief create_directories that reports failure as lv::Error (Io)
 */
void ensure_directory(const fs::path& dir);

/**
 * @brief Write @p bytes to @p path, replacing any existing file
 * @throws lv::Error Io when the file cannot be created or written
 */
void write_file(const fs::path& path, const std::vector<uint8_t>& bytes);

}  // namespace lv
