#pragma once

#include <cstddef>
#include <filesystem>

#include <nlohmann/json_fwd.hpp>

#include "lv/core/util/ChunkCache.hpp"

namespace lv {

/**
 * @brief Tunables of an inspection engine
 *
 * JSON keys (all optional): cache_max_entry_bytes, cache_max_total_bytes,
 * preview_bytes, preview_chars, hex_snippet_bytes, worker_threads, temp_dir,
 * launch_viewer.
 */
struct EngineConfig {
    std::size_t cacheMaxEntryBytes = ChunkCache::kDefaultMaxEntryBytes;
    std::size_t cacheMaxTotalBytes = 0;  // 0 = never evict
    std::size_t previewBytes = 2048;
    std::size_t previewChars = 400;
    std::size_t hexSnippetBytes = 48;
    unsigned workerThreads = 0;  // 0 = hardware concurrency
    std::filesystem::path tempDir;  // empty = <system temp>/litview
    bool launchViewer = true;

    /// Directory exported fields are written to
    std::filesystem::path exportDir() const;

    nlohmann::json toJson() const;

    /// Overlay the keys present in @p j onto @p base
    static EngineConfig fromJson(const nlohmann::json& j, const EngineConfig& base);
    static EngineConfig fromJson(const nlohmann::json& j);

    /// @throws lv::Error Io / Invalid when the file cannot be read or parsed
    static EngineConfig load(const std::filesystem::path& path, const EngineConfig& base);
    static EngineConfig load(const std::filesystem::path& path);
};

}  // namespace lv
