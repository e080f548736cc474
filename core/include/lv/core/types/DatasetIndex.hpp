#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace lv {

/// "config" block of an index document
struct IndexConfig {
    std::optional<std::string> compression;
    std::optional<uint32_t> chunkSize;
    std::optional<uint64_t> chunkBytes;
    std::optional<std::vector<std::string>> dataFormat;
    std::optional<std::string> dataSpec;

    /// Number of per-item field-size header entries (0 when undeclared)
    std::size_t fieldCount() const { return dataFormat ? dataFormat->size() : 0; }

    /// Declared format token of a field, if any
    std::optional<std::string> formatToken(std::size_t fieldIndex) const;

    /// The five known keys, absent ones as null
    nlohmann::json toJson() const;
    static IndexConfig fromJson(const nlohmann::json& j, const std::string& context);
};

/// One entry of the index "chunks" table
struct ChunkRecord {
    std::string filename;
    uint64_t chunkBytes = 0;
    uint32_t chunkSize = 0;
    std::optional<uint32_t> dim;

    static ChunkRecord fromJson(const nlohmann::json& j, const std::string& context);
};

/**
 * @brief Normalized description of a dataset, rebuilt for every query
 */
struct DatasetIndex {
    std::filesystem::path rootDir;
    std::filesystem::path source;
    IndexConfig config;
    nlohmann::json configRaw;
    std::vector<ChunkRecord> chunks;

    std::filesystem::path chunkPath(const std::string& filename) const { return rootDir / filename; }
};

/**
 * @brief Dataset built from an explicit list of chunk files
 *
 * locations maps each selected filename to the path it was given as.
 */
struct ChunkListing {
    DatasetIndex index;
    std::vector<std::pair<std::string, std::filesystem::path>> locations;

    std::filesystem::path locate(const std::string& filename) const;
};

/// Fixed index names tried, in order, before falling back to a glob
extern const char* const kIndexCandidates[6];

/// True for .bin/.zst files (case-insensitive) or names containing ".bin"
bool isChunkPath(const std::filesystem::path& path);

/// Index document inside @p dir: fixed candidates first, then the
/// lexicographically first "*.index.json" / "*.index.json.*" entry
std::optional<std::filesystem::path> findIndexInDirectory(const std::filesystem::path& dir);

/// Index document next to a chunk file
std::optional<std::filesystem::path> findNeighborIndex(const std::filesystem::path& chunkPath);

/**
 * @brief Turn a user path into an existing index document path
 * @throws lv::Error Missing when nothing matches
 */
std::filesystem::path resolveIndexPath(const std::filesystem::path& path);

/**
 * @brief Parse an index document (plain or zstd)
 * @throws lv::Error Invalid on malformed content, Io on read failure
 */
DatasetIndex parseIndexFile(const std::filesystem::path& path);

/**
 * @brief Describe a lone chunk that has no index: one chunk, one "bytes" field
 */
DatasetIndex parseChunkOnly(const std::filesystem::path& chunkPath);

/**
 * @brief Resolve any user path (index, directory, chunk, stem) to a dataset
 */
DatasetIndex resolveDataset(const std::filesystem::path& input);

/**
 * @brief Build a dataset from explicitly selected chunk files
 * @throws lv::Error Invalid if @p paths is empty
 */
ChunkListing resolveChunkList(const std::vector<std::filesystem::path>& paths);

}  // namespace lv
