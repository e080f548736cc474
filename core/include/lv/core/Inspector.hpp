#pragma once

#include <cstdint>
#include <filesystem>
#include <future>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lv/core/Config.hpp"
#include "lv/core/types/ChunkLayout.hpp"
#include "lv/core/types/DatasetIndex.hpp"
#include "lv/core/util/ChunkCache.hpp"
#include "lv/core/util/Launcher.hpp"
#include "lv/core/util/WorkerPool.hpp"

namespace lv {

struct ChunkSummary {
    std::string filename;
    std::filesystem::path path;
    uint32_t chunkSize = 0;
    uint64_t chunkBytes = 0;
    std::optional<uint32_t> dim;
    bool exists = false;

    nlohmann::json toJson() const;
};

struct IndexSummary {
    std::filesystem::path indexPath;
    std::filesystem::path rootDir;
    std::vector<std::string> dataFormat;
    std::optional<std::string> compression;
    std::optional<uint32_t> chunkSize;
    std::optional<uint64_t> chunkBytes;
    nlohmann::json configRaw;
    std::vector<ChunkSummary> chunks;

    nlohmann::json toJson() const;
};

struct FieldPreview {
    std::optional<std::string> previewText;
    std::string hexSnippet;
    std::optional<std::string> guessedExt;
    bool isBinary = false;
    uint32_t size = 0;

    nlohmann::json toJson() const;
};

/// A field written out in full for an external viewer
struct LeafExport {
    std::filesystem::path path;
    uint64_t bytes = 0;
    std::string extension;
    bool launched = false;

    /// "<path> (<bytes> bytes)"
    std::string message() const;
    nlohmann::json toJson() const;
};

nlohmann::json toJson(const std::vector<ItemMeta>& items);

/**
 * @brief Engine context behind every inspection operation
 *
 * Owns the chunk cache shared by all queries against it. Operations resolve
 * the dataset afresh on every call and may run concurrently.
 */
class Inspector
{
public:
    explicit Inspector(EngineConfig config = {}, ViewerLauncher launcher = openWithDefaultApp);

    Inspector(const Inspector&) = delete;
    Inspector& operator=(const Inspector&) = delete;

    const EngineConfig& config() const { return _config; }
    ChunkCache& cache() { return _cache; }

    IndexSummary loadIndex(const std::filesystem::path& path) const;

    IndexSummary loadChunkList(const std::vector<std::filesystem::path>& paths) const;

    std::vector<ItemMeta> listChunkItems(const std::filesystem::path& indexPath,
                                         const std::string& chunkFilename);

    /// Bounded preview of one field (at most config().previewBytes are read)
    FieldPreview peekField(const std::filesystem::path& indexPath,
                           const std::string& chunkFilename,
                           uint32_t itemIndex,
                           std::size_t fieldIndex);

    /**
     * @brief Write one field to the export directory and hand it to the viewer
     * @throws lv::Error Open when the viewer cannot be launched (the file
     *         has been written by then)
     */
    LeafExport openLeaf(const std::filesystem::path& indexPath,
                        const std::string& chunkFilename,
                        uint32_t itemIndex,
                        std::size_t fieldIndex);

private:
    EngineConfig _config;
    ViewerLauncher _launcher;
    ChunkCache _cache;
};

/**
 * @brief Inspector whose operations run on a worker pool
 *
 * Errors raised by an operation are delivered through its future.
 */
class InspectorService
{
public:
    explicit InspectorService(EngineConfig config = {}, ViewerLauncher launcher = openWithDefaultApp);

    Inspector& inspector() { return _inspector; }
    WorkerPool& pool() { return _pool; }

    std::future<IndexSummary> loadIndex(std::filesystem::path path);
    std::future<IndexSummary> loadChunkList(std::vector<std::filesystem::path> paths);
    std::future<std::vector<ItemMeta>> listChunkItems(std::filesystem::path indexPath, std::string chunkFilename);
    std::future<FieldPreview> peekField(std::filesystem::path indexPath,
                                        std::string chunkFilename,
                                        uint32_t itemIndex,
                                        std::size_t fieldIndex);
    std::future<LeafExport> openLeaf(std::filesystem::path indexPath,
                                     std::string chunkFilename,
                                     uint32_t itemIndex,
                                     std::size_t fieldIndex);

private:
    // declared first so the pool drains before the inspector goes away
    Inspector _inspector;
    WorkerPool _pool;
};

}  // namespace lv
