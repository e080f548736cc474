#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace lv {

class ChunkCache;
struct DatasetIndex;

/// Uncompressed chunk on disk; every read opens the file afresh
struct FileBackedChunk {
    std::filesystem::path path;
};

/// Fully decompressed chunk; the buffer is a shared immutable snapshot
struct MemoryBackedChunk {
    std::shared_ptr<const std::vector<uint8_t>> buffer;
};

/**
 * @brief Byte-addressable view of one chunk's content
 *
 * Reads past the end fail with MalformedChunk for memory-backed content and
 * with Io (short read) for file-backed content.
 */
class ChunkAccess
{
public:
    using Source = std::variant<FileBackedChunk, MemoryBackedChunk>;

    explicit ChunkAccess(FileBackedChunk file) : source_(std::move(file)) {}
    explicit ChunkAccess(MemoryBackedChunk memory) : source_(std::move(memory)) {}

    std::vector<uint8_t> readExactAt(uint64_t offset, std::size_t len) const;

    bool isMemoryBacked() const { return std::holds_alternative<MemoryBackedChunk>(source_); }
    const Source& source() const { return source_; }

private:
    Source source_;
};

/// Lowercased declared compression, nullopt when the chunks are stored raw
/// (no compression declared, or "none")
std::optional<std::string> normalizedCompression(const DatasetIndex& index);

/**
 * @brief Open one chunk of a dataset
 *
 * zstd chunks are decompressed whole and shared through @p cache (keyed by
 * the chunk path); raw chunks are read straight from disk.
 *
 * @throws lv::Error Missing if the chunk file does not exist,
 *         UnsupportedCompression for any scheme other than zstd,
 *         Invalid if decompression fails
 */
ChunkAccess openChunk(const DatasetIndex& index, const std::string& chunkFilename, ChunkCache& cache);

}  // namespace lv
