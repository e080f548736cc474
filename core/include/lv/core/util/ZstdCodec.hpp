#pragma once

/**
 * @file ZstdCodec.hpp
 * @brief Zstandard codec for index documents and chunk payloads.
 *
 * Chunk and index files are written as ordinary zstd streams, usually without
 * a content size in the frame header, so decoding always streams.
 */

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace lv {

struct ZstdCodec {
    int level = 3;

    std::string name() const { return "zstd"; }

    /// One-shot compression (frames carry their content size).
    std::vector<uint8_t> encode(const uint8_t* data, std::size_t len) const;

    /// Streaming decompression of every frame in [data, data+len).
    /// @throws lv::Error (Invalid) on corrupt or truncated input
    std::vector<uint8_t> decode(const uint8_t* data, std::size_t len) const;

    /// Streaming decompression reading from @p in until EOF.
    /// @throws lv::Error (Invalid) on corrupt or truncated input, (Io) on read failure
    std::vector<uint8_t> decode(std::istream& in) const;

    /// Open @p path and decode it fully into memory.
    /// @throws lv::Error (Io) if the file cannot be opened
    std::vector<uint8_t> decodeFile(const std::filesystem::path& path) const;
};

}  // namespace lv
