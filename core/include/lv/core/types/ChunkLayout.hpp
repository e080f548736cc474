#pragma once

/**
 * @file ChunkLayout.hpp
 * @brief Decoder for the item layout shared by every chunk.
 *
 * Layout (all integers little-endian u32):
 *
 *   [item count N][offset 0]...[offset N][item 0]...[item N-1]
 *
 * offset[i] is the absolute start of item i and offset[N] the end of the
 * last item. Each item begins with one size entry per declared field,
 * followed by the field payloads in declared order without padding.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "lv/core/types/ChunkAccess.hpp"

namespace lv {

inline uint32_t readLeU32(const uint8_t* p)
{
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

struct ChunkOffsets {
    uint32_t itemCount = 0;
    std::vector<uint32_t> offsets;  // itemCount + 1 entries
};

struct ItemRange {
    uint32_t start;
    uint32_t end;

    uint32_t length() const { return end - start; }
};

struct FieldMeta {
    std::size_t fieldIndex;
    uint32_t size;
};

struct ItemMeta {
    uint32_t itemIndex;
    uint64_t totalBytes;
    std::vector<FieldMeta> fields;
};

/// Bytes read from one field plus the field's full declared size
struct FieldBytes {
    std::vector<uint8_t> data;
    uint32_t size;
};

/**
 * @brief Read the item count and offset table
 * @throws lv::Error MalformedChunk (memory) / Io (file) when truncated
 */
ChunkOffsets parseOffsets(const ChunkAccess& access);

/**
 * @brief Byte range of one item
 * @throws lv::Error MalformedChunk when the range is inverted
 */
ItemRange itemRange(const ChunkOffsets& offsets, uint32_t itemIndex);

/// Decode the field-size header at the start of an item
std::vector<uint32_t> readFieldSizes(const ChunkAccess& access, uint32_t itemStart, std::size_t fieldCount);

/// Metadata of every item in order; fails on the first inverted range
std::vector<ItemMeta> listItems(const ChunkAccess& access, std::size_t fieldCount);

/**
 * @brief Read one field of one item
 * @param limit Cap on bytes read; the full declared size is still reported
 * @throws lv::Error Invalid for an out-of-range item or field index,
 *         MalformedChunk when the item range is inverted or the declared
 *         field sizes overrun it
 */
FieldBytes readField(const ChunkAccess& access,
                     uint32_t itemIndex,
                     std::size_t fieldIndex,
                     std::size_t fieldCount,
                     std::optional<std::size_t> limit);

nlohmann::json toJson(const FieldMeta& meta);
nlohmann::json toJson(const ItemMeta& meta);

}  // namespace lv
