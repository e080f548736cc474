#include "lv/core/types/ChunkLayout.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

#include "lv/core/util/Error.hpp"

namespace lv {

ChunkOffsets parseOffsets(const ChunkAccess& access)
{
    auto countBuf = access.readExactAt(0, 4);
    if (countBuf.size() != 4) {
        throw Error::malformedChunk();
    }

    ChunkOffsets table;
    table.itemCount = readLeU32(countBuf.data());

    const uint64_t entries = static_cast<uint64_t>(table.itemCount) + 1;
    auto raw = access.readExactAt(4, static_cast<std::size_t>(entries * 4));
    if (raw.size() != entries * 4) {
        throw Error::malformedChunk();
    }

    table.offsets.reserve(static_cast<std::size_t>(entries));
    for (std::size_t pos = 0; pos < raw.size(); pos += 4) {
        table.offsets.push_back(readLeU32(raw.data() + pos));
    }
    return table;
}

ItemRange itemRange(const ChunkOffsets& offsets, uint32_t itemIndex)
{
    ItemRange range{offsets.offsets.at(itemIndex), offsets.offsets.at(itemIndex + 1)};
    if (range.end < range.start) {
        throw Error::malformedChunk();
    }
    return range;
}

std::vector<uint32_t> readFieldSizes(const ChunkAccess& access, uint32_t itemStart, std::size_t fieldCount)
{
    std::vector<uint32_t> sizes;
    if (fieldCount == 0) return sizes;

    auto head = access.readExactAt(itemStart, fieldCount * 4);
    sizes.reserve(fieldCount);
    for (std::size_t j = 0; j < fieldCount; ++j) {
        sizes.push_back(readLeU32(head.data() + j * 4));
    }
    return sizes;
}

std::vector<ItemMeta> listItems(const ChunkAccess& access, std::size_t fieldCount)
{
    auto table = parseOffsets(access);

    std::vector<ItemMeta> items;
    items.reserve(table.itemCount);
    for (uint32_t i = 0; i < table.itemCount; ++i) {
        auto range = itemRange(table, i);
        auto sizes = readFieldSizes(access, range.start, fieldCount);

        ItemMeta meta{i, range.length(), {}};
        meta.fields.reserve(sizes.size());
        for (std::size_t j = 0; j < sizes.size(); ++j) {
            meta.fields.push_back({j, sizes[j]});
        }
        items.push_back(std::move(meta));
    }
    return items;
}

FieldBytes readField(const ChunkAccess& access,
                     uint32_t itemIndex,
                     std::size_t fieldIndex,
                     std::size_t fieldCount,
                     std::optional<std::size_t> limit)
{
    auto table = parseOffsets(access);
    if (itemIndex >= table.itemCount) {
        throw Error::invalid("item index out of range");
    }

    auto range = itemRange(table, itemIndex);
    auto sizes = readFieldSizes(access, range.start, fieldCount);
    if (fieldIndex >= sizes.size()) {
        throw Error::invalid("field index out of range");
    }

    // header + payloads must stay inside the item
    const uint64_t headerLen = static_cast<uint64_t>(fieldCount) * 4;
    uint64_t declared = headerLen;
    uint64_t cursor = static_cast<uint64_t>(range.start) + headerLen;
    for (std::size_t j = 0; j < sizes.size(); ++j) {
        if (j < fieldIndex) cursor += sizes[j];
        declared += sizes[j];
    }
    if (declared > range.length()) {
        throw Error::malformedChunk();
    }

    const uint32_t size = sizes[fieldIndex];
    const std::size_t wanted = limit ? std::min<std::size_t>(*limit, size) : size;
    return {access.readExactAt(cursor, wanted), size};
}

nlohmann::json toJson(const FieldMeta& meta)
{
    return {{"fieldIndex", meta.fieldIndex}, {"size", meta.size}};
}

nlohmann::json toJson(const ItemMeta& meta)
{
    nlohmann::json fields = nlohmann::json::array();
    for (const auto& f : meta.fields) {
        fields.push_back(toJson(f));
    }
    return {{"itemIndex", meta.itemIndex}, {"totalBytes", meta.totalBytes}, {"fields", fields}};
}

}  // namespace lv
