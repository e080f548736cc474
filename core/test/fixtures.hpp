#pragma once

// Helpers that write small datasets (chunks + index documents) to disk.

#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

#include "lv/core/util/Filesystem.hpp"
#include "lv/core/util/ZstdCodec.hpp"

namespace lv_test {

namespace fs = std::filesystem;

using Bytes = std::vector<uint8_t>;
using ItemFields = std::vector<Bytes>;

inline void put_u32(Bytes& out, uint32_t v)
{
    out.push_back(static_cast<uint8_t>(v));
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v >> 16));
    out.push_back(static_cast<uint8_t>(v >> 24));
}

inline Bytes bytes_of(const std::string& s)
{
    return Bytes(s.begin(), s.end());
}

// Chunk with one field-size entry per field in every item
inline Bytes build_chunk(const std::vector<ItemFields>& items)
{
    std::vector<Bytes> bodies;
    for (const auto& fields : items) {
        Bytes body;
        for (const auto& f : fields) put_u32(body, static_cast<uint32_t>(f.size()));
        for (const auto& f : fields) body.insert(body.end(), f.begin(), f.end());
        bodies.push_back(std::move(body));
    }

    Bytes out;
    put_u32(out, static_cast<uint32_t>(items.size()));
    uint32_t cursor = 4 + 4 * static_cast<uint32_t>(items.size() + 1);
    for (const auto& b : bodies) {
        put_u32(out, cursor);
        cursor += static_cast<uint32_t>(b.size());
    }
    put_u32(out, cursor);
    for (const auto& b : bodies) out.insert(out.end(), b.begin(), b.end());
    return out;
}

// Chunk with an explicit offset table and trailing payload
inline Bytes raw_chunk(const std::vector<uint32_t>& offsets, const Bytes& payload = {})
{
    Bytes out;
    put_u32(out, static_cast<uint32_t>(offsets.size() - 1));
    for (auto o : offsets) put_u32(out, o);
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

inline Bytes zstd(const Bytes& data)
{
    return lv::ZstdCodec{}.encode(data.data(), data.size());
}

inline void write(const fs::path& path, const Bytes& data)
{
    lv::write_file(path, data);
}

inline void write_json(const fs::path& path, const nlohmann::json& doc, bool compress = false)
{
    auto text = bytes_of(doc.dump());
    write(path, compress ? zstd(text) : text);
}

inline nlohmann::json chunk_entry(const std::string& filename, uint64_t bytes, uint32_t items)
{
    return {{"filename", filename}, {"chunk_bytes", bytes}, {"chunk_size", items}, {"dim", nullptr}};
}

// Temporary directory removed when the test ends
struct TempDir {
    fs::path path;

    explicit TempDir(const std::string& prefix = "lv_test") : path(lv::create_temp_directory(prefix)) {}
    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    fs::path operator/(const std::string& name) const { return path / name; }
};

}  // namespace lv_test
