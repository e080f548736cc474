#include "lv/core/types/ChunkAccess.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <system_error>

#include "lv/core/types/DatasetIndex.hpp"
#include "lv/core/util/ChunkCache.hpp"
#include "lv/core/util/Error.hpp"
#include "lv/core/util/Logging.hpp"
#include "lv/core/util/ZstdCodec.hpp"

namespace fs = std::filesystem;

namespace lv {

namespace {

std::vector<uint8_t> readFileRange(const fs::path& path, uint64_t offset, std::size_t len)
{
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
        throw Error::io(path.string() + ": " + ec.message());
    }
    if (offset > size || len > size - offset) {
        throw Error::io("failed to fill whole buffer reading " + path.string());
    }

    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        throw Error::io("cannot open " + path.string());
    }
    f.seekg(static_cast<std::streamoff>(offset));

    std::vector<uint8_t> buf(len);
    f.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(len));
    if (static_cast<std::size_t>(f.gcount()) != len) {
        throw Error::io("failed to fill whole buffer reading " + path.string());
    }
    return buf;
}

}  // namespace

std::vector<uint8_t> ChunkAccess::readExactAt(uint64_t offset, std::size_t len) const
{
    if (auto* file = std::get_if<FileBackedChunk>(&source_)) {
        return readFileRange(file->path, offset, len);
    }

    const auto& buffer = *std::get<MemoryBackedChunk>(source_).buffer;
    if (offset > buffer.size() || len > buffer.size() - offset) {
        throw Error::malformedChunk();
    }
    auto first = buffer.begin() + static_cast<std::ptrdiff_t>(offset);
    return std::vector<uint8_t>(first, first + static_cast<std::ptrdiff_t>(len));
}

std::optional<std::string> normalizedCompression(const DatasetIndex& index)
{
    if (!index.config.compression) return std::nullopt;
    std::string c = *index.config.compression;
    std::transform(c.begin(), c.end(), c.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (c == "none") return std::nullopt;
    return c;
}

ChunkAccess openChunk(const DatasetIndex& index, const std::string& chunkFilename, ChunkCache& cache)
{
    const auto chunkPath = index.chunkPath(chunkFilename);
    std::error_code ec;
    if (!fs::exists(chunkPath, ec)) {
        throw Error::missing(chunkPath.string());
    }

    const auto compression = normalizedCompression(index);
    if (!compression) {
        return ChunkAccess(FileBackedChunk{chunkPath});
    }
    if (*compression != "zstd") {
        throw Error::unsupportedCompression(*compression);
    }

    const auto key = chunkPath.string();
    if (auto cached = cache.fetch(key)) {
        Logger()->debug("chunk cache hit: {}", key);
        return ChunkAccess(MemoryBackedChunk{std::move(cached)});
    }

    std::vector<uint8_t> raw;
    try {
        raw = ZstdCodec{}.decodeFile(chunkPath);
    } catch (const Error& e) {
        if (e.kind() != ErrorKind::Invalid) throw;
        throw Error::invalid("decompressing chunk: " + e.detail());
    }
    Logger()->info("decompressed {} ({} bytes)", key, raw.size());

    auto buffer = std::make_shared<const std::vector<uint8_t>>(std::move(raw));
    cache.store(key, buffer);
    return ChunkAccess(MemoryBackedChunk{std::move(buffer)});
}

}  // namespace lv
