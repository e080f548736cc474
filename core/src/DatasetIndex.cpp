#include "lv/core/types/DatasetIndex.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <string_view>
#include <system_error>
#include <unordered_set>

#include "lv/core/types/ChunkLayout.hpp"
#include "lv/core/util/Error.hpp"
#include "lv/core/util/LoadJson.hpp"
#include "lv/core/util/Logging.hpp"

namespace fs = std::filesystem;

namespace lv {

const char* const kIndexCandidates[6] = {
    "index.json",
    "index.json.zstd",
    "index.json.zst",
    "0.index.json",
    "0.index.json.zstd",
    "0.index.json.zst",
};

namespace {

bool pathExists(const fs::path& p)
{
    std::error_code ec;
    return fs::exists(p, ec);
}

bool isIndexName(const std::string& name)
{
    constexpr std::string_view suffix = ".index.json";
    bool endsWith = name.size() >= suffix.size() &&
                    name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
    return endsWith || name.find(".index.json.") != std::string::npos;
}

struct ChunkHeader {
    uint32_t itemCount;
    uint64_t fileBytes;
};

// Item count and size of a raw (uncompressed) chunk; the offset table must be
// complete for the header to count as readable.
ChunkHeader readChunkHeader(const fs::path& path)
{
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
        throw Error::io(path.string() + ": " + ec.message());
    }

    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        throw Error::io("cannot open " + path.string());
    }
    std::array<uint8_t, 4> countBuf{};
    f.read(reinterpret_cast<char*>(countBuf.data()), countBuf.size());
    if (f.gcount() != static_cast<std::streamsize>(countBuf.size())) {
        throw Error::io("failed to fill whole buffer reading " + path.string());
    }
    uint32_t count = readLeU32(countBuf.data());

    uint64_t tableEnd = 4 + (static_cast<uint64_t>(count) + 1) * 4;
    if (tableEnd > size) {
        throw Error::io("failed to fill whole buffer reading offsets of " + path.string());
    }
    return {count, static_cast<uint64_t>(size)};
}

fs::path parentOrDot(const fs::path& p)
{
    auto parent = p.parent_path();
    return parent.empty() ? fs::path(".") : parent;
}

}  // namespace

std::optional<std::string> IndexConfig::formatToken(std::size_t fieldIndex) const
{
    if (!dataFormat || fieldIndex >= dataFormat->size()) return std::nullopt;
    return (*dataFormat)[fieldIndex];
}

nlohmann::json IndexConfig::toJson() const
{
    nlohmann::json j = nlohmann::json::object();
    j["compression"] = compression ? nlohmann::json(*compression) : nlohmann::json(nullptr);
    j["chunk_size"] = chunkSize ? nlohmann::json(*chunkSize) : nlohmann::json(nullptr);
    j["chunk_bytes"] = chunkBytes ? nlohmann::json(*chunkBytes) : nlohmann::json(nullptr);
    j["data_format"] = dataFormat ? nlohmann::json(*dataFormat) : nlohmann::json(nullptr);
    j["data_spec"] = dataSpec ? nlohmann::json(*dataSpec) : nlohmann::json(nullptr);
    return j;
}

IndexConfig IndexConfig::fromJson(const nlohmann::json& j, const std::string& context)
{
    if (!j.is_object()) {
        throw Error::invalid(context + " config must be an object");
    }
    IndexConfig cfg;
    cfg.compression = json::optional_string(j, "compression", context);
    cfg.chunkSize = json::optional_u32(j, "chunk_size", context);
    cfg.chunkBytes = json::optional_u64(j, "chunk_bytes", context);
    cfg.dataSpec = json::optional_string(j, "data_spec", context);

    auto it = j.find("data_format");
    if (it != j.end() && !it->is_null()) {
        if (!it->is_array()) {
            throw Error::invalid(context + " field 'data_format' must be an array");
        }
        std::vector<std::string> tokens;
        for (const auto& t : *it) {
            if (!t.is_string()) {
                throw Error::invalid(context + " field 'data_format' must hold strings");
            }
            tokens.push_back(t.get<std::string>());
        }
        cfg.dataFormat = std::move(tokens);
    }
    return cfg;
}

ChunkRecord ChunkRecord::fromJson(const nlohmann::json& j, const std::string& context)
{
    json::require_fields(j, {"filename", "chunk_bytes", "chunk_size"}, context + " chunk entry");
    ChunkRecord rec;
    auto filename = json::optional_string(j, "filename", context);
    auto bytes = json::optional_u64(j, "chunk_bytes", context);
    auto size = json::optional_u32(j, "chunk_size", context);
    if (!filename || !bytes || !size) {
        throw Error::invalid(context + " chunk entry has null filename/chunk_bytes/chunk_size");
    }
    rec.filename = *filename;
    rec.chunkBytes = *bytes;
    rec.chunkSize = *size;
    rec.dim = json::optional_u32(j, "dim", context);
    return rec;
}

fs::path ChunkListing::locate(const std::string& filename) const
{
    for (const auto& [name, path] : locations) {
        if (name == filename) return path;
    }
    return index.chunkPath(filename);
}

bool isChunkPath(const fs::path& path)
{
    auto ext = path.extension().string();
    if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == "bin" || ext == "zst") return true;
    return path.filename().string().find(".bin") != std::string::npos;
}

std::optional<fs::path> findIndexInDirectory(const fs::path& dir)
{
    for (const char* name : kIndexCandidates) {
        auto candidate = dir / name;
        if (pathExists(candidate)) {
            return candidate;
        }
    }

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) return std::nullopt;

    std::vector<fs::path> globbed;
    for (const auto& entry : it) {
        if (isIndexName(entry.path().filename().string())) {
            globbed.push_back(entry.path());
        }
    }
    if (globbed.empty()) return std::nullopt;
    std::sort(globbed.begin(), globbed.end());
    return globbed.front();
}

std::optional<fs::path> findNeighborIndex(const fs::path& chunkPath)
{
    return findIndexInDirectory(parentOrDot(chunkPath));
}

fs::path resolveIndexPath(const fs::path& path)
{
    std::error_code ec;
    if (fs::is_regular_file(path, ec)) {
        return path;
    }
    if (fs::is_directory(path, ec)) {
        if (auto found = findIndexInDirectory(path)) {
            Logger()->debug("index: found {} in directory {}", *found, path);
            return *found;
        }
        throw Error::missing(path.string());
    }

    const auto parent = path.parent_path();
    const auto base = path.has_stem() ? path.stem().string() : std::string("index");
    const std::array<fs::path, 7> candidates = {
        path,
        fs::path(path).replace_extension(".json"),
        fs::path(path).replace_extension(".json.zstd"),
        fs::path(path).replace_extension(".json.zst"),
        parent / (base + ".json"),
        parent / (base + ".json.zstd"),
        parent / (base + ".json.zst"),
    };
    for (const auto& candidate : candidates) {
        if (pathExists(candidate)) {
            Logger()->debug("index: {} resolved to {}", path, candidate);
            return candidate;
        }
    }
    throw Error::missing(path.string());
}

DatasetIndex parseIndexFile(const fs::path& path)
{
    const std::string context = path.string();
    auto doc = json::load_json_file(path);
    json::require_fields(doc, {"chunks", "config"}, context);

    DatasetIndex index;
    index.config = IndexConfig::fromJson(doc["config"], context);
    index.configRaw = index.config.toJson();

    const auto& chunks = doc["chunks"];
    if (!chunks.is_array()) {
        throw Error::invalid(context + " field 'chunks' must be an array");
    }
    index.chunks.reserve(chunks.size());
    for (const auto& c : chunks) {
        index.chunks.push_back(ChunkRecord::fromJson(c, context));
    }

    index.rootDir = parentOrDot(path);
    index.source = path;
    Logger()->debug("index: parsed {} ({} chunks)", path, index.chunks.size());
    return index;
}

DatasetIndex parseChunkOnly(const fs::path& chunkPath)
{
    auto header = readChunkHeader(chunkPath);
    const uint32_t items = std::max<uint32_t>(header.itemCount, 1);

    DatasetIndex index;
    index.rootDir = parentOrDot(chunkPath);
    index.source = chunkPath;
    index.config.chunkSize = items;
    index.config.chunkBytes = header.fileBytes;
    index.config.dataFormat = std::vector<std::string>{"bytes"};
    index.configRaw = index.config.toJson();

    ChunkRecord rec;
    rec.filename = chunkPath.has_filename() ? chunkPath.filename().string() : std::string("chunk.bin");
    rec.chunkBytes = header.fileBytes;
    rec.chunkSize = items;
    index.chunks.push_back(std::move(rec));

    Logger()->debug("index: no index next to {}, treating it as a lone chunk of {} items",
                    chunkPath, header.itemCount);
    return index;
}

DatasetIndex resolveDataset(const fs::path& input)
{
    if (isChunkPath(input)) {
        // The sibling is parsed directly: "*.index.json.zst" also looks like a chunk
        if (auto found = findNeighborIndex(input)) {
            return parseIndexFile(*found);
        }
        return parseChunkOnly(input);
    }
    return parseIndexFile(resolveIndexPath(input));
}

ChunkListing resolveChunkList(const std::vector<fs::path>& paths)
{
    if (paths.empty()) {
        throw Error::invalid("no chunk paths provided");
    }

    ChunkListing listing;
    auto& index = listing.index;
    index.rootDir = parentOrDot(paths.front());
    index.config.dataFormat = std::vector<std::string>{"bytes"};

    // Later duplicates of a filename replace the earlier path
    for (const auto& p : paths) {
        if (!p.has_filename()) continue;
        auto name = p.filename().string();
        auto it = std::find_if(listing.locations.begin(), listing.locations.end(),
                               [&](const auto& entry) { return entry.first == name; });
        if (it != listing.locations.end()) {
            it->second = p;
        } else {
            listing.locations.emplace_back(name, p);
        }
    }

    std::unordered_set<std::string> covered;
    bool haveIndex = false;
    if (auto found = findNeighborIndex(paths.front())) {
        auto parsed = parseIndexFile(*found);
        if (parsed.config.dataFormat) {
            index.config.dataFormat = parsed.config.dataFormat;
        }
        index.config.compression = parsed.config.compression;
        index.config.chunkSize = parsed.config.chunkSize;
        index.config.chunkBytes = parsed.config.chunkBytes;
        index.config.dataSpec = parsed.config.dataSpec;
        index.configRaw = parsed.configRaw;
        index.rootDir = parsed.rootDir;
        index.source = *found;
        haveIndex = true;

        std::unordered_set<std::string> selected;
        for (const auto& [name, _] : listing.locations) selected.insert(name);
        for (auto& c : parsed.chunks) {
            if (selected.count(c.filename)) {
                covered.insert(c.filename);
                index.chunks.push_back(std::move(c));
            }
        }
        Logger()->debug("chunk list: using index {} for {} of {} chunks",
                        *found, covered.size(), listing.locations.size());
    }

    for (const auto& [name, path] : listing.locations) {
        if (covered.count(name)) continue;
        auto header = readChunkHeader(path);
        ChunkRecord rec;
        rec.filename = name;
        rec.chunkBytes = header.fileBytes;
        rec.chunkSize = std::max<uint32_t>(header.itemCount, 1);
        index.chunks.push_back(std::move(rec));
    }

    if (!haveIndex) {
        index.configRaw = {{"source", "multi-bin"}, {"data_format", *index.config.dataFormat}};
        index.source = paths.front();
    }
    return listing;
}

}  // namespace lv
