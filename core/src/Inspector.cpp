#include "lv/core/Inspector.hpp"

#include <system_error>
#include <utility>

#include "lv/core/types/ChunkAccess.hpp"
#include "lv/core/util/ContentSniffer.hpp"
#include "lv/core/util/Error.hpp"
#include "lv/core/util/Filesystem.hpp"
#include "lv/core/util/Logging.hpp"
#include "lv/core/util/TextUtils.hpp"

namespace lv {

namespace {

template <typename T>
nlohmann::json nullable(const std::optional<T>& v)
{
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

IndexSummary summarize(const DatasetIndex& index)
{
    IndexSummary s;
    s.indexPath = index.source;
    s.rootDir = index.rootDir;
    if (index.config.dataFormat) s.dataFormat = *index.config.dataFormat;
    s.compression = index.config.compression;
    s.chunkSize = index.config.chunkSize;
    s.chunkBytes = index.config.chunkBytes;
    s.configRaw = index.configRaw;
    return s;
}

ChunkSummary summarize(const ChunkRecord& rec, std::filesystem::path path, bool exists)
{
    ChunkSummary c;
    c.filename = rec.filename;
    c.path = std::move(path);
    c.chunkSize = rec.chunkSize;
    c.chunkBytes = rec.chunkBytes;
    c.dim = rec.dim;
    c.exists = exists;
    return c;
}

}  // namespace

nlohmann::json ChunkSummary::toJson() const
{
    return {
        {"filename", filename},
        {"path", path.string()},
        {"chunkSize", chunkSize},
        {"chunkBytes", chunkBytes},
        {"dim", nullable(dim)},
        {"exists", exists},
    };
}

nlohmann::json IndexSummary::toJson() const
{
    auto chunkList = nlohmann::json::array();
    for (const auto& c : chunks) chunkList.push_back(c.toJson());
    return {
        {"indexPath", indexPath.string()},
        {"rootDir", rootDir.string()},
        {"dataFormat", dataFormat},
        {"compression", nullable(compression)},
        {"chunkSize", nullable(chunkSize)},
        {"chunkBytes", nullable(chunkBytes)},
        {"configRaw", configRaw},
        {"chunks", chunkList},
    };
}

nlohmann::json FieldPreview::toJson() const
{
    return {
        {"previewText", nullable(previewText)},
        {"hexSnippet", hexSnippet},
        {"guessedExt", nullable(guessedExt)},
        {"isBinary", isBinary},
        {"size", size},
    };
}

std::string LeafExport::message() const
{
    return path.string() + " (" + std::to_string(bytes) + " bytes)";
}

nlohmann::json LeafExport::toJson() const
{
    return {
        {"path", path.string()},
        {"bytes", bytes},
        {"extension", extension},
        {"launched", launched},
        {"message", message()},
    };
}

nlohmann::json toJson(const std::vector<ItemMeta>& items)
{
    auto out = nlohmann::json::array();
    for (const auto& item : items) out.push_back(toJson(item));
    return out;
}

// ============ Inspector ============

Inspector::Inspector(EngineConfig config, ViewerLauncher launcher)
    : _config(std::move(config))
    , _launcher(std::move(launcher))
    , _cache(_config.cacheMaxEntryBytes, _config.cacheMaxTotalBytes)
{
}

IndexSummary Inspector::loadIndex(const std::filesystem::path& path) const
{
    auto index = resolveDataset(path);
    auto summary = summarize(index);
    summary.chunks.reserve(index.chunks.size());
    for (const auto& rec : index.chunks) {
        auto chunkPath = index.chunkPath(rec.filename);
        std::error_code ec;
        bool exists = std::filesystem::exists(chunkPath, ec);
        summary.chunks.push_back(summarize(rec, std::move(chunkPath), exists));
    }
    Logger()->debug("loaded index {} ({} chunks)", summary.indexPath, summary.chunks.size());
    return summary;
}

IndexSummary Inspector::loadChunkList(const std::vector<std::filesystem::path>& paths) const
{
    auto listing = resolveChunkList(paths);
    auto summary = summarize(listing.index);
    summary.chunks.reserve(listing.index.chunks.size());
    for (const auto& rec : listing.index.chunks) {
        summary.chunks.push_back(summarize(rec, listing.locate(rec.filename), true));
    }
    return summary;
}

std::vector<ItemMeta> Inspector::listChunkItems(const std::filesystem::path& indexPath,
                                                const std::string& chunkFilename)
{
    auto index = resolveDataset(indexPath);
    auto access = openChunk(index, chunkFilename, _cache);
    return listItems(access, index.config.fieldCount());
}

FieldPreview Inspector::peekField(const std::filesystem::path& indexPath,
                                  const std::string& chunkFilename,
                                  uint32_t itemIndex,
                                  std::size_t fieldIndex)
{
    auto index = resolveDataset(indexPath);
    auto access = openChunk(index, chunkFilename, _cache);
    auto field = readField(access, itemIndex, fieldIndex, index.config.fieldCount(), _config.previewBytes);

    FieldPreview preview;
    const bool utf8 = text::isValidUtf8(field.data);
    if (utf8) {
        preview.previewText = text::truncateChars(std::string(field.data.begin(), field.data.end()),
                                                  _config.previewChars);
    }
    preview.hexSnippet = text::hexEncode(field.data, _config.hexSnippetBytes);
    preview.guessedExt = guessExtension(index.config.formatToken(fieldIndex), field.data);
    preview.isBinary = !utf8;
    preview.size = field.size;
    return preview;
}

LeafExport Inspector::openLeaf(const std::filesystem::path& indexPath,
                               const std::string& chunkFilename,
                               uint32_t itemIndex,
                               std::size_t fieldIndex)
{
    auto index = resolveDataset(indexPath);
    auto access = openChunk(index, chunkFilename, _cache);
    auto field = readField(access, itemIndex, fieldIndex, index.config.fieldCount(), std::nullopt);

    LeafExport leaf;
    leaf.extension = guessExtension(index.config.formatToken(fieldIndex), field.data).value_or("bin");
    leaf.bytes = field.data.size();

    const auto dir = _config.exportDir();
    ensure_directory(dir);
    leaf.path = dir / (text::sanitizeFilename(chunkFilename) + "-i" + std::to_string(itemIndex) + "-f" +
                       std::to_string(fieldIndex) + "." + leaf.extension);
    write_file(leaf.path, field.data);
    Logger()->info("exported {}", leaf.message());

    if (_config.launchViewer && _launcher) {
        try {
            _launcher(leaf.path);
        } catch (const Error&) {
            throw;
        } catch (const std::exception& e) {
            throw Error::open(e.what());
        }
        leaf.launched = true;
    }
    return leaf;
}

// ============ InspectorService ============

InspectorService::InspectorService(EngineConfig config, ViewerLauncher launcher)
    : _inspector(std::move(config), std::move(launcher))
    , _pool(_inspector.config().workerThreads)
{
}

std::future<IndexSummary> InspectorService::loadIndex(std::filesystem::path path)
{
    return _pool.submit([this, path = std::move(path)] { return _inspector.loadIndex(path); });
}

std::future<IndexSummary> InspectorService::loadChunkList(std::vector<std::filesystem::path> paths)
{
    return _pool.submit([this, paths = std::move(paths)] { return _inspector.loadChunkList(paths); });
}

std::future<std::vector<ItemMeta>> InspectorService::listChunkItems(std::filesystem::path indexPath,
                                                                    std::string chunkFilename)
{
    return _pool.submit([this, indexPath = std::move(indexPath), chunk = std::move(chunkFilename)] {
        return _inspector.listChunkItems(indexPath, chunk);
    });
}

std::future<FieldPreview> InspectorService::peekField(std::filesystem::path indexPath,
                                                      std::string chunkFilename,
                                                      uint32_t itemIndex,
                                                      std::size_t fieldIndex)
{
    return _pool.submit([this, indexPath = std::move(indexPath), chunk = std::move(chunkFilename),
                         itemIndex, fieldIndex] {
        return _inspector.peekField(indexPath, chunk, itemIndex, fieldIndex);
    });
}

std::future<LeafExport> InspectorService::openLeaf(std::filesystem::path indexPath,
                                                   std::string chunkFilename,
                                                   uint32_t itemIndex,
                                                   std::size_t fieldIndex)
{
    return _pool.submit([this, indexPath = std::move(indexPath), chunk = std::move(chunkFilename),
                         itemIndex, fieldIndex] {
        return _inspector.openLeaf(indexPath, chunk, itemIndex, fieldIndex);
    });
}

}  // namespace lv
