#include "lv/core/Config.hpp"

#include <nlohmann/json.hpp>

#include "lv/core/util/Error.hpp"
#include "lv/core/util/LoadJson.hpp"

namespace lv {

namespace {

std::size_t size_or(const nlohmann::json* m, const char* key, std::size_t def)
{
    double v = json::number_or(m, key, static_cast<double>(def));
    if (v < 0) {
        throw Error::invalid(std::string("config field '") + key + "' must not be negative");
    }
    return static_cast<std::size_t>(v);
}

}  // namespace

std::filesystem::path EngineConfig::exportDir() const
{
    if (!tempDir.empty()) return tempDir;
    return std::filesystem::temp_directory_path() / "litview";
}

nlohmann::json EngineConfig::toJson() const
{
    return {
        {"cache_max_entry_bytes", cacheMaxEntryBytes},
        {"cache_max_total_bytes", cacheMaxTotalBytes},
        {"preview_bytes", previewBytes},
        {"preview_chars", previewChars},
        {"hex_snippet_bytes", hexSnippetBytes},
        {"worker_threads", workerThreads},
        {"temp_dir", tempDir.string()},
        {"launch_viewer", launchViewer},
    };
}

EngineConfig EngineConfig::fromJson(const nlohmann::json& j, const EngineConfig& base)
{
    if (!j.is_object()) {
        throw Error::invalid("engine config must be a JSON object");
    }
    const nlohmann::json* m = &j;
    EngineConfig cfg = base;
    cfg.cacheMaxEntryBytes = size_or(m, "cache_max_entry_bytes", base.cacheMaxEntryBytes);
    cfg.cacheMaxTotalBytes = size_or(m, "cache_max_total_bytes", base.cacheMaxTotalBytes);
    cfg.previewBytes = size_or(m, "preview_bytes", base.previewBytes);
    cfg.previewChars = size_or(m, "preview_chars", base.previewChars);
    cfg.hexSnippetBytes = size_or(m, "hex_snippet_bytes", base.hexSnippetBytes);
    cfg.workerThreads = static_cast<unsigned>(size_or(m, "worker_threads", base.workerThreads));
    cfg.tempDir = json::string_or(m, "temp_dir", base.tempDir.string());
    cfg.launchViewer = json::bool_or(m, "launch_viewer", base.launchViewer);
    return cfg;
}

EngineConfig EngineConfig::fromJson(const nlohmann::json& j)
{
    return fromJson(j, EngineConfig());
}

EngineConfig EngineConfig::load(const std::filesystem::path& path, const EngineConfig& base)
{
    return fromJson(json::load_json_file(path), base);
}

EngineConfig EngineConfig::load(const std::filesystem::path& path)
{
    return load(path, EngineConfig());
}

}  // namespace lv
