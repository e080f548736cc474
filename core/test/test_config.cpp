#include "test.hpp"

#include "fixtures.hpp"
#include "lv/core/Config.hpp"

using namespace lv_test;

TEST(EngineConfig, Defaults)
{
    lv::EngineConfig cfg;
    EXPECT_EQ(cfg.cacheMaxEntryBytes, std::size_t{128} * 1024 * 1024);
    EXPECT_EQ(cfg.cacheMaxTotalBytes, 0u);
    EXPECT_EQ(cfg.previewBytes, 2048u);
    EXPECT_EQ(cfg.previewChars, 400u);
    EXPECT_EQ(cfg.hexSnippetBytes, 48u);
    EXPECT_TRUE(cfg.launchViewer);
    EXPECT_EQ(cfg.exportDir(), fs::temp_directory_path() / "litview");
}

TEST(EngineConfig, OverlaysPresentKeys)
{
    nlohmann::json j = {{"preview_bytes", 64}, {"launch_viewer", false}, {"temp_dir", "/tmp/lv-out"}};
    auto cfg = lv::EngineConfig::fromJson(j);
    EXPECT_EQ(cfg.previewBytes, 64u);
    EXPECT_FALSE(cfg.launchViewer);
    EXPECT_EQ(cfg.exportDir(), fs::path("/tmp/lv-out"));
    EXPECT_EQ(cfg.previewChars, 400u);
}

TEST(EngineConfig, LoadFromFile)
{
    TempDir dir;
    write_json(dir / "engine.json", {{"worker_threads", 3}, {"cache_max_total_bytes", 1 << 20}});
    auto cfg = lv::EngineConfig::load(dir / "engine.json");
    EXPECT_EQ(cfg.workerThreads, 3u);
    EXPECT_EQ(cfg.cacheMaxTotalBytes, std::size_t{1} << 20);

    auto back = lv::EngineConfig::fromJson(cfg.toJson());
    EXPECT_EQ(back.workerThreads, 3u);
}

TEST(EngineConfig, RejectsBadInput)
{
    EXPECT_THROW_KIND(lv::EngineConfig::fromJson(nlohmann::json::array()), Invalid);
    EXPECT_THROW_KIND(lv::EngineConfig::fromJson({{"preview_bytes", -5}}), Invalid);

    TempDir dir;
    write(dir / "broken.json", bytes_of("{"));
    EXPECT_THROW_KIND(lv::EngineConfig::load(dir / "broken.json"), Invalid);
    EXPECT_THROW_KIND(lv::EngineConfig::load(dir / "absent.json"), Io);
}

TEST(EngineConfig, OverlaysOntoGivenBase)
{
    lv::EngineConfig base;
    base.previewChars = 80;
    base.launchViewer = false;

    auto cfg = lv::EngineConfig::fromJson({{"preview_bytes", 512}}, base);
    EXPECT_EQ(cfg.previewBytes, 512u);
    EXPECT_EQ(cfg.previewChars, 80u);
    EXPECT_FALSE(cfg.launchViewer);

    TempDir dir;
    write_json(dir / "engine.json", {{"preview_chars", 10}});
    auto loaded = lv::EngineConfig::load(dir / "engine.json", base);
    EXPECT_EQ(loaded.previewChars, 10u);
    EXPECT_FALSE(loaded.launchViewer);
}
