#include "test.hpp"

#include <fstream>
#include <sstream>

#include "fixtures.hpp"
#include "lv/core/util/Logging.hpp"

using namespace lv_test;

namespace {

std::string slurp(const fs::path& p)
{
    std::ifstream f(p);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

}  // namespace

TEST(Logging, ParsesLevelNames)
{
    EXPECT_TRUE(lv::ParseLogLevel("debug") == lv::MinimalLogger::Level::Debug);
    EXPECT_TRUE(lv::ParseLogLevel("WARNING") == lv::MinimalLogger::Level::Warn);
    EXPECT_TRUE(lv::ParseLogLevel("Off") == lv::MinimalLogger::Level::Off);
    EXPECT_FALSE(lv::ParseLogLevel("verbose").has_value());
    EXPECT_THROW_KIND(lv::SetLogLevel("loud"), Invalid);
}

TEST(Logging, FormatsPlaceholdersIntoFileSink)
{
    TempDir dir;
    auto logFile = dir / "lv.log";
    lv::AddLogFile(logFile);
    lv::SetLogLevel("info");

    lv::Logger()->info("decompressed {} ({} bytes)", fs::path("/data/c.bin.zst"), 4096);
    lv::Logger()->debug("hidden {}", 1);
    lv::SetLogLevel("warn");
    lv::Logger()->info("also hidden");

    auto text = slurp(logFile);
    EXPECT_NE(text.find("[INFO ] decompressed /data/c.bin.zst (4096 bytes)"), std::string::npos);
    EXPECT_EQ(text.find("hidden"), std::string::npos);
}

TEST(Logging, UnwritableLogFileIsIo)
{
    TempDir dir;
    EXPECT_THROW_KIND(lv::AddLogFile(dir / "no" / "such" / "dir" / "lv.log"), Io);
}
