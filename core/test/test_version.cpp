#include "test.hpp"

#include <nlohmann/json.hpp>

#include "lv/core/Version.hpp"

using lv::ProjectInfo;

TEST(ProjectInfo, ReportsLitview)
{
    EXPECT_EQ(ProjectInfo::Name(), "litview");
    EXPECT_EQ(ProjectInfo::NameAndVersion(), "litview " + ProjectInfo::VersionString());
}

TEST(ProjectInfo, VersionStringMatchesParts)
{
    auto parts = std::to_string(ProjectInfo::VersionMajor()) + "." + std::to_string(ProjectInfo::VersionMinor()) +
                 "." + std::to_string(ProjectInfo::VersionPatch());
    EXPECT_EQ(ProjectInfo::VersionString(), parts);
}

TEST(ProjectInfo, ShortHashPrefixesFullHash)
{
    auto full = ProjectInfo::RepositoryHash();
    auto brief = ProjectInfo::RepositoryShortHash();
    ASSERT_FALSE(brief.empty());
    EXPECT_EQ(full.rfind(brief, 0), 0u);
}

TEST(ErrorReport, JsonCarriesKindAndMessage)
{
    auto j = lv::toJson(lv::Error::missing("/data/index.json"));
    EXPECT_EQ(j["code"].get<std::string>(), "Missing");
    EXPECT_EQ(j["message"].get<std::string>(), "not found: /data/index.json");
    EXPECT_EQ(std::string(lv::Error::malformedChunk().what()), "malformed chunk");
    EXPECT_EQ(std::string(lv::errorKindName(lv::ErrorKind::UnsupportedCompression)), "UnsupportedCompression");
}
