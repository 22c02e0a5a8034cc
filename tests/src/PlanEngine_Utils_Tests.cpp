#include "pch.h"
#include "../../src/Logic/PlanEngine.h"
#include <cerrno>
#include <set>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

TEST(PlanEngineUtils, ToLowerAndIequals)
{
    EXPECT_EQ(ToLower("MiXeD.TXT"), "mixed.txt");
    EXPECT_TRUE(PlanEngine::iequals("Photo.JPG", "photo.jpg"));
    EXPECT_FALSE(PlanEngine::iequals("photo.jpg", "photo.jpeg"));
    EXPECT_FALSE(PlanEngine::iequals("a", "b"));
}

TEST(PlanEngineUtils, ParseExtensionList)
{
    EXPECT_EQ(PlanEngine::ParseExtensionList(" .TXT, md ,,csv"), (std::set<std::string>{".csv", ".md", ".txt"}));
    EXPECT_TRUE(PlanEngine::ParseExtensionList("").empty());
    EXPECT_TRUE(PlanEngine::ParseExtensionList(" , ").empty());
}

TEST(PlanEngineUtils, FormatTimestamp)
{
    std::tm time = {};
    time.tm_year = 2021 - 1900;
    time.tm_mon = 5;
    time.tm_mday = 15;
    time.tm_hour = 10;
    time.tm_min = 20;
    time.tm_sec = 30;
    EXPECT_EQ(PlanEngine::FormatTimestamp(time), "2021-06-15_10-20-30");
}

TEST(PlanEngineUtils, HumanReadableSize)
{
    EXPECT_EQ(PlanEngine::HumanReadableSize(0), "0.0 B");
    EXPECT_EQ(PlanEngine::HumanReadableSize(1023), "1023.0 B");
    EXPECT_EQ(PlanEngine::HumanReadableSize(1536), "1.5 KB");
    EXPECT_EQ(PlanEngine::HumanReadableSize(1024 * 1024), "1.0 MB");
}

TEST(PlanEngineUtils, ErrorKindsAndCodes)
{
    EXPECT_STREQ(PlanEngine::ErrorKindName(RenameErrorKind::Partial), "Partial");
    EXPECT_STREQ(PlanEngine::ErrorKindName(RenameErrorKind::ResourceExhausted), "ResourceExhausted");

    RenameError missing = PlanEngine::ErrorFromCode(std::error_code(ENOENT, std::generic_category()), "Open", "/x");
    EXPECT_EQ(missing.kind, RenameErrorKind::NotFound);
    EXPECT_EQ(missing.path.string(), "/x");
    EXPECT_EQ(missing.message.rfind("Open: ", 0), 0u);

    RenameError denied = PlanEngine::ErrorFromCode(std::error_code(EACCES, std::generic_category()), "Open", "/x");
    EXPECT_EQ(denied.kind, RenameErrorKind::Access);
}

TEST(PlanEngineUtils, PathDepth)
{
    EXPECT_LT(PlanEngine::PathDepth(fs::path("/a/b")), PlanEngine::PathDepth(fs::path("/a/b/c")));
    EXPECT_EQ(PlanEngine::PathDepth(fs::path("/a/b")), PlanEngine::PathDepth(fs::path("/x/y")));
}
