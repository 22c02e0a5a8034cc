#include "pch.h"
#include "TestFixtures.h"
#include "../../src/Logic/PlanEngine.h"
#include <string>

namespace fs = std::filesystem;

TEST_F(PlanEngineFilesystemTest, Allocate_FreePathIsReturnedAndClaimed)
{
    ClaimedPathSet claimed;
    const fs::path desired = tempTestDir / "a.txt";

    EXPECT_EQ(PlanEngine::Allocate(desired, claimed).string(), desired.string());
    EXPECT_EQ(claimed.count(PlanEngine::ClaimKey(desired)), 1u);
}

TEST_F(PlanEngineFilesystemTest, Allocate_ExistingPathGetsCounterSuffix)
{
    CreateDummyFile(tempTestDir / "a.txt");
    ClaimedPathSet claimed;
    EXPECT_EQ(PlanEngine::Allocate(tempTestDir / "a.txt", claimed).filename().string(), "a_1.txt");

    CreateDummyFile(tempTestDir / "b.txt");
    CreateDummyFile(tempTestDir / "b_1.txt");
    EXPECT_EQ(PlanEngine::Allocate(tempTestDir / "b.txt", claimed).filename().string(), "b_2.txt");
}

TEST_F(PlanEngineFilesystemTest, Allocate_ClaimedPathsCollideWithinOnePass)
{
    ClaimedPathSet claimed;
    EXPECT_EQ(PlanEngine::Allocate(tempTestDir / "same.txt", claimed).filename().string(), "same.txt");
    EXPECT_EQ(PlanEngine::Allocate(tempTestDir / "same.txt", claimed).filename().string(), "same_1.txt");
    EXPECT_EQ(PlanEngine::Allocate(tempTestDir / "same.txt", claimed).filename().string(), "same_2.txt");
    EXPECT_EQ(claimed.size(), 3u);
}

TEST_F(PlanEngineFilesystemTest, Allocate_NameWithoutExtension)
{
    CreateDummyFile(tempTestDir / "README");
    ClaimedPathSet claimed;
    EXPECT_EQ(PlanEngine::Allocate(tempTestDir / "README", claimed).filename().string(), "README_1");
}

TEST_F(PlanEngineFilesystemTest, Allocate_ExistingDirectoryCountsAsTaken)
{
    CreateDummyDir(tempTestDir / "photos");
    ClaimedPathSet claimed;
    EXPECT_EQ(PlanEngine::Allocate(tempTestDir / "photos", claimed).filename().string(), "photos_1");
}

TEST_F(PlanEngineFilesystemTest, Allocate_GivesUpAfterAttemptLimit)
{
    ClaimedPathSet claimed;
    const fs::path desired = tempTestDir / "full.txt";
    claimed.insert(PlanEngine::ClaimKey(desired));
    for (int n = 1; n <= PlanEngine::MaxAllocationAttempts; ++n)
    {
        claimed.insert(PlanEngine::ClaimKey(tempTestDir / ("full_" + std::to_string(n) + ".txt")));
    }

    try
    {
        PlanEngine::Allocate(desired, claimed);
        FAIL() << "Expected RenameException";
    }
    catch (const RenameException &e)
    {
        EXPECT_EQ(e.Kind(), RenameErrorKind::ResourceExhausted);
    }
}

TEST_F(PlanEngineFilesystemTest, PathExists_FilesAndMissingPaths)
{
    CreateDummyFile(tempTestDir / "here.txt");
    EXPECT_TRUE(PlanEngine::PathExists(tempTestDir / "here.txt"));
    EXPECT_TRUE(PlanEngine::PathExists(tempTestDir));
    EXPECT_FALSE(PlanEngine::PathExists(tempTestDir / "missing.txt"));
    EXPECT_FALSE(PlanEngine::PathExists(tempTestDir / "here.txt" / "child")); // ENOTDIR
}
