// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) seaxfer contributors                                        *
// *****************************************************************************

#include "TestHelpers.h"

using namespace sx;
using namespace sxf;


class CopyLogFilesTest : public TransferTestBase {};


TEST_F(CopyLogFilesTest, NoMatchesCreatesNothing)
{
    // Arrange
    const auto xfer = MakeTransfer();

    // Act
    xfer->copyLogFiles();

    // Assert
    EXPECT_FALSE(fs::exists(dstRoot_));
    EXPECT_EQ(log_.info, (std::vector<std::string>{"Found 0 source SFL files."}));
}

TEST_F(CopyLogFilesTest, RecopiesChangedFiles)
{
    // Arrange
    WriteTestFile(srcRoot_ / "2016_133/a.sfl", "a");
    WriteTestFile(srcRoot_ / "2016_134/b.sfl", "b");
    const auto xfer = MakeTransfer();

    // Act
    xfer->copyLogFiles();

    // Assert
    EXPECT_EQ(ListFilesRecursive(dstRoot_), (std::vector<std::string>{"2016_133/a.sfl", "2016_134/b.sfl"}));
    EXPECT_EQ(ReadTestFile(dstRoot_ / "2016_133/a.sfl"), "a");
    EXPECT_EQ(ReadTestFile(dstRoot_ / "2016_134/b.sfl"), "b");

    // Arrange
    WriteTestFile(srcRoot_ / "2016_133/a.sfl", "aa");
    WriteTestFile(srcRoot_ / "2016_134/b.sfl", "bb");

    // Act
    xfer->copyLogFiles();

    // Assert
    EXPECT_EQ(ListFilesRecursive(dstRoot_), (std::vector<std::string>{"2016_133/a.sfl", "2016_134/b.sfl"}));
    EXPECT_EQ(ReadTestFile(dstRoot_ / "2016_133/a.sfl"), "aa");
    EXPECT_EQ(ReadTestFile(dstRoot_ / "2016_134/b.sfl"), "bb");
}

TEST_F(CopyLogFilesTest, RepeatedRunIsIdempotent)
{
    WriteTestFile(srcRoot_ / "2016_133/a.sfl", "a", 1463072402);
    const auto xfer = MakeTransfer();

    xfer->copyLogFiles();
    xfer->copyLogFiles();

    EXPECT_EQ(ListFilesRecursive(dstRoot_), (std::vector<std::string>{"2016_133/a.sfl"}));
    EXPECT_EQ(ReadTestFile(dstRoot_ / "2016_133/a.sfl"), "a");
    EXPECT_EQ(GetModTime(dstRoot_ / "2016_133/a.sfl"), 1463072402);
}

TEST_F(CopyLogFilesTest, IgnoresOtherFilesAndFolders)
{
    WriteTestFile(srcRoot_ / "2016_133/a.sfl", "a");
    WriteTestFile(srcRoot_ / "2016_133/2016-05-12T17-00-02+00-00", "evt");
    WriteTestFile(srcRoot_ / "2016_133/a.sfl.gz", "gz");
    WriteTestFile(srcRoot_ / "misc/b.sfl", "b");
    WriteTestFile(srcRoot_ / "c.sfl", "c");
    const auto xfer = MakeTransfer();

    xfer->copyLogFiles();

    EXPECT_EQ(ListFilesRecursive(dstRoot_), (std::vector<std::string>{"2016_133/a.sfl"}));
}

TEST_F(CopyLogFilesTest, CutoffExcludesEarlierFiles)
{
    // Arrange
    WriteTestFile(srcRoot_ / "2016_133/a.sfl", "a");
    WriteTestFile(srcRoot_ / "2016_133/2016-05-12T03-00-00-00-00.sfl", "b");
    WriteTestFile(srcRoot_ / "2016_133/2016-05-12T04-00-00-00-00.sfl", "c");
    WriteTestFile(srcRoot_ / "2016_133/2016-05-12T05-00-00-00-00.sfl", "d");
    const auto xfer = MakeTransfer(parseRfc3339Time("2016-05-12T04:00:00Z"));

    // Act
    xfer->copyLogFiles();

    // Assert
    EXPECT_EQ(ListFilesRecursive(dstRoot_), (std::vector<std::string>
    {
        "2016_133/2016-05-12T04-00-00-00-00.sfl",
        "2016_133/2016-05-12T05-00-00-00-00.sfl",
        "2016_133/a.sfl",
    }));

    // Arrange
    WriteTestFile(srcRoot_ / "2016_133/a.sfl", "aa");
    WriteTestFile(srcRoot_ / "2016_133/2016-05-12T04-00-00-00-00.sfl", "cc");
    WriteTestFile(srcRoot_ / "2016_133/2016-05-12T05-00-00-00-00.sfl", "dd");

    // Act
    xfer->copyLogFiles();

    // Assert
    EXPECT_FALSE(fs::exists(dstRoot_ / "2016_133/2016-05-12T03-00-00-00-00.sfl"));
    EXPECT_EQ(ReadTestFile(dstRoot_ / "2016_133/a.sfl"), "aa");
    EXPECT_EQ(ReadTestFile(dstRoot_ / "2016_133/2016-05-12T04-00-00-00-00.sfl"), "cc");
    EXPECT_EQ(ReadTestFile(dstRoot_ / "2016_133/2016-05-12T05-00-00-00-00.sfl"), "dd");
}

TEST_F(CopyLogFilesTest, FailureAbortsPassAndNamesFile)
{
    // Arrange
    WriteTestFile(srcRoot_ / "2016_133/a.sfl", "a");
    WriteTestFile(srcRoot_ / "2016_133/b.sfl", "b");
    fs::create_directories(dstRoot_ / "2016_133/a.sfl/blocker"); //non-empty folder at final path
    const auto xfer = MakeTransfer();

    // Act
    try
    {
        xfer->copyLogFiles();
        FAIL() << "expected ErrorCopyFile";
    }
    catch (const ErrorCopyFile& e)
    {
        // Assert
        EXPECT_THAT(e.toString(), ::testing::HasSubstr("Error while copying"));
        EXPECT_THAT(e.toString(), ::testing::HasSubstr("a.sfl"));
    }
    EXPECT_FALSE(fs::exists(dstRoot_ / "2016_133/b.sfl")); //no partial-continue
}

TEST_F(CopyLogFilesTest, LogsEachCopiedFile)
{
    WriteTestFile(srcRoot_ / "2016_133/a.sfl", "a");
    const auto xfer = MakeTransfer();

    xfer->copyLogFiles();

    EXPECT_EQ(log_.info, (std::vector<std::string>
    {
        "Found 1 source SFL files.",
        "Copied " + (srcRoot_ / "2016_133/a.sfl").string(),
    }));
    EXPECT_TRUE(log_.error.empty());
}
