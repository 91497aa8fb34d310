// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) seaxfer contributors                                        *
// *****************************************************************************

#include "TestHelpers.h"
#include <sx/serialize.h>

using namespace sx;
using namespace sxf;


class NativeFileSystemTest : public TransferTestBase
{
protected:
    const std::unique_ptr<AbstractFileSystem> fs_ = createNativeFileSystem();
};


TEST_F(NativeFileSystemTest, CreateFolderRecursionIsIdempotent)
{
    // Arrange
    const Zstring folderPath = (dstRoot_ / "a/b/c").string();

    // Act
    fs_->createFolderIfMissingRecursion(folderPath);
    fs_->createFolderIfMissingRecursion(folderPath);

    // Assert
    EXPECT_TRUE(fs::is_directory(folderPath));
    EXPECT_EQ(fs_->getItemTypeIfExists(folderPath), AFS::ItemType::folder);
}

TEST_F(NativeFileSystemTest, CreateFolderFailsIfFileIsInTheWay)
{
    WriteTestFile(dstRoot_ / "2016_133", "file");

    EXPECT_THROW(fs_->createFolderIfMissingRecursion((dstRoot_ / "2016_133").string()), FileError);
}

TEST_F(NativeFileSystemTest, OutputStreamIsExclusive)
{
    WriteTestFile(srcRoot_ / "a", "a");

    EXPECT_THROW(fs_->getOutputStream((srcRoot_ / "a").string()), ErrorTargetExisting);
    EXPECT_EQ(ReadTestFile(srcRoot_ / "a"), "a");
}

TEST_F(NativeFileSystemTest, UnfinalizedOutputIsDeleted)
{
    // Arrange
    const Zstring filePath = (srcRoot_ / "partial").string();

    // Act
    {
        const std::unique_ptr<AFS::OutputStream> streamOut = fs_->getOutputStream(filePath);
        ASSERT_EQ(streamOut->tryWrite("abc", 3), 3u);
    }

    // Assert
    EXPECT_FALSE(fs::exists(filePath));
}

TEST_F(NativeFileSystemTest, StreamsCarryContentAndModTime)
{
    // Arrange
    WriteTestFile(srcRoot_ / "in", "payload", 1463072402);
    const Zstring outPath = (srcRoot_ / "out").string();

    // Act
    const std::unique_ptr<AFS::InputStream> streamIn = fs_->getInputStream((srcRoot_ / "in").string());
    const timespec modTime = streamIn->getModTime();
    {
        const std::unique_ptr<AFS::OutputStream> streamOut = fs_->getOutputStream(outPath);
        unbufferedStreamCopy([&](void* buffer, size_t bytesToRead) { return streamIn->tryRead(buffer, bytesToRead); }, streamIn->getBlockSize(),
                             [&](const void* buffer, size_t bytesToWrite) { return streamOut->tryWrite(buffer, bytesToWrite); }, streamOut->getBlockSize());
        streamOut->finalize();
    }
    fs_->setFileTimes(outPath, {.tv_sec = 1600000000}, modTime);

    // Assert
    EXPECT_EQ(modTime.tv_sec, 1463072402);
    EXPECT_EQ(ReadTestFile(outPath), "payload");
    EXPECT_EQ(GetModTime(outPath), 1463072402);
}

TEST_F(NativeFileSystemTest, MoveReplacesExistingFile)
{
    WriteTestFile(srcRoot_ / "tmp", "new");
    WriteTestFile(srcRoot_ / "final", "old");

    fs_->moveAndRenameItem((srcRoot_ / "tmp").string(), (srcRoot_ / "final").string());

    EXPECT_FALSE(fs::exists(srcRoot_ / "tmp"));
    EXPECT_EQ(ReadTestFile(srcRoot_ / "final"), "new");
}

TEST_F(NativeFileSystemTest, FolderContent)
{
    WriteTestFile(srcRoot_ / "2016_133/a", "a");

    const std::optional<std::vector<AFS::FolderItem>> items = fs_->getFolderContentIfExists(srcRoot_.string());
    ASSERT_TRUE(items);
    EXPECT_EQ(items->size(), 1u);
    EXPECT_EQ(items->front().itemName, "2016_133");
    EXPECT_EQ(items->front().type, AFS::ItemType::folder);

    EXPECT_FALSE(fs_->getFolderContentIfExists((srcRoot_ / "missing").string()));
    EXPECT_FALSE(fs_->getFolderContentIfExists((srcRoot_ / "2016_133/a").string()));
}

TEST_F(NativeFileSystemTest, CloseIsHarmless)
{
    EXPECT_NO_THROW(fs_->close());
    EXPECT_NO_THROW(fs_->close());
}
