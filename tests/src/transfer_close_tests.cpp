// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) seaxfer contributors                                        *
// *****************************************************************************

#include "TestHelpers.h"

using namespace sx;
using namespace sxf;
using ::testing::Return;
using ::testing::Throw;


class TransferCloseTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        auto srcFs = std::make_unique<::testing::StrictMock<MockFileSystem>>();
        auto dstFs = std::make_unique<::testing::StrictMock<MockFileSystem>>();
        srcFs_ = srcFs.get();
        dstFs_ = dstFs.get();

        xfer_ = std::make_unique<Transfer>(std::move(srcFs), "/src",
                                           std::move(dstFs), "/dst", std::nullopt, log_.MakeSinks(), std::mt19937(1));
    }

    ::testing::StrictMock<MockFileSystem>* srcFs_ = nullptr; //owned by xfer_
    ::testing::StrictMock<MockFileSystem>* dstFs_ = nullptr; //
    CapturedLog log_;
    std::unique_ptr<Transfer> xfer_;
};


TEST_F(TransferCloseTest, ClosesBothFileSystems)
{
    EXPECT_CALL(*srcFs_, close());
    EXPECT_CALL(*dstFs_, close());

    EXPECT_NO_THROW(xfer_->close());
    EXPECT_TRUE(log_.error.empty());
}

TEST_F(TransferCloseTest, SourceErrorTakesPriority)
{
    // Arrange
    EXPECT_CALL(*srcFs_, close()).WillOnce(Throw(FileError("Source close failed.")));
    EXPECT_CALL(*dstFs_, close()).WillOnce(Throw(FileError("Destination close failed.")));

    // Act + Assert
    try
    {
        xfer_->close();
        FAIL() << "expected FileError";
    }
    catch (const FileError& e)
    {
        EXPECT_EQ(e.toString(), "Source close failed.");
    }
    EXPECT_EQ(log_.error, (std::vector<std::string>{"Destination close failed."}));
}

TEST_F(TransferCloseTest, DestinationIsClosedAfterSourceFailure)
{
    EXPECT_CALL(*srcFs_, close()).WillOnce(Throw(FileError("Source close failed.")));
    EXPECT_CALL(*dstFs_, close());

    EXPECT_THROW(xfer_->close(), FileError);
    EXPECT_TRUE(log_.error.empty());
}

TEST_F(TransferCloseTest, DestinationErrorIsReported)
{
    EXPECT_CALL(*srcFs_, close());
    EXPECT_CALL(*dstFs_, close()).WillOnce(Throw(FileError("Destination close failed.")));

    EXPECT_THROW(xfer_->close(), FileError);
}


TEST(TransferConstruction, RejectsMissingFileSystem)
{
    CapturedLog log;
    EXPECT_THROW(Transfer(nullptr, "/src", createNativeFileSystem(), "/dst", std::nullopt, log.MakeSinks(), std::mt19937(1)), std::logic_error);
}


TEST(TransferGlobErrors, ListingErrorAbortsPass)
{
    // Arrange
    auto srcFs = std::make_unique<::testing::NiceMock<MockFileSystem>>();
    ON_CALL(*srcFs, getDisplayPath(::testing::_)).WillByDefault(::testing::ReturnArg<0>());
    EXPECT_CALL(*srcFs, getFolderContentIfExists(Zstring("/src"))).WillOnce(Throw(FileError("Cannot open directory \"/src\".")));

    CapturedLog log;
    Transfer xfer(std::move(srcFs), "/src", createNativeFileSystem(), "/dst", std::nullopt, log.MakeSinks(), std::mt19937(1));

    // Act + Assert
    EXPECT_THROW(xfer.copyLogFiles(), FileError);
}
