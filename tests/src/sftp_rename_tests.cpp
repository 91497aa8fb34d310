// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) seaxfer contributors                                        *
// *****************************************************************************

#include <gtest/gtest.h>
#include <libssh2/libssh2_wrap.h>
#include "afs/sftp.h"

using namespace sxf;


class SftpRenameConflictTest : public ::testing::TestWithParam<std::pair<unsigned long, bool>> {};

TEST_P(SftpRenameConflictTest, ReplacesTargetOnlyForConflictStatus)
{
    // Arrange
    const auto [sftpStatusCode, expected] = GetParam();

    // Act
    const bool conflict = isSftpRenameConflict(sftpStatusCode);

    // Assert
    EXPECT_EQ(conflict, expected) << "status " << sftpStatusCode;
}

INSTANTIATE_TEST_SUITE_P(Statuses, SftpRenameConflictTest, ::testing::Values(
                             std::pair<unsigned long, bool>(LIBSSH2_FX_FAILURE,             true),
                             std::pair<unsigned long, bool>(LIBSSH2_FX_FILE_ALREADY_EXISTS, true),
                             std::pair<unsigned long, bool>(LIBSSH2_FX_PERMISSION_DENIED,   false),
                             std::pair<unsigned long, bool>(LIBSSH2_FX_NO_SUCH_FILE,        false),
                             std::pair<unsigned long, bool>(LIBSSH2_FX_NO_SUCH_PATH,        false),
                             std::pair<unsigned long, bool>(LIBSSH2_FX_WRITE_PROTECT,       false),
                             std::pair<unsigned long, bool>(LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM, false)));
