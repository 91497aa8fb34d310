// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) seaxfer contributors                                        *
// *****************************************************************************

#include "gtest/gtest.h"
#include <sx/base64.h>
#include <sx/error_log.h>
#include <sx/file_path.h>
#include <sx/string_tools.h>

using namespace sx;


TEST(StringTools, SplitSkipsEmptySegments)
{
    // Arrange
    const std::string path = "/data//2016_133/file.sfl/";

    // Act
    const std::vector<std::string> parts = splitCpy(path, '/', SplitOnEmpty::skip);

    // Assert
    EXPECT_EQ(parts, (std::vector<std::string>{"data", "2016_133", "file.sfl"}));
}

TEST(StringTools, SplitKeepsEmptySegments)
{
    EXPECT_EQ(splitCpy("a,,b", ',', SplitOnEmpty::allow), (std::vector<std::string>{"a", "", "b"}));
}

TEST(StringTools, NumberConversion)
{
    int port = 0;
    EXPECT_TRUE(stringTo("2222", port));
    EXPECT_EQ(port, 2222);

    EXPECT_FALSE(stringTo("22x", port));
    EXPECT_FALSE(stringTo("", port));

    EXPECT_EQ(numberTo(-42), "-42");
}

TEST(StringTools, CaseInsensitiveCompare)
{
    EXPECT_TRUE(equalAsciiNoCase("srcRoot", "SRCROOT"));
    EXPECT_FALSE(equalAsciiNoCase("srcRoot", "srcRoo"));
}

TEST(StringTools, SplitAtTerm)
{
    EXPECT_EQ(beforeFirst("sshPort=22=x", "=", IfNotFoundReturn::all), "sshPort");
    EXPECT_EQ(afterFirst ("sshPort=22=x", "=", IfNotFoundReturn::none), "22=x");
    EXPECT_EQ(afterLast  ("file",         "/", IfNotFoundReturn::all), "file");
    EXPECT_EQ(afterLast  ("file",         "/", IfNotFoundReturn::none), "");
}

TEST(FilePath, ParentAndItemName)
{
    EXPECT_EQ(getItemName("/data/2016_133/file.sfl"), "file.sfl");
    EXPECT_EQ(getParentFolderPath("/data/2016_133/file.sfl"), std::optional<Zstring>("/data/2016_133"));
    EXPECT_EQ(getParentFolderPath("/file"), std::optional<Zstring>("/"));
    EXPECT_EQ(getParentFolderPath("file"), std::nullopt);
    EXPECT_EQ(getParentFolderPath("/data/2016_133/"), std::optional<Zstring>("/data"));
    EXPECT_EQ(getParentFolderPath("/"), std::nullopt);
}

TEST(FilePath, AppendPath)
{
    EXPECT_EQ(appendPath("/data", "2016_133"), "/data/2016_133");
    EXPECT_EQ(appendPath("/", "2016_133"), "/2016_133");
    EXPECT_EQ(appendPath("", "2016_133"), "2016_133");
}

TEST(StringTools, Base64EncodesWithPadding)
{
    EXPECT_EQ(stringEncodeBase64(""), "");
    EXPECT_EQ(stringEncodeBase64("f"), "Zg==");
    EXPECT_EQ(stringEncodeBase64("fo"), "Zm8=");
    EXPECT_EQ(stringEncodeBase64("foo"), "Zm9v");
    EXPECT_EQ(stringEncodeBase64("Sample text"), "U2FtcGxlIHRleHQ=");
    EXPECT_EQ(stringEncodeBase64(std::string("\xff\xfe\x00", 3)), "//4A");
}

TEST(StringTools, LogMessageContinuationLinesAreIndented)
{
    // Act
    const std::string line = formatMessage({0, MSG_TYPE_WARNING, "Cannot copy file \"a\".\n\nlstat failed\n"});

    // Assert
    ASSERT_TRUE(startsWith(line, "["));
    const size_t msgStart = line.find("Cannot copy");
    ASSERT_NE(msgStart, std::string::npos);
    EXPECT_EQ(line.substr(line.find("]  ")), "]  Warning:  Cannot copy file \"a\".\n" + std::string(msgStart, ' ') + "lstat failed\n");
}
