// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) seaxfer contributors                                        *
// *****************************************************************************

#include "TestHelpers.h"
#include "afs/glob.h"

using namespace sxf;


TEST(GlobMatch, Wildcards)
{
    EXPECT_TRUE (matchesGlob("a.sfl", "*.sfl"));
    EXPECT_TRUE (matchesGlob(".sfl", "*.sfl"));
    EXPECT_FALSE(matchesGlob("a.sfl.gz", "*.sfl"));
    EXPECT_TRUE (matchesGlob("2016_133", "????_???"));
    EXPECT_FALSE(matchesGlob("2016_13", "????_???"));
    EXPECT_TRUE (matchesGlob("", "*"));
}

TEST(GlobMatch, WildcardsDoNotCrossSeparator)
{
    EXPECT_FALSE(matchesGlob("2016_133/a.sfl", "*.sfl"));
    EXPECT_FALSE(matchesGlob("a/b", "a?b"));
}

TEST(GlobMatch, CharacterClasses)
{
    EXPECT_TRUE (matchesGlob("7", "[0-9]"));
    EXPECT_FALSE(matchesGlob("x", "[0-9]"));
    EXPECT_TRUE (matchesGlob("x", "[^0-9]"));
    EXPECT_TRUE (matchesGlob("x", "[!0-9]"));
    EXPECT_TRUE (matchesGlob("-", "[\\-+]"));
    EXPECT_TRUE (matchesGlob("+", "[\\-+]"));
    EXPECT_FALSE(matchesGlob(":", "[\\-+]"));
    EXPECT_TRUE (matchesGlob("-", "[-+]"));
    EXPECT_TRUE (matchesGlob("+", "[-+]"));
    EXPECT_TRUE (matchesGlob("-", "[+-]"));
    EXPECT_FALSE(matchesGlob(",", "[+-]")); //no range up to ']'
    EXPECT_TRUE (matchesGlob("x", "[!-+]"));
}

TEST(GlobMatch, EscapedLiterals)
{
    EXPECT_TRUE (matchesGlob("a*b", "a\\*b"));
    EXPECT_FALSE(matchesGlob("axb", "a\\*b"));
}

TEST(GlobMatch, MalformedPatternsThrow)
{
    EXPECT_THROW(matchesGlob("a", "[a"),   SysErrorGlobPattern);
    EXPECT_THROW(matchesGlob("a", "[]"),   SysErrorGlobPattern);
    EXPECT_THROW(matchesGlob("a", "[a--]"), SysErrorGlobPattern);
    EXPECT_THROW(matchesGlob("a", "a\\"),  SysErrorGlobPattern);
    //malformed tail must be reported even if the head already fails to match
    EXPECT_THROW(matchesGlob("b", "a[z"),  SysErrorGlobPattern);
}

TEST(GlobMatch, CapturePatterns)
{
    for (const char* name :
         {
             "2016-05-12T17-00-02+00-00",
             "2016-05-12T17-00-02-07-00",
             "2016-05-12T17-00-02.3-07-00",
         })
    {
        EXPECT_TRUE(matchesGlob(name, CAPTURE_FILE_PATTERNS[0]) || matchesGlob(name, CAPTURE_FILE_PATTERNS[2])) << name;
        EXPECT_TRUE(matchesGlob(std::string(name) + ".gz", CAPTURE_FILE_PATTERNS[1]) ||
                    matchesGlob(std::string(name) + ".gz", CAPTURE_FILE_PATTERNS[3])) << name;
    }

    for (const char* name :
         {
             "2016-05-12T17-00-02",
             "2016-05-12T17-00-02+00-00.sfl",
             "._seaxfer_abcdefg.2016-05-12T17-00-02+00-00_",
             "._seaxfer_abcdefg.2016-05-12T17-00-02+00-00_.gz",
         })
        for (const Zchar* pattern : CAPTURE_FILE_PATTERNS)
            EXPECT_FALSE(matchesGlob(name, pattern)) << name << " / " << pattern;

    EXPECT_TRUE (matchesGlob("2016_133", DAY_FOLDER_PATTERN));
    EXPECT_FALSE(matchesGlob("2016-133", DAY_FOLDER_PATTERN));
    EXPECT_FALSE(matchesGlob("._seaxfer_abcdefg.a.sfl_", LOG_FILE_PATTERN));
}


class GlobFileSystemTest : public TransferTestBase {};

TEST_F(GlobFileSystemTest, MatchesAcrossFolders)
{
    // Arrange
    WriteTestFile(srcRoot_ / "2016_134/b.sfl", "b");
    WriteTestFile(srcRoot_ / "2016_133/a.sfl", "a");
    WriteTestFile(srcRoot_ / "2016_133/c.txt", "c");
    WriteTestFile(srcRoot_ / "other/d.sfl", "d");
    WriteTestFile(srcRoot_ / "2016_135", "not a folder");
    const std::unique_ptr<AbstractFileSystem> fsNative = createNativeFileSystem();

    // Act
    const std::vector<Zstring> matches = fsNative->glob(srcRoot_.string() + "/????_???/*.sfl");

    // Assert
    EXPECT_EQ(matches, (std::vector<Zstring>
    {
        srcRoot_.string() + "/2016_133/a.sfl",
        srcRoot_.string() + "/2016_134/b.sfl",
    }));
}

TEST_F(GlobFileSystemTest, MissingFolderYieldsNoMatches)
{
    const std::unique_ptr<AbstractFileSystem> fsNative = createNativeFileSystem();

    EXPECT_TRUE(fsNative->glob((testRoot_ / "missing").string() + "/????_???/*.sfl").empty());
    EXPECT_TRUE(fsNative->glob((testRoot_ / "missing").string() + "/a.sfl").empty());
}

TEST_F(GlobFileSystemTest, LiteralPathMatchesExistingItemOnly)
{
    WriteTestFile(srcRoot_ / "2016_133/a.sfl", "a");
    const std::unique_ptr<AbstractFileSystem> fsNative = createNativeFileSystem();

    EXPECT_EQ(fsNative->glob(srcRoot_.string() + "/2016_133/a.sfl"), (std::vector<Zstring>{srcRoot_.string() + "/2016_133/a.sfl"}));
    EXPECT_TRUE(fsNative->glob(srcRoot_.string() + "/2016_133/b.sfl").empty());
}

TEST_F(GlobFileSystemTest, MalformedPatternIsFileError)
{
    const std::unique_ptr<AbstractFileSystem> fsNative = createNativeFileSystem();

    EXPECT_THROW(fsNative->glob(srcRoot_.string() + "/[abc"), sx::FileError);
}
