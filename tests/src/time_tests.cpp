// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) seaxfer contributors                                        *
// *****************************************************************************

#include "gtest/gtest.h"
#include <sx/time.h>

using namespace sx;


TEST(Time, ParseTimeWithCustomSeparators)
{
    // Act
    const TimeComp tc = parseTime("%Y-%m-%dT%H-%M-%S", "2016-05-12T17-00-02");

    // Assert
    EXPECT_EQ(tc.year,   2016);
    EXPECT_EQ(tc.month,  5);
    EXPECT_EQ(tc.day,    12);
    EXPECT_EQ(tc.hour,   17);
    EXPECT_EQ(tc.minute, 0);
    EXPECT_EQ(tc.second, 2);
}

TEST(Time, ParseTimeRejectsMismatch)
{
    EXPECT_EQ(parseTime("%Y-%m-%dT%H-%M-%S", "2016-05-12T17:00:02"), TimeComp());
    EXPECT_EQ(parseTime("%Y-%m-%d", "2016-05-1"), TimeComp());
}

TEST(Time, ValidTimeChecksRanges)
{
    EXPECT_TRUE (isValidTime({2016, 2, 29, 23, 59, 59}));
    EXPECT_FALSE(isValidTime({2015, 2, 29, 0, 0, 0}));
    EXPECT_FALSE(isValidTime({2016, 13, 1, 0, 0, 0}));
    EXPECT_FALSE(isValidTime({2016, 1, 1, 24, 0, 0}));
}

TEST(Time, UtcRoundTrip)
{
    // Arrange
    const TimeComp tc{2016, 5, 12, 4, 0, 0};

    // Act
    const auto [utc, success] = utcToTimeT(tc);

    // Assert
    ASSERT_TRUE(success);
    EXPECT_EQ(utc, 1463025600);
    EXPECT_EQ(getUtcTime(utc), tc);
    EXPECT_EQ(formatTime("%Y-%m-%d %H:%M:%S", getUtcTime(utc)), "2016-05-12 04:00:00");
}
