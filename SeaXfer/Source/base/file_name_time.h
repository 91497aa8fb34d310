// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) seaxfer contributors                                        *
// *****************************************************************************

#ifndef FILE_NAME_TIME_H_8840275519036612
#define FILE_NAME_TIME_H_8840275519036612

#include <compare>
#include <ctime>
#include <sx/sys_error.h>


namespace sxf
{
DEFINE_NEW_SYS_ERROR(SysErrorTimeFormat)

struct TimeStamp
{
    time_t utc = 0;  //number of seconds since Jan. 1st 1970 UTC
    int nanoSec = 0; //[0, 999'999'999]

    std::strong_ordering operator<=>(const TimeStamp&) const = default;
};

/*  instrument file names embed an RFC 3339 time stamp with ':' replaced by '-':
        "2019-12-06T22-58-10+00-00"
        "2019-12-06T22-58-10.3-07-00.sfl"
        "2016_340/2019-12-06T22-58-10+00-00.gz"
    only the item name is evaluated; a trailing ".gz", then a trailing ".sfl" are ignored  */
TimeStamp parseFileNameTime(const Zstring& filePath); //throw SysErrorTimeFormat

//"2019-12-06T22:58:10Z", "2019-12-06T22:58:10.3+07:00"
TimeStamp parseRfc3339Time(std::string_view str); //throw SysErrorTimeFormat

//"2019-12-06T22:58:10Z" (fractional seconds are appended if not zero)
std::string formatRfc3339Time(const TimeStamp& ts);
}

#endif //FILE_NAME_TIME_H_8840275519036612
