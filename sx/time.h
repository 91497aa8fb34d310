// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef TIME_H_9316047725508813
#define TIME_H_9316047725508813

#include <cerrno>
#include <ctime>
#include <utility>
#include "string_tools.h"
#include "zstring.h"


namespace sx
{
//broken-down calendar time; all-zero means "invalid"
struct TimeComp
{
    int year   = 0;
    int month  = 0; //1-12
    int day    = 0; //1-31
    int hour   = 0; //0-23
    int minute = 0; //0-59
    int second = 0; //0-60: leap second

    bool operator==(const TimeComp&) const = default;
};

TimeComp getUtcTime  (time_t utc); //TimeComp() on error
TimeComp getLocalTime(time_t utc); //

std::pair<time_t, bool /*success*/> utcToTimeT(const TimeComp& tc);

//rejects what timegm() would silently roll over: month 13, February 30th, hour 24
bool isValidTime(const TimeComp& tc);

//strftime() syntax; empty string for TimeComp()
Zstring formatTime(const Zchar* format, const TimeComp& tc);

const Zchar* const formatIsoDateTimeTag = Zstr("%Y-%m-%d %H:%M:%S"); //2016-05-12 17:00:02

//fixed-width subset of strptime(): %Y (4 digits), %m %d %H %M %S (2 digits), literal chars match exactly
//the whole string must be consumed; no range checks => see isValidTime()
TimeComp parseTime(std::string_view format, std::string_view str); //TimeComp() on error





//############################ implementation ##############################
namespace impl
{
inline
TimeComp fromClibTime(const std::tm& ctc)
{
    return {ctc.tm_year + 1900, ctc.tm_mon + 1, ctc.tm_mday, ctc.tm_hour, ctc.tm_min, ctc.tm_sec};
}


inline
std::tm toClibTime(const TimeComp& tc)
{
    std::tm ctc = {};
    ctc.tm_year  = tc.year - 1900;
    ctc.tm_mon   = tc.month - 1;
    ctc.tm_mday  = tc.day;
    ctc.tm_hour  = tc.hour;
    ctc.tm_min   = tc.minute;
    ctc.tm_sec   = tc.second;
    ctc.tm_isdst = 0;
    return ctc;
}
}


inline
TimeComp getUtcTime(time_t utc)
{
    std::tm ctc = {};
    return ::gmtime_r(&utc, &ctc) ? impl::fromClibTime(ctc) : TimeComp();
}


inline
TimeComp getLocalTime(time_t utc)
{
    std::tm ctc = {};
    return ::localtime_r(&utc, &ctc) ? impl::fromClibTime(ctc) : TimeComp();
}


inline
std::pair<time_t, bool /*success*/> utcToTimeT(const TimeComp& tc)
{
    if (tc == TimeComp())
        return {};

    std::tm ctc = impl::toClibTime(tc);
    errno = 0;
    const time_t utc = ::timegm(&ctc); //-1 is also 1969-12-31 23:59:59
    if (utc == -1 && errno != 0)
        return {};
    return {utc, true};
}


inline
bool isValidTime(const TimeComp& tc)
{
    if (tc.month < 1 || 12 < tc.month)
        return false;

    const bool leapYear = tc.year % 4 == 0 && (tc.year % 100 != 0 || tc.year % 400 == 0);
    const int monthLen = tc.month == 2 ? (leapYear ? 29 : 28) :
                         tc.month == 4 || tc.month == 6 || tc.month == 9 || tc.month == 11 ? 30 : 31;

    return 1 <= tc.day && tc.day <= monthLen &&
           0 <= tc.hour   && tc.hour   < 24 &&
           0 <= tc.minute && tc.minute < 60 &&
           0 <= tc.second && tc.second <= 60;
}


inline
Zstring formatTime(const Zchar* format, const TimeComp& tc)
{
    if (tc == TimeComp())
        return Zstring();

    std::tm ctc = impl::toClibTime(tc);
    ctc.tm_isdst = -1;
    std::mktime(&ctc); //strftime() may need tm_wday and tm_yday

    char buf[128] = {};
    return Zstring(buf, std::strftime(buf, sizeof(buf), format, &ctc));
}


inline
TimeComp parseTime(std::string_view format, std::string_view str)
{
    TimeComp tc;

    while (!format.empty())
    {
        if (format.front() != '%')
        {
            if (!startsWith(str, format.substr(0, 1)))
                return TimeComp();
            format.remove_prefix(1);
            str   .remove_prefix(1);
            continue;
        }

        if (format.size() < 2)
            return TimeComp();
        const char conversion = format[1];
        format.remove_prefix(2);

        int* field = nullptr;
        size_t width = 2;
        switch (conversion)
        {
            //*INDENT-OFF*
            case 'Y': field = &tc.year; width = 4; break;
            case 'm': field = &tc.month;  break;
            case 'd': field = &tc.day;    break;
            case 'H': field = &tc.hour;   break;
            case 'M': field = &tc.minute; break;
            case 'S': field = &tc.second; break;
            default: return TimeComp();
            //*INDENT-ON*
        }

        if (str.size() < width)
            return TimeComp();

        int value = 0;
        for (const char c : str.substr(0, width))
        {
            if (!isDigit(c))
                return TimeComp();
            value = value * 10 + (c - '0');
        }
        *field = value;
        str.remove_prefix(width);
    }
    return str.empty() ? tc : TimeComp();
}
}

#endif //TIME_H_9316047725508813
