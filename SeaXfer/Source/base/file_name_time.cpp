// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) seaxfer contributors                                        *
// *****************************************************************************

#include "file_name_time.h"
#include <sx/file_error.h>
#include <sx/file_path.h>
#include <sx/time.h>

using namespace sx;
using namespace sxf;


namespace
{
//"2019-12-06T22-58-10" => "-" is timeSep
TimeStamp parseTimeStamp(std::string_view str, char timeSep, bool allowZulu) //throw SysErrorTimeFormat
{
    const std::string_view strOrig = str;
    auto throwInvalid = [&] { throw SysErrorTimeFormat(replaceCpy("Invalid time stamp %x.", "%x", fmtPath(strOrig))); };

    const size_t dateTimeLen = 19; //fixed width: "YYYY-MM-DDThh-mm-ss"
    if (str.size() < dateTimeLen)
        throwInvalid();

    const std::string format = std::string("%Y-%m-%dT%H") + timeSep + "%M" + timeSep + "%S";
    const TimeComp tc = parseTime(format, str.substr(0, dateTimeLen));
    if (tc == TimeComp() || !isValidTime(tc))
        throwInvalid();
    str.remove_prefix(dateTimeLen);

    //optional fractional seconds: any number of digits, nanosecond precision
    int nanoSec = 0;
    if (startsWith(str, "."))
    {
        str.remove_prefix(1);
        size_t digitCount = 0;
        for (int scale = 100'000'000; !str.empty() && isDigit(str.front()); str.remove_prefix(1), scale /= 10, ++digitCount)
            nanoSec += (str.front() - '0') * scale; //scale reaches 0 after 9 digits

        if (digitCount == 0)
            throwInvalid();
    }

    //time zone offset
    int offsetSec = 0;
    if (allowZulu && (str == "Z" || str == "z"))
        str = {};
    else
    {
        if (str.size() != 6 || (str[0] != '+' && str[0] != '-') || str[3] != timeSep ||
            !isDigit(str[1]) || !isDigit(str[2]) || !isDigit(str[4]) || !isDigit(str[5]))
            throwInvalid();

        const int offsetHour   = (str[1] - '0') * 10 + (str[2] - '0');
        const int offsetMinute = (str[4] - '0') * 10 + (str[5] - '0');
        if (offsetHour > 23 || offsetMinute > 59)
            throwInvalid();

        offsetSec = (str[0] == '-' ? -1 : 1) * (offsetHour * 3600 + offsetMinute * 60);
    }

    const auto [utcLocal, success] = utcToTimeT(tc);
    if (!success)
        throwInvalid();

    return {utcLocal - offsetSec, nanoSec};
}
}


TimeStamp sxf::parseFileNameTime(const Zstring& filePath) //throw SysErrorTimeFormat
{
    Zstring itemName = getItemName(filePath);

    if (endsWith(itemName, Zstr(".gz")))
        itemName.resize(itemName.size() - 3);
    if (endsWith(itemName, Zstr(".sfl")))
        itemName.resize(itemName.size() - 4);

    return parseTimeStamp(itemName, '-', false /*allowZulu*/); //throw SysErrorTimeFormat
}


TimeStamp sxf::parseRfc3339Time(std::string_view str) //throw SysErrorTimeFormat
{
    return parseTimeStamp(trimCpy(str), ':', true /*allowZulu*/); //throw SysErrorTimeFormat
}


std::string sxf::formatRfc3339Time(const TimeStamp& ts)
{
    std::string output = formatTime(Zstr("%Y-%m-%dT%H:%M:%S"), getUtcTime(ts.utc));
    if (ts.nanoSec != 0)
    {
        std::string fraction = numberTo(ts.nanoSec);
        fraction.insert(0, 9 - fraction.size(), '0');
        while (endsWith(fraction, "0"))
            fraction.pop_back();
        output += '.' + fraction;
    }
    return output + 'Z';
}
