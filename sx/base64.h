// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef BASE64_H_2901847736651024
#define BASE64_H_2901847736651024

#include <algorithm>
#include <string>
#include <string_view>


namespace sx
{
//RFC 4648 base64 with '=' padding: "Sample text" => "U2FtcGxlIHRleHQ="
inline
std::string stringEncodeBase64(std::string_view str)
{
    const char alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string output;
    output.reserve((str.size() + 2) / 3 * 4);

    for (size_t pos = 0; pos < str.size(); pos += 3)
    {
        const size_t groupLen = std::min<size_t>(3, str.size() - pos);

        unsigned int group = 0; //24 bits, big-endian
        for (size_t i = 0; i < 3; ++i)
            group = (group << 8) | (i < groupLen ? static_cast<unsigned char>(str[pos + i]) : 0U);

        for (size_t i = 0; i < 4; ++i)
            output += i <= groupLen ? alphabet[(group >> (18 - 6 * i)) & 0x3f] : '=';
    }
    return output;
}
}

#endif //BASE64_H_2901847736651024
