// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) seaxfer contributors                                        *
// *****************************************************************************

#include "glob.h"
#include <sx/file_path.h>

using namespace sx;
using namespace sxf;


namespace
{
char getClassChar(ZstringView& mask) //throw SysErrorGlobPattern
{
    if (mask.empty() || mask.front() == '-' || mask.front() == ']')
        throw SysErrorGlobPattern("Invalid character class.");

    if (mask.front() == '\\')
    {
        mask.remove_prefix(1);
        if (mask.empty())
            throw SysErrorGlobPattern("Trailing escape character.");
    }
    const char c = mask.front();
    mask.remove_prefix(1);
    return c;
}


//mask starts after '['; on return mask is positioned after the closing ']'
bool matchesCharClass(char c, ZstringView& mask) //throw SysErrorGlobPattern
{
    bool negated = false;
    if (!mask.empty() && (mask.front() == '^' || mask.front() == '!'))
    {
        negated = true;
        mask.remove_prefix(1);
    }

    bool match = false;
    for (int itemCount = 0;; ++itemCount)
    {
        if (mask.empty())
            throw SysErrorGlobPattern("Missing ']' in character class.");

        if (mask.front() == ']' && itemCount > 0)
        {
            mask.remove_prefix(1);
            break;
        }

        char lo = '-';
        if (mask.front() == '-' && (itemCount == 0 || startsWith(mask.substr(1), "]"))) //leading or trailing '-' is literal: "[-+]", "[+-]"
            mask.remove_prefix(1);
        else
            lo = getClassChar(mask); //throw SysErrorGlobPattern
        char hi = lo;
        if (mask.size() >= 2 && mask.front() == '-' && mask[1] != ']')
        {
            mask.remove_prefix(1);
            hi = getClassChar(mask); //throw SysErrorGlobPattern
        }

        if (lo <= c && c <= hi)
            match = true;
    }
    return match != negated;
}


bool matchesGlobImpl(ZstringView name, ZstringView mask) //throw SysErrorGlobPattern
{
    for (;;)
    {
        if (mask.empty())
            return name.empty();

        switch (mask.front())
        {
            case '*':
            {
                while (!mask.empty() && mask.front() == '*') //advance mask to next non-* char
                    mask.remove_prefix(1);

                for (size_t i = 0; i <= name.size(); ++i)
                {
                    if (matchesGlobImpl(name.substr(i), mask))
                        return true;
                    if (i < name.size() && name[i] == FILE_NAME_SEPARATOR)
                        return false;
                }
                return false;
            }

            case '?': //should not match FILE_NAME_SEPARATOR
                if (name.empty() || name.front() == FILE_NAME_SEPARATOR)
                    return false;
                mask.remove_prefix(1);
                name.remove_prefix(1);
                break;

            case '[':
            {
                mask.remove_prefix(1);
                if (name.empty())
                    return false;
                if (!matchesCharClass(name.front(), mask)) //throw SysErrorGlobPattern
                    return false;
                name.remove_prefix(1);
            }
            break;

            case '\\':
                mask.remove_prefix(1);
                if (mask.empty())
                    throw SysErrorGlobPattern("Trailing escape character.");
                [[fallthrough]];

            default:
                if (name.empty() || name.front() != mask.front())
                    return false;
                mask.remove_prefix(1);
                name.remove_prefix(1);
        }
    }
}
}


bool sxf::matchesGlob(ZstringView name, ZstringView pattern) //throw SysErrorGlobPattern
{
    checkGlobPattern(pattern); //don't let a malformed pattern pass as "no match"
    return matchesGlobImpl(name, pattern);
}


void sxf::checkGlobPattern(ZstringView pattern) //throw SysErrorGlobPattern
{
    while (!pattern.empty())
    {
        const char m = pattern.front();
        pattern.remove_prefix(1);

        if (m == '[')
            matchesCharClass('\0', pattern); //throw SysErrorGlobPattern
        else if (m == '\\')
        {
            if (pattern.empty())
                throw SysErrorGlobPattern("Trailing escape character.");
            pattern.remove_prefix(1);
        }
    }
}


bool sxf::hasGlobMeta(ZstringView pattern)
{
    return pattern.find_first_of("*?[\\") != ZstringView::npos;
}


Zstring sxf::unescapeGlob(ZstringView pattern)
{
    Zstring output;
    for (auto it = pattern.begin(); it != pattern.end(); ++it)
    {
        if (*it == '\\' && it + 1 != pattern.end())
            ++it;
        output += *it;
    }
    return output;
}
