// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef STRING_TOOLS_H_7729104518235
#define STRING_TOOLS_H_7729104518235

#include <algorithm>
#include <cassert>
#include <charconv>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>


//string helpers for char-based strings (UTF-8 paths and messages)
namespace sx
{
inline bool isWhiteSpace(char c) { return c == ' ' || ('\t' <= c && c <= '\r'); } //std::isspace() for default locale, minus the int/unsigned char trap
inline bool isDigit     (char c) { return '0' <= c && c <= '9'; } //not exactly the same as "std::isdigit" -> we consider '0'-'9' only!
inline char asciiToLower(char c) { return 'A' <= c && c <= 'Z' ? static_cast<char>(c - 'A' + 'a') : c; }

inline bool contains  (std::string_view str, std::string_view term)    { return str.find(term) != std::string_view::npos; }
inline bool startsWith(std::string_view str, std::string_view prefix)  { return str.substr(0, prefix.size()) == prefix; }
inline bool endsWith  (std::string_view str, std::string_view postfix) { return str.size() >= postfix.size() && str.substr(str.size() - postfix.size()) == postfix; }

bool equalAsciiNoCase(std::string_view lhs, std::string_view rhs);

enum class IfNotFoundReturn
{
    all,
    none
};
std::string afterLast  (std::string_view str, std::string_view term, IfNotFoundReturn infr);
std::string afterFirst (std::string_view str, std::string_view term, IfNotFoundReturn infr);
std::string beforeFirst(std::string_view str, std::string_view term, IfNotFoundReturn infr);

enum class SplitOnEmpty
{
    allow,
    skip
};
[[nodiscard]] std::vector<std::string> splitCpy(std::string_view str, char delimiter, SplitOnEmpty soe);

[[nodiscard]] std::string trimCpy(std::string_view str);

[[nodiscard]] std::string replaceCpy(std::string str, std::string_view oldTerm, std::string_view newTerm);

template <class Num> std::string numberTo(const Num& number);
template <class Num> bool        stringTo(std::string_view str, Num& number); //false if not a complete number






//---------------------- implementation ----------------------
inline
bool equalAsciiNoCase(std::string_view lhs, std::string_view rhs)
{
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) { return asciiToLower(a) == asciiToLower(b); });
}


inline
std::string afterLast(std::string_view str, std::string_view term, IfNotFoundReturn infr)
{
    assert(!term.empty());
    const size_t pos = str.rfind(term);
    if (pos == std::string_view::npos)
        return infr == IfNotFoundReturn::all ? std::string(str) : std::string();

    return std::string(str.substr(pos + term.size()));
}


inline
std::string afterFirst(std::string_view str, std::string_view term, IfNotFoundReturn infr)
{
    assert(!term.empty());
    const size_t pos = str.find(term);
    if (pos == std::string_view::npos)
        return infr == IfNotFoundReturn::all ? std::string(str) : std::string();

    return std::string(str.substr(pos + term.size()));
}


inline
std::string beforeFirst(std::string_view str, std::string_view term, IfNotFoundReturn infr)
{
    assert(!term.empty());
    const size_t pos = str.find(term);
    if (pos == std::string_view::npos)
        return infr == IfNotFoundReturn::all ? std::string(str) : std::string();

    return std::string(str.substr(0, pos));
}


inline
std::vector<std::string> splitCpy(std::string_view str, char delimiter, SplitOnEmpty soe)
{
    std::vector<std::string> output;
    for (;;)
    {
        const size_t pos = str.find(delimiter);
        const std::string_view part = str.substr(0, pos);

        if (!part.empty() || soe == SplitOnEmpty::allow)
            output.emplace_back(part);

        if (pos == std::string_view::npos)
            return output;
        str.remove_prefix(pos + 1);
    }
}


inline
std::string trimCpy(std::string_view str)
{
    auto itFirst = std::find_if_not(str.begin(), str.end(), isWhiteSpace);
    auto itLast  = std::find_if_not(str.rbegin(), std::string_view::const_reverse_iterator(itFirst), isWhiteSpace).base();
    return std::string(itFirst, itLast);
}


inline
std::string replaceCpy(std::string str, std::string_view oldTerm, std::string_view newTerm)
{
    assert(!oldTerm.empty());
    if (oldTerm.empty())
        return str;

    for (size_t pos = 0; (pos = str.find(oldTerm, pos)) != std::string::npos; pos += newTerm.size())
        str.replace(pos, oldTerm.size(), newTerm);
    return str;
}


template <class Num> inline
std::string numberTo(const Num& number)
{
    char buffer[64]; //big enough for 64-bit integers
    const std::to_chars_result rv = std::to_chars(std::begin(buffer), std::end(buffer), number);
    assert(rv.ec == std::errc());
    return std::string(buffer, rv.ptr);
}


template <class Num> inline
bool stringTo(std::string_view str, Num& number)
{
    if (str.empty())
        return false;
    const std::from_chars_result rv = std::from_chars(str.data(), str.data() + str.size(), number);
    return rv.ec == std::errc() && rv.ptr == str.data() + str.size();
}
}

#endif //STRING_TOOLS_H_7729104518235
