// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "file_path.h"
#include <map>
#include <unistd.h> //environ

using namespace sx;


std::optional<Zstring> sx::getParentFolderPath(const Zstring& itemPath)
{
    const size_t lastChar = itemPath.find_last_not_of(FILE_NAME_SEPARATOR);
    if (lastChar == Zstring::npos) //"/" or ""
        return std::nullopt;

    const size_t sepPos = itemPath.rfind(FILE_NAME_SEPARATOR, lastChar);
    if (sepPos == Zstring::npos)
        return std::nullopt;

    return sepPos == 0 ? Zstring(1, FILE_NAME_SEPARATOR) : itemPath.substr(0, sepPos);
}


Zstring sx::appendPath(const Zstring& basePath, const Zstring& relPath)
{
    if (basePath.empty() || relPath.empty())
        return basePath + relPath;

    return endsWith(basePath, "/") ? basePath + relPath : basePath + FILE_NAME_SEPARATOR + relPath;
}


std::optional<Zstring> sx::getEnvironmentVar(ZstringView name)
{
    //::getenv() hands out pointers into memory that ::setenv() may free => copy once
    static const std::map<Zstring, Zstring, std::less<>> envSnapshot = []
    {
        std::map<Zstring, Zstring, std::less<>> vars;
        for (char** entry = environ; entry && *entry; ++entry)
        {
            const std::string_view nameValue(*entry);
            vars.emplace(beforeFirst(nameValue, "=", IfNotFoundReturn::all),
                         afterFirst (nameValue, "=", IfNotFoundReturn::none));
        }
        return vars;
    }();

    if (auto it = envSnapshot.find(name); it != envSnapshot.end())
        return it->second;
    return std::nullopt;
}
