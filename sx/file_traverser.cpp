// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "file_traverser.h"
#include <dirent.h>

using namespace sx;


void sx::traverseFolder(const Zstring& dirPath, const std::function<void(const Zstring& itemName, ItemType type)>& onItem) //throw FileError
{
    const std::string errorMsg = replaceCpy("Cannot read directory %x.", "%x", fmtPath(dirPath));

    DIR* folder = ::opendir(dirPath.c_str());
    if (!folder)
    {
        const ErrorCode ec = errno;
        throw FileError(replaceCpy("Cannot open directory %x.", "%x", fmtPath(dirPath)), formatSystemError("opendir", ec));
    }
    SX_ON_SCOPE_EXIT(::closedir(folder));

    for (;;)
    {
        errno = 0; //readdir() returns nullptr for both "end of folder" and error
        const dirent* entry = ::readdir(folder);
        if (!entry)
        {
            const ErrorCode ec = errno;
            if (ec == 0)
                return;
            throw FileError(errorMsg, formatSystemError("readdir", ec));
        }

        const std::string_view itemName = entry->d_name;
        if (itemName == "." || itemName == "..")
            continue;
        if (itemName.empty())
            throw FileError(errorMsg, "Folder contains an item without name.");

        switch (entry->d_type)
        {
            case DT_LNK:
                onItem(Zstring(itemName), ItemType::symlink);
                break;
            case DT_DIR:
                onItem(Zstring(itemName), ItemType::folder);
                break;
            case DT_UNKNOWN: //not every file system fills in d_type
                if (const std::optional<ItemType> type = getItemTypeIfExists(appendPath(dirPath, Zstring(itemName)))) //throw FileError
                    onItem(Zstring(itemName), *type);
                break; //deleted in the meantime
            default: //regular file, pipe, device
                onItem(Zstring(itemName), ItemType::file);
                break;
        }
    }
}
