// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_ACCESS_H_3305129877410265
#define FILE_ACCESS_H_3305129877410265

#include <optional>
#include <ctime>
#include "file_path.h"
#include "file_error.h"


namespace sx
{
enum class ItemType
{
    file, //anything that is neither folder nor symlink: devices, FIFOs, sockets
    folder,
    symlink,
};
//does not follow symlinks; no value if the item or a parent folder is missing
std::optional<ItemType> getItemTypeIfExists(const Zstring& itemPath); //throw FileError

void setFileTime(const Zstring& filePath, const timespec& accessTime, const timespec& modTime); //throw FileError

void removeFilePlain(const Zstring& filePath); //throw FileError

//same file system only; replaces an existing file at pathTo
void moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo); //throw FileError

void createDirectory(const Zstring& dirPath); //throw FileError, ErrorTargetExisting
}

#endif //FILE_ACCESS_H_3305129877410265
