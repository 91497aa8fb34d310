// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "file_access.h"
#include "scope_guard.h"
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

using namespace sx;


std::optional<ItemType> sx::getItemTypeIfExists(const Zstring& itemPath) //throw FileError
{
    struct stat itemInfo = {};
    if (::lstat(itemPath.c_str(), &itemInfo) != 0)
    {
        const ErrorCode ec = errno;
        if (ec == ENOENT || ec == ENOTDIR) //ENOTDIR: some parent is a file
            return std::nullopt;
        throw FileError(replaceCpy("Cannot read file attributes of %x.", "%x", fmtPath(itemPath)), formatSystemError("lstat", ec));
    }

    if (S_ISLNK(itemInfo.st_mode))
        return ItemType::symlink;
    return S_ISDIR(itemInfo.st_mode) ? ItemType::folder : ItemType::file;
}


void sx::setFileTime(const Zstring& filePath, const timespec& accessTime, const timespec& modTime) //throw FileError
{
    const timespec fileTimes[] = {accessTime, modTime};
    try
    {
        if (::utimensat(AT_FDCWD, filePath.c_str(), fileTimes, 0 /*follow symlinks*/) != 0)
        {
            //CIFS mounts reject utimensat() with EINVAL, yet accept futimens() on a handle opened for writing
            const int fd = ::open(filePath.c_str(), O_WRONLY | O_APPEND | O_CLOEXEC);
            if (fd == -1)
                THROW_LAST_SYS_ERROR("open");
            SX_ON_SCOPE_EXIT(::close(fd));

            if (::futimens(fd, fileTimes) != 0)
                THROW_LAST_SYS_ERROR("futimens");
        }
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot write modification time of %x.", "%x", fmtPath(filePath)), e.toString()); }
}


void sx::removeFilePlain(const Zstring& filePath) //throw FileError
{
    if (::unlink(filePath.c_str()) != 0)
        throw FileError(replaceCpy("Cannot delete file %x.", "%x", fmtPath(filePath)), formatSystemError("unlink", errno));
}


void sx::moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo) //throw FileError
{
    if (::rename(pathFrom.c_str(), pathTo.c_str()) != 0) //atomically replaces pathTo
    {
        const ErrorCode ec = errno;
        throw FileError(replaceCpy(replaceCpy("Cannot move file %x to %y.", "%x", "\n" + fmtPath(pathFrom)), "%y", "\n" + fmtPath(pathTo)),
                        formatSystemError("rename", ec));
    }
}


void sx::createDirectory(const Zstring& dirPath) //throw FileError, ErrorTargetExisting
{
    const std::string errorMsg = replaceCpy("Cannot create directory %x.", "%x", fmtPath(dirPath));

    const Zstring dirName = getItemName(dirPath);
    if (dirName.find_first_not_of(Zstr('.')) == Zstring::npos) //"", ".", ".."
        throw FileError(errorMsg, replaceCpy("Invalid folder name %x.", "%x", fmtPath(dirName)));

    if (::mkdir(dirPath.c_str(), 0777 /*umask applies*/) != 0)
    {
        const ErrorCode ec = errno;
        if (ec == EEXIST)
            throw ErrorTargetExisting(errorMsg, formatSystemError("mkdir", ec));
        throw FileError(errorMsg, formatSystemError("mkdir", ec));
    }
}
