// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef ABSTRACT_H_3958102274416530
#define ABSTRACT_H_3958102274416530

#include <memory>
#include <vector>
#include <sx/file_access.h>


namespace sxf
{
DEFINE_NEW_FILE_ERROR(ErrorConnection)

//a place files live: local disk or remote SFTP session; paths are native path strings of the respective device
struct AbstractFileSystem
{
    virtual ~AbstractFileSystem() = default;

    //for messages: "sftp://user@host/path" or the local path
    virtual Zstring getDisplayPath(const Zstring& itemPath) const = 0;

    using ItemType = sx::ItemType;

    //symlinks are not followed; no value if the item or a parent folder is missing
    virtual std::optional<ItemType> getItemTypeIfExists(const Zstring& itemPath) = 0; //throw FileError

    struct FolderItem
    {
        Zstring itemName;
        ItemType type = ItemType::file;
    };
    //unsorted, without "." and ".."; no value if the folder is missing or is no folder
    virtual std::optional<std::vector<FolderItem>> getFolderContentIfExists(const Zstring& folderPath) = 0; //throw FileError

    //parent must exist
    virtual void createFolderPlain(const Zstring& folderPath) = 0; //throw FileError, ErrorTargetExisting

    //"mkdir -p"
    void createFolderIfMissingRecursion(const Zstring& folderPath); //throw FileError

    struct InputStream
    {
        virtual ~InputStream() = default;
        virtual size_t getBlockSize() = 0; //throw FileError; > 0
        virtual size_t tryRead(void* buffer, size_t bytesToRead) = 0; //throw FileError; bytesToRead > 0; short reads possible, 0 only at end of file
        virtual timespec getModTime() = 0; //throw FileError; since Jan. 1st 1970 GMT; sub-second part only where the device has one
    };
    virtual std::unique_ptr<InputStream> getInputStream(const Zstring& filePath) = 0; //throw FileError

    struct OutputStream
    {
        virtual ~OutputStream() = default; //deletes the file unless finalize() succeeded
        virtual size_t getBlockSize() = 0; //throw FileError; > 0
        virtual size_t tryWrite(const void* buffer, size_t bytesToWrite) = 0; //throw FileError; bytesToWrite > 0; short writes possible
        virtual void finalize() = 0; //throw FileError; the file is complete afterwards
    };
    //never overwrites
    virtual std::unique_ptr<OutputStream> getOutputStream(const Zstring& filePath) = 0; //throw FileError, ErrorTargetExisting

    virtual void removeFilePlain(const Zstring& filePath) = 0; //throw FileError

    //an existing file at pathTo is replaced
    virtual void moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo) = 0; //throw FileError

    //follows symlinks; devices without sub-second precision truncate tv_nsec
    virtual void setFileTimes(const Zstring& filePath, const timespec& accessTime, const timespec& modTime) = 0; //throw FileError

    //release the device; later calls are no-ops
    virtual void close() = 0; //throw FileError

    //shell-style pattern per path component (see glob.h); matches are sorted per folder, none is not an error
    std::vector<Zstring> glob(const Zstring& pattern); //throw FileError
};

using AFS = AbstractFileSystem;
}

#endif //ABSTRACT_H_3958102274416530
