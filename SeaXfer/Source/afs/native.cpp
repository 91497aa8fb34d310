// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "native.h"
#include <sx/file_io.h>
#include <sx/file_traverser.h>

using namespace sx;
using namespace sxf;


namespace
{
struct InputStreamNative : public AFS::InputStream
{
    explicit InputStreamNative(const Zstring& filePath) : fileIn_(filePath) {} //throw FileError

    size_t getBlockSize() override { return fileIn_.getBlockSize(); }
    size_t tryRead(void* buffer, size_t bytesToRead) override { return fileIn_.tryRead(buffer, bytesToRead); } //throw FileError

    timespec getModTime() override { return fileIn_.getStat().st_mtim; } //throw FileError

private:
    FileInputPlain fileIn_;
};

struct OutputStreamNative : public AFS::OutputStream
{
    explicit OutputStreamNative(const Zstring& filePath) : fileOut_(filePath) {} //throw FileError, ErrorTargetExisting

    size_t getBlockSize() override { return fileOut_.getBlockSize(); }
    size_t tryWrite(const void* buffer, size_t bytesToWrite) override { return fileOut_.tryWrite(buffer, bytesToWrite); } //throw FileError

    void finalize() override { fileOut_.close(); } //throw FileError

private:
    FileOutputPlain fileOut_; //deletes the file if not closed
};

class NativeFileSystem : public AbstractFileSystem
{
public:
    Zstring getDisplayPath(const Zstring& itemPath) const override { return itemPath; }

    std::optional<ItemType> getItemTypeIfExists(const Zstring& itemPath) override { return sx::getItemTypeIfExists(itemPath); } //throw FileError

    std::optional<std::vector<FolderItem>> getFolderContentIfExists(const Zstring& folderPath) override //throw FileError
    {
        const std::optional<ItemType> type = sx::getItemTypeIfExists(folderPath); //throw FileError
        if (!type || *type == ItemType::file)
            return std::nullopt;

        struct stat linkTarget = {};
        if (*type == ItemType::symlink && (::stat(folderPath.c_str(), &linkTarget) != 0 || !S_ISDIR(linkTarget.st_mode)))
            return std::nullopt; //dangling or leading to a file

        std::vector<FolderItem> items;
        traverseFolder(folderPath, [&](const Zstring& itemName, ItemType itemType) { items.push_back({itemName, itemType}); }); //throw FileError
        return items;
    }

    void createFolderPlain(const Zstring& folderPath) override { createDirectory(folderPath); } //throw FileError, ErrorTargetExisting

    std::unique_ptr<InputStream> getInputStream(const Zstring& filePath) override
    {
        return std::make_unique<InputStreamNative>(filePath); //throw FileError
    }

    std::unique_ptr<OutputStream> getOutputStream(const Zstring& filePath) override
    {
        return std::make_unique<OutputStreamNative>(filePath); //throw FileError, ErrorTargetExisting
    }

    void removeFilePlain(const Zstring& filePath) override { sx::removeFilePlain(filePath); } //throw FileError

    void moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo) override { sx::moveAndRenameItem(pathFrom, pathTo); } //throw FileError

    void setFileTimes(const Zstring& filePath, const timespec& accessTime, const timespec& modTime) override { setFileTime(filePath, accessTime, modTime); } //throw FileError

    void close() override {}
};
}


std::unique_ptr<AbstractFileSystem> sxf::createNativeFileSystem()
{
    return std::make_unique<NativeFileSystem>();
}
