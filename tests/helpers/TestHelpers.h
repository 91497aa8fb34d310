// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) seaxfer contributors                                        *
// *****************************************************************************

#ifndef TEST_HELPERS_H_5518203746691024
#define TEST_HELPERS_H_5518203746691024

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <vector>
#include <sys/stat.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include <sx/file_access.h>
#include <sx/serialize.h>
#include <sx/zlib_wrap.h>
#include <zlib.h>
#include "afs/abstract.h"
#include "afs/native.h"
#include "base/transfer.h"

namespace fs = std::filesystem;


/**
 * @brief Write a file, creating parent directories, and optionally set its modification time.
 */
inline void WriteTestFile(const fs::path& filePath, const std::string& content, time_t modTime = 0)
{
    fs::create_directories(filePath.parent_path());
    {
        std::ofstream out(filePath, std::ios::binary | std::ios::trunc);
        out << content;
    }
    if (modTime != 0)
        sx::setFileTime(filePath.string(), {.tv_sec = modTime}, {.tv_sec = modTime}); //throw FileError
}


inline std::string ReadTestFile(const fs::path& filePath)
{
    std::ifstream in(filePath, std::ios::binary);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}


inline time_t GetModTime(const fs::path& filePath)
{
    struct stat fileInfo = {};
    if (::stat(filePath.c_str(), &fileInfo) != 0)
        return -1;
    return fileInfo.st_mtime;
}


inline timespec GetModTimeExact(const fs::path& filePath)
{
    struct stat fileInfo = {};
    if (::stat(filePath.c_str(), &fileInfo) != 0)
        return {.tv_sec = -1};
    return fileInfo.st_mtim;
}


/**
 * @brief Gzip a buffer the way the transfer compresses files.
 */
inline std::string GzipCompress(const std::string& data, const sx::GzipHeader& header)
{
    size_t pos = 0;
    sx::InputStreamAsGzip gzipStream([&](void* buffer, size_t bytesToRead)
    {
        const size_t chunkSize = std::min(bytesToRead, data.size() - pos);
        std::copy_n(data.data() + pos, chunkSize, static_cast<char*>(buffer));
        pos += chunkSize;
        return chunkSize;
    }, 64 * 1024, sx::GZIP_DEFAULT_LEVEL, header);

    return sx::unbufferedLoad<std::string>([&](void* buffer, size_t bytesToRead) { return gzipStream.read(buffer, bytesToRead); },
                                           gzipStream.getBlockSize());
}


/**
 * @brief Decode a single-member gzip stream with plain zlib; throws std::runtime_error if it is not one.
 */
inline std::string GzipDecompress(const std::string& gz, sx::GzipHeader* headerOut = nullptr)
{
    z_stream zs = {};
    if (::inflateInit2(&zs, MAX_WBITS + 16) != Z_OK)
        throw std::runtime_error("inflateInit2 failed");

    char nameBuf[256] = {};
    gz_header gzHeader = {};
    gzHeader.name     = reinterpret_cast<Bytef*>(nameBuf);
    gzHeader.name_max = sizeof(nameBuf) - 1;
    ::inflateGetHeader(&zs, &gzHeader);

    zs.next_in  = reinterpret_cast<Bytef*>(const_cast<char*>(gz.data()));
    zs.avail_in = static_cast<uInt>(gz.size());

    std::string output;
    int rc = Z_OK;
    while (rc == Z_OK)
    {
        char chunk[4096];
        zs.next_out  = reinterpret_cast<Bytef*>(chunk);
        zs.avail_out = sizeof(chunk);
        rc = ::inflate(&zs, Z_NO_FLUSH);
        output.append(chunk, sizeof(chunk) - zs.avail_out);
    }
    ::inflateEnd(&zs);

    if (rc != Z_STREAM_END)
        throw std::runtime_error("not a complete gzip stream: zlib status " + std::to_string(rc));
    if (headerOut)
        *headerOut = {nameBuf, static_cast<time_t>(gzHeader.time)};
    return output;
}


/**
 * @brief Sorted list of all files below a directory, as paths relative to it.
 */
inline std::vector<std::string> ListFilesRecursive(const fs::path& rootPath)
{
    std::vector<std::string> files;
    if (fs::is_directory(rootPath))
        for (const auto& entry : fs::recursive_directory_iterator(rootPath))
            if (entry.is_regular_file())
                files.push_back(fs::relative(entry.path(), rootPath).string());
    std::sort(files.begin(), files.end());
    return files;
}


/**
 * @brief Collects the messages of the three transfer log sinks.
 */
struct CapturedLog
{
    std::vector<std::string> debug;
    std::vector<std::string> info;
    std::vector<std::string> error;

    sxf::LogSinks MakeSinks()
    {
        return
        {
            [this](const std::string& msg) { debug.push_back(msg); },
            [this](const std::string& msg) { info .push_back(msg); },
            [this](const std::string& msg) { error.push_back(msg); },
        };
    }
};


/**
 * @brief Fixture providing a fresh source and destination directory per test.
 */
class TransferTestBase : public ::testing::Test
{
protected:
    void SetUp() override
    {
        char tmpl[] = "/tmp/seaxfer_test_XXXXXX";
        ASSERT_NE(::mkdtemp(tmpl), nullptr);
        testRoot_ = tmpl;
        srcRoot_ = testRoot_ / "src";
        dstRoot_ = testRoot_ / "dst";
        fs::create_directories(srcRoot_);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(testRoot_, ec);
    }

    std::unique_ptr<sxf::Transfer> MakeTransfer(const std::optional<sxf::TimeStamp>& earliest = std::nullopt)
    {
        return std::make_unique<sxf::Transfer>(sxf::createNativeFileSystem(), srcRoot_.string(),
                                               sxf::createNativeFileSystem(), dstRoot_.string(),
                                               earliest, log_.MakeSinks(), std::mt19937(42));
    }

    fs::path testRoot_;
    fs::path srcRoot_;
    fs::path dstRoot_;
    CapturedLog log_;
};


class MockFileSystem : public sxf::AbstractFileSystem
{
public:
    MOCK_METHOD(Zstring, getDisplayPath, (const Zstring& itemPath), (const, override));
    MOCK_METHOD(std::optional<ItemType>, getItemTypeIfExists, (const Zstring& itemPath), (override));
    MOCK_METHOD(std::optional<std::vector<FolderItem>>, getFolderContentIfExists, (const Zstring& folderPath), (override));
    MOCK_METHOD(void, createFolderPlain, (const Zstring& folderPath), (override));
    MOCK_METHOD(std::unique_ptr<InputStream>, getInputStream, (const Zstring& filePath), (override));
    MOCK_METHOD(std::unique_ptr<OutputStream>, getOutputStream, (const Zstring& filePath), (override));
    MOCK_METHOD(void, removeFilePlain, (const Zstring& filePath), (override));
    MOCK_METHOD(void, moveAndRenameItem, (const Zstring& pathFrom, const Zstring& pathTo), (override));
    MOCK_METHOD(void, setFileTimes, (const Zstring& filePath, const timespec& accessTime, const timespec& modTime), (override));
    MOCK_METHOD(void, close, (), (override));
};

#endif //TEST_HELPERS_H_5518203746691024
