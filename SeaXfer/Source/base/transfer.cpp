// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) seaxfer contributors                                        *
// *****************************************************************************

#include "transfer.h"
#include <algorithm>
#include <set>
#include <sx/extra_log.h>
#include <sx/serialize.h>
#include <sx/zlib_wrap.h>

using namespace sx;
using namespace sxf;


const Zchar* const sxf::DAY_FOLDER_PATTERN = Zstr("[0-9][0-9][0-9][0-9]_[0-9][0-9][0-9]");

const Zchar* const sxf::LOG_FILE_PATTERN = Zstr("*.sfl");

const Zchar* const sxf::CAPTURE_FILE_PATTERNS[4] =
{
    Zstr("[0-9][0-9][0-9][0-9]-[0-9][0-9]-[0-9][0-9]T[0-9][0-9]-[0-9][0-9]-[0-9][0-9][\\-+][0-9][0-9]-[0-9][0-9]"),
    Zstr("[0-9][0-9][0-9][0-9]-[0-9][0-9]-[0-9][0-9]T[0-9][0-9]-[0-9][0-9]-[0-9][0-9][\\-+][0-9][0-9]-[0-9][0-9].gz"),
    //fractional seconds:
    Zstr("[0-9][0-9][0-9][0-9]-[0-9][0-9]-[0-9][0-9]T[0-9][0-9]-[0-9][0-9]-[0-9][0-9].[0-9]*[\\-+][0-9][0-9]-[0-9][0-9]"),
    Zstr("[0-9][0-9][0-9][0-9]-[0-9][0-9]-[0-9][0-9]T[0-9][0-9]-[0-9][0-9]-[0-9][0-9].[0-9]*[\\-+][0-9][0-9]-[0-9][0-9].gz"),
};


namespace
{
const Zchar GZIP_FILE_EXTENSION[] = Zstr(".gz");

//"2016-05-12T17-00-02+00-00.gz" => "2016-05-12T17-00-02+00-00": compression is not part of a capture file's identity
Zstring getUncompressedName(const Zstring& filePath)
{
    Zstring itemName = getItemName(filePath);
    if (endsWith(itemName, GZIP_FILE_EXTENSION))
        itemName.resize(itemName.size() - std::size(GZIP_FILE_EXTENSION) + 1);
    return itemName;
}
}


Transfer::Transfer(std::unique_ptr<AbstractFileSystem>&& srcFs, const Zstring& srcRoot,
                   std::unique_ptr<AbstractFileSystem>&& dstFs, const Zstring& dstRoot,
                   const std::optional<TimeStamp>& earliest,
                   const LogSinks& log,
                   std::mt19937&& rng) :
    srcFs_(std::move(srcFs)),
    srcRoot_(srcRoot),
    dstFs_(std::move(dstFs)),
    dstRoot_(dstRoot),
    earliest_(earliest),
    log_(log),
    rng_(std::move(rng))
{
    if (!srcFs_ || !dstFs_)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo(__LINE__) + "] Contract violation!");
}


void Transfer::copyLogFiles() //throw FileError, ErrorCreateDirectory, ErrorCopyFile
{
    const std::vector<Zstring> srcFiles = globAll(*srcFs_, srcRoot_, {LOG_FILE_PATTERN}); //throw FileError

    logInfo("Found " + numberTo(srcFiles.size()) + " source SFL files.");

    for (const Zstring& filePath : srcFiles)
        if (passesCutoff(filePath, true /*includeIfNoTime*/)) //log file names are not required to carry a time stamp
            copyFileWithContext(filePath, false /*compress*/); //throw ErrorCreateDirectory, ErrorCopyFile
}


void Transfer::copyCaptureFiles() //throw FileError, ErrorCreateDirectory, ErrorCopyFile
{
    const std::vector<Zstring> capturePatterns(std::begin(CAPTURE_FILE_PATTERNS), std::end(CAPTURE_FILE_PATTERNS));

    std::vector<Zstring> srcFiles = globAll(*srcFs_, srcRoot_, capturePatterns); //throw FileError

    logInfo("Found " + numberTo(srcFiles.size()) + " source EVT files.");

    if (srcFiles.size() < 2) //never copy a single file: it might still be written to
        return;

    //fixed-width time stamp names: lexicographical order is chronological, also across day folders
    std::sort(srcFiles.begin(), srcFiles.end());
    logDebug("Most recent EVT file is not copied: " + srcFs_->getDisplayPath(srcFiles.back()));
    srcFiles.pop_back();

    std::set<Zstring> dstNames;
    for (const Zstring& filePath : globAll(*dstFs_, dstRoot_, capturePatterns)) //throw FileError
        dstNames.insert(getUncompressedName(filePath));

    std::vector<Zstring> newFiles;
    for (const Zstring& filePath : srcFiles)
        if (!dstNames.contains(getUncompressedName(filePath)))
            newFiles.push_back(filePath);

    logInfo("Skipped " + numberTo(srcFiles.size() - newFiles.size()) + " duplicates and the most recent EVT file.");

    for (const Zstring& filePath : newFiles)
        if (passesCutoff(filePath, true /*includeIfNoTime*/)) //not expected: pattern constrains the name
            copyFileWithContext(filePath, true /*compress*/); //throw ErrorCreateDirectory, ErrorCopyFile
}


void Transfer::copyFile(const Zstring& srcFilePath, bool compress) //throw ErrorCreateDirectory, ErrorCopyFile
{
    const Zstring fileName = getItemName(srcFilePath);

    Zstring dayFolderName;
    if (const std::optional<Zstring> srcFolderPath = getParentFolderPath(srcFilePath))
        dayFolderName = getItemName(*srcFolderPath);

    const Zstring dstFolderPath = dayFolderName.empty() || dayFolderName == Zstr("/") ? dstRoot_ : appendPath(dstRoot_, dayFolderName);

    if (endsWith(fileName, GZIP_FILE_EXTENSION)) //never compress twice
        compress = false;

    //temp name embeds the final name, but matches neither log nor capture file pattern
    Zstring dstFilePath = appendPath(dstFolderPath, fileName);
    Zstring tmpFilePath = appendPath(dstFolderPath, generateTempName(fileName));
    if (compress)
    {
        dstFilePath += GZIP_FILE_EXTENSION;
        tmpFilePath += GZIP_FILE_EXTENSION;
    }

    try
    {
        dstFs_->createFolderIfMissingRecursion(dstFolderPath); //throw FileError
    }
    catch (const FileError& e) { throw ErrorCreateDirectory(e.toString()); }

    logDebug("Writing " + dstFs_->getDisplayPath(tmpFilePath));
    try
    {
        const std::unique_ptr<AFS::InputStream> streamIn = srcFs_->getInputStream(srcFilePath); //throw FileError
        const timespec modTime = streamIn->getModTime(); //throw FileError
        {
            const std::unique_ptr<AFS::OutputStream> streamOut = dstFs_->getOutputStream(tmpFilePath); //throw FileError, ErrorTargetExisting

            auto tryReadIn   = [&](void* buffer, size_t bytesToRead)        { return streamIn ->tryRead (buffer, bytesToRead ); }; //throw FileError
            auto tryWriteOut = [&](const void* buffer, size_t bytesToWrite) { return streamOut->tryWrite(buffer, bytesToWrite); }; //throw FileError

            if (compress)
            {
                InputStreamAsGzip gzipStream(tryReadIn, streamIn->getBlockSize(), GZIP_DEFAULT_LEVEL, {fileName, modTime.tv_sec}); //throw SysError

                unbufferedStreamCopy([&](void* buffer, size_t bytesToRead) { return gzipStream.read(buffer, bytesToRead); }, //throw SysError, FileError
                                     gzipStream.getBlockSize(),
                                     tryWriteOut, streamOut->getBlockSize()); //throw FileError
            }
            else
                unbufferedStreamCopy(tryReadIn,   streamIn ->getBlockSize(), //throw FileError
                                     tryWriteOut, streamOut->getBlockSize()); //

            streamOut->finalize(); //throw FileError
        }
        //output finalized => no more auto-deletion by OutputStream
        SX_ON_SCOPE_FAIL(try { dstFs_->removeFilePlain(tmpFilePath); /*throw FileError*/ }
                         catch (const FileError& e) { logExtraError(e.toString()); });

        dstFs_->setFileTimes(tmpFilePath, {.tv_sec = std::time(nullptr)}, modTime); //throw FileError

        dstFs_->moveAndRenameItem(tmpFilePath, dstFilePath); //throw FileError
    }
    catch (const FileError& e) { throw ErrorCopyFile(replaceCpy("Cannot copy file %x.", "%x", fmtPath(srcFs_->getDisplayPath(srcFilePath))), e.toString()); }
    catch (const SysError&  e) { throw ErrorCopyFile(replaceCpy("Cannot copy file %x.", "%x", fmtPath(srcFs_->getDisplayPath(srcFilePath))), e.toString()); }
}


void Transfer::close() //throw FileError
{
    std::optional<FileError> srcError;
    std::optional<FileError> dstError;

    try { srcFs_->close(); /*throw FileError*/ }
    catch (const FileError& e) { srcError = e; }

    try { dstFs_->close(); /*throw FileError*/ } //close destination, even if source failed
    catch (const FileError& e) { dstError = e; }

    if (srcError)
    {
        if (dstError)
            logError(dstError->toString());
        throw* srcError;
    }
    if (dstError)
        throw* dstError;
}


bool Transfer::passesCutoff(const Zstring& filePath, bool includeIfNoTime) //no throw
{
    if (!earliest_)
        return true;
    try
    {
        const TimeStamp fileTime = parseFileNameTime(filePath); //throw SysErrorTimeFormat
        if (fileTime >= *earliest_)
            return true;

        logDebug("Skipped " + srcFs_->getDisplayPath(filePath) + ": earlier than " + formatRfc3339Time(*earliest_));
        return false;
    }
    catch (const SysErrorTimeFormat& e)
    {
        logDebug("No time stamp in file name " + srcFs_->getDisplayPath(filePath) + ": " + e.toString());
        return includeIfNoTime;
    }
}


void Transfer::copyFileWithContext(const Zstring& srcFilePath, bool compress) //throw ErrorCreateDirectory, ErrorCopyFile
{
    const std::string errorMsg = replaceCpy("Error while copying %x.", "%x", fmtPath(srcFs_->getDisplayPath(srcFilePath)));
    try
    {
        copyFile(srcFilePath, compress); //throw ErrorCreateDirectory, ErrorCopyFile
    }
    catch (const ErrorCreateDirectory& e) { throw ErrorCreateDirectory(errorMsg, e.toString()); }
    catch (const ErrorCopyFile&        e) { throw ErrorCopyFile       (errorMsg, e.toString()); }

    logInfo("Copied " + srcFs_->getDisplayPath(srcFilePath));
}


std::vector<Zstring> Transfer::globAll(AbstractFileSystem& fs, const Zstring& rootPath, const std::vector<Zstring>& fileNamePatterns) //throw FileError
{
    std::vector<Zstring> output;
    for (const Zstring& fileNamePattern : fileNamePatterns)
    {
        const Zstring pattern = appendPath(rootPath, Zstring(DAY_FOLDER_PATTERN) + FILE_NAME_SEPARATOR + fileNamePattern);
        logDebug("Glob pattern: " + fs.getDisplayPath(pattern));

        const std::vector<Zstring> matches = fs.glob(pattern); //throw FileError
        output.insert(output.end(), matches.begin(), matches.end());
    }
    return output;
}


Zstring Transfer::generateTempName(const Zstring& fileName)
{
    const char charset[] = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    std::uniform_int_distribution<size_t> distribution(0, std::size(charset) - 2); //exclude '\0'

    Zstring token;
    for (int i = 0; i < 7; ++i)
        token += charset[distribution(rng_)];

    return Zstr("._seaxfer_") + token + Zstr('.') + fileName + Zstr('_');
}
