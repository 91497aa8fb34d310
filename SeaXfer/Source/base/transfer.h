// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) seaxfer contributors                                        *
// *****************************************************************************

#ifndef TRANSFER_H_2270416693815048
#define TRANSFER_H_2270416693815048

#include <functional>
#include <random>
#include "file_name_time.h"
#include "../afs/abstract.h"


namespace sxf
{
DEFINE_NEW_FILE_ERROR(ErrorCreateDirectory)
DEFINE_NEW_FILE_ERROR(ErrorCopyFile)

//pure observers: empty sinks discard
struct LogSinks
{
    std::function<void(const std::string& msg)> debug;
    std::function<void(const std::string& msg)> info;
    std::function<void(const std::string& msg)> error;
};

//shell patterns of the instrument's file layout: <root>/<day folder>/<file name>
extern const Zchar* const DAY_FOLDER_PATTERN;         //"2016_133"
extern const Zchar* const LOG_FILE_PATTERN;           //"2016-05-12T17-00-02+00-00.sfl", "a.sfl"
extern const Zchar* const CAPTURE_FILE_PATTERNS[4];   //"2016-05-12T17-00-02+00-00", "2016-05-12T17-00-02.3-07-00.gz"

/*  one-shot transfer of instrument files from source to destination:
    - log files (*.sfl) are always copied
    - capture files are copied incrementally and gzip-compressed; the most recent one may still be written to and is never copied
    - optional cutoff: files with an earlier file name time stamp are not copied                               */
class Transfer
{
public:
    Transfer(std::unique_ptr<AbstractFileSystem>&& srcFs, const Zstring& srcRoot,
             std::unique_ptr<AbstractFileSystem>&& dstFs, const Zstring& dstRoot,
             const std::optional<TimeStamp>& earliest, //no value: no cutoff
             const LogSinks& log,
             std::mt19937&& rng); //random source for temporary file names

    void copyLogFiles();     //throw FileError, ErrorCreateDirectory, ErrorCopyFile
    void copyCaptureFiles(); //throw FileError, ErrorCreateDirectory, ErrorCopyFile

    //copy <srcRoot>/<day folder>/<name> to <dstRoot>/<day folder>/<name>[.gz]
    //target becomes visible via final rename only; source modification time is preserved
    void copyFile(const Zstring& srcFilePath, bool compress); //throw ErrorCreateDirectory, ErrorCopyFile

    //close both file systems: source error takes precedence
    void close(); //throw FileError

private:
    Transfer           (const Transfer&) = delete;
    Transfer& operator=(const Transfer&) = delete;

    bool passesCutoff(const Zstring& filePath, bool includeIfNoTime); //no throw
    void copyFileWithContext(const Zstring& srcFilePath, bool compress); //throw ErrorCreateDirectory, ErrorCopyFile
    std::vector<Zstring> globAll(AbstractFileSystem& fs, const Zstring& rootPath, const std::vector<Zstring>& fileNamePatterns); //throw FileError
    Zstring generateTempName(const Zstring& fileName);

    void logDebug(const std::string& msg) const { if (log_.debug) log_.debug(msg); }
    void logInfo (const std::string& msg) const { if (log_.info ) log_.info (msg); }
    void logError(const std::string& msg) const { if (log_.error) log_.error(msg); }

    const std::unique_ptr<AbstractFileSystem> srcFs_;
    const Zstring srcRoot_;
    const std::unique_ptr<AbstractFileSystem> dstFs_;
    const Zstring dstRoot_;
    const std::optional<TimeStamp> earliest_;
    const LogSinks log_;
    std::mt19937 rng_;
};
}

#endif //TRANSFER_H_2270416693815048
