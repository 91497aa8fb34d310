// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_ERROR_H_2209488160385712
#define FILE_ERROR_H_2209488160385712

#include "sys_error.h"


namespace sx
{
//what went wrong with which item: message for the end user, optionally followed by SysError details
class FileError
{
public:
    explicit FileError(const std::string& msg) : msg_(msg) {}
    FileError(const std::string& msg, const std::string& details) : msg_(msg + "\n\n" + details) {}
    virtual ~FileError() {}

    const std::string& toString() const { return msg_; }

private:
    std::string msg_;
};

#define DEFINE_NEW_FILE_ERROR(X) struct X : public sx::FileError { using FileError::FileError; };

DEFINE_NEW_FILE_ERROR(ErrorTargetExisting)


inline std::string fmtPath(std::string_view displayPath) { return '"' + std::string(displayPath) + '"'; }
}

#endif //FILE_ERROR_H_2209488160385712
