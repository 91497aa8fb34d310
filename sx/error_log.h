// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef ERROR_LOG_H_6624018937455102
#define ERROR_LOG_H_6624018937455102

#include <vector>
#include "time.h"
#include "string_tools.h"


namespace sx
{
enum MessageType
{
    MSG_TYPE_DEBUG   = 0x1,
    MSG_TYPE_INFO    = 0x2,
    MSG_TYPE_WARNING = 0x4,
    MSG_TYPE_ERROR   = 0x8,
};

struct LogEntry
{
    time_t      time = 0;
    MessageType type = MSG_TYPE_ERROR;
    std::string message;
};

using ErrorLog = std::vector<LogEntry>;

inline void logMsg(ErrorLog& log, const std::string& msg, MessageType type) { log.push_back({std::time(nullptr), type, msg}); }

/*  "[2016-05-12 17:00:02]  Error:  Cannot copy file "a".
                                    <details>"
    continuation lines are indented below the message start; empty lines are dropped  */
std::string formatMessage(const LogEntry& entry);






//######################## implementation ##########################
inline
std::string formatMessage(const LogEntry& entry)
{
    const char* label = "Error";
    switch (entry.type)
    {
        case MSG_TYPE_DEBUG:   label = "Debug";   break;
        case MSG_TYPE_INFO:    label = "Info";    break;
        case MSG_TYPE_WARNING: label = "Warning"; break;
        case MSG_TYPE_ERROR:   break;
    }

    const std::string prefix = '[' + formatTime(formatIsoDateTimeTag, getLocalTime(entry.time)) + "]  " + label + ":  ";

    std::string output = prefix;
    bool firstLine = true;
    for (const std::string& line : splitCpy(trimCpy(entry.message), '\n', SplitOnEmpty::skip))
    {
        if (!firstLine)
            output += '\n' + std::string(prefix.size(), ' ');
        output += line;
        firstLine = false;
    }
    return output + '\n';
}
}

#endif //ERROR_LOG_H_6624018937455102
