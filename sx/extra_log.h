// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef EXTRA_LOG_H_4471902385561034
#define EXTRA_LOG_H_4471902385561034

#include <cassert>
#include <utility>
#include "error_log.h"


namespace sx
{
//errors that cannot be thrown: cleanup in destructors, failures while another exception unwinds
//main() prints them before exiting
void logExtraError(const std::string& msg); //noexcept

ErrorLog fetchExtraLog();






//######################## implementation ##########################
namespace impl
{
inline ErrorLog extraLog; //single-threaded
}

inline
void logExtraError(const std::string& msg) //noexcept
{
    try
    {
        logMsg(impl::extraLog, msg, MSG_TYPE_ERROR); //throw std::bad_alloc
    }
    catch (const std::bad_alloc&) { assert(false); } //nowhere left to report to
}


inline ErrorLog fetchExtraLog() { return std::exchange(impl::extraLog, {}); }
}

#endif //EXTRA_LOG_H_4471902385561034
