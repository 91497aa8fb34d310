// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) seaxfer contributors                                        *
// *****************************************************************************

#ifndef RETURN_CODES_H_4410927736501832
#define RETURN_CODES_H_4410927736501832


namespace sxf
{
enum class XferExitCode //as returned on process exit
{
    success = 0,
    error,
    commandLine,
};


inline
void raiseExitCode(XferExitCode& rc, XferExitCode rcProposed)
{
    if (rc < rcProposed)
        rc = rcProposed;
}
}

#endif //RETURN_CODES_H_4410927736501832
