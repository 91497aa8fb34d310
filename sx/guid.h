// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef GUID_H_4410927365581207
#define GUID_H_4410927365581207

#include <random>
#include <stdexcept>
#include <unistd.h> //getentropy
#include "sys_error.h"


namespace sx
{
inline
std::string generateGUID() //creates a 16-byte GUID
{
    std::string guid(16, '\0');

    if (::getentropy(guid.data(), guid.size()) != 0) //"The maximum permitted value for the length argument is 256"
        throw std::runtime_error(std::string(__FILE__) + '[' + numberTo(__LINE__) + "] Failed to generate GUID." + "\n\n" +
                                 formatSystemError("getentropy", errno));
    return guid;
}


//pseudo-random generator seeded once per process from the kernel entropy pool
inline
std::mt19937 createRandomEngine()
{
    const std::string guid = generateGUID(); //throw std::runtime_error
    std::seed_seq seed(guid.begin(), guid.end());
    return std::mt19937(seed);
}
}

#endif //GUID_H_4410927365581207
