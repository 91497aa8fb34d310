// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SERIALIZE_H_3840127759130482
#define SERIALIZE_H_3840127759130482

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <stdexcept>
#include <vector>
#include "sys_error.h"


namespace sx
{
/*  unbuffered stream functions:
        size_t tryRead (void* buffer,       size_t bytesToRead ); //throw X; may return short, only 0 means EOF
        size_t tryWrite(const void* buffer, size_t bytesToWrite); //throw X; may return short                   */

template <class BinContainer, class Function>
BinContainer unbufferedLoad(Function tryRead, size_t blockSize); //throw X

//writes at most blockSizeOut bytes per call, and full blocks unless the output is short (libssh2 splits packets of other sizes)
template <class Function1, class Function2>
void unbufferedStreamCopy(Function1 tryRead, size_t blockSizeIn, Function2 tryWrite, size_t blockSizeOut); //throw X






//-----------------------implementation-------------------------------
template <class BinContainer, class Function> inline
BinContainer unbufferedLoad(Function tryRead, size_t blockSize) //throw X
{
    static_assert(sizeof(typename BinContainer::value_type) == 1);
    if (blockSize == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo(__LINE__) + "] Contract violation!");

    BinContainer output;
    size_t bytesTotal = 0;
    for (;;)
    {
        output.resize(bytesTotal + blockSize);
        const size_t bytesRead = tryRead(&output[bytesTotal], blockSize); //throw X
        bytesTotal += bytesRead;
        if (bytesRead == 0)
        {
            output.resize(bytesTotal);
            return output;
        }
    }
}


template <class Function1, class Function2> inline
void unbufferedStreamCopy(Function1 tryRead, size_t blockSizeIn, Function2 tryWrite, size_t blockSizeOut) //throw X
{
    if (blockSizeIn == 0 || blockSizeOut == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo(__LINE__) + "] Contract violation!");

    //invariant: less than blockSizeOut bytes pending before each read
    std::vector<std::byte> buf(blockSizeOut - 1 + blockSizeIn);
    size_t bytesPending = 0;

    auto writeAll = [&](size_t bytesToWrite) //throw X
    {
        size_t bytesDone = 0;
        while (bytesDone < bytesToWrite)
            bytesDone += tryWrite(buf.data() + bytesDone, std::min(bytesToWrite - bytesDone, blockSizeOut)); //throw X
        bytesPending -= bytesToWrite;
        std::memmove(buf.data(), buf.data() + bytesToWrite, bytesPending);
    };

    for (;;)
    {
        const size_t bytesRead = tryRead(buf.data() + bytesPending, blockSizeIn); //throw X
        if (bytesRead == 0)
        {
            writeAll(bytesPending); //throw X
            return;
        }
        bytesPending += bytesRead;

        if (const size_t fullBlocks = bytesPending / blockSizeOut;
            fullBlocks > 0)
            writeAll(fullBlocks * blockSizeOut); //throw X
    }
}
}

#endif //SERIALIZE_H_3840127759130482
