// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SOCKET_H_1184205379926613
#define SOCKET_H_1184205379926613

#include <optional>
#include "sys_error.h"
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>


namespace sx
{
//TCP connection in blocking mode; only connect() is bounded by a time-out
class Socket
{
public:
    Socket(const Zstring& server, const Zstring& serviceName, int timeoutSec); //throw SysError
    ~Socket() { ::close(socket_); }

    int get() const { return socket_; }

private:
    Socket           (const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    static int connectTimed(const addrinfo& ai, int timeoutSec); //throw SysError

    int socket_ = -1;
};






//######################## implementation ########################
inline
int Socket::connectTimed(const addrinfo& ai, int timeoutSec) //throw SysError
{
    //non-blocking during connect() only: blocking connect() could hang for minutes
    const int fd = ::socket(ai.ai_family, ai.ai_socktype | SOCK_CLOEXEC | SOCK_NONBLOCK, ai.ai_protocol);
    if (fd == -1)
        THROW_LAST_SYS_ERROR("socket");
    SX_ON_SCOPE_FAIL(::close(fd));

    if (::connect(fd, ai.ai_addr, ai.ai_addrlen) != 0)
    {
        if (errno != EINPROGRESS)
            THROW_LAST_SYS_ERROR("connect");

        pollfd pfd{.fd = fd, .events = POLLOUT};
        const int rv = ::poll(&pfd, 1, timeoutSec * 1000);
        if (rv < 0)
            THROW_LAST_SYS_ERROR("poll");
        if (rv == 0)
            throw SysError(formatSystemError("connect, " + numberTo(timeoutSec) + " sec", ETIMEDOUT));

        int connectError = 0;
        socklen_t optLen = sizeof(connectError);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &connectError, &optLen) != 0)
            THROW_LAST_SYS_ERROR("getsockopt(SO_ERROR)");
        if (connectError != 0)
            throw SysError(formatSystemError("connect", connectError));
    }

    const int flags = ::fcntl(fd, F_GETFL);
    if (flags == -1 || ::fcntl(fd, F_SETFL, flags & ~O_NONBLOCK) != 0)
        THROW_LAST_SYS_ERROR("fcntl(O_NONBLOCK)");

    const int noDelay = 1; //SSH sends small packets and waits for replies
    if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &noDelay, sizeof(noDelay)) != 0)
        THROW_LAST_SYS_ERROR("setsockopt(TCP_NODELAY)");
    return fd;
}


inline
Socket::Socket(const Zstring& server, const Zstring& serviceName, int timeoutSec) //throw SysError
{
    if (trimCpy(server).empty())
        throw SysError("Server name must not be empty.");

    addrinfo hints = {};
    hints.ai_flags    = AI_ADDRCONFIG; //no IPv6 addresses without an IPv6 interface
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* addresses = nullptr;
    if (const int rc = ::getaddrinfo(server.c_str(), serviceName.c_str(), &hints, &addresses);
        rc != 0)
    {
        if (rc == EAI_SYSTEM)
            THROW_LAST_SYS_ERROR("getaddrinfo");
        throw SysError(formatSystemError("getaddrinfo", "EAI " + numberTo(rc), ::gai_strerror(rc)));
    }
    SX_ON_SCOPE_EXIT(::freeaddrinfo(addresses));

    //e.g. both an IPv6 and an IPv4 address: first one that connects wins, first error is reported
    std::optional<SysError> firstError;
    for (const addrinfo* ai = addresses; ai; ai = ai->ai_next)
        try
        {
            socket_ = connectTimed(*ai, timeoutSec); //throw SysError
            return;
        }
        catch (const SysError& e)
        {
            if (!firstError)
                firstError = e;
        }

    throw firstError ? *firstError : SysError(formatSystemError("getaddrinfo", "", "No address found."));
}
}

#endif //SOCKET_H_1184205379926613
