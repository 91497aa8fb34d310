// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef LIBSSH2_WRAP_H_5507129384416620
#define LIBSSH2_WRAP_H_5507129384416620

#include <sx/sys_error.h>
#include <libssh2_sftp.h>

/*  std::string overloads for the libssh2 calls used by the SFTP file system
    libssh2 declares most of these as macros that pass strlen() as unsigned int => replace them  */

namespace sx::impl
{
inline unsigned int sshLen(const std::string& str) { return static_cast<unsigned int>(str.size()); }
}


#undef libssh2_userauth_password
inline int libssh2_userauth_password(LIBSSH2_SESSION* session, const std::string& username, const std::string& password)
{
    using sx::impl::sshLen;
    return ::libssh2_userauth_password_ex(session, username.c_str(), sshLen(username), password.c_str(), sshLen(password), nullptr /*no password change*/);
}

#undef libssh2_userauth_keyboard_interactive
inline int libssh2_userauth_keyboard_interactive(LIBSSH2_SESSION* session, const std::string& username, LIBSSH2_USERAUTH_KBDINT_RESPONSE_FUNC((*responseCallback)))
{
    return ::libssh2_userauth_keyboard_interactive_ex(session, username.c_str(), sx::impl::sshLen(username), responseCallback);
}

inline char* libssh2_userauth_list(LIBSSH2_SESSION* session, const std::string& username)
{
    return ::libssh2_userauth_list(session, username.c_str(), sx::impl::sshLen(username));
}

//public key is derived from the private key
inline int libssh2_userauth_publickey_frommemory(LIBSSH2_SESSION* session, const std::string& username, const std::string& privateKey, const std::string& passphrase)
{
    return ::libssh2_userauth_publickey_frommemory(session, username.c_str(), username.size(), nullptr, 0, privateKey.c_str(), privateKey.size(), passphrase.c_str());
}


#undef libssh2_sftp_open
inline LIBSSH2_SFTP_HANDLE* libssh2_sftp_open(LIBSSH2_SFTP* sftp, const std::string& filePath, unsigned long flags, long mode)
{
    return ::libssh2_sftp_open_ex(sftp, filePath.c_str(), sx::impl::sshLen(filePath), flags, mode, LIBSSH2_SFTP_OPENFILE);
}

#undef libssh2_sftp_opendir
inline LIBSSH2_SFTP_HANDLE* libssh2_sftp_opendir(LIBSSH2_SFTP* sftp, const std::string& folderPath)
{
    return ::libssh2_sftp_open_ex(sftp, folderPath.c_str(), sx::impl::sshLen(folderPath), 0, 0, LIBSSH2_SFTP_OPENDIR);
}

#undef libssh2_sftp_stat
inline int libssh2_sftp_stat(LIBSSH2_SFTP* sftp, const std::string& itemPath, LIBSSH2_SFTP_ATTRIBUTES* attribs)
{
    return ::libssh2_sftp_stat_ex(sftp, itemPath.c_str(), sx::impl::sshLen(itemPath), LIBSSH2_SFTP_STAT, attribs);
}

#undef libssh2_sftp_setstat
inline int libssh2_sftp_setstat(LIBSSH2_SFTP* sftp, const std::string& itemPath, LIBSSH2_SFTP_ATTRIBUTES* attribs)
{
    return ::libssh2_sftp_stat_ex(sftp, itemPath.c_str(), sx::impl::sshLen(itemPath), LIBSSH2_SFTP_SETSTAT, attribs);
}

#undef libssh2_sftp_mkdir
inline int libssh2_sftp_mkdir(LIBSSH2_SFTP* sftp, const std::string& folderPath, long mode)
{
    return ::libssh2_sftp_mkdir_ex(sftp, folderPath.c_str(), sx::impl::sshLen(folderPath), mode);
}

#undef libssh2_sftp_unlink
inline int libssh2_sftp_unlink(LIBSSH2_SFTP* sftp, const std::string& filePath)
{
    return ::libssh2_sftp_unlink_ex(sftp, filePath.c_str(), sx::impl::sshLen(filePath));
}

#undef libssh2_sftp_rename
inline int libssh2_sftp_rename(LIBSSH2_SFTP* sftp, const std::string& pathFrom, const std::string& pathTo, long flags)
{
    using sx::impl::sshLen;
    return ::libssh2_sftp_rename_ex(sftp, pathFrom.c_str(), sshLen(pathFrom), pathTo.c_str(), sshLen(pathTo), flags);
}


namespace sx
{
//session-level status: negative return codes of libssh2 calls
inline
std::string formatSshStatusCode(int sc)
{
    static const NamedCode sshStatusNames[] =
    {
        SX_NAMED_CODE(LIBSSH2_ERROR_NONE),
        SX_NAMED_CODE(LIBSSH2_ERROR_SOCKET_NONE),
        SX_NAMED_CODE(LIBSSH2_ERROR_BANNER_RECV),
        SX_NAMED_CODE(LIBSSH2_ERROR_BANNER_SEND),
        SX_NAMED_CODE(LIBSSH2_ERROR_KEX_FAILURE),
        SX_NAMED_CODE(LIBSSH2_ERROR_ALLOC),
        SX_NAMED_CODE(LIBSSH2_ERROR_SOCKET_SEND),
        SX_NAMED_CODE(LIBSSH2_ERROR_KEY_EXCHANGE_FAILURE),
        SX_NAMED_CODE(LIBSSH2_ERROR_TIMEOUT),
        SX_NAMED_CODE(LIBSSH2_ERROR_HOSTKEY_INIT),
        SX_NAMED_CODE(LIBSSH2_ERROR_HOSTKEY_SIGN),
        SX_NAMED_CODE(LIBSSH2_ERROR_DECRYPT),
        SX_NAMED_CODE(LIBSSH2_ERROR_SOCKET_DISCONNECT),
        SX_NAMED_CODE(LIBSSH2_ERROR_PROTO),
        SX_NAMED_CODE(LIBSSH2_ERROR_PASSWORD_EXPIRED),
        SX_NAMED_CODE(LIBSSH2_ERROR_FILE),
        SX_NAMED_CODE(LIBSSH2_ERROR_METHOD_NONE),
        SX_NAMED_CODE(LIBSSH2_ERROR_AUTHENTICATION_FAILED),
        SX_NAMED_CODE(LIBSSH2_ERROR_PUBLICKEY_UNVERIFIED),
        SX_NAMED_CODE(LIBSSH2_ERROR_CHANNEL_FAILURE),
        SX_NAMED_CODE(LIBSSH2_ERROR_CHANNEL_CLOSED),
        SX_NAMED_CODE(LIBSSH2_ERROR_SOCKET_TIMEOUT),
        SX_NAMED_CODE(LIBSSH2_ERROR_SFTP_PROTOCOL),
        SX_NAMED_CODE(LIBSSH2_ERROR_METHOD_NOT_SUPPORTED),
        SX_NAMED_CODE(LIBSSH2_ERROR_INVAL),
        SX_NAMED_CODE(LIBSSH2_ERROR_EAGAIN),
        SX_NAMED_CODE(LIBSSH2_ERROR_BAD_USE),
        SX_NAMED_CODE(LIBSSH2_ERROR_SOCKET_RECV),
        SX_NAMED_CODE(LIBSSH2_ERROR_ENCRYPT),
        SX_NAMED_CODE(LIBSSH2_ERROR_BAD_SOCKET),
        SX_NAMED_CODE(LIBSSH2_ERROR_KEYFILE_AUTH_FAILED),
    };
    return getCodeName(sc, sshStatusNames);
}


//status of the last SFTP request: libssh2_sftp_last_error()
inline
std::string formatSftpStatusCode(unsigned long sc)
{
    static const NamedCode sftpStatusNames[] = //SFTP v3 plus the v4+ codes servers send anyway
    {
        SX_NAMED_CODE(LIBSSH2_FX_OK),
        SX_NAMED_CODE(LIBSSH2_FX_EOF),
        SX_NAMED_CODE(LIBSSH2_FX_NO_SUCH_FILE),
        SX_NAMED_CODE(LIBSSH2_FX_PERMISSION_DENIED),
        SX_NAMED_CODE(LIBSSH2_FX_FAILURE),
        SX_NAMED_CODE(LIBSSH2_FX_BAD_MESSAGE),
        SX_NAMED_CODE(LIBSSH2_FX_NO_CONNECTION),
        SX_NAMED_CODE(LIBSSH2_FX_CONNECTION_LOST),
        SX_NAMED_CODE(LIBSSH2_FX_OP_UNSUPPORTED),
        SX_NAMED_CODE(LIBSSH2_FX_INVALID_HANDLE),
        SX_NAMED_CODE(LIBSSH2_FX_NO_SUCH_PATH),
        SX_NAMED_CODE(LIBSSH2_FX_FILE_ALREADY_EXISTS),
        SX_NAMED_CODE(LIBSSH2_FX_WRITE_PROTECT),
        SX_NAMED_CODE(LIBSSH2_FX_NO_MEDIA),
        SX_NAMED_CODE(LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM),
        SX_NAMED_CODE(LIBSSH2_FX_QUOTA_EXCEEDED),
        SX_NAMED_CODE(LIBSSH2_FX_DIR_NOT_EMPTY),
        SX_NAMED_CODE(LIBSSH2_FX_NOT_A_DIRECTORY),
        SX_NAMED_CODE(LIBSSH2_FX_INVALID_FILENAME),
        SX_NAMED_CODE(LIBSSH2_FX_LINK_LOOP),
    };
    return getCodeName(static_cast<long>(sc), sftpStatusNames);
}
}

#else
#error libssh2_wrap.h included twice: include it in .cpp files only
#endif //LIBSSH2_WRAP_H_5507129384416620
