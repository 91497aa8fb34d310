// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SFTP_H_5392687134401296
#define SFTP_H_5392687134401296

#include "abstract.h"


namespace sxf
{
const int DEFAULT_PORT_SFTP = 22;

struct SftpLogin
{
    Zstring server;
    int port = DEFAULT_PORT_SFTP;
    Zstring username;
    Zstring password;           //password authentication, or passphrase if a private key file is used
    Zstring privateKeyFilePath; //optional: authenticate via key file instead of password
    std::string hostKeyFingerprint; //optional: "SHA256:<base64>" as shown by "ssh-keygen -l"; empty: host key is NOT verified!
    int timeoutSec = 10;
};

//SFTP session is established immediately: paths are absolute or relative to the login folder on the server
std::unique_ptr<AbstractFileSystem> createSftpFileSystem(const SftpLogin& login); //throw ErrorConnection

//rename failed with an SFTP status that servers use for "target exists" => replacing the target may help
//any other status (permission denied, no such file, ...) must leave an existing target alone
bool isSftpRenameConflict(unsigned long sftpStatusCode);
}

#endif //SFTP_H_5392687134401296
