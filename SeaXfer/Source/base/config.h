// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) seaxfer contributors                                        *
// *****************************************************************************

#ifndef CONFIG_H_6029374418856310
#define CONFIG_H_6029374418856310

#include <functional>
#include <optional>
#include <vector>
#include "file_name_time.h"
#include "../afs/sftp.h"


namespace sxf
{
const char seaxferVersion[] = "v0.3.0";

DEFINE_NEW_SYS_ERROR(SysErrorCommandLine)

struct XferConfig
{
    Zstring srcRoot;
    Zstring dstRoot;
    Zstring srcAddress; //empty: local source
    Zstring dstAddress; //empty: local destination
    int sshPort = DEFAULT_PORT_SFTP;
    Zstring sshUser;
    Zstring sshPassword;
    Zstring sshPrivateKeyFilePath;
    std::string sshHostKey; //empty: host key is not verified
    std::optional<TimeStamp> earliest; //no value: no cutoff

    bool quiet   = false;
    bool verbose = false;
    bool version = false;
    bool help    = false;
};

using EnvLookup = std::function<std::optional<Zstring>(const ZstringView name)>;

/*  options: "-srcRoot <path>" or "--srcRoot=<path>", case-insensitive
    environment variables: upper-case option names; override command line; boolean options are true for "1" only */
XferConfig parseConfig(const std::vector<Zstring>& commandArgs, const EnvLookup& getEnvVar); //throw SysErrorCommandLine

bool needsPassword(const XferConfig& cfg);

SftpLogin getSftpLogin(const XferConfig& cfg, const Zstring& address);

std::string getSyntaxHelp(const std::string& programName);
}

#endif //CONFIG_H_6029374418856310
