// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) seaxfer contributors                                        *
// *****************************************************************************

#include "config.h"
#include <algorithm>

using namespace sx;
using namespace sxf;


namespace
{
enum class OptionType
{
    text,
    boolean,
};

struct OptionInfo
{
    const char* name;
    const char* envName; //nullptr: command line only
    OptionType type;
    const char* description;
};

const OptionInfo optionInfos[] =
{
    {"srcRoot",      "SRCROOT",      OptionType::text,    "Root path of source"},
    {"dstRoot",      "DSTROOT",      OptionType::text,    "Root path of destination"},
    {"srcAddress",   "SRCADDRESS",   OptionType::text,    "Address of SFTP source"},
    {"dstAddress",   "DSTADDRESS",   OptionType::text,    "Address of SFTP destination"},
    {"sshPort",      "SSHPORT",      OptionType::text,    "SSH port (default 22)"},
    {"sshUser",      "SSHUSER",      OptionType::text,    "SSH user name"},
    {"sshPublicKey", "SSHPUBLICKEY", OptionType::text,    "SSH private key file, overrides SSHPASSWORD"},
    {"sshHostKey",   "SSHHOSTKEY",   OptionType::text,    "Expected SSH host key fingerprint \"SHA256:...\"; host key is not verified if empty"},
    {"start",        "START",        OptionType::text,    "Earliest file timestamp to transfer as an RFC3339 string"},
    {"quiet",        "QUIET",        OptionType::boolean, "Suppress informational logging"},
    {"verbose",      "VERBOSE",      OptionType::boolean, "Enable debugging logs"},
    {"version",      "VERSION",      OptionType::boolean, "Display version and exit"},
    {"help",         nullptr,        OptionType::boolean, "Display this help and exit"},
};


void applyOption(XferConfig& cfg, const std::string& name, const Zstring& value) //throw SysErrorCommandLine
{
    auto parseBool = [&]
    {
        if (value == Zstr("1") || equalAsciiNoCase(value, "true"))
            return true;
        if (value == Zstr("0") || equalAsciiNoCase(value, "false"))
            return false;
        throw SysErrorCommandLine(replaceCpy(replaceCpy("Invalid boolean value %x for option %y.", "%x", fmtPath(value)), "%y", '-' + name));
    };

    if (name == "srcRoot")
        cfg.srcRoot = value;
    else if (name == "dstRoot")
        cfg.dstRoot = value;
    else if (name == "srcAddress")
        cfg.srcAddress = value;
    else if (name == "dstAddress")
        cfg.dstAddress = value;
    else if (name == "sshPort")
    {
        if (!stringTo(trimCpy(value), cfg.sshPort) || cfg.sshPort <= 0 || cfg.sshPort > 65535)
            throw SysErrorCommandLine(replaceCpy("Invalid port number %x.", "%x", fmtPath(value)));
    }
    else if (name == "sshUser")
        cfg.sshUser = value;
    else if (name == "sshPublicKey")
        cfg.sshPrivateKeyFilePath = value;
    else if (name == "sshHostKey")
        cfg.sshHostKey = value;
    else if (name == "start")
    {
        if (value.empty())
            cfg.earliest = std::nullopt;
        else
            try
            {
                cfg.earliest = parseRfc3339Time(value); //throw SysErrorTimeFormat
            }
            catch (const SysErrorTimeFormat& e) { throw SysErrorCommandLine("Could not parse -start RFC3339 timestamp. " + e.toString()); }
    }
    else if (name == "quiet")
        cfg.quiet = parseBool(); //throw SysErrorCommandLine
    else if (name == "verbose")
        cfg.verbose = parseBool(); //
    else if (name == "version")
        cfg.version = parseBool(); //
    else if (name == "help")
        cfg.help = parseBool(); //
    else
        assert(false);
}
}


XferConfig sxf::parseConfig(const std::vector<Zstring>& commandArgs, const EnvLookup& getEnvVar) //throw SysErrorCommandLine
{
    XferConfig cfg;

    auto findOption = [](std::string_view name) -> const OptionInfo*
    {
        auto it = std::find_if(std::begin(optionInfos), std::end(optionInfos), [&](const OptionInfo& oi) { return equalAsciiNoCase(oi.name, name); });
        if (it == std::end(optionInfos))
        {
            if (name == "h" || name == "?")
                return &optionInfos[std::size(optionInfos) - 1]; //help
            return nullptr;
        }
        return &*it;
    };

    for (auto it = commandArgs.begin(); it != commandArgs.end(); ++it)
    {
        const Zstring& arg = *it;

        //"-name", "--name", "-name=value"
        auto itName = std::find_if(arg.begin(), arg.end(), [](Zchar c) { return c != Zstr('-'); });
        if (itName == arg.begin() || itName - arg.begin() > 2)
            throw SysErrorCommandLine(replaceCpy("Unexpected argument %x.", "%x", fmtPath(arg)));

        const Zstring nameValue(itName, arg.end());
        const Zstring name = beforeFirst(nameValue, Zstr("="), IfNotFoundReturn::all);

        const OptionInfo* oi = findOption(name);
        if (!oi)
            throw SysErrorCommandLine(replaceCpy("Unknown option %x.", "%x", fmtPath(arg)));

        if (contains(nameValue, Zstr("=")))
            applyOption(cfg, oi->name, afterFirst(nameValue, Zstr("="), IfNotFoundReturn::none)); //throw SysErrorCommandLine
        else if (oi->type == OptionType::boolean)
            applyOption(cfg, oi->name, Zstr("1")); //throw SysErrorCommandLine
        else
        {
            if (++it == commandArgs.end())
                throw SysErrorCommandLine(replaceCpy("A value is expected after %x.", "%x", fmtPath(arg)));
            applyOption(cfg, oi->name, *it); //throw SysErrorCommandLine
        }
    }

    //environment overrides command line
    if (getEnvVar)
    {
        for (const OptionInfo& oi : optionInfos)
            if (oi.envName)
                if (const std::optional<Zstring> value = getEnvVar(oi.envName))
                {
                    if (oi.type == OptionType::boolean)
                    {
                        if (*value == Zstr("1"))
                            applyOption(cfg, oi.name, Zstr("1")); //throw SysErrorCommandLine
                    }
                    else
                        applyOption(cfg, oi.name, *value); //throw SysErrorCommandLine
                }

        if (const std::optional<Zstring> password = getEnvVar(Zstr("SSHPASSWORD")))
            cfg.sshPassword = *password;
    }
    return cfg;
}


bool sxf::needsPassword(const XferConfig& cfg)
{
    return (!cfg.srcAddress.empty() || !cfg.dstAddress.empty()) &&
           cfg.sshPassword.empty() && cfg.sshPrivateKeyFilePath.empty();
}


SftpLogin sxf::getSftpLogin(const XferConfig& cfg, const Zstring& address)
{
    SftpLogin login;
    login.server             = address;
    login.port               = cfg.sshPort;
    login.username           = cfg.sshUser;
    login.password           = cfg.sshPassword;
    login.privateKeyFilePath = cfg.sshPrivateKeyFilePath;
    login.hostKeyFingerprint = cfg.sshHostKey;
    return login;
}


std::string sxf::getSyntaxHelp(const std::string& programName)
{
    std::string help =
        "Transfer SeaFlow files between source and destination, which can be SFTP or local.\n"
        "Will not transfer gzipped files, but will gzip before writing to destination.\n"
        "If using SFTP, the SSH password should be set in ENV as SSHPASSWORD.\n"
        "Otherwise the password will be gathered from a prompt.\n"
        "All other options can be set in ENV as well, overriding CLI options.\n"
        "ENV variable names should be uppercased CLI option names.\n"
        "Boolean option ENV vars should be set to 1 for true.\n"
        "\n"
        "Usage of " + programName + ":\n";

    for (const OptionInfo& oi : optionInfos)
    {
        help += std::string("  -") + oi.name;
        if (oi.type == OptionType::text)
            help += " <value>";
        help += std::string("\n        ") + oi.description + '\n';
    }
    return help;
}
