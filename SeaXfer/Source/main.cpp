// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) seaxfer contributors                                        *
// *****************************************************************************

#include <iostream>
#include <termios.h>
#include <unistd.h>
#include <sx/extra_log.h>
#include <sx/file_path.h>
#include <sx/guid.h>
#include <sx/scope_guard.h>
#include "afs/native.h"
#include "afs/sftp.h"
#include "base/config.h"
#include "base/transfer.h"
#include "return_codes.h"

using namespace sx;
using namespace sxf;


namespace
{
void printLogMsg(const std::string& msg, MessageType type)
{
    std::cerr << formatMessage({std::time(nullptr), type, msg}) << std::flush;
}


Zstring readPasswordFromTerminal(const std::string& prompt) //throw SysError
{
    std::cerr << prompt << std::flush;

    termios oldAttr = {};
    const bool isTerminal = ::tcgetattr(STDIN_FILENO, &oldAttr) == 0;
    if (isTerminal)
    {
        termios newAttr = oldAttr;
        newAttr.c_lflag &= ~ECHO;
        if (::tcsetattr(STDIN_FILENO, TCSANOW, &newAttr) != 0)
            THROW_LAST_SYS_ERROR("tcsetattr");
    }
    SX_ON_SCOPE_EXIT(if (isTerminal) { ::tcsetattr(STDIN_FILENO, TCSANOW, &oldAttr); std::cerr << '\n'; });

    std::string password;
    if (!std::getline(std::cin, password))
        throw SysError("Failed to read password from standard input.");
    return password;
}


std::unique_ptr<AbstractFileSystem> connect(const XferConfig& cfg, const Zstring& address, const LogSinks& log) //throw ErrorConnection
{
    if (address.empty())
        return createNativeFileSystem();

    const SftpLogin login = getSftpLogin(cfg, address);
    std::unique_ptr<AbstractFileSystem> fs = createSftpFileSystem(login); //throw ErrorConnection

    if (log.info)
        log.info("Connected to " + login.server + ':' + numberTo(login.port) + " as " + login.username);
    if (login.hostKeyFingerprint.empty() && !cfg.quiet)
        printLogMsg("Host key of " + login.server + " was not verified. Set -sshHostKey to check it.", MSG_TYPE_WARNING);
    return fs;
}


XferExitCode runTransfer(XferConfig cfg)
{
    const LogSinks log
    {
        cfg.verbose && !cfg.quiet ? [](const std::string& msg) { printLogMsg(msg, MSG_TYPE_DEBUG); } : std::function<void(const std::string&)>(),
        !cfg.quiet                ? [](const std::string& msg) { printLogMsg(msg, MSG_TYPE_INFO ); } : std::function<void(const std::string&)>(),
        [](const std::string& msg) { printLogMsg(msg, MSG_TYPE_ERROR); },
    };

    XferExitCode exitCode = XferExitCode::success;
    try
    {
        if (needsPassword(cfg))
            cfg.sshPassword = readPasswordFromTerminal("Enter SSH password: "); //throw SysError

        std::unique_ptr<AbstractFileSystem> srcFs = connect(cfg, cfg.srcAddress, log); //throw ErrorConnection
        std::unique_ptr<AbstractFileSystem> dstFs = connect(cfg, cfg.dstAddress, log); //

        Transfer xfer(std::move(srcFs), cfg.srcRoot,
                      std::move(dstFs), cfg.dstRoot, cfg.earliest, log, createRandomEngine());
        try
        {
            xfer.copyLogFiles();     //throw FileError, ErrorCreateDirectory, ErrorCopyFile
            xfer.copyCaptureFiles(); //
        }
        catch (const FileError& e)
        {
            log.error(e.toString());
            raiseExitCode(exitCode, XferExitCode::error);
        }

        try
        {
            xfer.close(); //throw FileError
        }
        catch (const FileError& e)
        {
            log.error(e.toString());
            raiseExitCode(exitCode, XferExitCode::error);
        }
    }
    catch (const FileError& e)
    {
        log.error(e.toString());
        raiseExitCode(exitCode, XferExitCode::error);
    }
    catch (const SysError& e)
    {
        log.error(e.toString());
        raiseExitCode(exitCode, XferExitCode::error);
    }
    catch (const std::runtime_error& e) //createRandomEngine()
    {
        log.error(e.what());
        raiseExitCode(exitCode, XferExitCode::error);
    }

    for (const LogEntry& entry : fetchExtraLog())
        std::cerr << formatMessage(entry);

    return exitCode;
}
}


int main(int argc, char* argv[])
{
    const std::string programName = argc > 0 ? getItemName(argv[0]) : "seaxfer";

    std::vector<Zstring> commandArgs;
    for (int i = 1; i < argc; ++i)
        commandArgs.push_back(argv[i]);

    XferConfig cfg;
    try
    {
        cfg = parseConfig(commandArgs, getEnvironmentVar); //throw SysErrorCommandLine
    }
    catch (const SysErrorCommandLine& e)
    {
        std::cerr << e.toString() << "\n\n" << getSyntaxHelp(programName);
        return static_cast<int>(XferExitCode::commandLine);
    }

    if (cfg.help)
    {
        std::cout << getSyntaxHelp(programName);
        return static_cast<int>(XferExitCode::success);
    }
    if (cfg.version)
    {
        std::cout << seaxferVersion << '\n';
        return static_cast<int>(XferExitCode::success);
    }
    if (cfg.srcRoot.empty() || cfg.dstRoot.empty())
    {
        std::cerr << "Must provide -srcRoot and -dstRoot.\n\n" << getSyntaxHelp(programName);
        return static_cast<int>(XferExitCode::commandLine);
    }

    return static_cast<int>(runTransfer(cfg));
}
