// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "sftp.h"
#include <algorithm>
#include <array>
#include <cassert>
#include <cstring>
#include <sx/base64.h>
#include <sx/extra_log.h>
#include <sx/file_io.h>
#include <sx/socket.h>
#include <libssh2/libssh2_wrap.h> //instead of <libssh2_sftp.h>

using namespace sx;
using namespace sxf;


namespace
{
//libssh2 speaks SFTP version 3: https://filezilla-project.org/specs/draft-ietf-secsh-filexfer-02.txt

const long SFTP_MODE_NEW_FILE   = 0666; //the server's umask applies
const long SFTP_MODE_NEW_FOLDER = 0777; //

//libssh2 sends at most 30000 bytes per packet; several packets in flight hide the round trip
const size_t SFTP_STREAM_BLOCK_SIZE = 16 * 30000;


Zstring getSftpDisplayPath(const SftpLogin& login, const Zstring& itemPath)
{
    Zstring url = Zstr("sftp://");
    if (!login.username.empty())
        url += login.username + Zstr('@');
    url += login.server;
    if (login.port != DEFAULT_PORT_SFTP)
        url += Zstr(':') + numberTo(login.port);

    url += startsWith(itemPath, "/") ? itemPath : FILE_NAME_SEPARATOR + itemPath;
    return url;
}


//the server answered, but refused: the connection itself is fine
struct SysErrorSftpStatus : public SysError
{
    SysErrorSftpStatus(const std::string& msg, unsigned long status) : SysError(msg), sftpStatus(status) {}

    const unsigned long sftpStatus;
};

bool isMissingItemStatus(const SysErrorSftpStatus& e)
{
    return e.sftpStatus == LIBSSH2_FX_NO_SUCH_FILE || e.sftpStatus == LIBSSH2_FX_NO_SUCH_PATH;
}


//nullopt: server sent no permission bits
std::optional<AFS::ItemType> getItemType(const LIBSSH2_SFTP_ATTRIBUTES& attr)
{
    if (!(attr.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS))
        return std::nullopt;
    if (LIBSSH2_SFTP_S_ISLNK(attr.permissions))
        return AFS::ItemType::symlink;
    return LIBSSH2_SFTP_S_ISDIR(attr.permissions) ? AFS::ItemType::folder : AFS::ItemType::file;
}


//libssh2_init() once while any session is alive, libssh2_exit() after the last one
class LibsshRuntime
{
public:
    static std::shared_ptr<LibsshRuntime> acquire() //throw SysError
    {
        static std::weak_ptr<LibsshRuntime> current; //single-threaded

        std::shared_ptr<LibsshRuntime> runtime = current.lock();
        if (!runtime)
            current = runtime = std::shared_ptr<LibsshRuntime>(new LibsshRuntime()); //throw SysError
        return runtime;
    }

    ~LibsshRuntime() { ::libssh2_exit(); }

private:
    LibsshRuntime() //throw SysError
    {
        if (const int rc = ::libssh2_init(0); rc != 0)
            throw SysError(formatSystemError("libssh2_init", formatSshStatusCode(rc), ""));
    }
    LibsshRuntime           (const LibsshRuntime&) = delete;
    LibsshRuntime& operator=(const LibsshRuntime&) = delete;
};


//"SHA256:nThbg6kXUpJWGl7E1IGOCspRomTxdCARLviKw6E5SY8" as printed by "ssh-keygen -l": no base64 padding
std::string normalizeHostKeyFingerprint(const std::string& fingerprint)
{
    std::string output = trimCpy(fingerprint);
    output.erase(output.find_last_not_of('=') + 1);
    return output;
}


class SshSession
{
public:
    explicit SshSession(const SftpLogin& login) : //throw SysError
        socket_(login.server, numberTo(login.port), login.timeoutSec), //throw SysError
        sshSession_(::libssh2_session_init())
    {
        if (!sshSession_) //out of memory: no last error available
            throw SysError(formatSystemError("libssh2_session_init", formatSshStatusCode(LIBSSH2_ERROR_ALLOC), ""));
        SX_ON_SCOPE_FAIL(release());

        ::libssh2_session_set_blocking(sshSession_, 1);
        ::libssh2_session_set_timeout(sshSession_, login.timeoutSec * 1000);

        if (::libssh2_session_handshake(sshSession_, socket_.get()) != 0)
            throw SysError(describeLastError("libssh2_session_handshake"));

        if (!login.hostKeyFingerprint.empty())
            verifyHostKey(login.hostKeyFingerprint); //throw SysError

        authenticate(login); //throw SysError

        sftpChannel_ = ::libssh2_sftp_init(sshSession_);
        if (!sftpChannel_)
            throw SysError(describeLastError("libssh2_sftp_init"));

        ::libssh2_session_set_timeout(sshSession_, 0); //connect timeout only: transfers block as long as the server keeps the session
    }

    ~SshSession() { release(); }

    //one blocking libssh2 call: negative results are errors
    template <class Fun>
    int call(const char* functionName, Fun libsshCall) //throw SysError, SysErrorSftpStatus
    {
        const int rc = libsshCall(sftpChannel_);
        if (rc >= 0)
            return rc;

        if (::libssh2_session_last_errno(sshSession_) != rc) //not every libssh2 error path records itself
            ::libssh2_session_set_last_error(sshSession_, rc, nullptr);

        //LIBSSH2_ERROR_SFTP_PROTOCOL with status FX_OK means a garbled packet, i.e. a broken connection
        if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL)
            if (const unsigned long status = ::libssh2_sftp_last_error(sftpChannel_); status != LIBSSH2_FX_OK)
                throw SysErrorSftpStatus(describeLastError(functionName), status);

        throw SysError(describeLastError(functionName));
    }

    //libssh2 calls returning a handle: nullptr is an error
    template <class Fun>
    LIBSSH2_SFTP_HANDLE* openHandle(const char* functionName, Fun libsshOpen) //throw SysError, SysErrorSftpStatus
    {
        LIBSSH2_SFTP_HANDLE* handle = nullptr;
        call(functionName, [&](LIBSSH2_SFTP* sftp) //throw SysError, SysErrorSftpStatus
        {
            handle = libsshOpen(sftp);
            return handle ? 0 : std::min(::libssh2_session_last_errno(sshSession_), LIBSSH2_ERROR_SOCKET_NONE);
        });
        return handle;
    }

    //orderly goodbye; the session is unusable afterwards, even on error
    void disconnect() //throw SysError
    {
        if (LIBSSH2_SFTP* sftpChannel = std::exchange(sftpChannel_, nullptr))
            if (::libssh2_sftp_shutdown(sftpChannel) != 0)
                throw SysError(describeLastError("libssh2_sftp_shutdown"));

        disconnected_ = true;
        if (::libssh2_session_disconnect(sshSession_, "seaxfer: transfer complete") != 0) //only notifies the server
            throw SysError(describeLastError("libssh2_session_disconnect"));
    }

private:
    SshSession           (const SshSession&) = delete;
    SshSession& operator=(const SshSession&) = delete;

    void verifyHostKey(const std::string& expectedFingerprint) //throw SysError
    {
        const char* sha256 = ::libssh2_hostkey_hash(sshSession_, LIBSSH2_HOSTKEY_HASH_SHA256); //32 bytes
        if (!sha256)
            throw SysError(describeLastError("libssh2_hostkey_hash"));

        const std::string actual   = normalizeHostKeyFingerprint("SHA256:" + stringEncodeBase64(std::string_view(sha256, 32)));
        const std::string expected = normalizeHostKeyFingerprint(expectedFingerprint);
        if (actual != expected)
            throw SysError("Host key verification failed. Expected fingerprint " + expected + ", but server presented " + actual + '.');
    }

    void authenticate(const SftpLogin& login) //throw SysError
    {
        const char* methodList = ::libssh2_userauth_list(sshSession_, login.username);
        if (!methodList)
        {
            if (::libssh2_userauth_authenticated(sshSession_) == 1) //"none" authentication was accepted
                return;
            throw SysError(describeLastError("libssh2_userauth_list"));
        }

        const std::vector<std::string> methods = splitCpy(methodList, ',', SplitOnEmpty::skip);
        auto serverOffers = [&](std::string_view method)
        {
            return std::any_of(methods.begin(), methods.end(), [&](const std::string& m) { return trimCpy(m) == method; });
        };
        auto unsupported = [&](const std::string& what)
        {
            return SysError("The server does not support authentication via " + what + ".\nRequired: " + methodList);
        };

        if (!login.privateKeyFilePath.empty())
        {
            if (!serverOffers("publickey"))
                throw unsupported("\"key file\"");
            authenticateByKeyFile(login); //throw SysError
        }
        else if (serverOffers("password"))
        {
            if (::libssh2_userauth_password(sshSession_, login.username, login.password) != 0)
                throw SysError(describeLastError("libssh2_userauth_password"));
        }
        else if (serverOffers("keyboard-interactive")) //servers may offer this one only
            authenticateInteractive(login); //throw SysError
        else
            throw unsupported("\"username/password\"");
    }

    void authenticateByKeyFile(const SftpLogin& login) //throw SysError
    {
        std::string privateKey;
        try
        {
            privateKey = trimCpy(getFileContent(login.privateKeyFilePath)); //throw FileError
        }
        catch (const FileError& e) { throw SysError(replaceCpy(e.toString(), "\n\n", "\n")); }

        //passphrase: the password, if any; the public key is derived from the private one
        if (::libssh2_userauth_publickey_frommemory(sshSession_, login.username, privateKey, login.password) == 0)
            return;

        //libssh2 says "Unable to extract public key from private key": name the likelier cause
        const bool isPublicKey = contains(beforeFirst(privateKey, "\n", IfNotFoundReturn::all), "PUBLIC KEY") ||
                                 startsWith(privateKey, "ssh-") || startsWith(privateKey, "ecdsa-") || startsWith(privateKey, "rsa-");
        if (isPublicKey)
            throw SysError("Authentication failed. " + fmtPath(login.privateKeyFilePath) + " is a public key, not an OpenSSH private key file.");

        throw SysError(describeLastError("libssh2_userauth_publickey_frommemory"));
    }

    struct PromptAnswers
    {
        const std::string& password;
        std::string unexpectedPrompts;
        bool outOfMemory = false;
    };

    //C callback: must not throw
    static void answerPrompts(const char* /*name*/, int /*nameLen*/, const char* /*instruction*/, int /*instructionLen*/,
                              int promptCount, const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts, LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses, void** abstract)
    {
        PromptAnswers& answers = *static_cast<PromptAnswers*>(*abstract);
        try
        {
            if (promptCount == 1 && prompts[0].echo == 0) //hidden input: must be the password
            {
                responses[0].text = ::strdup(answers.password.c_str()); //libssh2 free()s it
                responses[0].length = responses[0].text ? static_cast<unsigned int>(answers.password.size()) : 0;
                return;
            }
            for (int i = 0; i < promptCount; ++i)
                answers.unexpectedPrompts += (answers.unexpectedPrompts.empty() ? "" : "|") + std::string(reinterpret_cast<const char*>(prompts[i].text), prompts[i].length);
        }
        catch (const std::bad_alloc&) { answers.outOfMemory = true; }
    }

    void authenticateInteractive(const SftpLogin& login) //throw SysError
    {
        PromptAnswers answers{login.password};

        void** abstract = ::libssh2_session_abstract(sshSession_);
        if (*abstract)
            throw SysError("libssh2_session_abstract: already in use");
        *abstract = &answers;
        SX_ON_SCOPE_EXIT(*abstract = nullptr);

        if (::libssh2_userauth_keyboard_interactive(sshSession_, login.username, answerPrompts) != 0)
        {
            if (answers.outOfMemory)
                throw std::bad_alloc();
            throw SysError(describeLastError("libssh2_userauth_keyboard_interactive") +
                           (answers.unexpectedPrompts.empty() ? "" : "\nUnexpected prompts: " + answers.unexpectedPrompts));
        }
    }

    //error path and destructor: blocks until the server answers or the socket gives up
    void release()
    {
        if (sftpChannel_)
            ::libssh2_sftp_shutdown(sftpChannel_); //the session goes away below either way

        if (!disconnected_)
            ::libssh2_session_disconnect(sshSession_, "seaxfer: transfer aborted");

        [[maybe_unused]] const int rc = ::libssh2_session_free(sshSession_);
        assert(rc == 0);
    }

    std::string describeLastError(const char* functionName) const
    {
        char* msgBuf = nullptr; //owned by the session
        const int sshStatus = ::libssh2_session_last_error(sshSession_, &msgBuf, nullptr, 0);
        std::string msg = msgBuf ? trimCpy(msgBuf) : "";

        //with a valid SFTP status the generic "SFTP Protocol Error" text adds nothing
        if (sshStatus == LIBSSH2_ERROR_SFTP_PROTOCOL && sftpChannel_)
            if (const unsigned long sftpStatus = ::libssh2_sftp_last_error(sftpChannel_); sftpStatus != LIBSSH2_FX_OK)
                return formatSystemError(functionName, formatSftpStatusCode(sftpStatus), msg == "SFTP Protocol Error" ? "" : msg);

        return formatSystemError(functionName, formatSshStatusCode(sshStatus), msg);
    }

    const std::shared_ptr<LibsshRuntime> runtime_ = LibsshRuntime::acquire(); //throw SysError; first member: outlives the rest
    Socket socket_;
    LIBSSH2_SESSION* const sshSession_;
    LIBSSH2_SFTP* sftpChannel_ = nullptr;
    bool disconnected_ = false;
};


//reads and writes go through an open SFTP handle; the handle is closed with the stream
class SftpFileHandle
{
protected:
    SftpFileHandle(SshSession& session, const Zstring& displayPath) : session_(session), displayPath_(displayPath) {}

    std::string errorMsg(const char* msgTemplate) const { return replaceCpy(msgTemplate, "%x", fmtPath(displayPath_)); }

    void closeHandle() //throw SysError
    {
        session_.call("libssh2_sftp_close", [&](LIBSSH2_SFTP*) { return ::libssh2_sftp_close(handle_); }); //throw SysError
        handle_ = nullptr;
    }

    SshSession& session_;
    const Zstring displayPath_;
    LIBSSH2_SFTP_HANDLE* handle_ = nullptr;
};


struct InputStreamSftp : public AFS::InputStream, private SftpFileHandle
{
    InputStreamSftp(SshSession& session, const Zstring& filePath, const Zstring& displayPath) : //throw FileError
        SftpFileHandle(session, displayPath)
    {
        try
        {
            handle_ = session_.openHandle("libssh2_sftp_open", [&](LIBSSH2_SFTP* sftp) { return ::libssh2_sftp_open(sftp, filePath, LIBSSH2_FXF_READ, 0); });
        }
        catch (const SysError& e) { throw FileError(errorMsg("Cannot open file %x."), e.toString()); }
    }

    ~InputStreamSftp()
    {
        try { closeHandle(); } //throw SysError
        catch (const SysError& e) { logExtraError(errorMsg("Cannot read file %x.") + "\n\n" + e.toString()); }
    }

    size_t getBlockSize() override { return SFTP_STREAM_BLOCK_SIZE; }

    size_t tryRead(void* buffer, size_t bytesToRead) override //throw FileError
    {
        if (bytesToRead == 0) //would look like end of file
            throw std::logic_error(std::string(__FILE__) + '[' + numberTo(__LINE__) + "] Contract violation!");
        try
        {
            const int bytesRead = session_.call("libssh2_sftp_read", [&](LIBSSH2_SFTP*) //throw SysError
            {
                return static_cast<int>(::libssh2_sftp_read(handle_, static_cast<char*>(buffer), bytesToRead));
            });
            ASSERT_SYSERROR(static_cast<size_t>(bytesRead) <= bytesToRead);
            return bytesRead;
        }
        catch (const SysError& e) { throw FileError(errorMsg("Cannot read file %x."), e.toString()); }
    }

    timespec getModTime() override //throw FileError
    {
        try
        {
            LIBSSH2_SFTP_ATTRIBUTES attr = {};
            session_.call("libssh2_sftp_fstat", [&](LIBSSH2_SFTP*) { return ::libssh2_sftp_fstat(handle_, &attr); }); //throw SysError

            if (!(attr.flags & LIBSSH2_SFTP_ATTR_ACMODTIME))
                throw SysError("Modification time not supported.");
            return {.tv_sec = static_cast<time_t>(attr.mtime)}; //SFTP v3: whole seconds
        }
        catch (const SysError& e) { throw FileError(errorMsg("Cannot read file attributes of %x."), e.toString()); }
    }
};


struct OutputStreamSftp : public AFS::OutputStream, private SftpFileHandle
{
    OutputStreamSftp(SshSession& session, const Zstring& filePath, const Zstring& displayPath) : //throw FileError
        SftpFileHandle(session, displayPath),
        filePath_(filePath)
    {
        try
        {
            //FXF_EXCL: an existing file fails with the generic FX_FAILURE
            handle_ = session_.openHandle("libssh2_sftp_open", [&](LIBSSH2_SFTP* sftp)
            {
                return ::libssh2_sftp_open(sftp, filePath, LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_EXCL, SFTP_MODE_NEW_FILE);
            });
        }
        catch (const SysError& e) { throw FileError(errorMsg("Cannot write file %x."), e.toString()); }
    }

    ~OutputStreamSftp()
    {
        if (finalized_)
            return;

        //incomplete file: close (once) and delete
        if (handle_ && !closeFailed_)
            try { closeHandle(); } //throw SysError
            catch (const SysError& e) { logExtraError(errorMsg("Cannot write file %x.") + "\n\n" + e.toString()); }

        try { session_.call("libssh2_sftp_unlink", [&](LIBSSH2_SFTP* sftp) { return ::libssh2_sftp_unlink(sftp, filePath_); }); } //throw SysError
        catch (const SysError& e) { logExtraError(errorMsg("Cannot delete file %x.") + "\n\n" + e.toString()); }
    }

    size_t getBlockSize() override { return SFTP_STREAM_BLOCK_SIZE; }

    size_t tryWrite(const void* buffer, size_t bytesToWrite) override //throw FileError
    {
        if (bytesToWrite == 0)
            throw std::logic_error(std::string(__FILE__) + '[' + numberTo(__LINE__) + "] Contract violation!");
        try
        {
            const int bytesWritten = session_.call("libssh2_sftp_write", [&](LIBSSH2_SFTP*) //throw SysError
            {
                return static_cast<int>(::libssh2_sftp_write(handle_, static_cast<const char*>(buffer), bytesToWrite));
            });
            ASSERT_SYSERROR(static_cast<size_t>(bytesWritten) <= bytesToWrite);
            return bytesWritten;
        }
        catch (const SysError& e) { throw FileError(errorMsg("Cannot write file %x."), e.toString()); }
    }

    void finalize() override //throw FileError
    {
        try
        {
            closeHandle(); //throw SysError; the server may report a failed write only now
        }
        catch (const SysError& e)
        {
            closeFailed_ = true;
            throw FileError(errorMsg("Cannot write file %x."), e.toString());
        }
        finalized_ = true;
    }

private:
    const Zstring filePath_;
    bool closeFailed_ = false;
    bool finalized_ = false;
};


class SftpFileSystem : public AbstractFileSystem
{
public:
    SftpFileSystem(const SftpLogin& login, std::unique_ptr<SshSession>&& session) : login_(login), session_(std::move(session)) {}

    Zstring getDisplayPath(const Zstring& itemPath) const override { return getSftpDisplayPath(login_, itemPath); }

    std::optional<ItemType> getItemTypeIfExists(const Zstring& itemPath) override //throw FileError
    {
        const std::string errorMsg = errorMsgFor("Cannot read file attributes of %x.", itemPath);
        try
        {
            LIBSSH2_SFTP_ATTRIBUTES attr = {};
            session().call("libssh2_sftp_stat", [&](LIBSSH2_SFTP* sftp) { return ::libssh2_sftp_stat(sftp, itemPath, &attr); }); //throw SysError, SysErrorSftpStatus

            if (const std::optional<ItemType> type = getItemType(attr))
                return type;
            throw SysError("File attributes not available.");
        }
        catch (const SysErrorSftpStatus& e)
        {
            if (isMissingItemStatus(e))
                return std::nullopt;
            throw FileError(errorMsg, e.toString());
        }
        catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }
    }

    std::optional<std::vector<FolderItem>> getFolderContentIfExists(const Zstring& folderPath) override //throw FileError
    {
        LIBSSH2_SFTP_HANDLE* dirHandle = nullptr;
        try
        {
            dirHandle = session().openHandle("libssh2_sftp_opendir", [&](LIBSSH2_SFTP* sftp) { return ::libssh2_sftp_opendir(sftp, folderPath); });
        }
        catch (const SysErrorSftpStatus& e)
        {
            //SFTP v3 has no "not a directory" status: a file fails with the generic FX_FAILURE
            if (isMissingItemStatus(e) || getItemTypeIfExists(folderPath) != ItemType::folder) //throw FileError
                return std::nullopt;
            throw FileError(errorMsgFor("Cannot open directory %x.", folderPath), e.toString());
        }
        catch (const SysError& e) { throw FileError(errorMsgFor("Cannot open directory %x.", folderPath), e.toString()); }

        SX_ON_SCOPE_EXIT(
            try { session().call("libssh2_sftp_closedir", [&](LIBSSH2_SFTP*) { return ::libssh2_sftp_closedir(dirHandle); }); } //throw SysError
            catch (const SysError& e) { logExtraError(errorMsgFor("Cannot read directory %x.", folderPath) + "\n\n" + e.toString()); });

        std::vector<FolderItem> items;
        for (;;)
        {
            std::array<char, 1024> nameBuf; //NAME_MAX + 1 would do
            LIBSSH2_SFTP_ATTRIBUTES attr = {};
            int nameLen = 0;
            try
            {
                nameLen = session().call("libssh2_sftp_readdir", [&](LIBSSH2_SFTP*) //throw SysError
                {
                    return ::libssh2_sftp_readdir(dirHandle, nameBuf.data(), nameBuf.size(), &attr);
                });
            }
            catch (const SysError& e) { throw FileError(errorMsgFor("Cannot read directory %x.", folderPath), e.toString()); }

            if (nameLen == 0)
                return items;

            const Zstring itemName(nameBuf.data(), nameLen);
            if (itemName != Zstr(".") && itemName != Zstr(".."))
                items.push_back({itemName, getItemType(attr).value_or(ItemType::symlink)}); //no permission bits: the caller resolves it like a link
        }
    }

    void createFolderPlain(const Zstring& folderPath) override //throw FileError, ErrorTargetExisting
    {
        const std::string errorMsg = errorMsgFor("Cannot create directory %x.", folderPath);
        try
        {
            session().call("libssh2_sftp_mkdir", [&](LIBSSH2_SFTP* sftp) { return ::libssh2_sftp_mkdir(sftp, folderPath, SFTP_MODE_NEW_FOLDER); }); //throw SysError, SysErrorSftpStatus
        }
        catch (const SysErrorSftpStatus& e)
        {
            if (getItemTypeIfExists(folderPath)) //throw FileError; an existing item fails with the generic FX_FAILURE
                throw ErrorTargetExisting(errorMsg, e.toString());
            throw FileError(errorMsg, e.toString());
        }
        catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }
    }

    std::unique_ptr<InputStream> getInputStream(const Zstring& filePath) override //throw FileError
    {
        return std::make_unique<InputStreamSftp>(sessionFor("Cannot open file %x.", filePath), filePath, getDisplayPath(filePath)); //throw FileError
    }

    std::unique_ptr<OutputStream> getOutputStream(const Zstring& filePath) override //throw FileError
    {
        return std::make_unique<OutputStreamSftp>(sessionFor("Cannot write file %x.", filePath), filePath, getDisplayPath(filePath)); //throw FileError
    }

    void removeFilePlain(const Zstring& filePath) override //throw FileError
    {
        try
        {
            session().call("libssh2_sftp_unlink", [&](LIBSSH2_SFTP* sftp) { return ::libssh2_sftp_unlink(sftp, filePath); }); //throw SysError
        }
        catch (const SysError& e) { throw FileError(errorMsgFor("Cannot delete file %x.", filePath), e.toString()); }
    }

    void moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo) override //throw FileError
    {
        const std::string errorMsg = replaceCpy(replaceCpy("Cannot move file %x to %y.", "%x", '\n' + fmtPath(getDisplayPath(pathFrom))),
                                                "%y", '\n' + fmtPath(getDisplayPath(pathTo)));
        auto rename = [&] //throw SysError, SysErrorSftpStatus
        {
            session().call("libssh2_sftp_rename", [&](LIBSSH2_SFTP* sftp)
            {
                return ::libssh2_sftp_rename(sftp, pathFrom, pathTo, LIBSSH2_SFTP_RENAME_OVERWRITE | LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE);
            });
        };

        try
        {
            rename(); //throw SysError, SysErrorSftpStatus
        }
        catch (const SysErrorSftpStatus& e)
        {
            //SFTP v3 servers (OpenSSH) ignore the overwrite flag and fail with FX_FAILURE on an existing target
            //any other status, or a source that's gone: keep the target
            if (!isSftpRenameConflict(e.sftpStatus) ||
                getItemTypeIfExists(pathFrom) != ItemType::file || //throw FileError
                getItemTypeIfExists(pathTo)   != ItemType::file)   //
                throw FileError(errorMsg, e.toString());
            try
            {
                removeFilePlain(pathTo); //throw FileError
                rename(); //throw SysError, SysErrorSftpStatus
            }
            catch (const SysError& e2) { throw FileError(errorMsg, e2.toString()); }
        }
        catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }
    }

    void setFileTimes(const Zstring& filePath, const timespec& accessTime, const timespec& modTime) override //throw FileError
    {
        LIBSSH2_SFTP_ATTRIBUTES attr = {};
        attr.flags = LIBSSH2_SFTP_ATTR_ACMODTIME;
        attr.atime = static_cast<unsigned long>(accessTime.tv_sec); //SFTP v3: 32-bit seconds
        attr.mtime = static_cast<unsigned long>(modTime   .tv_sec); //
        try
        {
            //by path: some servers mishandle libssh2_sftp_fsetstat()
            session().call("libssh2_sftp_setstat", [&](LIBSSH2_SFTP* sftp) { return ::libssh2_sftp_setstat(sftp, filePath, &attr); }); //throw SysError
        }
        catch (const SysError& e) { throw FileError(errorMsgFor("Cannot write modification time of %x.", filePath), e.toString()); }
    }

    void close() override //throw FileError
    {
        if (const std::unique_ptr<SshSession> session = std::move(session_))
            try
            {
                session->disconnect(); //throw SysError
            }
            catch (const SysError& e) { throw FileError(errorMsgFor("Cannot close connection to %x.", ""), e.toString()); }
    }

private:
    std::string errorMsgFor(const char* msgTemplate, const Zstring& itemPath) const
    {
        return replaceCpy(msgTemplate, "%x", fmtPath(getDisplayPath(itemPath)));
    }

    SshSession& session() //throw SysError
    {
        if (!session_)
            throw SysError("SFTP session is closed.");
        return *session_;
    }

    SshSession& sessionFor(const char* msgTemplate, const Zstring& filePath) //throw FileError
    {
        try { return session(); } //throw SysError
        catch (const SysError& e) { throw FileError(errorMsgFor(msgTemplate, filePath), e.toString()); }
    }

    const SftpLogin login_;
    std::unique_ptr<SshSession> session_;
};
}


bool sxf::isSftpRenameConflict(unsigned long sftpStatusCode)
{
    return sftpStatusCode == LIBSSH2_FX_FAILURE ||
           sftpStatusCode == LIBSSH2_FX_FILE_ALREADY_EXISTS;
}


std::unique_ptr<AbstractFileSystem> sxf::createSftpFileSystem(const SftpLogin& login) //throw ErrorConnection
{
    const std::string errorMsg = replaceCpy("Unable to connect to %x.", "%x", fmtPath(getSftpDisplayPath(login, "")));

    if (login.password.empty() && login.privateKeyFilePath.empty())
        throw ErrorConnection(errorMsg, "Must provide an SSH password or private key file.");
    try
    {
        return std::make_unique<SftpFileSystem>(login, std::make_unique<SshSession>(login)); //throw SysError
    }
    catch (const SysError& e) { throw ErrorConnection(errorMsg, e.toString()); }
}
