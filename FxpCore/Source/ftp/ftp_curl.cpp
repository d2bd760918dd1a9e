// *****************************************************************************
// * This file is part of the FxpCore project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ftp_curl.h"
#include <fxp/thread.h>
#include <libcurl/curl_wrap.h> //DON'T include <curl/curl.h> directly!
    #include <fcntl.h>

using namespace fxp;


namespace fxp
{
class FtpSession
{
public:
    explicit FtpSession(const FtpClientConfig& cfg) : cfg_(cfg) {}

    ~FtpSession()
    {
        if (easyHandle_)
            ::curl_easy_cleanup(easyHandle_); //sends QUIT if the control connection is still alive
    }

    //returns server response (header data)
    std::string perform(const std::vector<CurlOption>& extraOptions) //throw SysError, SysErrorPassword, SysErrorFtpProtocol, ThreadStopRequest
    {
        if (!easyHandle_)
        {
            easyHandle_ = ::curl_easy_init();
            if (!easyHandle_)
                throw SysError(formatSystemError("curl_easy_init", formatCurlStatusCode(CURLE_OUT_OF_MEMORY), L""));
        }
        else
            ::curl_easy_reset(easyHandle_); //keeps the live connection, DNS cache and session ID cache

        char curlErrorBuf[CURL_ERROR_SIZE] = {};
        setCurlOption(easyHandle_, {CURLOPT_ERRORBUFFER, curlErrorBuf}); //throw SysError

        std::string headerData;
        curl_write_callback onHeaderReceived = [](/*const*/ char* buffer, size_t size, size_t nitems, void* callbackData)
        {
            auto& output = *static_cast<std::string*>(callbackData);
            output.append(buffer, size * nitems);
            return size * nitems;
        };
        setCurlOption(easyHandle_, {CURLOPT_HEADERDATA, &headerData}); //throw SysError
        setCurlOption(easyHandle_, {CURLOPT_HEADERFUNCTION, onHeaderReceived}); //throw SysError

        setCurlOption(easyHandle_, {CURLOPT_URL, getCurlUrl().c_str()}); //throw SysError

        setCurlOption(easyHandle_, {CURLOPT_FTP_FILEMETHOD, CURLFTPMETHOD_NOCWD}); //throw SysError
        //=> libcurl never touches the working directory: it belongs to the caller (CWD via execute())

        if (!cfg_.username.empty()) //else: libcurl will default to CURL_DEFAULT_USER("anonymous") and CURL_DEFAULT_PASSWORD("ftp@example.com")
        {
            setCurlOption(easyHandle_, {CURLOPT_USERNAME, cfg_.username.c_str()}); //throw SysError
            setCurlOption(easyHandle_, {CURLOPT_PASSWORD, cfg_.password.c_str()}); //throw SysError
        }

        setCurlOption(easyHandle_, {CURLOPT_PORT, static_cast<long>(getEffectivePort(cfg_))}); //throw SysError

        //thread-safety: https://curl.haxx.se/libcurl/c/threadsafe.html
        setCurlOption(easyHandle_, {CURLOPT_NOSIGNAL, 1}); //throw SysError

        setCurlOption(easyHandle_, {CURLOPT_CONNECTTIMEOUT, cfg_.timeoutSec}); //throw SysError

        //CURLOPT_TIMEOUT: "Since this puts a hard limit for how long time a request is allowed to take, it has limited use in dynamic use cases with varying transfer times."
        setCurlOption(easyHandle_, {CURLOPT_LOW_SPEED_TIME, cfg_.timeoutSec}); //throw SysError
        setCurlOption(easyHandle_, {CURLOPT_LOW_SPEED_LIMIT, 1 /*[bytes]*/}); //throw SysError
        //can't use "0" which means "inactive", so use some low number

        setCurlOption(easyHandle_, {CURLOPT_SERVER_RESPONSE_TIMEOUT, cfg_.timeoutSec}); //throw SysError
        //FTP only; unlike CURLOPT_TIMEOUT, this one is NOT a limit on the total transfer time

        //an FXP transfer keeps the control connection idle for as long as the server-to-server copy takes
        setCurlOption(easyHandle_, {CURLOPT_TCP_KEEPALIVE, 1}); //throw SysError


        std::optional<SysError> socketException;
        //libcurl does *not* set FD_CLOEXEC for us! https://github.com/curl/curl/issues/2252
        auto onSocketCreate = [&](curl_socket_t curlfd, curlsocktype purpose)
        {
            if (::fcntl(curlfd, F_SETFD, FD_CLOEXEC) == -1) //=> RACE-condition if other thread calls fork/execv before this thread sets FD_CLOEXEC!
            {
                socketException = SysError(formatSystemError("fcntl(FD_CLOEXEC)", errno));
                return CURL_SOCKOPT_ERROR;
            }
            return CURL_SOCKOPT_OK;
        };

        using SocketCbType = decltype(onSocketCreate);
        using SocketCbWrapperType =            int (*)(SocketCbType* clientp, curl_socket_t curlfd, curlsocktype purpose); //needed for cdecl function pointer cast
        SocketCbWrapperType onSocketCreateWrapper = [](SocketCbType* clientp, curl_socket_t curlfd, curlsocktype purpose)
        {
            return (*clientp)(curlfd, purpose); //free this poor little C-API from its shackles and redirect to a proper lambda
        };

        setCurlOption(easyHandle_, {CURLOPT_SOCKOPTFUNCTION, onSocketCreateWrapper}); //throw SysError
        setCurlOption(easyHandle_, {CURLOPT_SOCKOPTDATA, &onSocketCreate}); //throw SysError

        //cancellation while waiting for the server: abort from within libcurl's event loop
        using XferInfoCbType = int (*)(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow);
        XferInfoCbType onXferInfo = [](void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow)
        {
            return interruptionRequested() ? 1 : 0; //=> CURLE_ABORTED_BY_CALLBACK
        };
        setCurlOption(easyHandle_, {CURLOPT_XFERINFOFUNCTION, onXferInfo}); //throw SysError
        setCurlOption(easyHandle_, {CURLOPT_NOPROGRESS, 0}); //throw SysError

        setCurlOption(easyHandle_, {CURLOPT_CAINFO, 0}); //throw SysError
        //be explicit: "even when [CURLOPT_SSL_VERIFYPEER] is disabled [...] curl may still load the certificate file specified in CURLOPT_CAINFO."

        //FXP servers are commonly self-signed: don't check certificate and host name
        setCurlOption(easyHandle_, {CURLOPT_SSL_VERIFYPEER, 0}); //throw SysError
        setCurlOption(easyHandle_, {CURLOPT_SSL_VERIFYHOST, 0}); //throw SysError

        if (cfg_.useTls) //https://tools.ietf.org/html/rfc4217
        {
            //require SSL for both control and data:
            setCurlOption(easyHandle_, {CURLOPT_USE_SSL,    CURLUSESSL_ALL}); //throw SysError
            //try TLS first, then SSL (currently: CURLFTPAUTH_DEFAULT == CURLFTPAUTH_SSL):
            setCurlOption(easyHandle_, {CURLOPT_FTPSSLAUTH, CURLFTPAUTH_TLS}); //throw SysError
        }

        for (const CurlOption& option : extraOptions)
            setCurlOption(easyHandle_, option); //throw SysError

        //=======================================================================================================
        const CURLcode rcPerf = ::curl_easy_perform(easyHandle_);
        //note: CURLOPT_FAILONERROR(default:off) is only available for HTTP => BUT at least we can prefix FTP commands with * for same effect: https://curl.se/libcurl/c/CURLOPT_QUOTE.html

        if (socketException)
            throw* socketException; //throw SysError
        //=======================================================================================================

        if (rcPerf == CURLE_ABORTED_BY_CALLBACK)
            interruptionPoint(); //throw ThreadStopRequest

        if (rcPerf != CURLE_OK)
        {
            std::wstring errorMsg = trimCpy(utfTo<std::wstring>(curlErrorBuf)); //optional

            if (const std::vector<std::string_view>& headerLines = splitFtpResponse(headerData);
                !headerLines.empty())
                if (const std::string response = trimCpy(std::string(headerLines.back())); //that *should* be the server's error response
                    !response.empty())
                    errorMsg += (errorMsg.empty() ? L"" : L"\n") + utfTo<std::wstring>(response);

            if (rcPerf == CURLE_LOGIN_DENIED)
                throw SysErrorPassword(formatSystemError("curl_easy_perform", formatCurlStatusCode(rcPerf), errorMsg));

            long ftpStatusCode = 0; //optional
            /*const CURLcode rc =*/ ::curl_easy_getinfo(easyHandle_, CURLINFO_RESPONSE_CODE, &ftpStatusCode);
            //https://en.wikipedia.org/wiki/List_of_FTP_server_return_codes
            if (ftpStatusCode != 0)
                throw SysErrorFtpProtocol(formatSystemError("curl_easy_perform", formatCurlStatusCode(rcPerf), errorMsg), ftpStatusCode);

            throw SysError(formatSystemError("curl_easy_perform", formatCurlStatusCode(rcPerf), errorMsg));
        }

        return headerData;
    }

    //returns server response (header data)
    std::string runSingleFtpCommand(const std::string& ftpCmd) //throw SysError, SysErrorPassword, SysErrorFtpProtocol, ThreadStopRequest
    {
        curl_slist* quote = nullptr;
        FXP_ON_SCOPE_EXIT(::curl_slist_free_all(quote));
        quote = ::curl_slist_append(quote, ftpCmd.c_str());
        if (!quote)
            throw SysError(formatSystemError("curl_slist_append", formatCurlStatusCode(CURLE_OUT_OF_MEMORY), L""));

        return perform(
        {
            {CURLOPT_NOBODY, 1L},
            {CURLOPT_QUOTE, quote},
        }); //throw SysError, SysErrorPassword, SysErrorFtpProtocol, ThreadStopRequest
    }

    std::optional<curl_socket_t> getActiveSocket() //throw SysError
    {
        if (easyHandle_)
        {
            curl_socket_t currentSocket = 0;
            const CURLcode rc = ::curl_easy_getinfo(easyHandle_, CURLINFO_ACTIVESOCKET, &currentSocket);
            if (rc != CURLE_OK)
                throw SysError(formatSystemError("curl_easy_getinfo(CURLINFO_ACTIVESOCKET)", formatCurlStatusCode(rc), utfTo<std::wstring>(::curl_easy_strerror(rc))));
            if (currentSocket != CURL_SOCKET_BAD)
                return currentSocket;
        }
        return {};
    }

private:
    FtpSession           (const FtpSession&) = delete;
    FtpSession& operator=(const FtpSession&) = delete;

    std::string getCurlUrl() const
    {
        std::string server = cfg_.server;
        if (server.find(':') != std::string::npos) //IPv6 literal
            server = '[' + server + ']';

        return "ftp://" + server + '/'; //directory URL + CURLOPT_NOBODY => no data connection
    }

    const FtpClientConfig cfg_;
    CURL* easyHandle_ = nullptr;
};
}

//================================================================================================================

void fxp::ftpInit()
{
    libcurlInit(); //+ OpenSSL
}


void fxp::ftpTeardown()
{
    libcurlTearDown();
}


CurlFtpClient::CurlFtpClient(const FtpClientConfig& cfg) : cfg_(cfg) {}


CurlFtpClient::~CurlFtpClient() {} //FtpSession is complete here


void CurlFtpClient::connect() //throw SysError, SysErrorPassword
{
    /*  FEAT: are there servers that don't support this command? yes: "550 FEAT: Operation not permitted"
        => '*' to the rescue: as long as we get an FTP response - *any* FTP response - the connection itself is fine!     */
    disconnect();
    session_ = std::make_unique<FtpSession>(cfg_);
    FXP_ON_SCOPE_FAIL(session_.reset());

    interruptionPoint(); //throw ThreadStopRequest

    const std::string featBuf = session_->runSingleFtpCommand("*FEAT"); //throw SysError, SysErrorPassword, SysErrorFtpProtocol, ThreadStopRequest
    parseFtpReply(featBuf); //throw SysError

    featureCache_ = parseFeatResponse(featBuf);
}


bool CurlFtpClient::isConnected() //throw SysError
{
    return session_ && session_->getActiveSocket(); //throw SysError
}


void CurlFtpClient::disconnect()
{
    session_.reset();
    featureCache_.reset();
}


FtpSession& CurlFtpClient::getSession() //throw SysError
{
    if (!session_)
        throw SysError(L"FTP client is not connected.");
    return *session_;
}


FtpReply CurlFtpClient::execute(const std::string& ftpCmd) //throw SysError
{
    FtpSession& session = getSession(); //throw SysError

    interruptionPoint(); //throw ThreadStopRequest
    //*: don't let libcurl fail on a negative reply => the caller decides
    const std::string response = session.runSingleFtpCommand('*' + ftpCmd); //throw SysError, SysErrorFtpProtocol, ThreadStopRequest
    interruptionPoint(); //throw ThreadStopRequest

    return parseFtpReply(response); //throw SysError
}


void CurlFtpClient::setDataType(FtpDataType type) //throw SysError, FtpCommandError
{
    //libcurl keeps its own idea of the transfer type, but never sends TYPE for a NOBODY directory request
    const FtpReply reply = execute(type == FtpDataType::binary ? "TYPE I" : "TYPE A"); //throw SysError
    if (!reply.success)
        throw FtpCommandError(reply);
}


std::string CurlFtpClient::getWorkingDirectory() //throw SysError
{
    const FtpReply reply = execute("PWD"); //throw SysError
    if (!reply.success)
        throw FtpCommandError(reply);

    if (reply.code == 257)
    {
        /* 257<space>[rubbish]"<directory-name>"<space><commentary>        according to libcurl

           "The directory name can contain any character; embedded double-quotes should be escaped by
           double-quotes (the "quote-doubling" convention)." https://tools.ietf.org/html/rfc959                    */
        const std::string& line = reply.message;
        auto itBegin = std::find(line.begin(), line.end(), '"');
        if (itBegin != line.end())
            for (auto it = ++itBegin; it != line.end(); ++it)
                if (*it == '"')
                {
                    if (it + 1 != line.end() && it[1] == '"')
                        ++it; //skip double quote
                    else
                        return replaceCpy<std::string>(std::string(itBegin, it), "\"\"", "\"");
                }
    }
    throw FtpMalformedResponse(L"Unexpected FTP response.", reply.getStatusLine());
}


void CurlFtpClient::setWorkingDirectory(const std::string& serverPath) //throw SysError, FtpCommandError
{
    const FtpReply reply = execute("CWD " + serverPath); //throw SysError
    if (!reply.success)
        throw FtpCommandError(reply);
}


const FtpFeatures& CurlFtpClient::getFeatures() //throw SysError
{
    if (!featureCache_)
        //*: ignore error if server does not support/allow FEAT
        featureCache_ = parseFeatResponse(getSession().runSingleFtpCommand("*FEAT")); //throw SysError, SysErrorFtpProtocol, ThreadStopRequest

    return *featureCache_;
}


bool CurlFtpClient::supportsChecksum() //throw SysError
{
    return getFeatures().supportsChecksum(); //throw SysError
}


FtpHash CurlFtpClient::getChecksum(const std::string& serverPath) //throw SysError
{
    return getRemoteChecksum(getFeatures(), serverPath, [this](const std::string& ftpCmd) { return execute(ftpCmd); }); //throw SysError
}


std::unique_ptr<FtpClient> CurlFtpClient::clone() const
{
    return std::make_unique<CurlFtpClient>(cfg_);
}
