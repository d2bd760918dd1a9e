// *****************************************************************************
// * This file is part of the FxpCore project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "curl_wrap.h"
#include <fxp/extra_log.h>
#include <fxp/open_ssl.h>
#include <fxp/thread.h>

using namespace fxp;


namespace
{
int curlInitLevel = 0; //support interleaving initialization calls!
//zero-initialized POD => not subject to static initialization order fiasco
}

void fxp::libcurlInit()
{
    assert(runningOnMainThread()); //OpenSSL and libcurl require init on main thread!
    assert(curlInitLevel >= 0);
    if (++curlInitLevel != 1) //non-atomic => require call from main thread
        return;

    openSslInit();

    try
    {
        ASSERT_SYSERROR(::curl_global_init(CURL_GLOBAL_NOTHING /*CURL_GLOBAL_DEFAULT = CURL_GLOBAL_SSL|CURL_GLOBAL_WIN32*/) == CURLE_OK);
    }
    catch (const SysError& e) { logExtraError(L"Error during process initialization.\n\n" + e.toString()); }
}


void fxp::libcurlTearDown()
{
    assert(runningOnMainThread()); //+ avoid race condition on "curlInitLevel"
    assert(curlInitLevel >= 1);
    if (--curlInitLevel != 0)
        return;

    ::curl_global_cleanup();
    openSslTearDown();
}


void fxp::setCurlOption(CURL* easyHandle, const CurlOption& curlOpt) //throw SysError
{
    if (const CURLcode rc = ::curl_easy_setopt(easyHandle, curlOpt.option, curlOpt.value);
        rc != CURLE_OK)
        throw SysError(formatSystemError("curl_easy_setopt(" + numberTo<std::string>(static_cast<int>(curlOpt.option)) + ")",
                                         formatCurlStatusCode(rc), utfTo<std::wstring>(::curl_easy_strerror(rc))));
}


std::wstring fxp::formatCurlStatusCode(CURLcode sc)
{
    switch (sc)
    {
            //setup
            FXP_CHECK_CASE_FOR_CONSTANT(CURLE_OK);
            FXP_CHECK_CASE_FOR_CONSTANT(CURLE_FAILED_INIT);
            FXP_CHECK_CASE_FOR_CONSTANT(CURLE_OUT_OF_MEMORY);
            FXP_CHECK_CASE_FOR_CONSTANT(CURLE_UNKNOWN_OPTION);
            FXP_CHECK_CASE_FOR_CONSTANT(CURLE_BAD_FUNCTION_ARGUMENT);
            FXP_CHECK_CASE_FOR_CONSTANT(CURLE_NOT_BUILT_IN);
            FXP_CHECK_CASE_FOR_CONSTANT(CURLE_UNSUPPORTED_PROTOCOL);
            FXP_CHECK_CASE_FOR_CONSTANT(CURLE_URL_MALFORMAT);
            FXP_CHECK_CASE_FOR_CONSTANT(CURLE_RECURSIVE_API_CALL);

            //control connection
            FXP_CHECK_CASE_FOR_CONSTANT(CURLE_COULDNT_RESOLVE_HOST);
            FXP_CHECK_CASE_FOR_CONSTANT(CURLE_COULDNT_CONNECT);
            FXP_CHECK_CASE_FOR_CONSTANT(CURLE_OPERATION_TIMEDOUT);
            FXP_CHECK_CASE_FOR_CONSTANT(CURLE_SEND_ERROR);
            FXP_CHECK_CASE_FOR_CONSTANT(CURLE_RECV_ERROR);
            FXP_CHECK_CASE_FOR_CONSTANT(CURLE_GOT_NOTHING);
            FXP_CHECK_CASE_FOR_CONSTANT(CURLE_WEIRD_SERVER_REPLY);
            FXP_CHECK_CASE_FOR_CONSTANT(CURLE_ABORTED_BY_CALLBACK); //cancelled via XFERINFOFUNCTION

            //login
            FXP_CHECK_CASE_FOR_CONSTANT(CURLE_LOGIN_DENIED);
            FXP_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_WEIRD_PASS_REPLY);
            FXP_CHECK_CASE_FOR_CONSTANT(CURLE_REMOTE_ACCESS_DENIED);

            //AUTH TLS
            FXP_CHECK_CASE_FOR_CONSTANT(CURLE_USE_SSL_FAILED);
            FXP_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CONNECT_ERROR);
            FXP_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CIPHER);
            FXP_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_SHUTDOWN_FAILED);

            //CURLOPT_QUOTE without '*' prefix
            FXP_CHECK_CASE_FOR_CONSTANT(CURLE_QUOTE_ERROR);
        default:
            break;
    }
    return replaceCpy<std::wstring>(L"Curl status %x", L"%x", numberTo<std::wstring>(static_cast<int>(sc)));
}
