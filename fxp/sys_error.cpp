// *****************************************************************************
// * This file is part of the FxpCore project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "sys_error.h"
    #include <glib.h>

using namespace fxp;


namespace
{
std::wstring formatSystemErrorCode(ErrorCode ec)
{
    switch (ec) //codes seen for local file access and socket I/O
    {
            FXP_CHECK_CASE_FOR_CONSTANT(EPERM);
            FXP_CHECK_CASE_FOR_CONSTANT(ENOENT);
            FXP_CHECK_CASE_FOR_CONSTANT(EINTR);
            FXP_CHECK_CASE_FOR_CONSTANT(EIO);
            FXP_CHECK_CASE_FOR_CONSTANT(ENXIO);
            FXP_CHECK_CASE_FOR_CONSTANT(EBADF);
            FXP_CHECK_CASE_FOR_CONSTANT(EAGAIN);
            FXP_CHECK_CASE_FOR_CONSTANT(ENOMEM);
            FXP_CHECK_CASE_FOR_CONSTANT(EACCES);
            FXP_CHECK_CASE_FOR_CONSTANT(EFAULT);
            FXP_CHECK_CASE_FOR_CONSTANT(EBUSY);
            FXP_CHECK_CASE_FOR_CONSTANT(EEXIST);
            FXP_CHECK_CASE_FOR_CONSTANT(ENODEV);
            FXP_CHECK_CASE_FOR_CONSTANT(ENOTDIR);
            FXP_CHECK_CASE_FOR_CONSTANT(EISDIR);
            FXP_CHECK_CASE_FOR_CONSTANT(EINVAL);
            FXP_CHECK_CASE_FOR_CONSTANT(ENFILE);
            FXP_CHECK_CASE_FOR_CONSTANT(EMFILE);
            FXP_CHECK_CASE_FOR_CONSTANT(EFBIG);
            FXP_CHECK_CASE_FOR_CONSTANT(ENOSPC);
            FXP_CHECK_CASE_FOR_CONSTANT(EROFS);
            FXP_CHECK_CASE_FOR_CONSTANT(EPIPE);
            FXP_CHECK_CASE_FOR_CONSTANT(ENAMETOOLONG);
            FXP_CHECK_CASE_FOR_CONSTANT(ENOSYS);
            FXP_CHECK_CASE_FOR_CONSTANT(ELOOP);
            FXP_CHECK_CASE_FOR_CONSTANT(EOVERFLOW);
            FXP_CHECK_CASE_FOR_CONSTANT(EILSEQ);
            FXP_CHECK_CASE_FOR_CONSTANT(ENOTSOCK);
            FXP_CHECK_CASE_FOR_CONSTANT(EPROTO);
            FXP_CHECK_CASE_FOR_CONSTANT(ENOTSUP);
            FXP_CHECK_CASE_FOR_CONSTANT(EADDRINUSE);
            FXP_CHECK_CASE_FOR_CONSTANT(EADDRNOTAVAIL);
            FXP_CHECK_CASE_FOR_CONSTANT(ENETDOWN);
            FXP_CHECK_CASE_FOR_CONSTANT(ENETUNREACH);
            FXP_CHECK_CASE_FOR_CONSTANT(ENETRESET);
            FXP_CHECK_CASE_FOR_CONSTANT(ECONNABORTED);
            FXP_CHECK_CASE_FOR_CONSTANT(ECONNRESET);
            FXP_CHECK_CASE_FOR_CONSTANT(ENOBUFS);
            FXP_CHECK_CASE_FOR_CONSTANT(EISCONN);
            FXP_CHECK_CASE_FOR_CONSTANT(ENOTCONN);
            FXP_CHECK_CASE_FOR_CONSTANT(ETIMEDOUT);
            FXP_CHECK_CASE_FOR_CONSTANT(ECONNREFUSED);
            FXP_CHECK_CASE_FOR_CONSTANT(EHOSTDOWN);
            FXP_CHECK_CASE_FOR_CONSTANT(EHOSTUNREACH);
            FXP_CHECK_CASE_FOR_CONSTANT(EALREADY);
            FXP_CHECK_CASE_FOR_CONSTANT(EINPROGRESS);
            FXP_CHECK_CASE_FOR_CONSTANT(ESTALE);
            FXP_CHECK_CASE_FOR_CONSTANT(ECANCELED);
        default:
            return replaceCpy(L"Error code %x", L"%x", numberTo<std::wstring>(ec));
    }
}
}


std::wstring fxp::getSystemErrorDescription(ErrorCode ec) //return empty string on error
{
    const ErrorCode ecCurrent = getLastError(); //not necessarily == ec
    FXP_ON_SCOPE_EXIT(errno = ecCurrent);

    //g_strerror() vs strerror(): "marginally improves thread safety, and marginally improves consistency"
    return trimCpy(utfTo<std::wstring>(std::string(::g_strerror(ec))));
}


std::wstring fxp::formatSystemError(const std::string& functionName, ErrorCode ec)
{
    return formatSystemError(functionName, formatSystemErrorCode(ec), getSystemErrorDescription(ec));
}


std::wstring fxp::formatSystemError(const std::string& functionName, const std::wstring& errorCode, const std::wstring& errorMsg)
{
    std::wstring output = trimCpy(errorCode);

    const std::wstring errorMsgFmt = trimCpy(errorMsg);
    if (!output.empty() && !errorMsgFmt.empty())
        output += L": ";

    output += errorMsgFmt;

    if (!functionName.empty())
        output += L" [" + utfTo<std::wstring>(functionName) + L']';

    return trimCpy(output);
}
