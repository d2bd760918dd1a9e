// *****************************************************************************
// * This file is part of the FxpCore project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef TRANSFER_VERIFIER_H_5610293847561029384
#define TRANSFER_VERIFIER_H_5610293847561029384

#include <functional>
#include <fxp/error_log.h>
#include "ftp/ftp_client.h"


namespace fxp
{
enum class VerificationOutcome
{
    skipped,  //server has no checksum command: not an error
    verified,
    failed,   //mismatch, unusable remote digest, or local file not readable
};

const wchar_t* getOutcomeLabel(VerificationOutcome outcome);

using WarningSink = std::function<void(const std::wstring& msg)>; //nothrow

WarningSink makeWarningSink(ErrorLog& log); //log must outlive the sink

/*  compare a transferred file against the server's checksum of its copy

    - blank path: std::invalid_argument, before any server access
    - local read errors: reported once via logWarning => failed
    - connection errors: SysError propagates                                */
VerificationOutcome verifyTransfer(const std::string& localPath,
                                   const std::string& remotePath,
                                   FtpClient& client,
                                   const WarningSink& logWarning); //throw SysError
}

#endif //TRANSFER_VERIFIER_H_5610293847561029384
