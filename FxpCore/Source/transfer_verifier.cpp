// *****************************************************************************
// * This file is part of the FxpCore project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "transfer_verifier.h"
#include <stdexcept>

using namespace fxp;


namespace
{
bool isBlank(const std::string& str)
{
    return trimCpy(str).empty();
}
}


const wchar_t* fxp::getOutcomeLabel(VerificationOutcome outcome)
{
    switch (outcome)
    {
        case VerificationOutcome::skipped:
            return L"Skipped";
        case VerificationOutcome::verified:
            return L"Verified";
        case VerificationOutcome::failed:
            return L"Failed";
    }
    assert(false);
    return L"";
}


WarningSink fxp::makeWarningSink(ErrorLog& log)
{
    return [&log](const std::wstring& msg) { logMsg(log, msg, MSG_TYPE_WARNING); };
}


VerificationOutcome fxp::verifyTransfer(const std::string& localPath,
                                        const std::string& remotePath,
                                        FtpClient& client,
                                        const WarningSink& logWarning) //throw SysError
{
    if (isBlank(localPath))
        throw std::invalid_argument("Required parameter is blank: localPath");
    if (isBlank(remotePath))
        throw std::invalid_argument("Required parameter is blank: remotePath");

    if (!client.supportsChecksum()) //throw SysError
        return VerificationOutcome::skipped;

    const FtpHash hash = client.getChecksum(remotePath); //throw SysError
    if (!hash.isValid())
        return VerificationOutcome::failed;

    try
    {
        return hash.verify(localPath) ? VerificationOutcome::verified : VerificationOutcome::failed; //throw FileError
    }
    catch (const FileError& e)
    {
        if (logWarning)
            logWarning(replaceCpy(L"Cannot verify file %x.", L"%x", fmtPath(localPath)) + L"\n\n" + e.toString());
        return VerificationOutcome::failed;
    }
}
