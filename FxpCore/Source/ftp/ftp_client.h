// *****************************************************************************
// * This file is part of the FxpCore project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FTP_CLIENT_H_4610293857102938475
#define FTP_CLIENT_H_4610293857102938475

#include <memory>
#include "ftp_common.h"
#include "ftp_hash.h"


namespace fxp
{
//one FTP control connection; not thread-safe: callers serialize access to an instance
class FtpClient
{
public:
    virtual ~FtpClient() {}

    virtual void connect() = 0; //throw SysError, SysErrorPassword
    virtual bool isConnected() = 0; //throw SysError
    virtual void disconnect() = 0; //nothrow

    //returns the server's reply, positive or negative; throws only if there is no reply at all
    virtual FtpReply execute(const std::string& ftpCmd) = 0; //throw SysError

    virtual void setDataType(FtpDataType type) = 0; //throw SysError, FtpCommandError

    virtual std::string getWorkingDirectory() = 0; //throw SysError
    virtual void setWorkingDirectory(const std::string& serverPath) = 0; //throw SysError, FtpCommandError

    virtual bool supportsChecksum() = 0; //throw SysError
    virtual FtpHash getChecksum(const std::string& serverPath) = 0; //throw SysError

    //new client with an identical (copied) configuration but its own, not yet connected control connection
    virtual std::unique_ptr<FtpClient> clone() const = 0;

    virtual const FtpClientConfig& getConfig() const = 0;
};
}

#endif //FTP_CLIENT_H_4610293857102938475
