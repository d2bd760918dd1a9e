// *****************************************************************************
// * This file is part of the FxpCore project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FTP_CURL_H_6029183745610293847
#define FTP_CURL_H_6029183745610293847

#include <optional>
#include "ftp_client.h"


namespace fxp
{
//init libcurl (and OpenSSL) before use: call from main thread!
void ftpInit();
void ftpTeardown();


class FtpSession;

//FtpClient over a libcurl easy handle: libcurl owns socket and TLS, we send raw commands via CURLOPT_QUOTE
class CurlFtpClient : public FtpClient
{
public:
    explicit CurlFtpClient(const FtpClientConfig& cfg);
    ~CurlFtpClient();

    void connect() override; //throw SysError, SysErrorPassword
    bool isConnected() override; //throw SysError
    void disconnect() override;

    FtpReply execute(const std::string& ftpCmd) override; //throw SysError

    void setDataType(FtpDataType type) override; //throw SysError, FtpCommandError

    std::string getWorkingDirectory() override; //throw SysError
    void setWorkingDirectory(const std::string& serverPath) override; //throw SysError, FtpCommandError

    bool supportsChecksum() override; //throw SysError
    FtpHash getChecksum(const std::string& serverPath) override; //throw SysError

    std::unique_ptr<FtpClient> clone() const override;

    const FtpClientConfig& getConfig() const override { return cfg_; }

private:
    CurlFtpClient           (const CurlFtpClient&) = delete;
    CurlFtpClient& operator=(const CurlFtpClient&) = delete;

    FtpSession& getSession(); //throw SysError
    const FtpFeatures& getFeatures(); //throw SysError

    const FtpClientConfig cfg_;
    std::unique_ptr<FtpSession> session_; //= control connection
    std::optional<FtpFeatures> featureCache_;
};
}

#endif //FTP_CURL_H_6029183745610293847
