// *****************************************************************************
// * This file is part of the FxpCore project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FAKE_FTP_CLIENT_H_8102937465019283746
#define FAKE_FTP_CLIENT_H_8102937465019283746

#include <deque>
#include <functional>
#include <map>
#include <memory>
#include "ftp/ftp_client.h"


namespace fxp::test
{
//events of all fakes sharing one journal, in call order: "<name>: <event>"
using Journal = std::vector<std::string>;


//in-memory FtpClient: replies are scripted per command verb, unscripted commands get "502"
class FakeFtpClient : public FtpClient
{
public:
    FakeFtpClient(const std::string& name, const std::shared_ptr<Journal>& journal, const FtpClientConfig& cfg = {}) :
        name_(name), journal_(journal), cfg_(cfg) {}

    ~FakeFtpClient() override { record("destroyed"); }

    //raw server response text, e.g. "227 Entering Passive Mode (10,0,0,5,23,45)."
    void addReply(const std::string& verb, const std::string& rawReply) { replies_[verb].push_back(rawReply); }

    void setConnectError(const std::wstring& msg) { connectError_ = msg; }
    void setWorkingDirectoryRaw(const std::string& dir) { cwd_ = dir; }
    void setChecksumSupport(bool supported) { checksumSupported_ = supported; }
    void setChecksum(const FtpHash& hash) { checksum_ = hash; }

    //called before a scripted reply is returned: run on the negotiating thread
    void setOnExecute(const std::function<void(const std::string& cmd)>& onExecute) { onExecute_ = onExecute; }

    //configure clones before they are handed out
    void setOnClone(const std::function<void(FakeFtpClient& clone)>& onClone) { onClone_ = onClone; }

    int getSupportsChecksumCalls() const { return supportsChecksumCalls_; }
    int getGetChecksumCalls() const { return getChecksumCalls_; }
    const std::string& getName() const { return name_; }

    //--------------------------------------------------------------------------------------

    void connect() override
    {
        record("connect");
        if (!connectError_.empty())
            throw SysError(connectError_);
        connected_ = true;
    }

    bool isConnected() override { return connected_; }

    void disconnect() override
    {
        record("disconnect");
        connected_ = false;
    }

    FtpReply execute(const std::string& ftpCmd) override
    {
        record(ftpCmd);
        if (onExecute_)
            onExecute_(ftpCmd);

        const std::string verb(beforeFirst(ftpCmd, ' ', IfNotFoundReturn::all));
        auto it = replies_.find(verb);
        if (it == replies_.end() || it->second.empty())
            return parseFtpReply("502 Command not implemented.");

        const std::string rawReply = it->second.front();
        it->second.pop_front();
        return parseFtpReply(rawReply); //throw SysError
    }

    void setDataType(FtpDataType type) override
    {
        const FtpReply reply = execute(type == FtpDataType::binary ? "TYPE I" : "TYPE A");
        if (!reply.success)
            throw FtpCommandError(reply);
    }

    std::string getWorkingDirectory() override
    {
        record("PWD");
        return cwd_;
    }

    void setWorkingDirectory(const std::string& serverPath) override
    {
        const FtpReply reply = execute("CWD " + serverPath);
        if (!reply.success)
            throw FtpCommandError(reply);
        cwd_ = serverPath;
    }

    bool supportsChecksum() override
    {
        ++supportsChecksumCalls_;
        return checksumSupported_;
    }

    FtpHash getChecksum(const std::string& serverPath) override
    {
        ++getChecksumCalls_;
        record("checksum " + serverPath);
        return checksum_;
    }

    std::unique_ptr<FtpClient> clone() const override
    {
        journal_->push_back(name_ + ": clone");

        auto clone = std::make_unique<FakeFtpClient>(name_ + "-clone", journal_, cfg_);
        if (onClone_)
            onClone_(*clone);
        return clone;
    }

    const FtpClientConfig& getConfig() const override { return cfg_; }

private:
    void record(const std::string& event) { journal_->push_back(name_ + ": " + event); }

    const std::string name_;
    const std::shared_ptr<Journal> journal_;
    const FtpClientConfig cfg_;

    std::map<std::string, std::deque<std::string>> replies_;
    std::wstring connectError_;
    std::string cwd_ = "/";
    bool connected_ = true;

    bool checksumSupported_ = false;
    FtpHash checksum_;
    int supportsChecksumCalls_ = 0;
    int getChecksumCalls_ = 0;

    std::function<void(const std::string& cmd)> onExecute_;
    std::function<void(FakeFtpClient& clone)> onClone_;
};


inline
bool journalContains(const Journal& journal, const std::string& event)
{
    return std::find(journal.begin(), journal.end(), event) != journal.end();
}


inline
ptrdiff_t journalIndexOf(const Journal& journal, const std::string& event)
{
    auto it = std::find(journal.begin(), journal.end(), event);
    return it == journal.end() ? -1 : it - journal.begin();
}
}

#endif //FAKE_FTP_CLIENT_H_8102937465019283746
