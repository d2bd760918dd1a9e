// *****************************************************************************
// * This file is part of the FxpCore project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <gtest/gtest.h>
#include "fxp_session.h"
#include "fake_ftp_client.h"

using namespace fxp;
using namespace fxp::test;


namespace
{
class FxpSessionTest : public ::testing::Test
{
protected:
    FxpSessionTest() :
        source_("source", journal_),
        target_("target", journal_)
    {
        source_.addReply("TYPE", "200 Type set to I");
        target_.addReply("TYPE", "200 Type set to I");
    }

    std::vector<std::string> commandsOf(const std::string& name) const
    {
        std::vector<std::string> output;
        for (const std::string& event : *journal_)
            if (startsWith(event, name + ": "))
                output.push_back(event.substr(name.size() + 2));
        return output;
    }

    std::shared_ptr<Journal> journal_ = std::make_shared<Journal>();
    FakeFtpClient source_;
    FakeFtpClient target_;
};
}


TEST_F(FxpSessionTest, PasvAndPort)
{
    target_.addReply("PASV", "227 Entering Passive Mode (10,0,0,5,23,45).");
    source_.addReply("PORT", "200 PORT command successful");

    FxpSession session = negotiateFxpSession(source_, target_, false /*trackProgress*/);

    EXPECT_EQ(&session.getSource(), &source_);
    EXPECT_EQ(&session.getTarget(), &target_);
    EXPECT_EQ(session.getProgress(), nullptr);
    EXPECT_EQ(session.getEndpoint().getPort(), 5933);

    EXPECT_EQ(commandsOf("source"), (std::vector<std::string>{"TYPE I", "PORT 10,0,0,5,23,45"}));
    EXPECT_EQ(commandsOf("target"), (std::vector<std::string>{"TYPE I", "PASV"}));

    //data type: source first, then target; PASV before PORT
    EXPECT_LT(journalIndexOf(*journal_, "source: TYPE I"), journalIndexOf(*journal_, "target: TYPE I"));
    EXPECT_LT(journalIndexOf(*journal_, "target: PASV"), journalIndexOf(*journal_, "source: PORT 10,0,0,5,23,45"));
}


TEST_F(FxpSessionTest, ConfiguredDataType)
{
    FtpClientConfig asciiCfg;
    asciiCfg.fxpDataType = FtpDataType::ascii;
    FakeFtpClient source("source-ascii", journal_, asciiCfg);
    FakeFtpClient target("target-ascii", journal_, asciiCfg);
    source.addReply("TYPE", "200 Type set to A");
    target.addReply("TYPE", "200 Type set to A");
    target.addReply("PASV", "227 (1,2,3,4,5,6)");
    source.addReply("PORT", "200 OK");

    negotiateFxpSession(source, target, false);

    EXPECT_TRUE(journalContains(*journal_, "source-ascii: TYPE A"));
    EXPECT_TRUE(journalContains(*journal_, "target-ascii: TYPE A"));
}


TEST_F(FxpSessionTest, CpsvFallback)
{
    target_.addReply("PASV", "435 Failed TLS negotiation on data channel");
    target_.addReply("CPSV", "227 Entering Passive Mode (192,168,1,20,195,80)");
    source_.addReply("PORT", "200 PORT command successful");

    FxpSession session = negotiateFxpSession(source_, target_, false);

    EXPECT_EQ(commandsOf("target"), (std::vector<std::string>{"TYPE I", "PASV", "CPSV"}));
    EXPECT_TRUE(journalContains(*journal_, "source: PORT 192,168,1,20,195,80")); //literal of the CPSV reply
    EXPECT_EQ(session.getEndpoint().literal, "192,168,1,20,195,80");
}


TEST_F(FxpSessionTest, PasvAndCpsvFail)
{
    target_.addReply("PASV", "435 Failed TLS negotiation on data channel");
    target_.addReply("CPSV", "500 Unknown command");

    try
    {
        negotiateFxpSession(source_, target_, false);
        FAIL() << "exception expected";
    }
    catch (const FtpCommandError& e)
    {
        //PASV reply is reported, not the CPSV one
        EXPECT_EQ(e.getReply().code, 435);
        EXPECT_EQ(e.getReply().message, "Failed TLS negotiation on data channel");
    }
    EXPECT_FALSE(journalContains(*journal_, "source: PORT 10,0,0,5,23,45"));
    EXPECT_EQ(commandsOf("source"), (std::vector<std::string>{"TYPE I"}));
}


TEST_F(FxpSessionTest, MalformedPasvReply)
{
    target_.addReply("PASV", "227 Entering Passive Mode (10,0,0,5,23)");

    EXPECT_THROW(negotiateFxpSession(source_, target_, false), FtpMalformedResponse);

    //no recovery attempt: neither CPSV nor PORT
    EXPECT_EQ(commandsOf("target"), (std::vector<std::string>{"TYPE I", "PASV"}));
    EXPECT_EQ(commandsOf("source"), (std::vector<std::string>{"TYPE I"}));
}


TEST_F(FxpSessionTest, PortFails)
{
    target_.addReply("PASV", "227 Entering Passive Mode (10,0,0,5,23,45).");
    source_.addReply("PORT", "500 Illegal PORT command");

    try
    {
        negotiateFxpSession(source_, target_, false);
        FAIL() << "exception expected";
    }
    catch (const FtpCommandError& e)
    {
        EXPECT_EQ(e.getReply().code, 500);
    }
}


TEST_F(FxpSessionTest, DataTypeFails)
{
    FakeFtpClient target("target-notype", journal_);
    target.addReply("TYPE", "504 Command not implemented for that parameter");

    EXPECT_THROW(negotiateFxpSession(source_, target, false), FtpCommandError);

    //no rollback of the source's data type, no PASV
    EXPECT_TRUE(journalContains(*journal_, "source: TYPE I"));
    EXPECT_FALSE(journalContains(*journal_, "target-notype: PASV"));
}


TEST_F(FxpSessionTest, SameClientTwice)
{
    EXPECT_THROW(negotiateFxpSession(source_, source_, false), std::invalid_argument);
    EXPECT_TRUE(journal_->empty());
}


TEST_F(FxpSessionTest, ProgressConnection)
{
    target_.setWorkingDirectoryRaw("/incoming/today");
    target_.setOnClone([](FakeFtpClient& clone) { clone.addReply("CWD", "250 Directory changed"); });
    target_.addReply("PASV", "227 Entering Passive Mode (10,0,0,5,23,45).");
    source_.addReply("PORT", "200 PORT command successful");

    FxpSession session = negotiateFxpSession(source_, target_, true /*trackProgress*/);

    ASSERT_NE(session.getProgress(), nullptr);
    EXPECT_EQ(session.getProgress()->getWorkingDirectory(), "/incoming/today");
    EXPECT_TRUE(session.getProgress()->isConnected());

    //progress connection is set up before any data type is touched
    EXPECT_LT(journalIndexOf(*journal_, "target-clone: CWD /incoming/today"), journalIndexOf(*journal_, "source: TYPE I"));
    EXPECT_EQ(commandsOf("target-clone"), (std::vector<std::string>{"connect", "CWD /incoming/today", "PWD"}));

    //snapshot: later changes on target are not mirrored
    target_.setWorkingDirectoryRaw("/elsewhere");
    EXPECT_EQ(session.getProgress()->getWorkingDirectory(), "/incoming/today");

    session.close();
    EXPECT_EQ(session.getProgress(), nullptr);
    EXPECT_TRUE(journalContains(*journal_, "target-clone: disconnect"));
    EXPECT_TRUE(journalContains(*journal_, "target-clone: destroyed"));
}


TEST_F(FxpSessionTest, ProgressConnectFails)
{
    target_.setOnClone([](FakeFtpClient& clone) { clone.setConnectError(L"Connection refused"); });
    target_.addReply("PASV", "227 Entering Passive Mode (10,0,0,5,23,45).");

    EXPECT_THROW(negotiateFxpSession(source_, target_, true), SysError);

    //fatal: no fallback to negotiating without progress tracking
    EXPECT_TRUE(commandsOf("source").empty());
    EXPECT_EQ(commandsOf("target"), (std::vector<std::string>{"clone"}));
    EXPECT_TRUE(journalContains(*journal_, "target-clone: destroyed"));
}


TEST_F(FxpSessionTest, ProgressCwdFails)
{
    target_.setWorkingDirectoryRaw("/gone");
    target_.setOnClone([](FakeFtpClient& clone) { clone.addReply("CWD", "550 No such directory"); });

    EXPECT_THROW(negotiateFxpSession(source_, target_, true), FtpCommandError);
    EXPECT_TRUE(journalContains(*journal_, "target-clone: destroyed"));
    EXPECT_TRUE(commandsOf("source").empty());
}


TEST_F(FxpSessionTest, ProgressReleasedOnLaterFailure)
{
    target_.setOnClone([](FakeFtpClient& clone) { clone.addReply("CWD", "250 OK"); });
    target_.addReply("PASV", "227 Entering Passive Mode (10,0,0,5,23,45).");
    source_.addReply("PORT", "425 Can't open data connection");

    EXPECT_THROW(negotiateFxpSession(source_, target_, true), FtpCommandError);
    EXPECT_TRUE(journalContains(*journal_, "target-clone: destroyed"));
}


TEST_F(FxpSessionTest, SessionIsMovable)
{
    target_.setOnClone([](FakeFtpClient& clone) { clone.addReply("CWD", "250 OK"); });
    target_.addReply("PASV", "227 (10,0,0,5,23,45)");
    source_.addReply("PORT", "200 OK");

    FxpSession session = negotiateFxpSession(source_, target_, true);
    FtpClient* progress = session.getProgress();

    FxpSession moved = std::move(session);
    EXPECT_EQ(moved.getProgress(), progress);
    EXPECT_FALSE(journalContains(*journal_, "target-clone: destroyed"));
}

//------------------------------------------------------------------------------------------

TEST_F(FxpSessionTest, TaskDeliversSession)
{
    target_.addReply("PASV", "227 Entering Passive Mode (10,0,0,5,23,45).");
    source_.addReply("PORT", "200 PORT command successful");

    FxpNegotiationTask task(source_, target_, false);
    FxpSession session = task.get();

    EXPECT_EQ(session.getEndpoint().literal, "10,0,0,5,23,45");
    EXPECT_EQ(commandsOf("source"), (std::vector<std::string>{"TYPE I", "PORT 10,0,0,5,23,45"}));
}


TEST_F(FxpSessionTest, TaskForwardsErrors)
{
    target_.addReply("PASV", "421 Service not available");
    target_.addReply("CPSV", "421 Service not available");

    FxpNegotiationTask task(source_, target_, false);
    EXPECT_THROW(task.get(), FtpCommandError);
}


TEST_F(FxpSessionTest, TaskCancellation)
{
    std::promise<void> pasvSent;
    target_.setOnClone([](FakeFtpClient& clone) { clone.addReply("CWD", "250 OK"); });
    target_.setOnExecute([&](const std::string& cmd)
    {
        if (cmd == "PASV")
        {
            pasvSent.set_value();
            //"waiting for the server" until the caller gives up
            while (!interruptionRequested())
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });
    target_.addReply("PASV", "227 Entering Passive Mode (10,0,0,5,23,45).");
    source_.addReply("PORT", "200 PORT command successful");

    FxpNegotiationTask task(source_, target_, true);
    pasvSent.get_future().wait();
    task.requestStop();

    EXPECT_THROW(task.get(), ThreadStopRequest);

    //stopped before PORT; progress connection not leaked
    EXPECT_FALSE(journalContains(*journal_, "source: PORT 10,0,0,5,23,45"));
    EXPECT_TRUE(journalContains(*journal_, "target-clone: destroyed"));
}


TEST_F(FxpSessionTest, BlockingModeIgnoresCancellation)
{
    //no InterruptibleThread => interruption points are no-ops
    target_.addReply("PASV", "227 Entering Passive Mode (10,0,0,5,23,45).");
    source_.addReply("PORT", "200 PORT command successful");

    EXPECT_FALSE(interruptionRequested());
    EXPECT_NO_THROW(negotiateFxpSession(source_, target_, false));
}
