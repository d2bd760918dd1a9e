// *****************************************************************************
// * This file is part of the FxpCore project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FXP_SESSION_H_3019284756102938475
#define FXP_SESSION_H_3019284756102938475

#include <future>
#include <fxp/thread.h>
#include "ftp/ftp_client.h"
#include "ftp/pasv_parser.h"


namespace fxp
{
/*  connections taking part in one server-to-server transfer:
    - source and target: borrowed from the caller, must outlive the session
    - progress (optional): third connection to the target for monitoring; owned by the session */
class FxpSession
{
public:
    FxpSession(FtpClient& source, FtpClient& target, std::unique_ptr<FtpClient>&& progress, const PasvEndpoint& endpoint) :
        source_(&source), target_(&target), progress_(std::move(progress)), endpoint_(endpoint) {}

    FxpSession           (FxpSession&&) noexcept = default;
    FxpSession& operator=(FxpSession&&) noexcept = default;

    FtpClient& getSource() { return *source_; }
    FtpClient& getTarget() { return *target_; }
    FtpClient* getProgress() { return progress_.get(); } //nullptr if not tracking progress

    const PasvEndpoint& getEndpoint() const { return endpoint_; } //where the source sends the data

    //release the progress connection early; otherwise done by ~FxpSession()
    void close();

private:
    FxpSession           (const FxpSession&) = delete;
    FxpSession& operator=(const FxpSession&) = delete;

    FtpClient* source_;
    FtpClient* target_;
    std::unique_ptr<FtpClient> progress_;
    PasvEndpoint endpoint_;
};


/*  prepare a server-to-server transfer:
        1. (optional) progress connection: clone of target, connected, same working directory
        2. FXP data type on source, then target
        3. PASV on target, CPSV if PASV is refused
        4. PORT on source with the endpoint literal from 3.

    source and target must be connected, logged in, and distinct.
    No rollback: a failure leaves the data type as it was set so far.
    Runs on the caller's thread; cancellable when called on an InterruptibleThread.     */
FxpSession negotiateFxpSession(FtpClient& source, FtpClient& target, bool trackProgress); //throw SysError, FtpCommandError, FtpMalformedResponse, ThreadStopRequest


//negotiateFxpSession() on a worker thread
class FxpNegotiationTask
{
public:
    FxpNegotiationTask(FtpClient& source, FtpClient& target, bool trackProgress);

    void requestStop() { worker_.requestStop(); } //=> get() throws ThreadStopRequest unless negotiation already finished

    bool isReady() const { return result_.wait_for(std::chrono::seconds(0)) == std::future_status::ready; }

    //call once; blocks until the worker is done
    FxpSession get(); //throw SysError, FtpCommandError, FtpMalformedResponse, ThreadStopRequest

private:
    FxpNegotiationTask           (const FxpNegotiationTask&) = delete;
    FxpNegotiationTask& operator=(const FxpNegotiationTask&) = delete;

    std::future<FxpSession> result_;
    InterruptibleThread worker_; //declare last: join before result_ goes away
};
}

#endif //FXP_SESSION_H_3019284756102938475
