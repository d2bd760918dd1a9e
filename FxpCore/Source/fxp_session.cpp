// *****************************************************************************
// * This file is part of the FxpCore project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "fxp_session.h"
#include <stdexcept>

using namespace fxp;


void FxpSession::close()
{
    if (progress_)
    {
        progress_->disconnect();
        progress_.reset();
    }
}


FxpSession fxp::negotiateFxpSession(FtpClient& source, FtpClient& target, bool trackProgress) //throw SysError, FtpCommandError, FtpMalformedResponse, ThreadStopRequest
{
    if (&source == &target)
        throw std::invalid_argument("FXP source and target must be different connections.");

    //owned from the moment it exists => released on failure and cancellation
    std::unique_ptr<FtpClient> progress;

    if (trackProgress)
    {
        interruptionPoint(); //throw ThreadStopRequest

        progress = target.clone();
        progress->connect(); //throw SysError, SysErrorPassword

        //snapshot: later directory changes on target are not mirrored
        const std::string targetDir = target.getWorkingDirectory(); //throw SysError
        progress->setWorkingDirectory(targetDir); //throw SysError, FtpCommandError
    }

    interruptionPoint(); //throw ThreadStopRequest
    source.setDataType(source.getConfig().fxpDataType); //throw SysError, FtpCommandError
    interruptionPoint(); //throw ThreadStopRequest
    target.setDataType(target.getConfig().fxpDataType); //

    interruptionPoint(); //throw ThreadStopRequest
    FtpReply pasvReply = target.execute("PASV"); //throw SysError
    interruptionPoint(); //throw ThreadStopRequest

    if (!pasvReply.success)
    {
        //glFTPd: "435 Failed TLS negotiation on data channel" => CPSV: target acts as TLS client on the data channel
        const FtpReply cpsvReply = target.execute("CPSV"); //throw SysError
        interruptionPoint(); //throw ThreadStopRequest

        if (!cpsvReply.success)
            throw FtpCommandError(pasvReply); //PASV error is the more telling one
        pasvReply = cpsvReply;
    }

    //malformed positive reply = protocol violation => no retry with CPSV
    const PasvEndpoint endpoint = parsePasvResponse(pasvReply.message); //throw FtpMalformedResponse

    interruptionPoint(); //throw ThreadStopRequest
    const FtpReply portReply = source.execute("PORT " + endpoint.literal); //throw SysError
    interruptionPoint(); //throw ThreadStopRequest

    if (!portReply.success)
        throw FtpCommandError(portReply);

    return FxpSession(source, target, std::move(progress), endpoint);
}


FxpNegotiationTask::FxpNegotiationTask(FtpClient& source, FtpClient& target, bool trackProgress)
{
    std::promise<FxpSession> promise;
    result_ = promise.get_future();

    worker_ = InterruptibleThread([promise = std::move(promise), &source, &target, trackProgress]() mutable
    {
        setCurrentThreadName("FXP negotiation");
        try
        {
            promise.set_value(negotiateFxpSession(source, target, trackProgress)); //throw SysError, ..., ThreadStopRequest
        }
        catch (...) { promise.set_exception(std::current_exception()); } //forward everything (incl. ThreadStopRequest) to get()
    });
}


FxpSession FxpNegotiationTask::get() //throw SysError, FtpCommandError, FtpMalformedResponse, ThreadStopRequest
{
    return result_.get();
}
