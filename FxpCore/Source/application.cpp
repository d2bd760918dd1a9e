// *****************************************************************************
// * This file is part of the FxpCore project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <iostream>
#include <fxp/extra_log.h>
#include "ftp/ftp_curl.h"
#include "fxp_session.h"
#include "return_codes.h"
#include "transfer_verifier.h"

using namespace fxp;


namespace
{
const char* optionProgress = "-progress";
const char* optionVerify   = "-verify";


void showSyntaxHelp()
{
    std::cout << "Syntax:\n"
              "  fxp_probe <source> <target> [-progress] [-verify <local file> <target file>]\n\n"
              "  <source>, <target>   ftp://[<user>[:<password>]@]<server>[:port]/<directory>[|ssl][|timeout=<sec>][|ascii]\n"
              "  -progress            open a third connection to the target for progress tracking\n"
              "  -verify              compare the target's checksum of a file against a local copy\n\n"
              "Negotiates a server-to-server (FXP) data connection: PASV (or CPSV) on the target, PORT on the source.\n";
}


struct CommandLine
{
    std::string sourcePhrase;
    std::string targetPhrase;
    bool trackProgress = false;
    std::optional<std::pair<std::string, std::string>> verifyPaths; //local, remote
};


std::optional<CommandLine> parseCommandLine(const std::vector<std::string>& commandArgs) //throw SysError
{
    auto isHelpRequest = [](const std::string& arg)
    {
        auto it = std::find_if(arg.begin(), arg.end(), [](char c) { return c != '/' && c != '-'; });
        if (it == arg.begin()) return false; //require at least one prefix character

        const std::string argTmp(it, arg.end());
        return equalAsciiNoCase(argTmp, "help") ||
               equalAsciiNoCase(argTmp, "h")    ||
               argTmp == "?";
    };

    auto isCommandLineOption = [&](const std::string& arg)
    {
        return equalAsciiNoCase(arg, optionProgress) ||
               equalAsciiNoCase(arg, optionVerify  ) ||
               isHelpRequest(arg);
    };

    CommandLine cmdLine;
    std::vector<std::string> phrases;

    for (auto it = commandArgs.begin(); it != commandArgs.end(); ++it)
        if (isHelpRequest(*it))
            return std::nullopt;
        else if (equalAsciiNoCase(*it, optionProgress))
            cmdLine.trackProgress = true;
        else if (equalAsciiNoCase(*it, optionVerify))
        {
            if (++it == commandArgs.end() || isCommandLineOption(*it))
                throw SysError(replaceCpy(L"A local and a remote file path are expected after %x.", L"%x", utfTo<std::wstring>(optionVerify)));
            const std::string localPath = *it;

            if (++it == commandArgs.end() || isCommandLineOption(*it))
                throw SysError(replaceCpy(L"A local and a remote file path are expected after %x.", L"%x", utfTo<std::wstring>(optionVerify)));
            cmdLine.verifyPaths = {localPath, *it};
        }
        else
            phrases.push_back(*it);

    if (phrases.size() != 2)
        throw SysError(L"Expected a source and a target FTP path.");

    cmdLine.sourcePhrase = phrases[0];
    cmdLine.targetPhrase = phrases[1];
    return cmdLine;
}


void connectClient(CurlFtpClient& client, const std::string& serverPath) //throw SysError
{
    client.connect(); //throw SysError, SysErrorPassword
    if (serverPath != "/")
        client.setWorkingDirectory(serverPath); //throw SysError, FtpCommandError
}


FxpExitCode runProbe(const CommandLine& cmdLine, ErrorLog& log) //throw SysError
{
    const FtpPathPhrase sourcePhrase = parseFtpPathPhrase(cmdLine.sourcePhrase); //throw SysError
    const FtpPathPhrase targetPhrase = parseFtpPathPhrase(cmdLine.targetPhrase); //

    CurlFtpClient source(sourcePhrase.cfg);
    CurlFtpClient target(targetPhrase.cfg);
    connectClient(source, sourcePhrase.serverPath); //throw SysError
    connectClient(target, targetPhrase.serverPath); //
    logMsg(log, L"Connected to " + utfTo<std::wstring>(sourcePhrase.cfg.server) + L" and " + utfTo<std::wstring>(targetPhrase.cfg.server), MSG_TYPE_INFO);

    FxpNegotiationTask task(source, target, cmdLine.trackProgress);
    FxpSession session = task.get(); //throw SysError, ThreadStopRequest

    logMsg(log, L"FXP data connection negotiated: " + utfTo<std::wstring>(session.getEndpoint().getHost()) + L':' +
           numberTo<std::wstring>(session.getEndpoint().getPort()), MSG_TYPE_INFO);
    if (FtpClient* progress = session.getProgress())
        logMsg(log, L"Progress connection open in " + utfTo<std::wstring>(progress->getWorkingDirectory()), MSG_TYPE_INFO); //throw SysError

    FxpExitCode exitCode = FxpExitCode::success;

    if (cmdLine.verifyPaths)
    {
        const VerificationOutcome outcome = verifyTransfer(cmdLine.verifyPaths->first, cmdLine.verifyPaths->second,
                                                           session.getTarget(), makeWarningSink(log)); //throw SysError
        const MessageType msgType = [&]
        {
            switch (outcome)
            {
                //*INDENT-OFF*
                case VerificationOutcome::verified: return MSG_TYPE_INFO;
                case VerificationOutcome::skipped:  return MSG_TYPE_WARNING; //server has no checksum command
                case VerificationOutcome::failed:   return MSG_TYPE_ERROR;
                //*INDENT-ON*
            }
            return MSG_TYPE_ERROR;
        }();
        logMsg(log, std::wstring(L"Verification: ") + getOutcomeLabel(outcome), msgType);

        if (outcome == VerificationOutcome::failed)
            raiseExitCode(exitCode, FxpExitCode::error);
    }

    session.close();
    return exitCode;
}
}


int main(int argc, char* argv[])
{
    setCurrentThreadName("Main thread");

    std::vector<std::string> commandArgs;
    for (int i = 1; i < argc; ++i)
        commandArgs.push_back(argv[i]);

    ftpInit(); //libcurl + OpenSSL
    FXP_ON_SCOPE_EXIT(ftpTeardown());

    ErrorLog log;
    FxpExitCode exitCode = FxpExitCode::success;
    try
    {
        const std::optional<CommandLine> cmdLine = parseCommandLine(commandArgs); //throw SysError
        if (!cmdLine)
        {
            showSyntaxHelp();
            return static_cast<int>(FxpExitCode::success);
        }

        raiseExitCode(exitCode, runProbe(*cmdLine, log)); //throw SysError
    }
    catch (const SysError& e)
    {
        logMsg(log, e.toString(), MSG_TYPE_ERROR);
        raiseExitCode(exitCode, FxpExitCode::error);
    }
    catch (ThreadStopRequest&)
    {
        logMsg(log, L"Stopped.", MSG_TYPE_WARNING);
        raiseExitCode(exitCode, FxpExitCode::cancelled);
    }
    catch (const std::exception& e)
    {
        logMsg(log, utfTo<std::wstring>(std::string(e.what())), MSG_TYPE_ERROR);
        raiseExitCode(exitCode, FxpExitCode::exception);
    }

    //errors that could not be reported otherwise
    for (const LogEntry& entry : fetchExtraLog())
        log.push_back(entry);

    const ErrorLogStats logStats = getStats(log);
    if (logStats.warning > 0)
        raiseExitCode(exitCode, FxpExitCode::warning);

    for (const LogEntry& entry : log)
        (entry.type == MSG_TYPE_INFO ? std::cout : std::cerr) << formatMessage(entry) << '\n';

    return static_cast<int>(exitCode);
}
