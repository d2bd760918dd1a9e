// *****************************************************************************
// * This file is part of the FxpCore project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ftp_common.h"
#include <fxp/file_error.h>

using namespace fxp;


namespace
{
//"ddd " or "ddd" => final line of a reply; "ddd-" => first line of a multi-line reply: https://tools.ietf.org/html/rfc959#section-4.2
bool isStatusLine(std::string_view line, char separator)
{
    return line.size() >= 3 &&
           std::all_of(line.begin(), line.begin() + 3, [](char c) { return isDigit(c); }) &&
           (line.size() == 3 ? separator == ' ' : line[3] == separator);
}


std::string_view getStatusText(std::string_view line)
{
    return line.size() > 4 ? line.substr(4) : std::string_view();
}


HashAlgorithm parseHashAlgorithmName(std::string_view name)
{
    if (equalAsciiNoCase(name, "SHA-1"  )) return HashAlgorithm::sha1;
    if (equalAsciiNoCase(name, "SHA-256")) return HashAlgorithm::sha256;
    if (equalAsciiNoCase(name, "SHA-512")) return HashAlgorithm::sha512;
    if (equalAsciiNoCase(name, "MD5"    )) return HashAlgorithm::md5;
    if (equalAsciiNoCase(name, "CRC32"  )) return HashAlgorithm::crc;
    return HashAlgorithm::none;
}
}


uint16_t fxp::getEffectivePort(const FtpClientConfig& cfg) //throw SysError
{
    if (cfg.portCfg == 0)
        return DEFAULT_PORT_FTP;

    if (cfg.portCfg < 1 || cfg.portCfg > 65535)
        throw SysError(replaceCpy(L"Invalid port number %x.", L"%x", numberTo<std::wstring>(cfg.portCfg)));

    return static_cast<uint16_t>(cfg.portCfg);
}


FtpPathPhrase fxp::parseFtpPathPhrase(const std::string& pathPhrase) //throw SysError
{
    std::string_view phrase = pathPhrase;
    phrase = phrase.substr(std::min(phrase.find_first_not_of(" \t"), phrase.size()));

    if (!startsWithAsciiNoCase(phrase, "ftp:"))
        throw SysError(replaceCpy(L"Invalid FTP path phrase %x.", L"%x", fmtPath(pathPhrase)));
    phrase.remove_prefix(4);
    phrase = phrase.substr(std::min(phrase.find_first_not_of("/\\"), phrase.size()));

    //password may contain '@' => split at last one before the path
    const std::string_view serverPathOpt0 = beforeFirst(phrase, '/', IfNotFoundReturn::all);
    const size_t posAt = serverPathOpt0.rfind('@');

    const std::string_view credentials = posAt == std::string_view::npos ? std::string_view() : phrase.substr(0, posAt);
    const std::string_view fullPathOpt = posAt == std::string_view::npos ? phrase : phrase.substr(posAt + 1);

    FtpPathPhrase output;
    output.cfg.username = std::string(beforeFirst(credentials, ':', IfNotFoundReturn::all));
    output.cfg.password = std::string( afterFirst(credentials, ':', IfNotFoundReturn::none));

    const std::string_view fullPath = beforeFirst(fullPathOpt, '|', IfNotFoundReturn::all);
    const std::string_view options  =  afterFirst(fullPathOpt, '|', IfNotFoundReturn::none);

    const size_t posPath = fullPath.find('/');
    const std::string_view serverPort = fullPath.substr(0, std::min(posPath, fullPath.size()));
    if (posPath != std::string_view::npos)
        output.serverPath = trimCpy(std::string(fullPath.substr(posPath)));

    //"[::1]:2121" or "host:21"
    std::string_view server = serverPort;
    std::string_view port;
    if (const size_t posColon = serverPort.rfind(':');
        posColon != std::string_view::npos && serverPort.find(']', posColon) == std::string_view::npos)
    {
        server = serverPort.substr(0, posColon);
        port   = serverPort.substr(posColon + 1);
    }
    if (startsWith(server, "[") && endsWith(server, "]"))
        server = server.substr(1, server.size() - 2);

    output.cfg.server = trimCpy(std::string(server));

    if (!port.empty()) //else: default port
    {
        if (port.size() > 5 || !std::all_of(port.begin(), port.end(), [](char c) { return isDigit(c); }))
            throw SysError(replaceCpy(L"Invalid port number %x.", L"%x", fmtPath(std::string(port))));

        output.cfg.portCfg = stringTo<int>(port);
        if (output.cfg.portCfg < 1 || output.cfg.portCfg > 65535)
            throw SysError(replaceCpy(L"Invalid port number %x.", L"%x", fmtPath(std::string(port))));
    }

    if (output.cfg.server.empty())
        throw SysError(replaceCpy(L"Server name must not be empty. (%x)", L"%x", fmtPath(pathPhrase)));

    split2(options, [](char c) { return c == '|'; }, [&](std::string_view optPhrase)
    {
        const std::string opt = trimCpy(std::string(optPhrase));
        if (!opt.empty())
        {
            if (startsWith(opt, "timeout="))
                output.cfg.timeoutSec = std::max(1, stringTo<int>(afterFirst(opt, '=', IfNotFoundReturn::none)));
            else if (opt == "ssl")
                output.cfg.useTls = true;
            else if (opt == "ascii")
                output.cfg.fxpDataType = FtpDataType::ascii;
            else
                throw SysError(replaceCpy(L"Unknown option %x.", L"%x", fmtPath(opt)));
        }
    });
    return output;
}


std::vector<std::string_view> fxp::splitFtpResponse(const std::string& buf)
{
    std::vector<std::string_view> lines;

    split2(buf, [](char c) { return isLineBreak(c) || c == '\0'; },
    [&lines](const std::string_view block)
    {
        if (!block.empty()) //consider Windows' <CR><LF>
            lines.push_back(block);
    });

    return lines;
}


FtpReply fxp::parseFtpReply(const std::string& responseText) //throw SysError
{
    const std::vector<std::string_view> lines = splitFtpResponse(responseText);

    auto itLast = std::find_if(lines.rbegin(), lines.rend(), [](std::string_view line) { return isStatusLine(line, ' '); });
    if (itLast == lines.rend())
        throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(responseText) + L')');

    const std::string_view statusLine = *itLast;
    const std::string_view code = statusLine.substr(0, 3);

    FtpReply reply;
    reply.code    = stringTo<int>(code);
    reply.message = trimCpy(std::string(getStatusText(statusLine)));
    reply.success = 100 <= reply.code && reply.code < 400; //1yz, 2yz, 3yz

    //multi-line: "ddd-first line" ... "ddd last line"
    //don't walk into the preceding reply
    auto itFirst = lines.rend();
    for (auto it = itLast + 1; it != lines.rend() && !isStatusLine(*it, ' '); ++it)
        if (isStatusLine(*it, '-') && startsWith(*it, code))
        {
            itFirst = it;
            break;
        }

    if (itFirst != lines.rend())
        for (auto it = itFirst.base() - 1; it != itLast.base() - 1; ++it)
        {
            std::string_view infoLine = *it;
            if (startsWith(infoLine, code) && isStatusLine(infoLine, '-'))
                infoLine = getStatusText(infoLine);

            reply.infoMessages.push_back(trimCpy(std::string(infoLine)));
        }

    return reply;
}


std::wstring fxp::formatFtpStatus(int sc)
{
    const wchar_t* statusText = [&] //https://en.wikipedia.org/wiki/List_of_FTP_server_return_codes
    {
        switch (sc)
        {
            //*INDENT-OFF*
            case 227: return L"Entering Passive Mode.";
            case 400: return L"The command was not accepted but the error condition is temporary.";
            case 421: return L"Service not available, closing control connection.";
            case 425: return L"Cannot open data connection.";
            case 426: return L"Connection closed; transfer aborted.";
            case 430: return L"Invalid username or password.";
            case 434: return L"Requested host unavailable.";
            case 435: return L"Failed TLS negotiation on data channel."; //glFTPd: PASV with TLS-protected data channel => use CPSV
            case 450: return L"Requested file action not taken.";
            case 451: return L"Local error in processing.";
            case 452: return L"Insufficient storage space in system. File unavailable, e.g. file busy.";

            case 500: return L"Syntax error, command unrecognized or command line too long.";
            case 501: return L"Syntax error in parameters or arguments.";
            case 502: return L"Command not implemented.";
            case 503: return L"Bad sequence of commands.";
            case 504: return L"Command not implemented for that parameter.";
            case 521: return L"Data connection cannot be opened with this PROT setting.";
            case 522: return L"Server does not support the requested network protocol.";
            case 530: return L"User not logged in.";
            case 534: return L"Could not connect to server; issue regarding SSL.";
            case 550: return L"File unavailable, e.g. file not found, no access.";
            case 553: return L"File name not allowed.";

            default:  return L"";
            //*INDENT-ON*
        }
    }();

    if (std::wstring_view(statusText).empty())
        return trimCpy(replaceCpy<std::wstring>(L"FTP status %x.", L"%x", numberTo<std::wstring>(sc)));
    else
        return trimCpy(replaceCpy<std::wstring>(L"FTP status %x: ", L"%x", numberTo<std::wstring>(sc)) + statusText);
}


FtpFeatures fxp::parseFeatResponse(const std::string& featResponse)
{
    FtpFeatures output; //FEAT command: https://tools.ietf.org/html/rfc2389#page-4
    std::vector<std::string_view> lines = splitFtpResponse(featResponse);

    auto it = std::find_if(lines.begin(), lines.end(), [](std::string_view line) { return startsWith(line, "211-") || startsWith(line, "211 "); });
    if (it != lines.end())
    {
        ++it;
        for (; it != lines.end(); ++it)
        {
            if (equalAsciiNoCase     (*it, "211 End") || //Serv-U: "211 End (for details use "HELP commmand" where command is the command of interest)"
                startsWithAsciiNoCase(*it, "211 End "))  //Home Ftp Server: "211 End of extentions."
                break;

            std::string line(*it);
            //suppport ProFTPD with "MultilineRFC2228 = on"
            if (startsWith(line, "211-"))
                line = ' ' + std::string(afterFirst(line, '-', IfNotFoundReturn::none));

            //feature name is case-insensitive, parameters follow after a space
            const std::string feature = std::string(beforeFirst(trimCpy(line), ' ', IfNotFoundReturn::all));
            const std::string params  = trimCpy(std::string(afterFirst(trimCpy(line), ' ', IfNotFoundReturn::none)));

            //https://tools.ietf.org/html/draft-bryan-ftpext-hash-02#section-3.1: "HASH SHA-1;SHA-256*;MD5"
            if (equalAsciiNoCase(feature, "HASH"))
            {
                output.hash = true;
                split2(params, [](char c) { return c == ';'; }, [&](std::string_view algoName)
                {
                    const bool selected = endsWith(algoName, "*");
                    if (selected)
                        algoName.remove_suffix(1);

                    if (const HashAlgorithm algo = parseHashAlgorithmName(algoName);
                        algo != HashAlgorithm::none)
                    {
                        output.hashAlgorithms.push_back(algo);
                        if (selected)
                            output.hashAlgorithmSelected = algo;
                    }
                });
            }
            else if (equalAsciiNoCase(feature, "MD5"    )) output.md5     = true;
            else if (equalAsciiNoCase(feature, "XMD5"   )) output.xmd5    = true;
            else if (equalAsciiNoCase(feature, "XSHA"   )) output.xsha1   = true; //old alias
            else if (equalAsciiNoCase(feature, "XSHA1"  )) output.xsha1   = true;
            else if (equalAsciiNoCase(feature, "XSHA256")) output.xsha256 = true;
            else if (equalAsciiNoCase(feature, "XSHA512")) output.xsha512 = true;
            else if (equalAsciiNoCase(feature, "XCRC"   )) output.xcrc    = true;
        }
    }
    return output;
}
