// *****************************************************************************
// * This file is part of the FxpCore project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ftp_hash.h"
#include <cstdio>
#include <fxp/crc.h>
#include <fxp/file_io.h>
#include <fxp/open_ssl.h>

using namespace fxp;


namespace
{
bool isHexString(std::string_view str)
{
    return !str.empty() && std::all_of(str.begin(), str.end(), [](char c) { return isHexDigit(c); });
}


std::vector<std::string_view> splitWords(std::string_view str)
{
    std::vector<std::string_view> words;
    split2(str, [](char c) { return isWhiteSpace(c); }, [&](std::string_view word)
    {
        if (!word.empty())
            words.push_back(word);
    });
    return words;
}


DigestType getDigestType(HashAlgorithm algo)
{
    switch (algo)
    {
        case HashAlgorithm::md5:
            return DigestType::md5;
        case HashAlgorithm::sha1:
            return DigestType::sha1;
        case HashAlgorithm::sha256:
            return DigestType::sha256;
        case HashAlgorithm::sha512:
            return DigestType::sha512;
        case HashAlgorithm::none:
        case HashAlgorithm::crc:
            break;
    }
    throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}
}


size_t fxp::getDigestHexLength(HashAlgorithm algo)
{
    switch (algo)
    {
        //*INDENT-OFF*
        case HashAlgorithm::none:   return 0;
        case HashAlgorithm::sha1:   return 40;
        case HashAlgorithm::sha256: return 64;
        case HashAlgorithm::sha512: return 128;
        case HashAlgorithm::md5:    return 32;
        case HashAlgorithm::crc:    return 8;
        //*INDENT-ON*
    }
    assert(false);
    return 0;
}


const char* fxp::getHashAlgorithmName(HashAlgorithm algo)
{
    switch (algo)
    {
        //*INDENT-OFF*
        case HashAlgorithm::none:   return "NONE";
        case HashAlgorithm::sha1:   return "SHA-1";
        case HashAlgorithm::sha256: return "SHA-256";
        case HashAlgorithm::sha512: return "SHA-512";
        case HashAlgorithm::md5:    return "MD5";
        case HashAlgorithm::crc:    return "CRC32";
        //*INDENT-ON*
    }
    assert(false);
    return "";
}


FtpHash fxp::getRemoteChecksum(const FtpFeatures& feat, const std::string& serverPath,
                               const std::function<FtpReply(const std::string& ftpCmd)>& execute) //throw SysError
{
    if (feat.hash)
    {
        if (feat.hashAlgorithmSelected == HashAlgorithm::none && !feat.hashAlgorithms.empty())
            if (!execute(std::string("OPTS HASH ") + getHashAlgorithmName(feat.hashAlgorithms.front())).success) //throw SysError
                return {};

        return parseHashReply(execute("HASH " + serverPath)); //throw SysError
    }

    //non-standard commands: strongest algorithm first
    const std::pair<bool FtpFeatures::*, std::pair<const char*, HashAlgorithm>> xCommands[] =
    {
        {&FtpFeatures::xsha512, {"XSHA512", HashAlgorithm::sha512}},
        {&FtpFeatures::xsha256, {"XSHA256", HashAlgorithm::sha256}},
        {&FtpFeatures::xsha1,   {"XSHA1",   HashAlgorithm::sha1  }},
        {&FtpFeatures::xmd5,    {"XMD5",    HashAlgorithm::md5   }},
        {&FtpFeatures::md5,     {"MD5",     HashAlgorithm::md5   }},
        {&FtpFeatures::xcrc,    {"XCRC",    HashAlgorithm::crc   }},
    };
    for (const auto& [supported, cmd] : xCommands)
        if (feat.*supported)
            return parseXChecksumReply(execute(std::string(cmd.first) + ' ' + serverPath), cmd.second); //throw SysError

    return {};
}


bool FtpHash::isValid() const
{
    return algorithm != HashAlgorithm::none &&
           value.size() == getDigestHexLength(algorithm) &&
           isHexString(value);
}


bool FtpHash::verify(const std::string& localFilePath) const //throw FileError
{
    if (!isValid())
        return false;

    return equalAsciiNoCase(getLocalDigest(localFilePath, algorithm), value); //throw FileError
}


FtpHash fxp::parseHashReply(const FtpReply& reply)
{
    if (!reply.success)
        return {};

    const std::vector<std::string_view> words = splitWords(reply.message);
    if (words.empty())
        return {};

    HashAlgorithm algo = HashAlgorithm::none;
    if (equalAsciiNoCase(words[0], "SHA-1"  )) algo = HashAlgorithm::sha1;
    if (equalAsciiNoCase(words[0], "SHA-256")) algo = HashAlgorithm::sha256;
    if (equalAsciiNoCase(words[0], "SHA-512")) algo = HashAlgorithm::sha512;
    if (equalAsciiNoCase(words[0], "MD5"    )) algo = HashAlgorithm::md5;
    if (equalAsciiNoCase(words[0], "CRC32"  )) algo = HashAlgorithm::crc;
    if (algo == HashAlgorithm::none)
        return {};

    //<algo> <byte range> <hex> <path>: the range may be omitted by lazy servers => search instead of index
    for (auto it = words.begin() + 1; it != words.end(); ++it)
        if (it->size() == getDigestHexLength(algo) && isHexString(*it))
            return {algo, asciiToLowerCpy(*it)};

    return {algo, {}}; //=> !isValid()
}


FtpHash fxp::parseXChecksumReply(const FtpReply& reply, HashAlgorithm algo)
{
    if (!reply.success || algo == HashAlgorithm::none)
        return {};

    const std::vector<std::string_view> words = splitWords(reply.message);

    //the digest comes last if the server echoes the path
    for (auto it = words.rbegin(); it != words.rend(); ++it)
        if (isHexString(*it))
        {
            std::string hex = asciiToLowerCpy(*it);

            //some servers drop leading zeros of CRC values
            if (algo == HashAlgorithm::crc && hex.size() < 8)
                hex.insert(0, 8 - hex.size(), '0');

            if (hex.size() == getDigestHexLength(algo))
                return {algo, hex};
        }

    return {algo, {}}; //=> !isValid()
}


std::string fxp::getLocalDigest(const std::string& filePath, HashAlgorithm algo) //throw FileError
{
    if (algo == HashAlgorithm::crc)
    {
        Crc32 crc;
        readFileBlocks(filePath, [&](const void* buffer, size_t bytes) { crc.update(buffer, bytes); }); //throw FileError

        char buf[16] = {};
        std::snprintf(buf, sizeof(buf), "%08x", static_cast<unsigned int>(crc.checksum()));
        return buf;
    }

    try
    {
        MessageDigest digest(getDigestType(algo)); //throw SysError
        readFileBlocks(filePath, [&](const void* buffer, size_t bytes) { digest.update(buffer, bytes); }); //throw FileError, SysError
        return formatAsHexString(digest.finalize()); //throw SysError
    }
    catch (const SysError& e) { throw FileError(replaceCpy(L"Cannot calculate checksum of %x.", L"%x", fmtPath(filePath)), e.toString()); }
}
