// *****************************************************************************
// * This file is part of the FxpCore project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FTP_HASH_H_2750193846502918374
#define FTP_HASH_H_2750193846502918374

#include <functional>
#include <fxp/file_error.h>
#include "ftp_common.h"


namespace fxp
{
//remote checksum as reported by the server
struct FtpHash
{
    HashAlgorithm algorithm = HashAlgorithm::none;
    std::string value; //lower-case hex

    //false: server replied, but not with a usable digest (!= "checksums not supported")
    bool isValid() const;

    //compare against the digest of a local file
    bool verify(const std::string& localFilePath) const; //throw FileError
};

size_t getDigestHexLength(HashAlgorithm algo); //0 for HashAlgorithm::none
const char* getHashAlgorithmName(HashAlgorithm algo);

//"213 SHA-256 0-49 169cd22282da7f147cb491e559e9dd filename.ext" https://tools.ietf.org/html/draft-bryan-ftpext-hash-02#section-3.1
FtpHash parseHashReply(const FtpReply& reply);

//XMD5/XSHA1/XSHA256/XSHA512/MD5/XCRC: "250 <hex>", "251 <hex>", "213 <hex>" or "200 <path> <hex>" depending on the server
FtpHash parseXChecksumReply(const FtpReply& reply, HashAlgorithm algo);

/*  ask the server for the checksum of a file, using the advertised features:
        1. "HASH": if the server's default algorithm is unknown, "OPTS HASH" to the first one we can compute
        2. otherwise the first of XSHA512, XSHA256, XSHA1, XMD5, MD5, XCRC the server supports
    a single checksum command is sent: a negative reply yields an invalid FtpHash, no other command is tried
    nothing advertised => invalid FtpHash, no command sent                                                  */
FtpHash getRemoteChecksum(const FtpFeatures& feat, const std::string& serverPath,
                          const std::function<FtpReply(const std::string& ftpCmd)>& execute); //throw SysError

//block-wise digest of a local file, lower-case hex
std::string getLocalDigest(const std::string& filePath, HashAlgorithm algo); //throw FileError
}

#endif //FTP_HASH_H_2750193846502918374
