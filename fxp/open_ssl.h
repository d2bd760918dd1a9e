// *****************************************************************************
// * This file is part of the FxpCore project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef OPEN_SSL_H_3958201746302918475
#define OPEN_SSL_H_3958201746302918475

#include <memory>
#include "sys_error.h"

struct evp_md_ctx_st;


namespace fxp
{
//init OpenSSL before use!
void openSslInit();
void openSslTearDown();


enum class DigestType
{
    md5,
    sha1,
    sha256,
    sha512,
};

//streaming message digest: feed file blocks one by one, then fetch the result once
class MessageDigest
{
public:
    explicit MessageDigest(DigestType type); //throw SysError
    ~MessageDigest();

    void update(const void* buffer, size_t bytes); //throw SysError
    std::string finalize(); //throw SysError; raw bytes, not hex!

private:
    MessageDigest           (const MessageDigest&) = delete;
    MessageDigest& operator=(const MessageDigest&) = delete;

    evp_md_ctx_st* mdctx_ = nullptr;
    bool finalized_ = false;
};


std::string formatAsHexString(std::string_view blob); //lower-case
}

#endif //OPEN_SSL_H_3958201746302918475
