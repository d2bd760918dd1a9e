// *****************************************************************************
// * This file is part of the FxpCore project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "open_ssl.h"
#include "extra_log.h"
#include "thread.h"
#include <stdexcept>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>


using namespace fxp;


namespace
{
#ifndef OPENSSL_THREADS
    #error OpenSSL was built without thread support!
#endif

static_assert(OPENSSL_VERSION_NUMBER >= 0x30000000L, "OpenSSL version is too old!");


std::wstring formatOpenSSLError(const char* functionName, unsigned long ec)
{
    char errorBuf[256] = {}; //== buffer size used by ERR_error_string(); err.c: it seems the message uses at most ~200 bytes
    ::ERR_error_string_n(ec, errorBuf, sizeof(errorBuf)); //includes null-termination

    return formatSystemError(functionName, replaceCpy(L"Error code %x", L"%x", numberTo<std::wstring>(ec)), utfTo<std::wstring>(errorBuf));
}


std::wstring formatLastOpenSSLError(const char* functionName)
{
    const auto ec = ::ERR_peek_last_error(); //"returns latest error code from the thread's error queue without modifying it" - unlike ERR_get_error()
    ::ERR_clear_error(); //clean up for next OpenSSL operation on this thread
    return formatOpenSSLError(functionName, ec);
}


const EVP_MD* getDigestAlgorithm(DigestType type)
{
    switch (type)
    {
        case DigestType::md5:
            return ::EVP_md5();
        case DigestType::sha1:
            return ::EVP_sha1();
        case DigestType::sha256:
            return ::EVP_sha256();
        case DigestType::sha512:
            return ::EVP_sha512();
    }
    throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}
}


void fxp::openSslInit()
{
    //official Wiki:           https://wiki.openssl.org/index.php/Library_Initialization
    //see Curl_ossl_cleanup(): https://github.com/curl/curl/blob/master/lib/vtls/openssl.c
    assert(runningOnMainThread());
    if (::OPENSSL_init_ssl(OPENSSL_INIT_SSL_DEFAULT | OPENSSL_INIT_NO_LOAD_CONFIG, nullptr) != 1)
        logExtraError(L"Error during process initialization.\n\n" + formatLastOpenSSLError("OPENSSL_init_ssl"));
}


void fxp::openSslTearDown() {}
//OpenSSL 1.1.0+ deprecates all clean up functions
namespace
{
struct OpenSslThreadCleanUp
{
    ~OpenSslThreadCleanUp()
    {
        ::OPENSSL_thread_stop();
    }
};
thread_local OpenSslThreadCleanUp tearDownOpenSslThreadData;
}

//================================================================================

MessageDigest::MessageDigest(DigestType type) //throw SysError
{
    mdctx_ = ::EVP_MD_CTX_new();
    if (!mdctx_)
        throw SysError(formatSystemError("EVP_MD_CTX_new", L"", L"No more error details."));
    FXP_ON_SCOPE_FAIL(::EVP_MD_CTX_free(mdctx_));

    if (::EVP_DigestInit_ex(mdctx_,                   //EVP_MD_CTX* ctx
                            getDigestAlgorithm(type), //const EVP_MD* type
                            nullptr) != 1)            //ENGINE* impl
        throw SysError(formatLastOpenSSLError("EVP_DigestInit_ex"));
}


MessageDigest::~MessageDigest()
{
    ::EVP_MD_CTX_free(mdctx_);
}


void MessageDigest::update(const void* buffer, size_t bytes) //throw SysError
{
    if (finalized_)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    if (::EVP_DigestUpdate(mdctx_,       //EVP_MD_CTX* ctx
                           buffer,       //const void*
                           bytes) != 1)  //size_t cnt
        throw SysError(formatLastOpenSSLError("EVP_DigestUpdate"));
}


std::string MessageDigest::finalize() //throw SysError
{
    if (finalized_)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
    finalized_ = true;

    std::string output(EVP_MAX_MD_SIZE, '\0');
    unsigned int bytesWritten = 0;

    if (::EVP_DigestFinal_ex(mdctx_,                                          //EVP_MD_CTX* ctx
                             reinterpret_cast<unsigned char*>(output.data()), //unsigned char* md
                             &bytesWritten) != 1)                             //unsigned int* s
        throw SysError(formatLastOpenSSLError("EVP_DigestFinal_ex"));

    output.resize(bytesWritten);
    return output;
}


std::string fxp::formatAsHexString(std::string_view blob)
{
    static const char digits[] = "0123456789abcdef";

    std::string output;
    output.reserve(blob.size() * 2);
    for (const char c : blob)
    {
        const auto b = static_cast<unsigned char>(c);
        output += digits[b >> 4];
        output += digits[b & 0xf];
    }
    return output;
}
