// *****************************************************************************
// * This file is part of the FxpCore project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "utf.h"
#include "scope_guard.h"
    #include <glib.h>

using namespace fxp;


static_assert(sizeof(wchar_t) == sizeof(gunichar), "wchar_t must be UTF-32 encoded");


bool fxp::isValidUtf(std::string_view str)
{
    return ::g_utf8_validate(str.data(), static_cast<gssize>(str.size()), nullptr);
}


std::wstring fxp::impl::utf8ToWide(std::string_view str) //nothrow
{
    if (str.empty()) return {};

    //replace broken sequences by U+FFFD: server replies come in any encoding
    gchar* validStr = ::g_utf8_make_valid(str.data(), static_cast<gssize>(str.size()));
    FXP_ON_SCOPE_EXIT(::g_free(validStr));

    glong charsWritten = 0;
    gunichar* ucs4Str = ::g_utf8_to_ucs4_fast(validStr, -1 /*null-terminated*/, &charsWritten);
    FXP_ON_SCOPE_EXIT(::g_free(ucs4Str));

    return {reinterpret_cast<const wchar_t*>(ucs4Str), static_cast<size_t>(charsWritten)};
}


std::string fxp::impl::wideToUtf8(std::wstring_view str) //nothrow
{
    std::string output;
    output.reserve(str.size());

    for (const wchar_t c : str)
    {
        gunichar codePoint = static_cast<gunichar>(c);
        if (!::g_unichar_validate(codePoint)) //e.g. lone surrogate
            codePoint = 0xfffd;

        gchar buf[6] = {};
        const gint bytesWritten = ::g_unichar_to_utf8(codePoint, buf);
        output.append(buf, bytesWritten);
    }
    return output;
}
