// *****************************************************************************
// * This file is part of the FxpCore project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef UTF_H_3840561290374615028
#define UTF_H_3840561290374615028

#include <string>
#include <string_view>
#include <type_traits>


namespace fxp
{
//convert between UTF-8 (network, file paths) and UTF-32 wchar_t (error messages)
//invalid UTF-8 input is repaired with U+FFFD instead of failing: error messages must always be producible
template <class TargetString, class SourceString>
TargetString utfTo(const SourceString& str);

bool isValidUtf(std::string_view str);

namespace impl
{
std::wstring utf8ToWide(std::string_view str); //nothrow
std::string wideToUtf8(std::wstring_view str); //nothrow
}






//######################## implementation ########################
template <class TargetString, class SourceString> inline
TargetString utfTo(const SourceString& str)
{
    if constexpr (std::is_same_v<TargetString, std::wstring>)
        return impl::utf8ToWide(std::string_view(str));
    else
    {
        static_assert(std::is_same_v<TargetString, std::string>);
        return impl::wideToUtf8(std::wstring_view(str));
    }
}
}

#endif //UTF_H_3840561290374615028
