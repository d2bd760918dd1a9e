// *****************************************************************************
// * This file is part of the FxpCore project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef STRING_TOOLS_H_9034175602318456723
#define STRING_TOOLS_H_9034175602318456723

#include <algorithm>
#include <charconv>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>


//string helpers for the protocol code: ASCII-only case handling is all FTP needs
namespace fxp
{
template <class Char> bool isWhiteSpace(Char c);
template <class Char> bool isLineBreak (Char c);
template <class Char> bool isDigit     (Char c); //'0'-'9' only, unlike std::isdigit()
template <class Char> bool isHexDigit  (Char c);
template <class Char> Char asciiToLower(Char c);

bool startsWith           (std::string_view str, std::string_view prefix);
bool startsWithAsciiNoCase(std::string_view str, std::string_view prefix);
bool endsWith             (std::string_view str, std::string_view postfix);
bool equalAsciiNoCase     (std::string_view lhs, std::string_view rhs);

enum class IfNotFoundReturn
{
    all,
    none
};
std::string_view afterFirst (std::string_view str, char term, IfNotFoundReturn infr);
std::string_view beforeFirst(std::string_view str, char term, IfNotFoundReturn infr);

template <class Function1, class Function2> void split2(std::string_view str, Function1 isDelimiter, Function2 onStringPart);

template <class S> [[nodiscard]] S trimCpy(const S& str);

std::string asciiToLowerCpy(std::string_view str);

template <class S> [[nodiscard]] S replaceCpy(S str, const S& oldTerm, const S& newTerm);
[[nodiscard]] inline std::wstring replaceCpy(const std::wstring& str, const wchar_t* oldTerm, const std::wstring& newTerm) { return replaceCpy<std::wstring>(str, oldTerm, newTerm); }

template <class S, class Num> S numberTo(const Num& number);
template <class Num> Num stringTo(std::string_view str); //parses leading digits; returns 0 on error






//######################## implementation ########################
template <class Char> inline
bool isWhiteSpace(Char c)
{
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);
    return c == static_cast<Char>(' ') || (static_cast<Char>('\t') <= c && c <= static_cast<Char>('\r')); //\t \n \v \f \r
}


template <class Char> inline
bool isLineBreak(Char c) { return c == static_cast<Char>('\r') || c == static_cast<Char>('\n'); }


template <class Char> inline
bool isDigit(Char c) { return static_cast<Char>('0') <= c && c <= static_cast<Char>('9'); }


template <class Char> inline
bool isHexDigit(Char c)
{
    return isDigit(c) ||
           (static_cast<Char>('A') <= c && c <= static_cast<Char>('F')) ||
           (static_cast<Char>('a') <= c && c <= static_cast<Char>('f'));
}


template <class Char> inline
Char asciiToLower(Char c)
{
    if (static_cast<Char>('A') <= c && c <= static_cast<Char>('Z'))
        return static_cast<Char>(c - static_cast<Char>('A') + static_cast<Char>('a'));
    return c;
}


inline
bool startsWith(std::string_view str, std::string_view prefix)
{
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}


inline
bool startsWithAsciiNoCase(std::string_view str, std::string_view prefix)
{
    return str.size() >= prefix.size() && equalAsciiNoCase(str.substr(0, prefix.size()), prefix);
}


inline
bool endsWith(std::string_view str, std::string_view postfix)
{
    return str.size() >= postfix.size() && str.compare(str.size() - postfix.size(), postfix.size(), postfix) == 0;
}


inline
bool equalAsciiNoCase(std::string_view lhs, std::string_view rhs)
{
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) { return asciiToLower(a) == asciiToLower(b); });
}


inline
std::string_view afterFirst(std::string_view str, char term, IfNotFoundReturn infr)
{
    const size_t pos = str.find(term);
    if (pos == std::string_view::npos)
        return infr == IfNotFoundReturn::all ? str : std::string_view();
    return str.substr(pos + 1);
}


inline
std::string_view beforeFirst(std::string_view str, char term, IfNotFoundReturn infr)
{
    const size_t pos = str.find(term);
    if (pos == std::string_view::npos)
        return infr == IfNotFoundReturn::all ? str : std::string_view();
    return str.substr(0, pos);
}


template <class Function1, class Function2> inline
void split2(std::string_view str, Function1 isDelimiter, Function2 onStringPart)
{
    size_t blockFirst = 0;
    for (;;)
    {
        const size_t blockLast = std::find_if(str.begin() + blockFirst, str.end(), isDelimiter) - str.begin();
        onStringPart(str.substr(blockFirst, blockLast - blockFirst));

        if (blockLast == str.size())
            return;
        blockFirst = blockLast + 1;
    }
}


template <class S> inline
S trimCpy(const S& str)
{
    auto itFirst = std::find_if_not(str.begin(), str.end(), [](auto c) { return isWhiteSpace(c); });
    auto itLast  = std::find_if_not(str.rbegin(), std::make_reverse_iterator(itFirst), [](auto c) { return isWhiteSpace(c); }).base();

    if (itFirst == str.begin() && itLast == str.end())
        return str;
    return S(str.substr(itFirst - str.begin(), itLast - itFirst));
}


inline
std::string asciiToLowerCpy(std::string_view str)
{
    std::string output(str);
    std::transform(output.begin(), output.end(), output.begin(), [](char c) { return asciiToLower(c); });
    return output;
}


template <class S> inline
S replaceCpy(S str, const S& oldTerm, const S& newTerm)
{
    if (oldTerm.empty())
        return str;

    for (size_t pos = str.find(oldTerm); pos != S::npos; pos = str.find(oldTerm, pos + newTerm.size()))
        str.replace(pos, oldTerm.size(), newTerm);
    return str;
}


template <class S, class Num> inline
S numberTo(const Num& number)
{
    static_assert(std::is_integral_v<Num>);
    const std::string tmp = std::to_string(number);

    if constexpr (std::is_same_v<S, std::string>)
        return tmp;
    else
        return S(tmp.begin(), tmp.end()); //ASCII digits only
}


template <class Num> inline
Num stringTo(std::string_view str)
{
    static_assert(std::is_integral_v<Num>);
    const auto itFirst = std::find_if_not(str.begin(), str.end(), [](char c) { return isWhiteSpace(c); });

    Num number = 0;
    const char* first = str.data() + (itFirst - str.begin());
    if (const auto [ptr, ec] = std::from_chars(first, str.data() + str.size(), number);
        ec != std::errc())
        return 0;
    return number;
}
}

#endif //STRING_TOOLS_H_9034175602318456723
