// *****************************************************************************
// * This file is part of the FxpCore project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "pasv_parser.h"
#include <optional>

using namespace fxp;


namespace
{
class PasvTokenizer
{
public:
    explicit PasvTokenizer(std::string_view text) : text_(text) {}
    /**/     PasvTokenizer(std::string&&) = delete;

    //try to read "d+,d+,d+,d+,d+,d+" starting at "pos"
    std::optional<std::array<std::string_view, 6>> readGroups(size_t pos) const
    {
        std::array<std::string_view, 6> groups;
        for (size_t i = 0; i < groups.size(); ++i)
        {
            if (i > 0)
            {
                if (pos == text_.size() || text_[pos] != ',')
                    return std::nullopt;
                ++pos;
            }
            const size_t digitsEnd = findDigitsEnd(pos);
            if (digitsEnd == pos)
                return std::nullopt;

            groups[i] = text_.substr(pos, digitsEnd - pos);
            pos = digitsEnd;
        }
        return groups;
    }

    //only start a match at the beginning of a digit run: "1234,..." must not match as "234,..."
    bool isGroupStart(size_t pos) const
    {
        return isDigit(text_[pos]) && (pos == 0 || !isDigit(text_[pos - 1]));
    }

    size_t size() const { return text_.size(); }

private:
    size_t findDigitsEnd(size_t pos) const
    {
        while (pos < text_.size() && isDigit(text_[pos]))
            ++pos;
        return pos;
    }

    const std::string_view text_;
};


uint8_t parseByte(std::string_view digits, const std::string& responseText) //throw FtpMalformedResponse
{
    //avoid overflow for absurdly long digit runs
    const std::string_view significant = digits.substr(std::min(digits.find_first_not_of('0'), digits.size()));
    if (significant.size() > 3)
        throw FtpMalformedResponse(L"Passive mode address out of range.", responseText);

    const int value = stringTo<int>(significant);
    if (value > 255)
        throw FtpMalformedResponse(L"Passive mode address out of range.", responseText);

    return static_cast<uint8_t>(value);
}
}


std::string PasvEndpoint::getHost() const
{
    return numberTo<std::string>(quad[0]) + '.' +
           numberTo<std::string>(quad[1]) + '.' +
           numberTo<std::string>(quad[2]) + '.' +
           numberTo<std::string>(quad[3]);
}


PasvEndpoint fxp::parsePasvResponse(const std::string& responseText) //throw FtpMalformedResponse
{
    const PasvTokenizer tokenizer(responseText);

    for (size_t pos = 0; pos < tokenizer.size(); ++pos)
        if (tokenizer.isGroupStart(pos))
            if (const std::optional<std::array<std::string_view, 6>> groups = tokenizer.readGroups(pos))
            {
                const auto& g = *groups;

                PasvEndpoint endpoint;
                for (size_t i = 0; i < endpoint.quad.size(); ++i)
                    endpoint.quad[i] = parseByte(g[i], responseText); //throw FtpMalformedResponse
                endpoint.portHigh = parseByte(g[4], responseText); //
                endpoint.portLow  = parseByte(g[5], responseText); //

                endpoint.literal.assign(g[0].data(), g[5].data() + g[5].size());
                return endpoint;
            }

    throw FtpMalformedResponse(L"Malformed PASV response.", responseText);
}
