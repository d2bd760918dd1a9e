// *****************************************************************************
// * This file is part of the FxpCore project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <gtest/gtest.h>
#include "ftp/pasv_parser.h"

using namespace fxp;


TEST(PasvParser, StandardReply)
{
    const PasvEndpoint ep = parsePasvResponse("Entering Passive Mode (10,0,0,5,23,45).");

    EXPECT_EQ(ep.getHost(), "10.0.0.5");
    EXPECT_EQ(ep.getPort(), 23 * 256 + 45);
    EXPECT_EQ(ep.getPort(), 5933);
    EXPECT_EQ(ep.literal, "10,0,0,5,23,45");
}


TEST(PasvParser, NoParentheses)
{
    //some servers drop the parentheses and the prose
    const PasvEndpoint ep = parsePasvResponse("=192,168,1,20,195,80");

    EXPECT_EQ(ep.getHost(), "192.168.1.20");
    EXPECT_EQ(ep.getPort(), 195 * 256 + 80);
    EXPECT_EQ(ep.literal, "192,168,1,20,195,80");
}


TEST(PasvParser, LiteralKeptVerbatim)
{
    //leading zeros are not normalized: the literal goes to PORT as received
    const PasvEndpoint ep = parsePasvResponse("Entering Passive Mode (010,000,000,005,023,045)");

    EXPECT_EQ(ep.literal, "010,000,000,005,023,045");
    EXPECT_EQ(ep.getHost(), "10.0.0.5");
    EXPECT_EQ(ep.getPort(), 5933);
}


TEST(PasvParser, FirstMatchWins)
{
    const PasvEndpoint ep = parsePasvResponse("1,2 then 1,2,3,4,5,6 and 7,8,9,10,11,12");

    EXPECT_EQ(ep.literal, "1,2,3,4,5,6");
    EXPECT_EQ(ep.getPort(), 5 * 256 + 6);
}


TEST(PasvParser, MoreThanSixGroups)
{
    //the first six groups form the match
    const PasvEndpoint ep = parsePasvResponse("(1,2,3,4,5,6,7)");

    EXPECT_EQ(ep.literal, "1,2,3,4,5,6");
}


TEST(PasvParser, BoundaryValues)
{
    const PasvEndpoint ep = parsePasvResponse("(255,255,255,255,255,255)");
    EXPECT_EQ(ep.getHost(), "255.255.255.255");
    EXPECT_EQ(ep.getPort(), 65535);

    const PasvEndpoint ep0 = parsePasvResponse("(0,0,0,0,0,0)");
    EXPECT_EQ(ep0.getPort(), 0);
}


TEST(PasvParser, MissingGroups)
{
    EXPECT_THROW(parsePasvResponse("Entering Passive Mode (10,0,0,5,23)."), FtpMalformedResponse);
    EXPECT_THROW(parsePasvResponse("Entering Passive Mode"), FtpMalformedResponse);
    EXPECT_THROW(parsePasvResponse(""), FtpMalformedResponse);
}


TEST(PasvParser, NonNumericGroup)
{
    EXPECT_THROW(parsePasvResponse("(10,0,x,5,23,45)"), FtpMalformedResponse);
    EXPECT_THROW(parsePasvResponse("(10,0,0,5,23,-45)"), FtpMalformedResponse);
    EXPECT_THROW(parsePasvResponse("(10, 0, 0, 5, 23, 45)"), FtpMalformedResponse);
}


TEST(PasvParser, ByteRangeViolation)
{
    //never wraps silently
    EXPECT_THROW(parsePasvResponse("(10,0,0,5,256,45)"), FtpMalformedResponse);
    EXPECT_THROW(parsePasvResponse("(300,0,0,5,23,45)"), FtpMalformedResponse);
    EXPECT_THROW(parsePasvResponse("(10,0,0,5,23,99999999999999999999)"), FtpMalformedResponse);
}


TEST(PasvParser, ErrorCarriesRawText)
{
    const std::string raw = "Entering Passive Mode (garbage)";
    try
    {
        parsePasvResponse(raw);
        FAIL() << "exception expected";
    }
    catch (const FtpMalformedResponse& e)
    {
        EXPECT_EQ(e.getRawResponse(), raw);
        EXPECT_NE(e.toString().find(L"garbage"), std::wstring::npos);
    }
}
