// *****************************************************************************
// * This file is part of the FxpCore project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef PASV_PARSER_H_8203946175029384716
#define PASV_PARSER_H_8203946175029384716

#include <array>
#include "ftp_common.h"


namespace fxp
{
//endpoint advertised by "227 Entering Passive Mode (h1,h2,h3,h4,p1,p2)"
struct PasvEndpoint
{
    std::array<uint8_t, 4> quad{};
    uint8_t portHigh = 0;
    uint8_t portLow  = 0;
    std::string literal; //matched text as sent by the server, e.g. "10,0,0,5,23,45"

    uint16_t getPort() const { return static_cast<uint16_t>(portHigh * 256 + portLow); }
    std::string getHost() const; //dotted quad
};

/*  find the first run of six comma-separated decimal numbers anywhere in the text
    (servers wrap it in parentheses, prose, or nothing at all)

    - each number must fit into a byte
    - "literal" is kept verbatim for reuse as the PORT argument                     */
PasvEndpoint parsePasvResponse(const std::string& responseText); //throw FtpMalformedResponse
}

#endif //PASV_PARSER_H_8203946175029384716
