// *****************************************************************************
// * This file is part of the FxpCore project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef CRC_H_5028371946102837465
#define CRC_H_5028371946102837465

#include <cstdint>
#include <cstddef>
#include <boost/crc.hpp>


namespace fxp
{
//incremental CRC-32 (same polynomial as zlib and XCRC servers)
class Crc32
{
public:
    void update(const void* buffer, size_t bytes) { if (bytes > 0) crc_.process_bytes(buffer, bytes); }
    uint32_t checksum() const
    {
        auto rv = crc_.checksum();
        static_assert(sizeof(rv) == sizeof(uint32_t));
        return rv;
    }

private:
    boost::crc_32_type crc_;
};
}

#endif //CRC_H_5028371946102837465
